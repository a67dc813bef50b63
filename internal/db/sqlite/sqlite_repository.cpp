#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace docflow::db::sqlite {

using docflow::db::ErrorCode;
using docflow::db::Result;
using docflow::model::MovementStatus;
using docflow::model::QuotationStatus;

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db), false);
  }
  return Stmt(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDecimal(sqlite3_stmt* st, int idx, util::Decimal d) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(d.Units()));
}

void BindDate(sqlite3_stmt* st, int idx, util::Date d) {
  BindText(st, idx, util::FormatDate(d));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<std::uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

util::Decimal ColDecimal(sqlite3_stmt* st, int col) {
  return util::Decimal::FromUnits(sqlite3_column_int64(st, col));
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  return util::ParseDate(ColText(st, col));
}

std::optional<std::uint64_t> ColOptionalU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

// Runs a statement that returns rows, invoking fn per row.
template <typename Fn>
void ForEachRow(sqlite3* db, sqlite3_stmt* st, Fn&& fn) {
  for (;;) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) return;
    if (rc != SQLITE_ROW) {
      const auto r = SqliteRepository::Translate(db, rc);
      throw util::StorageError("sqlite step: " + r.message, r.code == ErrorCode::Busy);
    }
    fn(st);
  }
}

constexpr const char* kSelectQuotation =
    "SELECT id,project_id,version,status,total_amount_units,created_at_ms,updated_at_ms FROM quotation";

constexpr const char* kSelectDelivery = "SELECT id,project_id,quotation_id,delivery_date,status,notes,created_at_ms FROM delivery";

constexpr const char* kSelectInvoice =
    "SELECT id,invoice_number,project_id,quotation_id,delivery_id,issue_date,due_date,status,tax_rate_units,subtotal_units,"
    "tax_amount_units,total_amount_units,created_at_ms FROM invoice";

model::QuotationRecord ReadQuotation(sqlite3_stmt* st) {
  model::QuotationRecord r;
  r.id            = ColU64(st, 0);
  r.project_id    = ColU64(st, 1);
  r.version       = static_cast<std::uint32_t>(ColI32(st, 2));
  r.status        = static_cast<QuotationStatus>(ColI32(st, 3));
  r.total_amount  = ColDecimal(st, 4);
  r.created_at_ms = ColU64(st, 5);
  r.updated_at_ms = ColU64(st, 6);
  return r;
}

model::DeliveryRecord ReadDelivery(sqlite3_stmt* st) {
  model::DeliveryRecord r;
  r.id            = ColU64(st, 0);
  r.project_id    = ColU64(st, 1);
  r.quotation_id  = ColOptionalU64(st, 2);
  r.delivery_date = ColDate(st, 3);
  r.status        = static_cast<MovementStatus>(ColI32(st, 4));
  r.notes         = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::InvoiceRecord ReadInvoice(sqlite3_stmt* st) {
  model::InvoiceRecord r;
  r.id             = ColU64(st, 0);
  r.invoice_number = ColText(st, 1);
  r.project_id     = ColU64(st, 2);
  r.quotation_id   = ColOptionalU64(st, 3);
  r.delivery_id    = ColOptionalU64(st, 4);
  r.issue_date     = ColDate(st, 5);
  r.due_date       = ColDate(st, 6);
  r.status         = static_cast<MovementStatus>(ColI32(st, 7));
  r.tax_rate       = ColDecimal(st, 8);
  r.subtotal       = ColDecimal(st, 9);
  r.tax_amount     = ColDecimal(st, 10);
  r.total_amount   = ColDecimal(st, 11);
  r.created_at_ms  = ColU64(st, 12);
  return r;
}

void LoadQuotationLines(sqlite3* db, model::QuotationRecord& q) {
  auto st = Prepare(db, "SELECT product_id,quantity_units,unit_price_units FROM quotation_line WHERE quotation_id=? ORDER BY line_no;");
  BindU64(st.get(), 1, q.id);
  ForEachRow(db, st.get(), [&](sqlite3_stmt* row) {
    q.lines.push_back(model::QuotationLineRecord{ColText(row, 0), ColDecimal(row, 1), ColDecimal(row, 2)});
  });
}

void LoadDeliveryLines(sqlite3* db, model::DeliveryRecord& d) {
  auto st = Prepare(db, "SELECT product_id,quantity_units FROM delivery_line WHERE delivery_id=? ORDER BY line_no;");
  BindU64(st.get(), 1, d.id);
  ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { d.lines.push_back(model::MovementLineRecord{ColText(row, 0), ColDecimal(row, 1)}); });
}

void LoadInvoiceLines(sqlite3* db, model::InvoiceRecord& inv) {
  auto st = Prepare(db, "SELECT product_id,quantity_units,unit_price_units,amount_units FROM invoice_line WHERE invoice_id=? ORDER BY line_no;");
  BindU64(st.get(), 1, inv.id);
  ForEachRow(db, st.get(), [&](sqlite3_stmt* row) {
    inv.lines.push_back(model::InvoiceLineRecord{ColText(row, 0), ColDecimal(row, 1), ColDecimal(row, 2), ColDecimal(row, 3)});
  });
}

Result InsertQuotationLines(sqlite3* db, const model::QuotationRecord& q) {
  auto st = Prepare(db, "INSERT INTO quotation_line(quotation_id,line_no,product_id,quantity_units,unit_price_units) VALUES(?,?,?,?,?);");
  for (std::size_t i = 0; i < q.lines.size(); ++i) {
    sqlite3_reset(st.get());
    BindU64(st.get(), 1, q.id);
    BindI32(st.get(), 2, static_cast<int>(i));
    BindText(st.get(), 3, q.lines[i].product_id);
    BindDecimal(st.get(), 4, q.lines[i].quantity);
    BindDecimal(st.get(), 5, q.lines[i].unit_price);
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return SqliteRepository::Translate(db, rc);
  }
  return Result::Ok();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Quotations
// ------------------------------------------------------------------

Result SqliteRepository::InsertQuotation(Transaction& t, model::QuotationRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO quotation(project_id,version,status,total_amount_units,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?);");
    BindU64(st.get(), 1, r.project_id);
    BindI32(st.get(), 2, static_cast<int>(r.version));
    BindI32(st.get(), 3, static_cast<int>(r.status));
    BindDecimal(st.get(), 4, r.total_amount);
    BindU64(st.get(), 5, r.created_at_ms);
    BindU64(st.get(), 6, r.updated_at_ms);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
    return InsertQuotationLines(db, r);
}

Result SqliteRepository::UpdateQuotation(Transaction& t, const model::QuotationRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE quotation SET status=?,total_amount_units=?,updated_at_ms=? WHERE id=?;");
    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindDecimal(st.get(), 2, r.total_amount);
    BindU64(st.get(), 3, r.updated_at_ms);
    BindU64(st.get(), 4, r.id);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "quotation " + std::to_string(r.id));

    auto del = Prepare(db, "DELETE FROM quotation_line WHERE quotation_id=?;");
    BindU64(del.get(), 1, r.id);
    const int del_rc = sqlite3_step(del.get());
    if (del_rc != SQLITE_DONE) return Translate(db, del_rc);

    return InsertQuotationLines(db, r);
}

std::optional<model::QuotationRecord> SqliteRepository::GetQuotation(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectQuotation) + " WHERE id=?;").c_str());
    BindU64(st.get(), 1, id);

    std::optional<model::QuotationRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out = ReadQuotation(row); });
    if (out) LoadQuotationLines(db, *out);
    return out;
}

std::optional<std::uint32_t> SqliteRepository::GetLatestQuotationVersion(Transaction& t, std::uint64_t project_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT MAX(version) FROM quotation WHERE project_id=?;");
    BindU64(st.get(), 1, project_id);

    std::optional<std::uint32_t> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) {
        if (sqlite3_column_type(row, 0) != SQLITE_NULL) out = static_cast<std::uint32_t>(ColI32(row, 0));
    });
    return out;
}

std::optional<model::QuotationRecord> SqliteRepository::FindLatestApprovedForProject(Transaction& t, std::uint64_t project_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectQuotation) + " WHERE project_id=? AND status IN (?,?,?) ORDER BY version DESC LIMIT 1;").c_str());
    BindU64(st.get(), 1, project_id);
    BindI32(st.get(), 2, static_cast<int>(QuotationStatus::kApproved));
    BindI32(st.get(), 3, static_cast<int>(QuotationStatus::kSent));
    BindI32(st.get(), 4, static_cast<int>(QuotationStatus::kAccepted));

    std::optional<model::QuotationRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out = ReadQuotation(row); });
    if (out) LoadQuotationLines(db, *out);
    return out;
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result SqliteRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO delivery(project_id,quotation_id,delivery_date,status,notes,created_at_ms) VALUES(?,?,?,?,?,?);");
    BindU64(st.get(), 1, r.project_id);
    BindOptionalU64(st.get(), 2, r.quotation_id);
    BindDate(st.get(), 3, r.delivery_date);
    BindI32(st.get(), 4, static_cast<int>(r.status));
    BindText(st.get(), 5, r.notes);
    BindU64(st.get(), 6, r.created_at_ms);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));

    auto line = Prepare(db, "INSERT INTO delivery_line(delivery_id,line_no,product_id,quantity_units) VALUES(?,?,?,?);");
    for (std::size_t i = 0; i < r.lines.size(); ++i) {
        sqlite3_reset(line.get());
        BindU64(line.get(), 1, r.id);
        BindI32(line.get(), 2, static_cast<int>(i));
        BindText(line.get(), 3, r.lines[i].product_id);
        BindDecimal(line.get(), 4, r.lines[i].quantity);
        const int line_rc = sqlite3_step(line.get());
        if (line_rc != SQLITE_DONE) return Translate(db, line_rc);
    }
    return Result::Ok();
}

Result SqliteRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE delivery SET status=?,quotation_id=? WHERE id=?;");
    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindOptionalU64(st.get(), 2, r.quotation_id);
    BindU64(st.get(), 3, r.id);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
    return Result::Ok();
}

std::optional<model::DeliveryRecord> SqliteRepository::GetDelivery(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectDelivery) + " WHERE id=?;").c_str());
    BindU64(st.get(), 1, id);

    std::optional<model::DeliveryRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out = ReadDelivery(row); });
    if (out) LoadDeliveryLines(db, *out);
    return out;
}

std::vector<model::DeliveryRecord> SqliteRepository::ListDeliveriesByQuotation(Transaction& t, std::uint64_t quotation_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectDelivery) + " WHERE quotation_id=? ORDER BY id;").c_str());
    BindU64(st.get(), 1, quotation_id);

    std::vector<model::DeliveryRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadDelivery(row)); });
    for (auto& d : out) LoadDeliveryLines(db, d);
    return out;
}

// ------------------------------------------------------------------
// Invoices
// ------------------------------------------------------------------

Result SqliteRepository::InsertInvoice(Transaction& t, model::InvoiceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO invoice(invoice_number,project_id,quotation_id,delivery_id,issue_date,due_date,status,tax_rate_units,subtotal_units,"
        "tax_amount_units,total_amount_units,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, r.invoice_number);
    BindU64(st.get(), 2, r.project_id);
    BindOptionalU64(st.get(), 3, r.quotation_id);
    BindOptionalU64(st.get(), 4, r.delivery_id);
    BindDate(st.get(), 5, r.issue_date);
    BindDate(st.get(), 6, r.due_date);
    BindI32(st.get(), 7, static_cast<int>(r.status));
    BindDecimal(st.get(), 8, r.tax_rate);
    BindDecimal(st.get(), 9, r.subtotal);
    BindDecimal(st.get(), 10, r.tax_amount);
    BindDecimal(st.get(), 11, r.total_amount);
    BindU64(st.get(), 12, r.created_at_ms);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));

    auto line = Prepare(db,
        "INSERT INTO invoice_line(invoice_id,line_no,product_id,quantity_units,unit_price_units,amount_units) VALUES(?,?,?,?,?,?);");
    for (std::size_t i = 0; i < r.lines.size(); ++i) {
        sqlite3_reset(line.get());
        BindU64(line.get(), 1, r.id);
        BindI32(line.get(), 2, static_cast<int>(i));
        BindText(line.get(), 3, r.lines[i].product_id);
        BindDecimal(line.get(), 4, r.lines[i].quantity);
        BindDecimal(line.get(), 5, r.lines[i].unit_price);
        BindDecimal(line.get(), 6, r.lines[i].amount);
        const int line_rc = sqlite3_step(line.get());
        if (line_rc != SQLITE_DONE) return Translate(db, line_rc);
    }
    return Result::Ok();
}

Result SqliteRepository::UpdateInvoice(Transaction& t, const model::InvoiceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE invoice SET status=?,invoice_number=? WHERE id=?;");
    BindI32(st.get(), 1, static_cast<int>(r.status));
    BindText(st.get(), 2, r.invoice_number);
    BindU64(st.get(), 3, r.id);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "invoice " + std::to_string(r.id));
    return Result::Ok();
}

std::optional<model::InvoiceRecord> SqliteRepository::GetInvoice(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectInvoice) + " WHERE id=?;").c_str());
    BindU64(st.get(), 1, id);

    std::optional<model::InvoiceRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out = ReadInvoice(row); });
    if (out) LoadInvoiceLines(db, *out);
    return out;
}

std::vector<model::InvoiceRecord> SqliteRepository::ListInvoicesByQuotation(Transaction& t, std::uint64_t quotation_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, (std::string(kSelectInvoice) + " WHERE quotation_id=? ORDER BY id;").c_str());
    BindU64(st.get(), 1, quotation_id);

    std::vector<model::InvoiceRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) { out.push_back(ReadInvoice(row)); });
    for (auto& inv : out) LoadInvoiceLines(db, inv);
    return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO payment(invoice_id,payment_date,amount_units,method,reference,created_at_ms) VALUES(?,?,?,?,?,?);");
    BindU64(st.get(), 1, r.invoice_id);
    BindDate(st.get(), 2, r.payment_date);
    BindDecimal(st.get(), 3, r.amount);
    BindText(st.get(), 4, r.method);
    BindText(st.get(), 5, r.reference);
    BindU64(st.get(), 6, r.created_at_ms);

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::vector<model::PaymentRecord> SqliteRepository::ListPaymentsByInvoice(Transaction& t, std::uint64_t invoice_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT id,invoice_id,payment_date,amount_units,method,reference,created_at_ms FROM payment WHERE invoice_id=? ORDER BY id;");
    BindU64(st.get(), 1, invoice_id);

    std::vector<model::PaymentRecord> out;
    ForEachRow(db, st.get(), [&](sqlite3_stmt* row) {
        model::PaymentRecord p;
        p.id            = ColU64(row, 0);
        p.invoice_id    = ColU64(row, 1);
        p.payment_date  = ColDate(row, 2);
        p.amount        = ColDecimal(row, 3);
        p.method        = ColText(row, 4);
        p.reference     = ColText(row, 5);
        p.created_at_ms = ColU64(row, 6);
        out.push_back(std::move(p));
    });
    return out;
}

} // namespace docflow::db::sqlite
