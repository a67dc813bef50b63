#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace docflow::db::postgres {

using docflow::model::MovementStatus;
using docflow::model::QuotationStatus;

namespace {

constexpr const char* kSelectQuotation =
    "SELECT id,project_id,version,status,total_amount::text,created_at_ms,updated_at_ms FROM quotation";

constexpr const char* kSelectDelivery = "SELECT id,project_id,quotation_id,delivery_date::text,status,notes,created_at_ms FROM delivery";

constexpr const char* kSelectInvoice =
    "SELECT id,invoice_number,project_id,quotation_id,delivery_id,issue_date::text,due_date::text,status,tax_rate::text,subtotal::text,"
    "tax_amount::text,total_amount::text,created_at_ms FROM invoice";

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

util::Decimal Dec(const pqxx::field& f) {
  return util::Decimal::Parse(f.c_str());
}

util::Date Day(const pqxx::field& f) {
  return util::ParseDate(f.c_str());
}

std::optional<std::uint64_t> OptionalId(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::uint64_t>();
}

model::QuotationRecord ReadQuotation(const pqxx::row& row) {
  model::QuotationRecord r;
  r.id            = row[0].as<std::uint64_t>();
  r.project_id    = row[1].as<std::uint64_t>();
  r.version       = row[2].as<std::uint32_t>();
  r.status        = static_cast<QuotationStatus>(row[3].as<int>());
  r.total_amount  = Dec(row[4]);
  r.created_at_ms = row[5].as<std::uint64_t>();
  r.updated_at_ms = row[6].as<std::uint64_t>();
  return r;
}

model::DeliveryRecord ReadDelivery(const pqxx::row& row) {
  model::DeliveryRecord r;
  r.id            = row[0].as<std::uint64_t>();
  r.project_id    = row[1].as<std::uint64_t>();
  r.quotation_id  = OptionalId(row[2]);
  r.delivery_date = Day(row[3]);
  r.status        = static_cast<MovementStatus>(row[4].as<int>());
  r.notes         = Text(row[5]);
  r.created_at_ms = row[6].as<std::uint64_t>();
  return r;
}

model::InvoiceRecord ReadInvoice(const pqxx::row& row) {
  model::InvoiceRecord r;
  r.id             = row[0].as<std::uint64_t>();
  r.invoice_number = Text(row[1]);
  r.project_id     = row[2].as<std::uint64_t>();
  r.quotation_id   = OptionalId(row[3]);
  r.delivery_id    = OptionalId(row[4]);
  r.issue_date     = Day(row[5]);
  r.due_date       = Day(row[6]);
  r.status         = static_cast<MovementStatus>(row[7].as<int>());
  r.tax_rate       = Dec(row[8]);
  r.subtotal       = Dec(row[9]);
  r.tax_amount     = Dec(row[10]);
  r.total_amount   = Dec(row[11]);
  r.created_at_ms  = row[12].as<std::uint64_t>();
  return r;
}

void LoadQuotationLines(pqxx::work& w, model::QuotationRecord& q) {
  for (const auto& row : w.exec_prepared("quotation_lines", q.id)) {
    q.lines.push_back(model::QuotationLineRecord{Text(row[0]), Dec(row[1]), Dec(row[2])});
  }
}

void LoadDeliveryLines(pqxx::work& w, model::DeliveryRecord& d) {
  for (const auto& row : w.exec_prepared("delivery_lines", d.id)) {
    d.lines.push_back(model::MovementLineRecord{Text(row[0]), Dec(row[1])});
  }
}

void LoadInvoiceLines(pqxx::work& w, model::InvoiceRecord& inv) {
  for (const auto& row : w.exec_prepared("invoice_lines", inv.id)) {
    inv.lines.push_back(model::InvoiceLineRecord{Text(row[0]), Dec(row[1]), Dec(row[2]), Dec(row[3])});
  }
}

void InsertQuotationLines(pqxx::work& w, const model::QuotationRecord& q) {
  for (std::size_t i = 0; i < q.lines.size(); ++i) {
    const auto& line = q.lines[i];
    w.exec_params("INSERT INTO quotation_line(quotation_id,line_no,product_id,quantity,unit_price) VALUES($1,$2,$3,$4::numeric,$5::numeric)",
                  q.id, static_cast<int>(i), line.product_id, line.quantity.ToString(), line.unit_price.ToString());
  }
}

// Reads never return a Result; backend failures surface as StorageError.
template <typename Fn>
auto Read(Fn&& fn) {
  try {
    return fn();
  } catch (const util::StorageError&) {
    throw;
  } catch (const util::InvalidArgument& e) {
    throw util::StorageError(std::string("postgres row decode: ") + e.what(), false);
  } catch (const std::exception& e) {
    const auto r = PgRepository::Translate(e);
    throw util::StorageError("postgres: " + r.message, r.code == ErrorCode::Busy || r.code == ErrorCode::SerializationFailure);
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::lock_not_available*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Quotations
// ------------------------------------------------------------------

Result PgRepository::InsertQuotation(Transaction& t, model::QuotationRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  row = w.exec_params1(
        "INSERT INTO quotation(project_id,version,status,total_amount,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4::numeric,$5,$6) "
         "RETURNING id",
        r.project_id, r.version, static_cast<int>(r.status), r.total_amount.ToString(), r.created_at_ms, r.updated_at_ms);
    r.id = row[0].as<std::uint64_t>();
    InsertQuotationLines(w, r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateQuotation(Transaction& t, const model::QuotationRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("UPDATE quotation SET status=$2,total_amount=$3::numeric,updated_at_ms=$4 WHERE id=$1", r.id,
                              static_cast<int>(r.status), r.total_amount.ToString(), r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "quotation " + std::to_string(r.id));

    w.exec_params("DELETE FROM quotation_line WHERE quotation_id=$1", r.id);
    InsertQuotationLines(w, r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::QuotationRecord> PgRepository::GetQuotation(Transaction& t, std::uint64_t id) {
  return Read([&]() -> std::optional<model::QuotationRecord> {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectQuotation) + " WHERE id=$1", id);
    if (res.empty()) return std::nullopt;

    auto q = ReadQuotation(res[0]);
    LoadQuotationLines(w, q);
    return q;
  });
}

std::optional<std::uint32_t> PgRepository::GetLatestQuotationVersion(Transaction& t, std::uint64_t project_id) {
  return Read([&]() -> std::optional<std::uint32_t> {
    auto res = TX(t).Work().exec_params("SELECT MAX(version) FROM quotation WHERE project_id=$1", project_id);
    if (res.empty() || res[0][0].is_null()) return std::nullopt;
    return res[0][0].as<std::uint32_t>();
  });
}

std::optional<model::QuotationRecord> PgRepository::FindLatestApprovedForProject(Transaction& t, std::uint64_t project_id) {
  return Read([&]() -> std::optional<model::QuotationRecord> {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectQuotation) + " WHERE project_id=$1 AND status IN ($2,$3,$4) ORDER BY version DESC LIMIT 1",
                              project_id, static_cast<int>(QuotationStatus::kApproved), static_cast<int>(QuotationStatus::kSent),
                              static_cast<int>(QuotationStatus::kAccepted));
    if (res.empty()) return std::nullopt;

    auto q = ReadQuotation(res[0]);
    LoadQuotationLines(w, q);
    return q;
  });
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result PgRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  row = w.exec_params1(
        "INSERT INTO delivery(project_id,quotation_id,delivery_date,status,notes,created_at_ms) VALUES($1,$2,$3::date,$4,$5,$6) RETURNING id",
        r.project_id, r.quotation_id, util::FormatDate(r.delivery_date), static_cast<int>(r.status), r.notes, r.created_at_ms);
    r.id = row[0].as<std::uint64_t>();

    for (std::size_t i = 0; i < r.lines.size(); ++i) {
      w.exec_params("INSERT INTO delivery_line(delivery_id,line_no,product_id,quantity) VALUES($1,$2,$3,$4::numeric)", r.id, static_cast<int>(i),
                    r.lines[i].product_id, r.lines[i].quantity.ToString());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE delivery SET status=$2,quotation_id=$3 WHERE id=$1", r.id, static_cast<int>(r.status), r.quotation_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeliveryRecord> PgRepository::GetDelivery(Transaction& t, std::uint64_t id) {
  return Read([&]() -> std::optional<model::DeliveryRecord> {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectDelivery) + " WHERE id=$1", id);
    if (res.empty()) return std::nullopt;

    auto d = ReadDelivery(res[0]);
    LoadDeliveryLines(w, d);
    return d;
  });
}

std::vector<model::DeliveryRecord> PgRepository::ListDeliveriesByQuotation(Transaction& t, std::uint64_t quotation_id) {
  return Read([&] {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectDelivery) + " WHERE quotation_id=$1 ORDER BY id", quotation_id);

    std::vector<model::DeliveryRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadDelivery(row));
    }
    for (auto& d : out) LoadDeliveryLines(w, d);
    return out;
  });
}

// ------------------------------------------------------------------
// Invoices
// ------------------------------------------------------------------

Result PgRepository::InsertInvoice(Transaction& t, model::InvoiceRecord& r) {
  try {
    auto& w   = TX(t).Work();
    auto  row = w.exec_params1(
        "INSERT INTO invoice(invoice_number,project_id,quotation_id,delivery_id,issue_date,due_date,status,tax_rate,subtotal,tax_amount,"
         "total_amount,created_at_ms) VALUES($1,$2,$3,$4,$5::date,$6::date,$7,$8::numeric,$9::numeric,$10::numeric,$11::numeric,$12) RETURNING id",
        r.invoice_number, r.project_id, r.quotation_id, r.delivery_id, util::FormatDate(r.issue_date), util::FormatDate(r.due_date),
        static_cast<int>(r.status), r.tax_rate.ToString(), r.subtotal.ToString(), r.tax_amount.ToString(), r.total_amount.ToString(),
        r.created_at_ms);
    r.id = row[0].as<std::uint64_t>();

    for (std::size_t i = 0; i < r.lines.size(); ++i) {
      const auto& line = r.lines[i];
      w.exec_params(
          "INSERT INTO invoice_line(invoice_id,line_no,product_id,quantity,unit_price,amount) VALUES($1,$2,$3,$4::numeric,$5::numeric,$6::numeric)",
          r.id, static_cast<int>(i), line.product_id, line.quantity.ToString(), line.unit_price.ToString(), line.amount.ToString());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateInvoice(Transaction& t, const model::InvoiceRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE invoice SET status=$2,invoice_number=$3 WHERE id=$1", r.id, static_cast<int>(r.status),
                                        r.invoice_number);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "invoice " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InvoiceRecord> PgRepository::GetInvoice(Transaction& t, std::uint64_t id) {
  return Read([&]() -> std::optional<model::InvoiceRecord> {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectInvoice) + " WHERE id=$1", id);
    if (res.empty()) return std::nullopt;

    auto inv = ReadInvoice(res[0]);
    LoadInvoiceLines(w, inv);
    return inv;
  });
}

std::vector<model::InvoiceRecord> PgRepository::ListInvoicesByQuotation(Transaction& t, std::uint64_t quotation_id) {
  return Read([&] {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params(std::string(kSelectInvoice) + " WHERE quotation_id=$1 ORDER BY id", quotation_id);

    std::vector<model::InvoiceRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadInvoice(row));
    }
    for (auto& inv : out) LoadInvoiceLines(w, inv);
    return out;
  });
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result PgRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  try {
    auto row = TX(t).Work().exec_params1(
        "INSERT INTO payment(invoice_id,payment_date,amount,method,reference,created_at_ms) VALUES($1,$2::date,$3::numeric,$4,$5,$6) RETURNING id",
        r.invoice_id, util::FormatDate(r.payment_date), r.amount.ToString(), r.method, r.reference, r.created_at_ms);
    r.id = row[0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PaymentRecord> PgRepository::ListPaymentsByInvoice(Transaction& t, std::uint64_t invoice_id) {
  return Read([&] {
    auto res = TX(t).Work().exec_params(
        "SELECT id,invoice_id,payment_date::text,amount::text,method,reference,created_at_ms FROM payment WHERE invoice_id=$1 ORDER BY id",
        invoice_id);

    std::vector<model::PaymentRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::PaymentRecord p;
      p.id            = row[0].as<std::uint64_t>();
      p.invoice_id    = row[1].as<std::uint64_t>();
      p.payment_date  = Day(row[2]);
      p.amount        = Dec(row[3]);
      p.method        = Text(row[4]);
      p.reference     = Text(row[5]);
      p.created_at_ms = row[6].as<std::uint64_t>();
      out.push_back(std::move(p));
    }
    return out;
  });
}

} // namespace docflow::db::postgres
