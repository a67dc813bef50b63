#pragma once

#include <string>
#include <vector>

namespace docflow::db::sql {

/*
  Bootstrap DDL, applied with CREATE ... IF NOT EXISTS on startup.

  SQLite stores decimals as INTEGER hundredths (*_units) and dates as
  ISO text. Postgres uses NUMERIC(12,2) and DATE; the repository moves
  both through their text form.

  docflow_lock is the lock store table: one row per held lock, unique on
  (lock_key, region).
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS quotation (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id INTEGER NOT NULL, version INTEGER NOT NULL, "
      "status INTEGER NOT NULL, total_amount_units INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "UNIQUE(project_id, version));",
      "CREATE TABLE IF NOT EXISTS quotation_line (quotation_id INTEGER NOT NULL REFERENCES quotation(id) ON DELETE CASCADE, line_no INTEGER "
      "NOT NULL, product_id TEXT NOT NULL, quantity_units INTEGER NOT NULL, unit_price_units INTEGER NOT NULL, PRIMARY KEY(quotation_id, "
      "line_no));",
      "CREATE TABLE IF NOT EXISTS delivery (id INTEGER PRIMARY KEY AUTOINCREMENT, project_id INTEGER NOT NULL, quotation_id INTEGER, "
      "delivery_date TEXT NOT NULL, status INTEGER NOT NULL, notes TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_delivery_quotation ON delivery(quotation_id);",
      "CREATE TABLE IF NOT EXISTS delivery_line (delivery_id INTEGER NOT NULL REFERENCES delivery(id) ON DELETE CASCADE, line_no INTEGER NOT "
      "NULL, product_id TEXT NOT NULL, quantity_units INTEGER NOT NULL, PRIMARY KEY(delivery_id, line_no));",
      "CREATE TABLE IF NOT EXISTS invoice (id INTEGER PRIMARY KEY AUTOINCREMENT, invoice_number TEXT, project_id INTEGER NOT NULL, "
      "quotation_id INTEGER, delivery_id INTEGER, issue_date TEXT NOT NULL, due_date TEXT NOT NULL, status INTEGER NOT NULL, tax_rate_units "
      "INTEGER NOT NULL, subtotal_units INTEGER NOT NULL, tax_amount_units INTEGER NOT NULL, total_amount_units INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_invoice_quotation ON invoice(quotation_id);",
      "CREATE TABLE IF NOT EXISTS invoice_line (invoice_id INTEGER NOT NULL REFERENCES invoice(id) ON DELETE CASCADE, line_no INTEGER NOT "
      "NULL, product_id TEXT NOT NULL, quantity_units INTEGER NOT NULL, unit_price_units INTEGER NOT NULL, amount_units INTEGER NOT NULL, "
      "PRIMARY KEY(invoice_id, line_no));",
      "CREATE TABLE IF NOT EXISTS payment (id INTEGER PRIMARY KEY AUTOINCREMENT, invoice_id INTEGER NOT NULL REFERENCES invoice(id), "
      "payment_date TEXT NOT NULL, amount_units INTEGER NOT NULL, method TEXT, reference TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_payment_invoice ON payment(invoice_id);",
      "CREATE TABLE IF NOT EXISTS docflow_lock (lock_key TEXT NOT NULL, region TEXT NOT NULL, holder_id TEXT NOT NULL, created_at_ms INTEGER "
      "NOT NULL, PRIMARY KEY(lock_key, region));",
  };
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS quotation (id BIGSERIAL PRIMARY KEY, project_id BIGINT NOT NULL, version INTEGER NOT NULL, status SMALLINT "
      "NOT NULL, total_amount NUMERIC(12,2) NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, UNIQUE(project_id, "
      "version));",
      "CREATE TABLE IF NOT EXISTS quotation_line (quotation_id BIGINT NOT NULL REFERENCES quotation(id) ON DELETE CASCADE, line_no INTEGER NOT "
      "NULL, product_id TEXT NOT NULL, quantity NUMERIC(12,2) NOT NULL, unit_price NUMERIC(12,2) NOT NULL, PRIMARY KEY(quotation_id, "
      "line_no));",
      "CREATE TABLE IF NOT EXISTS delivery (id BIGSERIAL PRIMARY KEY, project_id BIGINT NOT NULL, quotation_id BIGINT, delivery_date DATE NOT "
      "NULL, status SMALLINT NOT NULL, notes TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_delivery_quotation ON delivery(quotation_id);",
      "CREATE TABLE IF NOT EXISTS delivery_line (delivery_id BIGINT NOT NULL REFERENCES delivery(id) ON DELETE CASCADE, line_no INTEGER NOT "
      "NULL, product_id TEXT NOT NULL, quantity NUMERIC(12,2) NOT NULL, PRIMARY KEY(delivery_id, line_no));",
      "CREATE TABLE IF NOT EXISTS invoice (id BIGSERIAL PRIMARY KEY, invoice_number TEXT, project_id BIGINT NOT NULL, quotation_id BIGINT, "
      "delivery_id BIGINT, issue_date DATE NOT NULL, due_date DATE NOT NULL, status SMALLINT NOT NULL, tax_rate NUMERIC(5,2) NOT NULL, "
      "subtotal NUMERIC(12,2) NOT NULL, tax_amount NUMERIC(12,2) NOT NULL, total_amount NUMERIC(12,2) NOT NULL, created_at_ms BIGINT NOT "
      "NULL);",
      "CREATE INDEX IF NOT EXISTS idx_invoice_quotation ON invoice(quotation_id);",
      "CREATE TABLE IF NOT EXISTS invoice_line (invoice_id BIGINT NOT NULL REFERENCES invoice(id) ON DELETE CASCADE, line_no INTEGER NOT NULL, "
      "product_id TEXT NOT NULL, quantity NUMERIC(12,2) NOT NULL, unit_price NUMERIC(12,2) NOT NULL, amount NUMERIC(12,2) NOT NULL, PRIMARY "
      "KEY(invoice_id, line_no));",
      "CREATE TABLE IF NOT EXISTS payment (id BIGSERIAL PRIMARY KEY, invoice_id BIGINT NOT NULL REFERENCES invoice(id), payment_date DATE NOT "
      "NULL, amount NUMERIC(12,2) NOT NULL, method TEXT, reference TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_payment_invoice ON payment(invoice_id);",
      "CREATE TABLE IF NOT EXISTS docflow_lock (lock_key TEXT NOT NULL, region TEXT NOT NULL, holder_id TEXT NOT NULL, created_at_ms BIGINT "
      "NOT NULL, PRIMARY KEY(lock_key, region));",
  };
  return kStatements;
}

} // namespace docflow::db::sql
