#include <assert.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "internal/core/quotation_service.hpp"
#include "internal/core/workflow_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using docflow::core::CreateDeliveryRequest;
using docflow::core::CreateInvoiceRequest;
using docflow::core::PaymentRequest;
using docflow::core::QuotationLineInput;
using docflow::core::QuotationService;
using docflow::core::WorkflowOrchestrator;
using docflow::db::Repository;
using docflow::db::Result;
using docflow::db::Transaction;
using docflow::db::memory::MemoryRepository;
using docflow::guard::ProposedLine;
using docflow::util::Decimal;

namespace model = docflow::db::model;

// Slows down the reads the quantity guard and the payment balance depend
// on, so that unserialized writers would both pass their checks.
class HookedRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertQuotation(Transaction& tx, model::QuotationRecord& record) override {
    return inner_.InsertQuotation(tx, record);
  }

  Result UpdateQuotation(Transaction& tx, const model::QuotationRecord& record) override {
    return inner_.UpdateQuotation(tx, record);
  }

  std::optional<model::QuotationRecord> GetQuotation(Transaction& tx, std::uint64_t id) override {
    return inner_.GetQuotation(tx, id);
  }

  std::optional<std::uint32_t> GetLatestQuotationVersion(Transaction& tx, std::uint64_t project_id) override {
    return inner_.GetLatestQuotationVersion(tx, project_id);
  }

  std::optional<model::QuotationRecord> FindLatestApprovedForProject(Transaction& tx, std::uint64_t project_id) override {
    return inner_.FindLatestApprovedForProject(tx, project_id);
  }

  Result InsertDelivery(Transaction& tx, model::DeliveryRecord& record) override {
    return inner_.InsertDelivery(tx, record);
  }

  Result UpdateDelivery(Transaction& tx, const model::DeliveryRecord& record) override {
    return inner_.UpdateDelivery(tx, record);
  }

  std::optional<model::DeliveryRecord> GetDelivery(Transaction& tx, std::uint64_t id) override {
    return inner_.GetDelivery(tx, id);
  }

  std::vector<model::DeliveryRecord> ListDeliveriesByQuotation(Transaction& tx, std::uint64_t quotation_id) override {
    auto rows = inner_.ListDeliveriesByQuotation(tx, quotation_id);
    Pause();
    return rows;
  }

  Result InsertInvoice(Transaction& tx, model::InvoiceRecord& record) override {
    return inner_.InsertInvoice(tx, record);
  }

  Result UpdateInvoice(Transaction& tx, const model::InvoiceRecord& record) override {
    return inner_.UpdateInvoice(tx, record);
  }

  std::optional<model::InvoiceRecord> GetInvoice(Transaction& tx, std::uint64_t id) override {
    return inner_.GetInvoice(tx, id);
  }

  std::vector<model::InvoiceRecord> ListInvoicesByQuotation(Transaction& tx, std::uint64_t quotation_id) override {
    return inner_.ListInvoicesByQuotation(tx, quotation_id);
  }

  Result InsertPayment(Transaction& tx, model::PaymentRecord& record) override {
    return inner_.InsertPayment(tx, record);
  }

  std::vector<model::PaymentRecord> ListPaymentsByInvoice(Transaction& tx, std::uint64_t invoice_id) override {
    auto rows = inner_.ListPaymentsByInvoice(tx, invoice_id);
    Pause();
    return rows;
  }

  void DelayReadsBy(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(hook_mu_);
    delay_        = duration;
    inside_       = 0;
    max_inside_   = 0;
    read_started_ = false;
  }

  bool WaitForReadToStart(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(hook_mu_);
    return hook_cv_.wait_for(lock, timeout, [&] { return read_started_; });
  }

  int MaxConcurrentReads() const {
    std::lock_guard<std::mutex> lock(hook_mu_);
    return max_inside_;
  }

 private:
  void Pause() {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(hook_mu_);
      delay = delay_;
      if (delay.count() == 0) {
        return;
      }
      ++inside_;
      max_inside_   = std::max(max_inside_, inside_);
      read_started_ = true;
      hook_cv_.notify_all();
    }
    std::this_thread::sleep_for(delay);
    std::lock_guard<std::mutex> lock(hook_mu_);
    --inside_;
  }

  MemoryRepository inner_;

  mutable std::mutex        hook_mu_;
  std::condition_variable   hook_cv_;
  std::chrono::milliseconds delay_{0};
  int                       inside_       = 0;
  int                       max_inside_   = 0;
  bool                      read_started_ = false;
};

struct Fixture {
  explicit Fixture(std::chrono::milliseconds wait_timeout = std::chrono::seconds(5)) {
    docflow::lock::LockOptions options;
    options.wait_timeout  = wait_timeout;
    options.poll_interval = std::chrono::milliseconds(5);

    repository   = std::make_shared<HookedRepository>();
    auto locks   = std::make_shared<docflow::lock::LockService>(std::make_shared<docflow::lock::MemoryLockStore>(), options);
    quotations   = std::make_shared<QuotationService>(repository, locks);
    orchestrator = std::make_shared<WorkflowOrchestrator>(repository, locks);
  }

  std::uint64_t ApprovedQuotation(std::uint64_t project_id, const char* qty) {
    const auto id = quotations->CreateQuotation(project_id, {QuotationLineInput{"P1", Decimal::Parse(qty), Decimal::Parse("12.50")}}).id;
    quotations->Submit(id);
    quotations->ApplyApprovalDecision(id, true);
    return id;
  }

  std::shared_ptr<HookedRepository>     repository;
  std::shared_ptr<QuotationService>     quotations;
  std::shared_ptr<WorkflowOrchestrator> orchestrator;
};

CreateDeliveryRequest Delivery(const char* qty) {
  CreateDeliveryRequest request;
  request.delivery_date = docflow::util::ParseDate("2025-03-01");
  request.lines         = {ProposedLine{"P1", Decimal::Parse(qty)}};
  return request;
}

enum class Outcome {
  kPending,
  kCreated,
  kExceeded,
  kTimedOut,
  kOther,
};

template <typename Fn>
Outcome Attempt(Fn&& fn) {
  try {
    fn();
    return Outcome::kCreated;
  } catch (const docflow::util::QuantityExceeded&) {
    return Outcome::kExceeded;
  } catch (const docflow::util::InvalidArgument&) {
    return Outcome::kExceeded;
  } catch (const docflow::util::LockAcquisitionTimeout&) {
    return Outcome::kTimedOut;
  } catch (const std::exception&) {
    return Outcome::kOther;
  }
}

void TestConcurrentDeliveriesCannotOverConsume() {
  Fixture    f;
  const auto q = f.ApprovedQuotation(1, "100");
  f.repository->DelayReadsBy(std::chrono::milliseconds(150));

  std::atomic<bool> go{false};
  Outcome           outcomes[2] = {Outcome::kPending, Outcome::kPending};

  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      outcomes[i] = Attempt([&] { f.orchestrator->CreateDelivery(q, Delivery("70")); });
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  const int created  = std::count(std::begin(outcomes), std::end(outcomes), Outcome::kCreated);
  const int exceeded = std::count(std::begin(outcomes), std::end(outcomes), Outcome::kExceeded);
  assert(created == 1);
  assert(exceeded == 1);
  assert(f.repository->MaxConcurrentReads() == 1);

  f.repository->DelayReadsBy(std::chrono::milliseconds(0));
  assert(f.orchestrator->RemainingDeliverable(q).at("P1") == Decimal::Parse("30"));
}

void TestDifferentQuotationsProceedInParallel() {
  Fixture    f;
  const auto a = f.ApprovedQuotation(1, "100");
  const auto b = f.ApprovedQuotation(2, "100");
  f.repository->DelayReadsBy(std::chrono::milliseconds(300));

  std::atomic<bool> go{false};
  Outcome             outcomes[2] = {Outcome::kPending, Outcome::kPending};
  const std::uint64_t ids[2]      = {a, b};

  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      outcomes[i] = Attempt([&] { f.orchestrator->CreateDelivery(ids[i], Delivery("70")); });
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  assert(outcomes[0] == Outcome::kCreated);
  assert(outcomes[1] == Outcome::kCreated);
  assert(f.repository->MaxConcurrentReads() == 2);
}

void TestLockTimeoutSurfaces() {
  Fixture    f(std::chrono::milliseconds(100));
  const auto q = f.ApprovedQuotation(1, "100");
  f.repository->DelayReadsBy(std::chrono::milliseconds(600));

  Outcome     slow = Outcome::kPending;
  std::thread holder([&] { slow = Attempt([&] { f.orchestrator->CreateDelivery(q, Delivery("10")); }); });

  assert(f.repository->WaitForReadToStart(std::chrono::seconds(5)));
  const auto started = std::chrono::steady_clock::now();
  const auto blocked = Attempt([&] { f.orchestrator->CreateDelivery(q, Delivery("10")); });
  const auto waited  = std::chrono::steady_clock::now() - started;
  holder.join();

  assert(slow == Outcome::kCreated);
  assert(blocked == Outcome::kTimedOut);
  assert(waited < std::chrono::milliseconds(600));
}

void TestConcurrentPaymentsRespectBalance() {
  Fixture    f;
  const auto q = f.ApprovedQuotation(1, "40");
  f.orchestrator->CreateDelivery(q, Delivery("40"));

  CreateInvoiceRequest invoice_request;
  invoice_request.issue_date = docflow::util::ParseDate("2025-03-15");
  invoice_request.due_date   = invoice_request.issue_date;
  invoice_request.lines      = {ProposedLine{"P1", Decimal::Parse("40")}};
  const auto invoice         = f.orchestrator->CreateInvoice(q, invoice_request);
  assert(invoice.total_amount == Decimal::Parse("550"));

  f.repository->DelayReadsBy(std::chrono::milliseconds(150));

  std::atomic<bool> go{false};
  Outcome           outcomes[2] = {Outcome::kPending, Outcome::kPending};

  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      PaymentRequest payment;
      payment.payment_date = invoice_request.issue_date;
      payment.amount       = Decimal::Parse("300");
      payment.method       = "cash";
      outcomes[i]          = Attempt([&] { f.orchestrator->RecordPayment(invoice.id, payment); });
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  assert(std::count(std::begin(outcomes), std::end(outcomes), Outcome::kCreated) == 1);
  assert(std::count(std::begin(outcomes), std::end(outcomes), Outcome::kExceeded) == 1);

  f.repository->DelayReadsBy(std::chrono::milliseconds(0));
  const auto summary = f.orchestrator->GetInvoice(invoice.id);
  assert(summary.paid_amount == Decimal::Parse("300"));
  assert(summary.remaining_balance == Decimal::Parse("250"));
}

} // namespace

int main() {
  TestConcurrentDeliveriesCannotOverConsume();
  TestDifferentQuotationsProceedInParallel();
  TestLockTimeoutSurfaces();
  TestConcurrentPaymentsRespectBalance();

  std::cout << "docflow_unit_orchestrator_concurrency: pass\n";
  return 0;
}
