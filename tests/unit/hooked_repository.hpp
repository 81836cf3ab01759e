#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace loyalty::testing {

/*
  Forwards to a real repository; hooks may override single calls to inject
  store failures. Hooks returning std::nullopt fall through to the inner
  repository.
*/
class HookedRepository : public db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::function<std::optional<db::Result>(const db::model::LedgerEntryRecord&, uint64_t)> on_update_entry;
  std::function<bool(const std::string&)>                                                  hide_entry;

  std::atomic<int> begin_calls{0};
  std::atomic<int> update_entry_calls{0};

  std::unique_ptr<db::Transaction> Begin() override {
    ++begin_calls;
    return inner_->Begin();
  }

  db::Result InsertEntry(db::Transaction& tx, const db::model::LedgerEntryRecord& record) override {
    return inner_->InsertEntry(tx, record);
  }

  std::optional<db::model::LedgerEntryRecord> GetEntry(db::Transaction& tx, const std::string& id) override {
    if (hide_entry && hide_entry(id)) {
      return std::nullopt;
    }
    return inner_->GetEntry(tx, id);
  }

  db::Result UpdateEntry(db::Transaction& tx, const db::model::LedgerEntryRecord& record, uint64_t expected_version) override {
    ++update_entry_calls;
    if (on_update_entry) {
      if (auto injected = on_update_entry(record, expected_version)) {
        return *injected;
      }
    }
    return inner_->UpdateEntry(tx, record, expected_version);
  }

  std::vector<db::model::LedgerEntryRecord> ListEntries(db::Transaction& tx, const db::EntryQuery& query) override {
    return inner_->ListEntries(tx, query);
  }

  uint64_t CountEntries(db::Transaction& tx, const db::EntryQuery& query) override {
    return inner_->CountEntries(tx, query);
  }

  db::Result InsertUsage(db::Transaction& tx, const db::model::UsageRecord& record) override {
    return inner_->InsertUsage(tx, record);
  }

  std::optional<db::model::UsageRecord> GetUsage(db::Transaction& tx, const std::string& id) override {
    return inner_->GetUsage(tx, id);
  }

  db::Result UpdateUsage(db::Transaction& tx, const db::model::UsageRecord& record, uint64_t expected_version) override {
    return inner_->UpdateUsage(tx, record, expected_version);
  }

  std::vector<db::model::UsageRecord> ListUsages(db::Transaction& tx, const std::string& user_id, const db::Pagination& pagination) override {
    return inner_->ListUsages(tx, user_id, pagination);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

// Deterministic clock for tests; starts at 2023-11-14T22:13:20Z.
class ManualClock {
 public:
  ManualClock() : now_(std::make_shared<util::TimePoint>(util::FromUnixMillis(1700000000000))) {
  }

  util::ClockFn Fn() const {
    auto now = now_;
    return [now] { return *now; };
  }

  util::TimePoint Now() const {
    return *now_;
  }

  void Set(util::TimePoint tp) {
    *now_ = tp;
  }

  void Advance(std::chrono::milliseconds delta) {
    *now_ += delta;
  }

 private:
  std::shared_ptr<util::TimePoint> now_;
};

} // namespace loyalty::testing
