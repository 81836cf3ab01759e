#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/ledger_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace loyalty::factory {

/*
  Application

  Owns the long-lived objects of one process.
*/
struct Application {
  std::shared_ptr<db::Repository>      repository;
  std::shared_ptr<core::LedgerManager> ledger;
};

/*
  Build

  Constructs the ledger from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const loyalty::runtime::config::RuntimeConfig& config, util::ClockFn clock = util::Now);

// Opens the configured store and creates its schema if missing.
// No database section selects the in-memory store.
std::shared_ptr<db::Repository> BuildRepository(const loyalty::runtime::config::RuntimeConfig& config);

// Accrual policy, retry budget and sweep limits with defaults for unset fields.
core::LedgerOptions BuildLedgerOptions(const loyalty::runtime::config::RuntimeConfig& config);

} // namespace loyalty::factory
