#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "loyalty_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\loyalty\\\"quoted\"\\ledger.sqlite"
engine:
  max_attempts: 3
)");

  auto config = loyalty::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\loyalty\\\"quoted\"\\ledger.sqlite");
  assert(config.engine().max_attempts() == 3);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(logging:
  level: debug
  pattern: "line1\nline2☃"
)");

  auto config = loyalty::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
  assert(config.logging().level() == "debug");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(accrual:
  earning_rate: 0.05
unknown_field: 123
)");

  bool threw = ThrowsRuntimeError([&] { (void)loyalty::config::ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDocumentsAreRejected() {
  assert(ThrowsRuntimeError([] { (void)loyalty::config::ConfigLoader::LoadFromString("- just\n- a list\n"); }));
  assert(ThrowsRuntimeError([] { (void)loyalty::config::ConfigLoader::LoadFromString("accrual: [unclosed\n"); }));
  assert(ThrowsRuntimeError([] { (void)loyalty::config::ConfigLoader::LoadFromYaml("/nonexistent/loyalty.yaml"); }));
}

void TestEmptyDocumentUsesDefaults() {
  const auto config  = loyalty::config::ConfigLoader::LoadFromString("");
  const auto options = loyalty::factory::BuildLedgerOptions(config);

  const loyalty::core::LedgerOptions defaults;
  assert(options.accrual.holding_period == defaults.accrual.holding_period);
  assert(options.accrual.validity_period == defaults.accrual.validity_period);
  assert(options.accrual.earning_rate == defaults.accrual.earning_rate);
  assert(options.retry.max_attempts == defaults.retry.max_attempts);
  assert(options.sweep_batch_limit == 0);
}

void TestPolicyOverrides() {
  const auto config = loyalty::config::ConfigLoader::LoadFromString(R"(accrual:
  holding_period: "86400s"
  validity_period: "2592000s"
  earning_rate: 0.05
  max_eligible_amount: 1000
  referral_bonus: 50
  influencer_multiplier: 3
engine:
  max_attempts: 7
  retry_backoff: "0.010s"
sweeper:
  batch_limit: 250
)");

  const auto options = loyalty::factory::BuildLedgerOptions(config);
  assert(options.accrual.holding_period == std::chrono::hours(24));
  assert(options.accrual.validity_period == std::chrono::hours(24 * 30));
  assert(options.accrual.earning_rate == 0.05);
  assert(options.accrual.max_eligible_amount == 1000);
  assert(options.accrual.referral_bonus == 50);
  assert(options.accrual.influencer_multiplier == 3.0);
  assert(options.retry.max_attempts == 7);
  assert(options.retry.backoff == std::chrono::milliseconds(10));
  assert(options.sweep_batch_limit == 250);

  // malformed durations never reach the engine
  assert(ThrowsRuntimeError([] { (void)loyalty::config::ConfigLoader::LoadFromString("accrual:\n  holding_period: \"seven days\"\n"); }));
}

void TestBuildMemoryApplication() {
  const auto config = loyalty::config::ConfigLoader::LoadFromString(R"(database:
  memory: {}
accrual:
  holding_period: "0s"
)");

  auto app = loyalty::factory::Build(config);
  assert(app.repository);
  assert(app.ledger);

  // no holding period: matured on creation
  app.ledger->CreateGrant("u1", loyalty::model::EntryKind::kEarnedService, 40000);
  assert(app.ledger->GetBalance("u1").available_balance == 1000);
  app.ledger->Spend("u1", 250, "res");
  assert(app.ledger->GetBalance("u1").available_balance == 750);
}

#if LOYALTY_DB_SQLITE
void TestBuildSqliteApplication() {
  const auto db_path = std::filesystem::temp_directory_path() / "loyalty_ledger_config_loader_tests" / "factory.sqlite";
  std::filesystem::remove(db_path);

  const auto config = loyalty::config::ConfigLoader::LoadFromString("database:\n  sqlite:\n    path: \"" + db_path.string() + "\"\n");
  {
    auto app = loyalty::factory::Build(config);
    app.ledger->CreateGrant("u1", loyalty::model::EntryKind::kAdjustedByAdmin, 300, {.description = "seed"});
  }

  // reopened store keeps the grant and the schema bootstrap is repeatable
  auto app = loyalty::factory::Build(config);
  assert(app.ledger->GetBalance("u1").available_balance == 300);

  std::filesystem::remove(db_path);
}

void TestSqliteRequiresPath() {
  const auto config = loyalty::config::ConfigLoader::LoadFromString("database:\n  sqlite: {}\n");
  assert(ThrowsRuntimeError([&] { (void)loyalty::factory::BuildRepository(config); }));
}
#endif

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMalformedDocumentsAreRejected();
  TestEmptyDocumentUsesDefaults();
  TestPolicyOverrides();
  TestBuildMemoryApplication();
#if LOYALTY_DB_SQLITE
  TestBuildSqliteApplication();
  TestSqliteRequiresPath();
#endif

  std::cout << "loyalty_ledger_unit_config_loader: pass\n";
  return 0;
}
