#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using loyalty::core::LedgerManager;
using loyalty::db::model::LedgerEntryRecord;
using loyalty::db::model::UsageRecord;

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitRejected  = 2;
constexpr int kExitTransient = 3;

// Malformed command line; reported with the usage text.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void Usage() {
  std::cerr << "Usage: loyaltyctl --config <config.yaml> <command> [args]\n"
            << "  grant <user> <earned_service|earned_referral|influencer_bonus|adjusted> <base_amount>\n"
            << "        [--influencer] [--tier <multiplier>] [--reservation <id>] [--description <text>]\n"
            << "  balance <user> [--as-of <unix_ms>]\n"
            << "  spend <user> <amount> <reservation_id>\n"
            << "  rollback <usage_id> [reason]\n"
            << "  adjust-down <user> <amount> <reason>\n"
            << "  cancel-grant <entry_id> <reason>\n"
            << "  history <user> [--kind <kind>]... [--status <status>]... [--from <unix_ms>] [--to <unix_ms>]\n"
            << "          [--limit <n>] [--offset <n>]\n"
            << "  usage <usage_id>\n"
            << "  usages <user> [--limit <n>] [--offset <n>]\n"
            << "  expiring <user> <window_days> [--as-of <unix_ms>]\n"
            << "  sweep-maturation [--now <unix_ms>]\n"
            << "  sweep-expiration [--now <unix_ms>]\n";
}

std::int64_t ParseInt(const std::string& value, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoll(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // reported below
  }
  throw UsageError(std::string("invalid ") + what + ": '" + value + "'");
}

double ParseDouble(const std::string& value, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stod(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::logic_error&) {
    // reported below
  }
  throw UsageError(std::string("invalid ") + what + ": '" + value + "'");
}

/*
  Positional arguments first, then --flag [value] pairs.
*/
class Args {
 public:
  Args(std::vector<std::string> args) : args_(std::move(args)) {
  }

  const std::string& Positional(std::size_t index, const char* what) const {
    if (index >= args_.size() || args_[index].rfind("--", 0) == 0) {
      throw UsageError(std::string("missing ") + what);
    }
    return args_[index];
  }

  std::optional<std::string> Optional(std::size_t index) const {
    if (index >= args_.size() || args_[index].rfind("--", 0) == 0) {
      return std::nullopt;
    }
    return args_[index];
  }

  bool Flag(const std::string& name) const {
    for (const auto& arg : args_) {
      if (arg == name) return true;
    }
    return false;
  }

  std::vector<std::string> Values(const std::string& name) const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < args_.size(); ++i) {
      if (args_[i] != name) continue;
      if (i + 1 >= args_.size()) throw UsageError(name + " needs a value");
      out.push_back(args_[i + 1]);
    }
    return out;
  }

  std::optional<std::string> Value(const std::string& name) const {
    auto values = Values(name);
    if (values.empty()) return std::nullopt;
    return values.back();
  }

 private:
  std::vector<std::string> args_;
};

std::optional<loyalty::util::TimePoint> TimeFlag(const Args& args, const std::string& name) {
  auto value = args.Value(name);
  if (!value) return std::nullopt;
  return loyalty::util::FromUnixMillis(ParseInt(*value, name.c_str()));
}

loyalty::db::Pagination PaginationFlags(const Args& args) {
  loyalty::db::Pagination pagination;
  if (auto limit = args.Value("--limit")) pagination.limit = static_cast<std::size_t>(ParseInt(*limit, "limit"));
  if (auto offset = args.Value("--offset")) pagination.offset = static_cast<std::size_t>(ParseInt(*offset, "offset"));
  return pagination;
}

void PrintEntry(const LedgerEntryRecord& e) {
  std::cout << "entry=" << e.id << " user=" << e.user_id << " kind=" << loyalty::model::ToString(e.kind)
            << " status=" << loyalty::model::ToString(e.status) << " amount=" << e.amount << " remaining=" << e.remaining_amount
            << " available_from_ms=" << e.available_from_ms;
  if (e.expires_at_ms) std::cout << " expires_at_ms=" << *e.expires_at_ms;
  if (!e.linked_usage_id.empty()) std::cout << " usage=" << e.linked_usage_id;
  if (!e.source_entry_id.empty()) std::cout << " source=" << e.source_entry_id;
  if (!e.reservation_id.empty()) std::cout << " reservation=" << e.reservation_id;
  std::cout << " created_at_ms=" << e.created_at_ms << "\n";
}

void PrintUsage(const UsageRecord& u) {
  std::cout << "usage=" << u.id << " user=" << u.user_id << " reservation=" << u.reservation_id << " total=" << u.total_amount
            << " status=" << loyalty::model::ToString(u.status) << " draws=";
  for (std::size_t i = 0; i < u.consumed_from.size(); ++i) {
    std::cout << (i == 0 ? "" : ",") << u.consumed_from[i].grant_entry_id << ":" << u.consumed_from[i].amount_drawn;
  }
  std::cout << " created_at_ms=" << u.created_at_ms << "\n";
}

void PrintSweep(const char* name, const loyalty::core::SweepReport& report) {
  std::cout << "sweep=" << name << " examined=" << report.examined << " transitioned=" << report.transitioned << " failed=" << report.failed
            << "\n";
  for (const auto& failure : report.failures) {
    std::cout << "failed_entry=" << failure.entry_id << "\n";
  }
}

int RunCommand(LedgerManager& ledger, const std::string& command, const Args& args) {
  if (command == "grant") {
    auto kind = loyalty::model::ParseEntryKind(args.Positional(1, "kind"));
    if (!kind) throw UsageError("unknown kind: " + args.Positional(1, "kind"));

    loyalty::core::GrantContext context;
    context.is_influencer = args.Flag("--influencer");
    if (auto tier = args.Value("--tier")) context.tier_multiplier = ParseDouble(*tier, "tier multiplier");
    context.reservation_id = args.Value("--reservation").value_or("");
    context.description    = args.Value("--description").value_or("");

    PrintEntry(ledger.CreateGrant(args.Positional(0, "user"), *kind, ParseInt(args.Positional(2, "base_amount"), "base_amount"), context));
    return kExitOk;
  }

  if (command == "balance") {
    const auto b = ledger.GetBalance(args.Positional(0, "user"), TimeFlag(args, "--as-of"));
    std::cout << "user=" << b.user_id << " available=" << b.available_balance << " pending=" << b.pending_balance << " expired=" << b.expired_balance
              << " earned=" << b.total_earned << " used=" << b.total_used << " as_of_ms=" << b.last_calculated_at_ms << "\n";
    return kExitOk;
  }

  if (command == "spend") {
    PrintUsage(ledger.Spend(args.Positional(0, "user"), ParseInt(args.Positional(1, "amount"), "amount"), args.Positional(2, "reservation_id")));
    return kExitOk;
  }

  if (command == "rollback") {
    const auto outcome = ledger.Rollback(args.Positional(0, "usage_id"), args.Optional(1).value_or(""));
    std::cout << "usage=" << outcome.usage.id << " status=" << loyalty::model::ToString(outcome.usage.status) << " restored=" << outcome.restored_amount
              << " forfeited=" << outcome.forfeited_amount << "\n";
    return kExitOk;
  }

  if (command == "adjust-down") {
    PrintUsage(ledger.AdjustDown(args.Positional(0, "user"), ParseInt(args.Positional(1, "amount"), "amount"), args.Positional(2, "reason")));
    return kExitOk;
  }

  if (command == "cancel-grant") {
    PrintEntry(ledger.CancelGrant(args.Positional(0, "entry_id"), args.Positional(1, "reason")));
    return kExitOk;
  }

  if (command == "history") {
    loyalty::core::HistoryFilter filter;
    for (const auto& value : args.Values("--kind")) {
      auto kind = loyalty::model::ParseEntryKind(value);
      if (!kind) throw UsageError("unknown kind: " + value);
      filter.kinds.push_back(*kind);
    }
    for (const auto& value : args.Values("--status")) {
      auto status = loyalty::model::ParseEntryStatus(value);
      if (!status) throw UsageError("unknown status: " + value);
      filter.statuses.push_back(*status);
    }
    if (auto from = args.Value("--from")) filter.created_from_ms = ParseInt(*from, "from");
    if (auto to = args.Value("--to")) filter.created_to_ms = ParseInt(*to, "to");

    const auto page = ledger.ListHistory(args.Positional(0, "user"), filter, PaginationFlags(args));
    for (const auto& entry : page.items) {
      PrintEntry(entry);
    }
    std::cout << "total=" << page.total << " limit=" << page.limit << " offset=" << page.offset << "\n";
    return kExitOk;
  }

  if (command == "usage") {
    const auto& usage_id = args.Positional(0, "usage_id");
    auto        usage    = ledger.GetUsage(usage_id);
    if (!usage) throw loyalty::util::NotFound("usage " + usage_id + " not found");
    PrintUsage(*usage);
    return kExitOk;
  }

  if (command == "usages") {
    for (const auto& usage : ledger.ListUsages(args.Positional(0, "user"), PaginationFlags(args))) {
      PrintUsage(usage);
    }
    return kExitOk;
  }

  if (command == "expiring") {
    const auto days    = ParseInt(args.Positional(1, "window_days"), "window_days");
    const auto summary = ledger.ExpiringSoon(args.Positional(0, "user"), std::chrono::hours(24 * days), TimeFlag(args, "--as-of"));
    for (const auto& entry : summary.entries) {
      PrintEntry(entry);
    }
    std::cout << "user=" << summary.user_id << " expiring=" << summary.total << " window_end_ms=" << summary.window_end_ms << "\n";
    return kExitOk;
  }

  if (command == "sweep-maturation") {
    PrintSweep("maturation", ledger.SweepMaturation(TimeFlag(args, "--now").value_or(loyalty::util::Now())));
    return kExitOk;
  }

  if (command == "sweep-expiration") {
    PrintSweep("expiration", ledger.SweepExpiration(TimeFlag(args, "--now").value_or(loyalty::util::Now())));
    return kExitOk;
  }

  throw UsageError("unknown command: " + command);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string        config_path = argv[2];
  const std::string        command     = argv[3];
  std::vector<std::string> rest(argv + 4, argv + argc);

  loyalty::runtime::config::RuntimeConfig config;
  try {
    config = loyalty::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitUsage;
  }
  loyalty::observability::InitializeLogging(config);

  try {
    auto app  = loyalty::factory::Build(config);
    int  code = RunCommand(*app.ledger, command, Args(std::move(rest)));
    loyalty::observability::ShutdownLogging();
    return code;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  } catch (const loyalty::util::InsufficientFunds& e) {
    std::cerr << "insufficient funds: requested=" << e.requested() << " available=" << e.available() << "\n";
    return kExitRejected;
  } catch (const loyalty::util::InvalidAmount& e) {
    std::cerr << "invalid amount: " << e.what() << "\n";
    return kExitRejected;
  } catch (const loyalty::util::InvalidArgument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    return kExitRejected;
  } catch (const loyalty::util::AlreadyRolledBackOrMissing& e) {
    std::cerr << e.what() << "\n";
    return kExitRejected;
  } catch (const loyalty::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
    return kExitRejected;
  } catch (const loyalty::util::InvalidState& e) {
    std::cerr << "rejected: " << e.what() << "\n";
    return kExitRejected;
  } catch (const std::exception& e) {
    // integrity alerts, exhausted retries and store errors stay in the log
    LOYALTY_LOG_ERROR("command failed", {loyalty::observability::StringField("command", command), loyalty::observability::StringField("error", e.what())});
    std::cerr << "temporary failure, try again\n";
    loyalty::observability::ShutdownLogging();
    return kExitTransient;
  }
}
