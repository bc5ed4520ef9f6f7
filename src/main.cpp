#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <coffer/ledger/service.hpp>
#include <coffer/schema/amount.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using service_t = coffer::ledger::service<coffer::storage::rocksdb_storage_tag>;

constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;

constexpr auto kCommands = std::array<std::string_view, 8>{
    "create-wallet", "apply",      "deactivate",   "rename",
    "search",        "get-wallet", "list-wallets", "get-transaction"};

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output, so log lines go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "coffer", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

std::string format_timestamp(
    const std::optional<coffer::schema::timestamp_milliseconds_t>& value) {
  return value ? std::to_string(*value) : std::string{"-"};
}

void print(const coffer::schema::wallet_state_t& wallet) {
  std::cout << "wallet_id=" << coffer::schema::to_string(wallet.wallet_id)
            << " balance=" << coffer::schema::to_string(wallet.balance)
            << " active=" << (wallet.active ? "true" : "false")
            << " deactivated_at=" << format_timestamp(wallet.deactivated_at)
            << " created_at=" << wallet.created_at
            << " updated_at=" << wallet.updated_at
            << " transactions=" << wallet.transaction_count
            << " label=" << wallet.label << '\n';
}

void print(const coffer::schema::transaction_state_t& tx) {
  std::cout << "transaction_id=" << coffer::schema::to_string(tx.transaction_id)
            << " wallet_id=" << coffer::schema::to_string(tx.wallet_id)
            << " amount=" << coffer::schema::to_string(tx.amount)
            << " active=" << (tx.active ? "true" : "false")
            << " deactivated_at=" << format_timestamp(tx.deactivated_at)
            << " created_at=" << tx.created_at
            << " updated_at=" << tx.updated_at << " txid=" << tx.txid << '\n';
}

int report_failure(const coffer::schema::ledger_error_code code,
                   const std::string& log) {
  std::cout << "error=" << coffer::schema::to_string(code) << " log=" << log
            << '\n';
  return kExitFailure;
}

template <typename T>
int report(const coffer::schema::ledger_result<T>& result) {
  if (!result.ok()) {
    return report_failure(result.code, result.log);
  }
  print(*result.value);
  return EXIT_SUCCESS;
}

int usage_error(const std::string& message) {
  std::cerr << "coffer: " << message << '\n';
  return kExitUsage;
}

std::optional<std::string> get_string(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::optional<std::vector<coffer::schema::wallet_id_t>> get_wallet_ids(
    const po::variables_map& vm) {
  auto ids = std::vector<coffer::schema::wallet_id_t>{};
  if (!vm.contains("wallet-id")) {
    return ids;
  }
  for (const auto& value : vm["wallet-id"].as<std::vector<std::string>>()) {
    auto id = coffer::schema::try_make_uuid(value);
    if (!id) {
      return std::nullopt;
    }
    ids.push_back(*id);
  }
  return ids;
}

std::optional<coffer::schema::wallet_id_t> get_single_wallet_id(
    const po::variables_map& vm) {
  auto ids = get_wallet_ids(vm);
  if (!ids || ids->size() != 1) {
    return std::nullopt;
  }
  return ids->front();
}

int run_command(const std::string& command,
                const po::variables_map& vm,
                service_t& ledger) {
  if (std::ranges::find(kCommands, command) == std::end(kCommands)) {
    return usage_error("unknown command '" + command + "'");
  }

  if (command == "create-wallet") {
    return report(ledger.create_wallet(get_string(vm, "label").value_or("")));
  }

  if (command == "search") {
    auto ids = get_wallet_ids(vm);
    if (!ids) {
      return usage_error("--wallet-id must be a UUID");
    }
    for (const auto& tx : ledger.search_transactions(*ids)) {
      print(tx);
    }
    return EXIT_SUCCESS;
  }

  if (command == "list-wallets") {
    auto ids = get_wallet_ids(vm);
    if (!ids) {
      return usage_error("--wallet-id must be a UUID");
    }
    auto filter = coffer::schema::wallet_filter_t{};
    filter.wallet_ids = std::move(*ids);
    if (auto active = get_string(vm, "active")) {
      if (*active != "true" && *active != "false") {
        return usage_error("--active must be true|false");
      }
      filter.active = *active == "true";
    }
    if (auto ordering = get_string(vm, "ordering")) {
      filter.ordering =
          coffer::schema::try_from_string<coffer::schema::wallet_ordering_t>(
              *ordering)
              .value_or(coffer::schema::kDefaultWalletOrdering);
    }
    for (const auto& wallet : ledger.list_wallets(filter)) {
      print(wallet);
    }
    return EXIT_SUCCESS;
  }

  if (command == "get-transaction") {
    auto txid = get_string(vm, "txid");
    if (!txid) {
      return usage_error("get-transaction requires --txid");
    }
    return report(ledger.get_transaction(*txid));
  }

  auto wallet_id = get_single_wallet_id(vm);
  if (!wallet_id) {
    return usage_error(command + " requires exactly one --wallet-id UUID");
  }

  if (command == "get-wallet") {
    return report(ledger.get_wallet(*wallet_id));
  }
  if (command == "deactivate") {
    return report(ledger.deactivate_wallet(*wallet_id));
  }
  if (command == "rename") {
    return report(
        ledger.update_label(*wallet_id, get_string(vm, "label").value_or("")));
  }
  if (command == "apply") {
    auto txid = get_string(vm, "txid");
    auto amount_text = get_string(vm, "amount");
    if (!txid || !amount_text) {
      return usage_error("apply requires --txid and --amount");
    }
    auto amount = coffer::schema::try_parse_amount(*amount_text);
    if (!amount) {
      return report_failure(coffer::schema::ledger_error_code::invalid_amount,
                            "'" + *amount_text + "' is not a valid amount");
    }
    return report(ledger.apply_transaction(*wallet_id, *txid, *amount));
  }

  return usage_error("unknown command '" + command + "'");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  coffer create-wallet --label <text>\n"
            << "  coffer apply --wallet-id <uuid> --txid <id> --amount <n>\n"
            << "  coffer deactivate --wallet-id <uuid>\n"
            << "  coffer rename --wallet-id <uuid> --label <text>\n"
            << "  coffer search --wallet-id <uuid> [--wallet-id <uuid>...]\n"
            << "  coffer get-wallet --wallet-id <uuid>\n"
            << "  coffer list-wallets [--active true|false] [--ordering "
               "<name>]\n"
            << "  coffer get-transaction --txid <id>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto lock_timeout_ms = int64_t{};
  auto allow_negative_balance = false;
  auto max_label_length = size_t{};
  auto max_txid_length = size_t{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file")("verbose,v",
                                      "Log at debug level to stderr");

  auto settings = po::options_description{"Ledger"};
  settings.add_options()(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("coffer.db"),
      "RocksDB directory, created when missing")(
      "lock-timeout-ms",
      po::value<int64_t>(&lock_timeout_ms)
          ->default_value(coffer::ledger::kDefaultLockTimeout.count()),
      "Wait for a busy wallet before failing with lock_timeout")(
      "allow-negative-balance",
      po::value<bool>(&allow_negative_balance)->default_value(false),
      "Accept debits that take a balance below zero")(
      "max-label-length",
      po::value<size_t>(&max_label_length)
          ->default_value(coffer::ledger::kDefaultMaxLabelLength),
      "Longest accepted wallet label in bytes")(
      "max-txid-length",
      po::value<size_t>(&max_txid_length)
          ->default_value(coffer::ledger::kDefaultMaxTxidLength),
      "Longest accepted txid in bytes")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file");

  auto arguments = po::options_description{"Command"};
  arguments.add_options()("command", po::value<std::string>(&command),
                          "Command to run")(
      "wallet-id,w", po::value<std::vector<std::string>>(),
      "Wallet UUID (repeatable for search and list-wallets)")(
      "label,l", po::value<std::string>(), "Wallet label")(
      "txid,t", po::value<std::string>(), "External transaction id")(
      "amount,a", po::value<std::string>(),
      "Signed amount with up to two decimals")(
      "active", po::value<std::string>(), "Filter wallets by true|false")(
      "ordering,o", po::value<std::string>(),
      "balance|created_at|updated_at|label, '-' prefix for descending");

  auto all = po::options_description{"coffer options"};
  all.add(generic).add(settings).add(arguments);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto stream = std::ifstream{path};
      if (!stream) {
        return usage_error("cannot read config file '" + path + "'");
      }
      po::store(po::parse_config_file(stream, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    return usage_error(ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(all);
    return command.empty() && !vm.contains("help") ? kExitUsage : 0;
  }
  if (lock_timeout_ms < 0) {
    return usage_error("--lock-timeout-ms must not be negative");
  }

  configure_logging(vm.contains("verbose") ? "debug" : log_level, log_file);

  auto store = coffer::storage::make_storage<
      coffer::storage::rocksdb_storage_tag>(db_path);
  auto locks = coffer::ledger::wallet_lock_table{};
  auto ledger = service_t{
      store, locks,
      coffer::ledger::options{
          .lock_timeout = std::chrono::milliseconds{lock_timeout_ms},
          .max_label_length = max_label_length,
          .max_txid_length = max_txid_length,
          .allow_negative_balance = allow_negative_balance,
          .clock = &coffer::schema::now_milliseconds}};

  auto exit_code = run_command(command, vm, ledger);
  spdlog::shutdown();
  return exit_code;
}
