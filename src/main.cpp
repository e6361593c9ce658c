#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <remit/authorization/registry.hpp>
#include <remit/clock/clock_source.hpp>
#include <remit/execution/engine.hpp>
#include <remit/ledger/account_book.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/storage/rocksdb/storage.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

using encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;
using storage_t =
    remit::storage::storage<remit::storage::rocksdb_storage_tag>;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  // Console output goes to stderr so stdout carries command results only.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "remit", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

// Malformed arguments surface as program_options errors so they exit with a
// usage status instead of terminating.
remit::schema::principal_t parse_principal(const std::string& value) {
  auto parsed = remit::schema::try_make_hash32(value);
  if (!parsed) {
    throw po::invalid_option_value{value};
  }
  return *parsed;
}

remit::schema::principal_t get_principal(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    throw po::required_option{name};
  }
  return parse_principal(vm[name].as<std::string>());
}

uint64_t get_u64(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    throw po::required_option{name};
  }
  return vm[name].as<uint64_t>();
}

// recipient:amount[:high]
remit::schema::transfer_instruction_t parse_transfer(const std::string& value) {
  auto text = std::string_view{value};
  auto first = text.find(':');
  if (first == std::string_view::npos) {
    throw po::invalid_option_value{value};
  }
  auto recipient = parse_principal(std::string{text.substr(0, first)});

  auto rest = text.substr(first + 1);
  auto second = rest.find(':');
  auto amount_text = rest.substr(0, second);
  auto amount = uint64_t{};
  auto [end, error] = std::from_chars(
      amount_text.data(), amount_text.data() + amount_text.size(), amount);
  if (error != std::errc{} || end != amount_text.data() + amount_text.size()) {
    throw po::invalid_option_value{value};
  }

  auto high_value = false;
  if (second != std::string_view::npos) {
    auto flag = rest.substr(second + 1);
    if (flag != "high") {
      throw po::invalid_option_value{value};
    }
    high_value = true;
  }
  return remit::schema::transfer_instruction_t{
      .recipient = recipient,
      .amount = amount,
      .requires_high_value_check = high_value};
}

std::string to_hex(const remit::schema::hash32_t& hash) {
  return remit::schema::to_hex(
      remit::schema::bytes_view_t{hash.data(), hash.size()});
}

void print_record(const remit::schema::batch_record_t& record) {
  std::cout << "id=" << record.id << " timestamp=" << record.timestamp
            << " total=" << record.total_amount
            << " success=" << (record.success ? "true" : "false")
            << " conditions=";
  for (std::size_t i = 0; i < record.conditions_met.size(); ++i) {
    std::cout << (i == 0 ? "[" : ",")
              << (record.conditions_met[i] ? "true" : "false");
  }
  std::cout << "]\n";
}

int report(const remit::schema::operation_result_t& result) {
  if (result.ok()) {
    std::cout << "ok";
    if (!result.info.empty()) {
      std::cout << ' ' << result.info;
    }
    std::cout << '\n';
    return 0;
  }
  std::cout << result.log << ": " << result.info << '\n';
  return static_cast<int>(result.code);
}

int run_account_command(const std::string& command,
                        const po::variables_map& vm,
                        remit::ledger::account_book& accounts) {
  if (command == "deposit") {
    auto status =
        accounts.credit(get_principal(vm, "account"), get_u64(vm, "amount"));
    std::cout << remit::schema::to_string(status) << '\n';
    return static_cast<int>(status);
  }
  std::cout << accounts.balance_of(get_principal(vm, "account")) << '\n';
  return 0;
}

int run_engine_command(const std::string& command,
                       const po::variables_map& vm,
                       remit::execution::engine& engine) {
  if (command == "set-owner") {
    return report(engine.set_contract_owner(get_principal(vm, "caller"),
                                            get_principal(vm, "new-owner")));
  }
  if (command == "add-signer") {
    return report(engine.add_authorized_signer(get_principal(vm, "caller"),
                                               get_principal(vm, "signer")));
  }
  if (command == "remove-signer") {
    return report(engine.remove_authorized_signer(
        get_principal(vm, "caller"), get_principal(vm, "signer")));
  }
  if (command == "set-performance") {
    return report(engine.set_performance_metrics(get_principal(vm, "caller"),
                                                 get_u64(vm, "value")));
  }
  if (command == "execute") {
    auto instructions = std::vector<remit::schema::transfer_instruction_t>{};
    if (vm.contains("transfer")) {
      for (const auto& value : vm["transfer"].as<std::vector<std::string>>()) {
        instructions.push_back(parse_transfer(value));
      }
    }
    auto signatures = std::vector<remit::schema::principal_t>{};
    if (vm.contains("signature")) {
      for (const auto& value :
           vm["signature"].as<std::vector<std::string>>()) {
        signatures.push_back(parse_principal(value));
      }
    }
    return report(engine.execute_batch_transfer(get_principal(vm, "caller"),
                                                instructions, signatures));
  }
  if (command == "record") {
    auto record = engine.get_transfer_record(get_u64(vm, "id"));
    if (!record) {
      std::cout << "none\n";
      return 1;
    }
    print_record(*record);
    return 0;
  }
  if (command == "records") {
    auto to_id = vm.contains("to-id") ? vm["to-id"].as<uint64_t>()
                                      : engine.next_batch_id() - 1;
    for (const auto& record :
         engine.transfer_records(vm["from-id"].as<uint64_t>(), to_id)) {
      print_record(record);
    }
    return 0;
  }
  if (command == "last-execution") {
    std::cout << engine.get_last_execution() << '\n';
  } else if (command == "signers") {
    for (const auto& signer : engine.authorized_signers()) {
      std::cout << to_hex(signer) << '\n';
    }
  } else if (command == "digest") {
    std::cout << to_hex(engine.ledger_digest()) << '\n';
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  remit set-owner --caller P --new-owner P\n"
            << "  (the first administrative command on a new database also "
               "needs --bootstrap-owner P)\n"
            << "  remit add-signer|remove-signer --caller P --signer P\n"
            << "  remit set-performance --caller P --value N\n"
            << "  remit execute --caller P --transfer R:AMOUNT[:high]... "
               "[--signature P...]\n"
            << "  remit record --id N\n"
            << "  remit records --from-id N --to-id N\n"
            << "  remit last-execution|signers|owner|digest\n"
            << "  remit deposit --account P --amount N\n"
            << "  remit balance --account P\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_file = std::string{};
  auto config = remit::execution::engine_config{};

  auto general = po::options_description{"remit options"};
  general.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "operation to run")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with engine options")(
      "db", po::value<std::string>(&db_path)->default_value("remit.db"),
      "RocksDB directory")("log-file",
                           po::value<std::string>(&log_file)->default_value(""),
                           "also log to this file")(
      "verbose,v", "enable debug logging")(
      "caller", po::value<std::string>(), "calling principal (hex)")(
      "bootstrap-owner", po::value<std::string>(),
      "owner to persist when the database has none")(
      "new-owner", po::value<std::string>(), "principal for set-owner")(
      "signer", po::value<std::string>(), "principal for signer commands")(
      "value", po::value<uint64_t>(), "performance metric value")(
      "transfer", po::value<std::vector<std::string>>()->multitoken(),
      "recipient:amount[:high]")(
      "signature", po::value<std::vector<std::string>>()->multitoken(),
      "signing principal")("id", po::value<uint64_t>(), "batch id")(
      "from-id", po::value<uint64_t>()->default_value(1), "first batch id")(
      "to-id", po::value<uint64_t>(), "last batch id")(
      "account", po::value<std::string>(), "account principal")(
      "amount", po::value<uint64_t>(), "deposit amount")(
      "height", po::value<uint64_t>(),
      "block height to execute at (defaults to the wall clock)");

  auto engine_options = po::options_description{"engine options"};
  engine_options.add_options()(
      "engine.blocks-per-hour",
      po::value<uint64_t>(&config.blocks_per_hour)
          ->default_value(config.blocks_per_hour),
      "blocks per hour of day")(
      "engine.start-hour",
      po::value<uint64_t>(&config.start_hour)->default_value(config.start_hour),
      "first business hour")(
      "engine.end-hour",
      po::value<uint64_t>(&config.end_hour)->default_value(config.end_hour),
      "last business hour")(
      "engine.high-value-threshold",
      po::value<uint64_t>(&config.high_value_threshold)
          ->default_value(config.high_value_threshold),
      "totals above this need authorized multi-signature")(
      "engine.balance-buffer-percent",
      po::value<uint64_t>(&config.balance_buffer_percent)
          ->default_value(config.balance_buffer_percent),
      "required balance as percent of total")(
      "engine.max-instructions",
      po::value<uint64_t>(&config.max_instructions)
          ->default_value(config.max_instructions),
      "instructions per batch")(
      "engine.max-signatures",
      po::value<uint64_t>(&config.max_signatures)
          ->default_value(config.max_signatures),
      "signatures per batch")(
      "engine.enforce-performance-gate",
      po::value<bool>(&config.enforce_performance_gate)
          ->default_value(config.enforce_performance_gate),
      "reject batches while the performance metric is zero");

  auto options = po::options_description{};
  options.add(general).add(engine_options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), engine_options),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "remit: " << ex.what() << '\n';
    return 64;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  const auto account_commands = std::set<std::string>{"deposit", "balance"};
  const auto engine_commands = std::set<std::string>{
      "set-owner", "add-signer",     "remove-signer", "set-performance",
      "execute",   "record",         "records",       "last-execution",
      "signers",   "owner",          "digest"};
  if (!account_commands.contains(command) &&
      !engine_commands.contains(command)) {
    std::cerr << "remit: unknown command '" << command << "'\n";
    return 64;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto encoder = encoder_t{};
  auto storage =
      remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
          db_path);
  auto accounts = remit::ledger::account_book{encoder, storage};

  auto exit_code = 0;
  try {
    if (account_commands.contains(command)) {
      exit_code = run_account_command(command, vm, accounts);
    } else if (command == "owner") {
      // Reading the owner never bootstraps one.
      auto owner =
          remit::authorization::registry::load_owner(encoder, storage);
      if (owner) {
        std::cout << to_hex(*owner) << '\n';
      } else {
        std::cout << "none\n";
        exit_code = 1;
      }
    } else {
      auto persisted =
          remit::authorization::registry::load_owner(encoder, storage);
      if (!persisted && !vm.contains("bootstrap-owner")) {
        throw po::required_option{"bootstrap-owner"};
      }
      auto bootstrap_owner =
          persisted ? *persisted : get_principal(vm, "bootstrap-owner");

      auto clock = std::unique_ptr<remit::clock::height_source>{};
      if (vm.contains("height")) {
        clock = std::make_unique<remit::clock::manual_height_source>(
            vm["height"].as<uint64_t>());
      } else {
        clock = std::make_unique<remit::clock::wall_clock_height_source>(
            config.blocks_per_hour);
      }

      auto engine = remit::execution::engine{encoder,        storage, accounts,
                                             *clock,         bootstrap_owner,
                                             config};
      exit_code = run_engine_command(command, vm, engine);
    }
  } catch (const po::error& ex) {
    std::cerr << "remit: " << ex.what() << '\n';
    exit_code = 64;
  }

  spdlog::shutdown();
  return exit_code;
}
