#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <mandate/execution/engine.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace mandate::schema;
using engine_t = mandate::execution::engine<mandate::storage::rocksdb_storage_tag>;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  mandate delegate --delegator S --delegate S [--expiry T]\n"
            << "  mandate revoke --delegator S [--caller S]\n"
            << "  mandate resolve --delegator S\n"
            << "  mandate active --delegator S\n"
            << "  mandate history --delegator S\n"
            << "  mandate get --id N\n"
            << "  mandate events [--from N] [--to N]\n"
            << "  mandate root\n\n";
  std::cout << options << '\n';
}

std::optional<signer_id_t> read_signer(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("--{} is required", name);
    return std::nullopt;
  }
  auto text = vm[name].as<std::string>();
  auto signer = try_parse_signer(text);
  if (!signer) {
    spdlog::error("--{} '{}' is not a signer", name, text);
  }
  return signer;
}

std::string describe(const std::optional<ledger_time_t>& value) {
  return value ? std::to_string(*value) : std::string{"-"};
}

void print_event(const delegation_event_t& event) {
  std::cout << event.event_id << ' ' << to_string(event.type) << " id="
            << event.delegation_id << ' ' << to_string(event.delegator)
            << " -> " << to_string(event.delegate)
            << " expiry=" << describe(event.expiry)
            << " at=" << event.recorded_at << '\n';
}

void print_edge(const delegation_edge_t& edge) {
  std::cout << "active id=" << edge.delegation_id << ' '
            << to_string(edge.delegator) << " -> " << to_string(edge.delegate)
            << " created=" << edge.created_at
            << " expiry=" << describe(edge.expiry) << '\n';
}

void print_history_entry(const delegation_history_entry_t& entry) {
  std::cout << "history id=" << entry.delegation_id << ' '
            << to_string(entry.delegator) << " -> "
            << to_string(entry.delegate) << " created=" << entry.created_at
            << " ended=" << describe(entry.ended_at) << " reason="
            << (entry.ended_reason ? std::string{to_string(*entry.ended_reason)}
                                   : std::string{"open"})
            << '\n';
}

int print_result(const operation_result_t& result) {
  if (result.code != 0) {
    std::cout << result.codespace << " failed: " << result.log << " ("
              << result.info << ")\n";
    return static_cast<int>(result.code);
  }
  std::cout << result.info;
  if (result.delegation_id) {
    std::cout << " id=" << *result.delegation_id;
  }
  std::cout << '\n';
  for (const auto& event : result.events) {
    print_event(event);
  }
  return 0;
}

int run(engine_t& engine,
        const std::string& command,
        const po::variables_map& vm,
        const std::vector<signer_id_t>& eligible_signers,
        const ledger_time_t now) {
  if (command == "delegate") {
    auto delegator = read_signer(vm, "delegator");
    auto delegate = read_signer(vm, "delegate");
    if (!delegator || !delegate) {
      return 1;
    }
    auto expiry = std::optional<ledger_time_t>{};
    if (vm.contains("expiry")) {
      expiry = vm["expiry"].as<uint64_t>();
    }
    return print_result(
        engine.delegate(*delegator, *delegate, expiry, now, eligible_signers));
  }

  if (command == "revoke") {
    auto delegator = read_signer(vm, "delegator");
    if (!delegator) {
      return 1;
    }
    auto caller = vm.contains("caller") ? read_signer(vm, "caller") : delegator;
    if (!caller) {
      return 1;
    }
    return print_result(engine.revoke(*delegator, *caller, now));
  }

  if (command == "resolve") {
    auto signer = read_signer(vm, "delegator");
    if (!signer) {
      return 1;
    }
    auto result = engine.resolve_effective_voter(*signer, now);
    if (result.code != 0) {
      std::cout << result.codespace << " failed: " << result.log << '\n';
      return static_cast<int>(result.code);
    }
    std::cout << to_string(result.effective_voter) << " hops=" << result.hops
              << '\n';
    for (const auto& event : result.events) {
      print_event(event);
    }
    return 0;
  }

  if (command == "active") {
    auto delegator = read_signer(vm, "delegator");
    if (!delegator) {
      return 1;
    }
    if (auto edge = engine.get_active_delegation(*delegator, now)) {
      print_edge(*edge);
    } else {
      std::cout << "none\n";
    }
    return 0;
  }

  if (command == "history") {
    auto delegator = read_signer(vm, "delegator");
    if (!delegator) {
      return 1;
    }
    for (const auto& entry : engine.get_history(*delegator, now)) {
      print_history_entry(entry);
    }
    return 0;
  }

  if (command == "get") {
    if (!vm.contains("id")) {
      spdlog::error("--id is required");
      return 1;
    }
    auto record = engine.get_delegation(vm["id"].as<uint64_t>(), now);
    if (!record) {
      auto code = delegation_error_code::delegation_missing;
      std::cout << to_string(code) << '\n';
      return static_cast<int>(to_code(code));
    }
    std::visit(overloaded{[](const delegation_edge_t& edge) {
                            print_edge(edge);
                          },
                          [](const delegation_history_entry_t& entry) {
                            print_history_entry(entry);
                          }},
               *record);
    return 0;
  }

  if (command == "events") {
    for (const auto& event : engine.events(vm["from"].as<uint64_t>(),
                                           vm["to"].as<uint64_t>())) {
      print_event(event);
    }
    return 0;
  }

  if (command == "root") {
    auto root = engine.state_root();
    std::cout << to_hex(bytes_view_t{root.data(), root.size()}) << '\n';
    return 0;
  }

  spdlog::error(
      "command must be delegate|revoke|resolve|active|history|get|events|root");
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("mandate.log", false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "mandate", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto signers = std::vector<std::string>{};
  auto now = uint64_t{};
  auto history_capacity = uint32_t{};

  auto generic = po::options_description{"Generic options"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file");

  auto config = po::options_description{"Configuration"};
  config.add_options()(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("mandate.db"),
      "RocksDB directory holding delegation state")(
      "signer,s", po::value<std::vector<std::string>>(&signers)->composing(),
      "eligible signer (repeatable, ed25519:<hex>, secp256k1:<hex> or "
      "32-byte hex)")("now,n", po::value<uint64_t>(&now)->default_value(0),
                      "current ledger time")(
      "history-capacity",
      po::value<uint32_t>(&history_capacity)
          ->default_value(mandate::delegation::kDefaultHistoryCapacity),
      "history entries kept per delegator")("verbose,v",
                                            po::bool_switch(),
                                            "Enable verbose output");

  auto request = po::options_description{"Request"};
  request.add_options()("command", po::value<std::string>(&command),
                        "operation to run")(
      "delegator", po::value<std::string>(), "delegating signer")(
      "delegate", po::value<std::string>(), "receiving signer")(
      "caller", po::value<std::string>(), "revoking signer")(
      "expiry", po::value<uint64_t>(), "ledger time the delegation ends")(
      "id", po::value<uint64_t>(), "delegation id")(
      "from", po::value<uint64_t>()->default_value(1), "first event id")(
      "to",
      po::value<uint64_t>()->default_value(mandate::execution::kMaxEventPage),
      "last event id");

  auto command_line = po::options_description{"mandate"};
  command_line.add(generic).add(config).add(request);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (!config_path.empty()) {
      auto file = std::ifstream{config_path};
      if (!file) {
        spdlog::error("Cannot open config file '{}'", config_path);
        spdlog::shutdown();
        return 1;
      }
      po::store(po::parse_config_file(file, config), vm);
      po::notify(vm);
    }
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(command_line);
    spdlog::shutdown();
    return 0;
  }

  if (vm["verbose"].as<bool>()) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto eligible_signers = std::vector<signer_id_t>{};
  for (const auto& text : signers) {
    auto signer = try_parse_signer(text);
    if (!signer) {
      spdlog::error("--signer '{}' is not a signer", text);
      spdlog::shutdown();
      return 1;
    }
    eligible_signers.push_back(*signer);
  }

  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto storage =
      mandate::storage::make_storage<mandate::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = engine_t{
      encoder, storage,
      mandate::execution::engine_options{.history_capacity = history_capacity}};

  auto status = run(engine, command, vm, eligible_signers, now);
  spdlog::shutdown();
  return status;
}
