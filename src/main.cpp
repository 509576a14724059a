#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <courier/execution/engine.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace po = boost::program_options;
using namespace courier::schema;

namespace {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

struct genesis_options final {
  std::string name;
  std::string eip712_version;
  std::string symbol;
  uint32_t decimals{};
  std::string chain_id;
  std::string verifying_contract;
  std::string total_supply;
  std::string initial_holder;
};

void print_result(const transaction_result_t& result) {
  std::cout << "code: " << result.code << "\n";
  if (!result.codespace.empty()) {
    std::cout << "codespace: " << result.codespace << "\n";
  }
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << "\n";
  }
  if (!result.info.empty()) {
    std::cout << "info: " << result.info << "\n";
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << "\n";
  }
}

void print_query(const query_result_t& result) {
  std::cout << "code: " << result.code << "\n";
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << "\n";
  }
  if (!result.info.empty()) {
    std::cout << "info: " << result.info << "\n";
  }
  std::cout << "value: " << to_base64(result.value) << "\n";
}

/// Genesis is only assembled when a token name is configured; otherwise the
/// persisted config is authoritative.
std::optional<token_config_t> make_genesis(const genesis_options& options,
                                           std::string& error) {
  if (options.name.empty()) {
    return std::nullopt;
  }
  auto config = token_config_t{};
  config.name = options.name;
  config.eip712_version = options.eip712_version;
  config.symbol = options.symbol;
  if (options.decimals > 255) {
    error = "decimals must fit in 8 bits";
    return std::nullopt;
  }
  config.decimals = static_cast<uint8_t>(options.decimals);

  auto chain_id = try_parse_uint256(options.chain_id);
  auto total_supply = try_parse_uint256(options.total_supply);
  auto verifying_contract = try_make_address(options.verifying_contract);
  auto initial_holder = try_make_address(options.initial_holder);
  if (!chain_id) {
    error = "invalid --chain-id";
  } else if (!total_supply) {
    error = "invalid --total-supply";
  } else if (!verifying_contract) {
    error = "invalid --verifying-contract";
  } else if (!initial_holder) {
    error = "invalid --initial-holder";
  }
  if (!error.empty()) {
    return std::nullopt;
  }
  config.chain_id = *chain_id;
  config.total_supply = *total_supply;
  config.verifying_contract = *verifying_contract;
  config.initial_holder = *initial_holder;
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};
  auto tx_base64 = std::string{};
  auto query_path = std::string{};
  auto query_key = std::string{};
  auto genesis = genesis_options{};

  auto generic = po::options_description{"Courier"};
  generic.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the token options below")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("courier.log"),
      "Log file path");

  auto token = po::options_description{"Token"};
  token.add_options()(
      "db-path", po::value<std::string>(&db_path)->default_value("courier.db"),
      "RocksDB directory")("name", po::value<std::string>(&genesis.name),
                           "Token name (EIP-712 domain name)")(
      "eip712-version",
      po::value<std::string>(&genesis.eip712_version)->default_value("1"),
      "EIP-712 domain version")(
      "symbol", po::value<std::string>(&genesis.symbol), "Token symbol")(
      "decimals", po::value<uint32_t>(&genesis.decimals)->default_value(6),
      "Token decimals")(
      "chain-id", po::value<std::string>(&genesis.chain_id)->default_value("1"),
      "EIP-712 chain id")(
      "verifying-contract",
      po::value<std::string>(&genesis.verifying_contract)
          ->default_value("0x0000000000000000000000000000000000000000"),
      "EIP-712 verifying contract address")(
      "total-supply",
      po::value<std::string>(&genesis.total_supply)->default_value("0"),
      "Genesis supply in the smallest unit")(
      "initial-holder",
      po::value<std::string>(&genesis.initial_holder)
          ->default_value("0x0000000000000000000000000000000000000000"),
      "Address credited with the genesis supply");

  auto request = po::options_description{"Request"};
  request.add_options()(
      "command", po::value<std::string>(&command),
      "init | submit | query | info")(
      "tx", po::value<std::string>(&tx_base64),
      "Base64 signed SCALE transaction envelope (submit)")(
      "path", po::value<std::string>(&query_path), "Query route (query)")(
      "key", po::value<std::string>(&query_key)->default_value(""),
      "Base64 SCALE query key (query)");

  auto description = po::options_description{};
  description.add(generic).add(token).add(request);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto stream = std::ifstream{vm["config"].as<std::string>()};
      if (!stream) {
        std::cerr << "cannot read config file "
                  << vm["config"].as<std::string>() << std::endl;
        return 2;
      }
      po::store(po::parse_config_file(stream, token), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return command.empty() && !vm.contains("help") ? 2 : 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "courier", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto genesis_error = std::string{};
  auto genesis_config = make_genesis(genesis, genesis_error);
  if (!genesis_error.empty()) {
    spdlog::error("{}", genesis_error);
    spdlog::shutdown();
    return 2;
  }
  if (command == "init" && !genesis_config) {
    spdlog::error("init requires --name");
    spdlog::shutdown();
    return 2;
  }

  auto encoder = encoder_t{};
  auto storage =
      courier::storage::make_storage<courier::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = courier::execution::engine{encoder, storage, genesis_config};

  auto exit_code = 0;
  if (command == "init" || command == "info") {
    auto info = engine.info();
    std::cout << "token: " << info.token_name << " (" << info.token_symbol
              << ")\n"
              << "version: " << info.version << "\n"
              << "total_supply: " << engine.total_supply().str() << "\n"
              << "domain_separator: " << to_hex(info.domain_separator)
              << "\n";
  } else if (command == "submit") {
    auto raw = try_from_base64(tx_base64);
    if (!raw) {
      spdlog::error("--tx must be base64");
      exit_code = 2;
    } else {
      auto result = engine.execute_transaction(make_bytes_view(*raw));
      print_result(result);
      exit_code = result.code == 0 ? 0 : 1;
    }
  } else if (command == "query") {
    auto key = try_from_base64(query_key);
    if (!key) {
      spdlog::error("--key must be base64");
      exit_code = 2;
    } else {
      auto result = engine.query(query_path, make_bytes_view(*key));
      print_query(result);
      exit_code = result.code == 0 ? 0 : 1;
    }
  } else {
    spdlog::error("unknown command '{}'", command);
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
