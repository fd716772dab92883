#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongroom/blake3/hash.hpp>
#include <strongroom/runtime/ledger.hpp>
#include <strongroom/schema/primitives.hpp>
#include <string>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

std::optional<strongroom::schema::hash32_t> parse_id(
    const std::string& value,
    const std::string_view fallback_seed) {
  if (value.empty()) {
    return strongroom::blake3::hash(fallback_seed);
  }
  return strongroom::schema::try_make_hash32(value);
}

std::string_view trim(std::string_view line) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) {
    line.remove_prefix(1);
  }
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "strongroomd.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "strongroomd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto chain_id_hex = std::string{};
  auto program_id_hex = std::string{};
  auto block_time = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Strongroom"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "strongroom.db"),
      "RocksDB directory of the ledger")(
      "chain-id,c", boost::program_options::value<std::string>(&chain_id_hex),
      "Chain id as 64 hex characters")(
      "program-id,p",
      boost::program_options::value<std::string>(&program_id_hex),
      "Wallet program id as 64 hex characters")(
      "block-time,t",
      boost::program_options::value<uint64_t>(&block_time)->default_value(0),
      "Fixed block time in unix milliseconds; 0 uses the wall clock")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto chain_id = parse_id(chain_id_hex, "strongroom-local");
  auto program_id = parse_id(program_id_hex, "strongroom-wallet");
  if (!chain_id.has_value() || !program_id.has_value()) {
    spdlog::error("chain id and program id must be 64 hex characters");
    spdlog::shutdown();
    return 1;
  }

  auto encoder = strongroom::runtime::ledger::encoder_t{};
  auto storage = strongroom::storage::make_storage<
      strongroom::storage::rocksdb_storage_tag>(db_path);
  auto ledger = strongroom::runtime::ledger{encoder, storage, chain_id.value(),
                                            program_id.value()};

  auto line = std::string{};
  auto executed = uint64_t{};
  auto failed = uint64_t{};
  while (!shutdown_requested() && std::getline(std::cin, line)) {
    auto hex = trim(line);
    if (hex.empty() || hex.front() == '#') {
      continue;
    }
    auto raw_tx = strongroom::schema::try_from_hex(hex);
    if (!raw_tx.has_value()) {
      spdlog::error("Skipping line that is not hex");
      ++failed;
      continue;
    }
    ledger.set_block_time(
        block_time != 0
            ? block_time
            : static_cast<uint64_t>(
                  std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count()));
    auto result = ledger.execute(strongroom::schema::bytes_view_t{
        raw_tx->data(), raw_tx->size()});
    ++executed;
    if (result.code != 0) {
      ++failed;
      spdlog::warn("tx failed code={} codespace={} log='{}' info='{}'",
                   result.code, result.codespace, result.log, result.info);
    } else {
      spdlog::info("tx ok height={} instructions={}", result.height,
                   result.instruction_results.size());
    }
    std::cout << result.height << ' ' << result.code << ' '
              << strongroom::schema::to_hex(strongroom::schema::bytes_view_t{
                     result.state_root.data(), result.state_root.size()})
              << std::endl;
  }

  spdlog::info("Processed {} transaction(s), {} failed; height {}", executed,
               failed, ledger.height());
  spdlog::shutdown();
  return 0;
}
