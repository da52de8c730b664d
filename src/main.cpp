#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <estate/execution/engine.hpp>
#include <limits>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void print_event(const uint64_t sequence,
                 const estate::schema::state_event_t& event) {
  std::cout << "  #" << sequence << ' ' << event.name;
  for (const auto& attribute : event.attributes) {
    std::cout << ' ' << attribute.key << '=' << attribute.value;
  }
  std::cout << '\n';
}

void print_summary(estate::execution::engine& engine, const uint64_t recent) {
  auto root = engine.state_root();
  std::cout << "state root: "
            << estate::schema::to_hex(estate::schema::bytes_view_t{root})
            << '\n';
  std::cout << "block time: " << engine.block_time() << '\n';

  std::cout << "balances:\n";
  for (const auto& entry : engine.balances()) {
    std::cout << "  " << entry.token << ' '
              << estate::schema::to_string(entry.amount) << " (obligations "
              << estate::schema::to_string(engine.obligations_of(entry.token))
              << ")\n";
  }

  std::cout << "held locks:\n";
  for (const auto& [key, holder] : engine.held_locks()) {
    std::cout << "  " << estate::schema::to_string(key) << " held by "
              << holder << '\n';
  }

  std::cout << "pending settlements:\n";
  for (const auto& continuation : engine.pending_settlements()) {
    std::cout << "  " << continuation.id << ' '
              << estate::schema::to_string(continuation.kind) << ' '
              << estate::schema::to_string(continuation.amount) << ' '
              << continuation.token << " -> " << continuation.recipient
              << '\n';
  }

  auto all = engine.events(0, std::numeric_limits<uint64_t>::max());
  auto first = all.size() > recent ? all.size() - recent : size_t{0};
  std::cout << "recent events:\n";
  for (auto i = first; i < all.size(); ++i) {
    print_event(all[i].first, all[i].second);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto db_path = std::string{};
  auto log_path = std::string{};
  auto seed = estate::schema::engine_config_t{};
  auto oracle = std::string{};
  auto recent = uint64_t{10};
  auto outcome = std::string{};
  auto caller = std::string{};
  auto note = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Estate"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path)->default_value("estate.db"),
      "RocksDB directory holding engine state")(
      "log", po::value<std::string>(&log_path)->default_value("estate.log"),
      "Log file")("owner", po::value<std::string>(&seed.owner),
                  "Contract owner seeded into a fresh database")(
      "admin", po::value<std::vector<std::string>>(&seed.admins)->multitoken(),
      "Admin accounts seeded into a fresh database")(
      "token",
      po::value<std::vector<std::string>>(&seed.supported_tokens)->multitoken(),
      "Whitelisted token accounts seeded into a fresh database")(
      "oracle", po::value<std::string>(&oracle),
      "Oracle account seeded into a fresh database")(
      "events", po::value<uint64_t>(&recent)->default_value(10),
      "Number of recent events to print")(
      "force-resolve", po::value<uint64_t>(),
      "Settle a stuck continuation by id (owner only)")(
      "outcome", po::value<std::string>(&outcome)->default_value("failure"),
      "success|failure for --force-resolve")(
      "caller", po::value<std::string>(&caller),
      "Account invoking --force-resolve")(
      "note", po::value<std::string>(&note)->default_value(""),
      "Audit note recorded with --force-resolve")("verbose,v",
                                                  "Enable verbose output");
  po::store(po::parse_command_line(argc, argv, description), vm);
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "estate", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (!oracle.empty()) {
    seed.oracle_account = oracle;
  }

  auto storage =
      estate::storage::make_storage<estate::storage::rocksdb_storage_tag>(
          db_path);
  auto encoder = estate::execution::encoder_t{};
  auto engine = estate::execution::engine{encoder, storage, std::move(seed)};

  auto status = 0;
  if (vm.contains("force-resolve")) {
    if (outcome != "success" && outcome != "failure") {
      spdlog::error("--outcome must be success or failure, got '{}'", outcome);
      spdlog::shutdown();
      return 2;
    }
    auto id = vm["force-resolve"].as<uint64_t>();
    auto result =
        engine.force_resolve_settlement(caller, id, outcome == "success", note);
    if (result.ok()) {
      spdlog::info("Settlement {} force-resolved as {}", id, outcome);
    } else {
      spdlog::error("Force resolve of settlement {} failed: [{}:{}] {}", id,
                    result.codespace, result.code, result.log);
      status = 1;
    }
  }

  print_summary(engine, recent);

  spdlog::shutdown();
  return status;
}
