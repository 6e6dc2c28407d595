#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <leash/crypto/random.hpp>
#include <leash/execution/engine.hpp>
#include <leash/rpc/server.hpp>
#include <leash/storage/rocksdb/storage.hpp>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto db_path = std::string{};
  auto grpc_address = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};
  auto options = leash::execution::engine_options{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Leash"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI-style file with any of the options below")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "leash.db"),
      "RocksDB directory")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:50051"),
      "IP:Port for the session service")(
      "renewal-interval-seconds",
      boost::program_options::value<uint64_t>(
          &options.renewal_interval_seconds)
          ->default_value(options.renewal_interval_seconds),
      "Seconds between renewal scheduler passes")(
      "lookahead-ratio-percent",
      boost::program_options::value<uint32_t>(&options.lookahead_ratio_percent)
          ->default_value(options.lookahead_ratio_percent),
      "Renewal window as a percentage of the session duration")(
      "lookahead-floor-seconds",
      boost::program_options::value<uint64_t>(&options.lookahead_floor_seconds)
          ->default_value(options.lookahead_floor_seconds),
      "Minimum renewal window")(
      "challenge-ttl-seconds",
      boost::program_options::value<uint64_t>(&options.challenge_ttl_seconds)
          ->default_value(options.challenge_ttl_seconds),
      "Unanswered challenges older than this are expired")(
      "max-cas-retries",
      boost::program_options::value<uint32_t>(&options.max_cas_retries)
          ->default_value(options.max_cas_retries),
      "Conditional write attempts before reporting contention")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "leash.log"),
      "Log file written next to the console output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        std::cerr << "cannot open config file '" << path << "'" << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(input, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "leash", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  if (!leash::crypto::available()) {
    spdlog::critical("OpenSSL random generator is not seeded");
    spdlog::shutdown();
    return 1;
  }

  auto encoder = leash::storage::encoder_t{};
  auto storage = leash::storage::make_storage<leash::storage::rocksdb_storage_tag>(
      db_path);
  auto engine = leash::execution::engine{encoder, storage, options};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = leash::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Session service listening on {}", grpc_address);

  engine.start_scheduler();

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  engine.stop_scheduler();
  spdlog::shutdown();
  return 0;
}
