#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

namespace {

using lotgate::observability::IntField;
using lotgate::observability::StringField;
namespace cfg = lotgate::runtime::config;

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Invocation {
  std::string config_path;
  bool        check_only = false;
};

// lotgate [--check] <config.yaml> | lotgate [--check] --config <config.yaml>
std::optional<Invocation> ParseArgs(int argc, char** argv) {
  Invocation invocation;
  int        i = 1;
  if (i < argc && std::string(argv[i]) == "--check") {
    invocation.check_only = true;
    ++i;
  }
  if (i < argc && std::string(argv[i]) == "--config") ++i;
  if (i + 1 != argc) return std::nullopt;

  invocation.config_path = argv[i];
  return invocation;
}

void LogLotSummary(const cfg::RuntimeConfig& config, const std::string& bind_address) {
  const auto& parking = config.parking();
  LOTGATE_LOG_INFO("lotgate started",
                   {StringField("bind_address", bind_address), StringField("mode", cfg::OperatingMode_Name(parking.operating_mode())),
                    StringField("cameras", cfg::EntryExitMode_Name(parking.entry_exit_mode())),
                    StringField("payment", cfg::PaymentRequired_Name(parking.payment_required())),
                    IntField("barrier_count", config.barriers_size()), IntField("camera_count", config.cameras_size())});
}

} // namespace

int main(int argc, char** argv) {
  const auto invocation = ParseArgs(argc, argv);
  if (!invocation) {
    std::cerr << "Usage: lotgate [--check] <config.yaml> OR lotgate [--check] --config <config.yaml>" << std::endl;
    return 1;
  }

  cfg::RuntimeConfig config;
  try {
    config = lotgate::config::ConfigLoader::LoadFromYaml(invocation->config_path);
    lotgate::config::ConfigLoader::Validate(config);
  } catch (const std::exception& e) {
    std::cerr << invocation->config_path << ": " << e.what() << std::endl;
    return 2;
  }

  if (invocation->check_only) {
    std::cout << invocation->config_path << ": ok" << std::endl;
    return 0;
  }

  try {
    lotgate::observability::InitializeLogging(config);
    lotgate::observability::InitializeMetrics(config);

    auto app = lotgate::factory::Build(config);

    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
    lotgate::runtime::Server server(bind_address, std::move(app.grpc_services));

    // handlers go in before any worker thread exists
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    LogLotSummary(config, bind_address);

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    LOTGATE_LOG_INFO("shutting down lotgate");

    // stop taking detections before the barriers and timeout sweep go away
    server.Stop();
    app.Stop();
  } catch (const std::exception& e) {
    LOTGATE_LOG_ERROR("fatal error", {StringField("error", e.what())});
    lotgate::observability::ShutdownMetrics();
    lotgate::observability::ShutdownLogging();
    return 2;
  }

  lotgate::observability::ShutdownMetrics();
  lotgate::observability::ShutdownLogging();
  return 0;
}
