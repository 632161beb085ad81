#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/config_validator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/retention/retention_monitor.hpp"
#include "internal/runtime/server.hpp"
#include "internal/runtime/subprocess.hpp"
#include "internal/store/store.hpp"

using walship::runtime::Server;
using walship::runtime::Subprocess;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct Args {
  std::optional<std::string> config_path;
  bool                       expand_env = true;
  std::vector<std::string>   command;
};

void PrintUsage() {
  std::cerr << "Usage: walship [--config PATH] [--no-expand-env] [-- CMD ARGS...]" << std::endl;
}

std::optional<Args> ParseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--") {
      for (++i; i < argc; ++i) args.command.emplace_back(argv[i]);
      break;
    }
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      args.config_path = arg.substr(9);
    } else if (arg == "--no-expand-env") {
      args.expand_env = false;
    } else {
      return std::nullopt;
    }
  }
  return args;
}

void Shutdown() {
  walship::observability::ShutdownMetrics();
  walship::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  auto args = ParseArgs(argc, argv);
  if (!args) {
    PrintUsage();
    return 1;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  walship::runtime::config::RuntimeConfig config;
  std::string                             config_path;
  try {
    config = walship::config::ConfigLoader::Load(args->config_path, args->expand_env, &config_path);
    walship::config::ConfigLoader::ApplyDefaults(config);
    walship::config::Validate(config);
  } catch (const std::exception& e) {
    std::cerr << "walship: " << e.what() << std::endl;
    return 2;
  }

  std::vector<std::string> command = args->command;
  try {
    if (command.empty() && !config.exec().empty()) {
      command = walship::runtime::SplitCommandLine(config.exec());
    }
  } catch (const std::exception& e) {
    std::cerr << "walship: exec: " << e.what() << std::endl;
    return 2;
  }

  walship::observability::InitializeLogging(config);
  walship::observability::InitializeMetrics(config);
  WALSHIP_LOG_INFO("config loaded", {walship::observability::StringField("path", config_path)});

  int exit_code = 0;
  try {
    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = walship::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.store->Open();
    app.retention->Start();

    while (g_running && !app.store->Ready().WaitFor(std::chrono::milliseconds(200))) {
    }

    std::unique_ptr<Subprocess> child;
    if (g_running) {
      WALSHIP_LOG_INFO("walship ready", {walship::observability::StringField("role", walship::store::RoleName(app.store->CurrentRole()))});

      if (!command.empty()) {
        child = std::make_unique<Subprocess>(command);
        child->Start();
      }
    }

    while (g_running) {
      if (child && child->Done().WaitFor(std::chrono::milliseconds(200))) {
        exit_code = child->ExitCode();
        break;
      }
      if (!child) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    WALSHIP_LOG_INFO("Shutting down walship");

    server.Stop();
    app.retention->Stop();
    app.store->Close();
    if (child) child->Terminate();
  } catch (const std::exception& e) {
    WALSHIP_LOG_ERROR("Fatal error", {walship::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  Shutdown();
  return exit_code;
}
