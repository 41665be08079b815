#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using epd::config::ConfigLoader;
using epd::config::ConfigOverrides;
using epd::factory::Build;
using epd::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void PrintUsage(std::ostream& out) {
  out << "Usage: epd-server [--config <config.yaml>] [options]\n"
      << "  -c, --config <file>      YAML runtime config\n"
      << "  -i, --image-dir <dir>    directory holding device images\n"
      << "  -W, --epd-width <px>     display width\n"
      << "  -H, --epd-height <px>    display height\n"
      << "  -b, --bind <host:port>   listen address (default " << epd::config::kDefaultBindAddress << ")\n"
      << "  -h, --help               show this help\n";
}

std::uint32_t ParseDimension(const std::string& flag, const std::string& text) {
  std::size_t   consumed = 0;
  unsigned long value    = 0;
  try {
    value = std::stoul(text, &consumed, 10);
  } catch (const std::exception&) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + text + "'");
  }
  if (consumed != text.size() || value == 0 || value > UINT32_MAX) {
    throw std::invalid_argument(flag + " expects a positive integer, got '" + text + "'");
  }
  return static_cast<std::uint32_t>(value);
}

struct CommandLine {
  std::string     config_path;
  ConfigOverrides overrides;
  bool            help = false;
};

CommandLine ParseCommandLine(int argc, char** argv) {
  CommandLine cmd;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " requires a value");
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      cmd.help = true;
    } else if (arg == "-c" || arg == "--config") {
      cmd.config_path = next();
    } else if (arg == "-i" || arg == "--image-dir") {
      cmd.overrides.image_dir = next();
    } else if (arg == "-W" || arg == "--epd-width") {
      cmd.overrides.width = ParseDimension(arg, next());
    } else if (arg == "-H" || arg == "--epd-height") {
      cmd.overrides.height = ParseDimension(arg, next());
    } else if (arg == "-b" || arg == "--bind") {
      cmd.overrides.bind_address = next();
    } else if (cmd.config_path.empty() && !arg.empty() && arg[0] != '-') {
      cmd.config_path = arg;
    } else {
      throw std::invalid_argument("unknown argument '" + arg + "'");
    }
  }

  return cmd;
}

void ShutdownObservability() {
  epd::observability::ShutdownTelemetry();
  epd::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  CommandLine cmd;
  try {
    cmd = ParseCommandLine(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "epd-server: " << e.what() << std::endl;
    PrintUsage(std::cerr);
    return 1;
  }

  if (cmd.help) {
    PrintUsage(std::cout);
    return 0;
  }

  epd::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!cmd.config_path.empty()) {
      config = ConfigLoader::LoadFromYaml(cmd.config_path);
    }
    ConfigLoader::ApplyOverrides(cmd.overrides, &config);
    ConfigLoader::ApplyDefaults(&config);
    ConfigLoader::ValidateConfig(config);
  } catch (const std::exception& e) {
    std::cerr << "epd-server: " << e.what() << std::endl;
    PrintUsage(std::cerr);
    return 1;
  }

  try {
    epd::observability::InitializeLogging(config);
    const auto telemetry = epd::observability::InitializeTelemetry(config);
    EPD_LOG_INFO("telemetry export", {epd::observability::IntField("traces", telemetry.traces ? 1 : 0),
                                      epd::observability::IntField("metrics", telemetry.metrics ? 1 : 0)});

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    EPD_LOG_INFO("epd-server started", {epd::observability::StringField("bind_address", config.server().bind_address()),
                                        epd::observability::StringField("image_dir", config.store().image_dir())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EPD_LOG_INFO("Shutting down epd-server");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    EPD_LOG_ERROR("Fatal error", {epd::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
