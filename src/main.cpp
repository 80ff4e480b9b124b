// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.peerlink)\n"
      << "  --port=<port>        Listen port (default: 9876, 0 = any free port)\n"
      << "  --name=<name>        Display name announced to peers (persisted)\n"
      << "  --connect=<host:port>  Connect to a peer on startup (repeatable)\n"
      << "  --send=<path>        Send a file to every peer that connects (repeatable)\n"
      << "  --autoaccept         Accept incoming connection requests without asking\n"
      << "  --nolisten           Disable inbound connections\n"
      << "  --nodiscovery        Disable local network announcements\n"
      << "  --tlscert=<path>     PEM certificate (enables TLS together with --tlskey)\n"
      << "  --tlskey=<path>      PEM private key\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, discovery, transfer, app, all\n"
      << "                       Can be comma-separated: --debug=network,transfer\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    peerlink::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << peerlink::GetFullVersionString() << std::endl;
        std::cout << peerlink::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = peerlink::util::SafeParseInt(arg.substr(7), 0, 65535);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 0 and 65535" << std::endl;
          return 1;
        }
        config.network_config.listen_port = static_cast<uint16_t>(*port_opt);
      } else if (arg.find("--name=") == 0) {
        std::string name = arg.substr(7);
        if (name.empty()) {
          std::cerr << "Error: --name must not be empty" << std::endl;
          return 1;
        }
        config.display_name = name;
      } else if (arg.find("--connect=") == 0) {
        auto target = peerlink::util::ParseHostPort(arg.substr(10));
        if (!target) {
          std::cerr << "Error: Invalid address: " << arg.substr(10) << std::endl;
          std::cerr << "Expected host:port or [ipv6]:port" << std::endl;
          return 1;
        }
        config.connect.push_back(*target);
      } else if (arg.find("--send=") == 0) {
        std::filesystem::path path = arg.substr(7);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
          std::cerr << "Error: Not a file: " << path.string() << std::endl;
          return 1;
        }
        config.send_paths.push_back(path);
      } else if (arg == "--autoaccept") {
        config.auto_accept = true;
      } else if (arg == "--nolisten") {
        config.network_config.listen_enabled = false;
      } else if (arg == "--nodiscovery") {
        config.network_config.enable_multicast_discovery = false;
      } else if (arg.find("--tlscert=") == 0) {
        config.tls_cert = arg.substr(10);
      } else if (arg.find("--tlskey=") == 0) {
        config.tls_key = arg.substr(9);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,transfer
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir.string() << ": "
                << ec.message() << std::endl;
      return 1;
    }

    std::string log_file = (config.datadir / "debug.log").string();
    peerlink::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        peerlink::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        peerlink::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        peerlink::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    int exit_code = 0;
    {
      peerlink::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start application");
        exit_code = 1;
      } else {
        app.wait_for_shutdown();
      }
    }

    // Shutdown logging AFTER app is fully destroyed
    peerlink::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    peerlink::util::LogManager::Shutdown();
    return 1;
  }
}
