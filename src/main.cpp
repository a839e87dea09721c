#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Server options:\n"
      << "  --bind=<address>         Local address (default: 0.0.0.0)\n"
      << "  --port=<port>            Local port (default: 7400)\n"
      << "  --reuseaddr              Set SO_REUSEADDR before binding\n"
      << "  --loopback               Accept datagrams sent by this server's own socket\n"
      << "  --noecho                 Do not echo unmatched datagrams back\n"
      << "  --session-timeout=<s>    Dispose sessions idle this long (0 = never, default: 1200)\n"
      << "  --queue-size=<n>         Pending requests per session (default: 256)\n"
      << "  --threads=<n>            IO threads (default: hardware concurrency)\n"
      << "\n"
      << "Client options:\n"
      << "  --ping=<uri>             Send a request to <uri> (e.g. udp://10.0.0.2:7400)\n"
      << "                           and wait for the matching response\n"
      << "  --payload=<text>         Request payload (default: ping)\n"
      << "  --count=<n>              Number of requests (default: 1)\n"
      << "  --match-timeout=<ms>     Request timeout (default: 15000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                           Default: info\n"
      << "  --debug=<component>      Enable trace logging for specific component(s)\n"
      << "                           Components: network, session, match, app, all\n"
      << "                           Can be comma-separated: --debug=network,match\n"
      << "  --logfile=<path>         Log to a rotating file instead of the console\n"
      << "  --dump=<bytes>           Hex dump sent/received datagrams (debug level)\n"
      << "  --verbose                Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n"
      << std::endl;
}

namespace {

// "--name=value" -> value, when arg starts with prefix
bool OptionValue(const std::string &arg, const std::string &prefix,
                 std::string &out) {
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  out = arg.substr(prefix.size());
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    netsession::app::AppConfig config;
    auto &server = config.server_config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << netsession::GetFullVersionString() << std::endl;
        std::cout << netsession::GetCopyrightString() << std::endl;
        return 0;
      } else if (OptionValue(arg, "--bind=", value)) {
        auto normalized = netsession::util::ValidateAndNormalizeIP(value);
        if (!normalized) {
          std::cerr << "Error: Invalid bind address: " << value << std::endl;
          return 1;
        }
        server.local.SetHost(*normalized);
      } else if (OptionValue(arg, "--port=", value)) {
        auto port_opt = netsession::util::SafeParsePort(value);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << value << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        server.local.set_port(*port_opt);
      } else if (arg == "--reuseaddr") {
        server.reuse_address = true;
      } else if (arg == "--loopback") {
        server.loopback = true;
      } else if (arg == "--noecho") {
        config.echo = false;
      } else if (OptionValue(arg, "--session-timeout=", value)) {
        auto seconds = netsession::util::SafeParseInt(value, 0, 86400 * 7);
        if (!seconds) {
          std::cerr << "Error: Invalid session timeout: " << value << std::endl;
          return 1;
        }
        server.session_timeout = std::chrono::seconds(*seconds);
      } else if (OptionValue(arg, "--queue-size=", value)) {
        auto size = netsession::util::SafeParseInt(value, 1, 65536);
        if (!size) {
          std::cerr << "Error: Invalid queue size: " << value << std::endl;
          return 1;
        }
        server.match_queue_size = static_cast<size_t>(*size);
      } else if (OptionValue(arg, "--threads=", value)) {
        auto threads = netsession::util::SafeParseInt(value, 1, 256);
        if (!threads) {
          std::cerr << "Error: Invalid thread count: " << value << std::endl;
          return 1;
        }
        server.io_threads = static_cast<size_t>(*threads);
      } else if (OptionValue(arg, "--ping=", value)) {
        config.ping_uri = value;
      } else if (OptionValue(arg, "--payload=", value)) {
        config.ping_payload = value;
      } else if (OptionValue(arg, "--count=", value)) {
        auto count = netsession::util::SafeParseInt(value, 1, 1000000);
        if (!count) {
          std::cerr << "Error: Invalid count: " << value << std::endl;
          return 1;
        }
        config.ping_count = *count;
      } else if (OptionValue(arg, "--match-timeout=", value)) {
        auto timeout = netsession::util::SafeParseInt(value, 1, 3600 * 1000);
        if (!timeout) {
          std::cerr << "Error: Invalid match timeout: " << value << std::endl;
          return 1;
        }
        server.match_timeout_ms = *timeout;
      } else if (OptionValue(arg, "--dump=", value)) {
        auto bytes = netsession::util::SafeParseInt(value, 0, 65536);
        if (!bytes) {
          std::cerr << "Error: Invalid dump length: " << value << std::endl;
          return 1;
        }
        server.log_send = true;
        server.log_receive = true;
        server.log_data_length = static_cast<size_t>(*bytes);
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (OptionValue(arg, "--loglevel=", value)) {
        log_level = value;
      } else if (OptionValue(arg, "--logfile=", value)) {
        log_file = value;
      } else if (OptionValue(arg, "--debug=", value)) {
        // Parse comma-separated components: --debug=network,match
        size_t pos = 0;
        while (pos < value.length()) {
          size_t comma = value.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(value.substr(pos));
            break;
          }
          debug_components.push_back(value.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    netsession::util::LogManager::Initialize(log_level, !log_file.empty(),
                                             log_file.empty() ? "netsession.log"
                                                              : log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        netsession::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        netsession::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        netsession::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents race conditions where async callbacks try to log after logger is destroyed
    {
      netsession::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      if (app.is_client()) {
        int matched = app.run_client();
        exit_code = matched == config.ping_count ? 0 : 2;
        app.stop();
      } else {
        // Run until shutdown requested
        app.wait_for_shutdown();
      }
    }

    // Shutdown logging AFTER app is fully destroyed
    netsession::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    netsession::util::LogManager::Shutdown();
    return 1;
  }
}
