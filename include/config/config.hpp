#ifndef OBJSTORE_CONFIG_CONFIG_HPP
#define OBJSTORE_CONFIG_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace objstore::config {

constexpr const char* kDefaultListenHost = "0.0.0.0";
constexpr std::uint16_t kDefaultListenPort = 8080;
constexpr std::uint64_t kDefaultMaxObjectSize = 10 << 20;  // 10 MiB
constexpr const char* kEnvironmentPrefix = "OBJSTORE_";

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

struct ServerConfig {
  bool verbose{false};
  bool persist{false};
  bool show_help{false};
  std::string config_file;
  std::string listen_host{kDefaultListenHost};
  std::uint16_t listen_port{kDefaultListenPort};
  std::string data_path{"."};
  std::uint64_t max_object_size{kDefaultMaxObjectSize};
  std::size_t workers{1};
  std::string log_file;
  std::string usage;
};

// Looks up one environment variable, returns an empty string when unset
using EnvironmentLookup = std::function<std::string(const std::string&)>;

// Builds the configuration from, in decreasing precedence, the command line,
// OBJSTORE_* environment variables, the INI config file and the defaults.
// Throws ConfigError on unknown options or invalid values.
ServerConfig load_config(int argc, const char* const argv[]);
ServerConfig load_config(int argc, const char* const argv[], const EnvironmentLookup& environment);

// Help text listing every option
std::string usage(const std::string& program_name);

// Splits "<port>", "<host>:<port>", "*:<port>" or "<host>:" into host and
// port, filling the missing half with the defaults
std::pair<std::string, std::uint16_t> parse_listen_address(const std::string& address);

} // namespace objstore::config

#endif // OBJSTORE_CONFIG_CONFIG_HPP
