#include "config/config.hpp"
#include <boost/program_options.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>
#include <vector>

namespace objstore::config {

namespace po = boost::program_options;

namespace {

std::size_t default_workers() {
  const unsigned int cores = std::thread::hardware_concurrency();
  return cores == 0 ? 1 : cores;
}

po::options_description make_options() {
  po::options_description options("Options");
  options.add_options()
    ("help,h", "Print this help message")
    ("verbose,v", po::bool_switch(), "Print verbose output")
    ("config,c", po::value<std::string>()->default_value("config.ini"), "Path to the configuration file")
    ("listen-address,l", po::value<std::string>()->default_value(
        std::string(kDefaultListenHost) + ":" + std::to_string(kDefaultListenPort)),
      "Address to listen to in the form of <port> or <address>:<port>")
    ("persist,p", po::bool_switch(), "Whether to use persistent storage to store objects")
    ("data-path", po::value<std::string>()->default_value("."), "Path to folder of persistent data")
    ("max-object-size", po::value<std::uint64_t>()->default_value(kDefaultMaxObjectSize),
      "Maximum object size in bytes")
    ("workers", po::value<std::size_t>()->default_value(default_workers()), "Number of HTTP worker threads")
    ("log-file", po::value<std::string>()->default_value(""), "Also write logs to this file");
  return options;
}

// data-path -> OBJSTORE_DATA_PATH
std::string option_to_environment(const std::string& option) {
  std::string name(kEnvironmentPrefix);
  for (unsigned char c : option) {
    name += c == '-' ? '_' : static_cast<char>(std::toupper(c));
  }
  return name;
}

po::parsed_options parse_environment(const po::options_description& options,
                                     const EnvironmentLookup& environment) {
  po::parsed_options parsed(&options);
  for (const auto& option : options.options()) {
    const std::string& name = option->long_name();
    if (name == "help") {
      continue;
    }
    const std::string value = environment(option_to_environment(name));
    if (!value.empty()) {
      parsed.options.emplace_back(name, std::vector<std::string>{value});
    }
  }
  return parsed;
}

std::string system_environment(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return value;
  }
  return "";
}

} // namespace

std::pair<std::string, std::uint16_t> parse_listen_address(const std::string& address) {
  std::string host;
  std::string port_str;

  const auto colon = address.rfind(':');
  if (colon == std::string::npos) {
    port_str = address;
  } else {
    host = address.substr(0, colon);
    port_str = address.substr(colon + 1);
  }

  if (host.empty()) {
    host = kDefaultListenHost;
  } else if (host == "*") {
    host = "0.0.0.0";
  }

  if (port_str.empty()) {
    return {host, kDefaultListenPort};
  }
  if (!std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); }) ||
      port_str.size() > 5) {
    throw ConfigError("invalid port in listen address \"" + address + "\"");
  }
  const unsigned long port = std::stoul(port_str);
  if (port > 65535) {
    throw ConfigError("port out of range in listen address \"" + address + "\"");
  }
  return {host, static_cast<std::uint16_t>(port)};
}

std::string usage(const std::string& program_name) {
  std::stringstream text;
  text << "Usage: " << program_name << " [options]\n" << make_options();
  return text.str();
}

ServerConfig load_config(int argc, const char* const argv[]) {
  return load_config(argc, argv, system_environment);
}

ServerConfig load_config(int argc, const char* const argv[], const EnvironmentLookup& environment) {
  const po::options_description options = make_options();
  ServerConfig config;

  config.usage = usage(argc > 0 ? argv[0] : "objstore-server");

  po::variables_map vm;
  try {
    // First stored value wins: command line, then environment, then file
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::store(parse_environment(options, environment), vm);

    const std::string config_file = vm["config"].as<std::string>();
    if (std::filesystem::exists(config_file)) {
      po::store(po::parse_config_file<char>(config_file.c_str(), options, true), vm);
      config.config_file = config_file;
    } else if (!vm["config"].defaulted()) {
      throw ConfigError("config file " + config_file + " not found");
    }

    po::notify(vm);
  }
  catch (const po::error& e) {
    throw ConfigError(e.what());
  }

  config.show_help = vm.count("help") > 0;
  config.verbose = vm["verbose"].as<bool>();
  config.persist = vm["persist"].as<bool>();
  config.data_path = vm["data-path"].as<std::string>();
  config.max_object_size = vm["max-object-size"].as<std::uint64_t>();
  config.workers = std::max<std::size_t>(1, vm["workers"].as<std::size_t>());
  config.log_file = vm["log-file"].as<std::string>();

  auto [host, port] = parse_listen_address(vm["listen-address"].as<std::string>());
  config.listen_host = host;
  config.listen_port = port;

  if (config.max_object_size == 0) {
    throw ConfigError("max-object-size must be positive");
  }
  return config;
}

} // namespace objstore::config
