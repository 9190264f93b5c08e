#include <catalog/server/config.hpp>

#include <catalog/internal.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace catalog::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 3000)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --env <name>              Environment name (default: development)\n"
            << "  --api-key <key>           Accepted API key (repeatable, replaces defaults)\n"
            << "  --default-limit <n>       Page size when limit is absent (default: 10)\n"
            << "  --max-limit <n>           Maximum page size (default: 100)\n"
            << "  --no-seed                 Start with an empty catalog\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nEnvironment:\n"
            << "  CATALOG_ENV               Environment name\n"
            << "  CATALOG_API_KEYS          Comma-separated API keys\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --port 3000\n"
            << "  " << argv0 << " --config /etc/catalog/server.yaml\n"
            << "  " << argv0 << " --api-key s3cret --env production --no-seed\n";
}

bool ParseFlag(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

int64_t ParseCount(const std::string& value, const std::string& what) {
  try {
    size_t pos = 0;
    long long v = std::stoll(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    return static_cast<int64_t>(v);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid " + what + ": " + value);
  }
}

uint16_t ParsePort(const std::string& value) {
  int64_t v = ParseCount(value, "port");
  if (v <= 0 || v > 65535) {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<uint16_t>(v);
}

// A maximum given without a default pulls the default down to it.
void ClampDefaultLimit(PaginationConfig* pagination) {
  if (pagination->max_limit >= 1 &&
      pagination->default_limit > pagination->max_limit) {
    pagination->default_limit = pagination->max_limit;
  }
}

uint32_t ParseThreads(const std::string& value) {
  int64_t v = ParseCount(value, "threads");
  if (v < 0) throw std::runtime_error("Invalid threads: " + value);
  return static_cast<uint32_t>(v);
}

}  // namespace

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = internal::Trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  bool default_limit_set = false;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = internal::Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Malformed line in " + path + ": " + line);
    }

    std::string key = internal::Trim(line.substr(0, colon_pos));
    std::string value = internal::Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = ParsePort(value);
      } else if (key == "threads") {
        config.server.threads = ParseThreads(value);
      } else if (key == "log_level") {
        config.server.log_level = value;
      } else if (key == "environment") {
        config.server.environment = value;
      }
    } else if (current_section == "auth") {
      if (key == "api_keys") {
        config.auth.api_keys = SplitList(value);
      } else if (key == "header") {
        config.auth.header = internal::ToLower(value);
      }
    } else if (current_section == "pagination") {
      if (key == "default_limit") {
        config.pagination.default_limit = ParseCount(value, "default_limit");
        default_limit_set = true;
      } else if (key == "max_limit") {
        config.pagination.max_limit = ParseCount(value, "max_limit");
      }
    } else if (current_section == "catalog") {
      if (key == "seed_sample_data") {
        config.catalog.seed_sample_data = ParseFlag(value);
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseFlag(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    }
  }

  if (!default_limit_set) ClampDefaultLimit(&config.pagination);
  return config;
}

void Config::ApplyEnvironment() {
  if (const char* env = std::getenv("CATALOG_ENV"); env && *env) {
    server.environment = env;
  }
  if (const char* keys = std::getenv("CATALOG_API_KEYS"); keys && *keys) {
    auth.api_keys = SplitList(keys);
  }
}

Config Config::LoadFromArgs(int argc, char** argv) {
  std::string config_file;

  // First pass: locate the config file so flags can override it.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_file = argv[i + 1];
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);
  config.ApplyEnvironment();

  std::vector<std::string> cli_keys;
  bool default_limit_set = false;
  bool max_limit_set = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      if (++i >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
    } else if (arg == "--host") {
      if (++i >= argc) {
        throw std::runtime_error("--host requires an address argument");
      }
      config.server.host = argv[i];
    } else if (arg == "--port" || arg == "-p") {
      if (++i >= argc) {
        throw std::runtime_error("--port requires a port number");
      }
      config.server.port = ParsePort(argv[i]);
    } else if (arg == "--threads") {
      if (++i >= argc) {
        throw std::runtime_error("--threads requires a number");
      }
      config.server.threads = ParseThreads(argv[i]);
    } else if (arg == "--env") {
      if (++i >= argc) {
        throw std::runtime_error("--env requires a name");
      }
      config.server.environment = argv[i];
    } else if (arg == "--api-key") {
      if (++i >= argc) {
        throw std::runtime_error("--api-key requires a key");
      }
      cli_keys.push_back(argv[i]);
    } else if (arg == "--max-limit") {
      if (++i >= argc) {
        throw std::runtime_error("--max-limit requires a number");
      }
      config.pagination.max_limit = ParseCount(argv[i], "max_limit");
      max_limit_set = true;
    } else if (arg == "--default-limit") {
      if (++i >= argc) {
        throw std::runtime_error("--default-limit requires a number");
      }
      config.pagination.default_limit = ParseCount(argv[i], "default_limit");
      default_limit_set = true;
    } else if (arg == "--no-seed") {
      config.catalog.seed_sample_data = false;
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        throw std::runtime_error("--log-level requires a level");
      }
      config.server.log_level = argv[i];
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  if (!cli_keys.empty()) {
    config.auth.api_keys = cli_keys;
  }
  if (max_limit_set && !default_limit_set) {
    ClampDefaultLimit(&config.pagination);
  }

  return config;
}

void Config::Validate() const {
  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (auth.api_keys.empty()) {
    throw std::runtime_error("At least one API key is required (auth.api_keys)");
  }
  if (auth.header.empty()) {
    throw std::runtime_error("auth.header must not be empty");
  }

  if (pagination.max_limit < 1) {
    throw std::runtime_error("pagination.max_limit must be at least 1");
  }
  if (pagination.default_limit < 1 ||
      pagination.default_limit > pagination.max_limit) {
    throw std::runtime_error("pagination.default_limit must be between 1 and " +
                             std::to_string(pagination.max_limit));
  }

  if (metrics.enabled && (metrics.path.empty() || metrics.path[0] != '/')) {
    throw std::runtime_error("metrics.path must start with '/'");
  }
}

}  // namespace catalog::server
