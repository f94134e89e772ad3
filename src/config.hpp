#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace anxious {

constexpr double DEFAULT_BASE_SENS = 1.0;
constexpr double DEFAULT_MAX_SENS = 15.0;
constexpr double DEFAULT_RAMP_RATE = 0.3;

constexpr const char* DEFAULT_ENV_DIR = "/etc/anxious-scroll";
constexpr const char* DEFAULT_ENV_FILE = "anxious-scroll.env";
constexpr const char* DEFAULT_SERVICE_NAME = "anxious-scroll";
constexpr const char* DEFAULT_INSTALL_PATH = "/usr/local/bin/anxious-scroll";

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Curve and device settings, fixed once the relay starts.
struct Config {
    double base_sensitivity = DEFAULT_BASE_SENS;
    double max_sensitivity = DEFAULT_MAX_SENS;
    double ramp_rate = DEFAULT_RAMP_RATE;
    std::optional<std::string> device_path;
    bool debug = false;

    // Throws ConfigError unless max > base > 0 and ramp_rate > 0.
    void validate() const;
};

enum class Command { Run, ListDevices, Install, Uninstall, Help };

struct Args {
    Config config;
    Command command = Command::Run;
    std::string install_path = DEFAULT_INSTALL_PATH;
    std::string service_name = DEFAULT_SERVICE_NAME;
    std::string env_dir = DEFAULT_ENV_DIR;
};

// Parses argv and validates the resulting Config. Throws ConfigError.
Args parse_args(int argc, const char* const* argv);

void usage(const char* prog, bool show_install);

}  // namespace anxious
