#include "config.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace anxious {

namespace {

double parse_double_strict(const std::string& opt, const std::string& s) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos == s.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw ConfigError(opt + ": not a number: '" + s + "'");
}

// The name ends up in systemctl command lines and the unit file path.
std::string parse_service_name(const std::string& s) {
    if (s.empty()) throw ConfigError("--service-name: must not be empty");
    for (char c : s) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
                  c == '.' || c == '@' || c == '-';
        if (!ok) throw ConfigError("--service-name: invalid character in '" + s + "'");
    }
    return s;
}

}  // namespace

void Config::validate() const {
    std::ostringstream ss;
    if (!std::isfinite(base_sensitivity) || base_sensitivity <= 0.0) {
        ss << "base sensitivity must be > 0 (got " << base_sensitivity << ")";
    } else if (!std::isfinite(max_sensitivity) || max_sensitivity <= base_sensitivity) {
        ss << "max sensitivity must be > base sensitivity (got max " << max_sensitivity
           << ", base " << base_sensitivity << ")";
    } else if (!std::isfinite(ramp_rate) || ramp_rate <= 0.0) {
        ss << "ramp rate must be > 0 (got " << ramp_rate << ")";
    } else if (device_path && device_path->empty()) {
        ss << "device path must not be empty";
    } else {
        return;
    }
    throw ConfigError(ss.str());
}

void usage(const char* prog, bool show_install) {
    std::cerr << "Usage: " << prog << " [--device <path>] [options]\n\n"
              << "Options:\n"
              << "  -D, --device <path>    Physical mouse event node (default: autodetect)\n"
              << "  -d, --debug            Log every scroll decision\n"
              << "  --base-sens <float>    Multiplier for slow scrolling (default 1.0)\n"
              << "  --max-sens <float>     Multiplier ceiling for fast scrolling (default 15.0)\n"
              << "  --ramp-rate <float>    How quickly the multiplier ramps up (default 0.3)\n"
              << "  --list-devices         List candidates and exit\n"
              << (show_install ? "\nInstall (run as root):\n"
                                 "  --install              Install binary + systemd service (one-time)\n"
                                 "  --uninstall            Stop and remove the systemd service\n"
                                 "  --install-path <path>  Install binary path (default /usr/local/bin/anxious-scroll)\n"
                                 "  --service-name <name>  Systemd unit base name (default anxious-scroll)\n"
                                 "  --env-dir <dir>        Directory for .env file (default /etc/anxious-scroll)\n"
                               : "")
              << std::endl;
}

Args parse_args(int argc, const char* const* argv) {
    Args a;
    auto value_of = [&](int& i) -> std::string {
        if (i + 1 >= argc) throw ConfigError(std::string(argv[i]) + ": missing value");
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--device" || arg == "-D") {
            a.config.device_path = value_of(i);
        } else if (arg == "--debug" || arg == "-d") {
            a.config.debug = true;
        } else if (arg == "--base-sens") {
            a.config.base_sensitivity = parse_double_strict(arg, value_of(i));
        } else if (arg == "--max-sens") {
            a.config.max_sensitivity = parse_double_strict(arg, value_of(i));
        } else if (arg == "--ramp-rate") {
            a.config.ramp_rate = parse_double_strict(arg, value_of(i));
        } else if (arg == "--list-devices") {
            a.command = Command::ListDevices;
        } else if (arg == "--install") {
            a.command = Command::Install;
        } else if (arg == "--uninstall") {
            a.command = Command::Uninstall;
        } else if (arg == "--install-path") {
            a.install_path = value_of(i);
        } else if (arg == "--service-name") {
            a.service_name = parse_service_name(value_of(i));
        } else if (arg == "--env-dir") {
            a.env_dir = value_of(i);
        } else if (arg == "--help" || arg == "-h") {
            a.command = Command::Help;
            return a;
        } else {
            throw ConfigError("unknown option: " + arg);
        }
    }
    a.config.validate();
    return a;
}

}  // namespace anxious
