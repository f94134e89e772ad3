#include "install.hpp"

#include <limits.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <system_error>

namespace anxious {

namespace fs = std::filesystem;

namespace {

bool run_cmd_ok(const std::string& cmd, const char* action) {
    int rc = system(cmd.c_str());
    if (rc == -1) {
        perror(action);
        return false;
    }
    if (WIFEXITED(rc)) {
        int code = WEXITSTATUS(rc);
        if (code == 0) return true;
        std::cerr << action << " failed with exit code " << code << std::endl;
        return false;
    }
    if (WIFSIGNALED(rc)) {
        std::cerr << action << " terminated by signal " << WTERMSIG(rc) << std::endl;
        return false;
    }
    std::cerr << action << " failed with status " << rc << std::endl;
    return false;
}

bool write_file(const std::string& path, const std::string& content, mode_t mode) {
    {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) {
            std::cerr << "failed to write " << path << std::endl;
            return false;
        }
        f << content;
        f.flush();
        if (!f) {
            std::cerr << "failed to flush " << path << std::endl;
            return false;
        }
    }
    if (chmod(path.c_str(), mode) != 0) {
        perror(("chmod " + path).c_str());
        return false;
    }
    return true;
}

void remove_if_present(const std::string& path) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
        std::cout << "[uninstall] removed " << path << std::endl;
    } else if (ec) {
        std::cerr << "[uninstall] could not remove " << path << ": " << ec.message() << std::endl;
    }
}

}  // namespace

std::string unit_file_path(const std::string& service_name) {
    return "/etc/systemd/system/" + service_name + ".service";
}

std::string env_file_path(const Args& args) { return args.env_dir + "/" + DEFAULT_ENV_FILE; }

std::string render_env(const Config& config) {
    std::ostringstream ef;
    ef << std::setprecision(std::numeric_limits<double>::max_digits10);
    ef << "SCROLL_DEVICE=" << config.device_path.value_or("") << "\n";
    ef << "BASE_SENS=" << config.base_sensitivity << "\n";
    ef << "MAX_SENS=" << config.max_sensitivity << "\n";
    ef << "RAMP_RATE=" << config.ramp_rate << "\n";
    ef << "SCROLL_DEBUG=" << (config.debug ? "1" : "") << "\n";
    return ef.str();
}

std::string render_unit(const Args& args, const std::string& env_path) {
    std::ostringstream uf;
    uf << "[Unit]\n";
    uf << "Description=Anxious scroll: velocity-sensitive mouse wheel acceleration\n";
    uf << "After=local-fs.target systemd-udev-settle.service\n";
    uf << "ConditionPathExists=/dev/uinput\n\n";
    uf << "[Service]\n";
    uf << "Type=simple\n";
    uf << "EnvironmentFile=" << env_path << "\n";
    uf << "ExecStart=/bin/sh -c 'exec \"" << args.install_path
       << "\" ${SCROLL_DEVICE:+--device \"${SCROLL_DEVICE}\"} ${BASE_SENS:+--base-sens \"${BASE_SENS}\"}"
          " ${MAX_SENS:+--max-sens \"${MAX_SENS}\"} ${RAMP_RATE:+--ramp-rate \"${RAMP_RATE}\"}"
          " ${SCROLL_DEBUG:+--debug}'\n";
    uf << "Restart=on-failure\n";
    uf << "RestartSec=2s\n\n";
    uf << "[Install]\n";
    uf << "WantedBy=multi-user.target\n";
    return uf.str();
}

std::string read_self_path() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n < 0) {
        throw std::system_error(errno, std::generic_category(), "readlink /proc/self/exe");
    }
    buf[n] = '\0';
    return std::string(buf);
}

bool is_installed_copy(const std::string& service_name) {
    std::string unit_path = unit_file_path(service_name);
    std::error_code ec;
    if (!fs::exists(unit_path, ec)) return false;
    std::ifstream in(unit_path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    try {
        return ss.str().find(read_self_path()) != std::string::npos;
    } catch (const std::system_error&) {
        return false;
    }
}

int write_installation(const Args& args, const std::string& unit_path, const CommandRunner& run) {
    std::string env_path = env_file_path(args);
    try {
        fs::create_directories(args.env_dir);
        fs::create_directories(fs::path(unit_path).parent_path());
    } catch (const fs::filesystem_error& e) {
        std::cerr << "filesystem error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (!write_file(env_path, render_env(args.config), 0644)) return EXIT_FAILURE;
    if (!write_file(unit_path, render_unit(args, env_path), 0644)) return EXIT_FAILURE;

    if (!run("systemctl daemon-reload", "systemctl daemon-reload")) return EXIT_FAILURE;
    if (!run("systemctl enable " + args.service_name + ".service", "systemctl enable")) return EXIT_FAILURE;
    if (!run("systemctl restart " + args.service_name + ".service", "systemctl restart")) return EXIT_FAILURE;
    return 0;
}

int remove_installation(const Args& args, const std::string& unit_path, const CommandRunner& run) {
    std::error_code ec;
    bool has_unit = fs::exists(unit_path, ec);
    if (has_unit) {
        // Stopping lets the running daemon ungrab and remove its virtual device.
        if (!run("systemctl disable --now " + args.service_name + ".service", "systemctl disable")) {
            return EXIT_FAILURE;
        }
    } else {
        std::cerr << "[uninstall] warning: " << unit_path << " does not exist; removing leftover files" << std::endl;
    }
    remove_if_present(unit_path);
    remove_if_present(env_file_path(args));
    remove_if_present(args.install_path);
    if (has_unit && !run("systemctl daemon-reload", "systemctl daemon-reload")) return EXIT_FAILURE;
    return 0;
}

int install_service(const Args& args) {
    if (geteuid() != 0) {
        std::cerr << "install requires root" << std::endl;
        return EXIT_FAILURE;
    }
    if (args.config.device_path && !fs::exists(*args.config.device_path)) {
        std::cerr << "device path not found: " << *args.config.device_path << std::endl;
        return EXIT_FAILURE;
    }
    if (!run_cmd_ok("command -v systemctl >/dev/null 2>&1", "systemctl availability check")) {
        std::cerr << "systemctl not available; systemd required for --install" << std::endl;
        return EXIT_FAILURE;
    }
    std::string unit_path = unit_file_path(args.service_name);
    if (fs::exists(unit_path)) {
        std::cerr << "already installed: " << unit_path << " exists; refusing to reinstall" << std::endl;
        std::cerr << "edit the env file and restart the service if you need changes." << std::endl;
        return EXIT_FAILURE;
    }
    try {
        std::string self = read_self_path();
        if (self != args.install_path) {
            fs::create_directories(fs::path(args.install_path).parent_path());
            fs::copy_file(self, args.install_path, fs::copy_options::overwrite_existing);
            if (chmod(args.install_path.c_str(), 0755) != 0) {
                perror("chmod install_path");
                return EXIT_FAILURE;
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "filesystem error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::system_error& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (write_installation(args, unit_path, run_cmd_ok) != 0) {
        std::cerr << "install incomplete; run --uninstall to remove what was written" << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "Service installed and started." << std::endl;
    std::cout << "Logs: journalctl -u " << args.service_name << " -f" << std::endl;
    return 0;
}

int uninstall_service(const Args& args) {
    if (geteuid() != 0) {
        std::cerr << "uninstall requires root" << std::endl;
        return EXIT_FAILURE;
    }
    if (remove_installation(args, unit_file_path(args.service_name), run_cmd_ok) != 0) return EXIT_FAILURE;
    std::cout << "Service removed." << std::endl;
    return 0;
}

}  // namespace anxious
