#pragma once

#include "config.hpp"

#include <functional>
#include <string>

namespace anxious {

std::string unit_file_path(const std::string& service_name);
std::string env_file_path(const Args& args);

// Contents of the EnvironmentFile read by the unit.
std::string render_env(const Config& config);
std::string render_unit(const Args& args, const std::string& env_path);

std::string read_self_path();

// True when a unit of that name already launches this binary.
bool is_installed_copy(const std::string& service_name);

// Runs a shell command, reporting failures against the action name.
using CommandRunner = std::function<bool(const std::string& cmd, const char* action)>;

// Writes the env file and unit under the given unit path, then reloads,
// enables and restarts the service. Returns a process exit status.
int write_installation(const Args& args, const std::string& unit_path, const CommandRunner& run);

// Removes whatever part of an installation is present. The service is
// only stopped when its unit exists.
int remove_installation(const Args& args, const std::string& unit_path, const CommandRunner& run);

// Both return a process exit status.
int install_service(const Args& args);
int uninstall_service(const Args& args);

}  // namespace anxious
