#pragma once

#include "config.hpp"
#include "device.hpp"

#include <memory>
#include <ostream>
#include <string>

namespace anxious {

// Pairs the grabbed physical device with its virtual mirror. Destruction
// removes the virtual device first, then releases the grab; there is no
// other release path.
class Session {
public:
    Session(std::unique_ptr<EventSource> physical, std::unique_ptr<EventSink> virtual_device, std::string path,
            std::ostream& log);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Resolves the device (config.device_path or autodetection), grabs it
    // and creates the virtual device. Throws DeviceError; nothing stays
    // acquired when it does.
    static std::unique_ptr<Session> open(const Config& config, std::ostream& log);

    EventSource& physical() { return *physical_; }
    EventSink& virtual_device() { return *virtual_; }
    const std::string& path() const { return path_; }

private:
    std::unique_ptr<EventSource> physical_;
    std::unique_ptr<EventSink> virtual_;
    std::string path_;
    std::ostream& log_;
};

}  // namespace anxious
