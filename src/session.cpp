#include "session.hpp"

#include "discovery.hpp"

#include <utility>

namespace anxious {

Session::Session(std::unique_ptr<EventSource> physical, std::unique_ptr<EventSink> virtual_device, std::string path,
                 std::ostream& log)
    : physical_(std::move(physical)), virtual_(std::move(virtual_device)), path_(std::move(path)), log_(log) {}

Session::~Session() {
    virtual_.reset();
    physical_.reset();
    log_ << "[session] closed: virtual device removed, " << path_ << " released" << std::endl;
}

std::unique_ptr<Session> Session::open(const Config& config, std::ostream& log) {
    std::string path;
    if (config.device_path) {
        path = *config.device_path;
    } else {
        std::string why;
        path = discover_device(why);
        log << "[auto] device: " << path << " via " << why << std::endl;
    }

    auto physical = std::make_unique<PhysicalDevice>(path);
    log << "[session] grabbed " << path << " ('" << physical->name() << "')" << std::endl;

    auto virt = std::make_unique<VirtualDevice>(*physical);
    std::string node = virt->devnode();
    log << "[session] virtual device '" << VIRTUAL_DEVICE_NAME << "' at " << (node.empty() ? "<unknown>" : node)
        << std::endl;

    return std::make_unique<Session>(std::move(physical), std::move(virt), path, log);
}

}  // namespace anxious
