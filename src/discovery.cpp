#include "discovery.hpp"

#include "device.hpp"

#include <fcntl.h>
#include <libevdev/libevdev.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace anxious {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// event10 sorts after event9.
int event_index(const std::string& base) {
    return std::atoi(base.c_str() + std::string("event").size());
}

}  // namespace

bool probe_device(const std::string& path, Candidate& out) {
    out.name.clear();
    out.has_rel_xy = out.has_wheel = out.has_hwheel = out.has_hi_res = false;
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) return false;
    libevdev* dev = nullptr;
    bool ok = libevdev_new_from_fd(fd, &dev) == 0 && dev;
    if (ok) {
        const char* nm = libevdev_get_name(dev);
        if (nm) out.name = nm;
        if (libevdev_has_event_type(dev, EV_REL)) {
            out.has_rel_xy = libevdev_has_event_code(dev, EV_REL, REL_X) && libevdev_has_event_code(dev, EV_REL, REL_Y);
            out.has_wheel = libevdev_has_event_code(dev, EV_REL, REL_WHEEL);
            out.has_hwheel = libevdev_has_event_code(dev, EV_REL, REL_HWHEEL);
            out.has_hi_res = libevdev_has_event_code(dev, EV_REL, REL_WHEEL_HI_RES);
        }
        libevdev_free(dev);
    }
    close(fd);
    return ok;
}

std::vector<Candidate> scan_candidates() {
    std::vector<Candidate> v;
    std::set<fs::path> seen;
    std::error_code ec;

    auto add = [&](const fs::path& p, const std::string& origin) {
        fs::path real = fs::canonical(p, ec);
        if (ec || !seen.insert(real).second) return;
        Candidate c;
        c.path = p.string();
        c.origin = origin;
        if (probe_device(c.path, c)) v.push_back(c);
    };

    std::vector<fs::path> by_id;
    if (fs::exists("/dev/input/by-id", ec)) {
        for (auto& de : fs::directory_iterator("/dev/input/by-id", ec)) {
            if (de.is_symlink(ec) && ends_with(de.path().filename().string(), "-event-mouse")) {
                by_id.push_back(de.path());
            }
        }
    }
    std::sort(by_id.begin(), by_id.end());
    for (const auto& p : by_id) add(p, "by-id");

    std::vector<fs::path> nodes;
    if (fs::exists("/dev/input", ec)) {
        for (auto& de : fs::directory_iterator("/dev/input", ec)) {
            if (de.path().filename().string().rfind("event", 0) == 0) nodes.push_back(de.path());
        }
    }
    std::sort(nodes.begin(), nodes.end(), [](const fs::path& a, const fs::path& b) {
        return event_index(a.filename().string()) < event_index(b.filename().string());
    });
    for (const auto& p : nodes) add(p, "event");

    return v;
}

bool is_own_device(const Candidate& c) { return c.name == VIRTUAL_DEVICE_NAME; }

const Candidate* choose_candidate(const std::vector<Candidate>& pool, std::string& reason) {
    auto usable = [](const Candidate& c) { return c.has_rel_xy && c.has_wheel && !is_own_device(c); };
    for (const auto& c : pool) {
        if (usable(c) && c.has_hwheel) {
            reason = "wheel + horizontal wheel (" + c.origin + ")";
            return &c;
        }
    }
    for (const auto& c : pool) {
        if (usable(c)) {
            reason = "first mouse with a wheel (" + c.origin + ")";
            return &c;
        }
    }
    return nullptr;
}

void print_candidates(std::ostream& os, const std::vector<Candidate>& v) {
    os << "[scan] " << v.size() << " candidates" << std::endl;
    for (size_t i = 0; i < v.size(); ++i) {
        const auto& c = v[i];
        os << "  [" << (i + 1) << "] " << c.path << "  name='" << c.name << "'  caps=" << (c.has_rel_xy ? "relXY" : "-")
           << "," << (c.has_wheel ? "wheel" : "-") << "," << (c.has_hwheel ? "hwheel" : "-") << ","
           << (c.has_hi_res ? "hires" : "-") << (is_own_device(c) ? "  (ours)" : "") << std::endl;
    }
}

std::string discover_device(std::string& reason) {
    auto pool = scan_candidates();
    const Candidate* c = choose_candidate(pool, reason);
    if (!c) {
        throw DeviceError(DeviceError::Kind::DeviceUnavailable,
                          "no mouse with a scroll wheel found; pass --device <path>", ENODEV);
    }
    return c->path;
}

}  // namespace anxious
