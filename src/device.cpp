#include "device.hpp"

#include <fcntl.h>
#include <libevdev/libevdev.h>
#include <libevdev/libevdev-uinput.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>

namespace anxious {

namespace {

std::string describe(const std::string& action, int err) {
    if (err == 0) return action;
    return action + ": " + std::strerror(err);
}

}  // namespace

DeviceError::DeviceError(Kind kind, const std::string& action, int err)
    : std::runtime_error(describe(action, err)), kind_(kind), err_(err) {}

const char* kind_name(DeviceError::Kind kind) {
    switch (kind) {
        case DeviceError::Kind::DeviceUnavailable:
            return "DeviceUnavailable";
        case DeviceError::Kind::GrabFailed:
            return "GrabFailed";
        case DeviceError::Kind::VirtualDeviceCreationFailed:
            return "VirtualDeviceCreationFailed";
        case DeviceError::Kind::ReadFailed:
            return "ReadFailed";
        default:
            return "WriteFailed";
    }
}

void emit(EventSink& sink, uint16_t type, uint16_t code, int32_t value) {
    input_event ev{};
    ev.type = type;
    ev.code = code;
    ev.value = value;
    sink.write(ev);
}

PhysicalDevice::PhysicalDevice(const std::string& path) : path_(path) {
    fd_ = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd_ < 0) {
        throw DeviceError(DeviceError::Kind::DeviceUnavailable, "open " + path, errno);
    }

    int rc = libevdev_new_from_fd(fd_, &dev_);
    if (rc < 0) {
        release();
        throw DeviceError(DeviceError::Kind::DeviceUnavailable, "libevdev init on " + path, -rc);
    }

    rc = libevdev_set_clock_id(dev_, CLOCK_MONOTONIC);
    if (rc < 0) {
        release();
        throw DeviceError(DeviceError::Kind::DeviceUnavailable, "set monotonic clock on " + path, -rc);
    }

    rc = libevdev_grab(dev_, LIBEVDEV_GRAB);
    if (rc < 0) {
        release();
        throw DeviceError(DeviceError::Kind::GrabFailed, "grab " + path, -rc);
    }
    grabbed_ = true;
}

PhysicalDevice::~PhysicalDevice() { release(); }

void PhysicalDevice::release() noexcept {
    if (dev_) {
        // Fails harmlessly with ENODEV when the device was unplugged.
        if (grabbed_) libevdev_grab(dev_, LIBEVDEV_UNGRAB);
        libevdev_free(dev_);
        dev_ = nullptr;
    }
    grabbed_ = false;
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

ReadStatus PhysicalDevice::next_event(input_event& ev, int wake_fd) {
    for (;;) {
        unsigned int flags = syncing_ ? LIBEVDEV_READ_FLAG_SYNC : LIBEVDEV_READ_FLAG_NORMAL;
        int rc = libevdev_next_event(dev_, flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) return ReadStatus::Event;
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            if (syncing_) return ReadStatus::Event;
            syncing_ = true;
            return ReadStatus::Dropped;
        }
        if (rc == -EAGAIN) {
            if (syncing_) {
                syncing_ = false;
                continue;
            }
            bool woken = false;
            wait_readable(wake_fd, woken);
            if (woken) return ReadStatus::Interrupted;
            continue;
        }
        if (rc == -EINTR) continue;
        throw DeviceError(DeviceError::Kind::ReadFailed, "read " + path_, -rc);
    }
}

void PhysicalDevice::wait_readable(int wake_fd, bool& woken) {
    pollfd p[2]{};
    p[0].fd = fd_;
    p[0].events = POLLIN;
    p[1].fd = wake_fd;
    p[1].events = POLLIN;
    int rc = poll(p, 2, -1);
    if (rc < 0) {
        if (errno == EINTR) return;
        throw DeviceError(DeviceError::Kind::ReadFailed, "poll " + path_, errno);
    }
    if (p[1].revents & POLLIN) {
        woken = true;
        return;
    }
    if ((p[0].revents & (POLLERR | POLLHUP | POLLNVAL)) && !(p[0].revents & POLLIN)) {
        throw DeviceError(DeviceError::Kind::ReadFailed, "device " + path_ + " went away", ENODEV);
    }
}

bool PhysicalDevice::has_event_code(unsigned int type, unsigned int code) const {
    return libevdev_has_event_code(dev_, type, code) == 1;
}

std::string PhysicalDevice::name() const {
    const char* nm = libevdev_get_name(dev_);
    return nm ? nm : "";
}

VirtualDevice::VirtualDevice(const PhysicalDevice& physical) {
    libevdev* dev = physical.handle();
    // The uinput device copies name, ids, properties and every event
    // type/code (with abs info) from the physical one. Only the name differs.
    std::string original = physical.name();
    libevdev_set_name(dev, VIRTUAL_DEVICE_NAME);
    int rc = libevdev_uinput_create_from_device(dev, LIBEVDEV_UINPUT_OPEN_MANAGED, &uidev_);
    libevdev_set_name(dev, original.c_str());
    if (rc < 0) {
        uidev_ = nullptr;
        throw DeviceError(DeviceError::Kind::VirtualDeviceCreationFailed, "create uinput device", -rc);
    }
}

VirtualDevice::~VirtualDevice() {
    if (uidev_) libevdev_uinput_destroy(uidev_);
}

void VirtualDevice::write(const input_event& ev) {
    int rc = libevdev_uinput_write_event(uidev_, ev.type, ev.code, ev.value);
    if (rc < 0) {
        throw DeviceError(DeviceError::Kind::WriteFailed, "write to virtual device", -rc);
    }
}

std::string VirtualDevice::devnode() const {
    const char* node = libevdev_uinput_get_devnode(uidev_);
    return node ? node : "";
}

}  // namespace anxious
