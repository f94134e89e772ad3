#pragma once

#include <linux/input.h>

#include <cstdint>
#include <stdexcept>
#include <string>

struct libevdev;
struct libevdev_uinput;

namespace anxious {

constexpr const char* VIRTUAL_DEVICE_NAME = "Anxious Scroll Virtual Device";

class DeviceError : public std::runtime_error {
public:
    enum class Kind { DeviceUnavailable, GrabFailed, VirtualDeviceCreationFailed, ReadFailed, WriteFailed };

    DeviceError(Kind kind, const std::string& action, int err);

    Kind kind() const { return kind_; }
    // errno of the underlying failure, 0 if there was none.
    int error_code() const { return err_; }

private:
    Kind kind_;
    int err_;
};

const char* kind_name(DeviceError::Kind kind);

enum class ReadStatus {
    Event,        // ev holds the next event
    Dropped,      // kernel buffer overflowed; resync events follow
    Interrupted,  // the wake fd became readable
};

// Where raw events come from.
class EventSource {
public:
    virtual ~EventSource() = default;

    // Blocks until an event is ready or wake_fd is readable. Throws
    // DeviceError (ReadFailed) once the device is gone.
    virtual ReadStatus next_event(input_event& ev, int wake_fd) = 0;
    virtual bool has_event_code(unsigned int type, unsigned int code) const = 0;
    virtual std::string name() const = 0;
};

// Where relayed events go. write() throws DeviceError (WriteFailed).
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void write(const input_event& ev) = 0;
};

void emit(EventSink& sink, uint16_t type, uint16_t code, int32_t value);

// An evdev node, opened non-blocking and grabbed for as long as this
// object lives. Event timestamps use CLOCK_MONOTONIC.
class PhysicalDevice : public EventSource {
public:
    explicit PhysicalDevice(const std::string& path);
    ~PhysicalDevice() override;

    PhysicalDevice(const PhysicalDevice&) = delete;
    PhysicalDevice& operator=(const PhysicalDevice&) = delete;

    ReadStatus next_event(input_event& ev, int wake_fd) override;
    bool has_event_code(unsigned int type, unsigned int code) const override;
    std::string name() const override;

    const std::string& path() const { return path_; }
    libevdev* handle() const { return dev_; }

private:
    void wait_readable(int wake_fd, bool& woken);
    void release() noexcept;

    std::string path_;
    int fd_ = -1;
    libevdev* dev_ = nullptr;
    bool grabbed_ = false;
    bool syncing_ = false;
};

// A uinput device mirroring the capabilities of a PhysicalDevice.
class VirtualDevice : public EventSink {
public:
    explicit VirtualDevice(const PhysicalDevice& physical);
    ~VirtualDevice() override;

    VirtualDevice(const VirtualDevice&) = delete;
    VirtualDevice& operator=(const VirtualDevice&) = delete;

    void write(const input_event& ev) override;

    // /dev/input/eventN of the new device, empty if unknown.
    std::string devnode() const;

private:
    libevdev_uinput* uidev_ = nullptr;
};

}  // namespace anxious
