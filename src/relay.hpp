#pragma once

#include "config.hpp"
#include "device.hpp"
#include "shutdown.hpp"
#include "transform.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>

namespace anxious {

enum class RelayState { Running, Draining, Stopped };

const char* state_name(RelayState s);

Timestamp event_time(const input_event& ev);

struct RelayStats {
    uint64_t forwarded = 0;
    uint64_t scroll_in = 0;
    uint64_t scroll_out = 0;
    uint64_t suppressed = 0;
    uint64_t dropped_syncs = 0;
};

// Copies events from the physical device to the virtual one, reshaping
// wheel events on the way. Everything else is written unchanged and in
// arrival order; each frame keeps its own SYN_REPORT.
class RelayLoop {
public:
    // caps decides, per wheel axis, whether high-resolution events exist.
    RelayLoop(const Config& config, const EventSource& caps, std::ostream& log);

    // Runs until shutdown is requested or a device fails, then returns
    // true for a clean shutdown and false with failure() set otherwise.
    bool run(EventSource& source, EventSink& sink, const ShutdownSignal& shutdown);

    // Relays one event. Throws DeviceError when the sink fails.
    void process(const input_event& ev, EventSink& sink);

    // Forget all scroll timing, e.g. after SYN_DROPPED.
    void resync();

    RelayState state() const { return state_; }
    const std::optional<DeviceError>& failure() const { return failure_; }
    const RelayStats& stats() const { return stats_; }

private:
    struct ScrollAxis {
        const char* name;
        uint16_t legacy_code;
        uint16_t hi_res_code;
        bool hi_res;
        TransformStage stage;
        // Emitted hi-res units not yet reported as a legacy detent.
        int legacy_remainder;
    };

    ScrollAxis* find_axis(const input_event& ev, bool& drop);
    void relay_scroll(ScrollAxis& axis, const input_event& ev, EventSink& sink);

    bool debug_;
    std::ostream& log_;
    std::array<ScrollAxis, 2> axes_;
    RelayState state_ = RelayState::Stopped;
    std::optional<DeviceError> failure_;
    RelayStats stats_;
};

}  // namespace anxious
