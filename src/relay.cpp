#include "relay.hpp"

#include <iomanip>

namespace anxious {

namespace {

int units_per_notch(bool hi_res) { return hi_res ? HI_RES_PER_NOTCH : 1; }

bool has_hi_res(const EventSource& caps, uint16_t code) { return caps.has_event_code(EV_REL, code); }

}  // namespace

const char* state_name(RelayState s) {
    switch (s) {
        case RelayState::Running:
            return "running";
        case RelayState::Draining:
            return "draining";
        default:
            return "stopped";
    }
}

Timestamp event_time(const input_event& ev) {
    return std::chrono::seconds(ev.input_event_sec) + std::chrono::microseconds(ev.input_event_usec);
}

RelayLoop::RelayLoop(const Config& config, const EventSource& caps, std::ostream& log)
    : debug_(config.debug),
      log_(log),
      axes_{{
          {"wheel", REL_WHEEL, REL_WHEEL_HI_RES, has_hi_res(caps, REL_WHEEL_HI_RES),
           TransformStage(config, units_per_notch(has_hi_res(caps, REL_WHEEL_HI_RES))), 0},
          {"hwheel", REL_HWHEEL, REL_HWHEEL_HI_RES, has_hi_res(caps, REL_HWHEEL_HI_RES),
           TransformStage(config, units_per_notch(has_hi_res(caps, REL_HWHEEL_HI_RES))), 0},
      }} {}

bool RelayLoop::run(EventSource& source, EventSink& sink, const ShutdownSignal& shutdown) {
    state_ = RelayState::Running;
    failure_.reset();
    for (const auto& axis : axes_) {
        log_ << "[relay] " << axis.name << ": " << (axis.hi_res ? "high-resolution" : "legacy") << " events"
             << std::endl;
    }

    input_event ev{};
    while (state_ == RelayState::Running) {
        if (shutdown.requested()) {
            state_ = RelayState::Draining;
            break;
        }
        try {
            switch (source.next_event(ev, shutdown.fd())) {
                case ReadStatus::Interrupted:
                    break;
                case ReadStatus::Dropped:
                    ++stats_.dropped_syncs;
                    log_ << "[relay] SYN_DROPPED: kernel buffer overflow, resyncing" << std::endl;
                    resync();
                    break;
                case ReadStatus::Event:
                    process(ev, sink);
                    break;
            }
        } catch (const DeviceError& e) {
            failure_ = e;
            state_ = RelayState::Draining;
        }
    }

    // Nothing is buffered between events, so draining ends here.
    state_ = RelayState::Stopped;
    return !failure_;
}

void RelayLoop::process(const input_event& ev, EventSink& sink) {
    bool drop = false;
    ScrollAxis* axis = find_axis(ev, drop);
    if (axis) {
        relay_scroll(*axis, ev, sink);
        return;
    }
    if (drop) return;
    sink.write(ev);
    ++stats_.forwarded;
}

void RelayLoop::resync() {
    for (auto& axis : axes_) {
        axis.stage.reset();
        axis.legacy_remainder = 0;
    }
}

RelayLoop::ScrollAxis* RelayLoop::find_axis(const input_event& ev, bool& drop) {
    if (ev.type != EV_REL) return nullptr;
    for (auto& axis : axes_) {
        if (axis.hi_res) {
            if (ev.code == axis.hi_res_code) return &axis;
            // Re-synthesized from the transformed hi-res stream.
            if (ev.code == axis.legacy_code) {
                drop = true;
                return nullptr;
            }
        } else if (ev.code == axis.legacy_code) {
            return &axis;
        }
    }
    return nullptr;
}

void RelayLoop::relay_scroll(ScrollAxis& axis, const input_event& ev, EventSink& sink) {
    if (ev.value == 0) return;
    ++stats_.scroll_in;

    int out = axis.stage.transform(ev.value, event_time(ev));
    if (debug_) {
        const Decision& d = axis.stage.last();
        log_ << "[scroll] axis=" << axis.name << " raw=" << d.raw << std::fixed << std::setprecision(3)
             << " velocity=" << d.velocity << " multiplier=" << d.multiplier << " out=" << d.output
             << " carry=" << d.carry << (d.restarted ? " (new gesture)" : "") << std::defaultfloat << std::endl;
    }
    if (out == 0) {
        ++stats_.suppressed;
        return;
    }

    emit(sink, EV_REL, ev.code, out);
    ++stats_.scroll_out;
    if (!axis.hi_res) return;

    // Legacy consumers get one detent per HI_RES_PER_NOTCH emitted units,
    // restarting the count when the direction changes.
    if ((axis.legacy_remainder > 0 && out < 0) || (axis.legacy_remainder < 0 && out > 0)) {
        axis.legacy_remainder = 0;
    }
    long long total = static_cast<long long>(axis.legacy_remainder) + out;
    long long notches = total / HI_RES_PER_NOTCH;
    axis.legacy_remainder = static_cast<int>(total - notches * HI_RES_PER_NOTCH);
    if (notches != 0) {
        emit(sink, EV_REL, axis.legacy_code, static_cast<int32_t>(notches));
    }
}

}  // namespace anxious
