#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace anxious {

struct Candidate {
    std::string path;
    std::string origin;  // "by-id" or "event"
    std::string name;
    bool has_rel_xy = false;
    bool has_wheel = false;
    bool has_hwheel = false;
    bool has_hi_res = false;
};

// Fills name and capability flags; false if the node cannot be opened.
bool probe_device(const std::string& path, Candidate& out);

// /dev/input/by-id/*-event-mouse first, then /dev/input/event*, each
// physical node listed once.
std::vector<Candidate> scan_candidates();

bool is_own_device(const Candidate& c);

// A mouse needs REL_X, REL_Y and REL_WHEEL; one with a horizontal wheel
// is preferred, then scan order. Returns nullptr if nothing qualifies.
const Candidate* choose_candidate(const std::vector<Candidate>& pool, std::string& reason);

void print_candidates(std::ostream& os, const std::vector<Candidate>& v);

// Throws DeviceError (DeviceUnavailable) if no mouse is found.
std::string discover_device(std::string& reason);

}  // namespace anxious
