#pragma once

#include <atomic>

namespace anxious {

// Shutdown request that can wake a blocking poll(). request() only sets an
// atomic and writes one byte to a pipe, so it is safe from a signal handler.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Routes SIGINT and SIGTERM to request() until destruction.
    void install();

    void request(int signo = 0) noexcept;
    bool requested() const noexcept { return requested_.load(); }
    // Signal that caused the request, 0 if requested directly.
    int signal_number() const noexcept { return signo_.load(); }

    // Becomes readable once a shutdown was requested.
    int fd() const noexcept { return read_fd_; }

private:
    int read_fd_ = -1;
    int write_fd_ = -1;
    bool installed_ = false;
    std::atomic<bool> requested_{false};
    std::atomic<int> signo_{0};
};

}  // namespace anxious
