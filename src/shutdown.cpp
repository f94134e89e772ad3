#include "shutdown.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace anxious {

namespace {

// The handler has no other way to find its target.
std::atomic<ShutdownSignal*> g_active{nullptr};

void shutdown_handler(int signo) {
    ShutdownSignal* s = g_active.load();
    if (s) s->request(signo);
}

}  // namespace

ShutdownSignal::ShutdownSignal() {
    int fds[2];
    if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
}

ShutdownSignal::~ShutdownSignal() {
    if (installed_) {
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
    }
    ShutdownSignal* self = this;
    g_active.compare_exchange_strong(self, nullptr);
    close(read_fd_);
    close(write_fd_);
}

void ShutdownSignal::install() {
    g_active.store(this);
    struct sigaction sa {};
    sa.sa_handler = shutdown_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int signo : {SIGINT, SIGTERM}) {
        if (sigaction(signo, &sa, nullptr) < 0) {
            throw std::system_error(errno, std::generic_category(), "sigaction");
        }
    }
    installed_ = true;
}

void ShutdownSignal::request(int signo) noexcept {
    int saved = errno;
    if (signo) signo_.store(signo);
    if (!requested_.exchange(true)) {
        char b = 1;
        // A full pipe is still readable, so a short write is fine.
        ssize_t n = write(write_fd_, &b, 1);
        (void)n;
    }
    errno = saved;
}

}  // namespace anxious
