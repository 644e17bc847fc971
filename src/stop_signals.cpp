#include "stop_signals.hpp"
#include <csignal>
#include <utility>
#ifndef _WIN32
#include <signal.h>
#endif

namespace svckit {

namespace {
CancellationToken* g_stop_token = nullptr;
volatile std::sig_atomic_t g_last_signal = 0;

extern "C" void handle_stop_signal(int sig) {
    g_last_signal = sig;
    if (g_stop_token)
        g_stop_token->request();
}
} // namespace

#ifndef _WIN32
struct StopSignalScope::Saved {
    struct sigaction term {};
    struct sigaction intr {};
};

StopSignalScope::StopSignalScope(std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)), saved_(new Saved) {
    g_last_signal = 0;
    g_stop_token = token_.get();
    struct sigaction sa {};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGTERM, &sa, &saved_->term);
    sigaction(SIGINT, &sa, &saved_->intr);
}

StopSignalScope::~StopSignalScope() {
    sigaction(SIGTERM, &saved_->term, nullptr);
    sigaction(SIGINT, &saved_->intr, nullptr);
    g_stop_token = nullptr;
}
#else
struct StopSignalScope::Saved {
    void (*term)(int) = SIG_DFL;
    void (*intr)(int) = SIG_DFL;
};

StopSignalScope::StopSignalScope(std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)), saved_(new Saved) {
    g_last_signal = 0;
    g_stop_token = token_.get();
    saved_->term = std::signal(SIGTERM, handle_stop_signal);
    saved_->intr = std::signal(SIGINT, handle_stop_signal);
}

StopSignalScope::~StopSignalScope() {
    std::signal(SIGTERM, saved_->term);
    std::signal(SIGINT, saved_->intr);
    g_stop_token = nullptr;
}
#endif

int StopSignalScope::last_signal() { return static_cast<int>(g_last_signal); }

} // namespace svckit
