#include "cancellation.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <csignal>

namespace {
    CancellationToken* signal_token = nullptr;

    void handle_signal(int) {
        if (signal_token) {
            signal_token->cancel();
        }
    }
}

void CancellationToken::cancellation_point() const {
    if (is_cancelled()) {
        throw PackgetException(ErrorKind::Cancelled, get_string("error.cancelled"));
    }
}

void install_signal_handlers(CancellationToken& token) {
    static_assert(std::atomic<bool>::is_always_lock_free);
    signal_token = &token;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
}
