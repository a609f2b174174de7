#include "cancellation.hpp"

#include <csignal>

namespace maintbranch {

static std::atomic<CancellationToken*> g_token{nullptr};

static void handle_signal(int) {
    CancellationToken* t = g_token.load();
    if (t)
        t->request_cancel();
}

void install_signal_cancellation(CancellationToken* token) {
    g_token.store(token);
    std::signal(SIGINT, handle_signal);
#ifdef SIGTERM
    std::signal(SIGTERM, handle_signal);
#endif
}

} // namespace maintbranch
