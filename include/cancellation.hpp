#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>

namespace maintbranch {

/**
 * @brief Cooperative cancellation flag shared between a signal handler and
 *        the blocking workflow steps.
 *
 * Uses a lock-free atomic so request_cancel() is safe to call from a signal
 * handler.
 */
class CancellationToken {
  public:
    CancellationToken() noexcept = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request_cancel() noexcept { cancelled_.store(true); }
    bool cancelled() const noexcept { return cancelled_.load(); }

  private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @brief Route SIGINT and SIGTERM to @p token.
 *
 * Passing `nullptr` detaches the token; the handlers stay installed but do
 * nothing.
 */
void install_signal_cancellation(CancellationToken* token);

} // namespace maintbranch

#endif // CANCELLATION_HPP
