#ifndef LOGSCAN_UTILS_CANCELLATION_H
#define LOGSCAN_UTILS_CANCELLATION_H

#include <logscan/common/error.h>

#include <atomic>
#include <string>

namespace logscan {

/**
 * Cooperative cancellation flag. Scans poll it between lines and follow
 * loops poll it around every request and sleep. cancel() only stores an
 * atomic flag, so it may be called from a signal handler.
 */
class CancellationToken {
   public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

    void throw_if_cancelled(const std::string &where) const {
        if (is_cancelled()) {
            throw CancelledError("cancelled during " + where);
        }
    }

   private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace logscan

#endif  // LOGSCAN_UTILS_CANCELLATION_H
