#ifndef LOGSCAN_FETCH_PROGRESSIVE_FETCHER_H
#define LOGSCAN_FETCH_PROGRESSIVE_FETCHER_H

#include <logscan/common/constants.h>
#include <logscan/fetch/transport.h>
#include <logscan/reader/line_source.h>
#include <logscan/search/grep.h>
#include <logscan/search/log_window.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace logscan {

class CancellationToken;

/**
 * Metadata handed to the consumer alongside each increment's lines.
 */
struct Increment {
    std::string resource;
    std::uint64_t start_offset = 0;
    std::optional<std::uint64_t> next_offset;  // empty when complete
    std::uint64_t text_size = 0;
    std::size_t sequence = 0;      // 0 for the first increment of a follow
    std::size_t lines_before = 0;  // '\n' bytes pulled from earlier increments
};

using IncrementConsumer =
    std::function<void(const Increment &, LineSource &)>;

class FollowOptions {
   public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit FollowOptions(std::chrono::milliseconds poll_interval =
                               constants::fetch::DEFAULT_POLL_INTERVAL)
        : poll_interval_(poll_interval), cancel_(nullptr) {}

    inline static FollowOptions Default() { return FollowOptions(); }

    // Getter
    inline std::chrono::milliseconds poll_interval() const {
        return poll_interval_;
    }
    inline const CancellationToken *cancel() const { return cancel_; }
    inline const Sleeper &sleeper() const { return sleeper_; }

    // Setter
    inline FollowOptions &set_poll_interval(std::chrono::milliseconds interval) {
        poll_interval_ = interval;
        return *this;
    }
    inline FollowOptions &set_cancel(const CancellationToken *cancel) {
        cancel_ = cancel;
        return *this;
    }
    // Replaces std::this_thread::sleep_for, mostly for tests
    inline FollowOptions &set_sleeper(Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
        return *this;
    }

   private:
    std::chrono::milliseconds poll_interval_;
    const CancellationToken *cancel_;
    Sleeper sleeper_;
};

/**
 * Reads a remote, possibly growing, text resource through a
 * ProgressiveTransport. Each increment is decoded as an independent pass
 * (line numbers restart at 1) and handed to the consumer synchronously; the
 * increment's lines are gone once the consumer returns.
 */
class ProgressiveFetcher {
   public:
    explicit ProgressiveFetcher(ProgressiveTransport &transport)
        : transport_(transport) {}

    /**
     * One request at `cursor`. Returns the cursor for the next request, or
     * std::nullopt when the resource is complete.
     *
     * @throws TransportError on a non-200 status or a missing body (NO_DATA)
     */
    std::optional<std::uint64_t> fetch(const std::string &resource,
                                       std::uint64_t cursor,
                                       const IncrementConsumer &consumer);

    /**
     * Repeat fetch() from `cursor` until the resource is complete, pausing
     * the poll interval between requests but never after the last one.
     * Returns the final reported text size.
     *
     * @throws CancelledError when the token is cancelled between polls
     */
    std::uint64_t follow(const std::string &resource, std::uint64_t cursor,
                         const IncrementConsumer &consumer,
                         const FollowOptions &options = FollowOptions());

    /**
     * One-shot grep over the increment available at `cursor`.
     */
    SearchResults grep(const std::string &resource,
                       const SearchOptions &options, std::uint64_t cursor = 0,
                       const CancellationToken *cancel = nullptr);

    /**
     * One-shot head/tail/offset window over the increment at `cursor`.
     */
    LogWindow window(const std::string &resource, const WindowOptions &options,
                     std::uint64_t cursor = 0,
                     const CancellationToken *cancel = nullptr);

   private:
    std::optional<std::uint64_t> fetch_increment(
        const std::string &resource, Increment &increment,
        const IncrementConsumer &consumer, std::size_t &lines_seen);

    ProgressiveTransport &transport_;
};

}  // namespace logscan

#endif  // LOGSCAN_FETCH_PROGRESSIVE_FETCHER_H
