#include <logscan/common/constants.h>
#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/fetch/progressive_fetcher.h>
#include <logscan/reader/line_decoder.h>
#include <logscan/utils/cancellation.h>

#include <algorithm>
#include <thread>

namespace logscan {

namespace {

// Passes chunks through unchanged while counting '\n' bytes in the chunks
// the consumer actually pulled. Chunks left unread are never fetched.
class NewlineCountingSource : public ByteSource {
   public:
    explicit NewlineCountingSource(ByteSource &inner) : inner_(inner) {}

    bool next_chunk(std::string_view &chunk) override {
        if (exhausted_) {
            return false;
        }
        if (!inner_.next_chunk(chunk)) {
            exhausted_ = true;
            return false;
        }
        newlines_ += static_cast<std::size_t>(
            std::count(chunk.begin(), chunk.end(), '\n'));
        return true;
    }

    std::size_t newlines() const { return newlines_; }

   private:
    ByteSource &inner_;
    std::size_t newlines_ = 0;
    bool exhausted_ = false;
};

constexpr std::chrono::milliseconds SLEEP_SLICE{50};

void sleep_interruptible(std::chrono::milliseconds interval,
                         const CancellationToken *cancel) {
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (true) {
        if (cancel && cancel->is_cancelled()) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                  now);
        std::this_thread::sleep_for(std::min(remaining, SLEEP_SLICE));
    }
}

}  // namespace

std::optional<std::uint64_t> ProgressiveFetcher::fetch_increment(
    const std::string &resource, Increment &increment,
    const IncrementConsumer &consumer, std::size_t &lines_seen) {
    ProgressiveResponse response =
        transport_.fetch(resource, increment.start_offset);

    if (response.status != constants::fetch::HTTP_STATUS_OK) {
        throw TransportError(Error::TRANSPORT_ERROR, response.status,
                             "Progressive read of " + resource + " failed");
    }
    if (!response.body) {
        throw TransportError(Error::NO_DATA, response.status,
                             "No data returned for " + resource);
    }

    increment.text_size = response.text_size;
    if (response.more_data) {
        increment.next_offset = response.text_size;
    } else {
        increment.next_offset.reset();
    }

    NewlineCountingSource counted(*response.body);
    LineDecoder decoder(counted);
    consumer(increment, decoder);
    lines_seen += counted.newlines();

    LOGSCAN_LOG_DEBUG("Increment %zu of %s: offset %llu -> %llu (%s)",
                      increment.sequence, resource.c_str(),
                      static_cast<unsigned long long>(increment.start_offset),
                      static_cast<unsigned long long>(increment.text_size),
                      increment.next_offset ? "more data" : "complete");
    return increment.next_offset;
}

std::optional<std::uint64_t> ProgressiveFetcher::fetch(
    const std::string &resource, std::uint64_t cursor,
    const IncrementConsumer &consumer) {
    Increment increment;
    increment.resource = resource;
    increment.start_offset = cursor;
    std::size_t lines_seen = 0;
    return fetch_increment(resource, increment, consumer, lines_seen);
}

std::uint64_t ProgressiveFetcher::follow(const std::string &resource,
                                         std::uint64_t cursor,
                                         const IncrementConsumer &consumer,
                                         const FollowOptions &options) {
    const CancellationToken *cancel = options.cancel();
    std::size_t lines_seen = 0;
    std::size_t sequence = 0;
    std::uint64_t text_size = cursor;

    while (true) {
        if (cancel) {
            cancel->throw_if_cancelled("follow of " + resource);
        }

        Increment increment;
        increment.resource = resource;
        increment.start_offset = cursor;
        increment.sequence = sequence++;
        increment.lines_before = lines_seen;

        auto next = fetch_increment(resource, increment, consumer, lines_seen);
        text_size = increment.text_size;
        if (!next) {
            break;
        }
        cursor = *next;

        if (options.sleeper()) {
            options.sleeper()(options.poll_interval());
        } else {
            sleep_interruptible(options.poll_interval(), cancel);
        }
        if (cancel) {
            cancel->throw_if_cancelled("follow of " + resource);
        }
    }

    LOGSCAN_LOG_INFO("Follow of %s complete after %zu increments, %llu bytes",
                     resource.c_str(), sequence,
                     static_cast<unsigned long long>(text_size));
    return text_size;
}

SearchResults ProgressiveFetcher::grep(const std::string &resource,
                                       const SearchOptions &options,
                                       std::uint64_t cursor,
                                       const CancellationToken *cancel) {
    validate_search_options(options);
    SearchResults results;
    fetch(resource, cursor, [&](const Increment &, LineSource &lines) {
        results = ::logscan::grep(lines, options, cancel);
    });
    return results;
}

LogWindow ProgressiveFetcher::window(const std::string &resource,
                                     const WindowOptions &options,
                                     std::uint64_t cursor,
                                     const CancellationToken *cancel) {
    if (options.max_lines == 0) {
        throw Error(Error::INVALID_ARGUMENT, "max_lines must be positive");
    }
    LogWindow result;
    fetch(resource, cursor, [&](const Increment &, LineSource &lines) {
        result = read_window(lines, options, cancel);
    });
    return result;
}

}  // namespace logscan
