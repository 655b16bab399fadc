#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/search/grep.h>
#include <logscan/utils/cancellation.h>

#include <boost/regex.hpp>
#include <deque>
#include <stdexcept>

namespace logscan {

std::size_t count_matches(const SearchResults &results) {
    std::size_t n = 0;
    for (const auto &entry : results) {
        if (entry.is_match()) {
            ++n;
        }
    }
    return n;
}

namespace {

boost::regex compile_pattern(const std::string &pattern) {
    try {
        return boost::regex(pattern, boost::regex::ECMAScript);
    } catch (const boost::regex_error &e) {
        throw PatternError(pattern, e.what());
    }
}

// boost::regex matches without recursion and throws std::runtime_error when
// a line needs more states than its complexity limit allows
bool line_matches(const Line &line, const boost::regex &regex,
                  const std::string &pattern) {
    try {
        return boost::regex_search(line.text, regex);
    } catch (const std::runtime_error &e) {
        throw Error(Error::PATTERN_ERROR,
                    "Pattern " + pattern + " is too complex for line " +
                        std::to_string(line.number) + ": " + e.what());
    }
}

// FIFO of at most `capacity` lines
class BeforeContext {
   public:
    explicit BeforeContext(std::size_t capacity) : capacity_(capacity) {}

    void push(Line &&line) {
        if (capacity_ == 0) {
            return;
        }
        if (lines_.size() == capacity_) {
            lines_.pop_front();
        }
        lines_.push_back(std::move(line));
    }

    void flush_into(SearchResults &results) {
        for (auto &line : lines_) {
            results.push_back(
                ResultEntry::make_context(line.number, std::move(line.text)));
        }
        lines_.clear();
    }

   private:
    std::size_t capacity_;
    std::deque<Line> lines_;
};

}  // namespace

void check_pattern(const std::string &pattern) { compile_pattern(pattern); }

void validate_search_options(const SearchOptions &options) {
    if (options.max_count == 0) {
        throw Error(Error::INVALID_ARGUMENT, "max_count must be positive");
    }
    check_pattern(options.pattern);
}

SearchResults grep(LineSource &lines, const SearchOptions &options,
                   const CancellationToken *cancel) {
    if (options.max_count == 0) {
        throw Error(Error::INVALID_ARGUMENT, "max_count must be positive");
    }
    const boost::regex regex = compile_pattern(options.pattern);

    SearchResults results;
    BeforeContext before(options.context);
    std::size_t after_remaining = 0;
    std::size_t matches = 0;
    std::size_t index = 0;

    while (true) {
        bool budget_left = matches < options.max_count;
        if (!budget_left && after_remaining == 0) {
            LOGSCAN_LOG_DEBUG("Match budget of %zu reached after %zu lines",
                              options.max_count, index);
            break;
        }
        if (cancel) {
            cancel->throw_if_cancelled("search");
        }

        auto line = lines.next();
        if (!line) {
            break;
        }

        if (index++ < options.offset) {
            before.push(std::move(*line));
        } else if (budget_left && line_matches(*line, regex, options.pattern)) {
            before.flush_into(results);
            results.push_back(
                ResultEntry::make_match(line->number, std::move(line->text)));
            ++matches;
            after_remaining = options.context;
        } else if (after_remaining > 0) {
            results.push_back(
                ResultEntry::make_context(line->number, std::move(line->text)));
            --after_remaining;
        } else {
            before.push(std::move(*line));
        }
    }

    return results;
}

}  // namespace logscan
