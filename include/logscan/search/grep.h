#ifndef LOGSCAN_SEARCH_GREP_H
#define LOGSCAN_SEARCH_GREP_H

#include <logscan/common/constants.h>
#include <logscan/reader/line_source.h>
#include <logscan/search/search_result.h>

#include <cstddef>
#include <string>

namespace logscan {

class CancellationToken;

struct SearchOptions {
    std::string pattern;  // ECMAScript (Perl) regular expression
    std::size_t context = 0;
    std::size_t offset = 0;  // leading lines never tested for a match
    std::size_t max_count = constants::search::DEFAULT_MAX_COUNT;

    SearchOptions() = default;
    explicit SearchOptions(std::string pattern_) : pattern(std::move(pattern_)) {}

    SearchOptions &set_context(std::size_t n) {
        context = n;
        return *this;
    }
    SearchOptions &set_offset(std::size_t n) {
        offset = n;
        return *this;
    }
    SearchOptions &set_max_count(std::size_t n) {
        max_count = n;
        return *this;
    }
};

/**
 * Compile `pattern` without searching.
 * @throws PatternError when the pattern is malformed
 */
void check_pattern(const std::string &pattern);

/**
 * Everything grep() rejects before pulling a line.
 * @throws Error(INVALID_ARGUMENT) when max_count is 0, PatternError
 */
void validate_search_options(const SearchOptions &options);

/**
 * Single forward pass over `lines` collecting matches with up to
 * `options.context` lines of surrounding context.
 *
 * The pattern is compiled before any line is pulled; a malformed pattern
 * raises PatternError. Once `max_count` matches are collected and their
 * after-context is drained, no further line is pulled. Errors from the line
 * source and cancellation abort the call without a partial result.
 *
 * @throws PatternError, Error(INVALID_ARGUMENT) when max_count is 0,
 *         Error(PATTERN_ERROR) when matching a line exceeds the regex
 *         engine's complexity limit, CancelledError, and whatever the line
 *         source raises.
 */
SearchResults grep(LineSource &lines, const SearchOptions &options,
                   const CancellationToken *cancel = nullptr);

}  // namespace logscan

#endif  // LOGSCAN_SEARCH_GREP_H
