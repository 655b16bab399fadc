#ifndef LOGSCAN_SEARCH_LOG_WINDOW_H
#define LOGSCAN_SEARCH_LOG_WINDOW_H

#include <logscan/common/constants.h>
#include <logscan/reader/line_source.h>

#include <cstddef>
#include <string>
#include <vector>

namespace logscan {

class CancellationToken;

struct WindowOptions {
    enum Position { HEAD, TAIL, OFFSET };

    Position position = TAIL;
    std::size_t max_lines = constants::search::DEFAULT_WINDOW_LINES;
    std::size_t offset = 0;  // OFFSET only, 0-based line index

    static WindowOptions head(std::size_t n) { return {HEAD, n, 0}; }
    static WindowOptions tail(std::size_t n) { return {TAIL, n, 0}; }
    static WindowOptions at(std::size_t offset, std::size_t n) {
        return {OFFSET, n, offset};
    }
};

/**
 * A slice of a log plus how it relates to the whole: `line_offset` is the
 * 0-based index of the first returned line and `available_lines` the total
 * number of lines seen.
 */
struct LogWindow {
    std::size_t line_offset = 0;
    std::size_t max_lines = 0;
    std::size_t available_lines = 0;
    std::vector<std::string> lines;

    // lines joined by '\n', no trailing newline
    std::string content() const;
};

/**
 * Read `source` to the end and keep the window selected by `options`.
 * Memory stays bounded by `max_lines` for every position.
 *
 * @throws Error(INVALID_ARGUMENT) when max_lines is 0
 */
LogWindow read_window(LineSource &source, const WindowOptions &options,
                      const CancellationToken *cancel = nullptr);

/**
 * {"line_offset":..,"max_lines":..,"available_lines":..,"content":".."}
 */
std::string format_json(const LogWindow &window, bool pretty = false);

}  // namespace logscan

#endif  // LOGSCAN_SEARCH_LOG_WINDOW_H
