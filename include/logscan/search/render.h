#ifndef LOGSCAN_SEARCH_RENDER_H
#define LOGSCAN_SEARCH_RENDER_H

#include <logscan/search/search_result.h>

#include <cstddef>
#include <string>

namespace logscan {

/**
 * grep-style text: "N:text" for matches, "N-text" for context and a "--"
 * line between groups that are not adjacent. `line_base` is added to every
 * line number. Each line, separators included, ends with '\n'.
 *
 * `previous_line` carries the last rendered line number across calls so a
 * follow loop can keep separators consistent; pass nullptr for one-shot use.
 */
std::string format_text(const SearchResults &results, std::size_t line_base = 0,
                        std::size_t *previous_line = nullptr);

/**
 * JSON array of {"lineNumber":N,"match":"..."} and
 * {"lineNumber":N,"context":"..."} objects.
 */
std::string format_json(const SearchResults &results,
                        std::size_t line_base = 0, bool pretty = false);

}  // namespace logscan

#endif  // LOGSCAN_SEARCH_RENDER_H
