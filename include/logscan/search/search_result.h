#ifndef LOGSCAN_SEARCH_SEARCH_RESULT_H
#define LOGSCAN_SEARCH_SEARCH_RESULT_H

#include <cstddef>
#include <string>
#include <vector>

namespace logscan {

/**
 * One grep output entry: a matching line or a context line, never both.
 */
class ResultEntry {
   public:
    enum Kind { MATCH, CONTEXT };

    static ResultEntry make_match(std::size_t line_number, std::string text) {
        return ResultEntry(MATCH, line_number, std::move(text));
    }

    static ResultEntry make_context(std::size_t line_number, std::string text) {
        return ResultEntry(CONTEXT, line_number, std::move(text));
    }

    Kind kind() const { return kind_; }
    bool is_match() const { return kind_ == MATCH; }
    bool is_context() const { return kind_ == CONTEXT; }
    std::size_t line_number() const { return line_number_; }
    const std::string &text() const { return text_; }

    bool operator==(const ResultEntry &other) const {
        return kind_ == other.kind_ && line_number_ == other.line_number_ &&
               text_ == other.text_;
    }
    bool operator!=(const ResultEntry &other) const { return !(*this == other); }

   private:
    ResultEntry(Kind kind, std::size_t line_number, std::string text)
        : kind_(kind), line_number_(line_number), text_(std::move(text)) {}

    Kind kind_;
    std::size_t line_number_;
    std::string text_;
};

using SearchResults = std::vector<ResultEntry>;

std::size_t count_matches(const SearchResults &results);

}  // namespace logscan

#endif  // LOGSCAN_SEARCH_SEARCH_RESULT_H
