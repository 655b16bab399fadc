#ifndef LOGSCAN_READER_LINE_SOURCE_H
#define LOGSCAN_READER_LINE_SOURCE_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace logscan {

struct Line {
    std::size_t number;  // 1-based within one decoding pass
    std::string text;
};

/**
 * Lazy, finite, single-pass sequence of lines. next() returns std::nullopt
 * once exhausted and keeps returning it afterwards.
 */
class LineSource {
   public:
    virtual ~LineSource() = default;
    virtual std::optional<Line> next() = 0;
};

/**
 * Serves prepared lines, numbered from 1. Counts how many lines were pulled
 * so callers can verify early termination.
 */
class VectorLineSource : public LineSource {
   public:
    explicit VectorLineSource(std::vector<std::string> lines)
        : lines_(std::move(lines)) {}

    std::optional<Line> next() override {
        if (index_ >= lines_.size()) {
            return std::nullopt;
        }
        Line line{index_ + 1, lines_[index_]};
        ++index_;
        return line;
    }

    std::size_t lines_pulled() const { return index_; }

   private:
    std::vector<std::string> lines_;
    std::size_t index_ = 0;
};

}  // namespace logscan

#endif  // LOGSCAN_READER_LINE_SOURCE_H
