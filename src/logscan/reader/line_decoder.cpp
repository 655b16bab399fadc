#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/reader/line_decoder.h>
#include <logscan/reader/utf8.h>

#include <string_view>

namespace logscan {

LineDecoder::LineDecoder(ByteSource &source) : source_(&source) {}

LineDecoder::LineDecoder(std::unique_ptr<ByteSource> source)
    : owned_(std::move(source)), source_(owned_.get()) {
    if (!source_) {
        throw Error(Error::INVALID_ARGUMENT, "LineDecoder requires a source");
    }
}

Line LineDecoder::make_line(std::size_t begin, std::size_t end) {
    std::string_view raw(pending_.data() + begin, end - begin);
    return Line{++line_number_, sanitize_utf8(raw)};
}

std::optional<Line> LineDecoder::next() {
    if (is_finished_) {
        return std::nullopt;
    }

    while (true) {
        std::size_t pos = pending_.find('\n', scan_from_);
        if (pos != std::string::npos) {
            std::size_t end = pos;
            if (end > start_ && pending_[end - 1] == '\r') {
                --end;
            }
            Line line = make_line(start_, end);
            start_ = pos + 1;
            scan_from_ = start_;
            return line;
        }
        scan_from_ = pending_.size();

        std::string_view chunk;
        if (!source_->next_chunk(chunk)) {
            is_finished_ = true;
            if (start_ < pending_.size()) {
                Line line = make_line(start_, pending_.size());
                pending_.clear();
                start_ = scan_from_ = 0;
                return line;
            }
            pending_.clear();
            start_ = scan_from_ = 0;
            LOGSCAN_LOG_TRACE("Line decoder exhausted after %zu lines",
                              line_number_);
            return std::nullopt;
        }

        if (chunk.empty()) {
            continue;
        }

        // drop consumed lines before growing the buffer
        if (start_ > 0) {
            pending_.erase(0, start_);
            scan_from_ -= start_;
            start_ = 0;
        }
        pending_.append(chunk.data(), chunk.size());
    }
}

}  // namespace logscan
