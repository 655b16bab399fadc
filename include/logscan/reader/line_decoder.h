#ifndef LOGSCAN_READER_LINE_DECODER_H
#define LOGSCAN_READER_LINE_DECODER_H

#include <logscan/reader/byte_source.h>
#include <logscan/reader/line_source.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace logscan {

/**
 * Frames a ByteSource into lines.
 *
 * A line ends at every '\n'; a '\r' directly before it is dropped. A
 * non-empty unterminated remainder becomes the last line. Bytes are decoded
 * as UTF-8 with malformed sequences replaced by U+FFFD. Only the bytes after
 * the last emitted line boundary are buffered.
 *
 * One decoder serves exactly one pass; numbering starts at 1.
 */
class LineDecoder : public LineSource {
   public:
    explicit LineDecoder(ByteSource &source);
    explicit LineDecoder(std::unique_ptr<ByteSource> source);

    LineDecoder(const LineDecoder &) = delete;
    LineDecoder &operator=(const LineDecoder &) = delete;

    std::optional<Line> next() override;

    bool is_finished() const { return is_finished_; }
    std::size_t lines_emitted() const { return line_number_; }
    std::size_t buffered_bytes() const { return pending_.size() - start_; }

   private:
    Line make_line(std::size_t begin, std::size_t end);

    std::unique_ptr<ByteSource> owned_;
    ByteSource *source_;
    std::string pending_;
    std::size_t start_ = 0;      // first byte of the current line
    std::size_t scan_from_ = 0;  // bytes before this hold no '\n'
    std::size_t line_number_ = 0;
    bool is_finished_ = false;
};

}  // namespace logscan

#endif  // LOGSCAN_READER_LINE_DECODER_H
