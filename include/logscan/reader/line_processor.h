#ifndef LOGSCAN_READER_LINE_PROCESSOR_H
#define LOGSCAN_READER_LINE_PROCESSOR_H

#include <logscan/reader/line_source.h>

#include <cstddef>
#include <string>

namespace logscan {

class CancellationToken;

/**
 * Push-style consumer of decoded lines.
 */
class LineProcessor {
   public:
    virtual ~LineProcessor() = default;

    /**
     * Called once per line. Return false to stop before the next line.
     */
    virtual bool process(const Line &line) = 0;

    virtual void begin() {}
    virtual void end() {}
};

/**
 * LineProcessor that accumulates lines into a single string, one '\n'
 * after each line.
 */
class StringLineProcessor : public LineProcessor {
   public:
    explicit StringLineProcessor(std::string &result) : result_(result) {}

    bool process(const Line &line) override {
        result_.append(line.text);
        result_.append(1, '\n');
        return true;
    }

   private:
    std::string &result_;
};

/**
 * Feed every line of `source` to `processor` until either is done.
 * Cancellation is checked before each line. Returns the number of lines
 * processed.
 */
std::size_t process_lines(LineSource &source, LineProcessor &processor,
                          const CancellationToken *cancel = nullptr);

}  // namespace logscan

#endif  // LOGSCAN_READER_LINE_PROCESSOR_H
