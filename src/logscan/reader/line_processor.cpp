#include <logscan/reader/line_processor.h>
#include <logscan/utils/cancellation.h>

namespace logscan {

std::size_t process_lines(LineSource &source, LineProcessor &processor,
                          const CancellationToken *cancel) {
    std::size_t processed = 0;
    processor.begin();
    while (true) {
        if (cancel) {
            cancel->throw_if_cancelled("line processing");
        }
        auto line = source.next();
        if (!line) {
            break;
        }
        ++processed;
        if (!processor.process(*line)) {
            break;
        }
    }
    processor.end();
    return processed;
}

}  // namespace logscan
