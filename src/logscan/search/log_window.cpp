#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/search/log_window.h>
#include <logscan/utils/cancellation.h>
#include <yyjson.h>

#include <cstdlib>
#include <new>
#include <memory>

namespace logscan {

std::string LogWindow::content() const {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.append(1, '\n');
        }
        out.append(lines[i]);
    }
    return out;
}

LogWindow read_window(LineSource &source, const WindowOptions &options,
                      const CancellationToken *cancel) {
    if (options.max_lines == 0) {
        throw Error(Error::INVALID_ARGUMENT, "max_lines must be positive");
    }

    LogWindow window;
    window.max_lines = options.max_lines;

    std::size_t first = 0;
    switch (options.position) {
        case WindowOptions::HEAD:
            first = 0;
            break;
        case WindowOptions::OFFSET:
            first = options.offset;
            break;
        case WindowOptions::TAIL:
            break;
    }

    // TAIL keeps a ring of the last max_lines lines; ring_start is the index
    // of the oldest entry once the ring is full.
    std::vector<std::string> ring;
    std::size_t ring_start = 0;
    std::size_t seen = 0;

    while (true) {
        if (cancel) {
            cancel->throw_if_cancelled("log window read");
        }
        auto line = source.next();
        if (!line) {
            break;
        }

        if (options.position == WindowOptions::TAIL) {
            if (ring.size() < options.max_lines) {
                ring.push_back(std::move(line->text));
            } else {
                ring[ring_start] = std::move(line->text);
                ring_start = (ring_start + 1) % options.max_lines;
            }
        } else if (seen >= first && seen - first < options.max_lines) {
            window.lines.push_back(std::move(line->text));
        }
        ++seen;
    }

    window.available_lines = seen;
    if (options.position == WindowOptions::TAIL) {
        window.lines.reserve(ring.size());
        for (std::size_t i = 0; i < ring.size(); ++i) {
            window.lines.push_back(
                std::move(ring[(ring_start + i) % ring.size()]));
        }
        window.line_offset = seen - window.lines.size();
    } else {
        window.line_offset = first;
    }

    LOGSCAN_LOG_DEBUG("Log window: offset=%zu returned=%zu available=%zu",
                      window.line_offset, window.lines.size(),
                      window.available_lines);
    return window;
}

std::string format_json(const LogWindow &window, bool pretty) {
    std::unique_ptr<yyjson_mut_doc, decltype(&yyjson_mut_doc_free)> doc(
        yyjson_mut_doc_new(nullptr), &yyjson_mut_doc_free);
    if (!doc) {
        throw std::bad_alloc();
    }

    yyjson_mut_val *root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);
    yyjson_mut_obj_add_uint(doc.get(), root, "line_offset", window.line_offset);
    yyjson_mut_obj_add_uint(doc.get(), root, "max_lines", window.max_lines);
    yyjson_mut_obj_add_uint(doc.get(), root, "available_lines",
                            window.available_lines);
    std::string content = window.content();
    yyjson_mut_obj_add_strncpy(doc.get(), root, "content", content.data(),
                               content.size());

    std::size_t len = 0;
    char *json = yyjson_mut_write(
        doc.get(), pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG, &len);
    if (!json) {
        throw Error(Error::INVALID_ARGUMENT,
                    "Failed to serialize log window as JSON");
    }
    std::string out(json, len);
    std::free(json);
    return out;
}

}  // namespace logscan
