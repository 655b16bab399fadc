#include <logscan/common/error.h>
#include <logscan/search/render.h>
#include <yyjson.h>

#include <cstdlib>
#include <new>
#include <memory>

namespace logscan {

std::string format_text(const SearchResults &results, std::size_t line_base,
                        std::size_t *previous_line) {
    std::string out;
    std::size_t last = previous_line ? *previous_line : 0;
    for (const auto &entry : results) {
        std::size_t number = entry.line_number() + line_base;
        if (last != 0 && number != last + 1) {
            out.append("--\n");
        }
        out.append(std::to_string(number));
        out.append(1, entry.is_match() ? ':' : '-');
        out.append(entry.text());
        out.append(1, '\n');
        last = number;
    }
    if (previous_line) {
        *previous_line = last;
    }
    return out;
}

std::string format_json(const SearchResults &results, std::size_t line_base,
                        bool pretty) {
    std::unique_ptr<yyjson_mut_doc, decltype(&yyjson_mut_doc_free)> doc(
        yyjson_mut_doc_new(nullptr), &yyjson_mut_doc_free);
    if (!doc) {
        throw std::bad_alloc();
    }

    yyjson_mut_val *root = yyjson_mut_arr(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    for (const auto &entry : results) {
        yyjson_mut_val *obj = yyjson_mut_arr_add_obj(doc.get(), root);
        yyjson_mut_obj_add_uint(doc.get(), obj, "lineNumber",
                                entry.line_number() + line_base);
        yyjson_mut_obj_add_strncpy(doc.get(), obj,
                                   entry.is_match() ? "match" : "context",
                                   entry.text().data(), entry.text().size());
    }

    yyjson_write_flag flags =
        pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    std::size_t len = 0;
    char *json = yyjson_mut_write(doc.get(), flags, &len);
    if (!json) {
        throw Error(Error::INVALID_ARGUMENT,
                    "Failed to serialize results as JSON");
    }
    std::string out(json, len);
    std::free(json);
    return out;
}

}  // namespace logscan
