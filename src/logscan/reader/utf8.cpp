#include <logscan/reader/utf8.h>

#include <cstddef>

namespace logscan {

namespace {

// Number of continuation bytes a lead byte requires and the allowed range of
// the first continuation byte. Returns false for bytes that cannot start a
// sequence.
bool lead_byte_info(unsigned char c, std::size_t &need, unsigned char &lo,
                    unsigned char &hi) {
    lo = 0x80;
    hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        need = 1;
    } else if (c == 0xE0) {
        need = 2;
        lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
        need = 2;
    } else if (c == 0xED) {
        need = 2;
        hi = 0x9F;
    } else if (c == 0xF0) {
        need = 3;
        lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        need = 3;
    } else if (c == 0xF4) {
        need = 3;
        hi = 0x8F;
    } else {
        return false;
    }
    return true;
}

// Length of the valid sequence at `i`, or 0 with `consumed` set to the
// length of the invalid subpart to replace.
std::size_t decode_one(std::string_view bytes, std::size_t i,
                       std::size_t &consumed) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    if (c < 0x80) {
        return 1;
    }

    std::size_t need;
    unsigned char lo, hi;
    if (!lead_byte_info(c, need, lo, hi)) {
        consumed = 1;
        return 0;
    }

    std::size_t j = 1;
    for (; j <= need; ++j) {
        if (i + j >= bytes.size()) {
            break;
        }
        unsigned char cc = static_cast<unsigned char>(bytes[i + j]);
        unsigned char min = (j == 1) ? lo : 0x80;
        unsigned char max = (j == 1) ? hi : 0xBF;
        if (cc < min || cc > max) {
            break;
        }
    }

    if (j > need) {
        return need + 1;
    }
    consumed = j;
    return 0;
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t consumed = 0;
        std::size_t len = decode_one(bytes, i, consumed);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string sanitize_utf8(std::string_view bytes) {
    if (is_valid_utf8(bytes)) {
        return std::string(bytes);
    }

    std::string out;
    out.reserve(bytes.size() + 8);
    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t consumed = 0;
        std::size_t len = decode_one(bytes, i, consumed);
        if (len > 0) {
            out.append(bytes.data() + i, len);
            i += len;
        } else {
            out.append(UTF8_REPLACEMENT);
            i += consumed;
        }
    }
    return out;
}

}  // namespace logscan
