#ifndef LOGSCAN_READER_UTF8_H
#define LOGSCAN_READER_UTF8_H

#include <string>
#include <string_view>

namespace logscan {

// U+FFFD encoded as UTF-8
inline constexpr std::string_view UTF8_REPLACEMENT = "\xEF\xBF\xBD";

bool is_valid_utf8(std::string_view bytes);

/**
 * Copy `bytes`, replacing every maximal invalid subpart with U+FFFD.
 * Overlong forms, surrogates and code points above U+10FFFF are invalid.
 */
std::string sanitize_utf8(std::string_view bytes);

}  // namespace logscan

#endif  // LOGSCAN_READER_UTF8_H
