#ifndef LOGSCAN_COMMON_CONSTANTS_H
#define LOGSCAN_COMMON_CONSTANTS_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace logscan::constants {
namespace reader {
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 65536;     // 64KB
static constexpr std::size_t FILE_IO_BUFFER_SIZE = 262144;   // 256KB for file I/O
static constexpr std::size_t INFLATE_BUFFER_SIZE = 65536;
static constexpr int ZLIB_GZIP_WINDOW_BITS = 31;  // 15 + 16 for gzip format
static constexpr unsigned char GZIP_MAGIC_0 = 0x1f;
static constexpr unsigned char GZIP_MAGIC_1 = 0x8b;
}  // namespace reader

namespace search {
static constexpr std::size_t DEFAULT_MAX_COUNT = 200;
static constexpr std::size_t DEFAULT_WINDOW_LINES = 200;
}  // namespace search

namespace fetch {
static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{1000};
static constexpr std::size_t DEFAULT_MAX_BUFFERED_BYTES = 1048576;  // 1MB
static constexpr int DEFAULT_CONNECTION_TIMEOUT_SEC = 10;
static constexpr int DEFAULT_READ_TIMEOUT_SEC = 60;
static constexpr int HTTP_STATUS_OK = 200;
static constexpr const char *START_PARAMETER = "start";
static constexpr const char *MORE_DATA_HEADER = "X-More-Data";
static constexpr const char *TEXT_SIZE_HEADER = "X-Text-Size";
}  // namespace fetch
}  // namespace logscan::constants

#endif  // LOGSCAN_COMMON_CONSTANTS_H
