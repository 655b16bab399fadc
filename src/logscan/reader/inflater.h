#ifndef LOGSCAN_READER_INFLATER_H
#define LOGSCAN_READER_INFLATER_H

#include <logscan/common/constants.h>
#include <logscan/common/logging.h>
#include <zlib.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace logscan {
class Inflater {
   public:
    static constexpr std::size_t BUFFER_SIZE =
        constants::reader::INFLATE_BUFFER_SIZE;
    int bits;
    std::uint64_t c_off;
    z_stream stream;
    bool member_done;
    bool at_eof;
    alignas(64) unsigned char buffer[BUFFER_SIZE];
    alignas(64) unsigned char in_buffer[BUFFER_SIZE];

   public:
    Inflater()
        : bits(constants::reader::ZLIB_GZIP_WINDOW_BITS),
          c_off(0),
          member_done(false),
          at_eof(false),
          initialized_(false) {
        std::memset(&stream, 0, sizeof(stream));
    }

    ~Inflater() { reset(); }

    Inflater(const Inflater &) = delete;
    Inflater &operator=(const Inflater &) = delete;

    void initialize(int bits_ = constants::reader::ZLIB_GZIP_WINDOW_BITS) {
        reset();
        bits = bits_;
        if (inflateInit2(&stream, bits) != Z_OK) {
            throw std::runtime_error("Failed to initialize inflater");
        }
        initialized_ = true;
        stream.avail_in = 0;
        stream.next_in = nullptr;
    }

    void reset() {
        if (initialized_) {
            inflateEnd(&stream);
            initialized_ = false;
        }
        std::memset(&stream, 0, sizeof(stream));
        c_off = 0;
        member_done = false;
        at_eof = false;
    }

    /**
     * Every member seen so far was complete and the file has no more input.
     */
    bool finished() const { return at_eof && member_done; }

    /**
     * Inflate up to `len` bytes into `buf`. Concatenated gzip members are
     * decoded back to back. Returns false on a read error or corrupt data;
     * `bytes_out` is 0 with a true return only at end of input.
     */
    bool read(FILE *file, unsigned char *buf, std::size_t len,
              std::size_t &bytes_out) {
        stream.next_out = buf;
        stream.avail_out = static_cast<uInt>(len);
        bytes_out = 0;

        while (stream.avail_out > 0) {
            if (stream.avail_in == 0) {
                std::size_t n = std::fread(in_buffer, 1, sizeof(in_buffer), file);
                if (n == 0) {
                    if (std::ferror(file)) {
                        LOGSCAN_LOG_DEBUG(
                            "Error reading from file during inflation with "
                            "error: %s",
                            std::strerror(errno));
                        return false;
                    }
                    at_eof = true;
                    break;
                }
                stream.next_in = in_buffer;
                stream.avail_in = static_cast<uInt>(n);
                c_off += n;
            }

            if (member_done) {
                // another gzip member follows
                if (inflateReset(&stream) != Z_OK) {
                    return false;
                }
                member_done = false;
            }

            int ret = inflate(&stream, Z_NO_FLUSH);
            if (ret == Z_STREAM_END) {
                member_done = true;
                continue;
            }
            if (ret != Z_OK) {
                LOGSCAN_LOG_DEBUG("inflate() failed with error: %d (%s)", ret,
                                  stream.msg ? stream.msg : "no message");
                return false;
            }
        }

        bytes_out = len - stream.avail_out;
        return true;
    }

    const char *message() const {
        return stream.msg ? stream.msg : "corrupt compressed data";
    }

   private:
    bool initialized_;
};
}  // namespace logscan

#endif  // LOGSCAN_READER_INFLATER_H
