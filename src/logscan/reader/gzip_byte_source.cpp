#include <logscan/common/constants.h>
#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/reader/byte_source.h>

#include "inflater.h"

namespace logscan {

struct GzipByteSource::Impl {
    std::string path;
    FILE *file_handle = nullptr;
    Inflater inflater;
    bool is_finished = false;

    ~Impl() {
        if (file_handle) {
            std::fclose(file_handle);
        }
    }
};

GzipByteSource::GzipByteSource(const std::string &path)
    : p_impl_(std::make_unique<Impl>()) {
    p_impl_->path = path;
    p_impl_->file_handle = open_file(path);
    try {
        p_impl_->inflater.initialize(constants::reader::ZLIB_GZIP_WINDOW_BITS);
    } catch (const std::runtime_error &e) {
        throw Error(Error::DECOMPRESSION_ERROR,
                    std::string(e.what()) + ": " + path);
    }
}

GzipByteSource::~GzipByteSource() = default;

bool GzipByteSource::next_chunk(std::string_view &chunk) {
    Impl &impl = *p_impl_;
    if (impl.is_finished) {
        return false;
    }

    std::size_t bytes_out = 0;
    if (!impl.inflater.read(impl.file_handle, impl.inflater.buffer,
                            sizeof(impl.inflater.buffer), bytes_out)) {
        impl.is_finished = true;
        throw Error(Error::DECOMPRESSION_ERROR,
                    "Failed to inflate " + impl.path + ": " +
                        impl.inflater.message());
    }

    if (bytes_out == 0) {
        impl.is_finished = true;
        if (!impl.inflater.finished()) {
            throw Error(Error::DECOMPRESSION_ERROR,
                        "Unexpected end of compressed stream: " + impl.path);
        }
        LOGSCAN_LOG_DEBUG("Finished inflating %s (%llu compressed bytes)",
                          impl.path.c_str(),
                          static_cast<unsigned long long>(impl.inflater.c_off));
        return false;
    }

    chunk = std::string_view(reinterpret_cast<const char *>(impl.inflater.buffer),
                             bytes_out);
    return true;
}

std::unique_ptr<ByteSource> open_file_source(const std::string &path) {
    unsigned char magic[2] = {0, 0};
    std::size_t n = 0;
    {
        FILE *file = open_file(path);
        n = std::fread(magic, 1, sizeof(magic), file);
        std::fclose(file);
    }

    if (n == sizeof(magic) && magic[0] == constants::reader::GZIP_MAGIC_0 &&
        magic[1] == constants::reader::GZIP_MAGIC_1) {
        LOGSCAN_LOG_DEBUG("Detected gzip input: %s", path.c_str());
        return std::make_unique<GzipByteSource>(path);
    }
    return std::make_unique<FileByteSource>(path);
}

}  // namespace logscan
