#include <logscan/common/constants.h>
#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/reader/byte_source.h>

#include <cerrno>
#include <cstring>

#ifdef __linux__
#include <fcntl.h>
#endif

namespace logscan {

FILE *open_file(const std::string &path) {
    FILE *file = std::fopen(path.c_str(), "rb");
    if (!file) {
        throw Error(Error::IO_ERROR, "Failed to open file: " + path + " (" +
                                         std::strerror(errno) + ")");
    }

    setvbuf(file, nullptr, _IOFBF, constants::reader::FILE_IO_BUFFER_SIZE);

#ifdef __linux__
    // Hint to kernel about sequential access
    posix_fadvise(fileno(file), 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

    return file;
}

FileByteSource::FileByteSource(const std::string &path, std::size_t chunk_size)
    : path_(path),
      file_handle_(open_file(path)),
      buffer_(chunk_size > 0 ? chunk_size
                             : constants::reader::DEFAULT_CHUNK_SIZE),
      is_finished_(false) {
    LOGSCAN_LOG_DEBUG("Opened %s with chunk size %zu", path_.c_str(),
                      buffer_.size());
}

FileByteSource::~FileByteSource() {
    if (file_handle_) {
        std::fclose(file_handle_);
        file_handle_ = nullptr;
    }
}

bool FileByteSource::next_chunk(std::string_view &chunk) {
    if (is_finished_) {
        return false;
    }

    std::size_t n = std::fread(buffer_.data(), 1, buffer_.size(), file_handle_);
    if (n == 0) {
        if (std::ferror(file_handle_)) {
            throw Error(Error::IO_ERROR, "Failed to read from file: " + path_ +
                                             " (" + std::strerror(errno) +
                                             ")");
        }
        is_finished_ = true;
        return false;
    }

    chunk = std::string_view(buffer_.data(), n);
    return true;
}

}  // namespace logscan
