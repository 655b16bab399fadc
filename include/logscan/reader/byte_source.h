#ifndef LOGSCAN_READER_BYTE_SOURCE_H
#define LOGSCAN_READER_BYTE_SOURCE_H

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logscan {

/**
 * Pull-based source of byte chunks. Chunk boundaries carry no meaning and
 * may split lines or multi-byte characters anywhere.
 *
 * next_chunk() stores the next chunk in `chunk` and returns true, or returns
 * false once the source is exhausted. The returned view stays valid only
 * until the next call. Failures are raised as logscan::Error.
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;
    virtual bool next_chunk(std::string_view &chunk) = 0;
};

/**
 * Serves a fixed list of chunks in order. Empty chunks are passed through
 * unchanged so callers can exercise zero-length reads.
 */
class MemoryByteSource : public ByteSource {
   public:
    MemoryByteSource() = default;
    explicit MemoryByteSource(std::vector<std::string> chunks)
        : chunks_(std::move(chunks)) {}
    explicit MemoryByteSource(std::string data) {
        chunks_.push_back(std::move(data));
    }

    void append(std::string chunk) { chunks_.push_back(std::move(chunk)); }

    bool next_chunk(std::string_view &chunk) override;

    std::size_t chunks_served() const { return index_; }
    std::size_t total_bytes() const;

   private:
    std::vector<std::string> chunks_;
    std::size_t index_ = 0;
};

/**
 * Reads an uncompressed file sequentially in fixed-size chunks.
 */
class FileByteSource : public ByteSource {
   public:
    explicit FileByteSource(const std::string &path,
                            std::size_t chunk_size = 0);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource &) = delete;
    FileByteSource &operator=(const FileByteSource &) = delete;

    bool next_chunk(std::string_view &chunk) override;

    const std::string &path() const { return path_; }

   private:
    std::string path_;
    FILE *file_handle_;
    std::vector<char> buffer_;
    bool is_finished_;
};

/**
 * Inflates a gzip file (including multi-member files) chunk by chunk.
 */
class GzipByteSource : public ByteSource {
   public:
    explicit GzipByteSource(const std::string &path);
    ~GzipByteSource() override;

    GzipByteSource(const GzipByteSource &) = delete;
    GzipByteSource &operator=(const GzipByteSource &) = delete;

    bool next_chunk(std::string_view &chunk) override;

   private:
    struct Impl;
    std::unique_ptr<Impl> p_impl_;
};

/**
 * Opens a local file, picking GzipByteSource when the file starts with the
 * gzip magic bytes and FileByteSource otherwise.
 */
std::unique_ptr<ByteSource> open_file_source(const std::string &path);

/**
 * Opens `path` for sequential binary reading with a large stdio buffer.
 * Throws Error(IO_ERROR) when the file cannot be opened.
 */
FILE *open_file(const std::string &path);

}  // namespace logscan

#endif  // LOGSCAN_READER_BYTE_SOURCE_H
