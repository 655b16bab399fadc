#include <logscan/reader/byte_source.h>

namespace logscan {

bool MemoryByteSource::next_chunk(std::string_view &chunk) {
    if (index_ >= chunks_.size()) {
        return false;
    }
    chunk = chunks_[index_++];
    return true;
}

std::size_t MemoryByteSource::total_bytes() const {
    std::size_t total = 0;
    for (const auto &c : chunks_) {
        total += c.size();
    }
    return total;
}

}  // namespace logscan
