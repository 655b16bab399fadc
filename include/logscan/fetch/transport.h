#ifndef LOGSCAN_FETCH_TRANSPORT_H
#define LOGSCAN_FETCH_TRANSPORT_H

#include <logscan/reader/byte_source.h>

#include <cstdint>
#include <memory>
#include <string>

namespace logscan {

/**
 * One progressive read: the bytes appended since the requested offset and
 * what the server says about the rest of the resource.
 */
struct ProgressiveResponse {
    int status = 0;
    std::unique_ptr<ByteSource> body;  // nullptr when the response had none
    bool more_data = false;
    std::uint64_t text_size = 0;  // total size so far, next offset to request
};

/**
 * Source of progressive reads. Implementations issue exactly one request per
 * call and do not retry.
 */
class ProgressiveTransport {
   public:
    virtual ~ProgressiveTransport() = default;
    virtual ProgressiveResponse fetch(const std::string &resource,
                                      std::uint64_t offset) = 0;
};

}  // namespace logscan

#endif  // LOGSCAN_FETCH_TRANSPORT_H
