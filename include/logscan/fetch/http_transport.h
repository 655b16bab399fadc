#ifndef LOGSCAN_FETCH_HTTP_TRANSPORT_H
#define LOGSCAN_FETCH_HTTP_TRANSPORT_H

#include <logscan/common/constants.h>
#include <logscan/fetch/transport.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace logscan {

class HttpTransportConfig {
   public:
    using Header = std::pair<std::string, std::string>;

    explicit HttpTransportConfig(
        const std::string &base_url = "",
        int connection_timeout_sec =
            constants::fetch::DEFAULT_CONNECTION_TIMEOUT_SEC,
        int read_timeout_sec = constants::fetch::DEFAULT_READ_TIMEOUT_SEC,
        std::size_t max_buffered_bytes =
            constants::fetch::DEFAULT_MAX_BUFFERED_BYTES)
        : base_url_(base_url),
          connection_timeout_sec_(connection_timeout_sec),
          read_timeout_sec_(read_timeout_sec),
          max_buffered_bytes_(max_buffered_bytes),
          follow_redirects_(true) {}

    inline static HttpTransportConfig Default() {
        return HttpTransportConfig();
    }

    // Getter
    inline const std::string &base_url() const { return base_url_; }
    inline int connection_timeout_sec() const {
        return connection_timeout_sec_;
    }
    inline int read_timeout_sec() const { return read_timeout_sec_; }
    inline std::size_t max_buffered_bytes() const {
        return max_buffered_bytes_;
    }
    inline const std::vector<Header> &headers() const { return headers_; }
    inline bool follow_redirects() const { return follow_redirects_; }

    // Setter
    inline HttpTransportConfig &set_base_url(const std::string &base_url) {
        base_url_ = base_url;
        return *this;
    }
    inline HttpTransportConfig &set_connection_timeout_sec(int seconds) {
        connection_timeout_sec_ = seconds;
        return *this;
    }
    inline HttpTransportConfig &set_read_timeout_sec(int seconds) {
        read_timeout_sec_ = seconds;
        return *this;
    }
    inline HttpTransportConfig &set_max_buffered_bytes(std::size_t bytes) {
        max_buffered_bytes_ = bytes;
        return *this;
    }
    inline HttpTransportConfig &add_header(const std::string &name,
                                           const std::string &value) {
        headers_.emplace_back(name, value);
        return *this;
    }
    inline HttpTransportConfig &set_follow_redirects(bool follow) {
        follow_redirects_ = follow;
        return *this;
    }

   private:
    std::string base_url_;
    int connection_timeout_sec_;
    int read_timeout_sec_;
    std::size_t max_buffered_bytes_;  // received but not yet read
    std::vector<Header> headers_;
    bool follow_redirects_;
};

/**
 * ProgressiveTransport over HTTP(S) using cpp-httplib.
 *
 * fetch() issues GET <resource>?start=<offset> against the configured base
 * URL, waits for the X-More-Data and X-Text-Size headers and returns while
 * the body is still downloading on a background thread. At most about
 * max_buffered_bytes of received body wait for the reader. Destroying the
 * body early closes the connection, so a search that stops early downloads
 * little more than it read. Each fetch uses its own connection.
 *
 * @throws TransportError on connection failure (status 0) and on a non-200
 *         status. Reading the body throws TransportError (status 0) when
 *         the connection fails mid-body.
 */
class HttpTransport : public ProgressiveTransport {
   public:
    explicit HttpTransport(const HttpTransportConfig &config);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport &) = delete;
    HttpTransport &operator=(const HttpTransport &) = delete;

    ProgressiveResponse fetch(const std::string &resource,
                              std::uint64_t offset) override;

    const HttpTransportConfig &config() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> p_impl_;
};

struct UrlParts {
    std::string base;  // scheme://host[:port]
    std::string path;  // path and query, "/" when absent
};

/**
 * Split "scheme://host[:port]/path?query" into base and path.
 * @throws Error(INVALID_ARGUMENT) when the URL has no http(s) scheme or host
 */
UrlParts split_url(const std::string &url);

bool is_url(const std::string &source);

/**
 * Append the start=<offset> query parameter to `path`.
 */
std::string with_start_parameter(const std::string &path, std::uint64_t offset);

}  // namespace logscan

#endif  // LOGSCAN_FETCH_HTTP_TRANSPORT_H
