#include <httplib.h>
#include <logscan/common/config.h>
#include <logscan/common/constants.h>
#include <logscan/common/error.h>
#include <logscan/common/logging.h>
#include <logscan/fetch/http_transport.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace logscan {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::uint64_t parse_text_size(const std::string &value) {
    if (value.empty()) {
        return 0;
    }
    char *end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' ||
        value[0] == '-') {
        LOGSCAN_LOG_WARN("Ignoring malformed %s header: %s",
                         constants::fetch::TEXT_SIZE_HEADER, value.c_str());
        return 0;
    }
    return static_cast<std::uint64_t>(parsed);
}

}  // namespace

bool is_url(const std::string &source) {
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

UrlParts split_url(const std::string &url) {
    if (!is_url(url)) {
        throw Error(Error::INVALID_ARGUMENT,
                    "URL must start with http:// or https://: " + url);
    }
    std::size_t host_begin = url.find("://") + 3;
    std::size_t path_begin = url.find_first_of("/?", host_begin);
    if (path_begin == host_begin) {
        throw Error(Error::INVALID_ARGUMENT, "URL has no host: " + url);
    }

    UrlParts parts;
    if (path_begin == std::string::npos) {
        parts.base = url;
        parts.path = "/";
    } else {
        parts.base = url.substr(0, path_begin);
        parts.path = url.substr(path_begin);
        if (parts.path[0] == '?') {
            parts.path.insert(0, 1, '/');
        }
    }
    return parts;
}

std::string with_start_parameter(const std::string &path,
                                 std::uint64_t offset) {
    char separator = path.find('?') == std::string::npos ? '?' : '&';
    return path + separator + constants::fetch::START_PARAMETER + "=" +
           std::to_string(offset);
}

namespace {

// Chunks handed from the request thread to the reader. The request thread
// blocks while `buffered` is at the limit, so memory stays bounded no matter
// how large the increment is.
struct BodyChannel {
    explicit BodyChannel(std::size_t max_buffered_) : max_buffered(max_buffered_) {}

    std::mutex mutex;
    std::condition_variable changed;
    std::deque<std::string> chunks;
    std::size_t max_buffered;
    std::size_t buffered = 0;
    bool headers_ready = false;
    bool declared_body = false;  // Content-Length or Transfer-Encoding seen
    bool done = false;
    bool abort = false;
    int status = 0;
    bool more_data = false;
    std::uint64_t text_size = 0;
    std::string error;  // set when the request failed before completing
};

void run_request(const HttpTransportConfig &config,
                 const httplib::Headers &headers, const std::string &target,
                 const std::shared_ptr<BodyChannel> &channel) {
    std::string error;
    try {
        httplib::Client client(config.base_url());
        client.set_connection_timeout(config.connection_timeout_sec(), 0);
        client.set_read_timeout(config.read_timeout_sec(), 0);
        client.set_follow_location(config.follow_redirects());

        auto result = client.Get(
            target, headers,
            [&](const httplib::Response &response) {
                std::lock_guard<std::mutex> lock(channel->mutex);
                channel->status = response.status;
                channel->more_data =
                    to_lower(response.get_header_value(
                        constants::fetch::MORE_DATA_HEADER)) == "true";
                channel->text_size = parse_text_size(response.get_header_value(
                    constants::fetch::TEXT_SIZE_HEADER));
                channel->declared_body =
                    response.has_header("Content-Length") ||
                    response.has_header("Transfer-Encoding");
                channel->headers_ready = true;
                channel->changed.notify_all();
                return response.status == constants::fetch::HTTP_STATUS_OK &&
                       !channel->abort;
            },
            [&](const char *data, std::size_t length) {
                std::unique_lock<std::mutex> lock(channel->mutex);
                channel->changed.wait(lock, [&] {
                    return channel->abort ||
                           channel->buffered < channel->max_buffered;
                });
                if (channel->abort) {
                    return false;
                }
                channel->chunks.emplace_back(data, length);
                channel->buffered += length;
                channel->changed.notify_all();
                return true;
            });

        if (!result) {
            std::lock_guard<std::mutex> lock(channel->mutex);
            bool rejected = channel->headers_ready &&
                            channel->status != constants::fetch::HTTP_STATUS_OK;
            if (!channel->abort && !rejected) {
                error = "Request " + config.base_url() + target +
                        " failed: " + httplib::to_string(result.error());
            }
        }
    } catch (const std::exception &e) {
        error = "Request " + config.base_url() + target + " failed: " + e.what();
    }

    std::lock_guard<std::mutex> lock(channel->mutex);
    channel->error = error;
    channel->done = true;
    channel->changed.notify_all();
}

/**
 * Response body read while it downloads. Destroying it before the end stops
 * the download: the request thread sees `abort` on its next chunk and
 * cpp-httplib closes the connection.
 */
class StreamingBody : public ByteSource {
   public:
    StreamingBody(std::shared_ptr<BodyChannel> channel, std::thread worker)
        : channel_(std::move(channel)), worker_(std::move(worker)) {}

    ~StreamingBody() override {
        {
            std::lock_guard<std::mutex> lock(channel_->mutex);
            channel_->abort = true;
        }
        channel_->changed.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    StreamingBody(const StreamingBody &) = delete;
    StreamingBody &operator=(const StreamingBody &) = delete;

    bool next_chunk(std::string_view &chunk) override {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->changed.wait(lock, [&] {
            return !channel_->chunks.empty() || channel_->done;
        });
        if (channel_->chunks.empty()) {
            if (!channel_->error.empty()) {
                throw TransportError(Error::TRANSPORT_ERROR, 0,
                                     channel_->error);
            }
            return false;
        }
        current_ = std::move(channel_->chunks.front());
        channel_->chunks.pop_front();
        channel_->buffered -= current_.size();
        lock.unlock();
        channel_->changed.notify_all();
        chunk = current_;
        return true;
    }

    // Blocks until the status line and headers arrived or the request ended
    void wait_for_headers() {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        channel_->changed.wait(lock, [&] {
            return channel_->headers_ready || channel_->done;
        });
    }

    // Without a length or transfer encoding the body is known to be absent
    // only once the connection closes without sending anything
    bool has_body() {
        std::unique_lock<std::mutex> lock(channel_->mutex);
        if (channel_->declared_body) {
            return true;
        }
        channel_->changed.wait(lock, [&] {
            return !channel_->chunks.empty() || channel_->done;
        });
        return !channel_->chunks.empty() || !channel_->error.empty();
    }

   private:
    std::shared_ptr<BodyChannel> channel_;
    std::thread worker_;
    std::string current_;
};

}  // namespace

struct HttpTransport::Impl {
    HttpTransportConfig config;
    httplib::Headers headers;

    explicit Impl(const HttpTransportConfig &config_) : config(config_) {
        for (const auto &header : config.headers()) {
            headers.emplace(header.first, header.second);
        }
    }
};

HttpTransport::HttpTransport(const HttpTransportConfig &config) {
    if (config.base_url().empty()) {
        throw Error(Error::INVALID_ARGUMENT, "HTTP transport needs a base URL");
    }
#if !LOGSCAN_ENABLE_HTTPS
    if (config.base_url().rfind("https://", 0) == 0) {
        throw Error(Error::INVALID_ARGUMENT,
                    "https:// sources need a build with LOGSCAN_ENABLE_HTTPS: " +
                        config.base_url());
    }
#endif
    if (!httplib::Client(config.base_url()).is_valid()) {
        throw Error(Error::INVALID_ARGUMENT,
                    "Unsupported base URL: " + config.base_url());
    }
    if (config.max_buffered_bytes() == 0) {
        throw Error(Error::INVALID_ARGUMENT,
                    "max_buffered_bytes must be positive");
    }
    p_impl_ = std::make_unique<Impl>(config);
}

HttpTransport::~HttpTransport() = default;

const HttpTransportConfig &HttpTransport::config() const {
    return p_impl_->config;
}

ProgressiveResponse HttpTransport::fetch(const std::string &resource,
                                         std::uint64_t offset) {
    const std::string target = with_start_parameter(resource, offset);

    LOGSCAN_LOG_DEBUG("GET %s%s", p_impl_->config.base_url().c_str(),
                      target.c_str());

    auto channel =
        std::make_shared<BodyChannel>(p_impl_->config.max_buffered_bytes());
    auto body = std::make_unique<StreamingBody>(
        channel, std::thread(run_request, p_impl_->config, p_impl_->headers,
                             target, channel));
    body->wait_for_headers();

    ProgressiveResponse progressive;
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (!channel->headers_ready) {
            std::string error = channel->error.empty()
                                    ? "Request " + target + " failed"
                                    : channel->error;
            throw TransportError(Error::TRANSPORT_ERROR, 0, error);
        }
        if (channel->status != constants::fetch::HTTP_STATUS_OK) {
            throw TransportError(Error::TRANSPORT_ERROR, channel->status,
                                 "Request " + target + " was rejected");
        }
        progressive.status = channel->status;
        progressive.more_data = channel->more_data;
        progressive.text_size = channel->text_size;
    }

    if (body->has_body()) {
        progressive.body = std::move(body);
    }

    LOGSCAN_LOG_DEBUG("Streaming %s, more_data=%d, text_size=%llu",
                      target.c_str(), progressive.more_data ? 1 : 0,
                      static_cast<unsigned long long>(progressive.text_size));
    return progressive;
}

}  // namespace logscan
