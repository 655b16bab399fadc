#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <httplib.h>
#include <logscan/common/error.h>
#include <logscan/fetch/http_transport.h>
#include <logscan/fetch/progressive_fetcher.h>
#include <logscan/search/render.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "testing_utilities.h"

using namespace logscan;
using namespace logscan_test;

namespace {

/**
 * Loopback progressive-text endpoint. The log grows by one entry of
 * `growth` per request until `final_size` is reached.
 */
class ProgressiveServer {
   public:
    explicit ProgressiveServer(std::vector<std::string> growth)
        : growth_(std::move(growth)) {
        server_.Get("/job/demo/1/logText/progressiveText",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        serve(req, res);
                    });
        server_.Get("/missing", [](const httplib::Request&,
                                   httplib::Response& res) {
            res.status = 404;
            res.set_content("no such job", "text/plain");
        });
        server_.Get("/big", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("X-More-Data", "false");
            res.set_content(std::string(4096, 'x'), "text/plain");
        });
        server_.Get("/first-line", [](const httplib::Request&,
                                      httplib::Response& res) {
            res.set_header("X-More-Data", "false");
            res.set_content("error: first\n" + std::string(8192, 'x'),
                            "text/plain");
        });
        server_.Get("/endless", [this](const httplib::Request&,
                                       httplib::Response& res) {
            res.set_header("X-More-Data", "false");
            res.set_chunked_content_provider(
                "text/plain", [this](std::size_t, httplib::DataSink& sink) {
                    std::string block = "error: first\n";
                    std::string filler(4095, 'y');
                    filler.push_back('\n');
                    while (endless_written_ < ENDLESS_LIMIT) {
                        if (!sink.write(block.data(), block.size())) {
                            return false;
                        }
                        endless_written_ += block.size();
                        block = filler;
                    }
                    sink.done();
                    return true;
                });
        });
        server_.Get("/echo", [](const httplib::Request& req,
                                httplib::Response& res) {
            res.set_header("X-Text-Size", "not-a-number");
            res.set_header("X-More-Data", "TRUE");
            res.set_content(req.get_header_value("X-Trace-Id") + "\n" +
                                req.get_param_value("view") + "\n" +
                                req.get_param_value("start") + "\n",
                            "text/plain");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~ProgressiveServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    static constexpr std::size_t ENDLESS_LIMIT = 256u * 1024u * 1024u;

    std::size_t endless_written() const { return endless_written_; }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    std::vector<std::uint64_t> starts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

   private:
    void serve(const httplib::Request& req, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint64_t start = std::stoull(req.get_param_value("start"));
        starts_.push_back(start);
        if (published_ < growth_.size()) {
            log_ += growth_[published_++];
        }
        bool more = published_ < growth_.size();
        res.set_header("X-More-Data", more ? "true" : "false");
        res.set_header("X-Text-Size", std::to_string(log_.size()));
        res.set_content(start < log_.size() ? log_.substr(start) : "",
                        "text/plain");
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::mutex mutex_;
    std::vector<std::string> growth_;
    std::size_t published_ = 0;
    std::string log_;
    std::vector<std::uint64_t> starts_;
    std::atomic<std::size_t> endless_written_{0};
};

std::string body_of(ProgressiveResponse& response) {
    REQUIRE(response.body != nullptr);
    std::string out;
    std::string_view chunk;
    while (response.body->next_chunk(chunk)) {
        out.append(chunk.data(), chunk.size());
    }
    return out;
}

}  // namespace

TEST_CASE("URL helpers") {
    SUBCASE("split_url") {
        UrlParts parts =
            split_url("https://ci.example.com:8443/job/a/job/b/12/logText");
        CHECK(parts.base == "https://ci.example.com:8443");
        CHECK(parts.path == "/job/a/job/b/12/logText");

        CHECK(split_url("http://host").path == "/");
        CHECK(split_url("http://host?x=1").path == "/?x=1");
        CHECK_THROWS_AS(split_url("ftp://host/file"), Error);
        CHECK_THROWS_AS(split_url("http:///nohost"), Error);
    }

    SUBCASE("is_url") {
        CHECK(is_url("http://a"));
        CHECK(is_url("https://a"));
        CHECK_FALSE(is_url("/var/log/build.log"));
        CHECK_FALSE(is_url("build.log.gz"));
    }

    SUBCASE("with_start_parameter") {
        CHECK(with_start_parameter("/log", 0) == "/log?start=0");
        CHECK(with_start_parameter("/log?view=raw", 42) ==
              "/log?view=raw&start=42");
    }
}

TEST_CASE("HttpTransport - Configuration") {
    HttpTransportConfig config = HttpTransportConfig::Default();
    CHECK(config.base_url().empty());
    CHECK(config.max_buffered_bytes() ==
          constants::fetch::DEFAULT_MAX_BUFFERED_BYTES);
    CHECK(config.follow_redirects());

    config.set_base_url("http://localhost:1")
        .set_connection_timeout_sec(3)
        .set_read_timeout_sec(4)
        .set_max_buffered_bytes(10)
        .add_header("X-A", "1")
        .set_follow_redirects(false);
    CHECK(config.connection_timeout_sec() == 3);
    CHECK(config.read_timeout_sec() == 4);
    CHECK(config.max_buffered_bytes() == 10);
    REQUIRE(config.headers().size() == 1);
    CHECK(config.headers()[0].first == "X-A");
    CHECK_FALSE(config.follow_redirects());

    CHECK_THROWS_AS(HttpTransport{HttpTransportConfig()}, Error);
    CHECK_THROWS_AS(HttpTransport{HttpTransportConfig("http://localhost:1")
                                      .set_max_buffered_bytes(0)},
                    Error);
}

TEST_CASE("HttpTransport - Progressive endpoint") {
    ProgressiveServer server({"line 1\nerror: first\n", "line 3\n",
                              "error: second\nline 5\n"});
    HttpTransport transport(HttpTransportConfig(server.base_url())
                                .set_connection_timeout_sec(2)
                                .set_read_timeout_sec(5));
    const std::string resource = "/job/demo/1/logText/progressiveText";

    SUBCASE("Headers and body of one read") {
        ProgressiveResponse first = transport.fetch(resource, 0);
        CHECK(first.status == 200);
        CHECK(first.more_data);
        CHECK(first.text_size == 20);
        CHECK(body_of(first) == "line 1\nerror: first\n");

        ProgressiveResponse second = transport.fetch(resource, 20);
        CHECK(second.text_size == 27);
        CHECK(body_of(second) == "line 3\n");
        CHECK(server.starts() == std::vector<std::uint64_t>{0, 20});
    }

    SUBCASE("Follow until complete") {
        ProgressiveFetcher fetcher(transport);
        std::string printed;
        std::size_t previous = 0;
        FollowOptions options(std::chrono::milliseconds(1));
        std::uint64_t size = fetcher.follow(
            resource, 0,
            [&](const Increment& increment, LineSource& lines) {
                printed += format_text(grep(lines, SearchOptions("error")),
                                       increment.lines_before, &previous);
            },
            options);

        CHECK(size == 48);
        CHECK(server.starts() == std::vector<std::uint64_t>{0, 20, 27});
        CHECK(printed == "2:error: first\n--\n4:error: second\n");
    }
}

TEST_CASE("HttpTransport - Failures") {
    ProgressiveServer server({"x\n"});

    SUBCASE("Non-success status") {
        HttpTransport transport(HttpTransportConfig(server.base_url()));
        try {
            transport.fetch("/missing", 0);
            FAIL("expected a transport error");
        } catch (const TransportError& e) {
            CHECK(e.type() == Error::TRANSPORT_ERROR);
            CHECK(e.status_code() == 404);
        }
    }

    SUBCASE("Connection refused has no status") {
        HttpTransport transport(
            HttpTransportConfig("http://127.0.0.1:1").set_connection_timeout_sec(1));
        try {
            transport.fetch("/log", 0);
            FAIL("expected a transport error");
        } catch (const TransportError& e) {
            CHECK(e.type() == Error::TRANSPORT_ERROR);
            CHECK(e.status_code() == 0);
        }
    }
}

TEST_CASE("HttpTransport - Streaming body") {
    ProgressiveServer server({"x\n"});

    SUBCASE("Body larger than the buffer is read in full") {
        HttpTransport transport(
            HttpTransportConfig(server.base_url()).set_max_buffered_bytes(1000));
        ProgressiveResponse response = transport.fetch("/big", 0);
        CHECK(body_of(response).size() == 4096);
        CHECK_FALSE(response.more_data);
    }

    SUBCASE("Match on the first line of a long body") {
        HttpTransport transport(
            HttpTransportConfig(server.base_url()).set_max_buffered_bytes(1024));
        ProgressiveFetcher fetcher(transport);
        auto results =
            fetcher.grep("/first-line", SearchOptions("error:").set_max_count(1));
        REQUIRE(results.size() == 1);
        CHECK(results[0].text() == "error: first");
    }

    SUBCASE("Early stop closes the download") {
        HttpTransport transport(HttpTransportConfig(server.base_url())
                                    .set_max_buffered_bytes(64 * 1024)
                                    .set_read_timeout_sec(5));
        ProgressiveFetcher fetcher(transport);
        auto results =
            fetcher.grep("/endless", SearchOptions("error:").set_max_count(1));
        REQUIRE(results.size() == 1);

        // the server notices the closed connection on its next writes
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        CHECK(server.endless_written() <
              ProgressiveServer::ENDLESS_LIMIT / 4);
    }
}

TEST_CASE("HttpTransport - Request details") {
    ProgressiveServer server({"x\n"});
    HttpTransport transport(
        HttpTransportConfig(server.base_url()).add_header("X-Trace-Id", "abc"));

    ProgressiveResponse response = transport.fetch("/echo?view=raw", 17);
    CHECK(body_of(response) == "abc\nraw\n17\n");
    CHECK(response.more_data);
    CHECK(response.text_size == 0);
}
