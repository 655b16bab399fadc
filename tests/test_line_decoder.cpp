#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <logscan/common/error.h>
#include <logscan/reader/byte_source.h>
#include <logscan/reader/line_decoder.h>
#include <logscan/reader/line_processor.h>
#include <logscan/reader/utf8.h>
#include <logscan/utils/cancellation.h>

#include <string>
#include <vector>

#include "testing_utilities.h"

using namespace logscan;
using namespace logscan_test;

namespace {

std::vector<std::string> decode(std::vector<std::string> chunks) {
    MemoryByteSource source(std::move(chunks));
    LineDecoder decoder(source);
    return collect_texts(decoder);
}

// Counts next_chunk calls after exhaustion
class CountingSource : public ByteSource {
   public:
    explicit CountingSource(std::string data) : data_(std::move(data)) {}

    bool next_chunk(std::string_view& chunk) override {
        ++calls;
        if (served_) {
            return false;
        }
        served_ = true;
        chunk = data_;
        return true;
    }

    int calls = 0;

   private:
    std::string data_;
    bool served_ = false;
};

class FailingSource : public ByteSource {
   public:
    bool next_chunk(std::string_view& chunk) override {
        if (!first_done_) {
            first_done_ = true;
            chunk = "partial line\nrest";
            return true;
        }
        throw Error(Error::IO_ERROR, "disk went away");
    }

   private:
    bool first_done_ = false;
};

}  // namespace

TEST_CASE("LineDecoder - Splitting and numbering") {
    SUBCASE("Mixed line endings") {
        MemoryByteSource source(std::string("L1\nL2\r\nL3"));
        LineDecoder decoder(source);
        auto lines = collect_lines(decoder);
        REQUIRE(lines.size() == 3);
        CHECK(lines[0].number == 1);
        CHECK(lines[0].text == "L1");
        CHECK(lines[1].number == 2);
        CHECK(lines[1].text == "L2");
        CHECK(lines[2].number == 3);
        CHECK(lines[2].text == "L3");
    }

    SUBCASE("Trailing newline produces no empty line") {
        CHECK(decode({"a\nb\n"}) == std::vector<std::string>{"a", "b"});
    }

    SUBCASE("Empty lines in the middle are kept") {
        CHECK(decode({"a\n\n\nb\n"}) ==
              std::vector<std::string>{"a", "", "", "b"});
    }

    SUBCASE("A lone newline is one empty line") {
        CHECK(decode({"\n"}) == std::vector<std::string>{""});
    }

    SUBCASE("Empty input") {
        CHECK(decode({}).empty());
        CHECK(decode({"", "", ""}).empty());
    }

    SUBCASE("Only the carriage return right before the newline is dropped") {
        CHECK(decode({"a\rb\r\n"}) == std::vector<std::string>{"a\rb"});
        CHECK(decode({"a\r\r\n"}) == std::vector<std::string>{"a\r"});
    }

    SUBCASE("Unterminated trailing carriage return is kept") {
        CHECK(decode({"a\nb\r"}) == std::vector<std::string>{"a", "b\r"});
    }
}

TEST_CASE("LineDecoder - Chunk boundaries") {
    const std::vector<std::string> expected{"first", "second", "third"};

    SUBCASE("Single chunk") {
        CHECK(decode({"first\r\nsecond\nthird"}) == expected);
    }

    SUBCASE("CRLF split across chunks") {
        CHECK(decode({"first\r", "\nsecond\nthi", "rd"}) == expected);
    }

    SUBCASE("Zero-length chunks interleaved") {
        CHECK(decode({"", "fir", "", "st\r\n", "", "second\n", "third", ""}) ==
              expected);
    }

    SUBCASE("One byte per chunk") {
        std::string data = "first\r\nsecond\nthird";
        std::vector<std::string> chunks;
        for (char c : data) {
            chunks.emplace_back(1, c);
        }
        CHECK(decode(chunks) == expected);
    }

    SUBCASE("Only bytes after the last boundary stay buffered") {
        MemoryByteSource source(
            std::vector<std::string>{"aaaa\nbb", "bb\ncc"});
        LineDecoder decoder(source);
        REQUIRE(decoder.next()->text == "aaaa");
        CHECK(decoder.buffered_bytes() == 2);
        REQUIRE(decoder.next()->text == "bbbb");
        CHECK(decoder.buffered_bytes() == 2);
        REQUIRE(decoder.next()->text == "cc");
        CHECK_FALSE(decoder.next().has_value());
        CHECK(decoder.is_finished());
        CHECK(decoder.lines_emitted() == 3);
    }
}

TEST_CASE("LineDecoder - Exhaustion") {
    CountingSource source("only\n");
    LineDecoder decoder(source);
    CHECK(decoder.next()->text == "only");
    CHECK_FALSE(decoder.next().has_value());
    int calls = source.calls;
    CHECK_FALSE(decoder.next().has_value());
    CHECK_FALSE(decoder.next().has_value());
    CHECK(source.calls == calls);
}

TEST_CASE("LineDecoder - Source failures propagate") {
    FailingSource source;
    LineDecoder decoder(source);
    CHECK(decoder.next()->text == "partial line");
    try {
        decoder.next();
        FAIL("expected an IO error");
    } catch (const Error& e) {
        CHECK(e.type() == Error::IO_ERROR);
        CHECK(e.is_remote_error());
    }
}

TEST_CASE("LineDecoder - Owning constructor") {
    LineDecoder decoder(std::make_unique<MemoryByteSource>(std::string("x\ny")));
    CHECK(collect_texts(decoder) == std::vector<std::string>{"x", "y"});
    std::unique_ptr<ByteSource> missing;
    CHECK_THROWS_AS(LineDecoder{std::move(missing)}, Error);
}

TEST_CASE("UTF-8 - Lossy decoding") {
    const std::string fffd(UTF8_REPLACEMENT);

    SUBCASE("Valid text is untouched") {
        std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
        CHECK(is_valid_utf8(text));
        CHECK(sanitize_utf8(text) == text);
    }

    SUBCASE("Stray continuation byte") {
        CHECK(sanitize_utf8("a\x80z") == "a" + fffd + "z");
    }

    SUBCASE("Invalid lead bytes") {
        CHECK(sanitize_utf8("\xC0\xAF") == fffd + fffd);
        CHECK(sanitize_utf8("\xFF") == fffd);
    }

    SUBCASE("Truncated sequence is one replacement") {
        CHECK(sanitize_utf8("\xE2\x82z") == fffd + "z");
        CHECK(sanitize_utf8("\xF0\x9F\x98") == fffd);
    }

    SUBCASE("Surrogates and out of range code points") {
        CHECK_FALSE(is_valid_utf8("\xED\xA0\x80"));
        CHECK_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));
    }

    SUBCASE("Decoder replaces and keeps going") {
        auto lines = decode({"ok\nbad \xFF byte\nnext\n"});
        REQUIRE(lines.size() == 3);
        CHECK(lines[1] == "bad " + fffd + " byte");
        CHECK(lines[2] == "next");
    }

    SUBCASE("Multi-byte character split across chunks") {
        auto lines = decode({"caf\xC3", "\xA9\n"});
        REQUIRE(lines.size() == 1);
        CHECK(lines[0] == "caf\xC3\xA9");
    }
}

TEST_CASE("LineProcessor - Feeding lines") {
    MemoryByteSource source(numbered_lines(5));
    LineDecoder decoder(source);

    SUBCASE("StringLineProcessor accumulates every line") {
        std::string result;
        StringLineProcessor processor(result);
        CHECK(process_lines(decoder, processor) == 5);
        CHECK(result == numbered_lines(5));
    }

    SUBCASE("Processor can stop early") {
        struct FirstTwo : LineProcessor {
            std::vector<std::size_t> seen;
            bool process(const Line& line) override {
                seen.push_back(line.number);
                return seen.size() < 2;
            }
        } processor;
        CHECK(process_lines(decoder, processor) == 2);
        CHECK(processor.seen == std::vector<std::size_t>{1, 2});
        CHECK(decoder.next()->number == 3);
    }

    SUBCASE("Cancellation") {
        CancellationToken cancel;
        cancel.cancel();
        std::string result;
        StringLineProcessor processor(result);
        CHECK_THROWS_AS(process_lines(decoder, processor, &cancel),
                        CancelledError);
        CHECK(result.empty());
    }
}
