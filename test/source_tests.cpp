#include "test_helpers.hpp"

#include <sstream>

using namespace Catch;
using JsonStream::StreamError;

namespace {

    std::vector<std::string> drain(JsonStream::ChunkSource& src) {
        std::vector<std::string> out;
        while (true) {
            auto frag = src.next();
            REQUIRE(frag);
            if (!*frag) break;
            out.emplace_back(**frag);
        }
        return out;
    }

}

TEST_CASE("StringSource Serves Whole Text or Fixed Slices") {
    JsonStream::StringSource whole{ "[1,2,3]" };
    REQUIRE(drain(whole) == std::vector<std::string>{ "[1,2,3]" });

    JsonStream::StringSource sliced{ "[1,2,3]", 3 };
    REQUIRE(drain(sliced) == std::vector<std::string>{ "[1,", "2,3", "]" });

    JsonStream::StringSource empty{ "" };
    REQUIRE(drain(empty).empty());
}

TEST_CASE("FragmentSource Serves Fragments in Order") {
    JsonStream::FragmentSource src{ { "a", "", "bc" } };
    REQUIRE(drain(src) == std::vector<std::string>{ "a", "", "bc" });

    auto after = src.next();
    REQUIRE(after);
    REQUIRE_FALSE(after->has_value());
}

TEST_CASE("StreamSource Never Splits a UTF-8 Sequence") {
    const std::string text = "[\"a\xC3\xA9\xE2\x98\x83\xF0\x9F\x98\x80z\"]";

    for (size_t chunk = 1; chunk <= 6; chunk++) {
        INFO("chunk size: " << chunk);
        std::istringstream is{ text };
        JsonStream::SourceOptions opts;
        opts.chunk_size = chunk;
        JsonStream::StreamSource src{ is, opts };

        auto fragments = drain(src);
        std::string joined;
        for (const auto& f : fragments) {
            REQUIRE_FALSE(f.empty());
            REQUIRE(JsonStream::incomplete_utf8_tail(f) == 0);
            joined += f;
        }
        REQUIRE(joined == text);
        REQUIRE(src.bytes_read() == text.size());
    }
}

TEST_CASE("StreamSource Uses the Default Chunk Size") {
    std::string text(10000, ' ');
    text.front() = '[';
    text.back() = ']';

    std::istringstream is{ text };
    JsonStream::StreamSource src{ is };
    auto fragments = drain(src);
    REQUIRE(fragments.size() == 3);
    REQUIRE(fragments[0].size() == 4096);
    REQUIRE(fragments[2].size() == 10000 - 2 * 4096);
}

TEST_CASE("StreamSource Reports a Bad Stream") {
    std::istringstream is{ "[1,2]" };
    is.setstate(std::ios::badbit);

    JsonStream::StreamSource src{ is };
    auto frag = src.next();
    REQUIRE_FALSE(frag);
    REQUIRE(frag.error().errc == StreamError::code::source_failure);
    REQUIRE(frag.error().category() == JsonStream::error_category::io);

    std::istringstream bad{ "[1,2]" };
    bad.setstate(std::ios::badbit);
    auto r = JsonStream::parse(bad);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == StreamError::code::source_failure);
}

TEST_CASE("FunctionSource Stops Calling After the End") {
    int calls = 0;
    JsonStream::FunctionSource src{ [&]() -> JsonStream::StreamResult<std::optional<std::string>> {
        calls++;
        if (calls == 1) return std::string{ "{}" };
        return std::nullopt;
    } };

    REQUIRE(drain(src) == std::vector<std::string>{ "{}" });
    REQUIRE(calls == 2);

    auto after = src.next();
    REQUIRE(after);
    REQUIRE_FALSE(after->has_value());
    REQUIRE(calls == 2);
}

TEST_CASE("Incomplete UTF-8 Tail Detection") {
    using JsonStream::incomplete_utf8_tail;

    REQUIRE(incomplete_utf8_tail("") == 0);
    REQUIRE(incomplete_utf8_tail("abc") == 0);
    REQUIRE(incomplete_utf8_tail("a\xC3") == 1);
    REQUIRE(incomplete_utf8_tail("a\xC3\xA9") == 0);
    REQUIRE(incomplete_utf8_tail("\xE2\x98") == 2);
    REQUIRE(incomplete_utf8_tail("\xE2\x98\x83") == 0);
    REQUIRE(incomplete_utf8_tail("\xF0\x9F\x98") == 3);
    REQUIRE(incomplete_utf8_tail("\xF0\x9F\x98\x80") == 0);
    // stray continuation bytes and invalid leads are left for the tokenizer
    REQUIRE(incomplete_utf8_tail("a\x80") == 0);
    REQUIRE(incomplete_utf8_tail("a\xFF") == 0);
}
