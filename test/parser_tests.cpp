#include "test_helpers.hpp"

#include <sstream>

using namespace Catch;
using JsonStream::event;
using JsonStream::json_path;
using JsonStream::parse_state;
using JsonStream::StreamError;
using JsonStream::value;
using test_support::events_of;

namespace {

    StreamError parse_error(std::string_view text, size_t chunk_size = 0, const JsonStream::StreamOptions& opts = {}) {
        auto r = events_of(text, chunk_size, opts);
        REQUIRE_FALSE(r);
        return r.error();
    }

    value empty_array() {
        value v;
        (void)v.as_array();
        return v;
    }

    value empty_object() {
        value v;
        (void)v.as_object();
        return v;
    }

}

TEST_CASE("Events Carry Full Paths in Document Order") {
    auto r = events_of(R"({"a":[1,{"b":2}]})");
    REQUIRE(r);

    std::vector<event> expected{
        { json_path{ "a", 0 }, value{ 1 } },
        { json_path{ "a", 1, "b" }, value{ 2 } },
    };
    REQUIRE(*r == expected);
}

TEST_CASE("Top-Level Scalar Yields One Event With Empty Path") {
    for (auto* text : { "42", " \"x\" ", "true", "null", "-1.5" }) {
        INFO("parsing: " << text);
        auto r = events_of(text);
        REQUIRE(r);
        REQUIRE(r->size() == 1);
        REQUIRE(r->front().path.empty());
        REQUIRE(r->front().leaf.is_scalar());
    }

    auto r = events_of("42");
    REQUIRE(r);
    REQUIRE(r->front().leaf == value{ 42 });
}

TEST_CASE("Every Scalar Kind Becomes a Leaf") {
    auto r = events_of(R"(["s", 1, 2.5, true, false, null])");
    REQUIRE(r);
    REQUIRE(r->size() == 6);

    REQUIRE((*r)[0].leaf == value{ "s" });
    REQUIRE((*r)[1].leaf == value{ 1 });
    REQUIRE((*r)[2].leaf == value{ 2.5 });
    REQUIRE((*r)[3].leaf == value{ true });
    REQUIRE((*r)[4].leaf == value{ false });
    REQUIRE((*r)[5].leaf.is_null());

    for (size_t i = 0; i < r->size(); i++)
        REQUIRE((*r)[i].path == json_path{ i });
}

TEST_CASE("Empty Containers Produce Marker Events") {
    auto r = events_of(R"({"a":[],"b":{},"c":[[],{}],"d":[1]})");
    REQUIRE(r);

    std::vector<event> expected{
        { json_path{ "a" }, empty_array() },
        { json_path{ "b" }, empty_object() },
        { json_path{ "c", 0 }, empty_array() },
        { json_path{ "c", 1 }, empty_object() },
        { json_path{ "d", 0 }, value{ 1 } },
    };
    REQUIRE(*r == expected);
    REQUIRE((*r)[0].is_marker());
    REQUIRE_FALSE((*r)[4].is_marker());
}

TEST_CASE("Top-Level Empty Containers Produce One Marker") {
    auto arr = events_of("[]");
    REQUIRE(arr);
    REQUIRE(arr->size() == 1);
    REQUIRE(arr->front().path.empty());
    REQUIRE(arr->front().leaf == empty_array());

    auto obj = events_of(" { } ");
    REQUIRE(obj);
    REQUIRE(obj->size() == 1);
    REQUIRE(obj->front().leaf == empty_object());
}

TEST_CASE("Duplicate Keys Are Surfaced as Separate Events") {
    auto r = events_of(R"({"a":1,"a":2})");
    REQUIRE(r);
    REQUIRE(r->size() == 2);
    REQUIRE((*r)[0].path == (*r)[1].path);
    REQUIRE((*r)[1].leaf == value{ 2 });
}

TEST_CASE("Empty Input Produces No Events") {
    for (auto* text : { "", " \n\t " }) {
        auto r = events_of(text);
        REQUIRE(r);
        REQUIRE(r->empty());
    }
}

TEST_CASE("Events Do Not Depend on Split Points") {
    std::string text = R"( {"users":[{"id":1,"name":"Ann \"A\"","tags":[]},)"
                       R"({"id":2,"name":"Böb","score":-3.25e2,"ok":true,"x":null}],)"
                       R"("meta":{"next":"/users?page=2","empty":{}}} )";

    auto whole = events_of(text);
    REQUIRE(whole);
    REQUIRE(whole->size() == 10);

    for (size_t cut = 1; cut < text.size(); cut++) {
        INFO("split at: " << cut);
        JsonStream::FragmentSource src{ { text.substr(0, cut), text.substr(cut) } };
        JsonStream::EventParser parser{ src };
        auto split = JsonStream::collect(parser);
        REQUIRE(split);
        REQUIRE(*split == *whole);
    }

    auto per_char = events_of(text, 1);
    REQUIRE(per_char);
    REQUIRE(*per_char == *whole);
}

TEST_CASE("Malformed Input Fails at the Offending Token") {
    for (size_t chunk = 0; chunk <= 7; chunk++) {
        INFO("chunk size: " << chunk);
        auto err = parse_error(R"({"a": })", chunk);
        REQUIRE(err.errc == StreamError::code::unexpected_token);
        REQUIRE(err.category() == JsonStream::error_category::structural);
        REQUIRE(err.offset == 6);
        REQUIRE(err.line == 1);
        REQUIRE(err.column == 7);
        REQUIRE(err.path == "$.a");
    }
}

TEST_CASE("Structural Errors") {
    REQUIRE(parse_error("[1}").errc == StreamError::code::mismatched_close);
    REQUIRE(parse_error("[}").errc == StreamError::code::mismatched_close);
    REQUIRE(parse_error(R"({"a":1])").errc == StreamError::code::mismatched_close);
    REQUIRE(parse_error("{]").errc == StreamError::code::mismatched_close);
    REQUIRE(parse_error("]").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("[,1]").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("[1 2]").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("[1,,2]").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error(R"({"a" 1})").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("{1:2}").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("{,}").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error(":").errc == StreamError::code::unexpected_token);
    REQUIRE(parse_error("1 2").errc == StreamError::code::trailing_characters);
    REQUIRE(parse_error("{} []").errc == StreamError::code::trailing_characters);
}

TEST_CASE("Truncated Documents Fail With Unexpected End of Input") {
    for (auto* text : { "[", "[1", "[1,", "{", R"({"a")", R"({"a":)", R"({"a":1)", R"({"a":1,)", "[[]" }) {
        INFO("parsing: " << text);
        auto err = parse_error(text);
        REQUIRE(err.errc == StreamError::code::unexpected_end_of_input);
        REQUIRE(err.category() == JsonStream::error_category::structural);
    }
}

TEST_CASE("Trailing Commas Follow the Option") {
    REQUIRE(parse_error("[1,]").errc == StreamError::code::trailing_comma);
    REQUIRE(parse_error(R"({"a":1,})").errc == StreamError::code::trailing_comma);

    JsonStream::StreamOptions relaxed;
    relaxed.allow_trailing_commas = true;

    auto arr = events_of("[1,]", 0, relaxed);
    REQUIRE(arr);
    REQUIRE(arr->size() == 1);

    auto obj = events_of(R"({"a":1,})", 0, relaxed);
    REQUIRE(obj);
    REQUIRE(obj->size() == 1);

    REQUIRE(parse_error("[,]", 0, relaxed).errc == StreamError::code::unexpected_token);
}

TEST_CASE("Comments Follow the Option") {
    std::string text = "/* head */ {\"a\": // note\n 1}";
    REQUIRE(parse_error(text).errc == StreamError::code::unexpected_character);

    JsonStream::StreamOptions opts;
    opts.allow_comments = true;
    auto r = events_of(text, 2, opts);
    REQUIRE(r);
    REQUIRE(r->size() == 1);
    REQUIRE(r->front().path == json_path{ "a" });
}

TEST_CASE("Max Depth Is Enforced") {
    JsonStream::StreamOptions opts{};
    opts.max_depth = 3;

    REQUIRE(events_of("[[[]]]", 0, opts));
    REQUIRE(parse_error("[[[[]]]]", 0, opts).errc == StreamError::code::depth_limit_exceeded);
    REQUIRE(events_of(R"({ "1": { "2": {}}})", 0, opts));
    REQUIRE(parse_error(R"({ "1": { "2": { "3": {}}}})", 0, opts).errc == StreamError::code::depth_limit_exceeded);
}

TEST_CASE("Parser Reports the Same Error on Every Pull") {
    JsonStream::StringSource src{ "[1, 2, }" };
    JsonStream::EventParser parser{ src };

    REQUIRE(parser.next());
    REQUIRE(parser.next());

    auto first = parser.next();
    REQUIRE_FALSE(first);
    REQUIRE(parser.state() == parse_state::error);
    REQUIRE(first.error().path == "$[2]");

    auto second = parser.next();
    REQUIRE_FALSE(second);
    REQUIRE(second.error().errc == first.error().errc);
    REQUIRE(second.error().offset == first.error().offset);
}

TEST_CASE("Stepping Exposes State and Depth") {
    JsonStream::StringSource src{ R"({"a":[true]})" };
    JsonStream::EventParser parser{ src };

    REQUIRE(parser.state() == parse_state::expect_value);
    REQUIRE(parser.depth() == 0);

    auto expect_step = [&](parse_state state, size_t depth, bool produces_event) {
        auto r = parser.step();
        REQUIRE(r);
        REQUIRE(r->has_value() == produces_event);
        REQUIRE(parser.state() == state);
        REQUIRE(parser.depth() == depth);
    };

    expect_step(parse_state::expect_key_or_close, 1, false);          // {
    expect_step(parse_state::expect_colon, 1, false);                 // "a"
    REQUIRE(parser.current_path() == json_path{ "a" });
    expect_step(parse_state::expect_value, 1, false);                 // :
    expect_step(parse_state::expect_array_value_or_close, 2, false);  // [
    REQUIRE(parser.current_path() == json_path{ "a", 0 });
    expect_step(parse_state::expect_array_comma_or_close, 2, true);   // true
    expect_step(parse_state::expect_object_comma_or_close, 1, false); // ]
    expect_step(parse_state::expect_end, 0, false);                   // }
    expect_step(parse_state::done, 0, false);                         // end of input

    auto after = parser.next();
    REQUIRE(after);
    REQUIRE_FALSE(after->has_value());
}

TEST_CASE("Parser Pulls Fragments Only on Demand") {
    std::vector<std::string> fragments{ "[1,", "2,", "3]" };
    size_t pulls = 0;
    JsonStream::FunctionSource src{ [&]() -> JsonStream::StreamResult<std::optional<std::string>> {
        if (pulls >= fragments.size()) return std::nullopt;
        return fragments[pulls++];
    } };
    JsonStream::EventParser parser{ src };

    auto first = parser.next();
    REQUIRE(first);
    REQUIRE(pulls == 1);

    auto second = parser.next();
    REQUIRE(second);
    REQUIRE(pulls == 2);
}

TEST_CASE("Parser Errors Are Logged") {
    std::ostringstream sink;
    JsonStream::Logger logger{ JsonStream::LogLevel::debug, sink };

    JsonStream::StreamOptions opts;
    opts.logger = &logger;

    auto err = parse_error(R"({"a": })", 0, opts);
    REQUIRE(err.errc == StreamError::code::unexpected_token);

    const std::string line = sink.str();
    REQUIRE(line.find("level=ERROR") != std::string::npos);
    REQUIRE(line.find("logger=\"jsonstream.parser\"") != std::string::npos);
    REQUIRE(line.find("code=\"unexpected_token\"") != std::string::npos);
    REQUIRE(line.find("offset=\"6\"") != std::string::npos);
    REQUIRE(line.find("path=\"$.a\"") != std::string::npos);
}

TEST_CASE("Path Rendering") {
    REQUIRE(JsonStream::to_string(json_path{}) == "$");
    REQUIRE(JsonStream::to_string(json_path{ "a", 0, "b_2" }) == "$.a[0].b_2");
    REQUIRE(JsonStream::to_string(json_path{ "with space", "9lives", "q\"" }) == R"($["with space"]["9lives"]["q\""])");
}

TEST_CASE("Error Description Carries Position and Path") {
    auto err = parse_error("[1,\n  x]");
    REQUIRE(err.errc == StreamError::code::unexpected_character);
    REQUIRE(err.category() == JsonStream::error_category::lexical);
    REQUIRE(err.offset == 6);
    REQUIRE(err.line == 2);
    REQUIRE(err.column == 3);
    REQUIRE(err.describe().rfind("unexpected_character at line 2, column 3 (offset 6) in $[1]: ", 0) == 0);
}

TEST_CASE("Parser Position Tracks Consumed Text") {
    JsonStream::StringSource src{ "[1,\n 2]", 2 };
    JsonStream::EventParser parser{ src };
    REQUIRE(parser.position().offset == 0);

    auto events = JsonStream::collect(parser);
    REQUIRE(events);
    REQUIRE(parser.position().offset == 7);
    REQUIRE(parser.position().line == 2);
    REQUIRE(parser.position().column == 4);
}

TEST_CASE("Truncation Between Members Names the Open Container") {
    for (size_t chunk : { 0u, 1u }) {
        INFO("chunk size: " << chunk);

        auto in_array = parse_error("[1,2", chunk);
        REQUIRE(in_array.errc == StreamError::code::unexpected_end_of_input);
        REQUIRE(in_array.path == "$");

        auto nested = parse_error(R"({"a":[1,2)", chunk);
        REQUIRE(nested.errc == StreamError::code::unexpected_end_of_input);
        REQUIRE(nested.path == "$.a");

        auto in_object = parse_error(R"({"a":{"b":1)", chunk);
        REQUIRE(in_object.path == "$.a");

        // after a comma the next slot is awaited and named
        auto after_comma = parse_error("[1,2,", chunk);
        REQUIRE(after_comma.path == "$[2]");
    }
}
