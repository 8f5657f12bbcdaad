#pragma once

#include <catch2/catch_all.hpp>

#include "jsonstream/jsonstream.hpp"

#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace test_support {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        std::int64_t uniform_integer() {
            std::uniform_int_distribution<std::int64_t> dist(-(std::int64_t{ 1 } << 60), std::int64_t{ 1 } << 60);
            return dist(eng);
        }

        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }

        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(ascii_char());
            return s;
        }
    };

    JsonStream::value random_json_value(rng& r, int depth = 0, int max_depth = 4);

    inline JsonStream::value random_primitive(rng& r) {
        switch (r.uniform_size(0, 4)) {
            case 0: return JsonStream::value{ nullptr };
            case 1: return JsonStream::value{ r.coin() };
            case 2: return JsonStream::value{ r.uniform_double() };
            case 3: return JsonStream::value{ r.uniform_integer() };
            case 4: {
                auto s = r.random_string();
                return JsonStream::value{ std::string_view{ s } };
            }
        }
        return JsonStream::value{ nullptr };
    }

    inline JsonStream::value random_array(rng& r, int depth, int max_depth) {
        auto res = JsonStream::value{};
        auto& arr = res.as_array();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++)
            arr.emplace_back(random_json_value(r, depth + 1, max_depth));
        return res;
    }

    inline JsonStream::value random_object(rng& r, int depth, int max_depth) {
        auto res = JsonStream::value{};
        auto& obj = res.as_object();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            auto key = r.random_string();
            auto value = random_json_value(r, depth + 1, max_depth);
            obj.emplace(JsonStream::string{ key.c_str(), res.resource() }, std::move(value));
        }
        return res;
    }

    inline JsonStream::value random_json_value(rng& r, int depth, int max_depth) {
        if (depth >= max_depth) return random_primitive(r);

        switch (r.uniform_size(0, 5)) {
            case 0:
            case 1:
                return random_primitive(r);
            case 2:
            case 3:
                return random_array(r, depth, max_depth);
            case 4:
            case 5:
                return random_object(r, depth, max_depth);
        }
        return random_primitive(r);
    }

    /// Parses @p text cut into fragments of @p chunk_size bytes (0 = one fragment)
    inline JsonStream::StreamResult<std::vector<JsonStream::event>> events_of(std::string_view text,
                                                                              size_t chunk_size = 0,
                                                                              const JsonStream::StreamOptions& opts = {}) {
        JsonStream::StringSource src{ std::string{ text }, chunk_size };
        JsonStream::EventParser parser{ src, opts };
        return JsonStream::collect(parser);
    }

    inline JsonStream::StreamResult<JsonStream::value> assemble_text(std::string_view text,
                                                                     size_t chunk_size = 0,
                                                                     const JsonStream::StreamOptions& opts = {}) {
        JsonStream::StringSource src{ std::string{ text }, chunk_size };
        JsonStream::EventParser parser{ src, opts };
        return JsonStream::assembled(parser);
    }

    inline JsonStream::StreamResult<std::vector<JsonStream::group>> group_text(std::string_view text,
                                                                               size_t depth,
                                                                               size_t chunk_size = 0) {
        JsonStream::StringSource src{ std::string{ text }, chunk_size };
        JsonStream::EventParser parser{ src };
        return JsonStream::grouped(parser, depth);
    }

    inline JsonStream::value must_parse(std::string_view text) {
        auto r = JsonStream::parse(text);
        REQUIRE(r);
        return std::move(*r);
    }

    inline void expect_fail(std::string_view text,
                            JsonStream::StreamError::code code,
                            const JsonStream::StreamOptions& opts = {}) {
        INFO("parsing: " << text);
        auto r = JsonStream::parse(text, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }

} // namespace test_support
