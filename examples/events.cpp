#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "jsonstream/jsonstream.hpp"

namespace {

    void usage(std::ostream& os) {
        os << "usage: jsonstream_events [--group N] [--chunk-size BYTES] [--log-level LEVEL] [FILE]\n"
              "Prints one line per event (path = value), or one line per group with --group.\n"
              "Reads standard input when FILE is omitted or '-'.\n";
    }

    std::optional<std::size_t> parse_size(std::string_view text) {
        std::size_t out = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
        return out;
    }

    int report(const JsonStream::StreamError& err) {
        std::cerr << "error: " << err.describe() << '\n';
        return 1;
    }

}

int main(int argc, char** argv) {
    std::optional<std::size_t> group_depth;
    JsonStream::SourceOptions source_opts;
    JsonStream::LogLevel level = JsonStream::LogLevel::warn;
    std::string file = "-";

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        auto value_of = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view{ argv[++i] };
        };

        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            return 0;
        } else if (arg == "--group") {
            auto v = value_of();
            auto n = v ? parse_size(*v) : std::nullopt;
            if (!n) { usage(std::cerr); return 2; }
            group_depth = *n;
        } else if (arg == "--chunk-size") {
            auto v = value_of();
            auto n = v ? parse_size(*v) : std::nullopt;
            if (!n || *n == 0) { usage(std::cerr); return 2; }
            source_opts.chunk_size = *n;
        } else if (arg == "--log-level") {
            auto v = value_of();
            auto parsed = v ? JsonStream::parse_log_level(*v) : std::nullopt;
            if (!parsed) { usage(std::cerr); return 2; }
            level = *parsed;
        } else {
            file = std::string{ arg };
        }
    }

    std::ifstream ifs;
    std::istream* in = &std::cin;
    if (file != "-") {
        ifs.open(file, std::ios::binary);
        if (!ifs) {
            std::cerr << "error: cannot open " << file << '\n';
            return 1;
        }
        in = &ifs;
    }

    JsonStream::Logger logger{ level, std::cerr };
    JsonStream::StreamOptions opts;
    opts.logger = &logger;

    JsonStream::StreamSource src{ *in, source_opts };
    JsonStream::EventParser parser{ src, opts };

    if (group_depth) {
        JsonStream::Grouper groups{ parser, *group_depth };
        while (true) {
            auto g = groups.next();
            if (!g) return report(g.error());
            if (!*g) break;
            std::cout << JsonStream::to_string((*g)->prefix) << " = " << (*g)->content << '\n';
        }
        logger.info("jsonstream.events", "done", { { "groups", std::to_string(groups.yielded()) } });
        return 0;
    }

    std::size_t count = 0;
    while (true) {
        auto ev = parser.next();
        if (!ev) return report(ev.error());
        if (!*ev) break;
        std::cout << JsonStream::to_string((*ev)->path) << " = " << (*ev)->leaf << '\n';
        count++;
    }
    if (count == 0) {
        std::cerr << "error: empty document\n";
        return 1;
    }
    logger.info("jsonstream.events", "done", { { "events", std::to_string(count) } });
    return 0;
}
