#include "jsonstream/event.hpp"

#include <cctype>


namespace JsonStream {

    namespace {

        bool is_plain_key(std::string_view key) {
            if (key.empty()) return false;
            if (std::isdigit(static_cast<unsigned char>(key.front()))) return false;
            for (char c : key) {
                auto u = static_cast<unsigned char>(c);
                if (!std::isalnum(u) && c != '_') return false;
            }
            return true;
        }

        void append_segment(std::string& out, const path_segment& seg) {
            if (seg.is_index()) {
                out += '[';
                out += std::to_string(seg.index());
                out += ']';
                return;
            }

            const auto& key = seg.key();
            if (is_plain_key(key)) {
                out += '.';
                out += key;
                return;
            }

            out += "[\"";
            for (char c : key) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += "\"]";
        }

    } // namespace

    std::string to_string(const json_path& path) {
        std::string out = "$";
        for (const auto& seg : path) append_segment(out, seg);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const path_segment& seg) {
        if (seg.is_index()) return os << seg.index();
        return os << '"' << seg.key() << '"';
    }

    StreamResult<std::optional<event>> EventList::next() {
        if (m_Index >= m_Events.size()) return std::nullopt;
        return m_Events[m_Index++];
    }

    StreamResult<std::vector<event>> collect(EventSource& source) {
        std::vector<event> out;
        while (true) {
            auto ev = source.next();
            if (!ev) return std::unexpected(std::move(ev.error()));
            if (!*ev) break;
            out.push_back(std::move(**ev));
        }
        return out;
    }

} // namespace JsonStream
