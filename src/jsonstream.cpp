#include "jsonstream/jsonstream.hpp"

#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>


namespace JsonStream {

    namespace detail {

        /// Writes one value tree; keeps the stream and options for the recursion
        class Writer {
        public:
            Writer(std::ostream& os, const WriteOptions& opts) : m_Out{ os }, m_Opts{ opts } {}

            void write(const value& v);

        private:
            void write_string(std::string_view s);
            void write_number(const number& n);
            void break_line();

            template<class Range, class Member>
            void write_container(const Range& items, char open, char close, Member write_member);

            std::ostream& m_Out;
            const WriteOptions& m_Opts;
            std::size_t m_Depth = 0;
        };

    } // namespace detail

    StreamResult<value> parse(std::string_view input, const StreamOptions& opts) {
        StringSource src{ std::string{ input } };
        EventParser parser{ src, opts };
        return assembled(parser);
    }

    StreamResult<value> parse(std::istream& is, const StreamOptions& opts, const SourceOptions& source_opts) {
        StreamSource src{ is, source_opts };
        EventParser parser{ src, opts };
        return assembled(parser);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::Writer{ oss, opts }.write(v);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::Writer{ os, opts }.write(v);
    }

    std::ostream& operator<<(std::ostream& os, const value& v) {
        const WriteOptions compact{};
        detail::Writer{ os, compact }.write(v);
        return os;
    }

#pragma region Serializer

    namespace detail {

        void Writer::write_string(std::string_view s) {
            static constexpr char hex[] = "0123456789ABCDEF";

            m_Out.put('"');
            for (unsigned char c : s) {
                const char* escape = nullptr;
                switch (c) {
                case '"': escape = "\\\""; break;
                case '\\': escape = "\\\\"; break;
                case '\b': escape = "\\b"; break;
                case '\f': escape = "\\f"; break;
                case '\n': escape = "\\n"; break;
                case '\r': escape = "\\r"; break;
                case '\t': escape = "\\t"; break;
                default: break;
                }

                if (escape) m_Out << escape;
                else if (c < 0x20) m_Out << "\\u00" << hex[c >> 4] << hex[c & 0xF];
                else m_Out.put(static_cast<char>(c));
            }
            m_Out.put('"');
        }

        void Writer::write_number(const number& n) {
            char buf[32];
            std::to_chars_result res{};
            if (auto i = n.as_integer()) {
                res = std::to_chars(buf, buf + sizeof(buf), *i);
            } else if (double d = n.as_double(); std::isfinite(d)) {
                // shortest form that reads back to the same double
                res = std::to_chars(buf, buf + sizeof(buf), d);
            } else {
                m_Out << "null";
                return;
            }
            m_Out.write(buf, res.ptr - buf);
        }

        void Writer::break_line() {
            if (!m_Opts.pretty) return;
            m_Out.put('\n');
            for (std::size_t i = 0; i < m_Depth * m_Opts.indent; i++) m_Out.put(' ');
        }

        template<class Range, class Member>
        void Writer::write_container(const Range& items, char open, char close, Member write_member) {
            m_Out.put(open);
            if (items.empty()) {
                m_Out.put(close);
                return;
            }

            m_Depth++;
            bool first = true;
            for (const auto& item : items) {
                if (!first) m_Out.put(',');
                first = false;
                break_line();
                write_member(item);
            }
            m_Depth--;
            break_line();
            m_Out.put(close);
        }

        void Writer::write(const value& v) {
            switch (v.type()) {
            case kind::null: m_Out << "null"; break;
            case kind::boolean: m_Out << (v.as_bool() ? "true" : "false"); break;
            case kind::number: write_number(v.as_number()); break;
            case kind::string: write_string(v.as_string()); break;
            case kind::array:
                write_container(v.as_array(), '[', ']', [this](const value& elem) { write(elem); });
                break;
            case kind::object:
                write_container(v.as_object(), '{', '}', [this](const auto& member) {
                    write_string(member.first);
                    m_Out << (m_Opts.pretty ? ": " : ":");
                    write(member.second);
                });
                break;
            }
        }

    } // namespace detail

#pragma endregion

} // namespace JsonStream
