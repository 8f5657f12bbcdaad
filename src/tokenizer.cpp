#include "jsonstream/tokenizer.hpp"

#include <utility>


namespace JsonStream {

    namespace detail {

        inline bool is_valid_utf8(std::string_view s, size_t& error_idx) {
            const unsigned char* data = reinterpret_cast<const unsigned char*>(s.data());
            size_t i = 0;
            size_t n = s.size();

            auto fail = [&](size_t idx) { error_idx = idx; return false; };

            while (i < n) {
                unsigned char c = data[i];

                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                if (c >= 0xC2 && c <= 0xDF) {
                    if (i + 1 >= n) return fail(i);
                    if ((data[i + 1] & 0xC0) != 0x80) return fail(i);
                    i += 2;
                    continue;
                }

                if (c >= 0xE0 && c <= 0xEF) {
                    if (i + 2 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    unsigned char c2 = data[i + 2];
                    // E0 excludes overlongs, ED excludes encoded surrogates
                    if (c == 0xE0 && (c1 < 0xA0 || c1 > 0xBF)) return fail(i);
                    if (c == 0xED && (c1 < 0x80 || c1 > 0x9F)) return fail(i);
                    if ((c1 & 0xC0) != 0x80) return fail(i);
                    if ((c2 & 0xC0) != 0x80) return fail(i);
                    i += 3;
                    continue;
                }

                if (c >= 0xF0 && c <= 0xF4) {
                    if (i + 3 >= n) return fail(i);
                    unsigned char c1 = data[i + 1];
                    unsigned char c2 = data[i + 2];
                    unsigned char c3 = data[i + 3];
                    if (c == 0xF0 && (c1 < 0x90 || c1 > 0xBF)) return fail(i);
                    if (c == 0xF4 && (c1 < 0x80 || c1 > 0x8F)) return fail(i);
                    if ((c1 & 0xC0) != 0x80) return fail(i);
                    if ((c2 & 0xC0) != 0x80) return fail(i);
                    if ((c3 & 0xC0) != 0x80) return fail(i);
                    i += 4;
                    continue;
                }

                return fail(i);
            }
            return true;
        }

        void append_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                append_utf8(0xFFFDu, out);
            }
        }

        constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    } // namespace detail

    std::string_view to_string(token_kind k) noexcept {
        switch (k) {
        case token_kind::object_open: return "'{'";
        case token_kind::object_close: return "'}'";
        case token_kind::array_open: return "'['";
        case token_kind::array_close: return "']'";
        case token_kind::colon: return "':'";
        case token_kind::comma: return "','";
        case token_kind::string: return "string";
        case token_kind::number: return "number";
        case token_kind::boolean: return "boolean";
        case token_kind::null: return "null";
        case token_kind::end_of_input: return "end of input";
        }
        return "token";
    }

    Tokenizer::Tokenizer(ChunkSource& source, const StreamOptions& opts)
        : m_Source{ &source }, m_Opts{ opts } {}

#pragma region Cursor

    bool Tokenizer::fill() {
        while (!m_Exhausted) {
            auto r = m_Source->next();
            if (!r) {
                StreamError e = std::move(r.error());
                e.offset = m_Position.offset;
                e.line = m_Position.line;
                e.column = m_Position.column;
                m_SourceError = std::move(e);
                m_Exhausted = true;
                return false;
            }
            if (!*r) {
                m_Exhausted = true;
                return false;
            }
            if (!(*r)->empty()) {
                m_Chunk = **r;
                m_ChunkPos = 0;
                return true;
            }
        }
        return false;
    }

    bool Tokenizer::eof() {
        return m_ChunkPos >= m_Chunk.size() && !fill();
    }

    char Tokenizer::peek() {
        return eof() ? '\0' : m_Chunk[m_ChunkPos];
    }

    char Tokenizer::get() {
        if (eof()) return '\0';
        char c = m_Chunk[m_ChunkPos++];
        m_Position.offset++;
        if (c == '\n') {
            m_Position.line++;
            m_Position.column = 1;
        } else m_Position.column++;
        return c;
    }

    bool Tokenizer::consume(char c) {
        if (peek() == c) {
            get();
            return true;
        }
        return false;
    }

    StreamError Tokenizer::make_error(StreamError::code code, std::string_view msg) const {
        // A failing source truncates the input; report the cause, not the symptom
        if (m_SourceError) return *m_SourceError;
        return StreamError::make(code, m_Position.offset, m_Position.line, m_Position.column, msg);
    }

#pragma endregion
#pragma region Tokens

    Tokenizer::expected_void Tokenizer::skip_ws_and_comments() {
        while (!eof()) {
            char c = peek();

            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                get();
                continue;
            }

            if (!m_Opts.allow_comments || c != '/') break;

            get();
            char next = peek();
            if (next == '/') {
                get();
                while (!eof() && peek() != '\n') get();
                continue;
            }
            if (next == '*') {
                get();
                bool closed = false;
                while (!eof()) {
                    char ch = get();
                    if (ch == '*' && peek() == '/') {
                        get();
                        closed = true;
                        break;
                    }
                }
                if (!closed) return std::unexpected(make_error(StreamError::code::unterminated_comment, "Nonterminated block comment"));
                continue;
            }
            return std::unexpected(make_error(StreamError::code::unexpected_character, "Expected '/' or '*' after '/'"));
        }
        if (m_SourceError) return std::unexpected(*m_SourceError);
        return {};
    }

    Tokenizer::expected_void Tokenizer::read_literal(token& tok, std::string_view literal) {
        for (char expected : literal) {
            if (eof()) return std::unexpected(make_error(StreamError::code::truncated_token, "Truncated literal"));
            if (peek() != expected) return std::unexpected(make_error(StreamError::code::invalid_literal, "Invalid literal"));
            get();
        }
        tok.text.assign(literal.begin(), literal.end());
        return {};
    }

    StreamResult<uint16_t> Tokenizer::read_hex4() {
        uint16_t val = 0;
        for (int i = 0; i < 4; i++) {
            if (eof()) return std::unexpected(make_error(StreamError::code::unterminated_string, "Unexpected end in unicode escape"));
            char h = peek();
            unsigned digit = 0;
            if (h >= '0' && h <= '9') digit = h - '0';
            else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
            else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
            else return std::unexpected(make_error(StreamError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape"));
            get();
            val = static_cast<uint16_t>((val << 4) | digit);
        }
        return val;
    }

    Tokenizer::expected_void Tokenizer::read_string(token& tok) {
        get(); // opening quote
        std::string& out = tok.text;

        while (!eof()) {
            char c = peek();
            if (c == '"') {
                size_t bad_idx = 0;
                if (!detail::is_valid_utf8(out, bad_idx))
                    return std::unexpected(make_error(StreamError::code::invalid_string, "Invalid UTF-8 sequence in string"));
                get();
                return {};
            }
            if (static_cast<unsigned char>(c) < 0x20) return std::unexpected(make_error(StreamError::code::invalid_string, "Control character in string"));
            get();
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            if (eof()) break;
            char esc = peek();
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': break;
                default: return std::unexpected(make_error(StreamError::code::invalid_escape, "Invalid escape sequence"));
            }
            get();
            if (esc != 'u') continue;

            auto first = read_hex4();
            if (!first) return std::unexpected(std::move(first.error()));

            uint32_t codepoint = 0;
            if (*first >= 0xD800 && *first <= 0xDBFF) {
                if (eof()) break;
                if (!consume('\\')) return std::unexpected(make_error(StreamError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
                if (eof()) break;
                if (!consume('u')) return std::unexpected(make_error(StreamError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
                auto second = read_hex4();
                if (!second) return std::unexpected(std::move(second.error()));
                if (!(*second >= 0xDC00 && *second <= 0xDFFF)) return std::unexpected(make_error(StreamError::code::invalid_unicode_escape, "Invalid low surrogate"));
                codepoint = 0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | (static_cast<uint32_t>(*second - 0xDC00)));
            } else if (*first >= 0xDC00 && *first <= 0xDFFF) {
                return std::unexpected(make_error(StreamError::code::invalid_unicode_escape, "Unpaired low surrogate"));
            } else {
                codepoint = *first;
            }

            detail::append_utf8(codepoint, out);
        }

        return std::unexpected(make_error(StreamError::code::unterminated_string, "Nonterminated string"));
    }

    Tokenizer::expected_void Tokenizer::read_number(token& tok) {
        std::string& lexeme = tok.text;
        auto take = [&] { lexeme.push_back(get()); };

        if (peek() == '-') take();

        char first_digit = peek();
        if (!detail::is_digit(first_digit)) return std::unexpected(make_error(StreamError::code::invalid_number, "Expected digit"));
        take();
        if (first_digit == '0' && detail::is_digit(peek())) return std::unexpected(make_error(StreamError::code::invalid_number, "Leading zeros disallowed"));
        while (detail::is_digit(peek())) take();

        if (peek() == '.') {
            take();
            if (!detail::is_digit(peek())) return std::unexpected(make_error(StreamError::code::invalid_number, "Expected digit after '.'"));
            while (detail::is_digit(peek())) take();
        }

        char p = peek();
        if (p == 'e' || p == 'E') {
            take();
            char sign = peek();
            if (sign == '+' || sign == '-') take();
            if (!detail::is_digit(peek())) return std::unexpected(make_error(StreamError::code::invalid_number, "Expected digit in exponent"));
            while (detail::is_digit(peek())) take();
        }

        auto parsed = number::from_lexeme(lexeme);
        if (!parsed) return std::unexpected(make_error(StreamError::code::invalid_number, "Failed to parse number"));
        tok.num = *parsed;
        return {};
    }

    StreamResult<token> Tokenizer::next() {
        if (m_Failed) return std::unexpected(*m_Failed);

        auto scan = [&]() -> StreamResult<token> {
            if (auto ws = skip_ws_and_comments(); !ws) return std::unexpected(std::move(ws.error()));

            token tok;
            tok.position = m_Position;
            if (eof()) {
                tok.kind = token_kind::end_of_input;
                return tok;
            }

            auto punct = [&](token_kind k) -> StreamResult<token> {
                tok.kind = k;
                tok.text.push_back(get());
                return tok;
            };

            char c = peek();
            switch (c) {
            case '{': return punct(token_kind::object_open);
            case '}': return punct(token_kind::object_close);
            case '[': return punct(token_kind::array_open);
            case ']': return punct(token_kind::array_close);
            case ':': return punct(token_kind::colon);
            case ',': return punct(token_kind::comma);
            case 'n': {
                tok.kind = token_kind::null;
                if (auto r = read_literal(tok, "null"); !r) return std::unexpected(std::move(r.error()));
                return tok;
            }
            case 't': {
                tok.kind = token_kind::boolean;
                tok.boolean = true;
                if (auto r = read_literal(tok, "true"); !r) return std::unexpected(std::move(r.error()));
                return tok;
            }
            case 'f': {
                tok.kind = token_kind::boolean;
                tok.boolean = false;
                if (auto r = read_literal(tok, "false"); !r) return std::unexpected(std::move(r.error()));
                return tok;
            }
            case '"': {
                tok.kind = token_kind::string;
                if (auto r = read_string(tok); !r) return std::unexpected(std::move(r.error()));
                return tok;
            }
            default:
                if (c == '-' || detail::is_digit(c)) {
                    tok.kind = token_kind::number;
                    if (auto r = read_number(tok); !r) return std::unexpected(std::move(r.error()));
                    return tok;
                }
                if (c == '/') return std::unexpected(make_error(StreamError::code::unexpected_character, "Comments are not allowed"));
                if (c == '.') return std::unexpected(make_error(StreamError::code::invalid_number, "Fractional values must start with a 0"));
                return std::unexpected(make_error(StreamError::code::unexpected_character, "Unexpected character while reading token"));
            }
        };

        auto result = scan();
        if (!result) m_Failed = result.error();
        return result;
    }

#pragma endregion

} // namespace JsonStream
