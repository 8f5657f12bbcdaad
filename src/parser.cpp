#include "jsonstream/parser.hpp"

#include <utility>

#include "jsonstream/log.hpp"


namespace JsonStream {

    std::string_view to_string(parse_state s) noexcept {
        switch (s) {
        case parse_state::expect_value: return "expect_value";
        case parse_state::expect_key_or_close: return "expect_key_or_close";
        case parse_state::expect_colon: return "expect_colon";
        case parse_state::expect_object_comma_or_close: return "expect_object_comma_or_close";
        case parse_state::expect_array_value_or_close: return "expect_array_value_or_close";
        case parse_state::expect_array_comma_or_close: return "expect_array_comma_or_close";
        case parse_state::expect_end: return "expect_end";
        case parse_state::done: return "done";
        case parse_state::error: return "error";
        }
        return "unknown";
    }

    EventParser::EventParser(ChunkSource& source, const StreamOptions& opts)
        : m_Opts{ opts }, m_Tokenizer{ source, opts } {}

    StreamResult<std::optional<event>> EventParser::next() {
        while (true) {
            auto r = step();
            if (!r || *r) return r;
            if (m_State == parse_state::done) return std::nullopt;
        }
    }

    json_path EventParser::current_path() const {
        json_path path;
        path.reserve(m_Stack.size());
        for (std::size_t i = 0; i < m_Stack.size(); i++) {
            const auto& f = m_Stack[i];
            if (f.is_object) {
                if (f.has_key) path.emplace_back(f.key);
            } else if (i + 1 < m_Stack.size() || m_State == parse_state::expect_array_value_or_close) {
                // the innermost array names a slot only while a value is awaited
                path.emplace_back(f.index);
            }
        }
        return path;
    }

    json_path EventParser::snapshot_path() const {
        json_path path;
        path.reserve(m_Stack.size());
        for (const auto& f : m_Stack) {
            if (f.is_object) path.emplace_back(f.key);
            else path.emplace_back(f.index);
        }
        return path;
    }

#pragma region Errors

    EventParser::step_result EventParser::fail(StreamError err) {
        if (err.path.empty()) err.path = to_string(current_path());
        m_State = parse_state::error;
        m_Error = err;

        if (m_Opts.logger) {
            auto offset = std::to_string(err.offset);
            m_Opts.logger->error("jsonstream.parser", err.msg, {
                { "code", to_string(err.errc) },
                { "offset", offset },
                { "path", err.path },
            });
        }
        return std::unexpected(std::move(err));
    }

    EventParser::step_result EventParser::fail_at(const token& tok, StreamError::code code, std::string_view msg) {
        const auto& pos = tok.position;
        return fail(StreamError::make(code, pos.offset, pos.line, pos.column, msg));
    }

    EventParser::step_result EventParser::reject(const token& tok, std::string_view expecting) {
        if (tok.kind == token_kind::end_of_input) {
            std::string msg = "Unexpected end of input, expected ";
            msg += expecting;
            return fail_at(tok, StreamError::code::unexpected_end_of_input, msg);
        }
        std::string msg = "Unexpected ";
        msg += to_string(tok.kind);
        msg += ", expected ";
        msg += expecting;
        return fail_at(tok, StreamError::code::unexpected_token, msg);
    }

#pragma endregion
#pragma region Automaton

    EventParser::step_result EventParser::step() {
        if (m_State == parse_state::error) return std::unexpected(*m_Error);
        if (m_State == parse_state::done) return std::nullopt;

        auto next = m_Tokenizer.next();
        if (!next) return fail(std::move(next.error()));
        token& tok = *next;

        switch (m_State) {
        case parse_state::expect_value:
            if (tok.kind == token_kind::end_of_input && m_Stack.empty()) {
                // nothing but whitespace: no document, no events
                m_State = parse_state::done;
                return std::nullopt;
            }
            return on_value(tok);

        case parse_state::expect_array_value_or_close:
            if (tok.kind == token_kind::array_close) return on_close(tok, false);
            if (tok.kind == token_kind::object_close) return fail_at(tok, StreamError::code::mismatched_close, "'}' closing an array");
            if (tok.kind == token_kind::comma) return reject(tok, "a value or ']'");
            return on_value(tok);

        case parse_state::expect_key_or_close: {
            frame& top = m_Stack.back();
            if (tok.kind == token_kind::object_close) return on_close(tok, true);
            if (tok.kind == token_kind::array_close) return fail_at(tok, StreamError::code::mismatched_close, "']' closing an object");
            if (tok.kind != token_kind::string) return reject(tok, "an object key or '}'");
            top.key = std::move(tok.text);
            top.has_key = true;
            top.after_comma = false;
            m_State = parse_state::expect_colon;
            return std::nullopt;
        }

        case parse_state::expect_colon:
            if (tok.kind != token_kind::colon) return reject(tok, "':'");
            m_State = parse_state::expect_value;
            return std::nullopt;

        case parse_state::expect_object_comma_or_close:
            if (tok.kind == token_kind::object_close) return on_close(tok, true);
            if (tok.kind == token_kind::array_close) return fail_at(tok, StreamError::code::mismatched_close, "']' closing an object");
            if (tok.kind != token_kind::comma) return reject(tok, "',' or '}'");
            m_Stack.back().after_comma = true;
            m_State = parse_state::expect_key_or_close;
            return std::nullopt;

        case parse_state::expect_array_comma_or_close:
            if (tok.kind == token_kind::array_close) return on_close(tok, false);
            if (tok.kind == token_kind::object_close) return fail_at(tok, StreamError::code::mismatched_close, "'}' closing an array");
            if (tok.kind != token_kind::comma) return reject(tok, "',' or ']'");
            m_Stack.back().after_comma = true;
            m_State = parse_state::expect_array_value_or_close;
            return std::nullopt;

        case parse_state::expect_end:
            if (tok.kind == token_kind::end_of_input) {
                m_State = parse_state::done;
                return std::nullopt;
            }
            return fail_at(tok, StreamError::code::trailing_characters, "Unexpected data after the top-level value");

        case parse_state::done:
        case parse_state::error:
            break;
        }
        return std::nullopt;
    }

    EventParser::step_result EventParser::on_value(token& tok) {
        switch (tok.kind) {
        case token_kind::object_open:
        case token_kind::array_open: {
            if (m_Opts.max_depth != 0 && m_Stack.size() >= m_Opts.max_depth)
                return fail_at(tok, StreamError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            frame f;
            f.is_object = tok.kind == token_kind::object_open;
            m_Stack.push_back(std::move(f));
            m_State = m_Stack.back().is_object ? parse_state::expect_key_or_close : parse_state::expect_array_value_or_close;
            return std::nullopt;
        }
        case token_kind::string:
        case token_kind::number:
        case token_kind::boolean:
        case token_kind::null: {
            event ev;
            ev.path = snapshot_path();
            switch (tok.kind) {
            case token_kind::string: ev.leaf = value{ std::string_view{ tok.text } }; break;
            case token_kind::number: ev.leaf = value{ tok.num }; break;
            case token_kind::boolean: ev.leaf = value{ tok.boolean }; break;
            default: break;
            }
            complete_value();
            return ev;
        }
        default:
            return reject(tok, "a value");
        }
    }

    EventParser::step_result EventParser::on_close(const token& tok, bool object_close) {
        const frame& top = m_Stack.back();
        if (top.after_comma && !m_Opts.allow_trailing_commas)
            return fail_at(tok, StreamError::code::trailing_comma, "Trailing comma before closing bracket");

        const bool empty = top.children == 0;
        m_Stack.pop_back();

        std::optional<event> marker;
        if (empty) {
            // the popped container's own path is the parent's pending slot
            marker.emplace();
            marker->path = snapshot_path();
            if (object_close) marker->leaf = value{ object{} };
            else marker->leaf = value{ array{} };
        }

        complete_value();
        return marker;
    }

    void EventParser::complete_value() {
        if (m_Stack.empty()) {
            m_State = parse_state::expect_end;
            return;
        }

        frame& top = m_Stack.back();
        top.children++;
        top.after_comma = false;
        if (top.is_object) {
            top.has_key = false;
            top.key.clear();
            m_State = parse_state::expect_object_comma_or_close;
        } else {
            top.index++;
            m_State = parse_state::expect_array_comma_or_close;
        }
    }

#pragma endregion

} // namespace JsonStream
