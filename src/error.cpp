#include "jsonstream/error.hpp"

namespace JsonStream {

    StreamError StreamError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        StreamError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    error_category StreamError::category() const noexcept {
        switch (errc) {
        case code::unexpected_character:
        case code::invalid_literal:
        case code::invalid_number:
        case code::invalid_string:
        case code::invalid_escape:
        case code::invalid_unicode_escape:
        case code::unterminated_string:
        case code::unterminated_comment:
        case code::truncated_token:
            return error_category::lexical;
        case code::unexpected_token:
        case code::mismatched_close:
        case code::unexpected_end_of_input:
        case code::trailing_comma:
        case code::trailing_characters:
        case code::depth_limit_exceeded:
            return error_category::structural;
        case code::empty_document:
            return error_category::empty_document;
        case code::source_failure:
            return error_category::io;
        }
        return error_category::structural;
    }

    std::string StreamError::describe() const {
        std::string out{ to_string(errc) };
        out += " at line ";
        out += std::to_string(line);
        out += ", column ";
        out += std::to_string(column);
        out += " (offset ";
        out += std::to_string(offset);
        out += ')';
        if (!path.empty()) {
            out += " in ";
            out += path;
        }
        out += ": ";
        out += msg;
        return out;
    }

    std::string_view to_string(StreamError::code c) noexcept {
        using code = StreamError::code;
        switch (c) {
        case code::unexpected_character: return "unexpected_character";
        case code::invalid_literal: return "invalid_literal";
        case code::invalid_number: return "invalid_number";
        case code::invalid_string: return "invalid_string";
        case code::invalid_escape: return "invalid_escape";
        case code::invalid_unicode_escape: return "invalid_unicode_escape";
        case code::unterminated_string: return "unterminated_string";
        case code::unterminated_comment: return "unterminated_comment";
        case code::truncated_token: return "truncated_token";
        case code::unexpected_token: return "unexpected_token";
        case code::mismatched_close: return "mismatched_close";
        case code::unexpected_end_of_input: return "unexpected_end_of_input";
        case code::trailing_comma: return "trailing_comma";
        case code::trailing_characters: return "trailing_characters";
        case code::depth_limit_exceeded: return "depth_limit_exceeded";
        case code::empty_document: return "empty_document";
        case code::source_failure: return "source_failure";
        }
        return "unknown";
    }

    std::string_view to_string(error_category c) noexcept {
        switch (c) {
        case error_category::lexical: return "lexical";
        case error_category::structural: return "structural";
        case error_category::empty_document: return "empty_document";
        case error_category::io: return "io";
        }
        return "unknown";
    }

} // namespace JsonStream
