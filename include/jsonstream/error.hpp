#pragma once


/*
    --------------------------------------------------------
    JsonStream::StreamError - Structured stream error report
    --------------------------------------------------------
    `JsonStream::StreamError` describes a failure that terminated an
    incremental parse. Every stage of the pipeline (chunk source, tokenizer,
    event parser, assembler, grouper) reports failures through it, wrapped
    in `StreamResult<T>` (an alias for `std::expected<T, StreamError>`).

    ----------
    Categories
    ----------
    - `lexical`:
        * The character stream cannot be split into JSON tokens: invalid
          escape, unterminated string, malformed number or literal,
          unexpected character
    - `structural`:
        * Tokens are valid but appear where the grammar forbids them:
          comma before any value, `]` closing an object, end of input
          inside a container, characters after the top-level value
    - `empty_document`:
        * The stream held no value at all (e.g. an empty response body)
          and a caller asked for one
    - `io`:
        * The chunk source itself failed (e.g. a stream read error)

    ------
    Fields
    ------
    - `code errc`:
        * Fine-grained error code; `category()` maps it to one of the
          categories above
    - `size_t offset`:
        * Byte offset into the concatenated input where the error was
          detected. Fragment boundaries never influence it
    - `size_t line`, `size_t column`:
        * 1-based line and column of the same position
    - `std::string path`:
        * Rendered path of the value being parsed when the error occurred
          (e.g. `$.items[3].name`); empty for errors raised outside the
          event parser
    - `std::string msg`:
        * Human-readable description; not stable for programmatic use

    Errors are fatal to the parse that produced them. Events yielded before
    the error remain valid.
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "jsonstream/config.hpp"


/// @defgroup JsonStreamError Stream Errors
/// @ingroup JsonStream
/// @brief Error codes and structures produced while streaming JSON
namespace JsonStream {

    /// @ingroup JsonStreamError
    /// @brief Broad classification of a `StreamError`
    enum class error_category : uint8_t {
        lexical,        ///< Characters do not form valid JSON tokens.
        structural,     ///< Tokens appear in an order the grammar forbids.
        empty_document, ///< No value was present in the stream.
        io,             ///< The chunk source failed.
    };

    /// @ingroup JsonStreamError
    /// @brief Position of a character in the concatenated input
    struct source_position {
        std::size_t offset = 0; ///< Byte offset (0-based).
        std::size_t line = 1;   ///< Line (1-based).
        std::size_t column = 1; ///< Column in bytes (1-based).
    };

    /// @ingroup JsonStreamError
    /// @brief Structured error information produced during streaming.
    ///
    /// @details
    /// A `StreamError` is returned whenever a pull on any pipeline stage
    /// fails. The combination of code, position and path is deterministic
    /// for identical input, regardless of how the input was fragmented.
    struct StreamError {
        /// @ingroup JsonStreamError
        /// @brief Enumeration of the error conditions detected while streaming.
        enum class code : uint8_t {
            // lexical
            unexpected_character,    ///< Character cannot start a token.
            invalid_literal,         ///< Misspelled `true`, `false` or `null`.
            invalid_number,          ///< Number does not match the JSON grammar.
            invalid_string,          ///< Raw control character or invalid UTF-8 in a string.
            invalid_escape,          ///< Unknown escape sequence.
            invalid_unicode_escape,  ///< Bad `\uXXXX` digits or unpaired surrogate.
            unterminated_string,     ///< Input ended inside a string.
            unterminated_comment,    ///< Input ended inside a block comment.
            truncated_token,         ///< Input ended inside a literal.
            // structural
            unexpected_token,        ///< Token not allowed in the current parser state.
            mismatched_close,        ///< `]` closing an object or `}` closing an array.
            unexpected_end_of_input, ///< Input ended inside a container or before a value.
            trailing_comma,          ///< Comma directly before a closing bracket.
            trailing_characters,     ///< Tokens after the complete top-level value.
            depth_limit_exceeded,    ///< Nesting deeper than `StreamOptions::max_depth`.
            // reconstruction
            empty_document,          ///< No events, so no root value exists.
            // source
            source_failure,          ///< The chunk source reported a failure.
        };

        code errc{};          ///< The specific error condition.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string path{};   ///< Rendered path being parsed, if known.
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup JsonStreamError
        /// @brief Constructs a fully-populated `StreamError` instance.
        ///
        /// @param c    The error code.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `StreamError` with an empty path.
        JSONSTREAM_API static StreamError make(code c, size_t o, size_t l, size_t col, std::string_view m);

        /// @ingroup JsonStreamError
        /// @brief Returns the category `errc` belongs to
        [[nodiscard]] JSONSTREAM_API error_category category() const noexcept;

        /// @ingroup JsonStreamError
        /// @brief Formats the error as a single line
        ///
        /// @details
        /// The format is `<code> at line L, column C (offset O)[ in <path>]: <msg>`
        [[nodiscard]] JSONSTREAM_API std::string describe() const;
    };

    /// @ingroup JsonStreamError
    /// @brief Result type of every pull operation in the pipeline
    template<typename T>
    using StreamResult = std::expected<T, StreamError>;

    /// @ingroup JsonStreamError
    /// @brief Returns the snake_case name of an error code
    [[nodiscard]] JSONSTREAM_API std::string_view to_string(StreamError::code c) noexcept;

    /// @ingroup JsonStreamError
    /// @brief Returns the snake_case name of an error category
    [[nodiscard]] JSONSTREAM_API std::string_view to_string(error_category c) noexcept;

} // namespace JsonStream
