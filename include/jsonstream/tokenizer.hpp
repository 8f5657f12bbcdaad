#pragma once


/*
    --------------------------------------------
    JsonStream::Tokenizer - Resumable JSON lexer
    --------------------------------------------
    Turns the fragments of a `ChunkSource` into JSON tokens, one token per
    call to `next()`:

        { } [ ] : ,  string  number  true/false  null  end_of_input

    -------------
    Resumability
    -------------
    The tokenizer reads characters through a cursor that pulls the next
    fragment from the source whenever the current one runs out. A token may
    therefore straddle any number of fragments (an escaped surrogate pair
    split after every character still decodes to one code point). Only the token
    under construction is buffered; consumed fragments are never retained.

    Truncation is reported lazily: a fragment ending in `"abc` is not an
    error, the source running dry afterwards is (`unterminated_string`).
    A source that yields no fragments, or only whitespace, produces a single
    `end_of_input` token and no error.

    ---------
    Positions
    ---------
    Every token records the position of its first character as a byte
    offset plus 1-based line and column, counted over the concatenation of
    all fragments. Positions, and therefore error reports, do not depend on
    how the text was fragmented.

    --------
    Strings
    --------
    - Escapes `\" \\ \/ \b \f \n \r \t \uXXXX` are resolved
    - UTF-16 surrogate pairs combine into one code point; an unpaired
      surrogate is an `invalid_unicode_escape`
    - Raw control characters and invalid UTF-8 are `invalid_string`

    --------
    Numbers
    --------
    Recognized per RFC 8259 (optional `-`, no leading zeros, optional
    fraction and exponent). The token keeps the lexical form in `text` and
    the parsed `number` in `num`.
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/number.hpp"
#include "jsonstream/options.hpp"
#include "jsonstream/source.hpp"

/// @defgroup JsonStreamLexer Tokenizer
/// @ingroup JsonStream
/// @brief Resumable lexer over chunk sources

namespace JsonStream {

    /// @ingroup JsonStreamLexer
    /// @brief Kinds of JSON tokens
    enum class token_kind : uint8_t {
        object_open,  ///< `{`
        object_close, ///< `}`
        array_open,   ///< `[`
        array_close,  ///< `]`
        colon,        ///< `:`
        comma,        ///< `,`
        string,       ///< String literal, decoded into `text`
        number,       ///< Number literal, lexical form in `text`, value in `num`
        boolean,      ///< `true` or `false`, value in `boolean`
        null,         ///< `null`
        end_of_input, ///< The source is exhausted
    };

    /// @ingroup JsonStreamLexer
    /// @brief A single lexical token
    struct token {
        token_kind kind = token_kind::end_of_input;
        std::string text{};         ///< Decoded string, or lexical form of numbers and literals.
        bool boolean = false;       ///< Value of a `boolean` token.
        number num{};               ///< Value of a `number` token.
        source_position position{}; ///< Position of the token's first character.

        /// @brief Checks whether the token is a string, number, boolean or null
        [[nodiscard]] bool is_scalar() const noexcept {
            return kind == token_kind::string || kind == token_kind::number
                || kind == token_kind::boolean || kind == token_kind::null;
        }
    };

    /// @ingroup JsonStreamLexer
    /// @brief Returns a short display name of a token kind (e.g. `'{'`, `string`)
    [[nodiscard]] JSONSTREAM_API std::string_view to_string(token_kind k) noexcept;

    /// @ingroup JsonStreamLexer
    /// @brief Pull-driven, resumable JSON tokenizer
    ///
    /// @details
    /// The tokenizer borrows its source; the source must outlive it. After
    /// an error every further call returns the same error. After
    /// `end_of_input` every further call returns `end_of_input` again.
    ///
    /// Example:
    /// @code
    /// JsonStream::FragmentSource src{ { "[tr", "ue, 1", "2]" } };
    /// JsonStream::Tokenizer lexer{ src };
    /// while (true) {
    ///     auto tok = lexer.next();
    ///     if (!tok) { std::cerr << tok.error().describe() << '\n'; break; }
    ///     if (tok->kind == JsonStream::token_kind::end_of_input) break;
    ///     std::cout << JsonStream::to_string(tok->kind) << '\n';
    /// }
    /// @endcode
    class JSONSTREAM_API Tokenizer {
    public:
        explicit Tokenizer(ChunkSource& source, const StreamOptions& opts = {});

        Tokenizer(const Tokenizer&) = delete;
        Tokenizer& operator=(const Tokenizer&) = delete;

        /// @brief Produces the next token
        ///
        /// @return The token (`end_of_input` once the source is exhausted),
        ///         or a lexical / io error
        [[nodiscard]] StreamResult<token> next();

        /// @brief Position of the next unread character
        [[nodiscard]] source_position position() const noexcept { return m_Position; }

    private:
        using expected_void = StreamResult<void>;

        // cursor
        [[nodiscard]] bool eof();
        [[nodiscard]] char peek();
        char get();
        bool consume(char c);
        [[nodiscard]] bool fill();

        [[nodiscard]] StreamError make_error(StreamError::code code, std::string_view msg) const;

        expected_void skip_ws_and_comments();
        expected_void read_literal(token& tok, std::string_view literal);
        expected_void read_string(token& tok);
        expected_void read_number(token& tok);
        StreamResult<uint16_t> read_hex4();

        ChunkSource* m_Source;
        StreamOptions m_Opts;
        std::string_view m_Chunk{};
        std::size_t m_ChunkPos = 0;
        bool m_Exhausted = false;
        std::optional<StreamError> m_SourceError{};
        std::optional<StreamError> m_Failed{};
        source_position m_Position{};
    };

} // namespace JsonStream
