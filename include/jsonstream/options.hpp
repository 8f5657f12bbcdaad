#pragma once


/*
    --------------------------------------
    JsonStream streaming and write options
    --------------------------------------
    This header defines configuration structures that control parsing
    (text -> events), chunk sources (stream -> fragments) and writing
    (value -> JSON text)

    -----------------------------------------
    Stream Options - JsonStream::StreamOptions
    -----------------------------------------
    - `bool allow_comments`:
        * When true, the tokenizer skips line (`// ...`) and block
          (`/ * ... * /`) comments wherever whitespace is allowed
        * When false (strict JSON), a `/` is an `unexpected_character`
    - `bool allow_trailing_commas`:
        * When true, `[1,2,]` and `{"a": 1,}` are accepted
        * When false, the closing bracket fails with `trailing_comma`
    - `size_t max_depth`:
        * Limit on nesting depth of arrays/objects, 0 for no limit
        * If exceeded, the parser fails with `depth_limit_exceeded`
    - `Logger* logger`:
        * Optional diagnostics sink; parse failures and group boundaries
          are reported to it. Null (default) keeps the library silent

    -----------------------------------------
    Source Options - JsonStream::SourceOptions
    -----------------------------------------
    - `size_t chunk_size`:
        * Maximum number of bytes `StreamSource` reads per fragment

    ---------------------------------------
    Write Options - JsonStream::WriteOptions
    ---------------------------------------
    - `bool pretty`: indented, multi-line output when true
    - `size_t indent`: spaces per nesting level in pretty mode

    All option structures are plain aggregates suitable for brace
    initialization:

        JsonStream::EventParser parser{ source, { .allow_comments = true, .max_depth = 64 } };
*/


#include <cstddef>

/// @defgroup JsonStreamOptions Streaming and Writing Options
/// @ingroup JsonStream
/// @brief Configuration objects controlling parsing, sources and serialization

namespace JsonStream {

    class Logger;

    /// @ingroup JsonStreamOptions
    /// @brief Configuration controlling tokenizing and event parsing
    ///
    /// @details
    /// Defaults are strict RFC 8259 with no depth limit and no logging.
    struct StreamOptions {
        bool allow_comments = false;        ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        size_t max_depth = 0;               ///< Maximum allowed nesting depth (0 = unlimited)
        Logger* logger = nullptr;           ///< Diagnostics sink, not owned (nullptr = silent)
    };

    /// @ingroup JsonStreamOptions
    /// @brief Configuration of the library's chunk sources
    struct SourceOptions {
        std::size_t chunk_size = 4096; ///< Bytes read per fragment.
    };

    /// @ingroup JsonStreamOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    struct WriteOptions {
        bool pretty = false;    ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2; ///< Number of spaces per indentation level.
    };

} // namespace JsonStream
