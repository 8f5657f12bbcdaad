#pragma once


/*
    ------------------------------------------------------------
    JsonStream - Incremental JSON parsing for streamed responses
    ------------------------------------------------------------

    This is the main public header for JsonStream

    It brings together:
        - Chunk sources:           `StringSource`, `FragmentSource`,
                                   `StreamSource`, `FunctionSource`
        - The resumable lexer:     `JsonStream::Tokenizer`
        - The event parser:        `JsonStream::EventParser`
        - Reconstruction:          `JsonStream::assembled`, `JsonStream::Grouper`
        - The value DOM:           `JsonStream::value`
        - Error reporting types:   `JsonStream::StreamError`
        - Configuration options:   `StreamOptions`, `SourceOptions`,
                                   `WriteOptions`
        - Opt-in logging:          `JsonStream::Logger`

    -------------------
    High-Level Overview
    -------------------
    - Input arrives as text fragments of arbitrary size (network reads,
      file chunks). The tokenizer resumes across fragment boundaries
      anywhere, even inside an escape sequence or a literal
    - The event parser flattens the document into `(path, scalar)` events
      as soon as each scalar has been read
    - `assembled` rebuilds the whole document from the events;
      `Grouper` rebuilds it piecewise, one sub-document per prefix of `d`
      path segments, so a huge top-level array can be processed one
      element at a time
    - Every stage is pull-driven: nothing is read from the source before a
      consumer asks for the next element

    ------------
    Design Goals
    ------------
    - Bounded memory:
        * Only the current token, the container stack and one pending
          group are held; consumed fragments are never retained
    - Determinism:
        * Events, positions and errors are identical for every
          fragmentation of the same text
    - Composability:
        * No global state; sources are plain interfaces, results are
          `std::expected`, allocation is controlled through `std::pmr`

    -----
    Usage
    -----
        #include <jsonstream/jsonstream.hpp>

        int main() {
            JsonStream::StreamSource src{ std::cin };
            JsonStream::EventParser parser{ src };

            JsonStream::Grouper rows{ parser, 1 };
            while (true) {
                auto row = rows.next();
                if (!row) {
                    std::cerr << row.error().describe() << '\n';
                    return 1;
                }
                if (!*row) break;
                std::cout << JsonStream::dump((*row)->content) << '\n';
            }
        }

    Include this header if you want the full JsonStream API. For finer
    grained control or faster build times, include the individual headers
    (`parser.hpp`, `assemble.hpp`, `group.hpp`, ...) directly
*/

/// @defgroup JsonStream JsonStream Library
/// @brief Core types and functions for JsonStream

/// @defgroup JsonStreamAPI Top-level Parsing and Serialization API
/// @ingroup JsonStream
/// @brief Convenient free functions for whole documents

#include <iosfwd>
#include <string>
#include <string_view>

#include "jsonstream/assemble.hpp"
#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/event.hpp"
#include "jsonstream/group.hpp"
#include "jsonstream/log.hpp"
#include "jsonstream/number.hpp"
#include "jsonstream/options.hpp"
#include "jsonstream/parser.hpp"
#include "jsonstream/source.hpp"
#include "jsonstream/tokenizer.hpp"
#include "jsonstream/value.hpp"

namespace JsonStream {

    /// @ingroup JsonStreamAPI
    /// @brief Parses and assembles a complete JSON document held in memory
    ///
    /// @details
    /// Runs the full pipeline (`StringSource` -> `EventParser` ->
    /// `assembled`) over @p input. An empty or whitespace-only input fails
    /// with `empty_document`.
    ///
    /// Example:
    /// @code
    /// auto res = JsonStream::parse(R"({"x":42})");
    /// if (!res) std::cerr << res.error().describe() << '\n';
    /// else std::cout << JsonStream::dump(*res, { .pretty = true });
    /// @endcode
    [[nodiscard]] JSONSTREAM_API StreamResult<value> parse(std::string_view input, const StreamOptions& opts = {});

    /// @ingroup JsonStreamAPI
    /// @brief Parses and assembles a JSON document read from a stream
    ///
    /// @details
    /// The stream is read incrementally in `SourceOptions::chunk_size`
    /// pieces; a syntax error stops reading at the offending token.
    [[nodiscard]] JSONSTREAM_API StreamResult<value> parse(std::istream& is,
                                                           const StreamOptions& opts = {},
                                                           const SourceOptions& source_opts = {});

    /// @ingroup JsonStreamAPI
    /// @brief Serializes a value to a string
    ///
    /// @details
    /// Integers are written exactly, other numbers in shortest round-trip
    /// form; non-finite numbers are written as `null`. Object members come
    /// out in key order.
    ///
    /// @param v The DOM value to serialize
    /// @param opts Formatting options
    /// @return UTF-8 JSON text
    [[nodiscard]] JSONSTREAM_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup JsonStreamAPI
    /// @brief Serializes a value to an output stream
    JSONSTREAM_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup JsonStreamAPI
    /// @brief Writes the compact serialization of @p v
    JSONSTREAM_API std::ostream& operator<<(std::ostream& os, const value& v);

} // namespace JsonStream
