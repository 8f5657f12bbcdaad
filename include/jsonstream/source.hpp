#pragma once


/*
    ------------------------------------------------
    JsonStream chunk sources - where text comes from
    ------------------------------------------------
    A `ChunkSource` is the pipeline's only input: a pull-based, possibly
    blocking sequence of text fragments. Fragment boundaries carry no
    meaning; the tokenizer resumes across any of them, including the middle
    of a string escape or a literal such as `true`.

    `next()` returns:
        - a fragment, valid until the following call to `next()`
        - `std::nullopt` once the source is exhausted
        - a `StreamError` with code `source_failure` if reading failed

    Sources are borrowed by the tokenizer, never owned: whoever owns the
    underlying socket or stream closes it, whether or not the event stream
    was drained.

    Implementations shipped with the library:
        - `StringSource`:   a complete text, optionally cut into fixed slices
        - `FragmentSource`: an explicit list of fragments
        - `StreamSource`:   `std::istream`, read in `chunk_size` pieces that
                            never split a multi-byte UTF-8 sequence
        - `FunctionSource`: any pull callback (e.g. an HTTP body reader)
*/

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/options.hpp"

/// @defgroup JsonStreamSource Chunk Sources
/// @ingroup JsonStream
/// @brief Suppliers of text fragments for the tokenizer

namespace JsonStream {

    /// @ingroup JsonStreamSource
    /// @brief Pull interface supplying text fragments of arbitrary size
    class JSONSTREAM_API ChunkSource {
    public:
        virtual ~ChunkSource() = default;

        /// @brief Pulls the next fragment
        ///
        /// @return The next fragment (valid until the next call), `std::nullopt`
        ///         when exhausted, or a `source_failure` error
        [[nodiscard]] virtual StreamResult<std::optional<std::string_view>> next() = 0;
    };

    /// @ingroup JsonStreamSource
    /// @brief Serves a complete text, whole or in fixed-size slices
    ///
    /// @details
    /// With `chunk_size == 0` the text is served as a single fragment.
    /// Otherwise it is served in slices of at most `chunk_size` bytes, which
    /// makes it easy to reproduce any fragmentation in tests. The text is
    /// copied, so the source does not depend on the caller's buffer.
    class JSONSTREAM_API StringSource final : public ChunkSource {
    public:
        explicit StringSource(std::string text, std::size_t chunk_size = 0);

        [[nodiscard]] StreamResult<std::optional<std::string_view>> next() override;

    private:
        std::string m_Text;
        std::size_t m_ChunkSize;
        std::size_t m_Pos = 0;
        bool m_Served = false;
    };

    /// @ingroup JsonStreamSource
    /// @brief Serves an explicit, ordered list of fragments
    class JSONSTREAM_API FragmentSource final : public ChunkSource {
    public:
        explicit FragmentSource(std::vector<std::string> fragments);

        [[nodiscard]] StreamResult<std::optional<std::string_view>> next() override;

    private:
        std::vector<std::string> m_Fragments;
        std::size_t m_Index = 0;
    };

    /// @ingroup JsonStreamSource
    /// @brief Reads fragments from an `std::istream`
    ///
    /// @details
    /// Each call reads up to `SourceOptions::chunk_size` bytes. If a read ends
    /// inside a multi-byte UTF-8 sequence, the incomplete tail is held back
    /// and prepended to the next fragment, so every fragment is a run of
    /// whole code points (invalid lead bytes are passed through untouched;
    /// the tokenizer reports them).
    ///
    /// A stream that goes `bad()` produces a `source_failure` error. The
    /// stream is borrowed and must outlive the source.
    class JSONSTREAM_API StreamSource final : public ChunkSource {
    public:
        explicit StreamSource(std::istream& is, const SourceOptions& opts = {});

        [[nodiscard]] StreamResult<std::optional<std::string_view>> next() override;

        /// @brief Total number of bytes read from the stream so far
        [[nodiscard]] std::size_t bytes_read() const noexcept { return m_BytesRead; }

    private:
        std::istream* m_Stream;
        std::size_t m_ChunkSize;
        std::string m_Buffer;
        std::string m_Carry;
        std::size_t m_BytesRead = 0;
        bool m_Eof = false;
    };

    /// @ingroup JsonStreamSource
    /// @brief Adapts a pull callback into a chunk source
    ///
    /// @details
    /// The callback returns the next fragment, `std::nullopt` when done, or an
    /// error which is passed through unchanged. It is not called again once
    /// it signalled the end.
    class JSONSTREAM_API FunctionSource final : public ChunkSource {
    public:
        using pull_fn = std::function<StreamResult<std::optional<std::string>>()>;

        explicit FunctionSource(pull_fn pull);

        [[nodiscard]] StreamResult<std::optional<std::string_view>> next() override;

    private:
        pull_fn m_Pull;
        std::string m_Current;
        bool m_Done = false;
    };

    /// @ingroup JsonStreamSource
    /// @brief Number of bytes at the end of @p text that form an incomplete UTF-8 sequence
    ///
    /// @details
    /// Returns 0 when @p text ends on a code point boundary, or when the tail
    /// is not a valid sequence prefix at all.
    [[nodiscard]] JSONSTREAM_API std::size_t incomplete_utf8_tail(std::string_view text) noexcept;

} // namespace JsonStream
