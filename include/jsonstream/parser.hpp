#pragma once


/*
    ----------------------------------------------------
    JsonStream::EventParser - Streaming path/leaf parser
    ----------------------------------------------------
    A pushdown automaton over the tokenizer's tokens. It keeps one frame per
    open container (its kind, the pending key or current index and a child
    count) and emits an `event` for every scalar it reads, with the path
    built from those frames.

    ------
    States
    ------
        expect_value                  value after `:`, or the top-level value
        expect_key_or_close           after `{` or an object `,`
        expect_colon                  after an object key
        expect_object_comma_or_close  after an object member
        expect_array_value_or_close   after `[` or an array `,`
        expect_array_comma_or_close   after an array element
        expect_end                    top-level value complete, only
                                      whitespace may follow
        done                          input exhausted cleanly
        error                         a failure was reported (terminal)

    -------------
    Pull contract
    -------------
    - `next()` reads tokens until it can return an event, the end of the
      document (`std::nullopt`) or an error
    - `step()` reads exactly one token and returns the event it produced,
      if any. Together with `depth()` it lets a consumer observe container
      closes as they happen, without reading ahead (see `Grouper`)

    Nothing is read before it is asked for: the parser never pulls a
    fragment from the source unless the current token needs it.

    ------
    Errors
    ------
    The first failure moves the parser to `error`; that failure is returned
    by every further pull. Structural errors carry the position of the
    offending token and the path being parsed:

        {"a": }   ->   unexpected_token at offset 6 in $.a

    An empty (or whitespace-only) input is not an error here: it produces
    no events and `done`. Whether that is acceptable is the consumer's
    decision (`assembled` reports `empty_document`).
*/

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/event.hpp"
#include "jsonstream/options.hpp"
#include "jsonstream/source.hpp"
#include "jsonstream/tokenizer.hpp"

/// @defgroup JsonStreamParser Event Parser
/// @ingroup JsonStream
/// @brief Token stream to path/leaf events

namespace JsonStream {

    /// @ingroup JsonStreamParser
    /// @brief States of the event parser
    enum class parse_state : uint8_t {
        expect_value,
        expect_key_or_close,
        expect_colon,
        expect_object_comma_or_close,
        expect_array_value_or_close,
        expect_array_comma_or_close,
        expect_end,
        done,
        error,
    };

    /// @ingroup JsonStreamParser
    /// @brief Returns the snake_case name of a parser state
    [[nodiscard]] JSONSTREAM_API std::string_view to_string(parse_state s) noexcept;

    /// @ingroup JsonStreamParser
    /// @brief Incremental JSON parser producing path/leaf events
    ///
    /// @details
    /// The parser borrows @p source, which must outlive it. One parser
    /// handles one document; it is neither copyable nor reusable.
    ///
    /// Example:
    /// @code
    /// JsonStream::StringSource src{ R"({"a":[1,{"b":2}]})" };
    /// JsonStream::EventParser parser{ src };
    /// while (true) {
    ///     auto ev = parser.next();
    ///     if (!ev) { std::cerr << ev.error().describe() << '\n'; break; }
    ///     if (!*ev) break;
    ///     std::cout << JsonStream::to_string((*ev)->path) << '\n';   // $.a[0], $.a[1].b
    /// }
    /// @endcode
    class JSONSTREAM_API EventParser final : public EventSource {
    public:
        explicit EventParser(ChunkSource& source, const StreamOptions& opts = {});

        EventParser(const EventParser&) = delete;
        EventParser& operator=(const EventParser&) = delete;

        /// @brief Produces the next event
        ///
        /// @return The next event, `std::nullopt` when the document is
        ///         complete, or the error that terminated the parse
        [[nodiscard]] StreamResult<std::optional<event>> next() override;

        /// @brief Consumes exactly one token
        ///
        /// @return The event produced by that token, `std::nullopt` if the
        ///         token produced none (check `state()` for `done`), or an error
        [[nodiscard]] StreamResult<std::optional<event>> step();

        [[nodiscard]] parse_state state() const noexcept { return m_State; }

        /// @brief Number of currently open containers
        [[nodiscard]] std::size_t depth() const noexcept { return m_Stack.size(); }

        /// @brief Path of the value currently being parsed
        ///
        /// @details
        /// Array frames contribute the index of the element being (or about
        /// to be) parsed; object frames contribute their pending key. A
        /// container between two members (after a value, before `,` or the
        /// close) contributes nothing, so the path names the container.
        [[nodiscard]] json_path current_path() const;

        /// @brief Position of the next unread character
        [[nodiscard]] source_position position() const noexcept override { return m_Tokenizer.position(); }

        [[nodiscard]] const StreamOptions& options() const noexcept { return m_Opts; }

    private:
        struct frame {
            bool is_object = false;
            bool has_key = false;
            bool after_comma = false;
            std::string key{};
            std::size_t index = 0;
            std::size_t children = 0;
        };

        using step_result = StreamResult<std::optional<event>>;

        step_result on_value(token& tok);
        step_result on_close(const token& tok, bool object_close);
        void complete_value();
        [[nodiscard]] json_path snapshot_path() const;

        step_result fail(StreamError err);
        step_result fail_at(const token& tok, StreamError::code code, std::string_view msg);
        step_result reject(const token& tok, std::string_view expecting);

        StreamOptions m_Opts;
        Tokenizer m_Tokenizer;
        std::vector<frame> m_Stack{};
        parse_state m_State = parse_state::expect_value;
        std::optional<StreamError> m_Error{};
    };

} // namespace JsonStream
