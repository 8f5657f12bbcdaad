#pragma once


/*
    -------------------------------------------
    JsonStream events - paths and scalar leaves
    -------------------------------------------
    The event parser turns a document into a flat sequence of events, one
    per scalar, each carrying the full path from the root:

        {"a":[1,{"b":2}]}   ->   (["a", 0], 1)
                                 (["a", 1, "b"], 2)

    A path is a `json_path`, a root-to-leaf list of `path_segment`s (object
    key or array index). It is empty for a top-level scalar. Every event owns
    its path; nothing aliases the parser's live stack.

    ----------------------
    Empty-container marker
    ----------------------
    A container that closes without children would otherwise leave no
    trace in the event stream. For those, and only those, the parser emits
    a marker event at the container's own path whose leaf is an empty array
    or object:

        {"a":[],"b":{}}     ->   (["a"], [])
                                 (["b"], {})

    Consumers that only care about scalars can skip events whose leaf
    `is_scalar()` returns false.

    ------------
    EventSource
    ------------
    `EventSource` is the pull interface shared by the parser and by
    `EventList` (a recorded sequence). The assembler and `collect` accept
    any `EventSource`.
*/

#include <concepts>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/value.hpp"

/// @defgroup JsonStreamEvents Events
/// @ingroup JsonStream
/// @brief Path/leaf events produced by the event parser

namespace JsonStream {

    /// @ingroup JsonStreamEvents
    /// @brief One step of a path: an object key or an array index
    struct path_segment {
        std::variant<std::string, std::size_t> data;

        path_segment(std::string key) : data{ std::move(key) } {}
        path_segment(const char* key) : data{ std::string{ key } } {}
        path_segment(std::string_view key) : data{ std::string{ key } } {}

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        path_segment(I index) : data{ static_cast<std::size_t>(index) } {}

        [[nodiscard]] bool is_key() const noexcept { return data.index() == 0; }
        [[nodiscard]] bool is_index() const noexcept { return data.index() == 1; }

        [[nodiscard]] const std::string& key() const { return std::get<std::string>(data); }
        [[nodiscard]] std::size_t index() const { return std::get<std::size_t>(data); }

        friend bool operator==(const path_segment&, const path_segment&) = default;
    };

    /// @ingroup JsonStreamEvents
    /// @brief Root-to-leaf location of a value; empty at the root
    using json_path = std::vector<path_segment>;

    /// @ingroup JsonStreamEvents
    /// @brief Renders a path as `$`, `$.a[0]`, `$["key with spaces"]`
    [[nodiscard]] JSONSTREAM_API std::string to_string(const json_path& path);

    JSONSTREAM_API std::ostream& operator<<(std::ostream& os, const path_segment& seg);

    /// @ingroup JsonStreamEvents
    /// @brief A scalar (or empty-container marker) together with its path
    struct event {
        json_path path{};
        value leaf{};

        /// @brief Checks whether this is an empty-container marker
        [[nodiscard]] bool is_marker() const noexcept { return !leaf.is_scalar(); }

        friend bool operator==(const event& lhs, const event& rhs) {
            return lhs.path == rhs.path && lhs.leaf == rhs.leaf;
        }
    };

    /// @ingroup JsonStreamEvents
    /// @brief Pull interface producing events in document order
    class JSONSTREAM_API EventSource {
    public:
        virtual ~EventSource() = default;

        /// @brief Pulls the next event
        ///
        /// @return The next event, `std::nullopt` once the document is
        ///         complete, or the error that terminated the stream
        [[nodiscard]] virtual StreamResult<std::optional<event>> next() = 0;

        /// @brief Position reached in the underlying text
        ///
        /// @details
        /// Sources not backed by text stay at the start of input.
        [[nodiscard]] virtual source_position position() const noexcept { return {}; }
    };

    /// @ingroup JsonStreamEvents
    /// @brief Replays a recorded sequence of events
    ///
    /// @details
    /// Handy for feeding hand-written or previously collected events to the
    /// assembler. No validation is performed: out-of-order indices are
    /// padded with nulls when assembled.
    class JSONSTREAM_API EventList final : public EventSource {
    public:
        EventList() = default;
        explicit EventList(std::vector<event> events) : m_Events{ std::move(events) } {}

        [[nodiscard]] StreamResult<std::optional<event>> next() override;

        [[nodiscard]] std::size_t size() const noexcept { return m_Events.size(); }

    private:
        std::vector<event> m_Events{};
        std::size_t m_Index = 0;
    };

    /// @ingroup JsonStreamEvents
    /// @brief Drains @p source into a vector
    ///
    /// @return Every event in order, or the error that terminated the source
    [[nodiscard]] JSONSTREAM_API StreamResult<std::vector<event>> collect(EventSource& source);

} // namespace JsonStream
