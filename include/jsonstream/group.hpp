#pragma once


/*
    ------------------------------------------------
    JsonStream::Grouper - One sub-document at a time
    ------------------------------------------------
    Cuts a document at a path depth `d` and rebuilds each piece separately.
    Every distinct prefix of `d` path segments becomes one `group`, holding
    the assembled value found under that prefix:

        [{"id":1}, {"id":2}, {"id":3}]   at d = 1   ->   ([0], {"id":1})
                                                         ([1], {"id":2})
                                                         ([2], {"id":3})

    Groups are yielded in document order, each as soon as its closing
    token has been read: the grouper watches the parser's depth after
    every token and finalizes the pending group when it falls back to `d`.
    Only one group is held in memory at a time, which is what makes large
    top-level arrays consumable element by element.

    ----------
    Edge cases
    ----------
    - `d == 0` yields exactly one group with the empty prefix: the whole
      document, as `assembled` would build it
    - A scalar sitting above the cut (path shorter than `d`) is yielded
      on its own, in document order, as a group whose prefix is its full
      path. The prefix is then shorter than `d`, which tells these apart
      from cut groups; a top-level scalar gets the empty prefix. Nothing is
      merged, so array slots taken by cut groups are never padded:

        [1, [2, 3], 4]   at d = 2   ->   ([0], 1)
                                         ([1, 0], 2)
                                         ([1, 1], 3)
                                         ([2], 4)

    - Empty-container markers above the cut describe the framing
      containers only and are dropped, so `[]` at `d = 1` yields no group
    - A document with no events at all fails with `empty_document`
    - Parser errors are passed through; groups yielded before the error
      stay valid
*/

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <vector>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/event.hpp"
#include "jsonstream/parser.hpp"
#include "jsonstream/value.hpp"

/// @defgroup JsonStreamGroup Grouper
/// @ingroup JsonStream
/// @brief Depth-based re-chunking of an event stream

namespace JsonStream {

    /// @ingroup JsonStreamGroup
    /// @brief A prefix and the value assembled under it
    struct group {
        json_path prefix{};
        value content{};

        friend bool operator==(const group& lhs, const group& rhs) {
            return lhs.prefix == rhs.prefix && lhs.content == rhs.content;
        }
    };

    /// @ingroup JsonStreamGroup
    /// @brief Lazy sequence of groups cut at a fixed depth
    ///
    /// @details
    /// Drives @p parser token by token; the parser must not be pulled by
    /// anyone else while the grouper is in use.
    ///
    /// Example:
    /// @code
    /// JsonStream::StreamSource src{ response_body };
    /// JsonStream::EventParser parser{ src };
    /// JsonStream::Grouper rows{ parser, 1 };
    /// while (true) {
    ///     auto g = rows.next();
    ///     if (!g) return g.error();
    ///     if (!*g) break;
    ///     handle_row((*g)->content);
    /// }
    /// @endcode
    class JSONSTREAM_API Grouper {
    public:
        explicit Grouper(EventParser& parser,
                         std::size_t depth = 1,
                         std::pmr::memory_resource* res = std::pmr::get_default_resource());

        Grouper(const Grouper&) = delete;
        Grouper& operator=(const Grouper&) = delete;

        /// @brief Produces the next group
        ///
        /// @return The next group, `std::nullopt` after the last one, or an error
        [[nodiscard]] StreamResult<std::optional<group>> next();

        [[nodiscard]] std::size_t depth() const noexcept { return m_Depth; }

        /// @brief Number of groups yielded so far
        [[nodiscard]] std::size_t yielded() const noexcept { return m_Yielded; }

    private:
        group finalize(group g);

        EventParser* m_Parser;
        std::size_t m_Depth;
        std::pmr::memory_resource* m_MemRes;
        std::optional<group> m_Current{};
        bool m_SawEvent = false;
        bool m_Finished = false;
        std::size_t m_Yielded = 0;
    };

    /// @ingroup JsonStreamGroup
    /// @brief Collects every group of @p parser at @p depth
    [[nodiscard]] JSONSTREAM_API StreamResult<std::vector<group>> grouped(EventParser& parser,
                                                                          std::size_t depth = 1,
                                                                          std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace JsonStream
