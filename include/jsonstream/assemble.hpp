#pragma once


/*
    ------------------------------------------------
    JsonStream::assembled - Events back into a value
    ------------------------------------------------
    Rebuilds the document an event stream describes. Each event is merged
    into a growing tree: intermediate nodes along the path are created as
    objects (key segments) or arrays (index segments), arrays grow to fit
    the index with `null` padding, and the leaf is written at the end of
    the path.

    ------------
    Merge policy
    ------------
    - A scalar leaf replaces whatever sits at its path (last write wins,
      which settles repeated object keys)
    - An empty-container marker only fills a slot that holds nothing
      (`null`) or a scalar; it never wipes a container already built there
    - A node of the wrong kind on the way down is replaced by the kind the
      path needs

    `key_offset` drops that many leading segments from every path before
    merging. The grouper uses it to rebuild a subtree relative to its
    group prefix.

    ------
    Errors
    ------
    Errors of the event source are passed through unchanged. A source that
    produces no event at all yields `empty_document`: an empty body is
    never mistaken for a `null` document.
*/

#include <cstddef>
#include <memory_resource>

#include "jsonstream/config.hpp"
#include "jsonstream/error.hpp"
#include "jsonstream/event.hpp"
#include "jsonstream/value.hpp"

/// @defgroup JsonStreamAssemble Assembler
/// @ingroup JsonStream
/// @brief Reconstruction of values from events

namespace JsonStream {

    /// @ingroup JsonStreamAssemble
    /// @brief Merges a single event into @p root
    ///
    /// @details
    /// New nodes are allocated from `root.resource()`. Events whose path is
    /// shorter than @p key_offset are ignored.
    JSONSTREAM_API void merge(value& root, const event& ev, std::size_t key_offset = 0);

    /// @ingroup JsonStreamAssemble
    /// @brief Drains @p source and rebuilds the value it describes
    ///
    /// @param source      Events of exactly one document.
    /// @param key_offset  Leading path segments to ignore.
    /// @param res         Memory resource of the result.
    /// @return The assembled value, the source's error, or `empty_document`
    [[nodiscard]] JSONSTREAM_API StreamResult<value> assembled(EventSource& source,
                                                               std::size_t key_offset = 0,
                                                               std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace JsonStream
