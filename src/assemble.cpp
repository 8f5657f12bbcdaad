#include "jsonstream/assemble.hpp"

#include <utility>


namespace JsonStream {

    void merge(value& root, const event& ev, std::size_t key_offset) {
        const auto& path = ev.path;
        if (path.size() < key_offset) return;

        value* node = &root;
        for (std::size_t i = key_offset; i < path.size(); i++) {
            const auto& seg = path[i];
            if (seg.is_key()) node = &(*node)[std::string_view{ seg.key() }];
            else node = &(*node)[seg.index()];
        }

        if (ev.leaf.is_scalar() || node->is_scalar())
            *node = value{ ev.leaf, root.resource() };
    }

    StreamResult<value> assembled(EventSource& source, std::size_t key_offset, std::pmr::memory_resource* res) {
        value root{ res };
        bool any = false;

        while (true) {
            auto ev = source.next();
            if (!ev) return std::unexpected(std::move(ev.error()));
            if (!*ev) break;
            merge(root, **ev, key_offset);
            any = true;
        }

        if (!any) {
            const auto end = source.position();
            return std::unexpected(StreamError::make(StreamError::code::empty_document, end.offset, end.line, end.column, "No value in stream"));
        }
        return root;
    }

} // namespace JsonStream
