#include "jsonstream/group.hpp"

#include <string>
#include <utility>

#include "jsonstream/assemble.hpp"
#include "jsonstream/log.hpp"


namespace JsonStream {

    Grouper::Grouper(EventParser& parser, std::size_t depth, std::pmr::memory_resource* res)
        : m_Parser{ &parser }, m_Depth{ depth }, m_MemRes{ res } {}

    group Grouper::finalize(group g) {
        m_Yielded++;
        if (auto* logger = m_Parser->options().logger; logger && logger->should_log(LogLevel::debug)) {
            auto prefix = to_string(g.prefix);
            auto count = std::to_string(m_Yielded);
            logger->debug("jsonstream.grouper", "group finalized", {
                { "prefix", prefix },
                { "groups", count },
            });
        }
        return g;
    }

    StreamResult<std::optional<group>> Grouper::next() {
        if (m_Finished) return std::nullopt;

        while (true) {
            auto r = m_Parser->step();
            if (!r) return std::unexpected(std::move(r.error()));

            if (*r) {
                const event& ev = **r;
                m_SawEvent = true;

                if (ev.path.size() < m_Depth) {
                    // above the cut: a scalar is a group of its own, keyed by
                    // its full path; markers only frame the cut groups
                    if (!ev.is_marker())
                        return finalize(group{ ev.path, value{ ev.leaf, m_MemRes } });
                } else {
                    if (!m_Current) {
                        m_Current.emplace();
                        m_Current->prefix.assign(ev.path.begin(), ev.path.begin() + static_cast<std::ptrdiff_t>(m_Depth));
                        m_Current->content = value{ m_MemRes };
                    }
                    merge(m_Current->content, ev, m_Depth);
                }
            }

            if (m_Current && m_Parser->depth() <= m_Depth) {
                group g = std::move(*m_Current);
                m_Current.reset();
                return finalize(std::move(g));
            }

            if (m_Parser->state() == parse_state::done) {
                m_Finished = true;
                if (!m_SawEvent) {
                    const auto end = m_Parser->position();
                    return std::unexpected(StreamError::make(StreamError::code::empty_document, end.offset, end.line, end.column, "No value in stream"));
                }
                return std::nullopt;
            }
        }
    }

    StreamResult<std::vector<group>> grouped(EventParser& parser, std::size_t depth, std::pmr::memory_resource* res) {
        Grouper grouper{ parser, depth, res };
        std::vector<group> out;
        while (true) {
            auto g = grouper.next();
            if (!g) return std::unexpected(std::move(g.error()));
            if (!*g) break;
            out.push_back(std::move(**g));
        }
        return out;
    }

} // namespace JsonStream
