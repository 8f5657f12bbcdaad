#include "jsonstream/source.hpp"

#include <algorithm>
#include <istream>
#include <utility>

namespace JsonStream {

    StringSource::StringSource(std::string text, std::size_t chunk_size)
        : m_Text{ std::move(text) }, m_ChunkSize{ chunk_size } {}

    StreamResult<std::optional<std::string_view>> StringSource::next() {
        if (m_ChunkSize == 0) {
            if (m_Served || m_Text.empty()) return std::nullopt;
            m_Served = true;
            return std::string_view{ m_Text };
        }

        if (m_Pos >= m_Text.size()) return std::nullopt;
        std::size_t n = std::min(m_ChunkSize, m_Text.size() - m_Pos);
        std::string_view out{ m_Text.data() + m_Pos, n };
        m_Pos += n;
        return out;
    }

    FragmentSource::FragmentSource(std::vector<std::string> fragments)
        : m_Fragments{ std::move(fragments) } {}

    StreamResult<std::optional<std::string_view>> FragmentSource::next() {
        if (m_Index >= m_Fragments.size()) return std::nullopt;
        return std::string_view{ m_Fragments[m_Index++] };
    }

    StreamSource::StreamSource(std::istream& is, const SourceOptions& opts)
        : m_Stream{ &is }, m_ChunkSize{ std::max<std::size_t>(opts.chunk_size, 1) } {}

    StreamResult<std::optional<std::string_view>> StreamSource::next() {
        while (!m_Eof) {
            m_Buffer = std::move(m_Carry);
            m_Carry.clear();

            std::size_t start = m_Buffer.size();
            m_Buffer.resize(start + m_ChunkSize);
            m_Stream->read(m_Buffer.data() + start, static_cast<std::streamsize>(m_ChunkSize));
            auto n = static_cast<std::size_t>(m_Stream->gcount());
            m_Buffer.resize(start + n);
            m_BytesRead += n;

            if (m_Stream->bad()) {
                m_Eof = true;
                return std::unexpected(StreamError::make(StreamError::code::source_failure, m_BytesRead, 0, 0, "Input stream read failed"));
            }

            if (n < m_ChunkSize) {
                // Short read: end of stream, whatever is buffered goes out as is
                m_Eof = true;
            } else {
                std::size_t tail = incomplete_utf8_tail(m_Buffer);
                m_Carry.assign(m_Buffer, m_Buffer.size() - tail, tail);
                m_Buffer.resize(m_Buffer.size() - tail);
            }

            if (!m_Buffer.empty()) return std::string_view{ m_Buffer };
        }
        return std::nullopt;
    }

    FunctionSource::FunctionSource(pull_fn pull)
        : m_Pull{ std::move(pull) } {}

    StreamResult<std::optional<std::string_view>> FunctionSource::next() {
        if (m_Done) return std::nullopt;
        auto r = m_Pull();
        if (!r) return std::unexpected(std::move(r.error()));
        if (!*r) {
            m_Done = true;
            return std::nullopt;
        }
        m_Current = std::move(**r);
        return std::string_view{ m_Current };
    }

    std::size_t incomplete_utf8_tail(std::string_view text) noexcept {
        const std::size_t n = text.size();
        const std::size_t limit = std::min<std::size_t>(n, 3);
        for (std::size_t i = 1; i <= limit; i++) {
            auto c = static_cast<unsigned char>(text[n - i]);
            if ((c & 0xC0) == 0x80) continue;

            std::size_t need = 0;
            if (c >= 0xC2 && c <= 0xDF) need = 2;
            else if (c >= 0xE0 && c <= 0xEF) need = 3;
            else if (c >= 0xF0 && c <= 0xF4) need = 4;
            else return 0;

            return i < need ? i : 0;
        }
        return 0;
    }

} // namespace JsonStream
