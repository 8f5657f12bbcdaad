#include "jsonstream/number.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace JsonStream {

    std::optional<number> number::from_lexeme(std::string_view lexeme) {
        if (lexeme.empty()) return std::nullopt;

        const char* first = lexeme.data();
        const char* last = lexeme.data() + lexeme.size();

        double real = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, real);
        if (ec == std::errc::result_out_of_range) {
            // from_chars leaves the value untouched on overflow/underflow
            std::string copy{ lexeme };
            real = std::strtod(copy.c_str(), nullptr);
        } else if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }

        number out{ real };
        if (lexeme.find_first_of(".eE") == std::string_view::npos) {
            std::int64_t exact = 0;
            auto [iptr, iec] = std::from_chars(first, last, exact);
            if (iec == std::errc{} && iptr == last) out.m_Integer = exact;
        }
        return out;
    }

    bool operator==(const number& lhs, const number& rhs) noexcept {
        if (lhs.m_Integer && rhs.m_Integer) return *lhs.m_Integer == *rhs.m_Integer;
        return lhs.m_Real == rhs.m_Real;
    }

} // namespace JsonStream
