#pragma once


/*
    --------------------------------------
    JsonStream::number - JSON number value
    --------------------------------------
    JSON leaves number precision to the implementation. `number` keeps:
        - the value as a `double`, always
        - the exact value as `std::int64_t`, when the lexical form has no
          fraction and no exponent and fits the range

    Equality compares the exact integers when both sides have one and the
    doubles otherwise, so `1` and `1.0` compare equal while
    `9007199254740993` and `9007199254740992` do not.
*/

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

#include "jsonstream/config.hpp"

namespace JsonStream {

    /// @ingroup JsonStreamValue
    /// @brief A JSON number: a double plus, where representable, the exact integer
    class number {
    public:
        constexpr number() noexcept = default;

        /// @brief Constructs a non-integral number from a double
        constexpr explicit number(double d) noexcept : m_Real{ d } {}

        /// @brief Constructs an integral number
        ///
        /// @details
        /// The exact integer is kept when it fits in `int64_t`; larger
        /// unsigned values are held as a double only.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        constexpr explicit number(I i) noexcept
            : m_Real{ static_cast<double>(i) } {
            if constexpr (std::is_unsigned_v<I>) {
                if (i <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                    m_Integer = static_cast<std::int64_t>(i);
            } else {
                m_Integer = static_cast<std::int64_t>(i);
            }
        }

        /// @brief Parses the lexical form of a JSON number
        ///
        /// @details
        /// The lexeme is assumed to already match the JSON number grammar
        /// (the tokenizer guarantees it). Magnitudes beyond the double range
        /// saturate to infinity, as `strtod` does.
        ///
        /// @return The number, or `std::nullopt` if @p lexeme holds no number at all
        [[nodiscard]] JSONSTREAM_API static std::optional<number> from_lexeme(std::string_view lexeme);

        [[nodiscard]] constexpr bool is_integer() const noexcept { return m_Integer.has_value(); }
        [[nodiscard]] constexpr double as_double() const noexcept { return m_Real; }
        [[nodiscard]] constexpr std::optional<std::int64_t> as_integer() const noexcept { return m_Integer; }

        JSONSTREAM_API friend bool operator==(const number& lhs, const number& rhs) noexcept;

    private:
        double m_Real{};
        std::optional<std::int64_t> m_Integer{};
    };

} // namespace JsonStream
