#pragma once


/*
    ----------------------------------------
    JsonStream::Logger - Structured line log
    ----------------------------------------
    A small `key=value` line logger. The library never logs on its own:
    callers opt in by pointing `StreamOptions::logger` at a `Logger`.

    Each line has the form:

        ts_utc=2026-01-01T12:00:00.000Z level=ERROR logger="jsonstream.parser" msg="..." key="value"

    Values are always quoted and escaped, so lines stay machine-parseable
    even when a message carries JSON text.
*/

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

/// @defgroup JsonStreamLog Logging
/// @ingroup JsonStream
/// @brief Opt-in diagnostic logging

namespace JsonStream {

    /// @ingroup JsonStreamLog
    /// @brief Severity of a log line
    enum class LogLevel : uint8_t {
        debug = 0,
        info = 1,
        warn = 2,
        error = 3,
    };

    /// @ingroup JsonStreamLog
    /// @brief A single `key=value` field attached to a log line
    struct LogField {
        std::string_view key;
        std::string_view value;
    };

    inline std::string_view to_string(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warn: return "WARN";
        case LogLevel::error: return "ERROR";
        }
        return "INFO";
    }

    /// @ingroup JsonStreamLog
    /// @brief Parses a level name (`debug`, `info`, `warn`/`warning`, `error`), case-insensitively
    /// @return The level, or `std::nullopt` if @p raw names no level
    inline std::optional<LogLevel> parse_log_level(std::string_view raw) {
        std::string normalized(raw);
        std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (normalized == "debug") return LogLevel::debug;
        if (normalized == "info") return LogLevel::info;
        if (normalized == "warn" || normalized == "warning") return LogLevel::warn;
        if (normalized == "error") return LogLevel::error;
        return std::nullopt;
    }

    /// @ingroup JsonStreamLog
    /// @brief Level-filtered line logger writing to an `std::ostream`
    ///
    /// @details
    /// Not synchronized; share one `Logger` between threads only with
    /// external locking, or give each parse its own.
    class Logger {
    public:
        explicit Logger(LogLevel min_level = LogLevel::info, std::ostream& out = std::cerr)
            : m_MinLevel{ min_level }, m_Out{ &out } {}

        void set_min_level(LogLevel level) noexcept { m_MinLevel = level; }
        [[nodiscard]] LogLevel min_level() const noexcept { return m_MinLevel; }

        [[nodiscard]] bool should_log(LogLevel level) const noexcept {
            return static_cast<int>(level) >= static_cast<int>(m_MinLevel);
        }

        void log(LogLevel level,
                 std::string_view name,
                 std::string_view message,
                 std::initializer_list<LogField> fields = {}) {
            if (!should_log(level)) return;

            (*m_Out) << "ts_utc=" << format_utc_timestamp(std::chrono::system_clock::now())
                     << " level=" << to_string(level)
                     << " logger=" << quote(name)
                     << " msg=" << quote(message);

            for (const auto& field : fields) {
                (*m_Out) << ' ' << field.key << '=' << quote(field.value);
            }

            (*m_Out) << '\n';
            m_Out->flush();
        }

        void debug(std::string_view name, std::string_view message, std::initializer_list<LogField> fields = {}) {
            log(LogLevel::debug, name, message, fields);
        }

        void info(std::string_view name, std::string_view message, std::initializer_list<LogField> fields = {}) {
            log(LogLevel::info, name, message, fields);
        }

        void warn(std::string_view name, std::string_view message, std::initializer_list<LogField> fields = {}) {
            log(LogLevel::warn, name, message, fields);
        }

        void error(std::string_view name, std::string_view message, std::initializer_list<LogField> fields = {}) {
            log(LogLevel::error, name, message, fields);
        }

    private:
        static std::string format_utc_timestamp(std::chrono::system_clock::time_point ts) {
            const auto millis_since_epoch =
                std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
            const auto millis = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

            const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
            std::tm utc_time{};
#if defined(_WIN32)
            if (gmtime_s(&utc_time, &epoch_seconds) != 0) return "";
#else
            if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) return "";
#endif

            std::ostringstream out;
            out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S")
                << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
            return out.str();
        }

        static std::string quote(std::string_view raw) {
            std::string out;
            out.reserve(raw.size() + 2);
            out.push_back('"');
            for (const char c : raw) {
                switch (c) {
                case '\\': out += "\\\\"; break;
                case '"': out += "\\\""; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: out.push_back(c); break;
                }
            }
            out.push_back('"');
            return out;
        }

        LogLevel m_MinLevel = LogLevel::info;
        std::ostream* m_Out = &std::cerr;
    };

} // namespace JsonStream
