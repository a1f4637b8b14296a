#pragma once

#include <iostream>
#include <ostream>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace RollTftp::Meta {
    enum class LogLevel : unsigned char {
        debug,
        info,
        warning,
        fatal,
        silent
    };

    [[nodiscard]] constexpr std::string_view toLevelName(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info: return "INFO";
            case LogLevel::warning: return "WARNING";
            case LogLevel::fatal: return "FATAL";
            default: return "LOG";
        }
    }

    /**
     * @brief Leveled line logger for the daemon. Every line is prefixed with the tag and level, e.g. `rolltftpd [INFO]: ...`.
     * @note Not synchronized: the reactor thread is the only writer.
     */
    class Logger {
    private:
        std::ostream* m_out;
        std::string_view m_tag;
        LogLevel m_threshold;

    public:
        Logger() noexcept
        : m_out {&std::cout}, m_tag {"rolltftpd"}, m_threshold {LogLevel::info} {}

        Logger(std::ostream& out, std::string_view tag, LogLevel threshold) noexcept
        : m_out {&out}, m_tag {tag}, m_threshold {threshold} {}

        [[nodiscard]] constexpr LogLevel getThreshold() const noexcept {
            return m_threshold;
        }

        void setThreshold(LogLevel threshold) noexcept {
            m_threshold = threshold;
        }

        [[nodiscard]] constexpr bool isEnabled(LogLevel level) const noexcept {
            return m_threshold != LogLevel::silent and level >= m_threshold;
        }

        template <LogLevel L, typename ... Args>
        void logMessage(fmt::format_string<Args...> fmt_str, Args&& ... args) {
            static_assert(L != LogLevel::silent, "silent is a threshold, not a message level");

            if (not isEnabled(L)) {
                return;
            }

            *m_out << m_tag << " [" << toLevelName(L) << "]: " << fmt::format(fmt_str, std::forward<Args>(args)...) << '\n';
        }
    };
}
