// pf_log.hpp - Pipefitter - Logging
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_LOG_HPP
#define PF_LOG_HPP

#include "pf_core.hpp"

#include <cstdio>
#include <optional>

namespace pf
{
//========================================================================
// Log levels
//========================================================================

    enum class log_level
    {
        debug,
        info,
        warn,
        error,
        none
    };

    inline std::string_view to_string(log_level level)
    {
        switch (level)
        {
            case log_level::debug: return "DEBUG";
            case log_level::info:  return "INFO";
            case log_level::warn:  return "WARN";
            case log_level::error: return "ERROR";
            case log_level::none:  return "NONE";
        }
        return "NONE";
    }

    inline std::optional<log_level> parse_log_level(std::string_view text)
    {
        auto s = detail::to_lower(detail::trim_sv(text));

        if (s == "debug")                   return log_level::debug;
        if (s == "info")                    return log_level::info;
        if (s == "warn" || s == "warning")  return log_level::warn;
        if (s == "error")                   return log_level::error;
        if (s == "none" || s == "off")      return log_level::none;

        return std::nullopt;
    }

//========================================================================
// Logger
//========================================================================

    class logger
    {
    public:
        explicit logger(std::string category = {},
                        log_level level = log_level::info,
                        std::FILE* out = stderr)
            : category_(std::move(category)), level_(level), out_(out)
        {}

        log_level level() const noexcept { return level_; }
        void set_level(log_level level) noexcept { level_ = level; }

        std::string const & category() const noexcept { return category_; }

        void set_output(std::FILE* out) noexcept { out_ = out; }
        void enable_timestamps(bool on) noexcept { timestamps_ = on; }

        bool enabled(log_level level) const noexcept
        {
            return level_ != log_level::none
                && level  != log_level::none
                && level  >= level_
                && out_   != nullptr;
        }

        template <typename... Args>
        void debug(fmt::format_string<Args...> f, Args&&... args) const
        {
            log(log_level::debug, f, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(fmt::format_string<Args...> f, Args&&... args) const
        {
            log(log_level::info, f, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(fmt::format_string<Args...> f, Args&&... args) const
        {
            log(log_level::warn, f, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(fmt::format_string<Args...> f, Args&&... args) const
        {
            log(log_level::error, f, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void log(log_level level, fmt::format_string<Args...> f, Args&&... args) const
        {
            if (!enabled(level))
                return;

            write(level, fmt::format(f, std::forward<Args>(args)...));
        }

    private:
        std::string category_;
        log_level   level_;
        std::FILE*  out_;
        bool        timestamps_ = true;

        void write(log_level level, std::string_view message) const
        {
            std::string line;

            if (timestamps_)
                line += fmt::format("[{}] ", detail::iso_timestamp());
            if (!category_.empty())
                line += fmt::format("[{}] ", category_);

            line += fmt::format("[{}] {}\n", to_string(level), message);

            std::fputs(line.c_str(), out_);
        }
    };

    // Shared silent logger for components constructed without one.
    inline logger const & null_logger()
    {
        static const logger silent{ {}, log_level::none, nullptr };
        return silent;
    }

} // namespace pf

#endif // PF_LOG_HPP
