// pf_core.hpp - Pipefitter - Core Definitions
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_CORE_HPP
#define PF_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <stdexcept>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <compare>

#include <fmt/format.h>
#include <fmt/chrono.h>

namespace pf
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        id & operator= (size_t v) { val = v; return *this; }
        auto operator<=>(id const &) const = default;
        id & operator++() { ++val; return *this; }
        id operator++(int) { id temp = *this; ++val; return temp; }
    };

    template <typename Tag>
    constexpr id<Tag> invalid_id()
    {
        return id<Tag>{ npos() };
    }

//========================================================================
// Errors
//========================================================================

    // Conditions that abort the call they occur in.
    enum class error_kind
    {
        not_registered,
        invalid_configuration
    };

    inline std::string_view to_string(error_kind k)
    {
        switch (k)
        {
            case error_kind::not_registered:        return "not_registered";
            case error_kind::invalid_configuration: return "invalid_configuration";
        }
        return "unknown";
    }

    class pipefitter_error : public std::runtime_error
    {
    public:
        pipefitter_error(error_kind kind, std::string const & what)
            : std::runtime_error(what), kind_(kind)
        {}

        error_kind kind() const noexcept { return kind_; }

    private:
        error_kind kind_;
    };

    // Non-fatal, collected diagnostics.
    template <typename Kind>
    struct error
    {
        Kind        kind;
        std::string message;
    };

//========================================================================
// Result-with-diagnostics context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline bool is_all_digits(std::string_view s)
        {
            if (s.empty()) return false;
            return std::all_of(s.begin(), s.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        // UTC, ISO-8601 with millisecond precision
        inline std::string iso_timestamp()
        {
            using namespace std::chrono;
            auto now  = system_clock::now();
            auto ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
            auto utc = fmt::gmtime(system_clock::to_time_t(now));
            return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, ms.count());
        }
    }

} // namespace pf

#endif // PF_CORE_HPP
