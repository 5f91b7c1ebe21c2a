// pf_config.hpp - Pipefitter - Configuration
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_CONFIG_HPP
#define PF_CONFIG_HPP

#include "pf_log.hpp"
#include "pf_semantics.hpp"

#include <sstream>

namespace pf
{
//========================================================================
// Configuration
//========================================================================

    struct configuration
    {
        log_level   level          = log_level::info;
        format_type default_format = format_type::json;
        bool        log_timestamps = true;
        std::string log_category   = "pipefitter";
    };

    struct configuration_overrides
    {
        std::optional<log_level>   level;
        std::optional<format_type> default_format;
        std::optional<bool>        log_timestamps;
        std::optional<std::string> log_category;
    };

    inline configuration apply(configuration base, configuration_overrides const & o)
    {
        if (o.level)          base.level          = *o.level;
        if (o.default_format) base.default_format = *o.default_format;
        if (o.log_timestamps) base.log_timestamps = *o.log_timestamps;
        if (o.log_category)   base.log_category   = *o.log_category;
        return base;
    }

    inline logger make_logger(configuration const & cfg, std::FILE* out = stderr)
    {
        logger log(cfg.log_category, cfg.level, out);
        log.enable_timestamps(cfg.log_timestamps);
        return log;
    }

//========================================================================
// Configuration manager
//========================================================================

    class configuration_manager
    {
    public:
        configuration_manager() = default;

        explicit configuration_manager(configuration defaults)
            : core_(defaults), defaults_(std::move(defaults))
        {}

        void merge_defaults(configuration_overrides const & o)
        {
            defaults_ = apply(std::move(defaults_), o);
        }

        configuration create(configuration_overrides const & user = {}) const
        {
            return apply(defaults_, user);
        }

        configuration const & defaults() const noexcept { return defaults_; }

        void reset() { defaults_ = core_; }

    private:
        configuration core_;
        configuration defaults_;
    };

//========================================================================
// Text configuration
//========================================================================

    enum class config_error_kind
    {
        unknown_key,
        invalid_value,
        malformed_line
    };

    using config_context = context<configuration_overrides, error<config_error_kind>>;

    config_context parse_configuration(std::string_view text);

    namespace detail
    {
        inline std::optional<bool> parse_flag(std::string_view s)
        {
            auto l = to_lower(trim_sv(s));
            if (l == "true"  || l == "yes" || l == "on"  || l == "1") return true;
            if (l == "false" || l == "no"  || l == "off" || l == "0") return false;
            return std::nullopt;
        }
    }

    // key = value lines; blank lines and lines starting with '#' or
    // "//" are skipped. Bad lines are reported and the rest still apply.
    inline config_context parse_configuration(std::string_view text)
    {
        config_context out{};

        std::istringstream ss{ std::string(text) };
        std::string line;
        size_t line_no = 0;

        auto report = [&](config_error_kind kind, std::string msg)
        {
            out.errors.push_back({ kind, fmt::format("line {}: {}", line_no, msg) });
        };

        while (std::getline(ss, line))
        {
            ++line_no;

            auto sv = detail::trim_sv(line);
            if (sv.empty() || sv.front() == '#' || sv.starts_with("//"))
                continue;

            auto eq = sv.find('=');
            if (eq == std::string_view::npos)
            {
                report(config_error_kind::malformed_line, fmt::format("expected key = value, got \"{}\"", sv));
                continue;
            }

            auto key = detail::to_lower(detail::trim_sv(sv.substr(0, eq)));
            auto val = detail::trim_sv(sv.substr(eq + 1));

            if (key == "log_level")
            {
                if (auto l = parse_log_level(val)) out.result.level = *l;
                else report(config_error_kind::invalid_value, fmt::format("unknown log level \"{}\"", val));
            }
            else if (key == "default_format")
            {
                if (auto f = parse_format_type(val)) out.result.default_format = *f;
                else report(config_error_kind::invalid_value, fmt::format("unknown format \"{}\"", val));
            }
            else if (key == "log_timestamps")
            {
                if (auto b = detail::parse_flag(val)) out.result.log_timestamps = *b;
                else report(config_error_kind::invalid_value, fmt::format("expected a boolean, got \"{}\"", val));
            }
            else if (key == "log_category")
            {
                out.result.log_category = std::string(val);
            }
            else
            {
                report(config_error_kind::unknown_key, fmt::format("unknown key \"{}\"", key));
            }
        }

        return out;
    }

    // Throwing variant for callers that cannot continue on bad input.
    inline configuration_overrides parse_configuration_strict(std::string_view text)
    {
        auto ctx = parse_configuration(text);
        if (ctx.has_errors())
            throw pipefitter_error(error_kind::invalid_configuration, ctx.errors.front().message);
        return ctx.result;
    }

} // namespace pf

#endif // PF_CONFIG_HPP
