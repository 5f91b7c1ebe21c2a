// pf_registry.hpp - Pipefitter - Format Semantics Registry
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_REGISTRY_HPP
#define PF_REGISTRY_HPP

#include "pf_semantics.hpp"
#include "pf_config.hpp"
#include "pf_log.hpp"

#include <set>

namespace pf
{
//========================================================================
// Semantics registry
//========================================================================
//
// Populated during setup, read-only afterwards. Lookups are not
// synchronised against concurrent registration.

    class semantics_registry
    {
    public:
        explicit semantics_registry(logger const & log = null_logger()) noexcept
            : log_(&log)
        {}

        // Inserts or replaces the record for s.format.
        void add(format_semantics s)
        {
            auto f = s.format;
            auto [it, inserted] = formats_.insert_or_assign(f, std::move(s));

            if (inserted)
                log_->debug("registered format semantics for '{}'", to_string(f));
            else
                log_->warn("replaced format semantics for '{}'", to_string(f));
        }

        format_semantics const & lookup(format_type f) const
        {
            if (auto const * s = find(f))
                return *s;

            log_->error("no semantics registered for format '{}'", to_string(f));
            throw pipefitter_error(
                error_kind::not_registered,
                fmt::format("no semantics registered for format: {}", to_string(f)));
        }

        format_semantics const * find(format_type f) const noexcept
        {
            auto it = formats_.find(f);
            return it != formats_.end() ? &it->second : nullptr;
        }

        bool contains(format_type f) const noexcept { return formats_.contains(f); }

        std::set<format_type> supported_formats() const
        {
            std::set<format_type> out;
            for (auto const & [f, s] : formats_)
                out.insert(f);
            return out;
        }

        size_t size() const noexcept { return formats_.size(); }

        logger const & log() const noexcept { return *log_; }

    private:
        std::map<format_type, format_semantics> formats_;
        logger const * log_;
    };

    inline semantics_registry make_default_registry(logger const & log = null_logger())
    {
        semantics_registry r(log);
        r.add(json_semantics());
        r.add(csv_semantics());
        r.add(xml_semantics());
        return r;
    }

//========================================================================
// Extensions
//========================================================================

    struct extension
    {
        std::string                    name;
        std::string                    version;
        std::vector<format_semantics>  formats;
        configuration_overrides        config;
    };

    class extension_registry
    {
    public:
        extension_registry(semantics_registry& formats,
                           configuration_manager& config,
                           logger const & log = null_logger()) noexcept
            : formats_(formats), config_(config), log_(&log)
        {}

        // Registers the extension's formats and config defaults. A name
        // that is already installed is rejected and nothing changes.
        bool install(extension ext)
        {
            if (installed_.contains(ext.name))
            {
                log_->warn("extension '{}' already installed", ext.name);
                return false;
            }

            config_.merge_defaults(ext.config);

            for (auto const & f : ext.formats)
                formats_.add(f);

            log_->info("installed extension '{}' {} ({} formats)",
                ext.name, ext.version, ext.formats.size());

            auto name = ext.name;
            installed_.emplace(std::move(name), std::move(ext));
            return true;
        }

        // Registered formats stay registered.
        bool uninstall(std::string const & name)
        {
            return installed_.erase(name) > 0;
        }

        extension const * get(std::string const & name) const
        {
            auto it = installed_.find(name);
            return it != installed_.end() ? &it->second : nullptr;
        }

        bool has(std::string const & name) const { return installed_.contains(name); }

        std::vector<extension const *> list() const
        {
            std::vector<extension const *> out;
            out.reserve(installed_.size());
            for (auto const & [name, ext] : installed_)
                out.push_back(&ext);
            return out;
        }

        size_t count() const noexcept { return installed_.size(); }

        // Forgets every extension and restores the core configuration
        // defaults.
        void clear()
        {
            installed_.clear();
            config_.reset();
        }

    private:
        semantics_registry&              formats_;
        configuration_manager&           config_;
        logger const *                   log_;
        std::map<std::string, extension> installed_;
    };

} // namespace pf

#endif // PF_REGISTRY_HPP
