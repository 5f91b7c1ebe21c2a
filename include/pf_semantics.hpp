// pf_semantics.hpp - Pipefitter - Semantic Roles and Format Semantics
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_SEMANTICS_HPP
#define PF_SEMANTICS_HPP

#include "pf_node.hpp"

#include <map>
#include <span>
#include <functional>

namespace pf
{
//========================================================================
// Vocabulary
//========================================================================

    enum class format_type
    {
        json,
        xml,
        csv,
        yaml,
        database,
        custom
    };

    enum class semantic_role
    {
        root,           // top-level container
        container,      // collection of items
        item,           // individual data item
        property,       // key-value pair
        value,          // primitive value
        metadata,       // format-specific metadata
        annotation      // comments, documentation
    };

    enum class transformation_strategy
    {
        preserve,       // keep as-is
        convert,        // keep, attributes become fields
        flatten,        // splice children into parent
        promote,        // rebuild as annotation
        demote,         // rebuild as metadata
        drop            // remove entirely
    };

    inline std::string_view to_string(format_type f)
    {
        switch (f)
        {
            case format_type::json:     return "json";
            case format_type::xml:      return "xml";
            case format_type::csv:      return "csv";
            case format_type::yaml:     return "yaml";
            case format_type::database: return "database";
            case format_type::custom:   return "custom";
        }
        return "custom";
    }

    inline std::string_view to_string(semantic_role r)
    {
        switch (r)
        {
            case semantic_role::root:       return "root";
            case semantic_role::container:  return "container";
            case semantic_role::item:       return "item";
            case semantic_role::property:   return "property";
            case semantic_role::value:      return "value";
            case semantic_role::metadata:   return "metadata";
            case semantic_role::annotation: return "annotation";
        }
        return "value";
    }

    inline std::string_view to_string(transformation_strategy s)
    {
        switch (s)
        {
            case transformation_strategy::preserve: return "preserve";
            case transformation_strategy::convert:  return "convert";
            case transformation_strategy::flatten:  return "flatten";
            case transformation_strategy::promote:  return "promote";
            case transformation_strategy::demote:   return "demote";
            case transformation_strategy::drop:     return "drop";
        }
        return "preserve";
    }

    inline std::optional<format_type> parse_format_type(std::string_view text)
    {
        static const std::map<std::string, format_type, std::less<>> formats =
        {
            {"json",     format_type::json},
            {"xml",      format_type::xml},
            {"csv",      format_type::csv},
            {"yaml",     format_type::yaml},
            {"database", format_type::database},
            {"custom",   format_type::custom},
        };

        if (auto it = formats.find(detail::to_lower(detail::trim_sv(text))); it != formats.end())
            return it->second;
        return std::nullopt;
    }

    inline std::optional<transformation_strategy> parse_transformation_strategy(std::string_view text)
    {
        static const std::map<std::string, transformation_strategy, std::less<>> strategies =
        {
            {"preserve", transformation_strategy::preserve},
            {"convert",  transformation_strategy::convert},
            {"flatten",  transformation_strategy::flatten},
            {"promote",  transformation_strategy::promote},
            {"demote",   transformation_strategy::demote},
            {"drop",     transformation_strategy::drop},
        };

        if (auto it = strategies.find(detail::to_lower(detail::trim_sv(text))); it != strategies.end())
            return it->second;
        return std::nullopt;
    }

//========================================================================
// Format semantics record
//========================================================================

    using path = std::vector<std::string>;

    struct transformation_rules
    {
        transformation_strategy collections = transformation_strategy::preserve;
        transformation_strategy records     = transformation_strategy::preserve;
        transformation_strategy attributes  = transformation_strategy::preserve;
        transformation_strategy comments    = transformation_strategy::preserve;
    };

    // Per-format query primitives. navigate_path returns null when any
    // segment misses; reconstruct builds a new container holding items.
    struct query_strategy
    {
        std::function<node_list(node const &)>                                       locate_items;
        std::function<std::optional<primitive>(node const &, std::string_view)>      extract_value;
        std::function<node_ptr(node_ptr const &, std::span<const std::string>)>      navigate_path;
        std::function<node_ptr(node const &, node_list)>                             reconstruct;
    };

    struct format_semantics
    {
        format_type                             format = format_type::custom;
        std::map<node_kind, semantic_role>      kind_to_role;
        std::map<semantic_role, node_kind>      role_to_kind;
        transformation_rules                    rules;
        query_strategy                          query;

        // Kinds missing from the table read as plain values.
        semantic_role role_of(node_kind kind) const
        {
            auto it = kind_to_role.find(kind);
            return it != kind_to_role.end() ? it->second : semantic_role::value;
        }

        node_kind kind_of(semantic_role role) const
        {
            auto it = role_to_kind.find(role);
            return it != role_to_kind.end() ? it->second : node_kind::value;
        }

        bool reads_as(semantic_role role) const
        {
            for (auto const & [kind, r] : kind_to_role)
                if (r == role)
                    return true;
            return false;
        }

        bool represents(semantic_role role) const
        {
            return role_to_kind.contains(role);
        }

        transformation_strategy strategy_for(semantic_role role) const
        {
            switch (role)
            {
                case semantic_role::container:  return rules.collections;
                case semantic_role::item:       return rules.records;
                case semantic_role::metadata:   return rules.attributes;
                case semantic_role::annotation: return rules.comments;
                default:                        return transformation_strategy::preserve;
            }
        }
    };

//========================================================================
// Shared query building blocks
//========================================================================

    namespace detail
    {
        inline constexpr std::string_view CSV_ROW_NAME = "row";

        inline node_list children_where(node const & n, std::function<bool(node const &)> const & pred)
        {
            node_list out;
            for (auto const & c : n.children)
                if (c && pred(*c))
                    out.push_back(c);
            return out;
        }

        inline std::optional<primitive> child_value(node const & n, std::string_view key)
        {
            if (auto c = child(n, key))
                return c->value;
            return std::nullopt;
        }

        inline node_ptr navigate_by_name(node_ptr const & start, std::span<const std::string> segments)
        {
            node_ptr current = start;

            for (auto const & seg : segments)
            {
                if (!current)
                    return nullptr;
                current = child(*current, seg);
            }

            return current;
        }

        // "row" + index selects among the rows at the current level; a
        // bare "row" is the first row; a bare index counts rows.
        inline node_ptr navigate_rows(node_ptr const & start, std::span<const std::string> segments)
        {
            node_ptr current = start;

            auto nth_row = [](node const & n, size_t index) -> node_ptr
            {
                size_t seen = 0;
                for (auto const & c : n.children)
                {
                    if (!c || c->name != CSV_ROW_NAME)
                        continue;
                    if (seen++ == index)
                        return c;
                }
                return nullptr;
            };

            auto parse_index = [](std::string const & s) -> std::optional<size_t>
            {
                try { return static_cast<size_t>(std::stoull(s)); }
                catch (std::out_of_range const &) { return std::nullopt; }
            };

            for (size_t i = 0; i < segments.size(); ++i)
            {
                if (!current)
                    return nullptr;

                auto const & seg = segments[i];

                if (seg == CSV_ROW_NAME)
                {
                    if (i + 1 < segments.size() && is_all_digits(segments[i + 1]))
                    {
                        auto index = parse_index(segments[++i]);
                        current = index ? nth_row(*current, *index) : nullptr;
                    }
                    else
                    {
                        current = nth_row(*current, 0);
                    }
                }
                else if (is_all_digits(seg))
                {
                    auto index = parse_index(seg);
                    current = index ? nth_row(*current, *index) : nullptr;
                }
                else
                {
                    current = child(*current, seg);
                }
            }

            return current;
        }

        // "@name" resolves an attribute and ends the walk.
        inline node_ptr navigate_elements(node_ptr const & start, std::span<const std::string> segments)
        {
            node_ptr current = start;

            for (auto const & seg : segments)
            {
                if (!current)
                    return nullptr;

                if (!seg.empty() && seg.front() == '@')
                    return attribute(*current, std::string_view(seg).substr(1));

                current = child(*current, seg);
            }

            return current;
        }

        inline std::function<node_ptr(node const &, node_list)> replace_items()
        {
            return [](node const & container, node_list items)
            {
                return with_children(container, std::move(items));
            };
        }

        // Items are identified by name in some formats, so rebuilt items
        // must carry the canonical name.
        inline std::function<node_ptr(node const &, node_list)> rename_items(std::string canonical)
        {
            return [canonical = std::move(canonical)](node const & container, node_list items)
            {
                for (auto & item : items)
                    if (item && item->name != canonical)
                        item = with_name(*item, canonical);

                return with_children(container, std::move(items));
            };
        }
    }

//========================================================================
// Built-in formats
//========================================================================

    inline format_semantics json_semantics()
    {
        format_semantics s;
        s.format = format_type::json;

        s.kind_to_role =
        {
            {node_kind::collection, semantic_role::container},
            {node_kind::record,     semantic_role::item},
            {node_kind::field,      semantic_role::property},
            {node_kind::value,      semantic_role::value},
            {node_kind::comment,    semantic_role::annotation},
        };

        s.role_to_kind =
        {
            {semantic_role::root,      node_kind::record},
            {semantic_role::container, node_kind::collection},
            {semantic_role::item,      node_kind::record},
            {semantic_role::property,  node_kind::field},
            {semantic_role::value,     node_kind::value},
        };

        s.rules.collections = transformation_strategy::preserve;
        s.rules.records     = transformation_strategy::preserve;
        s.rules.attributes  = transformation_strategy::convert;
        s.rules.comments    = transformation_strategy::drop;

        s.query.locate_items = [](node const & n)
        {
            return detail::children_where(n, [](node const & c)
            {
                return c.kind == node_kind::record || c.kind == node_kind::collection;
            });
        };
        s.query.extract_value = detail::child_value;
        s.query.navigate_path = detail::navigate_by_name;
        s.query.reconstruct   = detail::replace_items();

        return s;
    }

    inline format_semantics csv_semantics()
    {
        format_semantics s;
        s.format = format_type::csv;

        s.kind_to_role =
        {
            {node_kind::collection, semantic_role::root},
            {node_kind::record,     semantic_role::item},
            {node_kind::field,      semantic_role::property},
            {node_kind::value,      semantic_role::value},
        };

        s.role_to_kind =
        {
            {semantic_role::root,      node_kind::collection},
            {semantic_role::container, node_kind::collection},
            {semantic_role::item,      node_kind::record},
            {semantic_role::property,  node_kind::field},
            {semantic_role::value,     node_kind::value},
        };

        s.rules.collections = transformation_strategy::preserve;
        s.rules.records     = transformation_strategy::preserve;
        s.rules.attributes  = transformation_strategy::promote;
        s.rules.comments    = transformation_strategy::promote;

        s.query.locate_items = [](node const & n)
        {
            return detail::children_where(n, [](node const & c)
            {
                return c.name == detail::CSV_ROW_NAME;
            });
        };
        s.query.extract_value = detail::child_value;
        s.query.navigate_path = detail::navigate_rows;
        s.query.reconstruct   = detail::rename_items(std::string(detail::CSV_ROW_NAME));

        return s;
    }

    inline format_semantics xml_semantics()
    {
        format_semantics s;
        s.format = format_type::xml;

        s.kind_to_role =
        {
            {node_kind::record,      semantic_role::item},
            {node_kind::collection,  semantic_role::container},
            {node_kind::field,       semantic_role::property},
            {node_kind::value,       semantic_role::value},
            {node_kind::attributes,  semantic_role::metadata},
            {node_kind::comment,     semantic_role::annotation},
            {node_kind::instruction, semantic_role::metadata},
        };

        s.role_to_kind =
        {
            {semantic_role::root,       node_kind::record},
            {semantic_role::container,  node_kind::collection},
            {semantic_role::item,       node_kind::record},
            {semantic_role::property,   node_kind::field},
            {semantic_role::value,      node_kind::value},
            {semantic_role::metadata,   node_kind::attributes},
            {semantic_role::annotation, node_kind::comment},
        };

        // All preserve: XML has a slot for everything.
        s.rules = transformation_rules{};

        s.query.locate_items = [](node const & n)
        {
            return detail::children_where(n, [](node const & c)
            {
                return c.kind == node_kind::record;
            });
        };

        // Attributes shadow child elements of the same name.
        s.query.extract_value = [](node const & n, std::string_view key) -> std::optional<primitive>
        {
            if (auto a = attribute(n, key); a && a->value)
                return a->value;
            return detail::child_value(n, key);
        };
        s.query.navigate_path = detail::navigate_elements;
        s.query.reconstruct   = detail::replace_items();

        return s;
    }

} // namespace pf

#endif // PF_SEMANTICS_HPP
