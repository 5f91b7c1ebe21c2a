// pf_node.hpp - Pipefitter - Format-Neutral Node Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_NODE_HPP
#define PF_NODE_HPP

#include "pf_core.hpp"

#include <memory>
#include <variant>
#include <cstddef>
#include <type_traits>

namespace pf
{
//========================================================================
// Node kinds
//========================================================================

    enum class node_kind
    {
        collection,     // arrays, documents, result sets
        record,         // objects, rows, elements
        field,          // properties, columns
        value,          // primitive leaves
        attributes,     // metadata such as XML attributes
        comment,
        instruction,    // processing directives, pragmas
        custom
    };

    inline std::string_view to_string(node_kind k)
    {
        switch (k)
        {
            case node_kind::collection:  return "collection";
            case node_kind::record:      return "record";
            case node_kind::field:       return "field";
            case node_kind::value:       return "value";
            case node_kind::attributes:  return "attributes";
            case node_kind::comment:     return "comment";
            case node_kind::instruction: return "instruction";
            case node_kind::custom:      return "custom";
        }
        return "value";
    }

//========================================================================
// Primitive values
//========================================================================

    // nullptr is an explicit null; an absent value is an empty optional
    // on the node.
    using primitive = std::variant<
        std::nullptr_t,
        std::string,
        double,
        bool
    >;

    template <typename T>
    primitive to_primitive(T&& v)
    {
        using U = std::decay_t<T>;

        if constexpr (std::is_same_v<U, primitive>)
            return std::forward<T>(v);
        else if constexpr (std::is_same_v<U, bool>)
            return primitive{ v };
        else if constexpr (std::is_same_v<U, std::nullptr_t>)
            return primitive{ nullptr };
        else if constexpr (std::is_arithmetic_v<U>)
            return primitive{ static_cast<double>(v) };
        else
            return primitive{ std::string(std::forward<T>(v)) };
    }

    inline bool is_null(primitive const & p) { return std::holds_alternative<std::nullptr_t>(p); }

    inline std::optional<std::string> as_string(primitive const & p)
    {
        if (auto* s = std::get_if<std::string>(&p))
            return *s;
        return std::nullopt;
    }

    inline std::optional<double> as_number(primitive const & p)
    {
        if (auto* d = std::get_if<double>(&p))
            return *d;
        return std::nullopt;
    }

    inline std::optional<bool> as_bool(primitive const & p)
    {
        if (auto* b = std::get_if<bool>(&p))
            return *b;
        return std::nullopt;
    }

    // Integral numbers print without a fractional part.
    inline std::string to_display_string(primitive const & p)
    {
        return std::visit([](auto const & v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::nullptr_t>)
                return "null";
            else if constexpr (std::is_same_v<T, std::string>)
                return v;
            else if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else
                return fmt::format("{}", v);
        }, p);
    }

//========================================================================
// Node
//========================================================================

    struct node;

    using node_ptr  = std::shared_ptr<const node>;
    using node_list = std::vector<node_ptr>;
    using node_ref  = std::weak_ptr<const node>;

    struct node
    {
        node_kind                  kind = node_kind::value;
        std::string                name;
        std::optional<primitive>   value;
        std::optional<std::string> id;
        std::optional<std::string> ns;
        std::optional<std::string> label;
        node_list                  children;
        std::vector<node_ref>      back_refs;   // logical containers, never owning
        std::optional<node_list>   attributes;

        bool has_value() const noexcept { return value.has_value(); }
        bool is_leaf() const noexcept { return children.empty(); }

        size_t attribute_count() const noexcept
        {
            return attributes ? attributes->size() : 0;
        }
    };

//========================================================================
// Construction
//========================================================================

    inline std::shared_ptr<node> make_node(node_kind kind, std::string name)
    {
        auto n = std::make_shared<node>();
        n->kind = kind;
        n->name = std::move(name);
        return n;
    }

    template <typename T>
    std::shared_ptr<node> make_node(node_kind kind, std::string name, T&& value)
    {
        auto n = make_node(kind, std::move(name));
        n->value = to_primitive(std::forward<T>(value));
        return n;
    }

    inline std::shared_ptr<node> make_collection(std::string name, node_list children = {})
    {
        auto n = make_node(node_kind::collection, std::move(name));
        n->children = std::move(children);
        return n;
    }

    inline std::shared_ptr<node> make_record(std::string name, node_list children = {}, node_list attributes = {})
    {
        auto n = make_node(node_kind::record, std::move(name));
        n->children = std::move(children);
        if (!attributes.empty())
            n->attributes = std::move(attributes);
        return n;
    }

    template <typename T>
    std::shared_ptr<node> make_field(std::string name, T&& value)
    {
        return make_node(node_kind::field, std::move(name), std::forward<T>(value));
    }

    template <typename T>
    std::shared_ptr<node> make_value(std::string name, T&& value)
    {
        return make_node(node_kind::value, std::move(name), std::forward<T>(value));
    }

    // Entry for a node's attribute list; attribute entries are leaves.
    template <typename T>
    std::shared_ptr<node> make_attribute(std::string name, T&& value)
    {
        return make_node(node_kind::value, std::move(name), std::forward<T>(value));
    }

    inline std::shared_ptr<node> make_comment(std::string text)
    {
        return make_node(node_kind::comment, "#comment", std::move(text));
    }

    inline std::shared_ptr<node> make_instruction(std::string target, std::string data)
    {
        return make_node(node_kind::instruction, std::move(target), std::move(data));
    }

//========================================================================
// Copy-with-change
//========================================================================

    inline node_ptr with_name(node const & n, std::string name)
    {
        auto copy = std::make_shared<node>(n);
        copy->name = std::move(name);
        return copy;
    }

    inline node_ptr with_kind(node const & n, node_kind kind)
    {
        auto copy = std::make_shared<node>(n);
        copy->kind = kind;
        return copy;
    }

    inline node_ptr with_children(node const & n, node_list children)
    {
        auto copy = std::make_shared<node>(n);
        copy->children = std::move(children);
        return copy;
    }

    inline node_ptr with_attributes(node const & n, std::optional<node_list> attributes)
    {
        auto copy = std::make_shared<node>(n);
        copy->attributes = std::move(attributes);
        return copy;
    }

//========================================================================
// Back-references
//========================================================================

    inline void add_back_ref(node & n, node_ptr const & container)
    {
        n.back_refs.push_back(container);
    }

    // Live back-references; expired ones are skipped.
    inline node_list back_refs(node const & n)
    {
        node_list out;
        out.reserve(n.back_refs.size());

        for (auto const & ref : n.back_refs)
            if (auto p = ref.lock())
                out.push_back(std::move(p));

        return out;
    }

//========================================================================
// Lookup
//========================================================================

    inline node_ptr child(node const & n, std::string_view name)
    {
        for (auto const & c : n.children)
            if (c && c->name == name)
                return c;
        return nullptr;
    }

    inline node_ptr attribute(node const & n, std::string_view name)
    {
        if (!n.attributes)
            return nullptr;

        for (auto const & a : *n.attributes)
            if (a && a->name == name)
                return a;
        return nullptr;
    }

//========================================================================
// Structural equality
//========================================================================

    inline bool equivalent(node const & a, node const & b);

    namespace detail
    {
        inline bool equivalent_lists(node_list const & a, node_list const & b)
        {
            if (a.size() != b.size())
                return false;

            for (size_t i = 0; i < a.size(); ++i)
            {
                if (a[i] == b[i])
                    continue;
                if (!a[i] || !b[i] || !equivalent(*a[i], *b[i]))
                    return false;
            }
            return true;
        }
    }

    // Deep comparison ignoring back-references. Absent and empty
    // attribute lists are equal.
    inline bool equivalent(node const & a, node const & b)
    {
        if (a.kind  != b.kind  || a.name != b.name ||
            a.value != b.value || a.id   != b.id   ||
            a.ns    != b.ns    || a.label != b.label)
            return false;

        if (!detail::equivalent_lists(a.children, b.children))
            return false;

        static const node_list none;
        return detail::equivalent_lists(
            a.attributes ? *a.attributes : none,
            b.attributes ? *b.attributes : none);
    }

} // namespace pf

#endif // PF_NODE_HPP
