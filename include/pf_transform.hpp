// pf_transform.hpp - Pipefitter - Transformation Engine
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Conversion runs in two phases. Lifting reads a tree with the source
// format's kind -> role table into a semantic graph; lowering rebuilds
// it with the target format's role -> kind table, applying the target's
// transformation strategy to every child.
//
// The semantic graph is an arena: every source node gets a stable index
// on first visit and later visits reuse it, so shared subtrees and
// cyclic back-references are walked exactly once.

#ifndef PF_TRANSFORM_HPP
#define PF_TRANSFORM_HPP

#include "pf_registry.hpp"
#include "pf_message.hpp"

#include <unordered_map>
#include <array>

namespace pf
{
//========================================================================
// Semantic graph
//========================================================================

    struct semantic_tag;
    using semantic_id = id<semantic_tag>;

    struct semantic_node
    {
        semantic_role                           role = semantic_role::value;
        std::string                             name;
        std::optional<primitive>                value;
        std::optional<std::string>              node_id;
        std::optional<std::string>              ns;
        std::optional<std::string>              label;
        std::vector<semantic_id>                children;
        std::optional<std::vector<semantic_id>> attributes;
        std::vector<semantic_id>                back_refs;      // referents inside the graph
        std::vector<node_ref>                   external_refs;  // referents outside it
    };

    class semantic_graph
    {
    public:
        semantic_id root() const noexcept { return root_; }
        size_t size() const noexcept { return nodes_.size(); }
        bool empty() const noexcept { return nodes_.empty(); }

        semantic_node const & at(semantic_id id) const { return nodes_.at(id.val); }

    private:
        std::vector<semantic_node> nodes_;
        semantic_id                root_ {invalid_id<semantic_tag>()};

        friend struct lifter;
    };

//========================================================================
// Lifting
//========================================================================

    struct lifter
    {
        explicit lifter(format_semantics const & source) noexcept
            : source_(source)
        {}

        semantic_graph run(node_ptr const & root);

    private:
        format_semantics const & source_;
        semantic_graph           out_;

        std::unordered_map<node const *, semantic_id>       seen_;
        std::vector<std::pair<semantic_id, node const *>>   visited_;

        semantic_id visit(node_ptr const & n);
        std::vector<semantic_id> visit_all(node_list const & nodes);
        void resolve_back_refs();
    };

    inline semantic_graph lifter::run(node_ptr const & root)
    {
        if (root)
        {
            out_.root_ = visit(root);
            resolve_back_refs();
        }
        return std::move(out_);
    }

    inline semantic_id lifter::visit(node_ptr const & n)
    {
        if (auto it = seen_.find(n.get()); it != seen_.end())
            return it->second;

        semantic_id sid{ out_.nodes_.size() };
        seen_.emplace(n.get(), sid);
        visited_.emplace_back(sid, n.get());

        semantic_node sn;
        sn.role    = source_.role_of(n->kind);
        sn.name    = n->name;
        sn.value   = n->value;
        sn.node_id = n->id;
        sn.ns      = n->ns;
        sn.label   = n->label;
        out_.nodes_.push_back(std::move(sn));

        // The arena grows while descending; index, never hold references.
        auto children = visit_all(n->children);
        out_.nodes_[sid.val].children = std::move(children);

        if (n->attributes)
        {
            auto attributes = visit_all(*n->attributes);
            out_.nodes_[sid.val].attributes = std::move(attributes);
        }

        return sid;
    }

    inline std::vector<semantic_id> lifter::visit_all(node_list const & nodes)
    {
        std::vector<semantic_id> ids;
        ids.reserve(nodes.size());

        for (auto const & n : nodes)
            if (n)
                ids.push_back(visit(n));

        return ids;
    }

    inline void lifter::resolve_back_refs()
    {
        for (auto const & [sid, source] : visited_)
        {
            auto & sn = out_.nodes_[sid.val];

            for (auto const & ref : source->back_refs)
            {
                auto p = ref.lock();
                if (!p)
                    continue;

                if (auto it = seen_.find(p.get()); it != seen_.end())
                    sn.back_refs.push_back(it->second);
                else
                    sn.external_refs.push_back(ref);
            }
        }
    }

//========================================================================
// Lowering
//========================================================================

    struct lowerer
    {
        lowerer(semantic_graph const & graph, format_semantics const & target) noexcept
            : graph_(graph), target_(target)
        {}

        node_ptr run();

        size_t built_count() const noexcept { return created_.size(); }

    private:
        semantic_graph const &   graph_;
        format_semantics const & target_;

        // Keyed by (semantic index, forced kind or -1): a node placed
        // twice under the same rule is built once and shared.
        std::map<std::pair<size_t, int>, std::shared_ptr<node>>    built_;
        std::vector<std::pair<std::shared_ptr<node>, semantic_id>> created_;
        std::unordered_map<size_t, node_ptr>                       first_built_;
        std::vector<semantic_id>                                   flattening_;

        std::shared_ptr<node> build(semantic_id sid, std::optional<node_kind> forced);
        void place(semantic_id sid, transformation_strategy strategy, node_list & out);
        void splice_children(semantic_id sid, node_list & out);
        node_list lower_children(std::vector<semantic_id> const & ids);
        std::optional<node_list> lower_attributes(std::optional<std::vector<semantic_id>> const & ids);
        void link_back_refs();
    };

    inline node_ptr lowerer::run()
    {
        if (graph_.empty())
            return nullptr;

        node_ptr root = build(graph_.root(), std::nullopt);
        link_back_refs();
        return root;
    }

    inline std::shared_ptr<node> lowerer::build(semantic_id sid, std::optional<node_kind> forced)
    {
        std::pair<size_t, int> key{ sid.val, forced ? static_cast<int>(*forced) : -1 };

        if (auto it = built_.find(key); it != built_.end())
            return it->second;

        auto n = std::make_shared<node>();
        built_.emplace(key, n);
        created_.emplace_back(n, sid);
        first_built_.try_emplace(sid.val, n);

        auto const & sn = graph_.at(sid);

        n->kind  = forced.value_or(target_.kind_of(sn.role));
        n->name  = sn.name;
        n->value = sn.value;
        n->id    = sn.node_id;
        n->ns    = sn.ns;
        n->label = sn.label;

        n->children   = lower_children(sn.children);
        n->attributes = lower_attributes(sn.attributes);

        return n;
    }

    inline void lowerer::place(semantic_id sid, transformation_strategy strategy, node_list & out)
    {
        switch (strategy)
        {
            case transformation_strategy::preserve:
                out.push_back(build(sid, std::nullopt));
                break;

            case transformation_strategy::convert:
                if (graph_.at(sid).role == semantic_role::metadata)
                    out.push_back(build(sid, node_kind::field));
                else
                    out.push_back(build(sid, std::nullopt));
                break;

            case transformation_strategy::flatten:
                splice_children(sid, out);
                break;

            case transformation_strategy::promote:
                out.push_back(build(sid, node_kind::comment));
                break;

            case transformation_strategy::demote:
                out.push_back(build(sid, node_kind::attributes));
                break;

            case transformation_strategy::drop:
                break;
        }
    }

    // A node already being flattened further up contributes nothing.
    inline void lowerer::splice_children(semantic_id sid, node_list & out)
    {
        if (std::find(flattening_.begin(), flattening_.end(), sid) != flattening_.end())
            return;

        flattening_.push_back(sid);
        for (auto child : graph_.at(sid).children)
            place(child, target_.strategy_for(graph_.at(child).role), out);
        flattening_.pop_back();
    }

    inline node_list lowerer::lower_children(std::vector<semantic_id> const & ids)
    {
        node_list out;
        out.reserve(ids.size());

        for (auto child : ids)
            place(child, target_.strategy_for(graph_.at(child).role), out);

        return out;
    }

    inline std::optional<node_list>
    lowerer::lower_attributes(std::optional<std::vector<semantic_id>> const & ids)
    {
        if (!ids || ids->empty())
            return std::nullopt;

        auto strategy = target_.rules.attributes;
        if (strategy == transformation_strategy::drop)
            return std::nullopt;

        node_list out;
        out.reserve(ids->size());

        for (auto attr : *ids)
        {
            if (strategy == transformation_strategy::convert)
                out.push_back(build(attr, node_kind::field));
            else
                place(attr, strategy, out);
        }

        if (out.empty())
            return std::nullopt;
        return out;
    }

    // Referents that were dropped or flattened have no counterpart and
    // are left out; external referents are carried over as they are.
    inline void lowerer::link_back_refs()
    {
        for (auto & [n, sid] : created_)
        {
            auto const & sn = graph_.at(sid);

            for (auto ref : sn.back_refs)
                if (auto it = first_built_.find(ref.val); it != first_built_.end())
                    n->back_refs.push_back(it->second);

            for (auto const & ext : sn.external_refs)
                n->back_refs.push_back(ext);
        }
    }

//========================================================================
// Transformation engine
//========================================================================

    class transformation_engine
    {
    public:
        explicit transformation_engine(semantics_registry const & registry,
                                       logger const & log = null_logger()) noexcept
            : registry_(registry), log_(&log)
        {}

        // Throws pipefitter_error(not_registered) for unknown formats.
        node_ptr convert(node_ptr const & n, format_type source, format_type target) const;

        // The input message is not modified; provenance goes under the
        // "transformation" metadata namespace.
        message convert_envelope(message const & m, format_type source, format_type target) const;

        // Table check only; says nothing about data lost to drop,
        // flatten or promote rules.
        bool is_compatible(format_type source, format_type target) const;

        std::set<format_type> supported_formats() const { return registry_.supported_formats(); }

        format_semantics const & semantics(format_type f) const { return registry_.lookup(f); }

        semantics_registry const & registry() const noexcept { return registry_; }

    private:
        semantics_registry const & registry_;
        logger const *             log_;
    };

    inline node_ptr transformation_engine::convert(node_ptr const & n, format_type source, format_type target) const
    {
        auto const & from = registry_.lookup(source);
        auto const & to   = registry_.lookup(target);

        if (!n)
            return nullptr;

        auto graph = lifter(from).run(n);

        lowerer low(graph, to);
        auto out = low.run();

        log_->debug("converted '{}' from {} to {}: {} nodes lifted, {} built",
            n->name, to_string(source), to_string(target), graph.size(), low.built_count());

        return out;
    }

    inline message transformation_engine::convert_envelope(message const & m, format_type source, format_type target) const
    {
        auto data = convert(m.data, source, target);

        return with_data(m, std::move(data), "transformation",
        {
            {"source_format",  std::string(to_string(source))},
            {"target_format",  std::string(to_string(target))},
            {"transformed_at", detail::iso_timestamp()},
        });
    }

    inline bool transformation_engine::is_compatible(format_type source, format_type target) const
    {
        auto const * from = registry_.find(source);
        auto const * to   = registry_.find(target);

        if (!from || !to)
            return false;

        static constexpr std::array<semantic_role, 3> core_roles =
        {
            semantic_role::container,
            semantic_role::item,
            semantic_role::value
        };

        return std::all_of(core_roles.begin(), core_roles.end(), [&](semantic_role r)
        {
            return !from->reads_as(r) || to->represents(r);
        });
    }

} // namespace pf

#endif // PF_TRANSFORM_HPP
