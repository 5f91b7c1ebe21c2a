// pf_operations.hpp - Pipefitter - Format-Aware Operations
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_OPERATIONS_HPP
#define PF_OPERATIONS_HPP

#include "pf_transform.hpp"

#include <type_traits>

namespace pf
{
    using item_predicate   = std::function<bool(node const &)>;
    using item_transformer = std::function<node_ptr(node_ptr const &)>;
    using item_less        = std::function<bool(node const &, node const &)>;
    using item_key         = std::function<std::string(node const &)>;

    class format_aware_query;

//========================================================================
// Operations
//========================================================================
//
// Every operation locates the items of message.data through the format's
// locate_items primitive. Operations returning a message rebuild the
// container with the format's reconstruct primitive and record what they
// did under the "processing" metadata namespace.

    class format_aware_operations
    {
    public:
        explicit format_aware_operations(semantics_registry const & registry,
                                         logger const & log = null_logger()) noexcept
            : registry_(registry), log_(&log)
        {}

        explicit format_aware_operations(transformation_engine const & engine,
                                         logger const & log = null_logger()) noexcept
            : registry_(engine.registry()), log_(&log)
        {}

        node_list items(message const & m, format_type f) const;

        node_list find(message const & m, item_predicate const & pred, format_type f) const;
        node_ptr find_first(message const & m, item_predicate const & pred, format_type f) const;

        bool some(message const & m, item_predicate const & pred, format_type f) const;
        bool every(message const & m, item_predicate const & pred, format_type f) const;

        // Counts every item when pred is empty.
        size_t count(message const & m, format_type f, item_predicate const & pred = {}) const;

        template <typename Mapper>
        auto map(message const & m, Mapper && mapper, format_type f) const
            -> std::vector<std::decay_t<std::invoke_result_t<Mapper&, node const &>>>;

        // reducer(accumulator, item, index) -> accumulator
        template <typename T, typename Reducer>
        T reduce(message const & m, Reducer && reducer, T initial, format_type f) const;

        std::map<std::string, node_list> group_by(message const & m, item_key const & key, format_type f) const;

        message filter(message const & m, item_predicate const & pred, format_type f) const;
        message transform(message const & m, item_transformer const & fn, format_type f) const;
        message sort(message const & m, item_less const & less, format_type f) const;
        message take(message const & m, size_t n, format_type f) const;
        message skip(message const & m, size_t n, format_type f) const;

        std::optional<primitive> extract_value(node const & n, std::string_view key, format_type f) const;
        node_ptr navigate_path(node_ptr const & n, path const & segments, format_type f) const;

        format_aware_query query(message m, format_type f) const;

        // Uses the default format from the message's pipeline context,
        // json when there is none.
        format_aware_query query(message m) const;

    private:
        semantics_registry const & registry_;
        logger const *             log_;

        message rebuild(message const & m, node_list items, format_semantics const & s, metadata_entries record) const;
    };

//========================================================================
// Query builder
//========================================================================

    class format_aware_query
    {
    public:
        format_aware_query(message m, format_type f, format_aware_operations const & ops)
            : message_(std::move(m)), format_(f), ops_(&ops)
        {}

        format_aware_query & filter(item_predicate const & pred)
        {
            message_ = ops_->filter(message_, pred, format_);
            return *this;
        }

        format_aware_query & transform(item_transformer const & fn)
        {
            message_ = ops_->transform(message_, fn, format_);
            return *this;
        }

        format_aware_query & sort(item_less const & less)
        {
            message_ = ops_->sort(message_, less, format_);
            return *this;
        }

        format_aware_query & take(size_t n)
        {
            message_ = ops_->take(message_, n, format_);
            return *this;
        }

        format_aware_query & skip(size_t n)
        {
            message_ = ops_->skip(message_, n, format_);
            return *this;
        }

        message execute() const { return message_; }

        template <typename Mapper>
        auto map(Mapper && mapper) const
        {
            return ops_->map(message_, std::forward<Mapper>(mapper), format_);
        }

        size_t count(item_predicate const & pred = {}) const
        {
            return ops_->count(message_, format_, pred);
        }

        std::map<std::string, node_list> group_by(item_key const & key) const
        {
            return ops_->group_by(message_, key, format_);
        }

        format_type format() const noexcept { return format_; }

    private:
        message                         message_;
        format_type                     format_;
        format_aware_operations const * ops_;
    };

//========================================================================
// Implementation
//========================================================================

    inline node_list format_aware_operations::items(message const & m, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        if (!m.data)
            return {};
        return s.query.locate_items(*m.data);
    }

    inline node_list format_aware_operations::find(message const & m, item_predicate const & pred, format_type f) const
    {
        node_list out;
        for (auto & item : items(m, f))
            if (pred(*item))
                out.push_back(std::move(item));
        return out;
    }

    inline node_ptr format_aware_operations::find_first(message const & m, item_predicate const & pred, format_type f) const
    {
        for (auto & item : items(m, f))
            if (pred(*item))
                return item;
        return nullptr;
    }

    inline bool format_aware_operations::some(message const & m, item_predicate const & pred, format_type f) const
    {
        auto all = items(m, f);
        return std::any_of(all.begin(), all.end(), [&](node_ptr const & n) { return pred(*n); });
    }

    inline bool format_aware_operations::every(message const & m, item_predicate const & pred, format_type f) const
    {
        auto all = items(m, f);
        return std::all_of(all.begin(), all.end(), [&](node_ptr const & n) { return pred(*n); });
    }

    inline size_t format_aware_operations::count(message const & m, format_type f, item_predicate const & pred) const
    {
        auto all = items(m, f);
        if (!pred)
            return all.size();

        return static_cast<size_t>(
            std::count_if(all.begin(), all.end(), [&](node_ptr const & n) { return pred(*n); }));
    }

    template <typename Mapper>
    auto format_aware_operations::map(message const & m, Mapper && mapper, format_type f) const
        -> std::vector<std::decay_t<std::invoke_result_t<Mapper&, node const &>>>
    {
        std::vector<std::decay_t<std::invoke_result_t<Mapper&, node const &>>> out;

        auto all = items(m, f);
        out.reserve(all.size());

        for (auto const & item : all)
            out.push_back(mapper(*item));

        return out;
    }

    template <typename T, typename Reducer>
    T format_aware_operations::reduce(message const & m, Reducer && reducer, T initial, format_type f) const
    {
        T acc = std::move(initial);
        size_t index = 0;

        for (auto const & item : items(m, f))
            acc = reducer(std::move(acc), *item, index++);

        return acc;
    }

    inline std::map<std::string, node_list>
    format_aware_operations::group_by(message const & m, item_key const & key, format_type f) const
    {
        std::map<std::string, node_list> groups;

        for (auto & item : items(m, f))
            groups[key(*item)].push_back(std::move(item));

        return groups;
    }

    inline message format_aware_operations::rebuild(
        message const & m,
        node_list items,
        format_semantics const & s,
        metadata_entries record
    ) const
    {
        log_->debug("{} on {}: {} items", as_string(record["operation"]).value_or("?"),
            to_string(s.format), items.size());

        record["timestamp"] = detail::iso_timestamp();

        node_ptr data = m.data ? s.query.reconstruct(*m.data, std::move(items)) : nullptr;
        return with_data(m, std::move(data), "processing", std::move(record));
    }

    inline message format_aware_operations::filter(message const & m, item_predicate const & pred, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        auto all = items(m, f);

        node_list kept;
        for (auto const & item : all)
            if (pred(*item))
                kept.push_back(item);

        metadata_entries record
        {
            {"operation",      std::string("filter")},
            {"original_count", static_cast<double>(all.size())},
            {"filtered_count", static_cast<double>(kept.size())},
        };

        return rebuild(m, std::move(kept), s, std::move(record));
    }

    inline message format_aware_operations::transform(message const & m, item_transformer const & fn, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        auto all = items(m, f);

        node_list out;
        out.reserve(all.size());
        for (auto const & item : all)
            if (auto t = fn(item))
                out.push_back(std::move(t));

        metadata_entries record
        {
            {"operation",  std::string("transform")},
            {"item_count", static_cast<double>(out.size())},
        };

        return rebuild(m, std::move(out), s, std::move(record));
    }

    // Stable: equal items keep their original order.
    inline message format_aware_operations::sort(message const & m, item_less const & less, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        auto all = items(m, f);

        std::stable_sort(all.begin(), all.end(), [&](node_ptr const & a, node_ptr const & b)
        {
            return less(*a, *b);
        });

        metadata_entries record
        {
            {"operation",  std::string("sort")},
            {"item_count", static_cast<double>(all.size())},
        };

        return rebuild(m, std::move(all), s, std::move(record));
    }

    inline message format_aware_operations::take(message const & m, size_t n, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        auto all = items(m, f);
        auto original = all.size();

        if (n < all.size())
            all.resize(n);

        metadata_entries record
        {
            {"operation",      std::string("take")},
            {"original_count", static_cast<double>(original)},
            {"taken_count",    static_cast<double>(all.size())},
        };

        return rebuild(m, std::move(all), s, std::move(record));
    }

    inline message format_aware_operations::skip(message const & m, size_t n, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        auto all = items(m, f);
        auto original = all.size();

        all.erase(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(std::min(n, all.size())));

        metadata_entries record
        {
            {"operation",       std::string("skip")},
            {"original_count",  static_cast<double>(original)},
            {"skipped_count",   static_cast<double>(n)},
            {"remaining_count", static_cast<double>(all.size())},
        };

        return rebuild(m, std::move(all), s, std::move(record));
    }

    inline std::optional<primitive>
    format_aware_operations::extract_value(node const & n, std::string_view key, format_type f) const
    {
        return registry_.lookup(f).query.extract_value(n, key);
    }

    inline node_ptr format_aware_operations::navigate_path(node_ptr const & n, path const & segments, format_type f) const
    {
        auto const & s = registry_.lookup(f);
        if (!n)
            return nullptr;
        return s.query.navigate_path(n, segments);
    }

    inline format_aware_query format_aware_operations::query(message m, format_type f) const
    {
        registry_.lookup(f);    // unknown formats fail here, not mid-chain
        return format_aware_query(std::move(m), f, *this);
    }

    inline format_aware_query format_aware_operations::query(message m) const
    {
        auto f = m.context ? m.context->config.default_format : format_type::json;
        return query(std::move(m), f);
    }

} // namespace pf

#endif // PF_OPERATIONS_HPP
