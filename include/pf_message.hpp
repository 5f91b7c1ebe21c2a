// pf_message.hpp - Pipefitter - Message Envelope
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef PF_MESSAGE_HPP
#define PF_MESSAGE_HPP

#include "pf_node.hpp"
#include "pf_config.hpp"

#include <map>

namespace pf
{
    // namespace -> (key -> value), e.g. "processing" -> "operation"
    using metadata_entries = std::map<std::string, primitive, std::less<>>;
    using metadata_map     = std::map<std::string, metadata_entries, std::less<>>;

    // Execution context owned by the pipeline; carried through untouched.
    struct pipeline_context
    {
        configuration config;
    };

    struct message
    {
        node_ptr                                 data;
        metadata_map                             metadata;
        std::shared_ptr<const pipeline_context>  context;
    };

    namespace detail
    {
        inline constexpr std::string_view NODE_MIME_TYPE = "application/x-pf-node";
    }

    inline message make_message(node_ptr data, std::shared_ptr<const pipeline_context> ctx = {})
    {
        message m;
        m.data    = std::move(data);
        m.context = std::move(ctx);
        m.metadata["data"]["format"] = std::string(detail::NODE_MIME_TYPE);
        return m;
    }

    inline std::optional<primitive> metadata_value(message const & m, std::string_view ns, std::string_view key)
    {
        auto outer = m.metadata.find(ns);
        if (outer == m.metadata.end())
            return std::nullopt;

        auto inner = outer->second.find(key);
        if (inner == outer->second.end())
            return std::nullopt;

        return inner->second;
    }

    // Copy of m carrying new data and one replaced metadata namespace;
    // every other namespace is kept.
    inline message with_data(message const & m, node_ptr data, std::string const & ns, metadata_entries entries)
    {
        message out = m;
        out.data = std::move(data);
        out.metadata[ns] = std::move(entries);
        return out;
    }

} // namespace pf

#endif // PF_MESSAGE_HPP
