// pf_dump.hpp - Pipefitter - Node Tree Outline
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Human-readable outline of a node tree for logs and examples:
//
//   collection "users"
//     record "user" [@id=1]
//       field "name" = John
//
// Not a wire format; nothing reads it back.

#ifndef PF_DUMP_HPP
#define PF_DUMP_HPP

#include "pf_node.hpp"

#include <unordered_set>

namespace pf
{
    struct dump_options
    {
        size_t indent    = 2;
        size_t max_depth = 64;
    };

    std::string dump(node_ptr const & root, dump_options opt = {});

    namespace detail
    {
        class dumper
        {
        public:
            explicit dumper(dump_options opt) : opt_(opt) {}

            std::string run(node_ptr const & root)
            {
                if (!root)
                    return "(null)\n";

                write(*root, 0);
                return std::move(out_);
            }

        private:
            dump_options                     opt_;
            std::string                      out_;
            std::unordered_set<node const *> open_;

            void write(node const & n, size_t depth)
            {
                out_ += std::string(depth * opt_.indent, ' ');
                out_ += fmt::format("{} \"{}\"", to_string(n.kind), n.name);

                if (n.ns)    out_ += fmt::format(" ns={}", *n.ns);
                if (n.label) out_ += fmt::format(" label={}", *n.label);
                if (n.id)    out_ += fmt::format(" #{}", *n.id);

                if (n.attributes && !n.attributes->empty())
                {
                    out_ += " [";
                    bool first = true;
                    for (auto const & a : *n.attributes)
                    {
                        if (!a) continue;
                        if (!first) out_ += ' ';
                        first = false;
                        out_ += fmt::format("@{}", a->name);
                        if (a->value)
                            out_ += fmt::format("={}", to_display_string(*a->value));
                    }
                    out_ += ']';
                }

                if (n.value)
                    out_ += fmt::format(" = {}", to_display_string(*n.value));

                if (!n.back_refs.empty())
                    out_ += fmt::format(" (^{})", n.back_refs.size());

                // A node nested inside itself is printed once.
                if (open_.contains(&n))
                {
                    out_ += " (cycle)\n";
                    return;
                }

                if (depth >= opt_.max_depth && !n.children.empty())
                {
                    out_ += " ...\n";
                    return;
                }

                out_ += '\n';

                open_.insert(&n);
                for (auto const & c : n.children)
                    if (c)
                        write(*c, depth + 1);
                open_.erase(&n);
            }
        };
    }

    inline std::string dump(node_ptr const & root, dump_options opt)
    {
        return detail::dumper(opt).run(root);
    }

} // namespace pf

#endif // PF_DUMP_HPP
