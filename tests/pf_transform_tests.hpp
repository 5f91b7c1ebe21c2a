#ifndef PF_TESTS_TRANSFORM__
#define PF_TESTS_TRANSFORM__

#include "pf_test_harness.hpp"
#include "pf_test_fixtures.hpp"

namespace pf::tests
{
    using namespace pf;

    // JSON-shaped custom format with one rule changed.
    inline format_semantics custom_format(transformation_rules rules)
    {
        auto s = json_semantics();
        s.format = format_type::custom;
        s.rules  = rules;
        s.kind_to_role.emplace(node_kind::attributes, semantic_role::metadata);
        s.role_to_kind.emplace(semantic_role::metadata, node_kind::attributes);
        s.role_to_kind.emplace(semantic_role::annotation, node_kind::comment);
        return s;
    }

    // -----------------------------------------------------------------
    // Round trips
    // -----------------------------------------------------------------

    bool json_to_xml_and_back_is_identity()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto original = json_users();
        auto xml  = engine.convert(original, format_type::json, format_type::xml);
        auto back = engine.convert(xml, format_type::xml, format_type::json);

        EXPECT(xml != nullptr && back != nullptr, "Conversions should produce trees");
        EXPECT(xml != original, "Conversion builds new nodes");
        EXPECT(equivalent(*back, *original), "Round trip should preserve the tree");

        std::vector<primitive> before, after;
        collect_values(*original, before);
        collect_values(*back, after);
        EXPECT(before == after, "Every leaf value survives in order");

        return true;
    }

    bool same_format_conversion_is_equivalent()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto original = xml_users();
        auto out = engine.convert(original, format_type::xml, format_type::xml);

        EXPECT(equivalent(*out, *original), "XML to XML keeps comments and attributes");
        return true;
    }

    bool null_input_converts_to_null()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        EXPECT(engine.convert(nullptr, format_type::json, format_type::xml) == nullptr, "Null in, null out");
        return true;
    }

    bool unknown_format_fails_convert()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        bool thrown = false;
        try
        {
            engine.convert(json_users(), format_type::json, format_type::yaml);
        }
        catch (pipefitter_error const & e)
        {
            thrown = e.kind() == error_kind::not_registered;
        }

        EXPECT(thrown, "Unregistered target should raise not_registered");

        thrown = false;
        try
        {
            engine.convert(nullptr, format_type::database, format_type::json);
        }
        catch (pipefitter_error const &)
        {
            thrown = true;
        }

        EXPECT(thrown, "Formats are checked even for null input");
        return true;
    }

    // -----------------------------------------------------------------
    // Strategies
    // -----------------------------------------------------------------

    bool drop_removes_every_annotation()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto deep = make_record("doc",
        {
            make_comment("top"),
            make_record("a",
            {
                make_comment("middle"),
                make_record("b", { make_comment("bottom"), make_field("x", 1) }),
            }),
            make_comment("tail"),
        });

        auto out = engine.convert(deep, format_type::xml, format_type::json);

        EXPECT(!contains_kind(*out, node_kind::comment), "No comment survives a drop rule");
        EXPECT(out->children.size() == 1, "Only the record remains at the top");
        EXPECT(child(*child(*child(*out, "a"), "b"), "x") != nullptr, "Structure around dropped nodes is kept");

        return true;
    }

    bool flatten_splices_in_order()
    {
        auto registry = make_default_registry();
        transformation_rules rules;
        rules.collections = transformation_strategy::flatten;
        registry.add(custom_format(rules));
        transformation_engine engine(registry);

        auto doc = make_record("doc",
        {
            make_field("a", 1),
            make_collection("group",
            {
                make_field("b", 2),
                make_collection("inner", { make_field("c", 3) }),
                make_field("d", 4),
            }),
            make_field("e", 5),
        });

        auto out = engine.convert(doc, format_type::json, format_type::custom);

        EXPECT(out->children.size() == 5, "Flattened children are spliced into the parent");

        std::string order;
        for (auto const & c : out->children)
            order += c->name;
        EXPECT(order == "abcde", "Spliced children keep document order");
        EXPECT(!contains_kind(*out, node_kind::collection), "No flattened container remains");

        return true;
    }

    bool promote_turns_into_comments()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto out = engine.convert(xml_users(), format_type::xml, format_type::csv);

        EXPECT(out->children[0]->kind == node_kind::comment, "CSV keeps comments as comments");

        auto first = out->children[1];
        EXPECT(first->attributes.has_value(), "Attributes are promoted, not dropped");
        EXPECT((*first->attributes)[0]->kind == node_kind::comment, "Promoted attributes become comments");
        EXPECT(as_number(*(*first->attributes)[0]->value) == 1.0, "Promoted attribute keeps its value");

        return true;
    }

    bool demote_turns_into_metadata()
    {
        auto registry = make_default_registry();
        transformation_rules rules;
        rules.records = transformation_strategy::demote;
        registry.add(custom_format(rules));
        transformation_engine engine(registry);

        auto out = engine.convert(json_users(), format_type::json, format_type::custom);

        EXPECT(out->children.size() == sample_users().size(), "Demoted items stay in place");
        for (auto const & c : out->children)
            EXPECT(c->kind == node_kind::attributes, "Demoted items become attributes");
        EXPECT(child(*out->children[0], "name") != nullptr, "Demoted items keep their children");

        return true;
    }

    bool convert_retypes_attributes_as_fields()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto el = make_record("user", { make_node(node_kind::attributes, "meta") }, { make_attribute("id", 7) });

        auto out = engine.convert(el, format_type::xml, format_type::json);

        EXPECT(out->attributes.has_value(), "Attribute list survives convert");
        EXPECT((*out->attributes)[0]->kind == node_kind::field, "Attribute entries become fields");
        EXPECT(out->children[0]->kind == node_kind::field, "Metadata children become fields");
        EXPECT(el->children[0]->kind == node_kind::attributes, "Input is untouched");

        return true;
    }

    bool attribute_drop_gives_absent_list()
    {
        auto registry = make_default_registry();
        transformation_rules rules;
        rules.attributes = transformation_strategy::drop;
        registry.add(custom_format(rules));
        transformation_engine engine(registry);

        auto out = engine.convert(xml_users(), format_type::xml, format_type::custom);

        for (auto const & c : out->children)
            EXPECT(!c->attributes.has_value(), "Dropped attributes leave no list behind");

        return true;
    }

    bool attribute_flatten_splices_entries()
    {
        auto registry = make_default_registry();
        transformation_rules rules;
        rules.attributes = transformation_strategy::flatten;
        registry.add(custom_format(rules));
        transformation_engine engine(registry);

        auto el = make_record("user", {},
        {
            make_attribute("id", 1),
            make_attribute("lang", "en"),
        });

        auto out = engine.convert(el, format_type::xml, format_type::custom);

        EXPECT(!out->attributes.has_value(), "Leaf attributes flatten to nothing");
        return true;
    }

    // -----------------------------------------------------------------
    // Graphs
    // -----------------------------------------------------------------

    bool back_refs_follow_the_conversion()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto a = make_record("user", { make_field("name", "a") });
        auto b = make_record("user", { make_field("name", "b") });
        node_ptr users = make_collection("users", { a, b });
        add_back_ref(*a, users);
        add_back_ref(*b, users);

        auto out = engine.convert(users, format_type::json, format_type::xml);

        auto refs = back_refs(*out->children[0]);
        EXPECT(refs.size() == 1, "Back-reference is carried over");
        EXPECT(refs[0] == out, "Back-reference points at the converted container");
        EXPECT(back_refs(*out->children[1])[0] == out, "Every item is linked");

        return true;
    }

    bool external_and_dropped_referents()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        node_ptr outside = make_record("elsewhere");
        node_ptr note    = make_comment("annotated");

        auto item = make_record("user");
        add_back_ref(*item, outside);
        add_back_ref(*item, note);

        auto doc = make_record("doc", { note, item });
        auto out = engine.convert(doc, format_type::xml, format_type::json);

        auto refs = back_refs(*child(*out, "user"));
        EXPECT(refs.size() == 1, "Reference to a dropped node is omitted");
        EXPECT(refs[0] == outside, "External referents pass through unchanged");

        return true;
    }

    bool shared_subtrees_stay_shared()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        node_ptr shared = make_record("user", { make_field("name", "twice") });
        auto doc = make_collection("users", { shared, shared });

        auto out = engine.convert(doc, format_type::json, format_type::xml);

        EXPECT(out->children.size() == 2, "Both occurrences are present");
        EXPECT(out->children[0] == out->children[1], "A shared node is built once");

        return true;
    }

    bool mutual_back_refs_terminate()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto a = make_record("a");
        auto b = make_record("b");
        node_ptr doc = make_collection("doc", { a, b });
        add_back_ref(*a, b);
        add_back_ref(*b, a);
        add_back_ref(*a, a);

        auto out = engine.convert(doc, format_type::json, format_type::xml);

        auto oa = child(*out, "a");
        auto ob = child(*out, "b");
        EXPECT(back_refs(*oa).size() == 2, "Both references on a survive");
        EXPECT(back_refs(*oa)[0] == ob, "a refers to the converted b");
        EXPECT(back_refs(*oa)[1] == oa, "A self reference stays a self reference");
        EXPECT(back_refs(*ob)[0] == oa, "b refers to the converted a");

        return true;
    }

    // -----------------------------------------------------------------
    // Envelope and compatibility
    // -----------------------------------------------------------------

    bool envelope_records_provenance()
    {
        auto registry = make_default_registry();
        transformation_engine engine(registry);

        auto in  = make_message(json_users());
        auto out = engine.convert_envelope(in, format_type::json, format_type::xml);

        EXPECT(metadata_value(out, "transformation", "source_format") == primitive{ std::string("json") },
            "Source format is recorded");
        EXPECT(metadata_value(out, "transformation", "target_format") == primitive{ std::string("xml") },
            "Target format is recorded");
        EXPECT(metadata_value(out, "transformation", "transformed_at").has_value(), "Timestamp is recorded");
        EXPECT(metadata_value(out, "data", "format").has_value(), "Existing metadata is kept");

        EXPECT(!in.metadata.contains("transformation"), "Input message is not modified");
        EXPECT(in.data != out.data, "Output carries the converted payload");
        EXPECT(equivalent(*in.data, *json_users()), "Input payload is untouched");

        return true;
    }

    bool compatibility_from_tables()
    {
        auto registry = make_default_registry();

        format_semantics no_items = json_semantics();
        no_items.format = format_type::custom;
        no_items.role_to_kind.erase(semantic_role::item);
        registry.add(no_items);

        transformation_engine engine(registry);

        EXPECT(engine.is_compatible(format_type::json, format_type::csv), "json to csv is compatible");
        EXPECT(engine.is_compatible(format_type::xml, format_type::json), "xml to json is compatible");
        EXPECT(!engine.is_compatible(format_type::json, format_type::custom), "No item slot, no compatibility");
        EXPECT(!engine.is_compatible(format_type::xml, format_type::custom), "Incompatible from any source");
        EXPECT(!engine.is_compatible(format_type::json, format_type::yaml), "Unregistered formats are incompatible");
        EXPECT(engine.supported_formats().size() == 4, "Engine sees the registry's formats");

        return true;
    }

    void run_transform_tests()
    {
        SUBCAT("Round trips");
        RUN_TEST(json_to_xml_and_back_is_identity);
        RUN_TEST(same_format_conversion_is_equivalent);
        RUN_TEST(null_input_converts_to_null);
        RUN_TEST(unknown_format_fails_convert);
        SUBCAT("Strategies");
        RUN_TEST(drop_removes_every_annotation);
        RUN_TEST(flatten_splices_in_order);
        RUN_TEST(promote_turns_into_comments);
        RUN_TEST(demote_turns_into_metadata);
        RUN_TEST(convert_retypes_attributes_as_fields);
        RUN_TEST(attribute_drop_gives_absent_list);
        RUN_TEST(attribute_flatten_splices_entries);
        SUBCAT("Graphs");
        RUN_TEST(back_refs_follow_the_conversion);
        RUN_TEST(external_and_dropped_referents);
        RUN_TEST(shared_subtrees_stay_shared);
        RUN_TEST(mutual_back_refs_terminate);
        SUBCAT("Envelope and compatibility");
        RUN_TEST(envelope_records_provenance);
        RUN_TEST(compatibility_from_tables);
    }
}

#endif
