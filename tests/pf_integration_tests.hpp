#ifndef PF_TESTS_INTEGRATION__
#define PF_TESTS_INTEGRATION__

#include "pf_test_harness.hpp"
#include "pf_test_fixtures.hpp"
#include "pf_config_tests.hpp"
#include "pf_operations_tests.hpp"

namespace pf::tests
{
    using namespace pf;

    bool xml_feed_to_json_report()
    {
        auto registry = make_default_registry();
        transformation_engine   engine(registry);
        format_aware_operations ops(engine);

        auto in   = make_message(xml_users());
        auto json = engine.convert_envelope(in, format_type::xml, format_type::json);

        auto active = ops.query(json, format_type::json)
            .filter(is_active)
            .sort([](node const & a, node const & b) { return field_text(a, "name") < field_text(b, "name"); })
            .execute();

        auto names = names_of(ops.items(active, format_type::json));
        std::vector<std::string> expected{ "Ann Lee", "Bob Wilson", "John Doe" };
        EXPECT(names == expected, "Active users sorted by name");

        auto ids = ops.map(active, [&](node const & n)
        {
            auto a = attribute(n, "id");
            return a ? as_number(*a->value).value_or(-1.0) : -1.0;
        }, format_type::json);
        EXPECT(ids == std::vector<double>({ 4.0, 3.0, 1.0 }), "Converted attributes travel with their items");
        EXPECT((*attribute(*ops.items(active, format_type::json)[0], "id")).kind == node_kind::field,
            "JSON carries attributes as fields");

        EXPECT(metadata_value(active, "transformation", "target_format") == primitive{ std::string("json") },
            "Conversion provenance survives later operations");
        EXPECT(metadata_value(active, "processing", "operation") == primitive{ std::string("sort") },
            "Last operation is recorded");

        return true;
    }

    bool table_round_trip_through_csv()
    {
        auto registry = make_default_registry();
        transformation_engine   engine(registry);
        format_aware_operations ops(engine);

        auto csv = engine.convert(json_users(), format_type::json, format_type::csv);
        EXPECT(ops.count(make_message(csv), format_type::csv) == 0, "Converted items keep their JSON names");

        auto renamed = ops.transform(make_message(csv_users()), [](node_ptr const & n) { return n; }, format_type::csv);
        auto json = engine.convert(renamed.data, format_type::csv, format_type::json);

        EXPECT(ops.count(make_message(json), format_type::json) == 4, "Rows become JSON items");

        path p{ "row", "2", "department" };
        auto dept = ops.navigate_path(renamed.data, p, format_type::csv);
        EXPECT(dept && as_string(*dept->value) == "Engineering", "Path into the third row");

        return true;
    }

    bool components_log_through_configuration()
    {
        auto overrides = parse_configuration("log_level = debug\nlog_timestamps = false\nlog_category = it");
        EXPECT(!overrides.has_errors(), "Configuration should parse");

        auto cfg = configuration_manager().create(overrides.result);

        std::FILE* f = std::tmpfile();
        EXPECT(f != nullptr, "Temporary file should open");

        auto log = make_logger(cfg, f);
        {
            auto registry = make_default_registry(log);
            registry.add(json_semantics());

            transformation_engine engine(registry, log);
            engine.convert(json_users(), format_type::json, format_type::xml);

            format_aware_operations ops(engine, log);
            ops.take(make_message(json_users()), 2, format_type::json);

            try
            {
                registry.lookup(format_type::yaml);
            }
            catch (pipefitter_error const &)
            {
                log.info("lookup failed as expected");
            }
        }

        auto text = read_back(f);
        std::fclose(f);

        EXPECT(text.find("[it] [DEBUG] registered format semantics for 'csv'") != std::string::npos, "Registration is logged");
        EXPECT(text.find("[it] [WARN] replaced format semantics for 'json'") != std::string::npos, "Overwrite is a warning");
        EXPECT(text.find("converted 'users' from json to xml") != std::string::npos, "Conversion is logged");
        EXPECT(text.find("take on json: 2 items") != std::string::npos, "Operations are logged");
        EXPECT(text.find("[ERROR] no semantics registered for format 'yaml'") != std::string::npos, "Registry miss is logged");

        return true;
    }

    bool dump_outlines_a_tree()
    {
        auto text = dump(xml_users());

        EXPECT(text.starts_with("record \"users\"\n"), "Root line names kind and name");
        EXPECT(text.find("  comment \"#comment\" = exported users\n") != std::string::npos, "Values follow '='");
        EXPECT(text.find("  record \"user\" [@id=1]\n") != std::string::npos, "Attributes are bracketed");
        EXPECT(text.find("    field \"name\" = John Doe\n") != std::string::npos, "Children are indented");
        EXPECT(dump(nullptr) == "(null)\n", "Null trees are marked");

        dump_options shallow;
        shallow.max_depth = 0;
        EXPECT(dump(xml_users(), shallow) == "record \"users\" ...\n", "Depth limit elides children");

        return true;
    }

    void run_integration_tests()
    {
        SUBCAT("Pipelines");
        RUN_TEST(xml_feed_to_json_report);
        RUN_TEST(table_round_trip_through_csv);
        SUBCAT("Ambient");
        RUN_TEST(components_log_through_configuration);
        RUN_TEST(dump_outlines_a_tree);
    }
}

#endif
