#ifndef PF_TESTS_REGISTRY__
#define PF_TESTS_REGISTRY__

#include "pf_test_harness.hpp"
#include "pf_test_fixtures.hpp"

namespace pf::tests
{
    using namespace pf;

    inline format_semantics yaml_semantics_for_tests()
    {
        auto s = json_semantics();
        s.format = format_type::yaml;
        return s;
    }

    bool default_registry_has_three_formats()
    {
        auto r = make_default_registry();

        EXPECT(r.size() == 3, "json, csv and xml should be registered");
        EXPECT(r.contains(format_type::json), "json is registered");
        EXPECT(r.contains(format_type::csv), "csv is registered");
        EXPECT(r.contains(format_type::xml), "xml is registered");
        EXPECT(!r.contains(format_type::yaml), "yaml is not registered");

        auto formats = r.supported_formats();
        EXPECT(formats.size() == 3, "supported_formats lists every entry");
        EXPECT(formats.contains(format_type::xml), "xml is listed");

        return true;
    }

    bool lookup_miss_throws_not_registered()
    {
        auto r = make_default_registry();

        bool thrown = false;
        try
        {
            r.lookup(format_type::database);
        }
        catch (pipefitter_error const & e)
        {
            thrown = e.kind() == error_kind::not_registered;
        }

        EXPECT(thrown, "Unknown format should raise not_registered");
        EXPECT(r.find(format_type::database) == nullptr, "find reports a miss as null");

        return true;
    }

    bool register_overwrites_existing()
    {
        semantics_registry r;
        r.add(json_semantics());

        auto replacement = json_semantics();
        replacement.rules.comments = transformation_strategy::preserve;
        r.add(replacement);

        EXPECT(r.size() == 1, "Re-registering replaces, it does not add");
        EXPECT(r.lookup(format_type::json).rules.comments == transformation_strategy::preserve,
            "The latest record wins");

        return true;
    }

    bool extension_registers_formats_and_defaults()
    {
        semantics_registry    formats;
        configuration_manager config;
        extension_registry    extensions(formats, config);

        extension ext;
        ext.name    = "yaml-support";
        ext.version = "1.0.0";
        ext.formats.push_back(yaml_semantics_for_tests());
        ext.config.default_format = format_type::yaml;

        EXPECT(extensions.install(ext), "First install should succeed");
        EXPECT(formats.contains(format_type::yaml), "Extension formats are registered");
        EXPECT(config.defaults().default_format == format_type::yaml, "Extension defaults are merged");
        EXPECT(config.create().default_format == format_type::yaml, "New configurations see the merged default");
        EXPECT(extensions.has("yaml-support"), "Extension is listed by name");
        EXPECT(extensions.get("yaml-support")->version == "1.0.0", "Extension record is kept");

        return true;
    }

    bool duplicate_extension_rejected()
    {
        semantics_registry    formats;
        configuration_manager config;
        extension_registry    extensions(formats, config);

        extension ext;
        ext.name = "dup";

        EXPECT(extensions.install(ext), "First install should succeed");

        ext.formats.push_back(yaml_semantics_for_tests());
        EXPECT(!extensions.install(ext), "Second install under the same name fails");
        EXPECT(!formats.contains(format_type::yaml), "A rejected install changes nothing");
        EXPECT(extensions.count() == 1, "Only one extension is installed");

        return true;
    }

    bool uninstall_and_clear()
    {
        semantics_registry    formats;
        configuration_manager config;
        extension_registry    extensions(formats, config);

        extension a;
        a.name = "a";
        a.formats.push_back(yaml_semantics_for_tests());
        a.config.log_category = "ext-a";

        extension b;
        b.name = "b";

        extensions.install(a);
        extensions.install(b);
        EXPECT(extensions.list().size() == 2, "Both extensions are listed");

        EXPECT(extensions.uninstall("a"), "Installed extension can be uninstalled");
        EXPECT(!extensions.uninstall("a"), "Uninstalling twice reports a miss");
        EXPECT(formats.contains(format_type::yaml), "Registered formats stay registered");

        extensions.clear();
        EXPECT(extensions.count() == 0, "clear removes every extension");
        EXPECT(config.defaults().log_category == "pipefitter", "clear restores core defaults");

        return true;
    }

    void run_registry_tests()
    {
        SUBCAT("Semantics registry");
        RUN_TEST(default_registry_has_three_formats);
        RUN_TEST(lookup_miss_throws_not_registered);
        RUN_TEST(register_overwrites_existing);
        SUBCAT("Extensions");
        RUN_TEST(extension_registers_formats_and_defaults);
        RUN_TEST(duplicate_extension_rejected);
        RUN_TEST(uninstall_and_clear);
    }
}

#endif
