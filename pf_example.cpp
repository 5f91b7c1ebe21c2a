#include "include/pf.hpp"

#include <iostream>

// Example pipeline configuration
const char* example_config = R"(
// Pipefitter example settings
log_level      = info
default_format = xml
log_timestamps = false
log_category   = example
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

std::string text_of(pf::node const & n, std::string_view key)
{
    if (auto c = pf::child(n, key); c && c->value)
        return pf::to_display_string(*c->value);
    return {};
}

bool is_active(pf::node const & n)
{
    auto c = pf::child(n, "active");
    return c && c->value && pf::as_bool(*c->value).value_or(false);
}

// What an XML adapter would hand over for a small staff list.
pf::node_ptr build_staff_document()
{
    struct row { int id; const char* name; bool active; const char* department; };

    const row staff[] =
    {
        {1, "John Doe",   true,  "Engineering"},
        {2, "Jane Smith", false, "Marketing"},
        {3, "Bob Wilson", true,  "Engineering"},
        {4, "Ann Lee",    true,  "Sales"},
    };

    pf::node_list elements;
    elements.push_back(pf::make_instruction("xml-stylesheet", "href=\"staff.xsl\""));
    elements.push_back(pf::make_comment("exported nightly"));

    for (auto const & r : staff)
    {
        elements.push_back(pf::make_record("employee",
            {
                pf::make_field("name", r.name),
                pf::make_field("active", r.active),
                pf::make_field("department", r.department),
            },
            { pf::make_attribute("id", r.id) }));
    }

    return pf::make_record("staff", std::move(elements));
}

void show_configuration(pf::configuration const & cfg)
{
    print_separator("STEP 1: Configuration");

    std::cout << "log level:      " << pf::to_string(cfg.level) << "\n";
    std::cout << "default format: " << pf::to_string(cfg.default_format) << "\n";
    std::cout << "log category:   " << cfg.log_category << "\n";
}

void show_conversion(pf::transformation_engine const & engine, pf::message const & xml)
{
    print_separator("STEP 2: XML to JSON and CSV");

    std::cout << "XML input:\n" << pf::dump(xml.data) << "\n";

    auto json = engine.convert_envelope(xml, pf::format_type::xml, pf::format_type::json);
    std::cout << "As JSON (comments dropped, attributes become fields):\n" << pf::dump(json.data) << "\n";

    auto csv = engine.convert(xml.data, pf::format_type::xml, pf::format_type::csv);
    std::cout << "As CSV (comments and attributes promoted to comments):\n" << pf::dump(csv) << "\n";

    for (auto from : engine.supported_formats())
        for (auto to : engine.supported_formats())
            std::cout << pf::to_string(from) << " -> " << pf::to_string(to) << ": "
                      << (engine.is_compatible(from, to) ? "compatible" : "incompatible") << "\n";
}

void show_queries(pf::format_aware_operations const & ops, pf::message const & xml)
{
    print_separator("STEP 3: Format-aware queries");

    auto result = ops.query(xml)
        .filter(is_active)
        .sort([](pf::node const & a, pf::node const & b) { return text_of(a, "name") < text_of(b, "name"); })
        .take(2)
        .execute();

    std::cout << "First two active employees by name:\n";
    for (auto const & item : ops.items(result, pf::format_type::xml))
    {
        auto id = ops.extract_value(*item, "id", pf::format_type::xml);
        std::cout << "  #" << (id ? pf::to_display_string(*id) : "?") << " " << text_of(*item, "name") << "\n";
    }

    std::cout << "\nProcessing metadata:\n";
    for (auto const & [key, value] : result.metadata.at("processing"))
        std::cout << "  " << key << " = " << pf::to_display_string(value) << "\n";

    auto groups = ops.group_by(xml, [](pf::node const & n) { return text_of(n, "department"); }, pf::format_type::xml);

    std::cout << "\nHeadcount by department:\n";
    for (auto const & [department, members] : groups)
        std::cout << "  " << department << ": " << members.size() << "\n";

    pf::path p{ "@id" };
    auto first = ops.items(xml, pf::format_type::xml).front();
    if (auto id = ops.navigate_path(first, p, pf::format_type::xml))
        std::cout << "\nFirst employee id via path [\"@id\"]: " << pf::to_display_string(*id->value) << "\n";
}

void show_error_handling(pf::transformation_engine const & engine, pf::message const & xml)
{
    print_separator("STEP 4: Error handling");

    auto bad = pf::parse_configuration("log_level = chatty\ncolour = blue\n");
    std::cout << "Configuration diagnostics (" << bad.errors.size() << "):\n";
    for (auto const & e : bad.errors)
        std::cout << "  " << e.message << "\n";

    try
    {
        engine.convert(xml.data, pf::format_type::xml, pf::format_type::yaml);
        std::cout << "✗ Expected a registry miss\n";
    }
    catch (pf::pipefitter_error const & e)
    {
        std::cout << "\n✓ " << pf::to_string(e.kind()) << ": " << e.what() << "\n";
    }
}

int main()
{
    std::cout << R"(
 ___ _           __ _ _   _
| _ (_)_ __  ___/ _(_) |_| |_ ___ _ _
|  _/ | '_ \/ -_)  _| |  _|  _/ -_) '_|
|_| |_| .__/\___|_| |_|\__|\__\___|_|
      |_|

Semantic transformation layer - Example
Version 0.1.0
)" << std::endl;

    try
    {
        auto parsed = pf::parse_configuration_strict(example_config);

        auto ctx = std::make_shared<pf::pipeline_context>();
        ctx->config = pf::configuration_manager().create(parsed);

        auto log      = pf::make_logger(ctx->config);
        auto registry = pf::make_default_registry(log);

        pf::transformation_engine   engine(registry, log);
        pf::format_aware_operations ops(engine, log);

        auto xml = pf::make_message(build_staff_document(), ctx);

        show_configuration(ctx->config);
        show_conversion(engine, xml);
        show_queries(ops, xml);
        show_error_handling(engine, xml);

        print_separator("DONE");
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n✗ Example failed with exception: " << e.what() << "\n";
        return 1;
    }
}
