#include "include/dxf.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

// A small floor plan: one layer table, one block and a few entities
const char* example_drawing = R"(0
SECTION
2
HEADER
9
$ACADVER
1
AC1027
9
$INSUNITS
70
4
9
$TDCREATE
40
2451544.91568287
0
ENDSEC
0
SECTION
2
TABLES
0
TABLE
2
LAYER
70
2
0
LAYER
2
Walls
70
0
62
7
6
Continuous
0
LAYER
2
Furniture
70
0
62
-3
6
Continuous
0
ENDTAB
0
ENDSEC
0
SECTION
2
BLOCKS
0
BLOCK
2
Chair
70
0
10
0.0
20
0.0
30
0.0
0
CIRCLE
8
Furniture
10
0.0
20
0.0
40
0.25
0
ENDBLK
0
ENDSEC
0
SECTION
2
ENTITIES
0
LWPOLYLINE
8
Walls
90
4
70
1
10
0.0
20
0.0
10
6.0
20
0.0
10
6.0
20
4.0
10
0.0
20
4.0
0
INSERT
8
Furniture
2
Chair
10
2.0
20
2.0
30
0.0
0
HATCH
8
Walls
2
SOLID
0
MTEXT
8
Walls
10
0.5
20
3.5
30
0.0
40
0.2
1
Living room
0
ENDSEC
0
EOF)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_diagnostics(std::vector<dxf::diagnostic> const & diagnostics)
{
    for (auto const & d : diagnostics)
    {
        std::cout << "  [" << dxf::to_string(d.level) << "]";
        if (d.loc.line)
            std::cout << " line " << d.loc.line;
        std::cout << ": " << d.message << "\n";
    }
}

void print_summary(dxf::drawing const & d)
{
    if (d.header)
    {
        std::cout << "HEADER: " << d.header->size() << " variables\n";
        if (auto v = d.header->find("$ACADVER"); v && std::holds_alternative<std::string>(v->value))
            std::cout << "  $ACADVER = " << std::get<std::string>(v->value) << "\n";
        if (auto v = d.header->find("$TDCREATE"); v && std::holds_alternative<std::string>(v->value))
            std::cout << "  $TDCREATE = " << std::get<std::string>(v->value) << "\n";
    }
    if (d.classes)
        std::cout << "CLASSES: " << d.classes->size() << "\n";
    if (d.tables)
    {
        std::cout << "TABLES:\n";
        if (d.tables->viewports)
            std::cout << "  VPORT: " << d.tables->viewports->records.size() << "\n";
        if (d.tables->line_types)
            std::cout << "  LTYPE: " << d.tables->line_types->records.size() << "\n";
        if (d.tables->layers)
        {
            std::cout << "  LAYER: " << d.tables->layers->records.size() << "\n";
            for (auto const & [name, layer] : d.tables->layers->records)
            {
                std::cout << "    " << name
                          << " color " << layer.color_index.value_or(0)
                          << (layer.visible == false ? " (hidden)" : "") << "\n";
            }
        }
    }
    if (d.blocks)
    {
        std::cout << "BLOCKS: " << d.blocks->size() << "\n";
        for (auto const & [name, b] : *d.blocks)
            std::cout << "  " << name << ": " << b.entities.size() << " entities\n";
    }
    if (d.entities)
    {
        std::cout << "ENTITIES: " << d.entities->size() << "\n";
        for (auto const & e : *d.entities)
        {
            auto const & common = dxf::common_of(e);
            std::cout << "  " << dxf::entity_type(e) << " on " << common.layer.value_or("<no layer>") << "\n";
        }
    }
    std::cout << "Total entities including blocks: " << dxf::entity_count(d) << "\n";
}

std::string read_file(char const * path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error(std::string("cannot open ") + path);

    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

void show_parsing(std::string const & text)
{
    print_separator("Parsing");

    auto result = dxf::parse(text);
    if (result.has_errors())
    {
        for (auto const & err : result.errors)
        {
            std::cout << "✗ " << dxf::to_string(err.kind) << " at line " << err.loc.line
                      << ": " << err.message << "\n";
        }
        print_diagnostics(result.diagnostics);
        return;
    }

    std::cout << "✓ Parsed successfully\n\n";
    print_summary(*result.document);

    if (!result.diagnostics.empty())
    {
        std::cout << "\nDiagnostics (" << result.diagnostics.size() << "):\n";
        print_diagnostics(result.diagnostics);
    }
}

void show_serialization(std::string const & text)
{
    print_separator("Serialization");

    auto result = dxf::parse(text);
    if (!result.document)
    {
        std::cout << "✗ Nothing to serialize\n";
        return;
    }

    std::string serialized = dxf::serialize_to_string(*result.document);

    std::cout << "Serialized output (first 300 chars):\n";
    std::cout << std::string(70, '-') << "\n";
    std::cout << serialized.substr(0, 300) << "\n";
    std::cout << (serialized.size() > 300 ? "...\n" : "");
    std::cout << std::string(70, '-') << "\n\n";

    auto again = dxf::parse(serialized);
    if (again.document && *again.document == *result.document)
        std::cout << "✓ Round-trip verification passed\n";
    else
        std::cout << "✗ Round-trip verification failed\n";
}

void show_custom_kind(std::string const & text)
{
    print_separator("Custom entity kinds");

    auto registry = dxf::entity_registry::with_builtin_handlers();
    registry.register_entity_handler("HATCH", dxf::generic_entity_handler());

    dxf::parse_options options;
    options.registry = &registry;
    options.min_severity = dxf::severity::warning;

    auto result = dxf::parse(text, options);
    if (!result.document || !result.document->entities)
        return;

    for (auto const & e : *result.document->entities)
    {
        if (auto h = std::get_if<dxf::custom_entity>(&e))
            std::cout << "✓ " << h->type << " kept with " << h->groups.size() << " groups\n";
    }

    dxf::serializer s(*result.document, { &registry });
    size_t lines = 0;
    for (auto const & line : s)
    {
        (void)line;
        ++lines;
    }
    std::cout << "✓ Written back as " << lines << " lines\n";
}

void show_error_handling()
{
    print_separator("Error Handling");

    // The start point has no 20 group
    const char* broken = "0\nSECTION\n2\nENTITIES\n0\nLINE\n10\n1.0\n30\n2.0\n0\nENDSEC\n0\nEOF";

    auto result = dxf::parse(broken);
    if (result.has_errors())
    {
        for (auto const & err : result.errors)
            std::cout << "✓ " << dxf::to_string(err.kind) << " at line " << err.loc.line << "\n";
    }
    else
    {
        std::cout << "✗ Expected a parse error but got none\n";
    }
}

int main(int argc, char** argv)
{
    std::cout << "DXF group-stream codec - Example\nVersion 0.1.0\n";

    try
    {
        std::string text = argc > 1 ? read_file(argv[1]) : std::string(example_drawing);

        show_parsing(text);
        show_serialization(text);
        show_custom_kind(text);
        show_error_handling();

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n✗ Failed with exception: " << e.what() << "\n";
        return 1;
    }
}
