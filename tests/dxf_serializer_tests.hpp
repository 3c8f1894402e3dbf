#ifndef DXF_TESTS_SERIALIZER__
#define DXF_TESTS_SERIALIZER__

#include "dxf_test_harness.hpp"
#include "dxf_test_documents.hpp"
#include "../include/dxf.hpp"

#include <sstream>

namespace dxf::tests
{
//------------------------------------------
// TESTS
//------------------------------------------

static bool serializer_writes_minimal_header_exactly()
{
    std::string const src = "0\nSECTION\n2\nHEADER\n9\n$ACADVER\n1\nAC1014\n0\nENDSEC\n0\nEOF";

    auto ctx = parse(src);
    EXPECT(ctx.document, "document not produced");
    EXPECT(serialize_to_string(*ctx.document) == src, "output differs from input");

    return true;
}

static bool serializer_writes_empty_drawing_as_eof()
{
    EXPECT(serialize_to_string(drawing{}) == "0\nEOF", "empty drawing not written as a bare EOF");

    return true;
}

static bool serializer_writes_no_trailing_newline()
{
    auto ctx = parse(sample_drawing());
    auto text = serialize_to_string(*ctx.document);

    EXPECT(!text.empty() && text.back() != '\n', "trailing newline written");
    EXPECT(text.ends_with("0\nEOF"), "output does not end with EOF");

    return true;
}

static bool serializer_keeps_empty_sections_and_skips_absent_ones()
{
    drawing d;
    d.blocks = blocks_section{};
    d.entities = dxf::entities_section{};

    auto text = serialize_to_string(d);
    EXPECT(text == "0\nSECTION\n2\nBLOCKS\n0\nENDSEC\n0\nSECTION\n2\nENTITIES\n0\nENDSEC\n0\nEOF",
           "empty sections not written as empty, or absent ones written");

    return true;
}

static bool serializer_uses_canonical_section_order()
{
    auto ctx = parse(dxf_lines({
        "0", "SECTION", "2", "ENTITIES", "0", "ENDSEC",
        "0", "SECTION", "2", "HEADER", "9", "$ACADVER", "1", "AC1009", "0", "ENDSEC",
        "0", "EOF"
    }));

    auto text = serialize_to_string(*ctx.document);
    EXPECT(text.starts_with("0\nSECTION\n2\nHEADER"), "HEADER not written first");
    EXPECT(text.find("ENTITIES") > text.find("HEADER"), "ENTITIES written before HEADER");

    return true;
}

static bool serializer_is_lazy()
{
    int writes = 0;
    auto registry = entity_registry::with_builtin_handlers();
    registry.register_entity_handler("COUNTED", entity_handler{
        {},
        [&writes](entity const &, group_writer & w)
        {
            ++writes;
            w.write_text(1, "counted");
        }
    });

    custom_entity e;
    e.type = "COUNTED";

    drawing d;
    d.entities = dxf::entities_section{ e, e, e };

    serializer s(d, { &registry });
    for (int i = 0; i < 6; ++i)
        EXPECT(s.next().has_value(), "output ended early");

    EXPECT(writes == 1, "entities rendered ahead of demand");

    s.to_string();
    EXPECT(writes == 3, "remaining entities not rendered on drain");
    EXPECT(!s.next().has_value(), "lines produced after EOF");

    return true;
}

static bool serializer_iterates_lines()
{
    drawing d;
    d.entities = dxf::entities_section{};

    serializer s(d);
    std::vector<std::string> lines;
    for (auto const & line : s)
        lines.push_back(line);

    EXPECT(lines.size() == 8, "wrong number of lines");
    EXPECT(lines.front() == "0" && lines.back() == "EOF", "iteration order wrong");

    return true;
}

static bool serializer_stream_matches_string()
{
    auto ctx = parse(sample_drawing());

    std::ostringstream out;
    serializer(*ctx.document).write(out);

    EXPECT(out.str() == serialize_to_string(*ctx.document), "stream and string output differ");

    return true;
}

//----------------------------------------------------------------------
// Hand-built drawings
//----------------------------------------------------------------------

static bool serializer_falls_back_to_header_catalog()
{
    drawing d;
    d.header.emplace();
    d.header->set("$INSUNITS", header_variable{ int64_t{ 4 }, std::nullopt });
    d.header->set("$MYVAR", header_variable{ std::string("x"), std::nullopt });

    serializer s(d);
    auto text = s.to_string();

    EXPECT(text.find("9\n$INSUNITS\n70\n4") != std::string::npos, "catalog code not used");
    EXPECT(text.find("$MYVAR") == std::string::npos, "variable without a code written");
    EXPECT(s.diagnostics().size() == 1 && s.diagnostics()[0].kind == diagnostic_kind::unknown_header_variable,
           "unknown variable not reported");

    return true;
}

static bool serializer_writes_dates_as_julian()
{
    drawing d;
    d.header.emplace();
    d.header->set("$TDCREATE", header_variable{ std::string("1999-12-31T00:00:00.000Z"), std::nullopt });

    auto text = serialize_to_string(d);
    EXPECT(text.find("9\n$TDCREATE\n40\n2451544.5") != std::string::npos, "date not written as a julian day");

    return true;
}

static bool serializer_rejects_unrenderable_values()
{
    drawing d;
    d.header.emplace();
    d.header->set("$ACADVER", header_variable{ 4.5, 1 });

    bool thrown = false;
    try
    {
        serialize_to_string(d);
    }
    catch (serialize_failure const &)
    {
        thrown = true;
    }
    EXPECT(thrown, "float written under a text code");

    return true;
}

static bool serializer_writes_hidden_layer_color_negative()
{
    layer_record r;
    r.name = "L";
    r.color_index = 3;
    r.visible = false;

    layer_table layers;
    layers.records.set("L", r);

    drawing d;
    d.tables.emplace();
    d.tables->layers = layers;

    auto text = serialize_to_string(d);
    EXPECT(text.find("62\n-3") != std::string::npos, "hidden layer color not negated");

    auto back = reparse(d);
    EXPECT(back && back->tables->layers->records.find("L")->visible == false, "hidden layer read back visible");

    return true;
}

static bool serializer_omits_absent_fields()
{
    line_entity l;
    l.start = point{ 1.0, 2.0, std::nullopt };

    drawing d;
    d.entities = dxf::entities_section{ l };

    auto lines = output_lines(serialize_to_string(d));
    EXPECT(count_code(lines, "10") == 1 && count_code(lines, "20") == 1, "start point not written");
    EXPECT(count_code(lines, "30") == 0, "absent z written");
    EXPECT(count_code(lines, "11") == 0, "absent end point written");
    EXPECT(count_code(lines, "8") == 0, "absent layer written");

    return true;
}

//------------------------------------------
// RUNNER
//------------------------------------------

inline void run_serializer_tests()
{
    SUBCAT("Output shape");
    RUN_TEST(serializer_writes_minimal_header_exactly);
    RUN_TEST(serializer_writes_empty_drawing_as_eof);
    RUN_TEST(serializer_writes_no_trailing_newline);
    RUN_TEST(serializer_keeps_empty_sections_and_skips_absent_ones);
    RUN_TEST(serializer_uses_canonical_section_order);

    SUBCAT("Pull model");
    RUN_TEST(serializer_is_lazy);
    RUN_TEST(serializer_iterates_lines);
    RUN_TEST(serializer_stream_matches_string);

    SUBCAT("Hand-built drawings");
    RUN_TEST(serializer_falls_back_to_header_catalog);
    RUN_TEST(serializer_writes_dates_as_julian);
    RUN_TEST(serializer_rejects_unrenderable_values);
    RUN_TEST(serializer_writes_hidden_layer_color_negative);
    RUN_TEST(serializer_omits_absent_fields);
}

} // ns dxf::tests

#endif
