#ifndef DXF_TESTS_DOCUMENTS__
#define DXF_TESTS_DOCUMENTS__

#include "dxf_test_harness.hpp"
#include "../include/dxf.hpp"

namespace dxf::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    // Wraps entity groups in an ENTITIES section.
    inline std::string entities_section(std::string const & body)
    {
        return "0\nSECTION\n2\nENTITIES\n" + body + "\n0\nENDSEC\n0\nEOF";
    }

    template <typename E>
    E const * entity_at(parse_context const & ctx, size_t i)
    {
        if (!ctx.document || !ctx.document->entities || ctx.document->entities->size() <= i)
            return nullptr;
        return std::get_if<E>(&(*ctx.document->entities)[i]);
    }

    inline size_t count_kind(parse_context const & ctx, diagnostic_kind kind)
    {
        return static_cast<size_t>(std::count_if(ctx.diagnostics.begin(), ctx.diagnostics.end(),
            [kind](diagnostic const & d) { return d.kind == kind; }));
    }

    inline size_t entities_in(parse_context const & ctx)
    {
        return ctx.document && ctx.document->entities ? ctx.document->entities->size() : 0;
    }

    inline std::optional<drawing> reparse(drawing const & d, entity_registry const * registry = nullptr)
    {
        auto text = serialize_to_string(d, { registry });
        auto ctx = parse(text, { registry });
        return ctx.document;
    }

    inline std::vector<std::string> output_lines(std::string const & text)
    {
        std::vector<std::string> out;
        for (auto l : split_lines(text))
            out.emplace_back(l);
        return out;
    }

    inline size_t count_code(std::vector<std::string> const & lines, std::string_view code)
    {
        size_t n = 0;
        for (size_t i = 0; i + 1 < lines.size(); i += 2)
        {
            if (lines[i] == code)
                ++n;
        }
        return n;
    }

//------------------------------------------
// FIXTURES
//------------------------------------------

    // One of everything the codec reads, in the order a CAD writer would
    // put it out.
    inline std::string const & sample_drawing()
    {
        static std::string const text = dxf_lines({
            "0", "SECTION",
            "2", "HEADER",
            "9", "$ACADVER",
            "1", "AC1027",
            "9", "$INSUNITS",
            "70", "4",
            "9", "$EXTMIN",
            "10", "-1.5",
            "20", "0.0",
            "30", "0.0",
            "9", "$LIMMAX",
            "10", "420.0",
            "20", "297.0",
            "9", "$TDCREATE",
            "40", "2451544.91568287",
            "9", "$REALWORLDSCALE",
            "290", "1",
            "0", "ENDSEC",

            "0", "SECTION",
            "2", "CLASSES",
            "0", "CLASS",
            "1", "ACDBDICTIONARYWDFLT",
            "2", "AcDbDictionaryWithDefault",
            "3", "ObjectDBX Classes",
            "90", "0",
            "91", "1",
            "280", "0",
            "281", "0",
            "0", "ENDSEC",

            "0", "SECTION",
            "2", "TABLES",
            "0", "TABLE",
            "2", "VPORT",
            "5", "8",
            "330", "0",
            "100", "AcDbSymbolTable",
            "70", "1",
            "0", "VPORT",
            "5", "29",
            "330", "8",
            "100", "AcDbSymbolTableRecord",
            "100", "AcDbViewportTableRecord",
            "2", "*ACTIVE",
            "70", "0",
            "10", "0.0",
            "20", "0.0",
            "11", "1.0",
            "21", "1.0",
            "12", "210.0",
            "22", "148.5",
            "40", "297.0",
            "41", "1.92",
            "292", "1",
            "282", "1",
            "421", "3355443",
            "0", "ENDTAB",
            "0", "TABLE",
            "2", "LTYPE",
            "5", "5",
            "70", "2",
            "0", "LTYPE",
            "5", "14",
            "2", "ByBlock",
            "70", "0",
            "3", "",
            "72", "65",
            "73", "0",
            "40", "0.0",
            "0", "LTYPE",
            "5", "16",
            "2", "DASHED",
            "70", "0",
            "3", "Dashed __ __ __ ",
            "72", "65",
            "73", "2",
            "40", "0.75",
            "49", "0.5",
            "74", "0",
            "49", "-0.25",
            "74", "0",
            "0", "ENDTAB",
            "0", "TABLE",
            "2", "LAYER",
            "5", "2",
            "70", "2",
            "0", "LAYER",
            "5", "10",
            "2", "0",
            "70", "0",
            "62", "7",
            "6", "Continuous",
            "370", "-3",
            "0", "LAYER",
            "5", "11",
            "2", "Hidden",
            "102", "{ACAD_XDICTIONARY",
            "360", "1F",
            "102", "}",
            "70", "1",
            "62", "-3",
            "6", "DASHED",
            "0", "ENDTAB",
            "0", "ENDSEC",

            "0", "SECTION",
            "2", "BLOCKS",
            "0", "BLOCK",
            "5", "20",
            "330", "1F",
            "100", "AcDbEntity",
            "8", "0",
            "100", "AcDbBlockBegin",
            "2", "Door",
            "70", "0",
            "10", "0.0",
            "20", "0.0",
            "30", "0.0",
            "3", "Door",
            "1", "",
            "0", "LINE",
            "5", "21",
            "8", "0",
            "10", "0.0",
            "20", "0.0",
            "30", "0.0",
            "11", "0.0",
            "21", "2.1",
            "31", "0.0",
            "0", "ARC",
            "5", "22",
            "8", "0",
            "10", "0.0",
            "20", "0.0",
            "40", "0.9",
            "50", "0.0",
            "51", "90.0",
            "0", "ENDBLK",
            "5", "23",
            "330", "1F",
            "8", "0",
            "0", "ENDSEC",

            "0", "SECTION",
            "2", "ENTITIES",
            "0", "INSERT",
            "5", "30",
            "8", "Doors",
            "2", "Door",
            "10", "5.0",
            "20", "0.0",
            "30", "0.0",
            "41", "1.0",
            "42", "1.0",
            "50", "90.0",
            "0", "LWPOLYLINE",
            "5", "31",
            "8", "Walls",
            "90", "4",
            "70", "1",
            "43", "0.0",
            "10", "0.0",
            "20", "0.0",
            "10", "10.0",
            "20", "0.0",
            "42", "0.5",
            "10", "10.0",
            "20", "8.0",
            "10", "0.0",
            "20", "8.0",
            "0", "MTEXT",
            "5", "32",
            "8", "Notes",
            "10", "1.0",
            "20", "1.0",
            "30", "0.0",
            "40", "0.25",
            "71", "1",
            "1", "Ground floor",
            "0", "POLYLINE",
            "5", "33",
            "8", "0",
            "66", "1",
            "10", "0.0",
            "20", "0.0",
            "30", "0.0",
            "70", "8",
            "0", "VERTEX",
            "5", "34",
            "8", "0",
            "10", "0.0",
            "20", "0.0",
            "30", "0.0",
            "70", "32",
            "0", "VERTEX",
            "5", "35",
            "8", "0",
            "10", "1.0",
            "20", "1.0",
            "30", "1.0",
            "70", "32",
            "0", "SEQEND",
            "5", "36",
            "8", "0",
            "0", "ENDSEC",
            "0", "EOF"
        });
        return text;
    }
}

#endif
