#ifndef DXF_TESTS_STRUCTURE__
#define DXF_TESTS_STRUCTURE__

#include "dxf_test_harness.hpp"
#include "../include/dxf.hpp"

namespace dxf::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    struct flag_probe
    {
        std::optional<bool> low;
        std::optional<bool> middle;
        std::optional<bool> high;
    };

    inline constexpr flag_bit<flag_probe> probe_bits[] =
    {
        { 1,   &flag_probe::low },
        { 4,   &flag_probe::middle },
        { 128, &flag_probe::high },
    };

//------------------------------------------
// TESTS
//------------------------------------------

static bool structure_reads_2d_point_and_undoes_lookahead()
{
    std::string src = dxf_lines({ "10", "1.0", "20", "2.0", "8", "Layer0", "0", "EOF" });
    scanner sc(src);
    sc.next();

    point p = parse_point(sc);
    EXPECT(p.x == 1.0 && p.y == 2.0, "coordinates wrong");
    EXPECT(!p.z, "2D point given a z");
    EXPECT(sc.last()->code == 20, "cursor not left on the y component");
    EXPECT(sc.next().is(8, "Layer0"), "group after the point lost");

    return true;
}

static bool structure_reads_3d_point()
{
    std::string src = dxf_lines({ "11", "1.0", "21", "2.0", "31", "3.0", "0", "EOF" });
    scanner sc(src);
    sc.next();

    point p = parse_point(sc);
    EXPECT(p.z == 3.0, "z not read");
    EXPECT(sc.last()->code == 31, "cursor not left on the z component");
    EXPECT(sc.next().is(0, "EOF"), "group after the point lost");

    return true;
}

static bool structure_point_before_eof_leaves_stream_readable()
{
    std::string src = dxf_lines({ "10", "1.0", "20", "2.0", "0", "EOF" });
    scanner sc(src);
    sc.next();

    point p = parse_point(sc);
    EXPECT(!p.z, "EOF read as a z component");
    EXPECT(!sc.is_exhausted(), "lookahead onto EOF left the scanner exhausted");
    EXPECT(sc.next().is(0, "EOF"), "EOF not replayed");

    return true;
}

static bool structure_point_without_y_is_fatal()
{
    std::string src = dxf_lines({ "10", "1.0", "30", "3.0", "0", "EOF" });
    scanner sc(src);
    sc.next();

    std::optional<error<parse_error_kind>> err;
    try
    {
        parse_point(sc);
    }
    catch (parse_failure const & e)
    {
        err = e.err;
    }

    EXPECT(err && err->kind == parse_error_kind::malformed_point, "missing y not reported");
    EXPECT(err->loc.line == 3, "error not located at the offending group");

    return true;
}

static bool structure_reads_matrix()
{
    std::string src;
    for (int i = 1; i <= 16; ++i)
        src += "47\n" + format_float(static_cast<double>(i)) + "\n";
    src += "0\nEOF";

    scanner sc(src);
    sc.next();

    matrix4 m = parse_matrix(sc);
    EXPECT(m[0] == 1.0 && m[15] == 16.0, "matrix values out of order");
    EXPECT(sc.next().is(0, "EOF"), "matrix read too far");

    return true;
}

static bool structure_short_matrix_is_fatal()
{
    std::string src;
    for (int i = 0; i < 15; ++i)
        src += "47\n0.0\n";
    src += "40\n1.0\n0\nEOF";

    scanner sc(src);
    sc.next();

    bool failed = false;
    try
    {
        parse_matrix(sc);
    }
    catch (parse_failure const & e)
    {
        failed = e.err.kind == parse_error_kind::malformed_matrix;
    }
    EXPECT(failed, "short matrix not reported");

    return true;
}

static bool structure_decomposes_flags()
{
    flag_probe p;
    decompose_flags<flag_probe>(p, 133, probe_bits);
    EXPECT(p.low == true && p.middle == true && p.high == true, "133 not decomposed into 1, 4 and 128");

    decompose_flags<flag_probe>(p, 4, probe_bits);
    EXPECT(p.low == false && p.middle == true && p.high == false, "clear bits not recorded as false");

    return true;
}

static bool structure_decomposes_polyline_flags()
{
    polyline_entity e;
    decompose_flags<polyline_entity>(e, 133, polyline_flag_bits);

    EXPECT(e.closed == true, "bit 1 not set");
    EXPECT(e.spline_fit == true, "bit 4 not set");
    EXPECT(e.plinegen == true, "bit 128 not set");
    EXPECT(e.curve_fit == false && e.is_3d_polyline == false && e.is_polyface == false, "unset bits not false");

    return true;
}

static bool structure_splits_chunks()
{
    std::string text(600, 'x');
    auto chunks = split_chunks(text);

    EXPECT(chunks.size() == 3, "expected three chunks");
    EXPECT(chunks[0].size() == 250 && chunks[1].size() == 250 && chunks[2].size() == 100, "chunk sizes wrong");

    EXPECT(split_chunks("").size() == 1, "empty text not one empty chunk");

    return true;
}

static bool structure_chunks_keep_utf8_sequences_whole()
{
    // 249 ASCII bytes then a two-byte sequence straddling the limit
    std::string text(249, 'a');
    text += "\xC3\xA9";
    text += std::string(10, 'b');

    auto chunks = split_chunks(text);
    EXPECT(chunks.size() == 2, "expected two chunks");
    EXPECT(chunks[0].size() == 249, "cut inside a UTF-8 sequence");
    EXPECT(chunks[1].substr(0, 2) == "\xC3\xA9", "sequence not moved to the next chunk");

    return true;
}

static bool structure_writer_chooses_chunk_codes()
{
    std::deque<std::string> out;
    group_writer w(out);

    w.write_chunked(1, 3, "short");
    EXPECT(out.size() == 2 && out[0] == "1" && out[1] == "short", "short text not under the single code");

    out.clear();
    w.write_chunked(1, 3, std::string(600, 'y'));
    EXPECT(out.size() == 6, "expected three groups");
    EXPECT(out[0] == "3" && out[2] == "3" && out[4] == "3", "chunks not under the chunk code");
    EXPECT(out[5].size() == 100, "last chunk wrong");

    return true;
}

static bool structure_writer_omits_absent_z()
{
    std::deque<std::string> out;
    group_writer w(out);

    w.write_point(10, point{ 1.0, 2.0, std::nullopt });
    EXPECT(out.size() == 4, "2D point written with a z");
    EXPECT(out[0] == "10" && out[1] == "1.0" && out[2] == "20" && out[3] == "2.0", "point lines wrong");

    out.clear();
    w.write(40, std::optional<double>{});
    EXPECT(out.empty(), "absent field written");

    return true;
}

//------------------------------------------
// RUNNER
//------------------------------------------

inline void run_structure_tests()
{
    SUBCAT("Points and matrices");
    RUN_TEST(structure_reads_2d_point_and_undoes_lookahead);
    RUN_TEST(structure_reads_3d_point);
    RUN_TEST(structure_point_before_eof_leaves_stream_readable);
    RUN_TEST(structure_point_without_y_is_fatal);
    RUN_TEST(structure_reads_matrix);
    RUN_TEST(structure_short_matrix_is_fatal);

    SUBCAT("Flags");
    RUN_TEST(structure_decomposes_flags);
    RUN_TEST(structure_decomposes_polyline_flags);

    SUBCAT("Chunked text");
    RUN_TEST(structure_splits_chunks);
    RUN_TEST(structure_chunks_keep_utf8_sequences_whole);
    RUN_TEST(structure_writer_chooses_chunk_codes);
    RUN_TEST(structure_writer_omits_absent_z);
}

} // ns dxf::tests

#endif
