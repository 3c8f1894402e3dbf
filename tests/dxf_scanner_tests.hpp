#ifndef DXF_TESTS_SCANNER__
#define DXF_TESTS_SCANNER__

#include "dxf_test_harness.hpp"
#include "../include/dxf_scanner.hpp"

namespace dxf::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    template <typename F>
    std::optional<parse_error_kind> failure_kind(F && f)
    {
        try
        {
            f();
        }
        catch (parse_failure const & e)
        {
            return e.err.kind;
        }
        return std::nullopt;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool scanner_reads_typed_groups()
{
    std::string src = dxf_lines({ "0", "SECTION", "10", "1.5", "70", "3", "290", "1", "0", "EOF" });
    scanner sc(src);

    group g = sc.next();
    EXPECT(g.is(0, "SECTION"), "first group is not 0/SECTION");

    g = sc.next();
    EXPECT(g.code == 10 && std::get<double>(g.value) == 1.5, "code 10 not read as float");

    g = sc.next();
    EXPECT(std::get<int64_t>(g.value) == 3, "code 70 not read as integer");

    g = sc.next();
    EXPECT(std::get<bool>(g.value) == true, "code 290 not read as boolean");

    EXPECT(!sc.is_exhausted(), "exhausted before EOF");
    g = sc.next();
    EXPECT(g.is(0, "EOF"), "last group is not 0/EOF");
    EXPECT(sc.is_exhausted(), "not exhausted after EOF");

    return true;
}

static bool scanner_records_code_line_numbers()
{
    std::string src = dxf_lines({ "0", "SECTION", "2", "HEADER", "0", "EOF" });
    scanner sc(src);

    EXPECT(sc.next().loc.line == 1, "first group not on line 1");
    EXPECT(sc.next().loc.line == 3, "second group not on line 3");
    EXPECT(sc.next().loc.line == 5, "third group not on line 5");

    return true;
}

static bool scanner_peek_does_not_advance()
{
    std::string src = dxf_lines({ "8", "Walls", "62", "5", "0", "EOF" });
    scanner sc(src);

    sc.next();
    group p = sc.peek();
    EXPECT(p.code == 62, "peek returned the wrong group");
    EXPECT(sc.last()->code == 8, "peek moved the last group");
    EXPECT(sc.next().code == 62, "next after peek skipped a group");

    return true;
}

static bool scanner_accepts_mixed_line_endings()
{
    std::string src = "0\r\nSECTION\r2\nHEADER\r\n0\rEOF";
    scanner sc(src);

    EXPECT(sc.next().is(0, "SECTION"), "CRLF pair not split");
    EXPECT(sc.next().is(2, "HEADER"), "bare CR not treated as a line break");
    EXPECT(sc.next().is(0, "EOF"), "EOF not reached");

    return true;
}

static bool scanner_strips_leading_value_whitespace_only()
{
    std::string src = dxf_lines({ "  1", "   padded text  ", " 10 ", "  2.5", "0", "EOF" });
    scanner sc(src);

    group g = sc.next();
    EXPECT(g.code == 1, "indented code not read");
    EXPECT(g.text() == "padded text  ", "text value not left-trimmed only");

    g = sc.next();
    EXPECT(g.code == 10 && std::get<double>(g.value) == 2.5, "padded numeric group not read");

    return true;
}

static bool scanner_fails_on_truncated_input()
{
    std::string src = dxf_lines({ "0", "SECTION", "2" });
    scanner sc(src);
    sc.next();

    auto kind = failure_kind([&] { sc.next(); });
    EXPECT(kind == parse_error_kind::unexpected_end_of_input, "dangling code line not reported");

    return true;
}

static bool scanner_fails_on_empty_input()
{
    scanner sc("");
    auto kind = failure_kind([&] { sc.next(); });
    EXPECT(kind == parse_error_kind::unexpected_end_of_input, "empty input not reported");

    return true;
}

static bool scanner_fails_reading_past_eof()
{
    std::string src = dxf_lines({ "0", "EOF", "0", "SECTION" });
    scanner sc(src);
    sc.next();

    EXPECT(!sc.has_next(), "has_next true after EOF");
    auto kind = failure_kind([&] { sc.next(); });
    EXPECT(kind == parse_error_kind::read_past_end, "read past EOF not reported");

    return true;
}

static bool scanner_fails_on_invalid_code()
{
    std::string src = dxf_lines({ "1O", "value", "0", "EOF" });
    scanner sc(src);

    std::optional<error<parse_error_kind>> err;
    try
    {
        sc.next();
    }
    catch (parse_failure const & e)
    {
        err = e.err;
    }

    EXPECT(err.has_value(), "invalid code accepted");
    EXPECT(err->kind == parse_error_kind::invalid_code, "wrong error kind");
    EXPECT(err->loc.line == 1, "wrong error line");

    return true;
}

static bool scanner_rewind_restores_last_and_clears_exhaustion()
{
    std::string src = dxf_lines({ "8", "A", "62", "1", "0", "EOF" });
    scanner sc(src);

    sc.next();
    sc.next();
    sc.next();
    EXPECT(sc.is_exhausted(), "not exhausted at EOF");

    sc.rewind();
    EXPECT(!sc.is_exhausted(), "rewind did not clear exhaustion");
    EXPECT(sc.last()->code == 62, "last not restored after rewind");

    sc.rewind(2);
    EXPECT(!sc.last().has_value(), "last not cleared at start of input");
    EXPECT(sc.next().is(8, "A"), "rewind to start did not replay the first group");

    return true;
}

static bool scanner_rewind_underflow_throws()
{
    std::string src = dxf_lines({ "8", "A", "0", "EOF" });
    scanner sc(src);
    sc.next();

    bool thrown = false;
    try
    {
        sc.rewind(2);
    }
    catch (std::out_of_range const &)
    {
        thrown = true;
    }
    EXPECT(thrown, "rewinding past the start did not throw");

    return true;
}

static bool scanner_next_if_takes_or_undoes()
{
    std::string src = dxf_lines({ "10", "1.0", "20", "2.0", "0", "EOF" });
    scanner sc(src);
    sc.next();

    EXPECT(!sc.next_if(30).has_value(), "next_if took a non-matching group");
    EXPECT(sc.last()->code == 10, "next_if did not undo");

    auto y = sc.next_if(20);
    EXPECT(y.has_value() && std::get<double>(y->value) == 2.0, "next_if did not take the matching group");
    EXPECT(sc.last()->code == 20, "next_if did not advance");

    return true;
}

static bool scanner_reports_untyped_code_once()
{
    std::string src = dxf_lines({ "2000", "custom", "0", "EOF" });
    diagnostics log;
    scanner sc(src, &log);

    group g = sc.next();
    EXPECT(g.text() == "custom", "untyped code not read as text");

    sc.rewind();
    sc.next();
    EXPECT(log.count(diagnostic_kind::untyped_code) == 1, "untyped code reported more than once");

    return true;
}

//------------------------------------------
// RUNNER
//------------------------------------------

inline void run_scanner_tests()
{
    SUBCAT("Reading");
    RUN_TEST(scanner_reads_typed_groups);
    RUN_TEST(scanner_records_code_line_numbers);
    RUN_TEST(scanner_peek_does_not_advance);
    RUN_TEST(scanner_accepts_mixed_line_endings);
    RUN_TEST(scanner_strips_leading_value_whitespace_only);

    SUBCAT("Failures");
    RUN_TEST(scanner_fails_on_truncated_input);
    RUN_TEST(scanner_fails_on_empty_input);
    RUN_TEST(scanner_fails_reading_past_eof);
    RUN_TEST(scanner_fails_on_invalid_code);

    SUBCAT("Lookahead");
    RUN_TEST(scanner_rewind_restores_last_and_clears_exhaustion);
    RUN_TEST(scanner_rewind_underflow_throws);
    RUN_TEST(scanner_next_if_takes_or_undoes);
    RUN_TEST(scanner_reports_untyped_code_once);
}

} // ns dxf::tests

#endif
