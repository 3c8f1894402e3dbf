// dxf_structure.hpp - DXF group-stream codec - Structural sub-grammars
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_STRUCTURE_HPP
#define DXF_STRUCTURE_HPP

#include "dxf_core.hpp"
#include "dxf_scanner.hpp"
#include <array>
#include <deque>
#include <span>
#include <type_traits>

namespace dxf
{
//========================================================================
// Points and matrices
//========================================================================

    struct point
    {
        double                x = 0.0;
        double                y = 0.0;
        std::optional<double> z;

        bool operator==(point const &) const = default;
    };

    using matrix4 = std::array<double, 16>;

    constexpr int default_matrix_code = 47;

    // The scanner's last group is the x component (code N). Requires y on
    // N+10; z on N+20 is optional and undone when absent.
    point parse_point(scanner & sc);

    // Rewinds one group, then reads sixteen values that all carry `code`.
    matrix4 parse_matrix(scanner & sc, int code = default_matrix_code);

//========================================================================
// Flag bitfields
//========================================================================

    constexpr bool flag_set(int64_t flags, int64_t mask) noexcept { return (flags & mask) != 0; }

    template <typename R>
    struct flag_bit
    {
        int64_t                   mask;
        std::optional<bool> R::*  field;
    };

    template <typename R>
    void decompose_flags(R & record, int64_t flags, std::type_identity_t<std::span<const flag_bit<R>>> bits)
    {
        for (auto const & b : bits)
            record.*(b.field) = flag_set(flags, b.mask);
    }

//========================================================================
// Chunked text
//========================================================================

    constexpr size_t max_chunk_length = 250;

    // Splits into pieces of at most `max` bytes without cutting a UTF-8
    // sequence.
    std::vector<std::string_view> split_chunks(std::string_view text, size_t max = max_chunk_length);

//========================================================================
// Group writer
//========================================================================

    // Appends rendered lines (code, value, code, value, ...) to a token queue.
    class group_writer
    {
    public:
        explicit group_writer(std::deque<std::string> & out) : out_(out) {}

        void write_value(int code, group_value const & v)
        {
            out_.push_back(std::to_string(code));
            out_.push_back(render_value(code, v));
        }

        void write_text(int code, std::string_view text)
        {
            out_.push_back(std::to_string(code));
            out_.push_back(std::string(text));
        }

        void write_group(group const & g) { write_value(g.code, g.value); }

        template <typename T>
        void write(int code, std::optional<T> const & v)
        {
            if (v)
                write_value(code, group_value{ *v });
        }

        void write(int code, std::optional<point> const & p)
        {
            if (p)
                write_point(code, *p);
        }

        void write_point(int code, point const & p);
        void write_matrix(int code, matrix4 const & m);

        // One chunk goes out under `single_code`, more than one all under
        // `chunk_code`.
        void write_chunked(int single_code, int chunk_code, std::string_view text);

    private:
        std::deque<std::string> & out_;
    };

//========================================================================
// Implementation
//========================================================================

    inline point parse_point(scanner & sc)
    {
        auto const & x = sc.last();
        if (!x)
            fail(parse_error_kind::malformed_point, sc.location(), "point without an x component");

        int code = x->code;
        point p;
        p.x = std::get<double>(x->value);

        group y = sc.next();
        if (y.code != code + 10)
            fail(parse_error_kind::malformed_point, y.loc,
                 "expected code " + std::to_string(code + 10) + " for the y component, got " + std::to_string(y.code));
        p.y = std::get<double>(y.value);

        if (auto z = sc.next_if(code + 20))
            p.z = std::get<double>(z->value);

        return p;
    }

//---------------------------------------------------------------------------

    inline matrix4 parse_matrix(scanner & sc, int code)
    {
        matrix4 m {};
        sc.rewind();

        for (auto & v : m)
        {
            group g = sc.next();
            if (g.code != code)
                fail(parse_error_kind::malformed_matrix, g.loc,
                     "expected code " + std::to_string(code) + " inside a matrix, got " + std::to_string(g.code));
            v = std::get<double>(g.value);
        }
        return m;
    }

//---------------------------------------------------------------------------

    inline std::vector<std::string_view> split_chunks(std::string_view text, size_t max)
    {
        std::vector<std::string_view> chunks;

        while (text.size() > max)
        {
            size_t cut = max;
            while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
                --cut;
            if (cut == 0)
                cut = max;

            chunks.push_back(text.substr(0, cut));
            text.remove_prefix(cut);
        }
        chunks.push_back(text);
        return chunks;
    }

//---------------------------------------------------------------------------

    inline void group_writer::write_point(int code, point const & p)
    {
        write_value(code, p.x);
        write_value(code + 10, p.y);
        if (p.z)
            write_value(code + 20, *p.z);
    }

    inline void group_writer::write_matrix(int code, matrix4 const & m)
    {
        for (double v : m)
            write_value(code, v);
    }

    inline void group_writer::write_chunked(int single_code, int chunk_code, std::string_view text)
    {
        auto chunks = split_chunks(text);
        if (chunks.size() == 1)
        {
            write_text(single_code, chunks.front());
            return;
        }
        for (auto c : chunks)
            write_text(chunk_code, c);
    }

} // namespace dxf

#endif
