// dxf_entity_kinds.hpp - DXF group-stream codec - Geometry and text entities
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_ENTITY_KINDS_HPP
#define DXF_ENTITY_KINDS_HPP

#include "dxf_entities.hpp"

namespace dxf
{
//========================================================================
// Code tables
//========================================================================

    inline constexpr field<point_entity> point_entity_fields[] =
    {
        { 10,  &point_entity::position },
        { 39,  &point_entity::thickness },
        { 50,  &point_entity::x_axis_angle },
        { 70,  &point_entity::flags },
        { 210, &point_entity::extrusion },
    };

    inline constexpr field<line_entity> line_entity_fields[] =
    {
        { 10,  &line_entity::start },
        { 11,  &line_entity::end },
        { 39,  &line_entity::thickness },
        { 70,  &line_entity::flags },
        { 210, &line_entity::extrusion },
    };

    inline constexpr field<circle_entity> circle_entity_fields[] =
    {
        { 10,  &circle_entity::center },
        { 40,  &circle_entity::radius },
        { 39,  &circle_entity::thickness },
        { 50,  &circle_entity::start_angle },
        { 51,  &circle_entity::end_angle },
        { 70,  &circle_entity::flags },
        { 210, &circle_entity::extrusion },
    };

    inline constexpr field<arc_entity> arc_entity_fields[] =
    {
        { 10,  &arc_entity::center },
        { 40,  &arc_entity::radius },
        { 39,  &arc_entity::thickness },
        { 50,  &arc_entity::start_angle },
        { 51,  &arc_entity::end_angle },
        { 70,  &arc_entity::flags },
        { 210, &arc_entity::extrusion },
    };

    inline constexpr field<ellipse_entity> ellipse_entity_fields[] =
    {
        { 10,  &ellipse_entity::center },
        { 11,  &ellipse_entity::major_axis_end },
        { 40,  &ellipse_entity::axis_ratio },
        { 41,  &ellipse_entity::start_parameter },
        { 42,  &ellipse_entity::end_parameter },
        { 2,   &ellipse_entity::name },
        { 70,  &ellipse_entity::flags },
        { 210, &ellipse_entity::extrusion },
    };

    inline constexpr field<solid_entity> solid_entity_fields[] =
    {
        { 39,  &solid_entity::thickness },
        { 70,  &solid_entity::flags },
        { 210, &solid_entity::extrusion },
    };

    inline constexpr field<insert_entity> insert_entity_fields[] =
    {
        { 2,   &insert_entity::block_name },
        { 10,  &insert_entity::position },
        { 41,  &insert_entity::x_scale },
        { 42,  &insert_entity::y_scale },
        { 43,  &insert_entity::z_scale },
        { 50,  &insert_entity::rotation },
        { 70,  &insert_entity::column_count },
        { 71,  &insert_entity::row_count },
        { 44,  &insert_entity::column_spacing },
        { 45,  &insert_entity::row_spacing },
        { 210, &insert_entity::extrusion },
    };

    inline constexpr field<dimension_entity> dimension_entity_fields[] =
    {
        { 2,   &dimension_entity::block_name },
        { 3,   &dimension_entity::style_name },
        { 10,  &dimension_entity::definition_point },
        { 11,  &dimension_entity::text_midpoint },
        { 12,  &dimension_entity::insertion_point },
        { 70,  &dimension_entity::dimension_type },
        { 71,  &dimension_entity::attachment_point },
        { 72,  &dimension_entity::line_spacing_style },
        { 42,  &dimension_entity::measurement },
        { 1,   &dimension_entity::text },
        { 53,  &dimension_entity::text_rotation },
        { 13,  &dimension_entity::first_point },
        { 14,  &dimension_entity::second_point },
        { 15,  &dimension_entity::arc_center_point },
        { 16,  &dimension_entity::arc_point },
        { 50,  &dimension_entity::angle },
        { 210, &dimension_entity::extrusion },
    };

    inline constexpr field<text_entity> text_entity_fields[] =
    {
        { 39,  &text_entity::thickness },
        { 10,  &text_entity::start },
        { 40,  &text_entity::height },
        { 1,   &text_entity::text },
        { 50,  &text_entity::rotation },
        { 41,  &text_entity::x_scale },
        { 51,  &text_entity::oblique_angle },
        { 7,   &text_entity::style },
        { 70,  &text_entity::flags },
        { 71,  &text_entity::generation_flags },
        { 72,  &text_entity::halign },
        { 11,  &text_entity::end },
        { 210, &text_entity::extrusion },
        { 73,  &text_entity::valign },
    };

    // Text (1/3) is chunked and handled outside the table.
    inline constexpr field<mtext_entity> mtext_entity_fields[] =
    {
        { 10,  &mtext_entity::position },
        { 40,  &mtext_entity::height },
        { 41,  &mtext_entity::reference_width },
        { 71,  &mtext_entity::attachment_point },
        { 72,  &mtext_entity::drawing_direction },
        { 7,   &mtext_entity::style },
        { 210, &mtext_entity::extrusion },
        { 11,  &mtext_entity::direction },
        { 50,  &mtext_entity::rotation },
        { 73,  &mtext_entity::line_spacing_style },
        { 44,  &mtext_entity::line_spacing_factor },
        { 70,  &mtext_entity::flags },
    };

    inline constexpr field<attdef_entity> attdef_entity_fields[] =
    {
        { 39,  &attdef_entity::thickness },
        { 10,  &attdef_entity::start },
        { 40,  &attdef_entity::text_height },
        { 1,   &attdef_entity::text },
        { 50,  &attdef_entity::rotation },
        { 41,  &attdef_entity::scale },
        { 51,  &attdef_entity::oblique_angle },
        { 7,   &attdef_entity::text_style },
        { 71,  &attdef_entity::generation_flags },
        { 72,  &attdef_entity::halign },
        { 11,  &attdef_entity::end },
        { 210, &attdef_entity::extrusion },
        { 3,   &attdef_entity::prompt },
        { 2,   &attdef_entity::tag },
        { 70,  &attdef_entity::flags },
        { 73,  &attdef_entity::field_length },
        { 74,  &attdef_entity::valign },
    };

    inline constexpr flag_bit<attdef_entity> attdef_flag_bits[] =
    {
        { 1, &attdef_entity::invisible },
        { 2, &attdef_entity::constant },
        { 4, &attdef_entity::verification_required },
        { 8, &attdef_entity::preset },
    };

    inline constexpr flag_bit<attdef_entity> attdef_generation_bits[] =
    {
        { 2, &attdef_entity::backwards },
        { 4, &attdef_entity::mirrored },
    };

//========================================================================
// Derived fields
//========================================================================

    // Sweep from start to end angle in degrees, counter-clockwise.
    inline std::optional<double> angle_span(std::optional<double> start, std::optional<double> end)
    {
        if (!start || !end)
            return std::nullopt;

        double d = *end - *start;
        if (d < 0.0)
            d += 360.0;
        return d;
    }

//========================================================================
// Reconstructors
//========================================================================

    inline point_entity read_point_entity(parse_state & st)
    {
        return read_entity<point_entity>(st, point_entity_fields);
    }

    inline line_entity read_line_entity(parse_state & st)
    {
        return read_entity<line_entity>(st, line_entity_fields);
    }

    inline circle_entity read_circle_entity(parse_state & st)
    {
        auto e = read_entity<circle_entity>(st, circle_entity_fields);
        e.angle_length = angle_span(e.start_angle, e.end_angle);
        return e;
    }

    inline arc_entity read_arc_entity(parse_state & st)
    {
        auto e = read_entity<arc_entity>(st, arc_entity_fields);
        e.angle_length = angle_span(e.start_angle, e.end_angle);
        return e;
    }

    inline ellipse_entity read_ellipse_entity(parse_state & st)
    {
        return read_entity<ellipse_entity>(st, ellipse_entity_fields);
    }

    inline solid_entity read_solid_entity(parse_state & st)
    {
        return read_entity<solid_entity>(st, solid_entity_fields,
            [&st](solid_entity & e, group const & g)
            {
                if (g.code < 10 || g.code > 13)
                    return false;
                e.corners[static_cast<size_t>(g.code - 10)] = parse_point(st.sc);
                return true;
            });
    }

    inline insert_entity read_insert_entity(parse_state & st)
    {
        return read_entity<insert_entity>(st, insert_entity_fields);
    }

    inline dimension_entity read_dimension_entity(parse_state & st)
    {
        return read_entity<dimension_entity>(st, dimension_entity_fields);
    }

    inline text_entity read_text_entity(parse_state & st)
    {
        return read_entity<text_entity>(st, text_entity_fields);
    }

    inline mtext_entity read_mtext_entity(parse_state & st)
    {
        return read_entity<mtext_entity>(st, mtext_entity_fields,
            [](mtext_entity & e, group const & g)
            {
                if (g.code != 1 && g.code != 3)
                    return false;
                if (!e.text)
                    e.text.emplace();
                *e.text += g.text();
                return true;
            });
    }

    inline attdef_entity read_attdef_entity(parse_state & st)
    {
        auto e = read_entity<attdef_entity>(st, attdef_entity_fields);
        if (e.flags)
            decompose_flags<attdef_entity>(e, *e.flags, attdef_flag_bits);
        if (e.generation_flags)
            decompose_flags<attdef_entity>(e, *e.generation_flags, attdef_generation_bits);
        return e;
    }

//========================================================================
// Writers
//========================================================================

    inline void write_point_entity(point_entity const & e, group_writer & w)
    {
        write_entity_fields<point_entity>(e, point_entity_fields, w);
    }

    inline void write_line_entity(line_entity const & e, group_writer & w)
    {
        write_entity_fields<line_entity>(e, line_entity_fields, w);
    }

    inline void write_circle_entity(circle_entity const & e, group_writer & w)
    {
        write_entity_fields<circle_entity>(e, circle_entity_fields, w);
    }

    inline void write_arc_entity(arc_entity const & e, group_writer & w)
    {
        write_entity_fields<arc_entity>(e, arc_entity_fields, w);
    }

    inline void write_ellipse_entity(ellipse_entity const & e, group_writer & w)
    {
        write_entity_fields<ellipse_entity>(e, ellipse_entity_fields, w);
    }

    inline void write_solid_entity(solid_entity const & e, group_writer & w)
    {
        write_common(e.common, w);
        for (size_t i = 0; i < e.corners.size(); ++i)
            w.write(10 + static_cast<int>(i), e.corners[i]);
        write_fields<solid_entity>(e, solid_entity_fields, w);
    }

    inline void write_insert_entity(insert_entity const & e, group_writer & w)
    {
        write_entity_fields<insert_entity>(e, insert_entity_fields, w);
    }

    inline void write_dimension_entity(dimension_entity const & e, group_writer & w)
    {
        write_entity_fields<dimension_entity>(e, dimension_entity_fields, w);
    }

    inline void write_text_entity(text_entity const & e, group_writer & w)
    {
        write_entity_fields<text_entity>(e, text_entity_fields, w);
    }

    inline void write_mtext_entity(mtext_entity const & e, group_writer & w)
    {
        write_entity_fields<mtext_entity>(e, mtext_entity_fields, w);
        if (e.text)
            w.write_chunked(1, 3, *e.text);
    }

    inline void write_attdef_entity(attdef_entity const & e, group_writer & w)
    {
        write_entity_fields<attdef_entity>(e, attdef_entity_fields, w);
    }

} // namespace dxf

#endif
