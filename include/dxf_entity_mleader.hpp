// dxf_entity_mleader.hpp - DXF group-stream codec - MULTILEADER
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// MULTILEADER nests three levels, each opened and closed by a marker:
//
//   300 CONTEXT_DATA{  ...  301 }
//     302 LEADER{      ...  303 }
//       304 LEADER_LINE{ ... 305 }
//
// The same code means different things per level (302 is a text field on
// the entity but opens a leader inside the context), so every level has
// its own table.
//========================================================================

#ifndef DXF_ENTITY_MLEADER_HPP
#define DXF_ENTITY_MLEADER_HPP

#include "dxf_entities.hpp"

namespace dxf
{
    namespace mleader_marker
    {
        constexpr std::string_view context_data = "CONTEXT_DATA{";
        constexpr std::string_view leader       = "LEADER{";
        constexpr std::string_view leader_line  = "LEADER_LINE{";
        constexpr std::string_view close        = "}";
    }

//========================================================================
// Code tables
//========================================================================

    inline constexpr field<mleader_line> mleader_line_fields[] =
    {
        { 11, &mleader_line::break_start },
        { 12, &mleader_line::break_end },
        { 90, &mleader_line::break_point_index },
        { 91, &mleader_line::line_index },
    };

    inline constexpr field<mleader_leader> mleader_leader_fields[] =
    {
        { 290, &mleader_leader::has_last_line_point },
        { 291, &mleader_leader::has_dogleg_vector },
        { 10,  &mleader_leader::last_line_point },
        { 11,  &mleader_leader::dogleg_vector },
        { 12,  &mleader_leader::break_start },
        { 13,  &mleader_leader::break_end },
        { 90,  &mleader_leader::branch_index },
        { 40,  &mleader_leader::dogleg_length },
    };

    inline constexpr field<mleader_context> mleader_context_fields[] =
    {
        { 40,  &mleader_context::content_scale },
        { 10,  &mleader_context::content_base_position },
        { 41,  &mleader_context::text_height },
        { 140, &mleader_context::arrow_head_size },
        { 145, &mleader_context::landing_gap },
        { 174, &mleader_context::text_angle_type },
        { 175, &mleader_context::text_alignment_type },
        { 290, &mleader_context::has_mtext },
        { 304, &mleader_context::default_text_contents },
        { 11,  &mleader_context::text_normal },
        { 340, &mleader_context::text_style_id },
        { 12,  &mleader_context::text_location },
        { 13,  &mleader_context::text_direction },
        { 42,  &mleader_context::text_rotation },
        { 43,  &mleader_context::text_width },
        { 44,  &mleader_context::text_height2 },
        { 45,  &mleader_context::text_line_spacing_factor },
        { 170, &mleader_context::text_line_spacing_style },
        { 90,  &mleader_context::break_point_index },
        { 91,  &mleader_context::text_background_color },
        { 141, &mleader_context::text_background_scale },
        { 92,  &mleader_context::text_background_transparency },
        { 291, &mleader_context::text_background_color_on },
        { 292, &mleader_context::text_background_fill_on },
        { 173, &mleader_context::text_column_type },
        { 293, &mleader_context::text_use_auto_height },
        { 142, &mleader_context::text_column_width },
        { 143, &mleader_context::text_column_gutter_width },
        { 294, &mleader_context::text_column_flow_reversed },
        { 144, &mleader_context::text_column_height },
        { 295, &mleader_context::text_use_word_break },
        { 296, &mleader_context::has_block },
        { 341, &mleader_context::block_content_id },
        { 14,  &mleader_context::block_content_normal },
        { 15,  &mleader_context::block_content_position },
        { 16,  &mleader_context::block_content_scale },
        { 46,  &mleader_context::block_content_rotation },
        { 93,  &mleader_context::block_content_color },
        { 171, &mleader_context::text_attachment },
        { 172, &mleader_context::text_flow_direction },
        { 176, &mleader_context::block_content_connection },
        { 177, &mleader_context::block_attribute_index },
        { 110, &mleader_context::plane_origin },
        { 111, &mleader_context::plane_x_axis },
        { 112, &mleader_context::plane_y_axis },
        { 297, &mleader_context::plane_normal_reversed },
    };

    inline constexpr field<mleader_entity> mleader_entity_fields[] =
    {
        { 340, &mleader_entity::leader_style_id },
        { 90,  &mleader_entity::property_override_flag },
        { 170, &mleader_entity::leader_line_type },
        { 91,  &mleader_entity::leader_line_color },
        { 341, &mleader_entity::leader_line_type_id },
        { 171, &mleader_entity::leader_line_weight },
        { 290, &mleader_entity::enable_landing },
        { 291, &mleader_entity::enable_dogleg },
        { 41,  &mleader_entity::dogleg_length },
        { 342, &mleader_entity::arrow_head_id },
        { 42,  &mleader_entity::arrow_head_size },
        { 172, &mleader_entity::content_type },
        { 343, &mleader_entity::text_style_id },
        { 173, &mleader_entity::text_left_attachment },
        { 95,  &mleader_entity::text_right_attachment },
        { 174, &mleader_entity::text_angle_type },
        { 175, &mleader_entity::text_alignment_type },
        { 92,  &mleader_entity::text_color },
        { 292, &mleader_entity::enable_frame_text },
        { 344, &mleader_entity::block_content_id },
        { 93,  &mleader_entity::block_content_color },
        { 10,  &mleader_entity::block_content_scale },
        { 43,  &mleader_entity::block_content_rotation },
        { 176, &mleader_entity::block_content_connection },
        { 293, &mleader_entity::enable_annotation_scale },
        { 94,  &mleader_entity::arrow_head_index },
        { 330, &mleader_entity::block_attribute_id },
        { 177, &mleader_entity::block_attribute_index },
        { 44,  &mleader_entity::block_attribute_width },
        { 302, &mleader_entity::block_attribute_text },
        { 294, &mleader_entity::text_direction_negative },
        { 178, &mleader_entity::text_align_in_ipe },
        { 179, &mleader_entity::text_attachment_point },
        { 45,  &mleader_entity::text_line_spacing_factor },
        { 271, &mleader_entity::text_attachment_direction },
        { 272, &mleader_entity::text_attachment_bottom },
        { 273, &mleader_entity::text_attachment_top },
    };

//========================================================================
// Nested levels
//========================================================================

    namespace detail
    {
        // Reads one level up to its closing `end_code`. A code-0 group means
        // the level was never closed; it is pushed back for the entity loop.
        template <typename R, typename Special>
        void read_level(R & r, parse_state & st, int end_code,
                        std::type_identity_t<field_table<R>> table, Special && special)
        {
            for (group g = st.sc.next(); g.code != end_code; g = st.sc.next())
            {
                if (g.code == 0)
                {
                    st.log.warn(diagnostic_kind::unhandled_group, g.loc,
                                "MULTILEADER level not closed by " + std::to_string(end_code));
                    st.sc.rewind();
                    return;
                }
                if (special(r, g))
                    continue;
                if (!read_bound<R>(r, table, st.sc, st.log))
                    log_unhandled(st.log, g);
            }
        }
    }

    inline mleader_line read_mleader_line(parse_state & st)
    {
        mleader_line line;
        detail::read_level<mleader_line>(line, st, 305, mleader_line_fields,
            [&st](mleader_line & l, group const & g)
            {
                if (g.code != 10)
                    return false;
                l.vertices.push_back(parse_point(st.sc));
                return true;
            });
        return line;
    }

    inline mleader_leader read_mleader_leader(parse_state & st)
    {
        mleader_leader leader;
        detail::read_level<mleader_leader>(leader, st, 303, mleader_leader_fields,
            [&st](mleader_leader & l, group const & g)
            {
                if (g.code != 304)
                    return false;
                l.lines.push_back(read_mleader_line(st));
                return true;
            });
        return leader;
    }

    inline mleader_context read_mleader_context(parse_state & st)
    {
        mleader_context ctx;
        detail::read_level<mleader_context>(ctx, st, 301, mleader_context_fields,
            [&st](mleader_context & c, group const & g)
            {
                switch (g.code)
                {
                    case 47:
                        c.block_transform = parse_matrix(st.sc, 47);
                        return true;
                    case 302:
                        c.leaders.push_back(read_mleader_leader(st));
                        return true;
                    default:
                        return false;
                }
            });
        return ctx;
    }

    inline mleader_entity read_mleader_entity(parse_state & st)
    {
        return read_entity<mleader_entity>(st, mleader_entity_fields,
            [&st](mleader_entity & e, group const & g)
            {
                if (g.code != 300)
                    return false;
                e.context = read_mleader_context(st);
                return true;
            });
    }

//========================================================================
// Writers
//========================================================================

    inline void write_mleader_line(mleader_line const & line, group_writer & w)
    {
        w.write_text(304, mleader_marker::leader_line);
        for (auto const & v : line.vertices)
            w.write_point(10, v);
        write_fields<mleader_line>(line, mleader_line_fields, w);
        w.write_text(305, mleader_marker::close);
    }

    inline void write_mleader_leader(mleader_leader const & leader, group_writer & w)
    {
        w.write_text(302, mleader_marker::leader);
        write_fields<mleader_leader>(leader, mleader_leader_fields, w);
        for (auto const & line : leader.lines)
            write_mleader_line(line, w);
        w.write_text(303, mleader_marker::close);
    }

    inline void write_mleader_context(mleader_context const & ctx, group_writer & w)
    {
        w.write_text(300, mleader_marker::context_data);
        write_fields<mleader_context>(ctx, mleader_context_fields, w);
        if (ctx.block_transform)
            w.write_matrix(47, *ctx.block_transform);
        for (auto const & leader : ctx.leaders)
            write_mleader_leader(leader, w);
        w.write_text(301, mleader_marker::close);
    }

    inline void write_mleader_entity(mleader_entity const & e, group_writer & w)
    {
        write_entity_fields<mleader_entity>(e, mleader_entity_fields, w);
        if (e.context)
            write_mleader_context(*e.context, w);
    }

} // namespace dxf

#endif
