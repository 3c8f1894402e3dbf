// dxf_entity_polylines.hpp - DXF group-stream codec - Vertex-list entities
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Faces, polylines and splines carry variable-length child lists. Their
// boundaries come from three different conventions:
//
//  * 3DFACE and LWPOLYLINE vertices are positional. A repeated x code
//    before anything else ends the current vertex and starts the next; the
//    first code that is not part of a vertex is pushed back.
//  * POLYLINE vertices are full VERTEX records closed by a SEQEND record.
//  * SPLINE lists are homogeneous runs of one code each, cross-checked
//    against declared counts.
//
// Declared counts are diagnosed, never corrected.
//========================================================================

#ifndef DXF_ENTITY_POLYLINES_HPP
#define DXF_ENTITY_POLYLINES_HPP

#include "dxf_entities.hpp"

namespace dxf
{
//========================================================================
// Code tables
//========================================================================

    inline constexpr field<face3d_entity> face3d_entity_fields[] =
    {
        { 70, &face3d_entity::flags },
    };

    inline constexpr flag_bit<face3d_entity> face3d_flag_bits[] =
    {
        { 1,   &face3d_entity::shape },
        { 128, &face3d_entity::has_continuous_linetype_pattern },
    };

    inline constexpr field<lwpolyline_entity> lwpolyline_entity_fields[] =
    {
        { 90,  &lwpolyline_entity::vertex_count },
        { 70,  &lwpolyline_entity::flags },
        { 43,  &lwpolyline_entity::constant_width },
        { 38,  &lwpolyline_entity::elevation },
        { 39,  &lwpolyline_entity::thickness },
        { 210, &lwpolyline_entity::extrusion },
    };

    inline constexpr flag_bit<lwpolyline_entity> lwpolyline_flag_bits[] =
    {
        { 1,   &lwpolyline_entity::closed },
        { 128, &lwpolyline_entity::plinegen },
    };

    inline constexpr field<polyline_entity> polyline_entity_fields[] =
    {
        { 10,  &polyline_entity::elevation_point },
        { 39,  &polyline_entity::thickness },
        { 70,  &polyline_entity::flags },
        { 40,  &polyline_entity::start_width },
        { 41,  &polyline_entity::end_width },
        { 71,  &polyline_entity::mesh_m_count },
        { 72,  &polyline_entity::mesh_n_count },
        { 73,  &polyline_entity::smooth_m_density },
        { 74,  &polyline_entity::smooth_n_density },
        { 75,  &polyline_entity::surface_type },
        { 210, &polyline_entity::extrusion },
    };

    inline constexpr flag_bit<polyline_entity> polyline_flag_bits[] =
    {
        { 1,   &polyline_entity::closed },
        { 2,   &polyline_entity::curve_fit },
        { 4,   &polyline_entity::spline_fit },
        { 8,   &polyline_entity::is_3d_polyline },
        { 16,  &polyline_entity::is_3d_mesh },
        { 32,  &polyline_entity::mesh_closed_n },
        { 64,  &polyline_entity::is_polyface },
        { 128, &polyline_entity::plinegen },
    };

    inline constexpr field<vertex_entity> vertex_entity_fields[] =
    {
        { 10, &vertex_entity::location },
        { 40, &vertex_entity::start_width },
        { 41, &vertex_entity::end_width },
        { 42, &vertex_entity::bulge },
        { 70, &vertex_entity::flags },
        { 50, &vertex_entity::tangent_direction },
        { 71, &vertex_entity::face_a },
        { 72, &vertex_entity::face_b },
        { 73, &vertex_entity::face_c },
        { 74, &vertex_entity::face_d },
        { 91, &vertex_entity::id },
    };

    inline constexpr flag_bit<vertex_entity> vertex_flag_bits[] =
    {
        { 1,   &vertex_entity::curve_fit_extra },
        { 2,   &vertex_entity::curve_fit_tangent },
        { 8,   &vertex_entity::spline_vertex },
        { 16,  &vertex_entity::spline_control_point },
        { 32,  &vertex_entity::polyline_3d_vertex },
        { 64,  &vertex_entity::mesh_3d_vertex },
        { 128, &vertex_entity::polyface_vertex },
    };

    inline constexpr field<spline_entity> spline_entity_fields[] =
    {
        { 210, &spline_entity::normal },
        { 70,  &spline_entity::flags },
        { 71,  &spline_entity::degree },
        { 72,  &spline_entity::knot_count },
        { 73,  &spline_entity::control_point_count },
        { 74,  &spline_entity::fit_point_count },
        { 42,  &spline_entity::knot_tolerance },
        { 43,  &spline_entity::control_point_tolerance },
        { 44,  &spline_entity::fit_tolerance },
        { 12,  &spline_entity::start_tangent },
        { 13,  &spline_entity::end_tangent },
    };

    // Planar is set by either of two bits.
    inline constexpr flag_bit<spline_entity> spline_flag_bits[] =
    {
        { 1,  &spline_entity::closed },
        { 2,  &spline_entity::periodic },
        { 4,  &spline_entity::rational },
        { 24, &spline_entity::planar },
        { 16, &spline_entity::linear },
    };

//========================================================================
// Positional vertex lists
//========================================================================

    constexpr size_t max_face_vertices = 4;

    // The scanner's last group is an x code in 10..13. Reads at most
    // `limit` vertices.
    inline std::vector<point> read_face_vertices(scanner & sc, size_t limit = max_face_vertices)
    {
        std::vector<point> vertices;
        point v;
        bool started = false;

        for (group g = *sc.last(); ; g = sc.next())
        {
            if (g.code >= 10 && g.code <= 13)
            {
                if (started)
                {
                    vertices.push_back(v);
                    v = {};
                    if (vertices.size() == limit)
                    {
                        started = false;
                        sc.rewind();
                        break;
                    }
                }
                v.x = detail::float_value(g);
                started = true;
            }
            else if (started && g.code >= 20 && g.code <= 23)
                v.y = detail::float_value(g);
            else if (started && g.code >= 30 && g.code <= 33)
                v.z = detail::float_value(g);
            else
            {
                sc.rewind();
                break;
            }
        }

        if (started)
            vertices.push_back(v);
        return vertices;
    }

//---------------------------------------------------------------------------

    // The scanner's last group is the first vertex's 10.
    inline std::vector<lwpolyline_vertex> read_lwpolyline_vertices(scanner & sc)
    {
        std::vector<lwpolyline_vertex> vertices;
        lwpolyline_vertex v;
        bool started = false;

        for (group g = *sc.last(); ; g = sc.next())
        {
            switch (g.code)
            {
                case 10:
                    if (started)
                        vertices.push_back(v);
                    v = {};
                    v.location.x = detail::float_value(g);
                    started = true;
                    break;
                case 20: v.location.y = detail::float_value(g); break;
                case 30: v.location.z = detail::float_value(g); break;
                case 40: v.start_width = detail::float_value(g); break;
                case 41: v.end_width = detail::float_value(g); break;
                case 42: v.bulge = detail::float_value(g); break;
                case 91: v.id = detail::int_value(g); break;

                default:
                    sc.rewind();
                    if (started)
                        vertices.push_back(v);
                    return vertices;
            }
        }
    }

    inline void check_count(diagnostics & log, std::optional<int64_t> declared, size_t actual,
                            std::string_view what, source_location loc)
    {
        if (declared && *declared != static_cast<int64_t>(actual))
            log.warn(diagnostic_kind::count_mismatch, loc,
                     std::string(what) + ": declared " + std::to_string(*declared) +
                     ", found " + std::to_string(actual));
    }

//========================================================================
// Reconstructors
//========================================================================

    inline face3d_entity read_face3d_entity(parse_state & st)
    {
        auto e = read_entity<face3d_entity>(st, face3d_entity_fields,
            [&st](face3d_entity & f, group const & g)
            {
                if (g.code < 10 || g.code > 13 || f.vertices.size() >= max_face_vertices)
                    return false;
                auto more = read_face_vertices(st.sc, max_face_vertices - f.vertices.size());
                f.vertices.insert(f.vertices.end(), more.begin(), more.end());
                return true;
            });

        if (e.flags)
            decompose_flags<face3d_entity>(e, *e.flags, face3d_flag_bits);
        return e;
    }

    inline lwpolyline_entity read_lwpolyline_entity(parse_state & st)
    {
        auto loc = st.sc.last()->loc;
        auto e = read_entity<lwpolyline_entity>(st, lwpolyline_entity_fields,
            [&st](lwpolyline_entity & p, group const & g)
            {
                if (g.code != 10)
                    return false;
                auto more = read_lwpolyline_vertices(st.sc);
                p.vertices.insert(p.vertices.end(), more.begin(), more.end());
                return true;
            });

        check_count(st.log, e.vertex_count, e.vertices.size(), "LWPOLYLINE vertices", loc);
        if (e.flags)
            decompose_flags<lwpolyline_entity>(e, *e.flags, lwpolyline_flag_bits);
        return e;
    }

    inline vertex_entity read_vertex_entity(parse_state & st)
    {
        auto e = read_entity<vertex_entity>(st, vertex_entity_fields);
        if (e.flags)
            decompose_flags<vertex_entity>(e, *e.flags, vertex_flag_bits);
        return e;
    }

    // Records that carry nothing but common properties (SEQEND).
    inline entity_common read_common_record(parse_state & st)
    {
        entity_common common;
        for (group g = st.sc.next(); g.code != 0; g = st.sc.next())
        {
            if (!read_common(common, st))
                log_unhandled(st.log, g);
        }
        return common;
    }

    inline polyline_entity read_polyline_entity(parse_state & st)
    {
        auto e = read_entity<polyline_entity>(st, polyline_entity_fields);
        if (e.flags)
            decompose_flags<polyline_entity>(e, *e.flags, polyline_flag_bits);

        while (true)
        {
            group const g = *st.sc.last();
            if (g.is(0, token::vertex))
            {
                e.vertices.push_back(read_vertex_entity(st));
            }
            else if (g.is(0, token::seq_end))
            {
                auto seq_end = read_common_record(st);
                if (seq_end != entity_common{})
                    e.sequence_end = std::move(seq_end);
                break;
            }
            else
            {
                st.log.warn(diagnostic_kind::unhandled_group, g.loc,
                            "POLYLINE ended by " + std::string(g.text()) + " instead of SEQEND");
                break;
            }
        }
        return e;
    }

    inline spline_entity read_spline_entity(parse_state & st)
    {
        auto loc = st.sc.last()->loc;
        auto e = read_entity<spline_entity>(st, spline_entity_fields,
            [&st](spline_entity & s, group const & g)
            {
                switch (g.code)
                {
                    case 10:
                    {
                        spline_control_point cp { parse_point(st.sc), std::nullopt };
                        if (auto w = st.sc.next_if(41))
                            cp.weight = detail::float_value(*w);
                        s.control_points.push_back(cp);
                        return true;
                    }
                    case 11:
                        s.fit_points.push_back(parse_point(st.sc));
                        return true;
                    case 40:
                        s.knots.push_back(detail::float_value(g));
                        return true;
                    case 41:
                        s.weights.push_back(detail::float_value(g));
                        return true;
                    default:
                        return false;
                }
            });

        check_count(st.log, e.knot_count, e.knots.size(), "SPLINE knots", loc);
        check_count(st.log, e.control_point_count, e.control_points.size(), "SPLINE control points", loc);
        check_count(st.log, e.fit_point_count, e.fit_points.size(), "SPLINE fit points", loc);
        if (e.flags)
            decompose_flags<spline_entity>(e, *e.flags, spline_flag_bits);
        return e;
    }

//========================================================================
// Writers
//========================================================================

    inline void write_face3d_entity(face3d_entity const & e, group_writer & w)
    {
        write_common(e.common, w);
        for (size_t i = 0; i < e.vertices.size() && i < max_face_vertices; ++i)
            w.write_point(10 + static_cast<int>(i), e.vertices[i]);
        write_fields<face3d_entity>(e, face3d_entity_fields, w);
    }

    inline void write_lwpolyline_entity(lwpolyline_entity const & e, group_writer & w)
    {
        write_entity_fields<lwpolyline_entity>(e, lwpolyline_entity_fields, w);
        for (auto const & v : e.vertices)
        {
            w.write_point(10, v.location);
            w.write(40, v.start_width);
            w.write(41, v.end_width);
            w.write(42, v.bulge);
            w.write(91, v.id);
        }
    }

    inline void write_vertex_entity(vertex_entity const & e, group_writer & w)
    {
        write_entity_fields<vertex_entity>(e, vertex_entity_fields, w);
    }

    inline void write_polyline_entity(polyline_entity const & e, group_writer & w)
    {
        write_entity_fields<polyline_entity>(e, polyline_entity_fields, w);
        for (auto const & v : e.vertices)
        {
            w.write_text(0, token::vertex);
            write_vertex_entity(v, w);
        }
        w.write_text(0, token::seq_end);
        if (e.sequence_end)
            write_common(*e.sequence_end, w);
    }

    inline void write_spline_entity(spline_entity const & e, group_writer & w)
    {
        write_entity_fields<spline_entity>(e, spline_entity_fields, w);
        for (double k : e.knots)
            w.write_value(40, k);
        for (double wt : e.weights)
            w.write_value(41, wt);
        for (auto const & cp : e.control_points)
        {
            w.write_point(10, cp.location);
            w.write(41, cp.weight);
        }
        for (auto const & p : e.fit_points)
            w.write_point(11, p);
    }

} // namespace dxf

#endif
