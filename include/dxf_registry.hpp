// dxf_registry.hpp - DXF group-stream codec - Entity handler registry
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_REGISTRY_HPP
#define DXF_REGISTRY_HPP

#include "dxf_entities.hpp"
#include "dxf_entity_kinds.hpp"
#include "dxf_entity_polylines.hpp"
#include "dxf_entity_mleader.hpp"

namespace dxf
{
//========================================================================
// REGISTRY API
//========================================================================

    // Handler that keeps every group of an unknown kind in a custom_entity
    // and writes them back unchanged.
    entity_handler generic_entity_handler();

    // The scanner's last group is the first group of the list. Stops on the
    // code-0 `terminator`, which stays the last group read.
    std::vector<entity> read_entity_list(parse_state & st, std::string_view terminator);

    void write_entity(entity const & e, entity_registry const & registry,
                      group_writer & w, diagnostics & log);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        template <typename E, E (*Read)(parse_state &), void (*Write)(E const &, group_writer &)>
        entity_handler make_handler()
        {
            return {
                [](parse_state & st) -> entity { return Read(st); },
                [](entity const & e, group_writer & w) { Write(std::get<E>(e), w); }
            };
        }

        template <typename E, E (*Read)(parse_state &), void (*Write)(E const &, group_writer &)>
        void add(entity_registry & r)
        {
            r.register_entity_handler(std::string(E::type_name), make_handler<E, Read, Write>());
        }
    }

//---------------------------------------------------------------------------

    inline entity_registry entity_registry::with_builtin_handlers()
    {
        using namespace detail;

        entity_registry r;
        add<point_entity,      read_point_entity,      write_point_entity>(r);
        add<line_entity,       read_line_entity,       write_line_entity>(r);
        add<circle_entity,     read_circle_entity,     write_circle_entity>(r);
        add<arc_entity,        read_arc_entity,        write_arc_entity>(r);
        add<ellipse_entity,    read_ellipse_entity,    write_ellipse_entity>(r);
        add<solid_entity,      read_solid_entity,      write_solid_entity>(r);
        add<insert_entity,     read_insert_entity,     write_insert_entity>(r);
        add<dimension_entity,  read_dimension_entity,  write_dimension_entity>(r);
        add<text_entity,       read_text_entity,       write_text_entity>(r);
        add<mtext_entity,      read_mtext_entity,      write_mtext_entity>(r);
        add<attdef_entity,     read_attdef_entity,     write_attdef_entity>(r);
        add<face3d_entity,     read_face3d_entity,     write_face3d_entity>(r);
        add<lwpolyline_entity, read_lwpolyline_entity, write_lwpolyline_entity>(r);
        add<polyline_entity,   read_polyline_entity,   write_polyline_entity>(r);
        add<spline_entity,     read_spline_entity,     write_spline_entity>(r);
        add<mleader_entity,    read_mleader_entity,    write_mleader_entity>(r);
        return r;
    }

    inline entity_registry const & entity_registry::builtin()
    {
        static entity_registry const registry = with_builtin_handlers();
        return registry;
    }

//---------------------------------------------------------------------------

    inline entity_handler generic_entity_handler()
    {
        return {
            [](parse_state & st) -> entity
            {
                custom_entity e;
                e.type = std::string(st.sc.last()->text());

                for (group g = st.sc.next(); g.code != 0; g = st.sc.next())
                {
                    if (!read_common(e.common, st))
                        e.groups.push_back(std::move(g));
                }
                return e;
            },
            [](entity const & e, group_writer & w)
            {
                auto const & c = std::get<custom_entity>(e);
                write_common(c.common, w);
                for (auto const & g : c.groups)
                    w.write_group(g);
            }
        };
    }

//---------------------------------------------------------------------------

    inline std::vector<entity> read_entity_list(parse_state & st, std::string_view terminator)
    {
        std::vector<entity> entities;

        while (true)
        {
            group const g = *st.sc.last();

            if (g.code != 0)
            {
                log_unhandled(st.log, g);
                st.sc.next();
                continue;
            }

            if (g.text() == terminator)
                break;

            if (g.text() == token::end_section || g.text() == token::eof)
            {
                st.log.warn(diagnostic_kind::unhandled_group, g.loc,
                            "entity list ended by " + std::string(g.text()) + " instead of " + std::string(terminator));
                break;
            }

            if (auto h = st.registry.find(g.text()))
            {
                entities.push_back(h->parse(st));
                continue;
            }

            st.log.warn(diagnostic_kind::unhandled_entity, g.loc, "unhandled entity " + std::string(g.text()));
            while (st.sc.next().code != 0)
                ;
        }
        return entities;
    }

//---------------------------------------------------------------------------

    inline void write_entity(entity const & e, entity_registry const & registry,
                             group_writer & w, diagnostics & log)
    {
        auto type = entity_type(e);
        auto h = registry.find(type);
        if (!h || !h->write)
        {
            log.warn(diagnostic_kind::unhandled_entity, {}, "no writer for entity " + std::string(type));
            return;
        }

        w.write_text(0, type);
        h->write(e, w);
    }

} // namespace dxf

#endif
