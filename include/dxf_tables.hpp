// dxf_tables.hpp - DXF group-stream codec - TABLES section
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_TABLES_HPP
#define DXF_TABLES_HPP

#include "dxf_document.hpp"
#include "dxf_entity_polylines.hpp"

namespace dxf
{
//========================================================================
// TABLES API
//========================================================================

    // The scanner's last group is 2/TABLES. Returns with 0/ENDSEC (or
    // 0/EOF) as the last group. Tables other than VPORT, LTYPE and LAYER are
    // skipped with a warning.
    tables_section read_tables(parse_state & st);
    void write_tables(tables_section const & tables, group_writer & w);

    // The scanner's last group is the 2/<kind> group after 0/TABLE. Returns
    // with 0/ENDTAB as the last group, or the group that cut the table short.
    template <typename Records, typename ReadRecord>
    symbol_table<Records> read_symbol_table(parse_state & st, std::string_view kind, ReadRecord && read_one);

    template <typename Records, typename WriteRecord>
    void write_symbol_table(symbol_table<Records> const & table, std::string_view kind,
                            group_writer & w, WriteRecord && write_one);

//========================================================================
// Code tables
//========================================================================

    template <typename Records>
    inline constexpr field<symbol_table<Records>> symbol_table_fields[3] =
    {
        { 5,   &symbol_table<Records>::handle },
        { 330, &symbol_table<Records>::owner_handle },
        { 70,  &symbol_table<Records>::max_entries },
    };

    inline constexpr field<viewport_record> viewport_fields[] =
    {
        { 2,   &viewport_record::name },
        { 5,   &viewport_record::handle },
        { 330, &viewport_record::owner_handle },
        { 70,  &viewport_record::flags },
        { 10,  &viewport_record::lower_left },
        { 11,  &viewport_record::upper_right },
        { 12,  &viewport_record::center },
        { 13,  &viewport_record::snap_base_point },
        { 14,  &viewport_record::snap_spacing },
        { 15,  &viewport_record::grid_spacing },
        { 16,  &viewport_record::view_direction },
        { 17,  &viewport_record::view_target },
        { 40,  &viewport_record::view_height },
        { 41,  &viewport_record::aspect_ratio },
        { 42,  &viewport_record::lens_length },
        { 43,  &viewport_record::front_clipping_plane },
        { 44,  &viewport_record::back_clipping_plane },
        { 45,  &viewport_record::view_height2 },
        { 50,  &viewport_record::snap_rotation_angle },
        { 51,  &viewport_record::view_twist_angle },
        { 72,  &viewport_record::circle_sides },
        { 74,  &viewport_record::ucs_icon },
        { 281, &viewport_record::render_mode },
        { 71,  &viewport_record::view_mode },
        { 73,  &viewport_record::fast_zoom },
        { 75,  &viewport_record::snap_on },
        { 76,  &viewport_record::snap_style },
        { 77,  &viewport_record::snap_isopair },
        { 78,  &viewport_record::grid_on },
        { 60,  &viewport_record::grid_behavior },
        { 61,  &viewport_record::grid_major },
        { 65,  &viewport_record::ucs_per_viewport },
        { 110, &viewport_record::ucs_origin },
        { 111, &viewport_record::ucs_x_axis },
        { 112, &viewport_record::ucs_y_axis },
        { 79,  &viewport_record::orthographic_type },
        { 146, &viewport_record::elevation },
        { 141, &viewport_record::brightness },
        { 142, &viewport_record::contrast },
        { 292, &viewport_record::use_default_lights },
        { 282, &viewport_record::default_lighting_type },
        { 63,  &viewport_record::ambient_color_index },
        { 421, &viewport_record::ambient_true_color },
        { 431, &viewport_record::ambient_color_name },
        { 332, &viewport_record::background_handle },
        { 333, &viewport_record::shade_plot_handle },
        { 348, &viewport_record::visual_style_handle },
        { 361, &viewport_record::sun_handle },
        { 345, &viewport_record::ucs_handle },
        { 346, &viewport_record::base_ucs_handle },
    };

    inline constexpr field<line_type_record> line_type_fields[] =
    {
        { 2,   &line_type_record::name },
        { 5,   &line_type_record::handle },
        { 330, &line_type_record::owner_handle },
        { 70,  &line_type_record::flags },
        { 3,   &line_type_record::description },
        { 72,  &line_type_record::alignment },
        { 73,  &line_type_record::element_count },
        { 40,  &line_type_record::pattern_length },
    };

    // 49 opens an element; the other codes attach to the open one.
    inline constexpr field<line_type_element> line_type_element_fields[] =
    {
        { 49,  &line_type_element::length },
        { 74,  &line_type_element::type },
        { 75,  &line_type_element::shape_number },
        { 340, &line_type_element::style_handle },
        { 46,  &line_type_element::scale },
        { 50,  &line_type_element::rotation },
        { 44,  &line_type_element::offset_x },
        { 45,  &line_type_element::offset_y },
        { 9,   &line_type_element::text },
    };

    // 62 is special: its sign carries visibility.
    inline constexpr field<layer_record> layer_fields[] =
    {
        { 2,   &layer_record::name },
        { 5,   &layer_record::handle },
        { 330, &layer_record::owner_handle },
        { 70,  &layer_record::flags },
        { 420, &layer_record::true_color },
        { 6,   &layer_record::line_type },
        { 290, &layer_record::plot },
        { 370, &layer_record::lineweight },
        { 390, &layer_record::plot_style_handle },
        { 347, &layer_record::material_handle },
        { 348, &layer_record::visual_style_handle },
    };

    constexpr int64_t layer_frozen_mask = 1 | 2;

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline bool read_application_groups(std::vector<application_group> & out, group const & g, parse_state & st)
        {
            if (g.code != 102 || !g.text().starts_with('{'))
                return false;
            out.push_back(parse_application_group(st.sc, st.log));
            return true;
        }

        inline void write_application_groups(std::vector<application_group> const & groups, group_writer & w)
        {
            for (auto const & ag : groups)
                write_application_group(ag, w);
        }

        template <typename R>
        void add_named(keyed_list<R> & records, R r, std::string_view kind, source_location loc, diagnostics & log)
        {
            if (!r.name)
            {
                log.error(diagnostic_kind::missing_name, loc, std::string(kind) + " record without a name dropped");
                return;
            }
            std::string name = *r.name;
            records.set(std::move(name), std::move(r));
        }

        inline size_t record_count(std::vector<viewport_record> const & v) { return v.size(); }

        template <typename R>
        size_t record_count(keyed_list<R> const & l) { return l.size(); }

        // Skips an unsupported table up to its 0/ENDTAB.
        inline void skip_table(scanner & sc)
        {
            for (group g = sc.next(); !g.is(0, token::end_table); g = sc.next())
            {
                if (g.is(0, token::end_section) || g.is(0, token::eof))
                    return;
            }
        }
    }

//---------------------------------------------------------------------------
// Records
//---------------------------------------------------------------------------

    inline viewport_record read_viewport(parse_state & st)
    {
        return read_record<viewport_record>(st.sc, st.log, viewport_fields,
            [&st](viewport_record & r, group const & g)
            {
                return detail::read_application_groups(r.application_groups, g, st);
            });
    }

    inline line_type_record read_line_type(parse_state & st)
    {
        auto loc = st.sc.last()->loc;
        auto r = read_record<line_type_record>(st.sc, st.log, line_type_fields,
            [&st](line_type_record & lt, group const & g)
            {
                if (detail::read_application_groups(lt.application_groups, g, st))
                    return true;
                if (g.code == 49)
                    lt.elements.emplace_back();
                else if (lt.elements.empty())
                    return false;
                return read_bound<line_type_element>(lt.elements.back(), line_type_element_fields, st.sc, st.log);
            });

        check_count(st.log, r.element_count, r.elements.size(), "LTYPE pattern elements", loc);
        return r;
    }

    inline layer_record read_layer(parse_state & st)
    {
        auto r = read_record<layer_record>(st.sc, st.log, layer_fields,
            [&st](layer_record & l, group const & g)
            {
                if (detail::read_application_groups(l.application_groups, g, st))
                    return true;
                if (g.code != 62)
                    return false;
                int64_t color = detail::int_value(g);
                l.visible = color >= 0;
                l.color_index = color < 0 ? -color : color;
                return true;
            });

        if (r.flags)
            r.frozen = flag_set(*r.flags, layer_frozen_mask);
        return r;
    }

//---------------------------------------------------------------------------

    inline void write_viewport(viewport_record const & r, group_writer & w)
    {
        w.write_text(0, token::vport);
        write_fields<viewport_record>(r, viewport_fields, w);
        detail::write_application_groups(r.application_groups, w);
    }

    inline void write_line_type(line_type_record const & r, group_writer & w)
    {
        w.write_text(0, token::ltype);
        write_fields<line_type_record>(r, line_type_fields, w);
        detail::write_application_groups(r.application_groups, w);
        for (auto const & e : r.elements)
            write_fields<line_type_element>(e, line_type_element_fields, w);
    }

    inline void write_layer(layer_record const & r, group_writer & w)
    {
        w.write_text(0, token::layer);
        write_fields<layer_record>(r, layer_fields, w);
        if (r.color_index)
            w.write_value(62, r.visible == false ? -*r.color_index : *r.color_index);
        detail::write_application_groups(r.application_groups, w);
    }

//---------------------------------------------------------------------------
// Tables
//---------------------------------------------------------------------------

    template <typename Records, typename ReadRecord>
    symbol_table<Records> read_symbol_table(parse_state & st, std::string_view kind, ReadRecord && read_one)
    {
        using table_type = symbol_table<Records>;

        table_type table;
        auto loc = st.sc.last()->loc;

        group g = st.sc.next();
        while (!g.is(0, token::end_table))
        {
            if (g.code == 0)
            {
                if (g.is(0, kind))
                {
                    read_one(st, table.records);
                    g = *st.sc.last();
                    continue;
                }
                if (g.is(0, token::end_section) || g.is(0, token::eof))
                {
                    st.log.warn(diagnostic_kind::unhandled_table, g.loc,
                                std::string(kind) + " table not closed by ENDTAB");
                    break;
                }
                st.log.warn(diagnostic_kind::unhandled_group, g.loc,
                            std::string(g.text()) + " record in " + std::string(kind) + " table skipped");
                skip_record(st.sc);
                g = *st.sc.last();
                continue;
            }

            if (!detail::read_application_groups(table.application_groups, g, st) &&
                !read_bound<table_type>(table, symbol_table_fields<Records>, st.sc, st.log) &&
                !(g.code == 100 && g.text() == "AcDbSymbolTable"))
                log_unhandled(st.log, g);

            g = st.sc.next();
        }

        auto count = detail::record_count(table.records);
        if (table.max_entries && static_cast<int64_t>(count) > *table.max_entries)
            st.log.warn(diagnostic_kind::count_mismatch, loc,
                        std::string(kind) + " table holds " + std::to_string(count) +
                        " records, more than the declared " + std::to_string(*table.max_entries));
        return table;
    }

    template <typename Records, typename WriteRecord>
    void write_symbol_table(symbol_table<Records> const & table, std::string_view kind,
                            group_writer & w, WriteRecord && write_one)
    {
        w.write_text(0, token::table);
        w.write_text(2, kind);
        w.write(5, table.handle);
        w.write(330, table.owner_handle);
        detail::write_application_groups(table.application_groups, w);
        w.write(70, table.max_entries);

        for (auto const & r : table.records)
        {
            if constexpr (std::is_same_v<Records, std::vector<viewport_record>>)
                write_one(r, w);
            else
                write_one(r.second, w);
        }
        w.write_text(0, token::end_table);
    }

//---------------------------------------------------------------------------
// Section
//---------------------------------------------------------------------------

    inline tables_section read_tables(parse_state & st)
    {
        tables_section tables;

        group g = st.sc.next();
        while (!section_ended(g, st.log, token::tables))
        {
            if (!g.is(0, token::table))
            {
                g = skip_unexpected(st.sc, st.log, g);
                continue;
            }

            group name = st.sc.next();
            std::string_view kind = name.code == 2 ? name.text() : std::string_view{};

            if (kind == token::vport)
            {
                tables.viewports = read_symbol_table<std::vector<viewport_record>>(st, kind,
                    [](parse_state & s, std::vector<viewport_record> & records)
                    {
                        records.push_back(read_viewport(s));
                    });
            }
            else if (kind == token::ltype)
            {
                tables.line_types = read_symbol_table<keyed_list<line_type_record>>(st, kind,
                    [](parse_state & s, keyed_list<line_type_record> & records)
                    {
                        auto loc = s.sc.last()->loc;
                        detail::add_named(records, read_line_type(s), token::ltype, loc, s.log);
                    });
            }
            else if (kind == token::layer)
            {
                tables.layers = read_symbol_table<keyed_list<layer_record>>(st, kind,
                    [](parse_state & s, keyed_list<layer_record> & records)
                    {
                        auto loc = s.sc.last()->loc;
                        detail::add_named(records, read_layer(s), token::layer, loc, s.log);
                    });
            }
            else
            {
                st.log.warn(diagnostic_kind::unhandled_table, name.loc,
                            "unhandled table " + (kind.empty() ? std::string("without a name") : std::string(kind)));
                if (name.code == 0)
                    st.sc.rewind();
                detail::skip_table(st.sc);
            }

            g = st.sc.last()->is(0, token::end_table) ? st.sc.next() : *st.sc.last();
        }
        return tables;
    }

    inline void write_tables(tables_section const & tables, group_writer & w)
    {
        if (tables.viewports)
            write_symbol_table(*tables.viewports, token::vport, w, write_viewport);
        if (tables.line_types)
            write_symbol_table(*tables.line_types, token::ltype, w, write_line_type);
        if (tables.layers)
            write_symbol_table(*tables.layers, token::layer, w, write_layer);
    }

} // namespace dxf

#endif
