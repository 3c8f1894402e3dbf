// dxf_document.hpp - DXF group-stream codec - Document model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_DOCUMENT_HPP
#define DXF_DOCUMENT_HPP

#include "dxf_core.hpp"
#include "dxf_entities.hpp"

namespace dxf
{
//========================================================================
// HEADER
//========================================================================

    using header_value = std::variant<
        std::string,
        double,
        int64_t,
        bool,
        point
    >;

    // The code is the one the variable was read with. Variables built by
    // hand may leave it empty; the writer then looks the name up.
    struct header_variable
    {
        header_value       value;
        std::optional<int> code;

        bool operator==(header_variable const &) const = default;
    };

    using header_section = keyed_list<header_variable>;

//========================================================================
// CLASSES
//========================================================================

    struct class_record
    {
        std::optional<std::string> record_name;        // 1
        std::optional<std::string> class_name;         // 2
        std::optional<std::string> application_name;   // 3
        std::optional<int64_t>     proxy_flags;        // 90
        std::optional<int64_t>     instance_count;     // 91
        std::optional<bool>        was_a_proxy;        // 280
        std::optional<bool>        is_an_entity;       // 281

        bool operator==(class_record const &) const = default;
    };

    using classes_section = keyed_list<class_record>;

//========================================================================
// TABLES
//========================================================================

    struct viewport_record
    {
        std::optional<std::string> name;                       // 2
        std::optional<std::string> handle;                     // 5
        std::optional<std::string> owner_handle;               // 330
        std::optional<int64_t>     flags;                      // 70
        std::optional<point>       lower_left;                 // 10
        std::optional<point>       upper_right;                // 11
        std::optional<point>       center;                     // 12
        std::optional<point>       snap_base_point;            // 13
        std::optional<point>       snap_spacing;               // 14
        std::optional<point>       grid_spacing;               // 15
        std::optional<point>       view_direction;             // 16
        std::optional<point>       view_target;                // 17
        std::optional<double>      view_height;                // 40
        std::optional<double>      aspect_ratio;               // 41
        std::optional<double>      lens_length;                // 42
        std::optional<double>      front_clipping_plane;       // 43
        std::optional<double>      back_clipping_plane;        // 44
        std::optional<double>      view_height2;               // 45
        std::optional<double>      snap_rotation_angle;        // 50
        std::optional<double>      view_twist_angle;           // 51
        std::optional<int64_t>     circle_sides;               // 72
        std::optional<int64_t>     ucs_icon;                   // 74
        std::optional<int64_t>     render_mode;                // 281
        std::optional<int64_t>     view_mode;                  // 71
        std::optional<int64_t>     fast_zoom;                  // 73
        std::optional<int64_t>     snap_on;                    // 75
        std::optional<int64_t>     snap_style;                 // 76
        std::optional<int64_t>     snap_isopair;               // 77
        std::optional<int64_t>     grid_on;                    // 78
        std::optional<int64_t>     grid_behavior;              // 60
        std::optional<int64_t>     grid_major;                 // 61
        std::optional<int64_t>     ucs_per_viewport;           // 65
        std::optional<point>       ucs_origin;                 // 110
        std::optional<point>       ucs_x_axis;                 // 111
        std::optional<point>       ucs_y_axis;                 // 112
        std::optional<int64_t>     orthographic_type;          // 79
        std::optional<double>      elevation;                  // 146
        std::optional<double>      brightness;                 // 141
        std::optional<double>      contrast;                   // 142
        std::optional<bool>        use_default_lights;         // 292
        std::optional<int64_t>     default_lighting_type;      // 282
        std::optional<int64_t>     ambient_color_index;        // 63
        std::optional<int64_t>     ambient_true_color;         // 421
        std::optional<std::string> ambient_color_name;         // 431
        std::optional<std::string> background_handle;          // 332
        std::optional<std::string> shade_plot_handle;          // 333
        std::optional<std::string> visual_style_handle;        // 348
        std::optional<std::string> sun_handle;                 // 361
        std::optional<std::string> ucs_handle;                 // 345
        std::optional<std::string> base_ucs_handle;            // 346
        std::vector<application_group> application_groups;

        bool operator==(viewport_record const &) const = default;
    };

    // One dash, dot or embedded shape/text of a line type pattern.
    struct line_type_element
    {
        std::optional<double>      length;             // 49
        std::optional<int64_t>     type;               // 74
        std::optional<int64_t>     shape_number;       // 75
        std::optional<std::string> style_handle;       // 340
        std::optional<double>      scale;              // 46
        std::optional<double>      rotation;           // 50
        std::optional<double>      offset_x;           // 44
        std::optional<double>      offset_y;           // 45
        std::optional<std::string> text;               // 9

        bool operator==(line_type_element const &) const = default;
    };

    struct line_type_record
    {
        std::optional<std::string> name;               // 2
        std::optional<std::string> handle;             // 5
        std::optional<std::string> owner_handle;       // 330
        std::optional<int64_t>     flags;              // 70
        std::optional<std::string> description;        // 3
        std::optional<int64_t>     alignment;          // 72
        std::optional<int64_t>     element_count;      // 73
        std::optional<double>      pattern_length;     // 40
        std::vector<line_type_element> elements;
        std::vector<application_group> application_groups;

        bool operator==(line_type_record const &) const = default;
    };

    struct layer_record
    {
        std::optional<std::string> name;               // 2
        std::optional<std::string> handle;             // 5
        std::optional<std::string> owner_handle;       // 330
        std::optional<int64_t>     flags;              // 70
        std::optional<bool>        frozen;             // 70 & (1|2), derived
        std::optional<int64_t>     color_index;        // |62|
        std::optional<bool>        visible;            // 62 >= 0
        std::optional<int64_t>     true_color;         // 420
        std::optional<std::string> line_type;          // 6
        std::optional<bool>        plot;               // 290
        std::optional<int64_t>     lineweight;         // 370
        std::optional<std::string> plot_style_handle;  // 390
        std::optional<std::string> material_handle;    // 347
        std::optional<std::string> visual_style_handle;// 348
        std::vector<application_group> application_groups;

        bool operator==(layer_record const &) const = default;
    };

    // Table properties are shared by every symbol table.
    template <typename Records>
    struct symbol_table
    {
        std::optional<std::string>     handle;         // 5
        std::optional<std::string>     owner_handle;   // 330
        std::optional<int64_t>         max_entries;    // 70
        std::vector<application_group> application_groups;
        Records                        records;

        bool operator==(symbol_table const &) const = default;
    };

    using viewport_table  = symbol_table<std::vector<viewport_record>>;
    using line_type_table = symbol_table<keyed_list<line_type_record>>;
    using layer_table     = symbol_table<keyed_list<layer_record>>;

    struct tables_section
    {
        std::optional<viewport_table>  viewports;
        std::optional<line_type_table> line_types;
        std::optional<layer_table>     layers;

        bool operator==(tables_section const &) const = default;
    };

//========================================================================
// BLOCKS
//========================================================================

    struct block
    {
        std::optional<std::string> name;               // 2
        std::optional<std::string> name2;              // 3
        std::optional<std::string> handle;             // 5
        std::optional<std::string> owner_handle;       // 330
        std::optional<std::string> layer;              // 8
        std::optional<std::string> xref_path;          // 1
        std::optional<std::string> description;        // 4
        std::optional<point>       position;           // 10
        std::optional<int64_t>     type_flags;         // 70
        std::optional<bool>        in_paper_space;     // 67
        std::vector<entity>        entities;
        std::optional<entity_common> end_block;        // ENDBLK record

        bool operator==(block const &) const = default;
    };

    using blocks_section = keyed_list<block>;

    using entities_section = std::vector<entity>;

//========================================================================
// Drawing
//========================================================================

    // A section that was not in the input stays absent; an empty section
    // that was in the input stays present.
    struct drawing
    {
        std::optional<header_section>   header;
        std::optional<classes_section>  classes;
        std::optional<tables_section>   tables;
        std::optional<blocks_section>   blocks;
        std::optional<entities_section> entities;

        bool operator==(drawing const &) const = default;
    };

//========================================================================
// Section boundaries
//========================================================================

    // True on 0/ENDSEC. A section cut short by 0/EOF also ends here, with a
    // warning.
    inline bool section_ended(group const & g, diagnostics & log, std::string_view section)
    {
        if (g.is(0, token::end_section))
            return true;
        if (g.is(0, token::eof))
        {
            log.warn(diagnostic_kind::unhandled_section, g.loc,
                     std::string(section) + " section ended by EOF instead of ENDSEC");
            return true;
        }
        return false;
    }

    // Skips the record started by the scanner's last group. Stops on the next
    // code-0 group and leaves it as the last group.
    inline void skip_record(scanner & sc)
    {
        while (sc.next().code != 0)
            ;
    }

    // Logs a group the section does not expect and moves past it. A code-0
    // group takes its whole record along. Returns the next group to look at.
    inline group skip_unexpected(scanner & sc, diagnostics & log, group const & g)
    {
        log_unhandled(log, g);
        if (g.code != 0)
            return sc.next();
        skip_record(sc);
        return *sc.last();
    }

} // namespace dxf

#endif
