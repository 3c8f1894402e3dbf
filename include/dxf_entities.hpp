// dxf_entities.hpp - DXF group-stream codec - Entity model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_ENTITIES_HPP
#define DXF_ENTITIES_HPP

#include "dxf_core.hpp"
#include "dxf_record.hpp"
#include <map>

namespace dxf
{
//========================================================================
// Common entity properties
//========================================================================

    struct entity_common
    {
        std::optional<std::string> handle;                 // 5
        std::optional<std::string> owner_handle;           // 330
        std::optional<std::string> layer;                  // 8
        std::optional<std::string> line_type;              // 6
        std::optional<std::string> material_handle;        // 347
        std::optional<int64_t>     color_index;            // 62
        std::optional<int64_t>     true_color;             // 420
        std::optional<int64_t>     lineweight;             // 370
        std::optional<double>      line_type_scale;        // 48
        std::optional<bool>        visible;                // 60, 0 means visible
        std::optional<bool>        in_paper_space;         // 67
        std::optional<bool>        entities_follow;        // 66

        bool operator==(entity_common const &) const = default;
    };

    inline constexpr field<entity_common> common_fields[] =
    {
        { 5,   &entity_common::handle },
        { 330, &entity_common::owner_handle },
        { 8,   &entity_common::layer },
        { 6,   &entity_common::line_type },
        { 347, &entity_common::material_handle },
        { 62,  &entity_common::color_index },
        { 420, &entity_common::true_color },
        { 370, &entity_common::lineweight },
        { 48,  &entity_common::line_type_scale },
        { 60,  &entity_common::visible, encoding::inverted_boolean },
        { 67,  &entity_common::in_paper_space, encoding::boolean },
        { 66,  &entity_common::entities_follow, encoding::boolean },
    };

//========================================================================
// Entity kinds
//========================================================================

    struct point_entity
    {
        static constexpr std::string_view type_name = "POINT";

        entity_common         common;
        std::optional<point>  position;         // 10
        std::optional<double> thickness;        // 39
        std::optional<double> x_axis_angle;     // 50
        std::optional<int64_t> flags;           // 70
        std::optional<point>  extrusion;        // 210

        bool operator==(point_entity const &) const = default;
    };

    struct line_entity
    {
        static constexpr std::string_view type_name = "LINE";

        entity_common          common;
        std::optional<point>   start;           // 10
        std::optional<point>   end;             // 11
        std::optional<double>  thickness;       // 39
        std::optional<int64_t> flags;           // 70
        std::optional<point>   extrusion;       // 210

        bool operator==(line_entity const &) const = default;
    };

    struct circle_entity
    {
        static constexpr std::string_view type_name = "CIRCLE";

        entity_common          common;
        std::optional<point>   center;          // 10
        std::optional<double>  radius;          // 40
        std::optional<double>  thickness;       // 39
        std::optional<double>  start_angle;     // 50, degrees
        std::optional<double>  end_angle;       // 51, degrees
        std::optional<double>  angle_length;    // derived from 50/51
        std::optional<int64_t> flags;           // 70
        std::optional<point>   extrusion;       // 210

        bool operator==(circle_entity const &) const = default;
    };

    struct arc_entity
    {
        static constexpr std::string_view type_name = "ARC";

        entity_common          common;
        std::optional<point>   center;
        std::optional<double>  radius;
        std::optional<double>  thickness;
        std::optional<double>  start_angle;
        std::optional<double>  end_angle;
        std::optional<double>  angle_length;
        std::optional<int64_t> flags;
        std::optional<point>   extrusion;

        bool operator==(arc_entity const &) const = default;
    };

    struct ellipse_entity
    {
        static constexpr std::string_view type_name = "ELLIPSE";

        entity_common              common;
        std::optional<point>       center;              // 10
        std::optional<point>       major_axis_end;      // 11, relative to center
        std::optional<double>      axis_ratio;          // 40
        std::optional<double>      start_parameter;     // 41
        std::optional<double>      end_parameter;       // 42
        std::optional<std::string> name;                // 2
        std::optional<int64_t>     flags;               // 70
        std::optional<point>       extrusion;           // 210

        bool operator==(ellipse_entity const &) const = default;
    };

    struct solid_entity
    {
        static constexpr std::string_view type_name = "SOLID";

        entity_common                      common;
        std::array<std::optional<point>, 4> corners;    // 10..13
        std::optional<double>              thickness;
        std::optional<int64_t>             flags;
        std::optional<point>               extrusion;

        bool operator==(solid_entity const &) const = default;
    };

    struct insert_entity
    {
        static constexpr std::string_view type_name = "INSERT";

        entity_common              common;
        std::optional<std::string> block_name;          // 2
        std::optional<point>       position;            // 10
        std::optional<double>      x_scale;             // 41
        std::optional<double>      y_scale;             // 42
        std::optional<double>      z_scale;             // 43
        std::optional<double>      rotation;            // 50
        std::optional<int64_t>     column_count;        // 70
        std::optional<int64_t>     row_count;           // 71
        std::optional<double>      column_spacing;      // 44
        std::optional<double>      row_spacing;         // 45
        std::optional<point>       extrusion;           // 210

        bool operator==(insert_entity const &) const = default;
    };

    struct dimension_entity
    {
        static constexpr std::string_view type_name = "DIMENSION";

        entity_common              common;
        std::optional<std::string> block_name;          // 2
        std::optional<std::string> style_name;          // 3
        std::optional<std::string> text;                // 1
        std::optional<point>       definition_point;    // 10
        std::optional<point>       text_midpoint;       // 11
        std::optional<point>       insertion_point;     // 12
        std::optional<point>       first_point;         // 13
        std::optional<point>       second_point;        // 14
        std::optional<point>       arc_center_point;    // 15
        std::optional<point>       arc_point;           // 16
        std::optional<int64_t>     dimension_type;      // 70
        std::optional<int64_t>     attachment_point;    // 71
        std::optional<int64_t>     line_spacing_style;  // 72
        std::optional<double>      measurement;         // 42
        std::optional<double>      angle;               // 50
        std::optional<double>      text_rotation;       // 53
        std::optional<point>       extrusion;           // 210

        bool operator==(dimension_entity const &) const = default;
    };

    struct text_entity
    {
        static constexpr std::string_view type_name = "TEXT";

        entity_common              common;
        std::optional<std::string> text;                // 1
        std::optional<std::string> style;               // 7
        std::optional<point>       start;               // 10
        std::optional<point>       end;                 // 11
        std::optional<double>      height;              // 40
        std::optional<double>      x_scale;             // 41
        std::optional<double>      rotation;            // 50
        std::optional<double>      oblique_angle;       // 51
        std::optional<double>      thickness;           // 39
        std::optional<int64_t>     flags;               // 70
        std::optional<int64_t>     generation_flags;    // 71
        std::optional<int64_t>     halign;              // 72
        std::optional<int64_t>     valign;              // 73
        std::optional<point>       extrusion;           // 210

        bool operator==(text_entity const &) const = default;
    };

    struct mtext_entity
    {
        static constexpr std::string_view type_name = "MTEXT";

        entity_common              common;
        std::optional<std::string> text;                // 1 and 3, chunked
        std::optional<std::string> style;               // 7
        std::optional<point>       position;            // 10
        std::optional<point>       direction;           // 11
        std::optional<double>      height;              // 40
        std::optional<double>      reference_width;     // 41
        std::optional<double>      line_spacing_factor; // 44
        std::optional<double>      rotation;            // 50
        std::optional<int64_t>     flags;               // 70
        std::optional<int64_t>     attachment_point;    // 71
        std::optional<int64_t>     drawing_direction;   // 72
        std::optional<int64_t>     line_spacing_style;  // 73
        std::optional<point>       extrusion;           // 210

        bool operator==(mtext_entity const &) const = default;
    };

    struct attdef_entity
    {
        static constexpr std::string_view type_name = "ATTDEF";
        static constexpr std::string_view default_text_style = "STANDARD";
        static constexpr double           default_scale = 1.0;

        entity_common              common;
        std::optional<std::string> text;                // 1
        std::optional<std::string> tag;                 // 2
        std::optional<std::string> prompt;              // 3
        std::optional<std::string> text_style;          // 7
        std::optional<point>       start;               // 10
        std::optional<point>       end;                 // 11
        std::optional<double>      thickness;           // 39
        std::optional<double>      text_height;         // 40
        std::optional<double>      scale;               // 41
        std::optional<double>      rotation;            // 50
        std::optional<double>      oblique_angle;       // 51
        std::optional<int64_t>     flags;               // 70
        std::optional<int64_t>     generation_flags;    // 71
        std::optional<int64_t>     halign;              // 72
        std::optional<int64_t>     field_length;        // 73
        std::optional<int64_t>     valign;              // 74
        std::optional<point>       extrusion;           // 210

        // from 70
        std::optional<bool> invisible;
        std::optional<bool> constant;
        std::optional<bool> verification_required;
        std::optional<bool> preset;
        // from 71
        std::optional<bool> backwards;
        std::optional<bool> mirrored;

        std::string_view effective_text_style() const noexcept
        { return text_style ? std::string_view(*text_style) : default_text_style; }

        double effective_scale() const noexcept { return scale.value_or(default_scale); }

        bool operator==(attdef_entity const &) const = default;
    };

    struct face3d_entity
    {
        static constexpr std::string_view type_name = "3DFACE";

        entity_common          common;
        std::vector<point>     vertices;            // 10..13, at most four
        std::optional<int64_t> flags;               // 70

        std::optional<bool>    shape;
        std::optional<bool>    has_continuous_linetype_pattern;

        bool operator==(face3d_entity const &) const = default;
    };

    struct lwpolyline_vertex
    {
        point                  location;            // 10
        std::optional<double>  start_width;         // 40
        std::optional<double>  end_width;           // 41
        std::optional<double>  bulge;               // 42
        std::optional<int64_t> id;                  // 91

        bool operator==(lwpolyline_vertex const &) const = default;
    };

    struct lwpolyline_entity
    {
        static constexpr std::string_view type_name = "LWPOLYLINE";

        entity_common                  common;
        std::optional<int64_t>         vertex_count;    // 90, as declared
        std::optional<int64_t>         flags;           // 70
        std::optional<double>          elevation;       // 38
        std::optional<double>          thickness;       // 39
        std::optional<double>          constant_width;  // 43
        std::optional<point>           extrusion;       // 210
        std::vector<lwpolyline_vertex> vertices;

        std::optional<bool>            closed;
        std::optional<bool>            plinegen;

        bool operator==(lwpolyline_entity const &) const = default;
    };

    struct vertex_entity
    {
        static constexpr std::string_view type_name = "VERTEX";

        entity_common          common;
        std::optional<point>   location;            // 10
        std::optional<double>  start_width;         // 40
        std::optional<double>  end_width;           // 41
        std::optional<double>  bulge;               // 42
        std::optional<double>  tangent_direction;   // 50
        std::optional<int64_t> flags;               // 70
        std::optional<int64_t> face_a;              // 71
        std::optional<int64_t> face_b;              // 72
        std::optional<int64_t> face_c;              // 73
        std::optional<int64_t> face_d;              // 74
        std::optional<int64_t> id;                  // 91

        std::optional<bool> curve_fit_extra;
        std::optional<bool> curve_fit_tangent;
        std::optional<bool> spline_vertex;
        std::optional<bool> spline_control_point;
        std::optional<bool> polyline_3d_vertex;
        std::optional<bool> mesh_3d_vertex;
        std::optional<bool> polyface_vertex;

        bool operator==(vertex_entity const &) const = default;
    };

    struct polyline_entity
    {
        static constexpr std::string_view type_name = "POLYLINE";

        entity_common                common;
        std::optional<point>         elevation_point;   // 10
        std::optional<double>        thickness;         // 39
        std::optional<double>        start_width;       // 40
        std::optional<double>        end_width;         // 41
        std::optional<int64_t>       flags;             // 70
        std::optional<int64_t>       mesh_m_count;      // 71
        std::optional<int64_t>       mesh_n_count;      // 72
        std::optional<int64_t>       smooth_m_density;  // 73
        std::optional<int64_t>       smooth_n_density;  // 74
        std::optional<int64_t>       surface_type;      // 75
        std::optional<point>         extrusion;         // 210
        std::vector<vertex_entity>   vertices;
        std::optional<entity_common> sequence_end;      // SEQEND record

        std::optional<bool> closed;
        std::optional<bool> curve_fit;
        std::optional<bool> spline_fit;
        std::optional<bool> is_3d_polyline;
        std::optional<bool> is_3d_mesh;
        std::optional<bool> mesh_closed_n;
        std::optional<bool> is_polyface;
        std::optional<bool> plinegen;

        bool operator==(polyline_entity const &) const = default;
    };

    struct spline_control_point
    {
        point                 location;         // 10
        std::optional<double> weight;           // 41 directly after the point

        bool operator==(spline_control_point const &) const = default;
    };

    struct spline_entity
    {
        static constexpr std::string_view type_name = "SPLINE";

        entity_common                     common;
        std::optional<point>              normal;                   // 210
        std::optional<int64_t>            flags;                    // 70
        std::optional<int64_t>            degree;                   // 71
        std::optional<int64_t>            knot_count;               // 72
        std::optional<int64_t>            control_point_count;      // 73
        std::optional<int64_t>            fit_point_count;          // 74
        std::optional<double>             knot_tolerance;           // 42
        std::optional<double>             control_point_tolerance;  // 43
        std::optional<double>             fit_tolerance;            // 44
        std::optional<point>              start_tangent;            // 12
        std::optional<point>              end_tangent;              // 13
        std::vector<double>               knots;                    // 40
        std::vector<double>               weights;                  // 41 not after a control point
        std::vector<spline_control_point> control_points;           // 10
        std::vector<point>                fit_points;               // 11

        std::optional<bool> closed;
        std::optional<bool> periodic;
        std::optional<bool> rational;
        std::optional<bool> planar;
        std::optional<bool> linear;

        bool operator==(spline_entity const &) const = default;
    };

//------------------------------------------------------------------------
// Multileader hierarchy: CONTEXT_DATA{ LEADER{ LEADER_LINE{ } } }
//------------------------------------------------------------------------

    struct mleader_line
    {
        std::vector<point>     vertices;            // 10
        std::optional<point>   break_start;         // 11
        std::optional<point>   break_end;           // 12
        std::optional<int64_t> break_point_index;   // 90
        std::optional<int64_t> line_index;          // 91

        bool operator==(mleader_line const &) const = default;
    };

    struct mleader_leader
    {
        std::optional<point>      last_line_point;      // 10
        std::optional<point>      dogleg_vector;        // 11
        std::optional<point>      break_start;          // 12
        std::optional<point>      break_end;            // 13
        std::optional<double>     dogleg_length;        // 40
        std::optional<int64_t>    branch_index;         // 90
        std::optional<bool>       has_last_line_point;  // 290
        std::optional<bool>       has_dogleg_vector;    // 291
        std::vector<mleader_line> lines;

        bool operator==(mleader_leader const &) const = default;
    };

    struct mleader_context
    {
        std::optional<point>       content_base_position;       // 10
        std::optional<point>       text_normal;                 // 11
        std::optional<point>       text_location;               // 12
        std::optional<point>       text_direction;              // 13
        std::optional<point>       block_content_normal;        // 14
        std::optional<point>       block_content_position;      // 15
        std::optional<double>      block_content_scale;         // 16
        std::optional<double>      content_scale;               // 40
        std::optional<double>      text_height;                 // 41
        std::optional<double>      text_rotation;               // 42
        std::optional<double>      text_width;                  // 43
        std::optional<double>      text_height2;                // 44
        std::optional<double>      text_line_spacing_factor;    // 45
        std::optional<double>      block_content_rotation;      // 46
        std::optional<int64_t>     break_point_index;           // 90
        std::optional<int64_t>     text_background_color;       // 91
        std::optional<int64_t>     text_background_transparency;// 92
        std::optional<int64_t>     block_content_color;         // 93
        std::optional<point>       plane_origin;                // 110
        std::optional<point>       plane_x_axis;                // 111
        std::optional<point>       plane_y_axis;                // 112
        std::optional<double>      arrow_head_size;             // 140
        std::optional<double>      text_background_scale;       // 141
        std::optional<double>      text_column_width;           // 142
        std::optional<double>      text_column_gutter_width;    // 143
        std::optional<double>      text_column_height;          // 144
        std::optional<double>      landing_gap;                 // 145
        std::optional<int64_t>     text_line_spacing_style;     // 170
        std::optional<int64_t>     text_attachment;             // 171
        std::optional<int64_t>     text_flow_direction;         // 172
        std::optional<int64_t>     text_column_type;            // 173
        std::optional<int64_t>     text_angle_type;             // 174
        std::optional<int64_t>     text_alignment_type;         // 175
        std::optional<int64_t>     block_content_connection;    // 176
        std::optional<int64_t>     block_attribute_index;       // 177
        std::optional<bool>        has_mtext;                   // 290
        std::optional<bool>        text_background_color_on;    // 291
        std::optional<bool>        text_background_fill_on;     // 292
        std::optional<bool>        text_use_auto_height;        // 293
        std::optional<bool>        text_column_flow_reversed;   // 294
        std::optional<bool>        text_use_word_break;         // 295
        std::optional<bool>        has_block;                   // 296
        std::optional<bool>        plane_normal_reversed;       // 297
        std::optional<std::string> default_text_contents;       // 304
        std::optional<std::string> text_style_id;               // 340
        std::optional<std::string> block_content_id;            // 341
        std::optional<matrix4>     block_transform;             // 47 x16
        std::vector<mleader_leader> leaders;

        bool operator==(mleader_context const &) const = default;
    };

    struct mleader_entity
    {
        static constexpr std::string_view type_name = "MULTILEADER";

        entity_common              common;
        std::optional<point>       block_content_scale;             // 10
        std::optional<double>      dogleg_length;                   // 41
        std::optional<double>      arrow_head_size;                 // 42
        std::optional<double>      block_content_rotation;          // 43
        std::optional<double>      block_attribute_width;           // 44
        std::optional<double>      text_line_spacing_factor;        // 45
        std::optional<int64_t>     property_override_flag;          // 90
        std::optional<int64_t>     leader_line_color;               // 91
        std::optional<int64_t>     text_color;                      // 92
        std::optional<int64_t>     block_content_color;             // 93
        std::optional<int64_t>     arrow_head_index;                // 94
        std::optional<int64_t>     text_right_attachment;           // 95
        std::optional<int64_t>     leader_line_type;                // 170
        std::optional<int64_t>     leader_line_weight;              // 171
        std::optional<int64_t>     content_type;                    // 172
        std::optional<int64_t>     text_left_attachment;            // 173
        std::optional<int64_t>     text_angle_type;                 // 174
        std::optional<int64_t>     text_alignment_type;             // 175
        std::optional<int64_t>     block_content_connection;        // 176
        std::optional<int64_t>     block_attribute_index;           // 177
        std::optional<int64_t>     text_align_in_ipe;               // 178
        std::optional<int64_t>     text_attachment_point;           // 179
        std::optional<int64_t>     text_attachment_direction;       // 271
        std::optional<int64_t>     text_attachment_bottom;          // 272
        std::optional<int64_t>     text_attachment_top;             // 273
        std::optional<bool>        enable_landing;                  // 290
        std::optional<bool>        enable_dogleg;                   // 291
        std::optional<bool>        enable_frame_text;               // 292
        std::optional<bool>        enable_annotation_scale;         // 293
        std::optional<bool>        text_direction_negative;         // 294
        std::optional<std::string> block_attribute_text;            // 302
        std::optional<std::string> block_attribute_id;              // 330
        std::optional<std::string> leader_style_id;                 // 340
        std::optional<std::string> leader_line_type_id;             // 341
        std::optional<std::string> arrow_head_id;                   // 342
        std::optional<std::string> text_style_id;                   // 343
        std::optional<std::string> block_content_id;                // 344
        std::optional<mleader_context> context;                     // 300..301

        bool operator==(mleader_entity const &) const = default;
    };

//------------------------------------------------------------------------
// Host-registered kinds
//------------------------------------------------------------------------

    // Entity of a kind the built-in set does not know. What `groups` holds
    // is up to the handler that produced it.
    struct custom_entity
    {
        std::string        type;
        entity_common      common;
        std::vector<group> groups;

        bool operator==(custom_entity const &) const = default;
    };

//========================================================================
// Entity variant
//========================================================================

    using entity = std::variant<
        point_entity,
        line_entity,
        circle_entity,
        arc_entity,
        ellipse_entity,
        solid_entity,
        insert_entity,
        dimension_entity,
        text_entity,
        mtext_entity,
        attdef_entity,
        face3d_entity,
        lwpolyline_entity,
        polyline_entity,
        spline_entity,
        mleader_entity,
        custom_entity
    >;

    inline std::string_view entity_type(entity const & e)
    {
        return std::visit([](auto const & x) -> std::string_view
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, custom_entity>) return x.type;
            else return T::type_name;
        }, e);
    }

    inline entity_common const & common_of(entity const & e)
    {
        return std::visit([](auto const & x) -> entity_common const & { return x.common; }, e);
    }

//========================================================================
// Handler registry
//========================================================================

    class entity_registry;

    // Everything a reconstructor may touch while it holds the cursor.
    struct parse_state
    {
        scanner &               sc;
        diagnostics &           log;
        entity_registry const & registry;
    };

    // On entry the scanner's last group is 0/<kind>. A parser reads up to and
    // including the code-0 group that starts the next sibling; that group is
    // left as the scanner's last group.
    using entity_parser = std::function<entity(parse_state &)>;

    // Writes everything after the 0/<kind> group.
    using entity_writer = std::function<void(entity const &, group_writer &)>;

    struct entity_handler
    {
        entity_parser parse;
        entity_writer write;
    };

    class entity_registry
    {
    public:
        // Registry holding every built-in kind. Defined in dxf_registry.hpp.
        static entity_registry const & builtin();
        static entity_registry with_builtin_handlers();

        void register_entity_handler(std::string kind, entity_handler handler)
        {
            handlers_[std::move(kind)] = std::move(handler);
        }

        entity_handler const * find(std::string_view kind) const
        {
            auto it = handlers_.find(kind);
            return it == handlers_.end() ? nullptr : &it->second;
        }

        size_t size() const noexcept { return handlers_.size(); }

    private:
        std::map<std::string, entity_handler, std::less<>> handlers_;
    };

//========================================================================
// Common property reconstruction
//========================================================================

    // Handles the properties every entity shares, the subclass markers (100)
    // and embedded objects (101). Returns false for anything else.
    inline bool read_common(entity_common & common, parse_state & st)
    {
        group const & g = *st.sc.last();

        if (read_bound<entity_common>(common, common_fields, st.sc, st.log))
            return true;

        switch (g.code)
        {
            case 100:
                return true;

            case 101:
            {
                auto loc = g.loc;
                while (st.sc.next().code != 0)
                    ;
                st.sc.rewind();
                st.log.debug(diagnostic_kind::skipped_embedded_object, loc, "embedded object skipped");
                return true;
            }

            default:
                return false;
        }
    }

    inline void write_common(entity_common const & common, group_writer & w)
    {
        write_fields<entity_common>(common, common_fields, w);
    }

//========================================================================
// Reconstruction loop
//========================================================================

    // Per group: the kind's special cases, then its code table, then the
    // common properties; anything left is logged and dropped. `special`
    // returns true when it consumed the group.
    template <typename E, typename Special>
    E read_entity(parse_state & st, std::type_identity_t<field_table<E>> table, Special && special)
    {
        E e;
        for (group g = st.sc.next(); g.code != 0; g = st.sc.next())
        {
            if (special(e, g))
                continue;
            if (read_bound<E>(e, table, st.sc, st.log) || read_common(e.common, st))
                continue;
            log_unhandled(st.log, g);
        }
        return e;
    }

    template <typename E>
    E read_entity(parse_state & st, std::type_identity_t<field_table<E>> table)
    {
        return read_entity<E>(st, table, [](E &, group const &) { return false; });
    }

    template <typename E>
    void write_entity_fields(E const & e, std::type_identity_t<field_table<E>> table, group_writer & w)
    {
        write_common(e.common, w);
        write_fields<E>(e, table, w);
    }

} // namespace dxf

#endif
