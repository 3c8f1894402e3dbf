// dxf_parser.hpp - DXF group-stream codec - Document assembler
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_PARSER_HPP
#define DXF_PARSER_HPP

#include "dxf_core.hpp"
#include "dxf_document.hpp"
#include "dxf_header.hpp"
#include "dxf_classes.hpp"
#include "dxf_tables.hpp"
#include "dxf_blocks.hpp"

namespace dxf
{
//========================================================================
// PARSER API
//========================================================================

    struct parse_options
    {
        entity_registry const * registry     = nullptr;     // null: built-in kinds
        diagnostic_sink         sink;
        severity                min_severity = severity::debug;
    };

    using parse_context = context<std::optional<drawing>, error<parse_error_kind>>;

    // Fatal errors leave `document` empty and put exactly one entry in
    // `errors`. Diagnostics are returned either way.
    parse_context parse(std::string_view text, parse_options const & options = {});

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        // Searching -> InSection(kind) -> Searching ... -> Done on 0/EOF.
        struct parser_impl
        {
            parse_state & st;

            drawing assemble();
            void read_section(drawing & d);
            void skip_section(std::string_view name);
        };

//---------------------------------------------------------------------------

        inline drawing parser_impl::assemble()
        {
            drawing d;

            while (true)
            {
                group g = st.sc.next();
                if (g.is(0, token::eof))
                    break;

                if (!g.is(0, token::section))
                {
                    log_unhandled(st.log, g);
                    continue;
                }

                read_section(d);
                if (st.sc.is_exhausted())
                    break;
            }
            return d;
        }

        // The scanner's last group is 0/SECTION.
        inline void parser_impl::read_section(drawing & d)
        {
            group name = st.sc.next();
            if (name.code != 2)
            {
                st.log.warn(diagnostic_kind::unhandled_section, name.loc, "SECTION without a name");
                if (name.code == 0)
                    st.sc.rewind();
                skip_section("unnamed");
                return;
            }

            auto kind = name.text();

            if (kind == token::header)
                d.header = read_header(st);
            else if (kind == token::classes)
                d.classes = read_classes(st);
            else if (kind == token::tables)
                d.tables = read_tables(st);
            else if (kind == token::blocks)
                d.blocks = read_blocks(st);
            else if (kind == token::entities)
                d.entities = read_entities(st);
            else
            {
                // Known gap: the content of sections such as OBJECTS is dropped
                st.log.warn(diagnostic_kind::unhandled_section, name.loc,
                            "unhandled section " + std::string(kind) + " dropped");
                skip_section(kind);
            }
        }

        inline void parser_impl::skip_section(std::string_view name)
        {
            for (group g = st.sc.next(); !section_ended(g, st.log, name); g = st.sc.next())
                ;
        }
    }

//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view text, parse_options const & options)
    {
        parse_context ctx;
        diagnostics log(options.sink, options.min_severity);
        scanner sc(text, &log);
        parse_state st { sc, log, options.registry ? *options.registry : entity_registry::builtin() };

        try
        {
            detail::parser_impl p { st };
            ctx.document = p.assemble();
        }
        catch (parse_failure const & e)
        {
            ctx.errors.push_back(e.err);
        }

        ctx.diagnostics = log.release();
        return ctx;
    }

} // namespace dxf

#endif
