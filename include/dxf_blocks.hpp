// dxf_blocks.hpp - DXF group-stream codec - BLOCKS and ENTITIES sections
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_BLOCKS_HPP
#define DXF_BLOCKS_HPP

#include "dxf_document.hpp"
#include "dxf_registry.hpp"

namespace dxf
{
//========================================================================
// BLOCKS API
//========================================================================

    // The scanner's last group is 0/BLOCK. Reads the block header, its
    // entities up to 0/ENDBLK and the end-block record. Returns with the
    // code-0 group after the block as the last group.
    block read_block(parse_state & st);

    // Section readers. The scanner's last group is the 2/<name> group; they
    // return with 0/ENDSEC (or 0/EOF) as the last group.
    blocks_section read_blocks(parse_state & st);
    entities_section read_entities(parse_state & st);

    // A block is written in three steps so that its entities can be pulled
    // one at a time.
    void write_block_begin(block const & b, group_writer & w);
    void write_block_end(block const & b, group_writer & w);

//========================================================================
// Code table
//========================================================================

    inline constexpr field<block> block_fields[] =
    {
        { 5,   &block::handle },
        { 330, &block::owner_handle },
        { 8,   &block::layer },
        { 2,   &block::name },
        { 70,  &block::type_flags },
        { 10,  &block::position },
        { 3,   &block::name2 },
        { 1,   &block::xref_path },
        { 4,   &block::description },
        { 67,  &block::in_paper_space, encoding::boolean },
    };

//========================================================================
// Implementation
//========================================================================

    inline block read_block(parse_state & st)
    {
        auto b = read_record<block>(st.sc, st.log, block_fields);

        if (!st.sc.last()->is(0, token::end_block))
            b.entities = read_entity_list(st, token::end_block);

        if (st.sc.last()->is(0, token::end_block))
        {
            auto end = read_common_record(st);
            if (end != entity_common{})
                b.end_block = std::move(end);
        }
        return b;
    }

    inline blocks_section read_blocks(parse_state & st)
    {
        blocks_section blocks;

        group g = st.sc.next();
        while (!section_ended(g, st.log, token::blocks))
        {
            if (!g.is(0, token::block))
            {
                g = skip_unexpected(st.sc, st.log, g);
                continue;
            }

            auto loc = g.loc;
            auto b = read_block(st);
            if (!b.name)
                st.log.error(diagnostic_kind::missing_name, loc, "BLOCK without a name dropped");
            else
                blocks.set(*b.name, std::move(b));
            g = *st.sc.last();
        }
        return blocks;
    }

    inline entities_section read_entities(parse_state & st)
    {
        st.sc.next();
        return read_entity_list(st, token::end_section);
    }

//---------------------------------------------------------------------------

    inline void write_block_begin(block const & b, group_writer & w)
    {
        w.write_text(0, token::block);
        write_fields<block>(b, block_fields, w);
    }

    inline void write_block_end(block const & b, group_writer & w)
    {
        w.write_text(0, token::end_block);
        if (b.end_block)
            write_common(*b.end_block, w);
    }

} // namespace dxf

#endif
