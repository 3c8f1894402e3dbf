// dxf.hpp - DXF group-stream codec
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Codec Principles:
//========================================================================
//
// The Round-Trip Principle
// ------------------------
// parse(serialize_to_string(d)) == d for every drawing d.
// Absent stays absent: a field or section never read is never written,
// and an empty one that was read is written back empty.
//
//
// The Tolerance Principle
// -----------------------
// Codes a record does not know are reported and skipped, never fatal.
// Only a broken stream fails a parse: a bad code line, a malformed point
// or matrix, an unreadable number, or input that ends early.
//
//
// The One-Cursor Principle
// ------------------------
// Every reader leaves the scanner on the last group it consumed.
// Lookahead is always paired with exactly one rewind.
//
//========================================================================

#ifndef DXF_GROUP_STREAM_CODEC
#define DXF_GROUP_STREAM_CODEC

#include "dxf_core.hpp"
#include "dxf_document.hpp"
#include "dxf_registry.hpp"
#include "dxf_parser.hpp"
#include "dxf_serializer.hpp"

namespace dxf
{
//========================================================================
// Names for reporting
//========================================================================

    inline std::string_view to_string(parse_error_kind k)
    {
        switch (k)
        {
            case parse_error_kind::unexpected_end_of_input: return "unexpected end of input";
            case parse_error_kind::read_past_end:           return "read past end";
            case parse_error_kind::malformed_point:         return "malformed point";
            case parse_error_kind::malformed_matrix:        return "malformed matrix";
            case parse_error_kind::invalid_boolean:         return "invalid boolean";
            case parse_error_kind::invalid_number:          return "invalid number";
            case parse_error_kind::invalid_code:            return "invalid code";
        }
        return "unknown";
    }

    inline std::string_view to_string(severity s)
    {
        switch (s)
        {
            case severity::debug:   return "debug";
            case severity::info:    return "info";
            case severity::warning: return "warning";
            case severity::error:   return "error";
        }
        return "unknown";
    }

//========================================================================
// Drawing summary
//========================================================================

    // Number of entities in the ENTITIES section plus those nested in blocks.
    inline size_t entity_count(drawing const & d)
    {
        size_t n = d.entities ? d.entities->size() : 0;
        if (d.blocks)
        {
            for (auto const & [name, b] : *d.blocks)
                n += b.entities.size();
        }
        return n;
    }

} // namespace dxf

#endif
