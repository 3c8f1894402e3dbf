// dxf_classes.hpp - DXF group-stream codec - CLASSES section
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_CLASSES_HPP
#define DXF_CLASSES_HPP

#include "dxf_document.hpp"

namespace dxf
{
    inline constexpr field<class_record> class_fields[] =
    {
        { 1,   &class_record::record_name },
        { 2,   &class_record::class_name },
        { 3,   &class_record::application_name },
        { 90,  &class_record::proxy_flags },
        { 91,  &class_record::instance_count },
        { 280, &class_record::was_a_proxy, encoding::boolean },
        { 281, &class_record::is_an_entity, encoding::boolean },
    };

    // The scanner's last group is 2/CLASSES.
    inline classes_section read_classes(parse_state & st)
    {
        classes_section classes;

        group g = st.sc.next();
        while (!section_ended(g, st.log, token::classes))
        {
            if (g.is(0, token::class_record))
            {
                auto loc = g.loc;
                auto c = read_record<class_record>(st.sc, st.log, class_fields);
                if (!c.record_name)
                    st.log.error(diagnostic_kind::missing_name, loc, "CLASS without a record name dropped");
                else
                    classes.set(*c.record_name, std::move(c));
                g = *st.sc.last();
                continue;
            }

            g = skip_unexpected(st.sc, st.log, g);
        }
        return classes;
    }

    inline void write_classes(classes_section const & classes, group_writer & w)
    {
        for (auto const & [name, c] : classes)
        {
            w.write_text(0, token::class_record);
            write_fields<class_record>(c, class_fields, w);
        }
    }

} // namespace dxf

#endif
