// dxf_record.hpp - DXF group-stream codec - Code/field tables for records
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Every record kind binds its simple fields in one table of
// { code, member } entries. The same table drives reading (lookup by code)
// and writing (walk in declaration order). Fields outside the table are
// the record's special cases and are handled by its reconstructor.
//========================================================================

#ifndef DXF_RECORD_HPP
#define DXF_RECORD_HPP

#include "dxf_core.hpp"
#include "dxf_scanner.hpp"
#include "dxf_structure.hpp"
#include <type_traits>

namespace dxf
{
//========================================================================
// Field bindings
//========================================================================

    enum class encoding
    {
        plain,
        boolean,            // integer code read as != 0
        inverted_boolean    // integer code read as == 0
    };

    template <typename R>
    using field_target = std::variant<
        std::optional<std::string> R::*,
        std::optional<double> R::*,
        std::optional<int64_t> R::*,
        std::optional<bool> R::*,
        std::optional<point> R::*
    >;

    template <typename R>
    struct field
    {
        int             code;
        field_target<R> target;
        encoding        enc = encoding::plain;
    };

    template <typename R>
    using field_table = std::span<const field<R>>;

//========================================================================
// Application groups
//========================================================================

    // 102 {NAME ... 102 } runs owned by a registered application.
    struct application_group
    {
        std::string        name;
        std::vector<group> groups;

        bool operator==(application_group const &) const = default;
    };

//========================================================================
// RECORD API
//========================================================================

    template <typename R>
    field<R> const * find_field(field_table<R> table, int code);

    // Assigns the scanner's last group to the bound member. Point members
    // keep reading through the point parser.
    template <typename R>
    void read_field(R & record, field<R> const & f, scanner & sc, diagnostics & log);

    template <typename R>
    void write_fields(R const & record, std::type_identity_t<field_table<R>> table, group_writer & w);

    // Table lookup first; returns false when the code is not bound.
    template <typename R>
    bool read_bound(R & record, std::type_identity_t<field_table<R>> table, scanner & sc, diagnostics & log)
    {
        auto const & g = *sc.last();
        if (auto f = find_field<R>(table, g.code))
        {
            read_field(record, *f, sc, log);
            return true;
        }
        return false;
    }

    void log_unhandled(diagnostics & log, group const & g);

    // Non-entity records (classes, table records, block headers). Reads up
    // to the next code-0 group, which is left as the scanner's last group.
    // `special` sees each group first; 100 subclass markers are dropped.
    template <typename R, typename Special>
    R read_record(scanner & sc, diagnostics & log, std::type_identity_t<field_table<R>> table, Special && special)
    {
        R r;
        for (group g = sc.next(); g.code != 0; g = sc.next())
        {
            if (special(r, g) || read_bound<R>(r, table, sc, log) || g.code == 100)
                continue;
            log_unhandled(log, g);
        }
        return r;
    }

    template <typename R>
    R read_record(scanner & sc, diagnostics & log, std::type_identity_t<field_table<R>> table)
    {
        return read_record<R>(sc, log, table, [](R &, group const &) { return false; });
    }

    // The scanner's last group is 102 "{NAME"; reads through the closing 102.
    application_group parse_application_group(scanner & sc, diagnostics & log);
    void write_application_group(application_group const & ag, group_writer & w);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string describe(group_value const & v)
        {
            return std::visit([](auto const & x) -> std::string
            {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, std::string>) return "'" + x + "'";
                else if constexpr (std::is_same_v<T, double>) return format_float(x);
                else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
                else return std::to_string(x);
            }, v);
        }

        template <typename T>
        std::optional<T> coerce(group_value const & v)
        {
            if (auto p = std::get_if<T>(&v))
                return *p;

            if constexpr (std::is_same_v<T, double>)
            {
                if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
            }
            else if constexpr (std::is_same_v<T, int64_t>)
            {
                if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(std::llround(*d));
                if (auto b = std::get_if<bool>(&v)) return static_cast<int64_t>(*b);
            }
            return std::nullopt;
        }

        inline int64_t int_value(group const & g)
        {
            return coerce<int64_t>(g.value).value_or(0);
        }

        inline double float_value(group const & g)
        {
            return coerce<double>(g.value).value_or(0.0);
        }
    }

//---------------------------------------------------------------------------

    template <typename R>
    field<R> const * find_field(field_table<R> table, int code)
    {
        auto it = std::find_if(table.begin(), table.end(),
            [code](field<R> const & f) { return f.code == code; });
        return it == table.end() ? nullptr : &*it;
    }

//---------------------------------------------------------------------------

    template <typename R>
    void read_field(R & record, field<R> const & f, scanner & sc, diagnostics & log)
    {
        group const g = *sc.last();

        auto mismatch = [&]
        {
            log.warn(diagnostic_kind::type_mismatch, g.loc,
                     "code " + std::to_string(g.code) + " holds an unexpected value " + detail::describe(g.value));
        };

        std::visit([&](auto member)
        {
            using M = std::decay_t<decltype(record.*member)>;
            using T = typename M::value_type;

            if constexpr (std::is_same_v<T, point>)
            {
                record.*member = parse_point(sc);
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                if (f.enc == encoding::plain)
                {
                    if (auto b = std::get_if<bool>(&g.value)) record.*member = *b;
                    else mismatch();
                    return;
                }

                auto i = detail::coerce<int64_t>(g.value);
                if (!i) { mismatch(); return; }
                record.*member = f.enc == encoding::inverted_boolean ? *i == 0 : *i != 0;
            }
            else
            {
                if (auto v = detail::coerce<T>(g.value)) record.*member = std::move(*v);
                else mismatch();
            }
        }, f.target);
    }

//---------------------------------------------------------------------------

    template <typename R>
    void write_fields(R const & record, std::type_identity_t<field_table<R>> table, group_writer & w)
    {
        for (auto const & f : table)
        {
            std::visit([&](auto member)
            {
                auto const & v = record.*member;
                using T = typename std::decay_t<decltype(v)>::value_type;

                if constexpr (std::is_same_v<T, bool>)
                {
                    if (!v)
                        return;
                    switch (f.enc)
                    {
                        case encoding::plain:            w.write_value(f.code, *v); break;
                        case encoding::boolean:          w.write_value(f.code, int64_t{ *v ? 1 : 0 }); break;
                        case encoding::inverted_boolean: w.write_value(f.code, int64_t{ *v ? 0 : 1 }); break;
                    }
                }
                else
                {
                    w.write(f.code, v);
                }
            }, f.target);
        }
    }

//---------------------------------------------------------------------------

    inline void log_unhandled(diagnostics & log, group const & g)
    {
        log.debug(diagnostic_kind::unhandled_group, g.loc,
                  "unhandled group " + std::to_string(g.code) + " " + detail::describe(g.value));
    }

//---------------------------------------------------------------------------

    inline application_group parse_application_group(scanner & sc, diagnostics & log)
    {
        application_group ag;
        auto opener = sc.last()->text();
        ag.name = std::string(opener.starts_with('{') ? opener.substr(1) : opener);

        while (true)
        {
            group g = sc.next();
            if (g.code == 102 && g.text() == "}")
                break;
            if (g.code == 0)
            {
                log.warn(diagnostic_kind::unhandled_group, g.loc,
                         "application group '" + ag.name + "' is not closed");
                sc.rewind();
                break;
            }
            ag.groups.push_back(std::move(g));
        }
        return ag;
    }

    inline void write_application_group(application_group const & ag, group_writer & w)
    {
        w.write_text(102, "{" + ag.name);
        for (auto const & g : ag.groups)
            w.write_group(g);
        w.write_text(102, "}");
    }

} // namespace dxf

#endif
