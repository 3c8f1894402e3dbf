// dxf_header.hpp - DXF group-stream codec - HEADER section
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_HEADER_HPP
#define DXF_HEADER_HPP

#include "dxf_document.hpp"
#include "dxf_entities.hpp"
#include <chrono>
#include <cstdio>

namespace dxf
{
//========================================================================
// HEADER API
//========================================================================

    // Group code of a known variable, for variables that carry none.
    std::optional<int> header_code(std::string_view name);

    // $TDCREATE and friends: Julian day numbers on the wire, ISO-8601 UTC
    // text ("2000-01-01T12:00:00.000Z") in the document.
    bool is_date_variable(std::string_view name);
    std::string julian_to_iso8601(double jd);
    std::optional<double> iso8601_to_julian(std::string_view iso);

    // The scanner's last group is 2/HEADER. Returns with 0/ENDSEC (or 0/EOF)
    // as the last group.
    header_section read_header(parse_state & st);
    void write_header(header_section const & header, group_writer & w, diagnostics & log);

//========================================================================
// Known variables
//========================================================================

    struct header_catalog_entry
    {
        std::string_view name;
        int              code;
    };

    // Sorted by name.
    inline constexpr header_catalog_entry header_catalog[] =
    {
        { "$3DDWFPREC", 40 },
        { "$ACADMAINTVER", 70 },
        { "$ACADVER", 1 },
        { "$ANGBASE", 50 },
        { "$ANGDIR", 70 },
        { "$ATTMODE", 70 },
        { "$AUNITS", 70 },
        { "$AUPREC", 70 },
        { "$CAMERADISPLAY", 290 },
        { "$CAMERAHEIGHT", 40 },
        { "$CECOLOR", 62 },
        { "$CELTSCALE", 40 },
        { "$CELTYPE", 6 },
        { "$CELWEIGHT", 370 },
        { "$CEPSNID", 390 },
        { "$CEPSNTYPE", 380 },
        { "$CHAMFERA", 40 },
        { "$CHAMFERB", 40 },
        { "$CHAMFERC", 40 },
        { "$CHAMFERD", 40 },
        { "$CLAYER", 8 },
        { "$CMLJUST", 70 },
        { "$CMLSCALE", 40 },
        { "$CMLSTYLE", 2 },
        { "$CSHADOW", 280 },
        { "$DIMADEC", 70 },
        { "$DIMALT", 70 },
        { "$DIMALTD", 70 },
        { "$DIMALTF", 40 },
        { "$DIMALTRND", 40 },
        { "$DIMALTTD", 70 },
        { "$DIMALTTZ", 70 },
        { "$DIMALTU", 70 },
        { "$DIMALTZ", 70 },
        { "$DIMAPOST", 1 },
        { "$DIMARCSYM", 70 },
        { "$DIMASO", 70 },
        { "$DIMASSOC", 280 },
        { "$DIMASZ", 40 },
        { "$DIMATFIT", 70 },
        { "$DIMAUNIT", 70 },
        { "$DIMAZIN", 70 },
        { "$DIMBLK", 1 },
        { "$DIMBLK1", 1 },
        { "$DIMBLK2", 1 },
        { "$DIMCEN", 40 },
        { "$DIMCLRD", 70 },
        { "$DIMCLRE", 70 },
        { "$DIMCLRT", 70 },
        { "$DIMDEC", 70 },
        { "$DIMDLE", 40 },
        { "$DIMDLI", 40 },
        { "$DIMDSEP", 70 },
        { "$DIMEXE", 40 },
        { "$DIMEXO", 40 },
        { "$DIMFAC", 40 },
        { "$DIMFRAC", 70 },
        { "$DIMFXL", 40 },
        { "$DIMFXLON", 70 },
        { "$DIMGAP", 40 },
        { "$DIMJOGANG", 40 },
        { "$DIMJUST", 70 },
        { "$DIMLDRBLK", 1 },
        { "$DIMLFAC", 40 },
        { "$DIMLIM", 70 },
        { "$DIMLTEX1", 6 },
        { "$DIMLTEX2", 6 },
        { "$DIMLTYPE", 6 },
        { "$DIMLUNIT", 70 },
        { "$DIMLWD", 70 },
        { "$DIMLWE", 70 },
        { "$DIMPOST", 1 },
        { "$DIMRND", 40 },
        { "$DIMSAH", 70 },
        { "$DIMSCALE", 40 },
        { "$DIMSD1", 70 },
        { "$DIMSD2", 70 },
        { "$DIMSE1", 70 },
        { "$DIMSE2", 70 },
        { "$DIMSHO", 70 },
        { "$DIMSOXD", 70 },
        { "$DIMSTYLE", 2 },
        { "$DIMTAD", 70 },
        { "$DIMTDEC", 70 },
        { "$DIMTFAC", 40 },
        { "$DIMTFILL", 70 },
        { "$DIMTFILLCLR", 70 },
        { "$DIMTIH", 70 },
        { "$DIMTIX", 70 },
        { "$DIMTM", 40 },
        { "$DIMTMOVE", 70 },
        { "$DIMTOFL", 70 },
        { "$DIMTOH", 70 },
        { "$DIMTOL", 70 },
        { "$DIMTOLJ", 70 },
        { "$DIMTP", 40 },
        { "$DIMTSZ", 40 },
        { "$DIMTVP", 40 },
        { "$DIMTXSTY", 7 },
        { "$DIMTXT", 40 },
        { "$DIMTXTDIRECTION", 70 },
        { "$DIMTZIN", 70 },
        { "$DIMUPT", 70 },
        { "$DIMZIN", 70 },
        { "$DISPSILH", 70 },
        { "$DRAGVS", 349 },
        { "$DWGCODEPAGE", 3 },
        { "$ELEVATION", 40 },
        { "$ENDCAPS", 280 },
        { "$EXTNAMES", 290 },
        { "$FASTZOOM", 70 },
        { "$FILLETRAD", 40 },
        { "$FILLMODE", 70 },
        { "$FINGERPRINTGUID", 2 },
        { "$GRIDMODE", 70 },
        { "$HALOGAP", 280 },
        { "$HANDSEED", 5 },
        { "$HIDETEXT", 290 },
        { "$HYPERLINKBASE", 1 },
        { "$INDEXCTL", 280 },
        { "$INSUNITS", 70 },
        { "$INTERFERECOLOR", 62 },
        { "$INTERFEREOBJVS", 345 },
        { "$INTERFEREVPVS", 346 },
        { "$INTERSECTIONCOLOR", 70 },
        { "$INTERSECTIONDISPLAY", 290 },
        { "$JOINSTYLE", 280 },
        { "$LASTSAVEDBY", 1 },
        { "$LATITUDE", 40 },
        { "$LENSLENGTH", 40 },
        { "$LIGHTGLYPHDISPLAY", 280 },
        { "$LIMCHECK", 70 },
        { "$LOFTANG1", 40 },
        { "$LOFTANG2", 40 },
        { "$LOFTMAG1", 40 },
        { "$LOFTMAG2", 40 },
        { "$LOFTNORMALS", 280 },
        { "$LOFTPARAM", 70 },
        { "$LONGITUDE", 40 },
        { "$LTSCALE", 40 },
        { "$LUNITS", 70 },
        { "$LUPREC", 70 },
        { "$LWDISPLAY", 290 },
        { "$MAXACTVP", 70 },
        { "$MEASUREMENT", 70 },
        { "$MENU", 1 },
        { "$MIRRTEXT", 70 },
        { "$NORTHDIRECTION", 40 },
        { "$OBSCOLOR", 70 },
        { "$OBSLTYPE", 280 },
        { "$OLESTARTUP", 290 },
        { "$ORTHOMODE", 70 },
        { "$PDMODE", 70 },
        { "$PDSIZE", 40 },
        { "$PELEVATION", 40 },
        { "$PLIMCHECK", 70 },
        { "$PLINEGEN", 70 },
        { "$PLINEWID", 40 },
        { "$PROJECTNAME", 1 },
        { "$PROXYGRAPHICS", 70 },
        { "$PSLTSCALE", 70 },
        { "$PSOLHEIGHT", 40 },
        { "$PSOLWIDTH", 40 },
        { "$PSTYLEMODE", 290 },
        { "$PSVPSCALE", 40 },
        { "$PUCSBASE", 2 },
        { "$PUCSNAME", 2 },
        { "$PUCSORTHOREF", 2 },
        { "$PUCSORTHOVIEW", 70 },
        { "$QTEXTMODE", 70 },
        { "$REGENMODE", 70 },
        { "$REQUIREDVERSIONS", 160 },
        { "$SHADEDGE", 70 },
        { "$SHADEDIF", 70 },
        { "$SHADOWPLANELOCATION", 40 },
        { "$SKETCHINC", 40 },
        { "$SKPOLY", 70 },
        { "$SNAPANG", 50 },
        { "$SNAPISOPAIR", 70 },
        { "$SNAPMODE", 70 },
        { "$SNAPSTYLE", 70 },
        { "$SORTENTS", 280 },
        { "$SPLFRAME", 70 },
        { "$SPLINESEGS", 70 },
        { "$SPLINETYPE", 70 },
        { "$STEPSIZE", 40 },
        { "$STEPSPERSEC", 40 },
        { "$STYLESHEET", 1 },
        { "$SURFTAB1", 70 },
        { "$SURFTAB2", 70 },
        { "$SURFTYPE", 70 },
        { "$SURFU", 70 },
        { "$SURFV", 70 },
        { "$TDCREATE", 40 },
        { "$TDINDWG", 40 },
        { "$TDUCREATE", 40 },
        { "$TDUPDATE", 40 },
        { "$TDUSRTIMER", 40 },
        { "$TDUUPDATE", 40 },
        { "$TEXTSIZE", 40 },
        { "$TEXTSTYLE", 7 },
        { "$THICKNESS", 40 },
        { "$TILEMODE", 70 },
        { "$TIMEZONE", 70 },
        { "$TRACEWID", 40 },
        { "$TREEDEPTH", 70 },
        { "$UCSBASE", 2 },
        { "$UCSNAME", 2 },
        { "$UCSORTHOREF", 2 },
        { "$UCSORTHOVIEW", 70 },
        { "$UNITMODE", 70 },
        { "$USERI1", 70 },
        { "$USERI2", 70 },
        { "$USERI3", 70 },
        { "$USERI4", 70 },
        { "$USERI5", 70 },
        { "$USERR1", 40 },
        { "$USERR2", 40 },
        { "$USERR3", 40 },
        { "$USERR4", 40 },
        { "$USERR5", 40 },
        { "$USRTIMER", 70 },
        { "$VERSIONGUID", 2 },
        { "$VIEWSIZE", 40 },
        { "$VISRETAIN", 70 },
        { "$WORLDVIEW", 70 },
        { "$XCLIPFRAME", 290 },
        { "$XEDIT", 290 },
    };

    inline constexpr std::string_view date_variables[] =
    {
        "$TDCREATE", "$TDUCREATE", "$TDUPDATE", "$TDUUPDATE"
    };

    constexpr double unix_epoch_julian = 2440588.5;
    constexpr double ms_per_day        = 86400000.0;

//========================================================================
// Implementation
//========================================================================

    inline std::optional<int> header_code(std::string_view name)
    {
        auto it = std::lower_bound(std::begin(header_catalog), std::end(header_catalog), name,
            [](header_catalog_entry const & e, std::string_view n) { return e.name < n; });
        if (it == std::end(header_catalog) || it->name != name)
            return std::nullopt;
        return it->code;
    }

    inline bool is_date_variable(std::string_view name)
    {
        return std::find(std::begin(date_variables), std::end(date_variables), name) != std::end(date_variables);
    }

//---------------------------------------------------------------------------

    inline std::string julian_to_iso8601(double jd)
    {
        using namespace std::chrono;

        sys_time<milliseconds> tp { milliseconds(std::llround((jd - unix_epoch_julian) * ms_per_day)) };
        auto midnight = floor<days>(tp);
        year_month_day ymd { midnight };
        hh_mm_ss<milliseconds> hms { tp - midnight };

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()),
                      static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()),
                      static_cast<int>(hms.subseconds().count()));
        return buf;
    }

    inline std::optional<double> iso8601_to_julian(std::string_view iso)
    {
        using namespace std::chrono;

        std::string s(iso);
        int y = 0;
        unsigned mo = 0, d = 0;
        int h = 0, mi = 0, sec = 0, ms = 0;
        int consumed = 0;

        if (std::sscanf(s.c_str(), "%d-%u-%uT%d:%d:%d%n", &y, &mo, &d, &h, &mi, &sec, &consumed) != 6)
            return std::nullopt;

        std::string_view rest = std::string_view(s).substr(static_cast<size_t>(consumed));
        if (rest.starts_with('.'))
        {
            rest.remove_prefix(1);
            size_t digits = 0;
            int scale = 100;
            while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9')
            {
                if (scale > 0)
                {
                    ms += (rest[digits] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
            }
            if (digits == 0)
                return std::nullopt;
            rest.remove_prefix(digits);
        }
        if (rest != "Z" && !rest.empty())
            return std::nullopt;

        year_month_day ymd { year{ y }, month{ mo }, day{ d } };
        if (!ymd.ok() || h > 23 || mi > 59 || sec > 59)
            return std::nullopt;

        auto tp = sys_days{ ymd } + hours{ h } + minutes{ mi } + seconds{ sec } + milliseconds{ ms };
        auto since_epoch = duration_cast<milliseconds>(tp.time_since_epoch()).count();
        return static_cast<double>(since_epoch) / ms_per_day + unix_epoch_julian;
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        inline header_value to_header_value(group_value const & v)
        {
            return std::visit([](auto const & x) -> header_value { return x; }, v);
        }

        inline group_value to_group_value(header_value const & v)
        {
            return std::visit([](auto const & x) -> group_value
            {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, point>)
                    throw serialize_failure("a point header value has no single group");
                else
                    return x;
            }, v);
        }
    }

//---------------------------------------------------------------------------

    inline header_section read_header(parse_state & st)
    {
        header_section header;
        std::optional<std::string>     name;
        std::optional<header_variable> current;

        auto commit = [&]
        {
            if (name && current)
                header.set(*name, std::move(*current));
            current.reset();
        };

        for (group g = st.sc.next(); ; g = st.sc.next())
        {
            if (g.code == 0)
            {
                if (!section_ended(g, st.log, token::header))
                {
                    log_unhandled(st.log, g);
                    continue;
                }
                commit();
                break;
            }

            if (g.code == 9)
            {
                commit();
                name = std::string(g.text());
                continue;
            }

            if (!name)
            {
                log_unhandled(st.log, g);
                continue;
            }

            if (g.code == 10)
            {
                current = header_variable{ parse_point(st.sc), 10 };
                continue;
            }

            header_value v = detail::to_header_value(g.value);
            if (auto jd = std::get_if<double>(&v); jd && is_date_variable(*name))
                v = julian_to_iso8601(*jd);
            current = header_variable{ std::move(v), g.code };
        }
        return header;
    }

//---------------------------------------------------------------------------

    inline void write_header(header_section const & header, group_writer & w, diagnostics & log)
    {
        for (auto const & [name, var] : header)
        {
            if (auto p = std::get_if<point>(&var.value))
            {
                w.write_text(9, name);
                w.write_point(var.code.value_or(10), *p);
                continue;
            }

            auto code = var.code ? var.code : header_code(name);
            if (!code)
            {
                log.warn(diagnostic_kind::unknown_header_variable, {},
                         "header variable " + name + " has no known code, not written");
                continue;
            }

            w.write_text(9, name);

            if (auto iso = std::get_if<std::string>(&var.value); iso && is_date_variable(name))
            {
                if (auto jd = iso8601_to_julian(*iso))
                {
                    w.write_value(*code, *jd);
                    continue;
                }
            }
            w.write_value(*code, detail::to_group_value(var.value));
        }
    }

} // namespace dxf

#endif
