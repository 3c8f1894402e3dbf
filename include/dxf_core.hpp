// dxf_core.hpp - DXF group-stream codec - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_CORE_HPP
#define DXF_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <functional>
#include <unordered_map>
#include <stdexcept>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace dxf
{
//========================================================================
// Symbols
//========================================================================

    namespace token
    {
        constexpr std::string_view section      = "SECTION";
        constexpr std::string_view end_section  = "ENDSEC";
        constexpr std::string_view eof          = "EOF";

        constexpr std::string_view header       = "HEADER";
        constexpr std::string_view classes      = "CLASSES";
        constexpr std::string_view tables       = "TABLES";
        constexpr std::string_view blocks       = "BLOCKS";
        constexpr std::string_view entities     = "ENTITIES";

        constexpr std::string_view class_record = "CLASS";
        constexpr std::string_view table        = "TABLE";
        constexpr std::string_view end_table    = "ENDTAB";
        constexpr std::string_view block        = "BLOCK";
        constexpr std::string_view end_block    = "ENDBLK";
        constexpr std::string_view vertex       = "VERTEX";
        constexpr std::string_view seq_end      = "SEQEND";

        constexpr std::string_view vport        = "VPORT";
        constexpr std::string_view ltype        = "LTYPE";
        constexpr std::string_view layer        = "LAYER";
    }

//========================================================================
// Values
//========================================================================

    enum class value_type
    {
        text,
        floating,
        integer,
        boolean
    };

    using group_value = std::variant<
        std::string,
        double,
        int64_t,
        bool
    >;

    struct source_location
    {
        size_t line = 0;    // 1-based line of the code line, 0 when synthesised
    };

    // One (code, value) pair. The location is bookkeeping and does not take
    // part in equality.
    struct group
    {
        int             code = 0;
        group_value     value;
        source_location loc;

        bool operator==(group const & o) const { return code == o.code && value == o.value; }

        bool is(int c, std::string_view v) const
        {
            auto s = std::get_if<std::string>(&value);
            return code == c && s && *s == v;
        }

        std::string_view text() const
        {
            auto s = std::get_if<std::string>(&value);
            return s ? std::string_view(*s) : std::string_view{};
        }
    };

//========================================================================
// Errors
//========================================================================

    enum class parse_error_kind
    {
        unexpected_end_of_input,
        read_past_end,
        malformed_point,
        malformed_matrix,
        invalid_boolean,
        invalid_number,
        invalid_code
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

    // Thrown by the scanner and the structural parsers. Only the parse facade
    // catches it; no partial document leaves a failed parse.
    struct parse_failure : std::runtime_error
    {
        error<parse_error_kind> err;

        explicit parse_failure(error<parse_error_kind> e)
            : std::runtime_error(e.message)
            , err(std::move(e))
        {}
    };

    // A value that cannot be rendered for its code. Always a programming error.
    struct serialize_failure : std::logic_error
    {
        using std::logic_error::logic_error;
    };

    [[noreturn]] inline void fail(parse_error_kind kind, source_location loc, std::string message)
    {
        throw parse_failure({ kind, loc, std::move(message) });
    }

//========================================================================
// Diagnostics
//========================================================================

    enum class severity
    {
        debug,
        info,
        warning,
        error
    };

    enum class diagnostic_kind
    {
        unhandled_group,
        unhandled_entity,
        unhandled_section,
        unhandled_table,
        untyped_code,
        count_mismatch,
        missing_name,
        type_mismatch,
        unknown_header_variable,
        skipped_embedded_object
    };

    struct diagnostic
    {
        severity        level;
        diagnostic_kind kind;
        source_location loc;
        std::string     message;
    };

    using diagnostic_sink = std::function<void(diagnostic const &)>;

    class diagnostics
    {
    public:
        explicit diagnostics(diagnostic_sink sink = {}, severity min_level = severity::debug)
            : sink_(std::move(sink))
            , min_level_(min_level)
        {}

        void report(severity level, diagnostic_kind kind, source_location loc, std::string message)
        {
            if (level < min_level_)
                return;

            entries_.push_back({ level, kind, loc, std::move(message) });
            if (sink_)
                sink_(entries_.back());
        }

        void debug(diagnostic_kind kind, source_location loc, std::string message)
        { report(severity::debug, kind, loc, std::move(message)); }

        void warn(diagnostic_kind kind, source_location loc, std::string message)
        { report(severity::warning, kind, loc, std::move(message)); }

        void error(diagnostic_kind kind, source_location loc, std::string message)
        { report(severity::error, kind, loc, std::move(message)); }

        std::vector<diagnostic> const & entries() const noexcept { return entries_; }
        std::vector<diagnostic> release() { return std::move(entries_); }

        size_t count(diagnostic_kind kind) const
        {
            return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                [kind](diagnostic const & d) { return d.kind == kind; }));
        }

    private:
        diagnostic_sink         sink_;
        severity                min_level_;
        std::vector<diagnostic> entries_;
    };

//========================================================================
// Document generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T                       document;
        std::vector<Error>      errors;
        std::vector<diagnostic> diagnostics;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// Insertion-ordered keyed records
//========================================================================

    // Records keyed by name (blocks, classes, layers) keep the order they
    // were read in. Setting an existing key replaces the record in place.
    template <typename V>
    class keyed_list
    {
    public:
        using entry          = std::pair<std::string, V>;
        using const_iterator = typename std::vector<entry>::const_iterator;

        V * find(std::string_view key)
        {
            auto it = index_.find(std::string(key));
            return it == index_.end() ? nullptr : &entries_[it->second].second;
        }

        V const * find(std::string_view key) const
        {
            auto it = index_.find(std::string(key));
            return it == index_.end() ? nullptr : &entries_[it->second].second;
        }

        bool contains(std::string_view key) const { return find(key) != nullptr; }

        V & set(std::string key, V value)
        {
            if (auto it = index_.find(key); it != index_.end())
            {
                entries_[it->second].second = std::move(value);
                return entries_[it->second].second;
            }
            index_.emplace(key, entries_.size());
            entries_.emplace_back(std::move(key), std::move(value));
            return entries_.back().second;
        }

        size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        bool operator==(keyed_list const & o) const { return entries_ == o.entries_; }

    private:
        std::vector<entry>                      entries_;
        std::unordered_map<std::string, size_t> index_;
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string_view ltrim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t");
            return start == std::string_view::npos ? std::string_view{} : s.substr(start);
        }

        inline bool in(int code, int lo, int hi) noexcept { return code >= lo && code <= hi; }

        inline std::optional<double> to_double(std::string_view sv)
        {
            auto s = std::string(trim_sv(sv));
            if (s.empty())
                return std::nullopt;

            char * end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (end != s.c_str() + s.size())
                return std::nullopt;
            return d;
        }

        inline std::optional<int64_t> to_integer(std::string_view sv)
        {
            auto s = std::string(trim_sv(sv));
            if (s.empty())
                return std::nullopt;

            char * end = nullptr;
            long long v = std::strtoll(s.c_str(), &end, 10);
            if (end == s.c_str() + s.size())
                return static_cast<int64_t>(v);

            // Some writers put integral values out as "3.0"
            auto d = to_double(s);
            if (d && std::isfinite(*d) && std::floor(*d) == *d)
                return static_cast<int64_t>(*d);
            return std::nullopt;
        }
    }

//========================================================================
// Group value typing
//========================================================================

    // The documented partition of the code space. Codes outside every range
    // yield nullopt; they are read as text and reported by the scanner.
    inline std::optional<value_type> declared_type(int code) noexcept
    {
        using detail::in;

        if (in(code, -5, 9) || in(code, 100, 109) || in(code, 300, 369) ||
            in(code, 390, 399) || in(code, 410, 419) || in(code, 430, 439) ||
            in(code, 470, 481) || code == 999 || in(code, 1000, 1009))
            return value_type::text;

        if (in(code, 10, 59) || in(code, 110, 149) || in(code, 210, 239) ||
            in(code, 460, 469) || in(code, 1010, 1059))
            return value_type::floating;

        if (in(code, 60, 99) || in(code, 160, 179) || in(code, 270, 289) ||
            in(code, 370, 389) || in(code, 400, 409) || in(code, 420, 429) ||
            in(code, 440, 459) || in(code, 1060, 1071))
            return value_type::integer;

        if (in(code, 290, 299))
            return value_type::boolean;

        return std::nullopt;
    }

    inline value_type type_of(int code) noexcept
    {
        return declared_type(code).value_or(value_type::text);
    }

    // Shortest fixed-notation text that reads back to the same double,
    // always with a fractional digit: 4 -> "4.0", 1e5 -> "100000.0".
    inline std::string format_float(double v)
    {
        char buf[400];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
        if (ec != std::errc{})
            throw serialize_failure("cannot format floating point value");

        std::string s(buf, ptr);
        if (s.find_first_of(".ni") == std::string::npos)
            s += ".0";
        return s;
    }

    inline group_value parse_value(int code, std::string_view raw, source_location loc = {})
    {
        switch (type_of(code))
        {
            case value_type::floating:
                if (auto d = detail::to_double(raw))
                    return *d;
                fail(parse_error_kind::invalid_number, loc,
                     "code " + std::to_string(code) + ": '" + std::string(raw) + "' is not a number");

            case value_type::integer:
                if (auto i = detail::to_integer(raw))
                    return *i;
                fail(parse_error_kind::invalid_number, loc,
                     "code " + std::to_string(code) + ": '" + std::string(raw) + "' is not an integer");

            case value_type::boolean:
                if (raw == "0") return false;
                if (raw == "1") return true;
                fail(parse_error_kind::invalid_boolean, loc,
                     "code " + std::to_string(code) + ": '" + std::string(raw) + "' is not a boolean");

            case value_type::text:
                break;
        }
        return std::string(raw);
    }

    inline std::string render_value(int code, group_value const & v)
    {
        auto mismatch = [code](char const * what) -> serialize_failure
        {
            return serialize_failure("code " + std::to_string(code) + " cannot carry " + what);
        };

        auto declared = declared_type(code);
        if (!declared)
        {
            // Untyped codes carry whatever was read
            return std::visit([](auto const & x) -> std::string
            {
                using T = std::decay_t<decltype(x)>;
                if constexpr (std::is_same_v<T, std::string>) return x;
                else if constexpr (std::is_same_v<T, double>) return format_float(x);
                else if constexpr (std::is_same_v<T, bool>) return x ? "1" : "0";
                else return std::to_string(x);
            }, v);
        }

        switch (*declared)
        {
            case value_type::text:
                if (auto s = std::get_if<std::string>(&v)) return *s;
                throw mismatch("a non-text value");

            case value_type::floating:
                if (auto d = std::get_if<double>(&v)) return format_float(*d);
                if (auto i = std::get_if<int64_t>(&v)) return format_float(static_cast<double>(*i));
                throw mismatch("a non-numeric value");

            case value_type::integer:
                if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
                if (auto d = std::get_if<double>(&v)) return std::to_string(std::llround(*d));
                if (auto b = std::get_if<bool>(&v)) return *b ? "1" : "0";
                throw mismatch("a text value");

            case value_type::boolean:
                if (auto b = std::get_if<bool>(&v)) return *b ? "1" : "0";
                if (auto i = std::get_if<int64_t>(&v)) return *i != 0 ? "1" : "0";
                throw mismatch("a non-boolean value");
        }
        throw mismatch("an unknown value");
    }

} // namespace dxf

#endif
