// dxf_scanner.hpp - DXF group-stream codec - Group scanner
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_SCANNER_HPP
#define DXF_SCANNER_HPP

#include "dxf_core.hpp"

namespace dxf
{
//========================================================================
// SCANNER API
//========================================================================

    // Splits on "\r\n", "\r" or "\n". The views point into `text`.
    std::vector<std::string_view> split_lines(std::string_view text);

    // Sequential cursor over alternating code and value lines. The scanner
    // does not own the text; it must outlive the scanner.
    class scanner
    {
    public:
        explicit scanner(std::string_view text, diagnostics * log = nullptr);

        group next();
        group peek() const;

        // Lookahead with undo: keeps the next group only if it carries `code`.
        std::optional<group> next_if(int code);

        void rewind(size_t n = 1);

        bool is_exhausted() const noexcept { return exhausted_; }
        bool has_next() const noexcept { return !exhausted_ && pos_ + 1 < lines_.size(); }

        std::optional<group> const & last() const noexcept { return last_; }
        source_location location() const noexcept { return { pos_ + 1 }; }

    private:
        group read_at(size_t pos) const;
        void check_readable() const;

        std::vector<std::string_view> lines_;
        size_t                        pos_        {0};
        size_t                        high_water_ {0};
        bool                          exhausted_  {false};
        std::optional<group>          last_;
        diagnostics *                 log_;
    };

//========================================================================
// Implementation
//========================================================================

    inline std::vector<std::string_view> split_lines(std::string_view text)
    {
        std::vector<std::string_view> lines;
        size_t start = 0;

        for (size_t i = 0; i < text.size(); ++i)
        {
            if (text[i] != '\n' && text[i] != '\r')
                continue;

            lines.push_back(text.substr(start, i - start));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            start = i + 1;
        }
        lines.push_back(text.substr(start));
        return lines;
    }

//---------------------------------------------------------------------------

    inline scanner::scanner(std::string_view text, diagnostics * log)
        : lines_(split_lines(text))
        , log_(log)
    {
        if (text.empty())
            lines_.clear();
    }

//---------------------------------------------------------------------------

    inline group scanner::read_at(size_t pos) const
    {
        source_location loc { pos + 1 };

        auto code_text = detail::trim_sv(lines_[pos]);
        int code = 0;
        auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
        if (code_text.empty() || ec != std::errc{} || ptr != code_text.data() + code_text.size())
            fail(parse_error_kind::invalid_code, loc,
                 "'" + std::string(lines_[pos]) + "' is not a group code");

        return group{ code, parse_value(code, detail::ltrim_sv(lines_[pos + 1]), loc), loc };
    }

//---------------------------------------------------------------------------

    inline void scanner::check_readable() const
    {
        if (exhausted_)
            fail(parse_error_kind::read_past_end, location(),
                 "read after the end-of-file marker");

        if (pos_ + 1 >= lines_.size())
            fail(parse_error_kind::unexpected_end_of_input, location(),
                 "input ended before the end-of-file marker");
    }

//---------------------------------------------------------------------------

    inline group scanner::next()
    {
        check_readable();

        group g = read_at(pos_);
        pos_ += 2;

        if (pos_ > high_water_)
        {
            high_water_ = pos_;
            if (log_ && !declared_type(g.code))
                log_->warn(diagnostic_kind::untyped_code, g.loc,
                           "code " + std::to_string(g.code) + " has no documented type, kept as text");
        }

        if (g.is(0, token::eof))
            exhausted_ = true;

        last_ = g;
        return g;
    }

//---------------------------------------------------------------------------

    inline group scanner::peek() const
    {
        check_readable();
        return read_at(pos_);
    }

//---------------------------------------------------------------------------

    inline std::optional<group> scanner::next_if(int code)
    {
        if (!has_next())
            return std::nullopt;

        group g = next();
        if (g.code == code)
            return g;

        rewind();
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline void scanner::rewind(size_t n)
    {
        if (n == 0)
            return;

        if (2 * n > pos_)
            throw std::out_of_range("scanner rewound past the start of input");

        pos_ -= 2 * n;
        exhausted_ = false;

        if (pos_ >= 2)
            last_ = read_at(pos_ - 2);
        else
            last_.reset();
    }

} // namespace dxf

#endif
