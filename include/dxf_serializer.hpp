// dxf_serializer.hpp - DXF group-stream codec - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef DXF_SERIALIZER_HPP
#define DXF_SERIALIZER_HPP

#include "dxf_core.hpp"
#include "dxf_document.hpp"
#include "dxf_header.hpp"
#include "dxf_classes.hpp"
#include "dxf_tables.hpp"
#include "dxf_blocks.hpp"
#include <iterator>
#include <ostream>

namespace dxf
{
//========================================================================
// SERIALIZER API
//========================================================================

    struct serialize_options
    {
        entity_registry const * registry     = nullptr;     // null: built-in kinds
        diagnostic_sink         sink;
        severity                min_severity = severity::debug;
    };

    // Pull-based producer of output lines. Sections, block headers and
    // entities are rendered one unit at a time as lines are requested;
    // stopping early leaves the rest unrendered. The drawing and registry
    // must outlive the serializer.
    class serializer
    {
    public:
        class iterator;

        explicit serializer(drawing const & d, serialize_options const & options = {});

        serializer(serializer const &) = delete;
        serializer & operator=(serializer const &) = delete;

        // Next line, or nullopt once 0/EOF has been produced.
        std::optional<std::string> next();

        // Drains the remaining lines, newline-joined, no trailing newline.
        void write(std::ostream & out);
        std::string to_string();

        iterator begin();
        iterator end();

        std::vector<diagnostic> const & diagnostics() const noexcept { return log_.entries(); }

    private:
        enum class stage
        {
            header,
            classes,
            tables,
            blocks,
            entities,
            eof,
            done
        };

        bool refill();
        bool refill_blocks();
        bool refill_entities();
        void begin_section(std::string_view name);
        void end_section();

        drawing const &             drawing_;
        entity_registry const &     registry_;
        dxf::diagnostics            log_;
        std::deque<std::string>     pending_;
        group_writer                writer_;

        stage                       stage_   {stage::header};
        bool                        opened_  {false};
        blocks_section::const_iterator block_;
        size_t                      child_   {0};
        size_t                      item_    {0};
    };

    class serializer::iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::string;
        using difference_type   = std::ptrdiff_t;
        using pointer           = std::string const *;
        using reference         = std::string const &;

        iterator() = default;
        explicit iterator(serializer * s) : s_(s) { ++*this; }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator & operator++()
        {
            if (auto line = s_->next())
                current_ = std::move(*line);
            else
                s_ = nullptr;
            return *this;
        }

        void operator++(int) { ++*this; }

        bool operator==(iterator const & o) const { return s_ == o.s_; }

    private:
        serializer * s_ = nullptr;
        std::string  current_;
    };

    serializer serialize(drawing const & d, serialize_options const & options = {});
    std::string serialize_to_string(drawing const & d, serialize_options const & options = {});

//========================================================================
// Implementation
//========================================================================

    inline serializer::serializer(drawing const & d, serialize_options const & options)
        : drawing_(d)
        , registry_(options.registry ? *options.registry : entity_registry::builtin())
        , log_(options.sink, options.min_severity)
        , writer_(pending_)
    {}

//---------------------------------------------------------------------------

    inline std::optional<std::string> serializer::next()
    {
        while (pending_.empty())
        {
            if (!refill())
                return std::nullopt;
        }

        std::string line = std::move(pending_.front());
        pending_.pop_front();
        return line;
    }

    inline void serializer::write(std::ostream & out)
    {
        bool first = true;
        while (auto line = next())
        {
            if (!first)
                out << '\n';
            out << *line;
            first = false;
        }
    }

    inline std::string serializer::to_string()
    {
        std::string out;
        bool first = true;
        while (auto line = next())
        {
            if (!first)
                out += '\n';
            out += *line;
            first = false;
        }
        return out;
    }

    inline serializer::iterator serializer::begin() { return iterator(this); }
    inline serializer::iterator serializer::end() { return iterator(); }

//---------------------------------------------------------------------------

    inline void serializer::begin_section(std::string_view name)
    {
        writer_.write_text(0, token::section);
        writer_.write_text(2, name);
    }

    inline void serializer::end_section()
    {
        writer_.write_text(0, token::end_section);
    }

    // Renders the next unit into the pending queue. A unit may render to
    // nothing (an entity without a writer); returns false once done.
    inline bool serializer::refill()
    {
        auto const & d = drawing_;

        switch (stage_)
        {
            case stage::header:
                if (d.header)
                {
                    begin_section(token::header);
                    write_header(*d.header, writer_, log_);
                    end_section();
                }
                stage_ = stage::classes;
                return true;

            case stage::classes:
                if (d.classes)
                {
                    begin_section(token::classes);
                    write_classes(*d.classes, writer_);
                    end_section();
                }
                stage_ = stage::tables;
                return true;

            case stage::tables:
                if (d.tables)
                {
                    begin_section(token::tables);
                    write_tables(*d.tables, writer_);
                    end_section();
                }
                stage_ = stage::blocks;
                return true;

            case stage::blocks:
                if (!d.blocks)
                {
                    stage_ = stage::entities;
                    return true;
                }
                return refill_blocks();

            case stage::entities:
                if (!d.entities)
                {
                    stage_ = stage::eof;
                    return true;
                }
                return refill_entities();

            case stage::eof:
                writer_.write_text(0, token::eof);
                stage_ = stage::done;
                return true;

            case stage::done:
                break;
        }
        return false;
    }

    inline bool serializer::refill_blocks()
    {
        auto const & blocks = *drawing_.blocks;

        if (!opened_)
        {
            begin_section(token::blocks);
            opened_ = true;
            block_  = blocks.begin();
            child_  = 0;
            return true;
        }

        if (block_ == blocks.end())
        {
            end_section();
            opened_ = false;
            stage_  = stage::entities;
            return true;
        }

        auto const & b = block_->second;
        if (child_ == 0)
            write_block_begin(b, writer_);
        else if (child_ <= b.entities.size())
            write_entity(b.entities[child_ - 1], registry_, writer_, log_);
        else
        {
            write_block_end(b, writer_);
            ++block_;
            child_ = 0;
            return true;
        }
        ++child_;
        return true;
    }

    inline bool serializer::refill_entities()
    {
        auto const & entities = *drawing_.entities;

        if (!opened_)
        {
            begin_section(token::entities);
            opened_ = true;
            item_   = 0;
            return true;
        }

        if (item_ < entities.size())
        {
            write_entity(entities[item_++], registry_, writer_, log_);
            return true;
        }

        end_section();
        opened_ = false;
        stage_  = stage::eof;
        return true;
    }

//========================================================================
// Serializer API implementation
//========================================================================

    inline serializer serialize(drawing const & d, serialize_options const & options)
    {
        return serializer(d, options);
    }

    inline std::string serialize_to_string(drawing const & d, serialize_options const & options)
    {
        return serializer(d, options).to_string();
    }

} // namespace dxf

#endif
