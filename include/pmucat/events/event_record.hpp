/*
 * This file is part of the pmucat software.
 * PMU event and metric catalog processing
 *
 * Copyright (c) 2024,
 *    Technische Universitaet Dresden, Germany
 *
 * pmucat is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * pmucat is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with pmucat.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <pmucat/events/event_definition.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pmucat
{
namespace events
{

/**
 * One event record of the x86 catalog dialect, separator already stripped.
 *
 * Grammar:
 *   record := bare | pmu
 *   bare   := TOKEN                                  (no ',')
 *   pmu    := UNIT '/' param (',' param)* ',' name
 *   param  := KEY ['=' VALUE]
 *   name   := "name=" ( "'" NAME "'" | NAME ) ['/']
 */
class EventRecord
{
public:
    class ParseError : public std::runtime_error
    {
    public:
        ParseError(const std::string& what) : std::runtime_error(what)
        {
        }
    };

    // a plain perf event name like "instructions" or "power/energy-pkg/"
    struct Bare
    {
        std::string token;
    };

    // a fully specified PMU event like "cpu/event=0xc0,umask=0x0,name='INST_RETIRED.ANY'/"
    struct Pmu
    {
        std::string unit;
        std::vector<std::pair<std::string, std::string>> params;
        std::string name;
    };

    static EventRecord parse(const std::string& text);

    bool is_bare() const
    {
        return std::holds_alternative<Bare>(record_);
    }

    const Bare& bare() const
    {
        return std::get<Bare>(record_);
    }

    const Pmu& pmu() const
    {
        return std::get<Pmu>(record_);
    }

    const std::string& text() const
    {
        return text_;
    }

    EventDefinition to_event_definition() const;

private:
    EventRecord(std::string text, std::variant<Bare, Pmu> record)
    : text_(std::move(text)), record_(std::move(record))
    {
    }

    static Pmu parse_pmu(const std::vector<std::string>& fields, const std::string& text);

    std::string text_;
    std::variant<Bare, Pmu> record_;
};

} // namespace events
} // namespace pmucat
