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

#include <pmucat/events/event_record.hpp>

#include <pmucat/log.hpp>

#include <nitro/lang/string.hpp>

namespace pmucat
{
namespace events
{

EventRecord EventRecord::parse(const std::string& text)
{
    if (text.empty())
    {
        throw ParseError{ "empty event record" };
    }

    auto fields = nitro::lang::split(text, ",");
    if (fields.size() == 1)
    {
        return EventRecord(text, Bare{ text });
    }

    return EventRecord(text, parse_pmu(fields, text));
}

EventRecord::Pmu EventRecord::parse_pmu(const std::vector<std::string>& fields,
                                        const std::string& text)
{
    using namespace std::string_literals;

    Pmu pmu;

    const auto& name_field = fields.back();
    if (!nitro::lang::starts_with(name_field, "name="))
    {
        throw ParseError{ "unrecognized event format, name field not found: "s + text };
    }

    auto name = name_field.substr(5);
    if (!name.empty() && name.back() == '/')
    {
        name.pop_back();
    }
    if (!name.empty() && name.front() == '\'')
    {
        if (name.size() < 2 || name.back() != '\'')
        {
            throw ParseError{ "unterminated quote in name field: "s + text };
        }
        name = name.substr(1, name.size() - 2);
    }
    if (name.empty())
    {
        throw ParseError{ "empty event name: "s + text };
    }
    pmu.name = name;

    // first field carries the unit: "cha/event=0x35"
    const auto& head = fields.front();
    auto slash = head.find('/');
    pmu.unit = head.substr(0, slash);

    std::vector<std::string> params;
    if (slash != std::string::npos && slash + 1 < head.size())
    {
        params.emplace_back(head.substr(slash + 1));
    }
    params.insert(params.end(), fields.begin() + 1, fields.end() - 1);

    for (const auto& param : params)
    {
        auto eq = param.find('=');
        if (eq == std::string::npos)
        {
            pmu.params.emplace_back(param, "");
        }
        else
        {
            pmu.params.emplace_back(param.substr(0, eq), param.substr(eq + 1));
        }
    }

    Log::trace() << "parsed event record " << pmu.name << " on unit " << pmu.unit << " with "
                 << pmu.params.size() << " parameters";

    return pmu;
}

EventDefinition EventRecord::to_event_definition() const
{
    EventDefinition event;
    event.raw = text_;

    if (is_bare())
    {
        event.name = bare().token;
    }
    else
    {
        event.name = pmu().name;
        event.device = pmu().unit;
    }
    return event;
}

} // namespace events
} // namespace pmucat
