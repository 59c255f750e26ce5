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

#include <pmucat/events/event_definition.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace pmucat
{
namespace events
{

std::string format_event_groups(const std::vector<GroupDefinition>& groups)
{
    std::vector<std::string> formatted;
    formatted.reserve(groups.size());

    for (const auto& group : groups)
    {
        std::vector<std::string> raws;
        for (const auto& event : group)
        {
            raws.emplace_back(event.raw);
        }
        formatted.emplace_back(fmt::format("{{{}}}", fmt::join(raws, ",")));
    }

    return fmt::format("{}", fmt::join(formatted, ","));
}

} // namespace events
} // namespace pmucat
