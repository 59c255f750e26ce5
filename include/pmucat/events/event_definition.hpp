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

#include <string>
#include <vector>

namespace pmucat
{
namespace events
{

/**
 * A single perf event as listed in a catalog.
 */
struct EventDefinition
{
    // verbatim token for the perf command line, e.g. "cha/event=0x35,umask=0x1,name='X'/"
    std::string raw;
    // identifier used for matching and reporting, e.g. "X"
    std::string name;
    // "cpu", an uncore device type or empty
    std::string device;
    std::string description;

    friend bool operator==(const EventDefinition& lhs, const EventDefinition& rhs)
    {
        return lhs.raw == rhs.raw && lhs.name == rhs.name && lhs.device == rhs.device &&
               lhs.description == rhs.description;
    }

    friend bool operator!=(const EventDefinition& lhs, const EventDefinition& rhs)
    {
        return !(lhs == rhs);
    }
};

// events that have to be scheduled onto the counters together
using GroupDefinition = std::vector<EventDefinition>;

/**
 * Result of loading a catalog: the groups that can be collected on the target and the names of
 * the events that were dropped because the target can not count them.
 */
struct EventCatalog
{
    std::vector<GroupDefinition> groups;
    std::vector<std::string> uncollectable;
};

/**
 * renders groups as perf event group list, e.g. "{a,b},{c}"
 */
std::string format_event_groups(const std::vector<GroupDefinition>& groups);

} // namespace events
} // namespace pmucat
