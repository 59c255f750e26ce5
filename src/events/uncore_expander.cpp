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

#include <pmucat/events/uncore_expander.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>

#include <fmt/core.h>

#include <iterator>
#include <regex>

namespace
{
struct rewrite_scheme
{
    // nullptr matches every vendor
    const char* vendor;
    const char* unit;
    const char* name;
};

static rewrite_scheme REWRITE_SCHEMES[] = {
    { pmucat::platform::VENDOR_AMD, "amd_{type}", "{name}" },
    { nullptr, "uncore_{type}_{id}", "{name}.{id}" },
};

const char* RAW_TEMPLATE = "{unit}/event={event},umask={umask},name='{name}'/";

const rewrite_scheme& scheme_for(const std::string& vendor)
{
    for (const auto& scheme : REWRITE_SCHEMES)
    {
        if (scheme.vendor == nullptr || vendor == scheme.vendor)
        {
            return scheme;
        }
    }
    // unreachable, the last scheme matches every vendor
    return REWRITE_SCHEMES[std::size(REWRITE_SCHEMES) - 1];
}
} // namespace

namespace pmucat
{
namespace events
{

std::vector<GroupDefinition> expand_uncore_group(const GroupDefinition& group,
                                                 const std::vector<int>& device_ids,
                                                 const std::string& vendor)
{
    // (type)/event=(code),umask=(umask and any further parameters),name='(name)'
    static const std::regex uncore_regex(
        "(\\w+)/event=(0x[0-9a-fA-F]+),umask=(0x[0-9a-fA-F]+.*),name='(.*)'");

    const auto& scheme = scheme_for(vendor);

    std::vector<GroupDefinition> groups;
    groups.reserve(device_ids.size());

    for (auto device_id : device_ids)
    {
        GroupDefinition device_group;
        for (const auto& event : group)
        {
            std::smatch match;
            if (!std::regex_search(event.raw, match, uncore_regex))
            {
                throw FormatError(fmt::format("unexpected raw event format: {}", event.raw));
            }

            EventDefinition device_event;
            device_event.name =
                fmt::format(fmt::runtime(scheme.name), fmt::arg("name", match.str(4)),
                            fmt::arg("id", device_id));
            auto unit = fmt::format(fmt::runtime(scheme.unit), fmt::arg("type", match.str(1)),
                                    fmt::arg("id", device_id));
            device_event.raw =
                fmt::format(fmt::runtime(RAW_TEMPLATE), fmt::arg("unit", unit),
                            fmt::arg("event", match.str(2)), fmt::arg("umask", match.str(3)),
                            fmt::arg("name", device_event.name));
            device_event.device = event.device;
            device_event.description = event.description;

            device_group.emplace_back(std::move(device_event));
        }
        groups.emplace_back(std::move(device_group));
    }
    return groups;
}

std::vector<GroupDefinition> expand_uncore_groups(const std::vector<GroupDefinition>& groups,
                                                  const platform::Metadata& metadata)
{
    std::vector<GroupDefinition> expanded;

    for (const auto& group : groups)
    {
        // uncore groups never mix device types, the first event speaks for the group
        if (group.empty() || metadata.uncore_device_ids.count(group.front().device) == 0)
        {
            expanded.emplace_back(group);
            continue;
        }

        const auto& device = group.front().device;
        const auto& ids = metadata.uncore_device_ids.at(device);
        if (ids.empty())
        {
            Log::warn() << "No uncore devices found for type " << device << ", dropping group";
            continue;
        }

        auto device_groups = expand_uncore_group(group, ids, metadata.vendor);
        Log::debug() << "expanded " << device << " group of " << group.size() << " events to "
                     << device_groups.size() << " devices";

        expanded.insert(expanded.end(), std::make_move_iterator(device_groups.begin()),
                        std::make_move_iterator(device_groups.end()));
    }
    return expanded;
}

} // namespace events
} // namespace pmucat
