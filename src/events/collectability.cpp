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

#include <pmucat/events/collectability.hpp>

#include <pmucat/log.hpp>

#include <nitro/lang/string.hpp>

#include <algorithm>
#include <string>

namespace
{
const char* TOPDOWN_SLOTS_EVENT = "TOPDOWN.SLOTS";
const char* FIXED_METRICS_PREFIX = "PERF_METRICS.";

// not available on some cloud instances that lack PEBS
const char* PEBS_ONLY_EVENTS[] = { "INT_MISC.UNKNOWN_BRANCH_CYCLES", "UOPS_RETIRED.MS" };

const char* OCR_PREFIXES[] = { "OCR", "OFFCORE_REQUESTS_OUTSTANDING" };

const char* UNCORE_PREFIX = "UNC";

bool contains(const std::string& str, const std::string& part)
{
    return str.find(part) != std::string::npos;
}

bool is_fixed_tma_event(const std::string& name)
{
    return name == TOPDOWN_SLOTS_EVENT || nitro::lang::starts_with(name, FIXED_METRICS_PREFIX);
}

bool is_pebs_only_event(const std::string& name)
{
    return std::any_of(std::begin(PEBS_ONLY_EVENTS), std::end(PEBS_ONLY_EVENTS),
                       [&name](const char* pebs) { return name == pebs; });
}

bool is_ocr_event(const pmucat::events::EventDefinition& event)
{
    return event.device == "cpu" &&
           std::any_of(std::begin(OCR_PREFIXES), std::end(OCR_PREFIXES), [&event](const char* p) {
               return nitro::lang::starts_with(event.name, p);
           });
}
} // namespace

namespace pmucat
{
namespace events
{

bool is_collectable_event(const EventDefinition& event, const platform::Metadata& metadata,
                          CollectionScope scope)
{
    if (!metadata.supports_fixed_tma && is_fixed_tma_event(event.name))
    {
        Log::debug() << "Fixed counter TMA not supported on target: " << event.name;
        return false;
    }

    if (!metadata.supports_pebs && is_pebs_only_event(event.name))
    {
        Log::debug() << "PEBS events not supported on target: " << event.name;
        return false;
    }

    if (event.device == "cpu" && !is_ocr_event(event))
    {
        return true;
    }

    if (is_ocr_event(event))
    {
        if (!(metadata.supports_ocr && metadata.supports_uncore))
        {
            Log::debug() << "Off-core response events not supported on target: " << event.name;
            return false;
        }
        if (is_task_bound(scope))
        {
            Log::debug() << "Off-core response events not supported in " << scope_name(scope)
                         << " scope: " << event.name;
            return false;
        }
        return true;
    }

    if (!metadata.supports_uncore && nitro::lang::starts_with(event.name, UNCORE_PREFIX))
    {
        Log::debug() << "Uncore events not supported on target: " << event.name;
        return false;
    }

    if (!event.device.empty())
    {
        if (is_task_bound(scope))
        {
            Log::debug() << "Uncore events not supported in " << scope_name(scope)
                         << " scope: " << event.name;
            return false;
        }
        if (metadata.uncore_device_ids.count(event.device) == 0)
        {
            Log::debug() << "Uncore device not found: " << event.device;
            return false;
        }
        if (!contains(event.raw, "umask") || !contains(event.raw, "event"))
        {
            Log::debug() << "Uncore event missing umask or event: " << event.name;
            return false;
        }
        return true;
    }

    // device-less events from here on
    if (!metadata.supports_ref_cycles && contains(event.name, "ref-cycles"))
    {
        Log::debug() << "ref-cycles not supported on target: " << event.name;
        return false;
    }

    if (is_task_bound(scope) &&
        (contains(event.name, "cstate_") || contains(event.name, "power/energy")))
    {
        Log::debug() << "Cstate and power events not supported in " << scope_name(scope)
                     << " scope: " << event.name;
        return false;
    }

    // modifiers like ":u" are not part of the perf list output
    auto base_name = event.name.substr(0, event.name.find(':'));
    if (!contains(metadata.perf_supported_events, base_name))
    {
        Log::debug() << "Event not supported by perf: " << base_name;
        return false;
    }

    return true;
}

} // namespace events
} // namespace pmucat
