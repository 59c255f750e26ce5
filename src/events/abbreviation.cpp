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

#include <pmucat/events/abbreviation.hpp>

#include <nitro/lang/string.hpp>

namespace
{
struct abbreviation
{
    const char* long_form;
    const char* short_form;
};

// Order matters, some long forms contain others. Replacements of UNC_* names have to start with
// "UNC" again, uncore events are recognized by that prefix.
static abbreviation ABBREVIATION_TABLE[] = {
    { "UNC_CHA_TOR_INSERTS", "UNCCTI" },
    { "UNC_CHA_TOR_OCCUPANCY", "UNCCTO" },
    { "UNC_CHA_CLOCKTICKS", "UNCCCT" },
    { "UNC_M_CAS_COUNT_SCH", "UNCMCC" },
    { "IA_MISS_DRD_REMOTE", "IMDR" },
    { "IA_MISS_DRD_LOCAL", "IMDL" },
    { "IA_MISS_LLCPREFDATA", "IMLP" },
    { "IA_MISS_LLCPREFRFO", "IMLR" },
    { "IA_MISS_DRD_PREF_LOCAL", "IMDPL" },
    { "IA_MISS_DRD_PREF_REMOTE", "IMDRP" },
    { "IA_MISS_CRD_PREF", "IMCP" },
    { "IA_MISS_RFO_PREF", "IMRP" },
    { "IA_MISS_RFO", "IMRF" },
    { "IA_MISS_CRD", "IMC" },
    { "IA_MISS_DRD", "IMD" },
    { "IO_PCIRDCUR", "IPCI" },
    { "IO_ITOMCACHENEAR", "IITN" },
    { "IO_ITOM", "IITO" },
    { "IMD_OPT", "IMDO" },
};
} // namespace

namespace pmucat
{
namespace events
{

std::string abbreviate_event_name(std::string event)
{
    for (const auto& abbr : ABBREVIATION_TABLE)
    {
        nitro::lang::replace_all(event, abbr.long_form, abbr.short_form);
    }
    return event;
}

} // namespace events
} // namespace pmucat
