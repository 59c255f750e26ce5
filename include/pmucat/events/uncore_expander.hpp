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
#include <pmucat/platform.hpp>

#include <string>
#include <vector>

namespace pmucat
{
namespace events
{

/**
 * Replicates group once per device id, rewriting every raw token to address that device.
 *
 * Intel style: cha/event=0x35,umask=0x1,name='X'/ -> uncore_cha_3/event=0x35,umask=0x1,name='X.3'/
 * AMD style:   l3/event=0x4,umask=0xff,name='X'/  -> amd_l3/event=0x4,umask=0xff,name='X'/
 *
 * @throws FormatError if a raw token does not have the expected uncore shape
 */
std::vector<GroupDefinition> expand_uncore_group(const GroupDefinition& group,
                                                 const std::vector<int>& device_ids,
                                                 const std::string& vendor);

/**
 * Expands every group whose (first) event belongs to a known uncore device type, in place and in
 * order. Groups of a device type without instances are dropped.
 */
std::vector<GroupDefinition> expand_uncore_groups(const std::vector<GroupDefinition>& groups,
                                                  const platform::Metadata& metadata);

} // namespace events
} // namespace pmucat
