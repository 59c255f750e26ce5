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

#include <pmucat/collection_scope.hpp>
#include <pmucat/events/event_definition.hpp>
#include <pmucat/platform.hpp>

namespace pmucat
{
namespace events
{

/**
 * Decides whether the target described by metadata can count event when collecting in scope.
 *
 * The rules are checked in order, the first one that applies decides:
 *  1. fixed counter TMA events need fixed TMA support
 *  2. PEBS-only events need PEBS support
 *  3. core events that are not off-core response events are collectable
 *  4. off-core response events need OCR and uncore support and system scope
 *  5. uncore named events need uncore support
 *  6. events of other devices need system scope, a known device and event/umask fields
 *  7. device-less events must be listed by perf (and pass the ref-cycles and
 *     cstate/power checks)
 */
bool is_collectable_event(const EventDefinition& event, const platform::Metadata& metadata,
                          CollectionScope scope);

} // namespace events
} // namespace pmucat
