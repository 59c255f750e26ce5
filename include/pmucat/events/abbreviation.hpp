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

namespace pmucat
{
namespace events
{

/**
 * Shortens well-known long event name fragments, mostly those of uncore events as they are
 * repeated once per uncore device on the perf command line.
 *
 * Applied to both the name and the raw token of an event.
 */
std::string abbreviate_event_name(std::string event);

} // namespace events
} // namespace pmucat
