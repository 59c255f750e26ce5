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
#include <pmucat/resources.hpp>

#include <filesystem>
#include <istream>

namespace pmucat
{
namespace events
{

/**
 * Loads the event groups for the target, choosing the ARM or the x86 catalog by architecture.
 */
EventCatalog load_event_groups(const CatalogSource& source, const platform::Metadata& metadata,
                               CollectionScope scope);

/**
 * Loads a line oriented x86 catalog and expands its uncore groups.
 *
 * Fails as a whole on the first malformed line.
 * @throws ResourceError, FormatError
 */
EventCatalog load_x86_event_groups(const CatalogSource& source,
                                   const platform::Metadata& metadata, CollectionScope scope);

/**
 * Parses x86 catalog text read from input, source names the input in error messages.
 */
EventCatalog parse_x86_catalog(std::istream& input, const std::filesystem::path& source,
                               const platform::Metadata& metadata, CollectionScope scope);

/**
 * Loads a directory of ARM JSON event files, one group per file.
 *
 * Files that can not be read or parsed are skipped.
 * @throws ResourceError if the directory is missing or the override is not a directory
 * @throws LookupError if there is no catalog for the microarchitecture
 */
EventCatalog load_arm_event_groups(const CatalogSource& source,
                                   const platform::Metadata& metadata, CollectionScope scope);

} // namespace events
} // namespace pmucat
