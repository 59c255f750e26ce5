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

#include <pmucat/platform.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace pmucat
{

/**
 * Where a catalog is read from: the packaged resource tree, unless the caller overrides it with
 * an explicit file (x86) or directory (ARM).
 */
struct CatalogSource
{
    std::filesystem::path resource_root;
    std::optional<std::filesystem::path> override_path;

    static CatalogSource packaged(std::filesystem::path root)
    {
        return CatalogSource{ std::move(root), std::nullopt };
    }

    static CatalogSource overridden(std::filesystem::path root, std::filesystem::path path)
    {
        return CatalogSource{ std::move(root), std::move(path) };
    }
};

namespace resources
{

enum class Kind
{
    EVENTS,
    METRICS
};

/**
 * <root>/<kind>/<architecture>/<vendor>/<uarch>[_nofixedtma]<extension>
 *
 * icx, spr and emr ship a variant for hosts without fixed TMA counters (e.g. some cloud VMs).
 */
std::filesystem::path x86_catalog_file(const std::filesystem::path& root, Kind kind,
                                       const platform::Metadata& metadata,
                                       const std::string& extension);

/**
 * @throws LookupError for microarchitectures without ARM catalog
 */
std::string arm_variant(const platform::Metadata& metadata);

/**
 * <root>/<kind>/<architecture>/<variant>
 */
std::filesystem::path arm_catalog_dir(const std::filesystem::path& root, Kind kind,
                                      const platform::Metadata& metadata);

} // namespace resources
} // namespace pmucat
