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

#include <pmucat/resources.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace
{
template <typename T>
struct string_to_id
{
    const char* name;
    T id;
};

static string_to_id<const char*> ARM_VARIANT_TABLE[] = {
    { "Neoverse V2", "neoverse-n2-v2" },
    { "Neoverse N2", "neoverse-n2-v2" },
};

const char* NO_FIXED_TMA_UARCHS[] = { "icx", "spr", "emr" };

const char* kind_dir(pmucat::resources::Kind kind)
{
    switch (kind)
    {
    case pmucat::resources::Kind::EVENTS:
        return "events";
    case pmucat::resources::Kind::METRICS:
        return "metrics";
    }
    return "events";
}
} // namespace

namespace pmucat
{
namespace resources
{

std::filesystem::path x86_catalog_file(const std::filesystem::path& root, Kind kind,
                                       const platform::Metadata& metadata,
                                       const std::string& extension)
{
    auto uarch = platform::uarch_key(metadata);

    std::string alternate;
    if (!metadata.supports_fixed_tma &&
        std::find(std::begin(NO_FIXED_TMA_UARCHS), std::end(NO_FIXED_TMA_UARCHS), uarch) !=
            std::end(NO_FIXED_TMA_UARCHS))
    {
        alternate = "_nofixedtma";
    }

    auto path = root / kind_dir(kind) / metadata.architecture / metadata.vendor /
                fmt::format("{}{}{}", uarch, alternate, extension);
    Log::debug() << "using " << kind_dir(kind) << " catalog " << path.string();
    return path;
}

std::string arm_variant(const platform::Metadata& metadata)
{
    for (const auto& variant : ARM_VARIANT_TABLE)
    {
        if (metadata.microarchitecture == variant.name)
        {
            return variant.id;
        }
    }
    throw LookupError(fmt::format("unknown ARM variant: {}", metadata.microarchitecture));
}

std::filesystem::path arm_catalog_dir(const std::filesystem::path& root, Kind kind,
                                      const platform::Metadata& metadata)
{
    return root / kind_dir(kind) / metadata.architecture / arm_variant(metadata);
}

} // namespace resources
} // namespace pmucat
