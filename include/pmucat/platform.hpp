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

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pmucat
{
namespace platform
{

constexpr const char* VENDOR_INTEL = "GenuineIntel";
constexpr const char* VENDOR_AMD = "AuthenticAMD";

/**
 * Description of the host the catalog is prepared for.
 *
 * Collected by the target layer (lscpu, perf list, sysfs) and handed in read-only.
 */
struct Metadata
{
    std::string architecture;
    std::string vendor;
    std::string microarchitecture;

    bool supports_fixed_tma = false;
    bool supports_pebs = false;
    bool supports_ocr = false;
    bool supports_uncore = false;
    bool supports_ref_cycles = false;

    // raw `perf list` output of the target
    std::string perf_supported_events;

    // uncore device type (e.g. "cha", "imc") -> instance ids
    std::map<std::string, std::vector<int>> uncore_device_ids;

    bool is_arm() const
    {
        return architecture == "aarch64" || architecture == "arm64";
    }

    bool is_amd() const
    {
        return vendor == VENDOR_AMD;
    }
};

/**
 * lower-cased leading token of the microarchitecture label, e.g. "SPR_XCC" -> "spr"
 */
std::string uarch_key(const Metadata& metadata);

Metadata read_metadata(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Metadata& metadata);
void from_json(const nlohmann::json& j, Metadata& metadata);

} // namespace platform
} // namespace pmucat
