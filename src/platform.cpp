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

#include <pmucat/platform.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>
#include <pmucat/util.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <nitro/lang/string.hpp>
#include <nlohmann/json.hpp>

namespace pmucat
{
namespace platform
{

std::string uarch_key(const Metadata& metadata)
{
    // "SPR_XCC" -> "spr", "Genoa (Zen 4)" -> "genoa"
    if (metadata.microarchitecture.empty())
    {
        return "";
    }
    auto uarch =
        boost::to_lower_copy(nitro::lang::split(metadata.microarchitecture, "_").front());
    return nitro::lang::split(uarch, " ").front();
}

Metadata read_metadata(const std::filesystem::path& path)
{
    auto content = read_file(path);

    try
    {
        return nlohmann::json::parse(content).get<Metadata>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw FormatError(path, std::string("invalid metadata document: ") + e.what());
    }
}

void to_json(nlohmann::json& j, const Metadata& metadata)
{
    j = nlohmann::json{ { "architecture", metadata.architecture },
                        { "vendor", metadata.vendor },
                        { "microarchitecture", metadata.microarchitecture },
                        { "supports_fixed_tma", metadata.supports_fixed_tma },
                        { "supports_pebs", metadata.supports_pebs },
                        { "supports_ocr", metadata.supports_ocr },
                        { "supports_uncore", metadata.supports_uncore },
                        { "supports_ref_cycles", metadata.supports_ref_cycles },
                        { "perf_supported_events", metadata.perf_supported_events },
                        { "uncore_device_ids", metadata.uncore_device_ids } };
}

void from_json(const nlohmann::json& j, Metadata& metadata)
{
    metadata.architecture = j.value("architecture", "");
    metadata.vendor = j.value("vendor", "");
    metadata.microarchitecture = j.value("microarchitecture", "");

    metadata.supports_fixed_tma = j.value("supports_fixed_tma", false);
    metadata.supports_pebs = j.value("supports_pebs", false);
    metadata.supports_ocr = j.value("supports_ocr", false);
    metadata.supports_uncore = j.value("supports_uncore", false);
    metadata.supports_ref_cycles = j.value("supports_ref_cycles", false);

    metadata.perf_supported_events = j.value("perf_supported_events", "");

    metadata.uncore_device_ids.clear();
    if (j.contains("uncore_device_ids"))
    {
        j.at("uncore_device_ids").get_to(metadata.uncore_device_ids);
    }

    Log::debug() << "metadata: " << metadata.architecture << " " << metadata.vendor << " "
                 << metadata.microarchitecture << ", " << metadata.uncore_device_ids.size()
                 << " uncore device types";
}

} // namespace platform
} // namespace pmucat
