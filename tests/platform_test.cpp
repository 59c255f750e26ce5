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

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <pmucat/collection_scope.hpp>
#include <pmucat/error.hpp>
#include <pmucat/platform.hpp>
#include <pmucat/resources.hpp>
#include <pmucat/util.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

using pmucat::platform::Metadata;

TEST_CASE("microarchitecture keys", "[platform]")
{
    Metadata metadata;

    metadata.microarchitecture = "SPR_XCC";
    REQUIRE(pmucat::platform::uarch_key(metadata) == "spr");

    metadata.microarchitecture = "EMR_MCC";
    REQUIRE(pmucat::platform::uarch_key(metadata) == "emr");

    metadata.microarchitecture = "Genoa (Zen 4)";
    REQUIRE(pmucat::platform::uarch_key(metadata) == "genoa");

    metadata.microarchitecture = "ICX";
    REQUIRE(pmucat::platform::uarch_key(metadata) == "icx");

    metadata.microarchitecture = "";
    REQUIRE(pmucat::platform::uarch_key(metadata).empty());
}

TEST_CASE("metadata documents", "[platform]")
{
    pmucat::test::TempPath file;

    SECTION("all fields")
    {
        file.write(R"({
            "architecture": "x86_64",
            "vendor": "GenuineIntel",
            "microarchitecture": "SPR_XCC",
            "supports_fixed_tma": true,
            "supports_uncore": true,
            "perf_supported_events": "cpu-cycles instructions",
            "uncore_device_ids": { "cha": [0, 1], "imc": [] }
        })");

        auto metadata = pmucat::platform::read_metadata(file.path());
        REQUIRE(metadata.architecture == "x86_64");
        REQUIRE(metadata.vendor == pmucat::platform::VENDOR_INTEL);
        REQUIRE(metadata.supports_fixed_tma);
        REQUIRE(metadata.supports_uncore);
        REQUIRE_FALSE(metadata.supports_pebs);
        REQUIRE_FALSE(metadata.is_arm());
        REQUIRE_FALSE(metadata.is_amd());
        REQUIRE(metadata.uncore_device_ids.at("cha") == std::vector<int>{ 0, 1 });
        REQUIRE(metadata.uncore_device_ids.at("imc").empty());

        nlohmann::json j = metadata;
        REQUIRE(j.get<Metadata>().uncore_device_ids == metadata.uncore_device_ids);
    }

    SECTION("missing fields take their defaults")
    {
        file.write(R"({ "architecture": "aarch64", "microarchitecture": "Neoverse V2" })");

        auto metadata = pmucat::platform::read_metadata(file.path());
        REQUIRE(metadata.is_arm());
        REQUIRE(metadata.vendor.empty());
        REQUIRE_FALSE(metadata.supports_ref_cycles);
        REQUIRE(metadata.uncore_device_ids.empty());
    }

    SECTION("wrong field type")
    {
        file.write(R"({ "supports_pebs": "yes" })");
        REQUIRE_THROWS_AS(pmucat::platform::read_metadata(file.path()), pmucat::FormatError);
    }

    SECTION("missing file")
    {
        REQUIRE_THROWS_AS(pmucat::platform::read_metadata(file.path()), pmucat::ResourceError);
    }
}

TEST_CASE("catalog resource paths", "[platform]")
{
    const std::filesystem::path root = "/opt/pmucat";
    using pmucat::resources::Kind;
    using pmucat::resources::x86_catalog_file;

    SECTION("x86 catalogs follow the fixed TMA support")
    {
        auto metadata =
            pmucat::test::full_x86_metadata(pmucat::platform::VENDOR_INTEL, "SPR_XCC");
        auto events = x86_catalog_file(root, Kind::EVENTS, metadata, ".txt");
        REQUIRE(events.string() == "/opt/pmucat/events/x86_64/GenuineIntel/spr.txt");

        metadata.supports_fixed_tma = false;
        auto metrics = x86_catalog_file(root, Kind::METRICS, metadata, ".json");
        REQUIRE(metrics.string() == "/opt/pmucat/metrics/x86_64/GenuineIntel/spr_nofixedtma.json");
    }

    SECTION("only Intel cores have a variant without fixed TMA")
    {
        auto metadata = pmucat::test::full_x86_metadata(pmucat::platform::VENDOR_AMD, "Genoa");
        metadata.supports_fixed_tma = false;
        auto events = x86_catalog_file(root, Kind::EVENTS, metadata, ".txt");
        REQUIRE(events.string() == "/opt/pmucat/events/x86_64/AuthenticAMD/genoa.txt");
    }

    SECTION("ARM catalogs are shared between variants")
    {
        REQUIRE(pmucat::resources::arm_variant(pmucat::test::arm_metadata("Neoverse N2")) ==
                "neoverse-n2-v2");
        auto dir = pmucat::resources::arm_catalog_dir(root, Kind::METRICS,
                                                      pmucat::test::arm_metadata("Neoverse V2"));
        REQUIRE(dir.string() == "/opt/pmucat/metrics/aarch64/neoverse-n2-v2");
        REQUIRE_THROWS_AS(pmucat::resources::arm_variant(pmucat::test::arm_metadata("Ampere-1")),
                          pmucat::LookupError);
    }
}

TEST_CASE("collection scopes", "[platform]")
{
    REQUIRE(pmucat::scope_from_string("system") == pmucat::CollectionScope::SYSTEM);
    REQUIRE(pmucat::scope_from_string("cgroup") == pmucat::CollectionScope::CGROUP);
    REQUIRE_THROWS_AS(pmucat::scope_from_string("thread"), pmucat::LookupError);

    REQUIRE_FALSE(pmucat::is_task_bound(pmucat::CollectionScope::SYSTEM));
    REQUIRE(pmucat::is_task_bound(pmucat::CollectionScope::PROCESS));
    REQUIRE(pmucat::scope_name(pmucat::CollectionScope::PROCESS) == "process");
}

TEST_CASE("directory listings", "[util]")
{
    pmucat::test::TempPath dir;
    dir.write_file("b.json", "[]");
    dir.write_file("A.JSON", "[]");
    dir.write_file("c.txt", "");
    std::filesystem::create_directories(dir.path() / "d.json");

    auto files = pmucat::list_files(dir.path(), ".json");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename().string() == "A.JSON");
    REQUIRE(files[1].filename().string() == "b.json");

    REQUIRE_THROWS_AS(pmucat::list_files(dir.path() / "missing", ".json"),
                      pmucat::ResourceError);
}
