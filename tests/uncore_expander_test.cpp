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

#include <pmucat/error.hpp>
#include <pmucat/events/uncore_expander.hpp>
#include <pmucat/platform.hpp>

#include <set>
#include <string>

using pmucat::events::EventDefinition;
using pmucat::events::GroupDefinition;

namespace
{
EventDefinition uncore_event(const std::string& device, const std::string& name,
                             const std::string& event_code, const std::string& umask)
{
    EventDefinition ev;
    ev.name = name;
    ev.device = device;
    ev.raw = device + "/event=" + event_code + ",umask=" + umask + ",name='" + name + "'/";
    return ev;
}

EventDefinition core_event(const std::string& name)
{
    EventDefinition ev;
    ev.name = name;
    ev.raw = name;
    ev.device = "cpu";
    return ev;
}
} // namespace

SCENARIO("uncore groups are replicated per device", "[uncore]")
{
    GIVEN("an Intel CHA group of two events")
    {
        GroupDefinition group = { uncore_event("cha", "UNCCTI.IMD", "0x35", "0xc80ffe01"),
                                  uncore_event("cha", "UNCCCT", "0x01", "0x00") };

        WHEN("expanded for three devices")
        {
            auto groups = pmucat::events::expand_uncore_group(group, { 0, 2, 5 },
                                                              pmucat::platform::VENDOR_INTEL);

            THEN("there is one group per device with the same number of events")
            {
                REQUIRE(groups.size() == 3);
                for (const auto& device_group : groups)
                {
                    REQUIRE(device_group.size() == group.size());
                }
            }

            THEN("unit and name address the device")
            {
                const auto& ev = groups[1][0];
                REQUIRE(ev.raw == "uncore_cha_2/event=0x35,umask=0xc80ffe01,name='UNCCTI.IMD.2'/");
                REQUIRE(ev.name == "UNCCTI.IMD.2");
                REQUIRE(ev.device == "cha");

                REQUIRE(groups[2][1].raw == "uncore_cha_5/event=0x01,umask=0x00,name='UNCCCT.5'/");
            }

            THEN("all names and raw tokens are distinct")
            {
                std::set<std::string> names;
                std::set<std::string> raws;
                for (const auto& device_group : groups)
                {
                    for (const auto& ev : device_group)
                    {
                        names.insert(ev.name);
                        raws.insert(ev.raw);
                    }
                }
                REQUIRE(names.size() == 6);
                REQUIRE(raws.size() == 6);
            }
        }
    }

    GIVEN("an event with parameters after the umask")
    {
        EventDefinition ev;
        ev.name = "UNCCTI.IMDR";
        ev.device = "cha";
        ev.raw = "cha/event=0x35,umask=0xc8177e01,config1=0x40433,name='UNCCTI.IMDR'/";

        THEN("the parameters are kept")
        {
            auto groups =
                pmucat::events::expand_uncore_group({ ev }, { 1 }, pmucat::platform::VENDOR_INTEL);
            REQUIRE(groups.size() == 1);
            REQUIRE(groups[0][0].raw ==
                    "uncore_cha_1/event=0x35,umask=0xc8177e01,config1=0x40433,"
                    "name='UNCCTI.IMDR.1'/");
        }
    }

    GIVEN("an AMD L3 group")
    {
        GroupDefinition group = { uncore_event("l3", "l3_lookup_state.l3_miss", "0x04", "0x01") };

        WHEN("expanded for two devices")
        {
            auto groups =
                pmucat::events::expand_uncore_group(group, { 0, 1 }, pmucat::platform::VENDOR_AMD);

            THEN("the unit is the AMD pmu and the name is unchanged")
            {
                REQUIRE(groups.size() == 2);
                for (const auto& device_group : groups)
                {
                    REQUIRE(device_group[0].raw ==
                            "amd_l3/event=0x04,umask=0x01,name='l3_lookup_state.l3_miss'/");
                    REQUIRE(device_group[0].name == "l3_lookup_state.l3_miss");
                }
            }
        }
    }

    GIVEN("an event that does not have the uncore shape")
    {
        EventDefinition ev;
        ev.name = "UNC_X";
        ev.device = "cha";
        ev.raw = "cha/umask=0x01,event=0x35,name='UNC_X'/";

        THEN("expansion fails")
        {
            REQUIRE_THROWS_AS(pmucat::events::expand_uncore_group(
                                  { ev }, { 0 }, pmucat::platform::VENDOR_INTEL),
                              pmucat::FormatError);
        }
    }
}

TEST_CASE("expanding a group list", "[uncore]")
{
    pmucat::platform::Metadata metadata;
    metadata.vendor = pmucat::platform::VENDOR_INTEL;
    metadata.uncore_device_ids = { { "cha", { 0, 1 } }, { "imc", {} } };

    std::vector<GroupDefinition> groups = {
        { core_event("instructions"), core_event("cpu-cycles") },
        { uncore_event("cha", "UNCCCT", "0x01", "0x00") },
        { uncore_event("imc", "UNCMCC0.RD", "0x05", "0xcf") },
        { uncore_event("upi", "UNC_UPI_TxL_FLITS.ALL_DATA", "0x02", "0x0f") },
        {},
    };

    auto expanded = pmucat::events::expand_uncore_groups(groups, metadata);

    // the imc group has no devices and is dropped
    REQUIRE(expanded.size() == 5);
    REQUIRE(expanded[0] == groups[0]);
    REQUIRE(expanded[1][0].name == "UNCCCT.0");
    REQUIRE(expanded[2][0].name == "UNCCCT.1");
    // not in the device inventory, passes through
    REQUIRE(expanded[3] == groups[3]);
    REQUIRE(expanded[4].empty());
}
