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

#include <pmucat/events/catalog.hpp>

#include <pmucat/error.hpp>
#include <pmucat/events/abbreviation.hpp>
#include <pmucat/events/collectability.hpp>
#include <pmucat/events/event_record.hpp>
#include <pmucat/events/uncore_expander.hpp>
#include <pmucat/log.hpp>
#include <pmucat/util.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace
{
// keeps the order in which the names were first seen
class NameSet
{
public:
    void add(const std::string& name)
    {
        if (seen_.insert(name).second)
        {
            names_.emplace_back(name);
        }
    }

    std::vector<std::string> names() const
    {
        return names_;
    }

private:
    std::set<std::string> seen_;
    std::vector<std::string> names_;
};

std::vector<pmucat::events::EventDefinition> read_arm_event_file(const std::filesystem::path& path)
{
    auto content = pmucat::read_file(path);

    std::vector<pmucat::events::EventDefinition> events;
    try
    {
        auto records = nlohmann::json::parse(content);
        if (!records.is_array())
        {
            throw pmucat::FormatError(path, "expected a JSON array of events");
        }

        for (const auto& record : records)
        {
            if (!record.is_object() || !record.contains("ArchStdEvent"))
            {
                pmucat::Log::debug() << "Ignoring ARM event record without ArchStdEvent in "
                                     << path.string();
                continue;
            }

            pmucat::events::EventDefinition event;
            event.name = record.at("ArchStdEvent").get<std::string>();
            event.raw = event.name;
            // the ARM catalogs only describe core events
            event.device = "cpu";
            event.description = record.value("PublicDescription", "");

            pmucat::Log::trace() << "ARM event definition " << event.name;
            events.emplace_back(std::move(event));
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw pmucat::FormatError(path, e.what());
    }
    return events;
}
} // namespace

namespace pmucat
{
namespace events
{

EventCatalog load_event_groups(const CatalogSource& source, const platform::Metadata& metadata,
                               CollectionScope scope)
{
    EventCatalog catalog;
    if (metadata.is_arm())
    {
        catalog = load_arm_event_groups(source, metadata, scope);
    }
    else
    {
        catalog = load_x86_event_groups(source, metadata, scope);
    }

    if (!catalog.uncollectable.empty())
    {
        Log::warn() << "Events not collectable on target: "
                    << fmt::format("{}", fmt::join(catalog.uncollectable, ", "));
    }
    return catalog;
}

EventCatalog load_x86_event_groups(const CatalogSource& source,
                                   const platform::Metadata& metadata, CollectionScope scope)
{
    auto path = source.override_path.value_or(resources::x86_catalog_file(
        source.resource_root, resources::Kind::EVENTS, metadata, ".txt"));

    std::ifstream input(path);
    if (!input.is_open())
    {
        throw ResourceError(path, "Failed to open event definition file");
    }
    return parse_x86_catalog(input, path, metadata, scope);
}

EventCatalog parse_x86_catalog(std::istream& input, const std::filesystem::path& source,
                               const platform::Metadata& metadata, CollectionScope scope)
{
    EventCatalog catalog;
    NameSet uncollectable;
    GroupDefinition group;

    std::size_t line_number = 0;
    for (std::string line; std::getline(input, line);)
    {
        line_number++;
        boost::trim(line);
        if (line.empty() || line.front() == '#')
        {
            continue;
        }

        // ',' continues the group, ';' closes it
        const char separator = line.back();
        if (separator != ',' && separator != ';')
        {
            throw FormatError(source, fmt::format("line {}: event definition must end with ',' "
                                                  "or ';': {}",
                                                  line_number, line));
        }

        EventDefinition event;
        try
        {
            auto record = EventRecord::parse(boost::trim_copy(line.substr(0, line.size() - 1)));
            event = record.to_event_definition();
        }
        catch (const EventRecord::ParseError& e)
        {
            throw FormatError(source, fmt::format("line {}: {}", line_number, e.what()));
        }

        // abbreviate to shorten the eventual perf command line
        event.name = abbreviate_event_name(event.name);
        event.raw = abbreviate_event_name(event.raw);

        if (is_collectable_event(event, metadata, scope))
        {
            group.emplace_back(std::move(event));
        }
        else
        {
            uncollectable.add(event.name);
        }

        if (separator == ';')
        {
            if (!group.empty())
            {
                catalog.groups.emplace_back(std::move(group));
            }
            else
            {
                Log::warn() << "No collectable events in group ending with " << line;
            }
            group.clear();
        }
    }

    if (input.bad())
    {
        throw ResourceError(source, "Failed to read event definition file");
    }

    if (!group.empty())
    {
        Log::warn() << "Last event group in " << source.string()
                    << " is not terminated with ';', keeping it";
        catalog.groups.emplace_back(std::move(group));
    }

    try
    {
        catalog.groups = expand_uncore_groups(catalog.groups, metadata);
    }
    catch (const FormatError& e)
    {
        throw FormatError(source, e.what());
    }
    catalog.uncollectable = uncollectable.names();

    Log::debug() << "loaded " << catalog.groups.size() << " event groups from "
                 << source.string();
    return catalog;
}

EventCatalog load_arm_event_groups(const CatalogSource& source,
                                   const platform::Metadata& metadata, CollectionScope scope)
{
    std::filesystem::path dir;
    if (source.override_path.has_value())
    {
        dir = *source.override_path;

        std::error_code ec;
        auto status = std::filesystem::status(dir, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw ResourceError(dir, "Failed to stat event definition override");
        }
        // ARM catalogs come as a directory of JSON files
        if (!std::filesystem::is_directory(status))
        {
            throw ResourceError(dir, "ARM event definition override is not a directory");
        }
    }
    else
    {
        dir = resources::arm_catalog_dir(source.resource_root, resources::Kind::EVENTS, metadata);
    }

    EventCatalog catalog;
    NameSet uncollectable;

    for (const auto& file : list_files(dir, ".json"))
    {
        std::vector<EventDefinition> events;
        try
        {
            events = read_arm_event_file(file);
        }
        catch (const Error& e)
        {
            Log::warn() << "Skipping ARM event file " << file.string() << ": " << e.what();
            continue;
        }

        GroupDefinition group;
        for (auto& event : events)
        {
            if (is_collectable_event(event, metadata, scope))
            {
                group.emplace_back(std::move(event));
            }
            else
            {
                Log::debug() << "Event not collectable on target: " << event.name;
                uncollectable.add(event.name);
            }
        }

        if (group.empty())
        {
            Log::warn() << "No collectable ARM events in file " << file.string();
            continue;
        }
        catalog.groups.emplace_back(std::move(group));
    }

    catalog.uncollectable = uncollectable.names();
    return catalog;
}

} // namespace events
} // namespace pmucat
