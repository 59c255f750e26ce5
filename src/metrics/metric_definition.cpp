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

#include <pmucat/metrics/metric_definition.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>
#include <pmucat/metrics/conditional.hpp>
#include <pmucat/util.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <system_error>

namespace
{
std::vector<pmucat::metrics::MetricDefinition>
read_arm_metric_file(const std::filesystem::path& path)
{
    auto content = pmucat::read_file(path);

    std::vector<pmucat::metrics::MetricDefinition> metrics;
    try
    {
        auto records = nlohmann::json::parse(content);
        if (!records.is_array())
        {
            throw pmucat::FormatError(path, "expected a JSON array of metrics");
        }

        for (const auto& record : records)
        {
            if (!record.is_object() || !record.contains("MetricName") ||
                !record.contains("MetricExpr"))
            {
                pmucat::Log::debug() << "Ignoring ARM metric record without name or expression in "
                                     << path.string();
                continue;
            }

            pmucat::metrics::MetricDefinition metric;
            metric.name = record.at("MetricName").get<std::string>();
            metric.expression = record.at("MetricExpr").get<std::string>();
            if (record.contains("BriefDescription"))
            {
                metric.description = record.at("BriefDescription").get<std::string>();
            }
            else
            {
                metric.description = record.value("PublicDescription", "");
            }
            metrics.emplace_back(std::move(metric));
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw pmucat::FormatError(path, e.what());
    }
    return metrics;
}
} // namespace

namespace pmucat
{
namespace metrics
{

std::vector<MetricDefinition> load_metric_definitions(const CatalogSource& source,
                                                      const std::vector<std::string>& selected,
                                                      const platform::Metadata& metadata)
{
    std::vector<MetricDefinition> metrics;
    if (metadata.is_arm())
    {
        metrics = load_arm_metric_definitions(source, metadata);
    }
    else
    {
        metrics = load_x86_metric_definitions(source, metadata);
    }

    for (auto& metric : metrics)
    {
        metric.expression = transform_conditional(metric.expression);
    }

    return select_metrics(std::move(metrics), selected);
}

std::vector<MetricDefinition> load_x86_metric_definitions(const CatalogSource& source,
                                                          const platform::Metadata& metadata)
{
    auto path = source.override_path.value_or(resources::x86_catalog_file(
        source.resource_root, resources::Kind::METRICS, metadata, ".json"));

    auto content = read_file(path);
    try
    {
        auto metrics = nlohmann::json::parse(content).get<std::vector<MetricDefinition>>();
        Log::debug() << "loaded " << metrics.size() << " metric definitions from "
                     << path.string();
        return metrics;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw FormatError(path, e.what());
    }
}

std::vector<MetricDefinition> load_arm_metric_definitions(const CatalogSource& source,
                                                          const platform::Metadata& metadata)
{
    std::filesystem::path dir;
    if (source.override_path.has_value())
    {
        dir = *source.override_path;

        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw ResourceError(dir, "ARM metric definition override is not a directory");
        }
    }
    else
    {
        dir = resources::arm_catalog_dir(source.resource_root, resources::Kind::METRICS, metadata);
    }

    std::vector<MetricDefinition> metrics;
    for (const auto& file : list_files(dir, ".json"))
    {
        try
        {
            auto file_metrics = read_arm_metric_file(file);
            std::move(file_metrics.begin(), file_metrics.end(), std::back_inserter(metrics));
        }
        catch (const Error& e)
        {
            Log::warn() << "Skipping ARM metric file " << file.string() << ": " << e.what();
        }
    }
    return metrics;
}

std::vector<MetricDefinition> select_metrics(std::vector<MetricDefinition> metrics,
                                             const std::vector<std::string>& selected)
{
    if (selected.empty())
    {
        return metrics;
    }

    std::set<std::string> wanted(selected.begin(), selected.end());
    std::vector<MetricDefinition> result;
    for (auto& metric : metrics)
    {
        if (wanted.erase(metric.name) > 0)
        {
            result.emplace_back(std::move(metric));
        }
    }

    if (!wanted.empty())
    {
        throw LookupError(fmt::format("unknown metrics: {}", fmt::join(wanted, ", ")));
    }
    return result;
}

void to_json(nlohmann::json& j, const MetricDefinition& metric)
{
    j = nlohmann::json{ { "name", metric.name },
                        { "expression", metric.expression },
                        { "description", metric.description } };
}

void from_json(const nlohmann::json& j, MetricDefinition& metric)
{
    j.at("name").get_to(metric.name);
    j.at("expression").get_to(metric.expression);
    metric.description = j.value("description", "");
}

} // namespace metrics
} // namespace pmucat
