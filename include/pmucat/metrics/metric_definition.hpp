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
#include <pmucat/resources.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pmucat
{
namespace metrics
{

struct MetricDefinition
{
    std::string name;
    // already rewritten into ternary form
    std::string expression;
    std::string description;
    // filled in by the expression compiler, empty after loading
    std::vector<std::string> variables;
};

/**
 * Loads the metric catalog for the target and keeps only the selected metrics, in catalog order.
 * An empty selection keeps all metrics.
 *
 * @throws LookupError if a selected metric is not in the catalog
 * @throws ConditionalSyntaxError if an expression uses a malformed conditional
 */
std::vector<MetricDefinition> load_metric_definitions(const CatalogSource& source,
                                                      const std::vector<std::string>& selected,
                                                      const platform::Metadata& metadata);

/**
 * JSON array of {"name", "expression", "description"} objects, one file per microarchitecture.
 * @throws ResourceError, FormatError
 */
std::vector<MetricDefinition> load_x86_metric_definitions(const CatalogSource& source,
                                                          const platform::Metadata& metadata);

/**
 * Directory of JSON files with {"MetricName", "MetricExpr", "BriefDescription"} records.
 * Unreadable files are skipped.
 */
std::vector<MetricDefinition> load_arm_metric_definitions(const CatalogSource& source,
                                                          const platform::Metadata& metadata);

std::vector<MetricDefinition> select_metrics(std::vector<MetricDefinition> metrics,
                                             const std::vector<std::string>& selected);

void to_json(nlohmann::json& j, const MetricDefinition& metric);
void from_json(const nlohmann::json& j, MetricDefinition& metric);

} // namespace metrics
} // namespace pmucat
