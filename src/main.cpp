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

#include <pmucat/config.hpp>
#include <pmucat/events/catalog.hpp>
#include <pmucat/io.hpp>
#include <pmucat/log.hpp>
#include <pmucat/metrics/metric_definition.hpp>
#include <pmucat/platform.hpp>

#include <iostream>

#include <cstdlib>

int main(int argc, const char** argv)
{
    try
    {
        pmucat::parse_program_options(argc, argv);
        const auto& config = pmucat::config();

        auto metadata = pmucat::platform::read_metadata(config.catalog.metadata_path);

        auto metrics = pmucat::metrics::load_metric_definitions(config.catalog.metric_source(),
                                                                config.catalog.metrics, metadata);
        if (config.general.list_metrics)
        {
            std::cout << pmucat::io::metric_listing(metrics);
            return EXIT_SUCCESS;
        }

        auto catalog = pmucat::events::load_event_groups(config.catalog.event_source(), metadata,
                                                         config.catalog.scope);

        std::cout << pmucat::events::format_event_groups(catalog.groups) << '\n';

        if (config.general.list_uncollectable)
        {
            std::cout << pmucat::io::name_listing("Uncollectable events", catalog.uncollectable);
        }

        for (const auto& metric : metrics)
        {
            std::cout << metric.name << " = " << metric.expression << '\n';
        }
    }
    catch (const std::exception& e)
    {
        pmucat::Log::fatal() << "Aborting: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
