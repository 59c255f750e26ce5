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

#include <nitro/log/log.hpp>

#include <nitro/log/sink/stderr_mt.hpp>

#include <nitro/log/attribute/message.hpp>
#include <nitro/log/attribute/pid.hpp>
#include <nitro/log/attribute/severity.hpp>
#include <nitro/log/attribute/timestamp.hpp>

#include <nitro/log/filter/severity_filter.hpp>

#include <algorithm>
#include <array>
#include <sstream>
#include <string>

#include <cstddef>

namespace pmucat
{
namespace logging
{

    using Record = nitro::log::record<nitro::log::message_attribute,
                                      nitro::log::timestamp_attribute,
                                      nitro::log::severity_attribute, nitro::log::pid_attribute>;

    // pmucat[<pid>] <time since epoch> <severity>: <message>
    template <typename R>
    class CatalogLogFormatter
    {
    public:
        std::string format(R& r)
        {
            std::stringstream s;

            s << "pmucat[" << r.pid() << "] " << r.timestamp().count() << " " << r.severity()
              << ": " << r.message();

            return s.str();
        }
    };

    template <typename R>
    using CatalogFilter = nitro::log::filter::severity_filter<R>;

    using Logging = nitro::log::logger<Record, CatalogLogFormatter, nitro::log::sink::stderr_mt,
                                       CatalogFilter>;

    inline void set_min_severity_level(nitro::log::severity_level sev)
    {
        CatalogFilter<Record>::set_severity(sev);
    }

    /**
     * Maps the number of -v flags to a severity, -q lowers it to errors only.
     * Quiet is ignored when verbose output is requested as well.
     */
    inline nitro::log::severity_level severity_for(std::size_t verbose, bool quiet)
    {
        using sl = nitro::log::severity_level;
        static const std::array<sl, 4> levels = { sl::warn, sl::info, sl::debug, sl::trace };

        if (verbose == 0)
        {
            return quiet ? sl::error : sl::warn;
        }
        return levels[std::min(verbose, levels.size() - 1)];
    }

} // namespace logging

using Log = logging::Logging;
} // namespace pmucat
