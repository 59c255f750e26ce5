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

/**
 * \file pmucat/io.hpp
 * \brief Listings printed by the pmucat front end
 *
 * A listing is a titled table of names, each with an optional description. Descriptions may
 * span several lines, continuation lines are aligned below the first one.
 */

#pragma once

#include <pmucat/metrics/metric_definition.hpp>

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace pmucat
{
namespace io
{

class Listing
{
public:
    explicit Listing(std::string title) : title_(std::move(title))
    {
    }

    void add(const std::string& name, const std::string& description = "")
    {
        entries_.emplace_back(name, description);
    }

    bool empty() const
    {
        return entries_.empty();
    }

    friend std::ostream& operator<<(std::ostream& os, const Listing& listing)
    {
        os << "\n" << listing.title_ << " (" << listing.entries_.size() << "):\n\n";

        if (listing.entries_.empty())
        {
            os << "  (none)\n\n";
            return os;
        }

        std::size_t width = 0;
        for (const auto& entry : listing.entries_)
        {
            width = std::max(width, entry.first.size());
        }

        for (const auto& entry : listing.entries_)
        {
            std::vector<std::string> lines;
            boost::split(lines, entry.second, boost::is_any_of("\n"));

            bool first = true;
            for (auto& line : lines)
            {
                boost::trim_right(line);
                const std::string name = first ? entry.first : "";
                if (line.empty())
                {
                    os << "  " << name << '\n';
                }
                else
                {
                    os << "  " << std::left << std::setw(width + 2) << name << line << '\n';
                }
                first = false;
            }
        }
        os << '\n';
        return os;
    }

private:
    std::string title_;
    std::vector<std::pair<std::string, std::string>> entries_;
};

inline Listing metric_listing(const std::vector<metrics::MetricDefinition>& metrics)
{
    Listing listing("Metrics");
    for (const auto& metric : metrics)
    {
        listing.add(metric.name, metric.description);
    }
    return listing;
}

inline Listing name_listing(const std::string& title, const std::vector<std::string>& names)
{
    Listing listing(title);
    for (const auto& name : names)
    {
        listing.add(name);
    }
    return listing;
}

} // namespace io
} // namespace pmucat
