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

#include <pmucat/util.hpp>

#include <pmucat/error.hpp>
#include <pmucat/log.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pmucat
{

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        throw ResourceError(path, "Failed to open file");
    }

    std::stringstream content;
    content << stream.rdbuf();

    if (stream.bad())
    {
        throw ResourceError(path, "Failed to read file");
    }
    return content.str();
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir,
                                              const std::string& extension)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
    {
        throw ResourceError(dir, "Failed to read directory (" + ec.message() + ")");
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : it)
    {
        // use std::filesystem::path::string, otherwise the paths are formatted quoted
        const auto name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || !boost::iends_with(name, extension))
        {
            Log::trace() << "Skipping directory entry " << name;
            continue;
        }
        files.emplace_back(entry.path());
    }

    // directory order is unspecified, keep catalogs reproducible
    std::sort(files.begin(), files.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.filename() < rhs.filename(); });
    return files;
}

} // namespace pmucat
