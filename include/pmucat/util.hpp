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

#include <filesystem>
#include <string>
#include <vector>

namespace pmucat
{

/**
 * reads a whole file
 * @throws ResourceError if the file can not be opened or read
 */
std::string read_file(const std::filesystem::path& path);

/**
 * regular files in dir with a case-insensitive extension match, sorted by file name
 * @throws ResourceError if dir can not be listed
 */
std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir,
                                              const std::string& extension);

} // namespace pmucat
