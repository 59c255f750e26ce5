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

#include <pmucat/config/catalog_config.hpp>
#include <pmucat/config/general_config.hpp>

#include <nitro/options/arguments.hpp>
#include <nlohmann/json_fwd.hpp>

namespace pmucat
{
struct Config
{
    Config(nitro::options::arguments& arguments, int argc, const char** argv);

    GeneralConfig general;
    CatalogConfig catalog;
};

const Config& config();

void parse_program_options(int argc, const char** argv);

void to_json(nlohmann::json& j, const Config& config);
} // namespace pmucat
