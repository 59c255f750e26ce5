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

#include <pmucat/log.hpp>

#include <nitro/options/parser.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <sstream>

#include <cstdlib>

namespace pmucat
{
static std::optional<Config> instance = std::nullopt;

const Config& config()
{
    return *instance;
}

Config::Config(nitro::options::arguments& arguments, int argc, const char** argv)
: general(arguments, argc, argv), catalog(arguments)
{
}

void parse_program_options(int argc, const char** argv)
{
    std::stringstream description;
    description << "PMU event and metric catalog processing" << std::endl << std::endl;
    description << "  " << argv[0] << " [options] --metadata FILE\n";

    nitro::options::parser parser("pmucat", description.str());

    GeneralConfig::add_parser(parser);
    CatalogConfig::add_parser(parser);

    nitro::options::arguments arguments;
    try
    {
        arguments = parser.parse(argc, argv);
    }
    catch (const nitro::options::parsing_error& e)
    {
        std::cerr << e.what() << '\n';
        parser.usage();
        std::exit(EXIT_FAILURE);
    }

    GeneralConfig::apply_verbosity(arguments);

    if (arguments.given("help"))
    {
        parser.usage();
        std::exit(EXIT_SUCCESS);
    }
    GeneralConfig::handle_print_options(arguments);

    Config config(arguments, argc, argv);

    if (config.general.dump_config)
    {
        std::cout << nlohmann::json(config).dump(4) << std::endl;
        std::exit(EXIT_SUCCESS);
    }

    config.catalog.check();

    instance = std::move(config);
}

void to_json(nlohmann::json& j, const Config& config)
{
    j = nlohmann::json({ { "general", config.general }, { "catalog", config.catalog } });
}
} // namespace pmucat
