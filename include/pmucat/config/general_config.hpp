#pragma once

#include <nitro/options/arguments.hpp>
#include <nitro/options/parser.hpp>
#include <nlohmann/json_fwd.hpp>

#include <string>

#include <cstddef>

namespace pmucat
{

struct GeneralConfig
{
    static void add_parser(nitro::options::parser& parser);

    // needs to happen before anything is logged
    static void apply_verbosity(nitro::options::arguments& arguments);

    // options that print something and exit
    static void handle_print_options(nitro::options::arguments& arguments);

    GeneralConfig(nitro::options::arguments& arguments, int argc, const char** argv);

    std::size_t verbosity = 0;
    bool quiet = false;
    bool dump_config = false;
    bool list_uncollectable = false;
    bool list_metrics = false;
    std::string command_line;
};

void to_json(nlohmann::json& j, const GeneralConfig& config);
} // namespace pmucat
