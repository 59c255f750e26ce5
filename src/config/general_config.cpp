#include <pmucat/config/general_config.hpp>

#include <pmucat/build_config.hpp>
#include <pmucat/log.hpp>
#include <pmucat/version.hpp>

#include <nitro/log/severity.hpp>
#include <nitro/options/arguments.hpp>
#include <nitro/options/parser.hpp>
#include <nlohmann/json.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>
#include <vector>

#include <cstdlib>

namespace pmucat
{

namespace
{
void print_version()
{
    // clang-format off
    std::cout << "pmucat " << pmucat::version() << " - PMU event and metric catalogs\n"
              << "Copyright (C) " PMUCAT_COPYRIGHT_YEAR " Technische Universitaet Dresden, Germany\n"
              << "License GPLv3+: GNU GPL version 3 or later <http://gnu.org/licenses/gpl.html>\n"
              << "Packaged catalogs: " PMUCAT_RESOURCE_DIR "\n";
    // clang-format on
}
} // namespace

GeneralConfig::GeneralConfig(nitro::options::arguments& arguments, int argc, const char** argv)
: verbosity(arguments.given("verbose")),
  quiet(arguments.given("quiet") && verbosity == 0), dump_config(arguments.given("dump-config")),
  list_uncollectable(arguments.given("list-uncollectable")),
  list_metrics(arguments.given("list-metrics"))
{
    std::vector<std::string> args(argv, argv + argc);
    command_line = fmt::format("{}", fmt::join(args, " "));
}

void GeneralConfig::apply_verbosity(nitro::options::arguments& arguments)
{
    const auto verbose = static_cast<std::size_t>(arguments.given("verbose"));
    const bool quiet = arguments.given("quiet");

    logging::set_min_severity_level(logging::severity_for(verbose, quiet));

    if (quiet && verbose > 0)
    {
        Log::warn() << "Both --quiet and --verbose given, ignoring --quiet.";
    }
    if (verbose > 0)
    {
        Log::info() << "Log level raised by " << verbose << " step(s) above 'warn'";
    }
}

void GeneralConfig::add_parser(nitro::options::parser& parser)
{
    auto& general_options = parser.group("General options");

    general_options.toggle("help", "Show this help message.").short_name("h");
    general_options.toggle("version", "Print version information.").short_name("V");
    general_options.toggle("dump-config", "Print the effective configuration as JSON and exit.");

    general_options.toggle("quiet", "Only log errors.").short_name("q");
    general_options
        .toggle("verbose", "Log more details, repeat for debug (-vv) and trace (-vvv) output.")
        .short_name("v");

    general_options.toggle("list-uncollectable",
                           "Also list the catalog events that the target can not count.");
    general_options.toggle("list-metrics", "List the selected metrics with descriptions and exit.")
        .short_name("l");
}

void GeneralConfig::handle_print_options(nitro::options::arguments& arguments)
{
    if (arguments.given("version"))
    {
        print_version();
        std::exit(EXIT_SUCCESS);
    }
}

void to_json(nlohmann::json& j, const GeneralConfig& config)
{
    j = nlohmann::json{ { "verbosity", config.verbosity },
                        { "quiet", config.quiet },
                        { "list_uncollectable", config.list_uncollectable },
                        { "list_metrics", config.list_metrics },
                        { "command_line", config.command_line } };
}
} // namespace pmucat
