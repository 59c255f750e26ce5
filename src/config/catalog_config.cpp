#include <pmucat/config/catalog_config.hpp>

#include <pmucat/build_config.hpp>
#include <pmucat/log.hpp>

#include <nitro/options/arguments.hpp>
#include <nitro/options/parser.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>

namespace pmucat
{
NLOHMANN_JSON_SERIALIZE_ENUM(CollectionScope, { { CollectionScope::SYSTEM, "system" },
                                                { CollectionScope::PROCESS, "process" },
                                                { CollectionScope::CGROUP, "cgroup" } })

CatalogConfig::CatalogConfig(nitro::options::arguments& arguments)
{
    if (arguments.provided("metadata"))
    {
        metadata_path = arguments.get("metadata");
    }
    resource_dir = arguments.get("resources");

    if (arguments.provided("events"))
    {
        events_override = arguments.get("events");
    }
    if (arguments.provided("metrics"))
    {
        metrics_override = arguments.get("metrics");
    }

    scope = scope_from_string(arguments.get("scope"));
    metrics = arguments.get_all("metric");
}

void CatalogConfig::add_parser(nitro::options::parser& parser)
{
    auto& catalog_options = parser.group("Catalog options");

    catalog_options
        .option("metadata", "JSON description of the target platform, as collected on the target.")
        .short_name("m")
        .metavar("FILE")
        .optional();

    catalog_options
        .option("scope", "Collection scope the events are selected for: system, process or cgroup.")
        .short_name("s")
        .default_value("system")
        .metavar("SCOPE");

    catalog_options.option("resources", "Root directory of the packaged event and metric catalogs.")
        .default_value(PMUCAT_RESOURCE_DIR)
        .env("PMUCAT_RESOURCE_DIR")
        .metavar("DIR");

    catalog_options
        .option("events", "Event catalog to use instead of the packaged one. A file on x86, a "
                          "directory of JSON files on ARM.")
        .short_name("e")
        .metavar("PATH")
        .optional();

    catalog_options
        .option("metrics", "Metric catalog to use instead of the packaged one. A file on x86, a "
                           "directory of JSON files on ARM.")
        .metavar("PATH")
        .optional();

    catalog_options
        .multi_option("metric", "Only load this metric (may be specified multiple times).")
        .short_name("M")
        .optional()
        .metavar("NAME");
}

void CatalogConfig::check() const
{
    if (metadata_path.empty())
    {
        Log::fatal() << "No platform metadata provided. You need to pass --metadata FILE.";
        std::exit(EXIT_FAILURE);
    }
}

CatalogSource CatalogConfig::event_source() const
{
    if (events_override)
    {
        return CatalogSource::overridden(resource_dir, *events_override);
    }
    return CatalogSource::packaged(resource_dir);
}

CatalogSource CatalogConfig::metric_source() const
{
    if (metrics_override)
    {
        return CatalogSource::overridden(resource_dir, *metrics_override);
    }
    return CatalogSource::packaged(resource_dir);
}

void to_json(nlohmann::json& j, const CatalogConfig& config)
{
    j = nlohmann::json({ { "metadata", config.metadata_path.string() },
                         { "resources", config.resource_dir.string() },
                         { "scope", config.scope },
                         { "metrics", config.metrics } });

    j["events_override"] =
        config.events_override ? nlohmann::json(config.events_override->string()) : nullptr;
    j["metrics_override"] =
        config.metrics_override ? nlohmann::json(config.metrics_override->string()) : nullptr;
}
} // namespace pmucat
