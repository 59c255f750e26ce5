#pragma once

#include <pmucat/collection_scope.hpp>
#include <pmucat/resources.hpp>

#include <nitro/options/arguments.hpp>
#include <nitro/options/parser.hpp>
#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pmucat
{

struct CatalogConfig
{
    static void add_parser(nitro::options::parser& parser);
    CatalogConfig(nitro::options::arguments& arguments);

    void check() const;

    CatalogSource event_source() const;
    CatalogSource metric_source() const;

    std::filesystem::path metadata_path;
    std::filesystem::path resource_dir;
    std::optional<std::filesystem::path> events_override = std::nullopt;
    std::optional<std::filesystem::path> metrics_override = std::nullopt;
    CollectionScope scope = CollectionScope::SYSTEM;
    // empty selects every metric of the catalog
    std::vector<std::string> metrics;
};

void to_json(nlohmann::json& j, const CatalogConfig& config);
} // namespace pmucat
