#include "MatchingSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>

namespace config
{

namespace
{

double clampUnit(double value, double fallback)
{
    if (!std::isfinite(value))
        return fallback;
    return std::clamp(value, 0.0, 1.0);
}

} // namespace

void MatchingSettings::clamp()
{
    const MatchingSettings defaults;
    fuzzy_threshold = clampUnit(fuzzy_threshold, defaults.fuzzy_threshold);
    length_ratio_floor = clampUnit(length_ratio_floor, defaults.length_ratio_floor);
    // Winkler's bound: prefix (max 4) * scale must stay <= 1
    prefix_scale = std::isfinite(prefix_scale) ? std::clamp(prefix_scale, 0.0, 0.25) : defaults.prefix_scale;
    max_results = std::clamp<std::size_t>(max_results, 1, 1000);

    weight_levenshtein = std::isfinite(weight_levenshtein) ? std::max(weight_levenshtein, 0.0) : 0.0;
    weight_jaro = std::isfinite(weight_jaro) ? std::max(weight_jaro, 0.0) : 0.0;
    weight_jaro_winkler = std::isfinite(weight_jaro_winkler) ? std::max(weight_jaro_winkler, 0.0) : 0.0;
    if (weight_levenshtein + weight_jaro + weight_jaro_winkler <= 0.0)
    {
        weight_levenshtein = defaults.weight_levenshtein;
        weight_jaro = defaults.weight_jaro;
        weight_jaro_winkler = defaults.weight_jaro_winkler;
    }

    if (similarity::algorithmName(similarity::algorithmFromName(algorithm)) != algorithm)
    {
        PLOG_WARNING << "Unknown matching algorithm '" << algorithm << "', using combined";
        algorithm = "combined";
    }
}

similarity::MatcherOptions MatchingSettings::toMatcherOptions() const
{
    similarity::MatcherOptions options;
    options.weights = similarity::SimilarityWeights{ weight_levenshtein, weight_jaro, weight_jaro_winkler };
    options.prefixScale = prefix_scale;
    options.lengthRatioFloor = length_ratio_floor;
    options.algorithm = similarity::algorithmFromName(algorithm);
    options.maxResults = max_results;
    return options;
}

void MatchingSettings::applyTo(lookup::MatchConfig& config) const
{
    config.fuzzyThreshold = fuzzy_threshold;
    config.algorithm = similarity::algorithmFromName(algorithm);
}

void MatchingSettings::deserialize(const toml::table& section)
{
    applyDefaults();

    if (auto v = section["fuzzy_threshold"].value<double>())
        fuzzy_threshold = *v;
    if (auto v = section["max_results"].value<int64_t>())
        max_results = *v > 0 ? static_cast<std::size_t>(*v) : 1;
    if (auto v = section["length_ratio_floor"].value<double>())
        length_ratio_floor = *v;
    if (auto v = section["prefix_scale"].value<double>())
        prefix_scale = *v;
    if (auto v = section["algorithm"].value<std::string>())
        algorithm = *v;

    if (auto weights = section["weights"].as_table())
    {
        if (auto v = (*weights)["levenshtein"].value<double>())
            weight_levenshtein = *v;
        if (auto v = (*weights)["jaro"].value<double>())
            weight_jaro = *v;
        if (auto v = (*weights)["jaro_winkler"].value<double>())
            weight_jaro_winkler = *v;
    }

    clamp();
}

toml::table MatchingSettings::serialize() const
{
    toml::table weights;
    weights.insert("levenshtein", weight_levenshtein);
    weights.insert("jaro", weight_jaro);
    weights.insert("jaro_winkler", weight_jaro_winkler);

    toml::table table;
    table.insert("fuzzy_threshold", fuzzy_threshold);
    table.insert("max_results", static_cast<int64_t>(max_results));
    table.insert("length_ratio_floor", length_ratio_floor);
    table.insert("prefix_scale", prefix_scale);
    table.insert("algorithm", algorithm);
    table.insert("weights", std::move(weights));
    return table;
}

void MatchingSettings::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) { deserialize(section); };
    cb.save = [this]() -> toml::table { return serialize(); };

    config.registerTable("matching", std::move(cb),
                         { "fuzzy_threshold", "max_results", "length_ratio_floor", "prefix_scale", "algorithm",
                           "weights" });
}

} // namespace config
