#pragma once

#include "../lookup/LookupTypes.hpp"
#include "../similarity/FuzzyMatcher.hpp"

#include <cstddef>
#include <string>

#include <toml++/toml.h>

namespace config
{

class ConfigManager;

/// [matching] section: scoring parameters shared by all lookups.
struct MatchingSettings
{
    double fuzzy_threshold;
    std::size_t max_results;
    double length_ratio_floor;
    double prefix_scale;
    double weight_levenshtein;
    double weight_jaro;
    double weight_jaro_winkler;
    std::string algorithm;

    MatchingSettings() { applyDefaults(); }

    void applyDefaults()
    {
        fuzzy_threshold = 0.6;
        max_results = 5;
        length_ratio_floor = 0.2;
        prefix_scale = 0.1;
        weight_levenshtein = 0.4;
        weight_jaro = 0.3;
        weight_jaro_winkler = 0.3;
        algorithm = "combined";
    }

    /// Pull out-of-range values back into their valid ranges.
    void clamp();

    similarity::MatcherOptions toMatcherOptions() const;

    /// Threshold and algorithm for a lookup column.
    void applyTo(lookup::MatchConfig& config) const;

    void deserialize(const toml::table& section);
    toml::table serialize() const;

    void registerConfigHandler(ConfigManager& config);
};

} // namespace config
