#pragma once

#include "../lookup/LookupProcessor.hpp"

#include <cstddef>

#include <toml++/toml.h>

namespace config
{

class ConfigManager;

/// [lookup] section: suggestion and review hand-off limits.
struct LookupSettings
{
    std::size_t max_suggestions;
    double review_confidence;
    std::size_t max_review_matches;
    bool fuzzy_enabled;

    LookupSettings() { applyDefaults(); }

    void applyDefaults()
    {
        max_suggestions = 3;
        review_confidence = 0.7;
        max_review_matches = 100;
        fuzzy_enabled = true;
    }

    void clamp();

    void applyTo(lookup::MatchConfig& config) const;
    lookup::ProcessingOptions toProcessingOptions() const;

    void deserialize(const toml::table& section);
    toml::table serialize() const;

    void registerConfigHandler(ConfigManager& config);
};

} // namespace config
