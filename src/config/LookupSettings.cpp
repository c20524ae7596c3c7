#include "LookupSettings.hpp"
#include "ConfigManager.hpp"

#include <algorithm>
#include <cmath>

namespace config
{

void LookupSettings::clamp()
{
    max_suggestions = std::min<std::size_t>(max_suggestions, 50);
    review_confidence = std::isfinite(review_confidence) ? std::clamp(review_confidence, 0.0, 1.0) : 0.7;
    max_review_matches = std::min<std::size_t>(max_review_matches, 100000);
}

void LookupSettings::applyTo(lookup::MatchConfig& config) const
{
    config.maxSuggestions = max_suggestions;
    config.fuzzyEnabled = fuzzy_enabled;
}

lookup::ProcessingOptions LookupSettings::toProcessingOptions() const
{
    lookup::ProcessingOptions options;
    options.minConfidence = review_confidence;
    options.maxFuzzyMatches = max_review_matches;
    return options;
}

void LookupSettings::deserialize(const toml::table& section)
{
    applyDefaults();

    if (auto v = section["max_suggestions"].value<int64_t>())
        max_suggestions = *v > 0 ? static_cast<std::size_t>(*v) : 0;
    if (auto v = section["review_confidence"].value<double>())
        review_confidence = *v;
    if (auto v = section["max_review_matches"].value<int64_t>())
        max_review_matches = *v > 0 ? static_cast<std::size_t>(*v) : 0;
    if (auto v = section["fuzzy_enabled"].value<bool>())
        fuzzy_enabled = *v;

    clamp();
}

toml::table LookupSettings::serialize() const
{
    toml::table table;
    table.insert("max_suggestions", static_cast<int64_t>(max_suggestions));
    table.insert("review_confidence", review_confidence);
    table.insert("max_review_matches", static_cast<int64_t>(max_review_matches));
    table.insert("fuzzy_enabled", fuzzy_enabled);
    return table;
}

void LookupSettings::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) { deserialize(section); };
    cb.save = [this]() -> toml::table { return serialize(); };

    config.registerTable("lookup", std::move(cb),
                         { "max_suggestions", "review_confidence", "max_review_matches", "fuzzy_enabled" });
}

} // namespace config
