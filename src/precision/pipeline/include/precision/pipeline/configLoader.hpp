#pragma once

#include "precision/core/config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>

namespace cutprec::precision::pipeline {

//! Load a JSON (.json) or YAML (.yaml, .yml) configuration and merge it over the defaults.
//! Without a path the defaults are returned.
//! \throws core::ConfigError for missing files, unsupported extensions, unknown keys, wrong types and invalid values.
core::AppConfig loadAppConfig(const std::optional<std::filesystem::path>& path);

//! Build a configuration from a (possibly partial) JSON document using snake_case keys.
//! \throws core::ConfigError like loadAppConfig.
core::AppConfig configFromJson(const nlohmann::json& document);

//! All sections with snake_case keys, as written into reports.
nlohmann::json configToJson(const core::AppConfig& config);

} // namespace cutprec::precision::pipeline
