#pragma once

#include <optional>
#include <string>

#include "detector_config.hpp"

/**
 * Build a DetectorConfig from a flat JSON object with snake_case keys. Keys that are absent
 * keep their defaults and unknown keys are ignored. The result is not validated.
 * @throws std::invalid_argument when a known key has a malformed value
 */
DetectorConfig parseDetectorConfigJson(const std::string& jsonStr);

// Raw value text for a top-level key: string contents without quotes, other values trimmed.
std::optional<std::string> findJsonValue(const std::string& jsonStr, const std::string& key);
