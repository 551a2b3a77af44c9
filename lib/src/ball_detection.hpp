#pragma once

#include <string>

#include "ball_types.hpp"

std::string formatDetectionResultJson(const DetectionResult& result);
std::string formatErrorJson(const std::string& message);
std::string escapeJsonString(const std::string& text);
