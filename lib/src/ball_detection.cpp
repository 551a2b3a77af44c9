#include "ball_detection.hpp"

#include <cstdio>

std::string escapeJsonString(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

std::string formatErrorJson(const std::string& message) {
    return "{\"error\": \"" + escapeJsonString(message) + "\"}";
}

std::string formatDetectionResultJson(const DetectionResult& result) {
    std::string json = "{\"balls\": [";
    for (size_t i = 0; i < result.balls.size(); ++i) {
        const auto& ball = result.balls[i];
        json += "{";
        json += "\"id\": \"" + escapeJsonString(ball.id) + "\", ";
        json += "\"x\": " + std::to_string(ball.position.x) + ", ";
        json += "\"y\": " + std::to_string(ball.position.y) + ", ";
        json += "\"radius\": " + std::to_string(ball.radius) + ", ";
        json += "\"confidence\": " + std::to_string(ball.confidence) + ", ";
        json += "\"ball_type\": \"" + ballTypeToString(ball.ballType) + "\", ";
        json += "\"color\": \"" + escapeJsonString(ball.color) + "\", ";
        json += "\"number\": " + (ball.number ? std::to_string(*ball.number) : "null");
        json += "}";
        if (i < result.balls.size() - 1) {
            json += ", ";
        }
    }
    json += "], ";
    json += "\"image_width\": " + std::to_string(result.imageWidth) + ", ";
    json += "\"image_height\": " + std::to_string(result.imageHeight) + ", ";
    json += "\"timestamp\": " + std::to_string(result.timestamp) + ", ";
    json += "\"processing_time_ms\": " + std::to_string(result.processingTimeMs);
    json += "}";
    return json;
}
