#include <algorithm>
#include <cmath>
#include <core/upload/progress_normalizer.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>

using json = nlohmann::json;

namespace pipecdn::core {

namespace {

std::optional<std::uint64_t> ReadByteCount(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer()) {
        auto value = it->get<std::int64_t>();
        if (value < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    auto value = it->get<double>();
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

std::optional<double> ReadNumber(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

// Strings are taken as-is and numbers in their JSON form. Booleans, objects
// and arrays count as absent, so {"error": false} is not an error.
std::optional<std::string> ReadText(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !(it->is_string() || it->is_number())) {
        return std::nullopt;
    }
    std::string text = it->is_string() ? it->get<std::string>() : it->dump();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

} // namespace

std::optional<ProgressEvent> ProgressNormalizer::Parse(const json& payload) {
    if (payload.is_number()) {
        ProgressEvent event;
        event.percent = payload.get<double>();
        return event;
    }
    if (!payload.is_object()) {
        spdlog::warn("Ignoring progress payload of unexpected type: {}", payload.type_name());
        return std::nullopt;
    }

    try {
        ProgressEvent event;
        event.id = ReadText(payload, "id");
        event.percent = ReadNumber(payload, "percent");
        event.uploaded = ReadByteCount(payload, "uploaded");
        event.total = ReadByteCount(payload, "total");
        if (auto it = payload.find("completed"); it != payload.end() && it->is_boolean()) {
            event.completed = it->get<bool>();
        }
        event.status = ReadText(payload, "status");
        event.message = ReadText(payload, "message");
        event.error = ReadText(payload, "error");
        return event;
    } catch (const json::exception& e) {
        spdlog::warn("Failed to parse progress payload: {}", e.what());
        return std::nullopt;
    }
}

NormalizedProgress ProgressNormalizer::Normalize(const ProgressEvent& event,
                                                 std::optional<std::uint64_t> cumulative_bytes,
                                                 std::uint64_t known_total) {
    NormalizedProgress normalized;
    normalized.uploaded = cumulative_bytes ? cumulative_bytes : event.uploaded;
    normalized.total = std::max(known_total, event.total.value_or(0));

    if (normalized.uploaded && normalized.total > 0) {
        double percent = static_cast<double>(*normalized.uploaded)
                         / static_cast<double>(normalized.total) * 100.0;
        normalized.percent = std::clamp(percent, 0.0, 100.0);
    } else if (event.percent) {
        normalized.percent = ScaleReportedPercent(*event.percent);
    }
    return normalized;
}

std::optional<double> ProgressNormalizer::ScaleReportedPercent(double reported) {
    if (!std::isfinite(reported) || reported < 0.0) {
        return std::nullopt;
    }
    double percent = reported <= 1.0 ? reported * 100.0 : reported;
    return std::min(percent, 100.0);
}

} // namespace pipecdn::core
