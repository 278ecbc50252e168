#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct DecisionRecord {
    std::string threatId;
    std::string recommendation;
    bool destructive = false;
    bool approved = false;
    std::optional<std::string> notes;
    std::chrono::system_clock::time_point timestamp;
};

// One entry per submitted threat, in submission order.
using BatchReport = std::vector<DecisionRecord>;

// ISO-8601 UTC with millisecond precision, e.g. 2025-09-05T12:00:00.123Z
std::string FormatTimestamp(const std::chrono::system_clock::time_point& timestamp);

nlohmann::ordered_json ToJson(const DecisionRecord& record);
nlohmann::ordered_json ToJson(const BatchReport& report);
