#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct ExtraValue;

// Insertion-ordered; keys are unique within one level.
using ExtraFields = std::vector<std::pair<std::string, ExtraValue>>;

// JSON integers keep their integer alternative so they reach the prompt and
// the audit log unchanged; null is kept as null.
struct ExtraValue {
    using Storage = std::variant<std::nullptr_t, std::string, int64_t, uint64_t, double, bool, ExtraFields>;

    ExtraValue(std::nullptr_t)
        : value{std::in_place_type<std::nullptr_t>, nullptr} {}
    ExtraValue(std::string text)
        : value{std::move(text)} {}
    ExtraValue(const char* text)
        : value{std::string{text}} {}
    ExtraValue(double number)
        : value{number} {}
    ExtraValue(int number)
        : value{static_cast<int64_t>(number)} {}
    ExtraValue(int64_t number)
        : value{number} {}
    ExtraValue(uint64_t number)
        : value{number} {}
    ExtraValue(bool flag)
        : value{flag} {}
    ExtraValue(ExtraFields fields)
        : value{std::move(fields)} {}

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsText() const { return std::holds_alternative<std::string>(value); }
    bool IsInteger() const {
        return std::holds_alternative<int64_t>(value) || std::holds_alternative<uint64_t>(value);
    }
    bool IsNumber() const { return std::holds_alternative<double>(value); }
    bool IsFlag() const { return std::holds_alternative<bool>(value); }
    bool IsFields() const { return std::holds_alternative<ExtraFields>(value); }

    Storage value;
};

struct ThreatRecord {
    std::string id;
    std::optional<std::string> path;
    std::optional<std::string> hash;
    std::optional<std::string> description;
    ExtraFields extra;
};

// Throws RemediationResultException(INPUT_INVALID) for an empty id or a
// duplicated extra key.
void ValidateThreatRecord(const ThreatRecord& threat);

// Wire form: {"threat_id", "file_path", "sha256", "description",
// "additional_info"}. Absent optionals serialize as null. Throws
// RemediationResultException(INPUT_INVALID) when a value has no JSON form.
nlohmann::ordered_json ToJson(const ThreatRecord& threat);

ThreatRecord ThreatRecordFromJson(const nlohmann::ordered_json& json);
