#include "ThreatRecord.hpp"

#include "RemediationResult.hpp"

#include <cmath>
#include <set>

namespace {
constexpr int kMaxExtraDepth = 16;

[[noreturn]] void ThrowInputError(const std::string& message) {
    throw RemediationResultException(RemediationResultCode::INPUT_INVALID, message);
}

void ValidateExtraFields(const ExtraFields& fields, const std::string& scope, int depth) {
    if (depth > kMaxExtraDepth) {
        ThrowInputError("additional_info nesting exceeds " + std::to_string(kMaxExtraDepth) + " levels");
    }

    std::set<std::string> seen;
    for (const auto& field : fields) {
        if (!seen.insert(field.first).second) {
            ThrowInputError("duplicate additional_info key '" + scope + field.first + "'");
        }

        if (field.second.IsFields()) {
            ValidateExtraFields(std::get<ExtraFields>(field.second.value), scope + field.first + ".", depth + 1);
        }
    }
}

nlohmann::ordered_json ExtraToJson(const ExtraFields& fields, const std::string& scope) {
    auto out = nlohmann::ordered_json::object();

    for (const auto& field : fields) {
        const auto& value = field.second.value;
        if (std::holds_alternative<std::nullptr_t>(value)) {
            out[field.first] = nullptr;
        } else if (const auto* text = std::get_if<std::string>(&value)) {
            out[field.first] = *text;
        } else if (const auto* integer = std::get_if<int64_t>(&value)) {
            out[field.first] = *integer;
        } else if (const auto* unsignedInteger = std::get_if<uint64_t>(&value)) {
            out[field.first] = *unsignedInteger;
        } else if (const auto* number = std::get_if<double>(&value)) {
            if (!std::isfinite(*number)) {
                ThrowInputError("additional_info value '" + scope + field.first + "' is not a finite number");
            }
            out[field.first] = *number;
        } else if (const auto* flag = std::get_if<bool>(&value)) {
            out[field.first] = *flag;
        } else {
            out[field.first] = ExtraToJson(std::get<ExtraFields>(value), scope + field.first + ".");
        }
    }

    return out;
}

ExtraFields ExtraFromJson(const nlohmann::ordered_json& json, const std::string& scope, int depth) {
    if (depth > kMaxExtraDepth) {
        ThrowInputError("additional_info nesting exceeds " + std::to_string(kMaxExtraDepth) + " levels");
    }

    ExtraFields fields;
    for (const auto& item : json.items()) {
        const auto& value = item.value();
        const auto name = scope + item.key();

        if (value.is_null()) {
            fields.emplace_back(item.key(), nullptr);
        } else if (value.is_string()) {
            fields.emplace_back(item.key(), value.get<std::string>());
        } else if (value.is_boolean()) {
            fields.emplace_back(item.key(), value.get<bool>());
        } else if (value.is_number_unsigned()) {
            fields.emplace_back(item.key(), value.get<uint64_t>());
        } else if (value.is_number_integer()) {
            fields.emplace_back(item.key(), value.get<int64_t>());
        } else if (value.is_number()) {
            fields.emplace_back(item.key(), value.get<double>());
        } else if (value.is_object()) {
            fields.emplace_back(item.key(), ExtraFromJson(value, name + ".", depth + 1));
        } else {
            ThrowInputError("additional_info value '" + name
                + "' must be null, a string, number, boolean or object");
        }
    }

    return fields;
}

std::optional<std::string> OptionalText(const nlohmann::ordered_json& json, const char* key) {
    auto iter = json.find(key);
    if (iter == json.end() || iter->is_null()) {
        return std::nullopt;
    }
    if (!iter->is_string()) {
        ThrowInputError(std::string{"threat field '"} + key + "' must be a string");
    }

    return iter->get<std::string>();
}

nlohmann::ordered_json OptionalToJson(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

void ValidateThreatRecord(const ThreatRecord& threat) {
    if (threat.id.empty()) {
        ThrowInputError("threat_id is required");
    }

    ValidateExtraFields(threat.extra, "", 1);
}

nlohmann::ordered_json ToJson(const ThreatRecord& threat) {
    nlohmann::ordered_json json;
    json["threat_id"] = threat.id;
    json["file_path"] = OptionalToJson(threat.path);
    json["sha256"] = OptionalToJson(threat.hash);
    json["description"] = OptionalToJson(threat.description);

    if (threat.extra.empty()) {
        json["additional_info"] = nullptr;
    } else {
        json["additional_info"] = ExtraToJson(threat.extra, "");
    }

    return json;
}

ThreatRecord ThreatRecordFromJson(const nlohmann::ordered_json& json) {
    if (!json.is_object()) {
        ThrowInputError("threat must be a JSON object");
    }

    ThreatRecord threat;

    auto id = json.find("threat_id");
    if (id == json.end() || !id->is_string()) {
        ThrowInputError("threat_id is required and must be a string");
    }
    threat.id = id->get<std::string>();

    threat.path = OptionalText(json, "file_path");
    threat.hash = OptionalText(json, "sha256");
    threat.description = OptionalText(json, "description");

    auto extra = json.find("additional_info");
    if (extra != json.end() && !extra->is_null()) {
        if (!extra->is_object()) {
            ThrowInputError("additional_info must be a JSON object");
        }
        threat.extra = ExtraFromJson(*extra, "", 1);
    }

    ValidateThreatRecord(threat);

    return threat;
}
