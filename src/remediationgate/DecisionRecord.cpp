#include "DecisionRecord.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string FormatTimestamp(const std::chrono::system_clock::time_point& timestamp) {
    using namespace std::chrono;

    const auto wholeSeconds = floor<seconds>(timestamp);
    const auto millis = duration_cast<milliseconds>(timestamp - wholeSeconds).count();

    const std::time_t time = system_clock::to_time_t(wholeSeconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
        << 'Z';
    return out.str();
}

nlohmann::ordered_json ToJson(const DecisionRecord& record) {
    nlohmann::ordered_json json;
    json["threat_id"] = record.threatId;
    json["recommendation"] = record.recommendation;
    json["destructive"] = record.destructive;
    json["approved"] = record.approved;
    if (record.notes) {
        json["notes"] = *record.notes;
    } else {
        json["notes"] = nullptr;
    }
    json["timestamp"] = FormatTimestamp(record.timestamp);
    return json;
}

nlohmann::ordered_json ToJson(const BatchReport& report) {
    auto entries = nlohmann::ordered_json::array();
    for (const auto& record : report) {
        entries.push_back(ToJson(record));
    }

    nlohmann::ordered_json json;
    json["report"] = std::move(entries);
    return json;
}
