// output_format.cpp
#include "output_format.h"
#include "constants.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

bool parseOutputFormat(const std::string& name, OutputFormat& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "iso") {
        out = OutputFormat::ISO;
    } else if (lower == "unix") {
        out = OutputFormat::UNIX;
    } else if (lower == "unix-ms") {
        out = OutputFormat::UNIX_MS;
    } else if (lower == "json") {
        out = OutputFormat::JSON;
    } else {
        return false;
    }
    return true;
}

const char* outputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::ISO:     return "iso";
        case OutputFormat::UNIX:    return "unix";
        case OutputFormat::UNIX_MS: return "unix-ms";
        case OutputFormat::JSON:    return "json";
        default:                    return "unknown";
    }
}

std::string renderRecord(const TimestampRecord& record, OutputFormat format) {
    switch (format) {
        case OutputFormat::UNIX:
            return std::to_string(record.timestampSec);
        case OutputFormat::UNIX_MS:
            return std::to_string(record.timestampMs);
        case OutputFormat::JSON: {
            // ordered_json keeps insertion order
            json data;
            data[JSON_FIELD_UUID] = record.uuid;
            data[JSON_FIELD_TIMESTAMP_MS] = record.timestampMs;
            data[JSON_FIELD_TIMESTAMP_SEC] = record.timestampSec;
            data[JSON_FIELD_ISO8601] = record.iso8601;
            data[JSON_FIELD_RFC3339] = record.rfc3339;
            return data.dump();
        }
        case OutputFormat::ISO:
        default:
            return record.iso8601;
    }
}
