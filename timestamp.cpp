// timestamp.cpp
#include "timestamp.h"
#include "constants.h"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\r\n\v\f";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

const char* errorDescription(ExtractError error) {
    switch (error) {
        case ExtractError::NONE:                   return "OK";
        case ExtractError::INVALID_UUID:           return "Invalid UUID";
        case ExtractError::TIMESTAMP_OUT_OF_RANGE: return "Timestamp out of range";
        default:                                   return "Unknown error";
    }
}

uint64_t extractTimestampMs(const Uuid& uuid) {
    uint64_t value = 0;
    for (int i = 0; i < TIMESTAMP_BYTES; i++) {
        value = (value << 8) | uuid.bytes[i];
    }
    return value;
}

bool isTimestampInRange(uint64_t timestampMs) {
    return timestampMs <= MAX_TIMESTAMP_MS;
}

bool formatInstant(uint64_t timestampMs, const char* utcSuffix, std::string& out) {
    if (!isTimestampInRange(timestampMs)) {
        return false;
    }

    std::time_t seconds = static_cast<std::time_t>(timestampMs / 1000);
    unsigned millis = static_cast<unsigned>(timestampMs % 1000);

    std::tm tm_buf;
    if (gmtime_r(&seconds, &tm_buf) == nullptr) {
        return false;
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << millis << utcSuffix;
    out = oss.str();
    return true;
}

ExtractError buildRecord(std::string_view input, TimestampRecord& out) {
    std::string_view text = trim(input);

    Uuid uuid;
    if (!parseUuid(text, uuid)) {
        return ExtractError::INVALID_UUID;
    }

    TimestampRecord record;
    record.uuid = std::string(text);
    record.timestampMs = extractTimestampMs(uuid);
    record.timestampSec = record.timestampMs / 1000;

    if (!formatInstant(record.timestampMs, "Z", record.iso8601) ||
        !formatInstant(record.timestampMs, "+00:00", record.rfc3339)) {
        return ExtractError::TIMESTAMP_OUT_OF_RANGE;
    }

    out = std::move(record);
    return ExtractError::NONE;
}
