// timestamp.h
#ifndef TIMESTAMP_H
#define TIMESTAMP_H

#include "uuid.h"
#include <cstdint>
#include <string>
#include <string_view>

enum class ExtractError {
    NONE,
    INVALID_UUID,
    TIMESTAMP_OUT_OF_RANGE
};

// Short human-readable name, e.g. "Invalid UUID"
const char* errorDescription(ExtractError error);

// Everything derived from one successfully decoded UUID
struct TimestampRecord {
    std::string uuid;         // Input text, trimmed
    uint64_t timestampMs = 0;
    uint64_t timestampSec = 0;
    std::string iso8601;      // 2024-01-31T07:14:26.746Z
    std::string rfc3339;      // 2024-01-31T07:14:26.746+00:00
};

// Big-endian 48-bit value of bytes 0-5
uint64_t extractTimestampMs(const Uuid& uuid);

// False if `timestampMs` is past MAX_TIMESTAMP_MS
bool isTimestampInRange(uint64_t timestampMs);

// Render `timestampMs` as UTC with millisecond precision, followed by
// `utcSuffix` ("Z" or "+00:00"). False if the value is out of range.
bool formatInstant(uint64_t timestampMs, const char* utcSuffix, std::string& out);

// Parse, extract and format one candidate, ignoring surrounding whitespace.
// Fills `out` only when the result is ExtractError::NONE.
ExtractError buildRecord(std::string_view input, TimestampRecord& out);

#endif // TIMESTAMP_H
