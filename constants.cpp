#include "constants.h"

const char* PROGRAM_NAME = "uuid7time";
const char* PROGRAM_DESCRIPTION = "Extract timestamps from UUID version 7";

// --- Supported calendar range ---
// Four-digit years only, so every ISO-8601 rendering has the same width.
const uint64_t MAX_TIMESTAMP_MS = 253402300799999ULL;
const char* MAX_TIMESTAMP_ISO = "9999-12-31T23:59:59.999Z";

const int TIMESTAMP_BYTES = 6;

// --- JSON output ---
const char* JSON_FIELD_UUID = "uuid";
const char* JSON_FIELD_TIMESTAMP_MS = "timestamp_ms";
const char* JSON_FIELD_TIMESTAMP_SEC = "timestamp_sec";
const char* JSON_FIELD_ISO8601 = "iso8601";
const char* JSON_FIELD_RFC3339 = "rfc3339";
