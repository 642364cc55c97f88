#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>

extern const char* PROGRAM_NAME;
extern const char* PROGRAM_DESCRIPTION;

// Last supported instant: 9999-12-31T23:59:59.999Z
extern const uint64_t MAX_TIMESTAMP_MS;
extern const char* MAX_TIMESTAMP_ISO;

// Number of leading UUID bytes holding the millisecond timestamp
extern const int TIMESTAMP_BYTES;

// JSON output field names, in output order
extern const char* JSON_FIELD_UUID;
extern const char* JSON_FIELD_TIMESTAMP_MS;
extern const char* JSON_FIELD_TIMESTAMP_SEC;
extern const char* JSON_FIELD_ISO8601;
extern const char* JSON_FIELD_RFC3339;

#endif // CONSTANTS_H
