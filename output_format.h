// output_format.h
#ifndef OUTPUT_FORMAT_H
#define OUTPUT_FORMAT_H

#include "timestamp.h"
#include <string>

enum class OutputFormat {
    ISO,
    UNIX,
    UNIX_MS,
    JSON
};

// Accepts "iso", "unix", "unix-ms" and "json" in any letter case
bool parseOutputFormat(const std::string& name, OutputFormat& out);

const char* outputFormatName(OutputFormat format);

// One output line for `record`, without the trailing newline
std::string renderRecord(const TimestampRecord& record, OutputFormat format);

#endif // OUTPUT_FORMAT_H
