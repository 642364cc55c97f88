// batch.cpp
#include "batch.h"
#include "constants.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <utility>

namespace {

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

size_t BatchResult::failureCount() const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [](const ItemOutcome& item) { return !item.ok(); }));
}

int BatchResult::exitStatus() const {
    if (items.empty() || failureCount() > 0) {
        return 1;
    }
    return 0;
}

BatchDriver::BatchDriver(const Config& config, std::ostream& out, std::ostream& err)
    : config(config), out(out), err(err) {
}

ExtractError BatchDriver::process(const std::string& candidate) {
    ItemOutcome outcome;
    outcome.input = candidate;
    outcome.error = buildRecord(candidate, outcome.record);

    if (outcome.ok()) {
        LOG_DEBUG("'%s' -> %llu ms (%s)", outcome.record.uuid.c_str(),
                  static_cast<unsigned long long>(outcome.record.timestampMs),
                  outcome.record.iso8601.c_str());
        out << renderRecord(outcome.record, config.format) << std::endl;
    } else {
        LOG_WARNING("%s: '%s'", errorDescription(outcome.error), candidate.c_str());
        reportError(outcome);
    }

    ExtractError error = outcome.error;
    batch.items.push_back(std::move(outcome));
    return error;
}

void BatchDriver::processAll(const std::vector<std::string>& candidates) {
    for (const auto& candidate : candidates) {
        process(candidate);
    }
}

void BatchDriver::processLines(std::istream& in) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isBlank(line)) {
            continue;
        }
        process(line);
    }

    if (in.bad()) {
        LOG_ERROR("Read error on input after %zu items", batch.items.size());
    }
}

int BatchDriver::finish() {
    if (batch.items.empty()) {
        LOG_WARNING("No UUID provided");
        if (!config.quiet) {
            err << "Error: No UUID provided. Use --help for usage information." << std::endl;
        }
    }

    int status = batch.exitStatus();
    LOG_INFO("Processed %zu items, %zu failed, exit status %d",
             batch.items.size(), batch.failureCount(), status);
    return status;
}

void BatchDriver::reportError(const ItemOutcome& outcome) {
    if (config.quiet) {
        return;
    }

    err << "Error: " << errorDescription(outcome.error) << ": '" << outcome.input << "'";
    if (outcome.error == ExtractError::TIMESTAMP_OUT_OF_RANGE) {
        err << " (supported up to " << MAX_TIMESTAMP_ISO << ")";
    }
    err << std::endl;
}
