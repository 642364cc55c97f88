// batch.h
#ifndef BATCH_H
#define BATCH_H

#include "config.h"
#include "timestamp.h"
#include <iosfwd>
#include <string>
#include <vector>

// Result of one candidate. `record` is only meaningful when error is NONE.
struct ItemOutcome {
    std::string input;
    ExtractError error = ExtractError::NONE;
    TimestampRecord record;

    bool ok() const { return error == ExtractError::NONE; }
};

struct BatchResult {
    std::vector<ItemOutcome> items;   // Input order

    size_t failureCount() const;
    // 0 if there was at least one item and none failed, 1 otherwise
    int exitStatus() const;
};

// Runs candidates through parse/extract/format and writes one line per item:
// the rendering to `out` or a diagnostic to `err`.
class BatchDriver {
public:
    BatchDriver(const Config& config, std::ostream& out, std::ostream& err);

    // Handles one candidate and returns its error kind (NONE on success)
    ExtractError process(const std::string& candidate);

    void processAll(const std::vector<std::string>& candidates);

    // One candidate per line until EOF or a read error. Trailing CR is
    // removed and blank lines are skipped.
    void processLines(std::istream& in);

    // Reports the empty batch, if it was one, and returns the exit status
    int finish();

    const BatchResult& result() const { return batch; }

private:
    const Config& config;
    std::ostream& out;
    std::ostream& err;
    BatchResult batch;

    void reportError(const ItemOutcome& outcome);
};

#endif // BATCH_H
