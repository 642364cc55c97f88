// cli.cpp
#include "cli.h"
#include "batch.h"
#include "config.h"
#include "constants.h"
#include "logger.h"
#include "version.h"
#include <CLI/CLI.hpp>
#include <istream>
#include <ostream>

namespace {

// An explicit --format wins; otherwise the first shorthand set, in the order
// --unix, --unix-ms, --json.
bool resolveFormat(const CLI::Option* formatOption, const std::string& formatName,
                   bool unixSec, bool unixMs, bool json, OutputFormat& out) {
    if (formatOption->count() > 0) {
        return parseOutputFormat(formatName, out);
    }
    if (unixSec) {
        out = OutputFormat::UNIX;
    } else if (unixMs) {
        out = OutputFormat::UNIX_MS;
    } else if (json) {
        out = OutputFormat::JSON;
    } else {
        out = OutputFormat::ISO;
    }
    return true;
}

} // namespace

int runCli(int argc, const char* const* argv,
           std::istream& in, std::ostream& out, std::ostream& err) {
    Config config;
    std::string formatName = "iso";
    bool unixSec = false;
    bool unixMs = false;
    bool json = false;

    CLI::App cli(PROGRAM_DESCRIPTION, PROGRAM_NAME);
    cli.set_version_flag("-V,--version", UUID7TIME_VERSION);
    cli.add_option("uuids", config.uuids, "UUID(s) to extract timestamp from; read from stdin if omitted")
        ->type_name("UUID");
    CLI::Option* formatOption =
        cli.add_option("-f,--format", formatName, "Output format: iso, unix, unix-ms, json")
            ->type_name("FORMAT")
            ->capture_default_str();
    cli.add_flag("-u,--unix", unixSec, "Output unix timestamp in seconds (shortcut for --format unix)");
    cli.add_flag("-U,--unix-ms", unixMs, "Output unix timestamp in milliseconds (shortcut for --format unix-ms)");
    cli.add_flag("-j,--json", json, "Output JSON (shortcut for --format json)");
    cli.add_flag("-q,--quiet", config.quiet, "Suppress error messages");
    cli.add_option("--log-file", config.logFile, "Write a debug log to this file")
        ->type_name("PATH");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit with code 0, usage errors with 1
        int code = cli.exit(e, out, err);
        return code == 0 ? 0 : 1;
    }

    if (!config.logFile.empty()) {
        if (Logger::instance().open(config.logFile)) {
            LOG_INFO("%s %s (%s) starting", PROGRAM_NAME, UUID7TIME_VERSION, VERSION_GIT_HASH);
        } else if (!config.quiet) {
            err << "Warning: cannot open log file: " << config.logFile << std::endl;
        }
    }

    if (!resolveFormat(formatOption, formatName, unixSec, unixMs, json, config.format)) {
        LOG_ERROR("Unknown format: %s", formatName.c_str());
        err << "Error: Unknown format: " << formatName << ". Use: iso, unix, unix-ms, json" << std::endl;
        return 1;
    }
    LOG_DEBUG("Output format: %s, quiet: %d", outputFormatName(config.format), config.quiet ? 1 : 0);

    BatchDriver driver(config, out, err);
    if (!config.uuids.empty()) {
        LOG_DEBUG("Reading %zu UUIDs from arguments", config.uuids.size());
        driver.processAll(config.uuids);
    } else {
        LOG_DEBUG("Reading UUIDs from standard input");
        driver.processLines(in);
    }

    int status = driver.finish();
    out.flush();
    Logger::instance().flush();
    return status;
}
