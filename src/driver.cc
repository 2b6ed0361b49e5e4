#include "driver.h"
#include "config.h"
#include "errors.h"
#include "formatter.h"
#include "log.h"
#include "token.h"
#include <exception>
#include <sstream>
#include <string_view>

namespace {

/**
 * Print the error message and hand back the status to exit with.
 */
int fail(std::ostream& err, std::string_view message, int status) {
    err << "Error: " << message << std::endl;
    return status;
}

void logRun(std::string_view status, std::size_t in_bytes, std::size_t items,
            std::size_t out_bytes, std::string_view detail) {
    Log& log = Log::getInstance();
    if (log.isOpen()) {
        log.writeLogLine(status, in_bytes, items, out_bytes, detail);
    }
}

} // namespace

int runLineup(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out,
              std::ostream& err) {
    Config config;
    try {
        config = buildConfig(parseCommandLineOptions(arguments));
    } catch (const ConfigError& e) {
        return fail(err, e.what(), ExitStatus::CONFIG_ERROR);
    } catch (const std::exception& e) {
        // argparse failures already carry the usage text
        err << e.what() << std::endl;
        return ExitStatus::CONFIG_ERROR;
    }

    if (!config.log_file.empty() && !Log::getInstance().openLogFile(config.log_file)) {
        return fail(err, "cannot open log file " + config.log_file, ExitStatus::IO_ERROR);
    }

    std::ostringstream buffer;
    if (in.peek() != std::char_traits<char>::eof()) {
        buffer << in.rdbuf();
    }
    if (in.bad()) {
        return fail(err, "failed to read standard input", ExitStatus::IO_ERROR);
    }
    std::string input = buffer.str();

    std::vector<std::string> items;
    try {
        Token token;
        token.tokenize(input, config.input, items);
    } catch (const TokenizeError& e) {
        std::string detail = std::string(TokenizeError::kindName(e.kind())) + ": " + e.what();
        logRun("error", input.size(), 0, 0, detail);
        return fail(err, detail, ExitStatus::TOKENIZE_ERROR);
    }

    std::string output;
    try {
        Formatter formatter;
        output = formatter.format(items, config.output);
    } catch (const std::exception& e) {
        // Allocation failures while padding or joining
        logRun("error", input.size(), items.size(), 0, e.what());
        return fail(err, std::string("formatting failed: ") + e.what(), ExitStatus::IO_ERROR);
    }

    out.write(output.data(), static_cast<std::streamsize>(output.size()));
    out.flush();
    if (!out) {
        logRun("error", input.size(), items.size(), 0, "write failed");
        return fail(err, "failed to write standard output", ExitStatus::IO_ERROR);
    }

    logRun("ok", input.size(), items.size(), output.size(), "");
    return ExitStatus::OK;
}
