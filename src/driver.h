#ifndef LINEUP_DRIVER_H
#define LINEUP_DRIVER_H 1

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "global.h"

/**
 * Process exit statuses
 */
namespace ExitStatus {

constexpr int OK = 0;
constexpr int TOKENIZE_ERROR = 1; // input could not be split
constexpr int CONFIG_ERROR = 2;   // bad options or configuration values
constexpr int IO_ERROR = 3;       // stdin, stdout, log file or formatting failure

} // namespace ExitStatus

/**
 * One conversion run: options, read all of in, tokenize, format, write out.
 * Diagnostics go to err. Nothing reaches out unless the whole run succeeds.
 * Returns one of the ExitStatus values.
 */
int runLineup(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out,
              std::ostream& err);

#endif /* !LINEUP_DRIVER_H */
