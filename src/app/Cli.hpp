/**
 * @file Cli.hpp
 * @brief Command dispatch for the fieldtrack executable.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fieldtrack::app {

/// Exit codes of RunCommand.
enum ExitCode : int {
    kExitOk = 0,
    kExitFailed = 1,
    kExitUsage = 2
};

/**
 * @brief Runs one command line, writing its JSON result to out.
 *
 *   fieldtrack [--config <file>] provision <tenant> <projectNumber>
 *                                diagnose <tenant>
 *                                check-path <path>
 *                                serve
 *
 * Usage errors print the usage text to std::cerr. Never throws.
 * @param args Arguments without the program name.
 */
int RunCommand(const std::vector<std::string>& args, std::ostream& out);

/**
 * @brief Pretty-prints a result. Invalid UTF-8 coming from user-supplied identifiers
 * is replaced with U+FFFD instead of throwing.
 */
std::string DumpForOutput(const nlohmann::json& value);

} // namespace fieldtrack::app
