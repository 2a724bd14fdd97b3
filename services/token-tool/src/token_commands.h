/**
 * @file token_commands.h
 * @brief Sub-commands of the `token` key and JWT management tool
 *
 * The tool manages the key directory shared with the server and issues or
 * checks tokens:
 *
 *   token [-k|--key-dir DIR] create-key [-k|--key-id ID]
 *   token [-k|--key-dir DIR] list-keys
 *   token [-k|--key-dir DIR] show-public KEY_ID
 *   token [-k|--key-dir DIR] create-token [options] SUBJECT
 *   token [-k|--key-dir DIR] verify-token [options] TOKEN
 *
 * Output goes to the given streams so the commands can run in tests.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace token_tool {

/// Default key directory, relative to the working directory
constexpr const char* DEFAULT_KEY_DIR = "./keys/";

/// RSA modulus size for keys created by create-key
constexpr int KEY_BITS = 2048;

/**
 * @brief Split a `key=value` claim argument
 * @throws common::ConfigException when '=' is missing or repeated
 */
std::pair<std::string, std::string> parseClaimArgument(const std::string& argument);

/**
 * @brief Run the tool with the arguments following the program name
 * @return Process exit code: 0 on success, 1 on any error
 */
int runTokenTool(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

/// Usage text printed by --help and after argument errors
std::string usage(const std::string& program);

} // namespace token_tool
