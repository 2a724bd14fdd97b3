/**
 * @file main.cpp
 * @brief `token` - manage signing keys and issue JWTs for the expense tracker
 */

#include <iostream>
#include <string>
#include <vector>

#include "logger.h"
#include "token_commands.h"

int main(int argc, char* argv[]) {
    // Diagnostics go to stderr; stdout carries keys and tokens only
    common::Logger::initialize("token", "warn");

    std::vector<std::string> args(argv + 1, argv + argc);
    return token_tool::runTokenTool(args, std::cout, std::cerr);
}
