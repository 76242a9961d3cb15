/*
 * File: src/greet_main.cpp
 * Project: Greet Service
 * Purpose: Main server binary: GET / and GET /health
 * Notes:
 *  - Exit codes: 0 clean shutdown, 1 startup failure, 2 bad arguments
 * Last updated: 2026-10-18
 */

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "greet_config.hpp"
#include "greet_log.hpp"
#include "greet_service.hpp"

int main(int argc, char **argv)
{
    ParsedArgs parsed;
    try
    {
        parsed = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    }
    catch (const ConfigError &e)
    {
        greet_log::error(e.what());
        std::cerr << usage();
        return 2;
    }

    if (parsed.show_help)
    {
        std::cout << usage();
        return 0;
    }

    try
    {
        return run_service(parsed.config);
    }
    catch (const std::exception &e)
    {
        greet_log::error(std::string("fatal: ") + e.what());
        return 1;
    }
}
