/*
 * File: src/greet_log.hpp
 * Project: Greet Service
 * Purpose: Line-oriented logging to stdout/stderr
 * Notes:
 *  - INFO goes to stdout, WARN/ERROR to stderr
 *  - One line per call; a mutex keeps lines from interleaving across io threads
 * Last updated: 2026-10-18
 */

#pragma once
#include <iostream>
#include <mutex>
#include <string>

#include "common/iso8601.hpp"

namespace greet_log
{
    inline std::mutex &sink_mutex()
    {
        static std::mutex m;
        return m;
    }

    inline void write(std::ostream &os, const char *level, const std::string &msg)
    {
        const std::string line = iso8601_now_ms() + " " + level + " greet: " + msg + "\n";
        std::scoped_lock lk(sink_mutex());
        os << line << std::flush;
    }

    inline void info(const std::string &msg) { write(std::cout, "INFO ", msg); }
    inline void warn(const std::string &msg) { write(std::cerr, "WARN ", msg); }
    inline void error(const std::string &msg) { write(std::cerr, "ERROR", msg); }
} // namespace greet_log
