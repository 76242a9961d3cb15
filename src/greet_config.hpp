/*
 * File: src/greet_config.hpp
 * Project: Greet Service
 * Purpose: ServiceConfig and its sources (env PORT, command line)
 * Notes:
 *  - Precedence: --http / --port, then env PORT, then defaults
 *  - A bad PORT falls back to 3000; a bad flag value is a ConfigError
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdlib>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "greet_log.hpp"

constexpr unsigned short DEFAULT_PORT = 3000;
constexpr int MAX_THREADS = 64;

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ServiceConfig
{
    std::string host{"0.0.0.0"};
    unsigned short port{DEFAULT_PORT};
    int threads{1};
};

struct ParsedArgs
{
    ServiceConfig config;
    bool show_help{false};
};

// Returns nullptr when the variable is unset.
using EnvLookup = std::function<const char *(const char *)>;

inline const char *process_env(const char *name) { return std::getenv(name); }

inline std::optional<long> parse_decimal(const std::string &s, long lo, long hi)
{
    if (s.empty() || s.size() > 9)
        return std::nullopt;
    long v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + (c - '0');
    }
    if (v < lo || v > hi)
        return std::nullopt;
    return v;
}

inline std::optional<unsigned short> parse_port(const std::string &s)
{
    auto v = parse_decimal(s, 0, 65535);
    if (!v)
        return std::nullopt;
    return static_cast<unsigned short>(*v);
}

inline unsigned short port_from_env(const EnvLookup &env)
{
    const char *raw = env("PORT");
    if (raw == nullptr || *raw == '\0')
        return DEFAULT_PORT;
    if (auto p = parse_port(raw))
        return *p;
    greet_log::warn("ignoring PORT='" + std::string(raw) + "' (not a port number), using " + std::to_string(DEFAULT_PORT));
    return DEFAULT_PORT;
}

inline std::string usage()
{
    return "usage: greet_server [--http host:port] [--port N] [--threads N] [--help]\n"
           "  PORT   listening port when neither --http nor --port is given (default 3000)\n";
}

inline ParsedArgs parse_args(const std::vector<std::string> &args, const EnvLookup &env = process_env)
{
    ParsedArgs out;
    out.config.port = port_from_env(env);

    auto need_value = [&](std::size_t i, const std::string &flag) -> const std::string &
    {
        if (i + 1 >= args.size())
            throw ConfigError(flag + " requires a value");
        return args[i + 1];
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a == "--help" || a == "-h")
        {
            out.show_help = true;
        }
        else if (a == "--http")
        {
            const std::string &v = need_value(i++, a);
            auto colon = v.rfind(':');
            if (colon == std::string::npos || colon == 0)
                throw ConfigError("--http expects host:port, got '" + v + "'");
            auto port = parse_port(v.substr(colon + 1));
            if (!port)
                throw ConfigError("--http has an invalid port in '" + v + "'");
            out.config.host = v.substr(0, colon);
            out.config.port = *port;
        }
        else if (a == "--port")
        {
            const std::string &v = need_value(i++, a);
            auto port = parse_port(v);
            if (!port)
                throw ConfigError("--port expects 0-65535, got '" + v + "'");
            out.config.port = *port;
        }
        else if (a == "--threads")
        {
            const std::string &v = need_value(i++, a);
            auto n = parse_decimal(v, 1, MAX_THREADS);
            if (!n)
                throw ConfigError("--threads expects 1-" + std::to_string(MAX_THREADS) + ", got '" + v + "'");
            out.config.threads = static_cast<int>(*n);
        }
        else
        {
            greet_log::warn("ignoring unknown argument '" + a + "'");
        }
    }
    return out;
}
