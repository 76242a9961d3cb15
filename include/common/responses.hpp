/*
 * File: include/common/responses.hpp
 * Project: Greet Service
 * Purpose: Response payloads for / and /health
 * Notes:
 *  - Built fresh per request; nothing here is shared between requests
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "common/iso8601.hpp"

constexpr const char *GREETING_MESSAGE = "Hello World!";
constexpr const char *SERVICE_VERSION = "1.0.0";
constexpr const char *HEALTH_STATUS = "healthy";


struct GreetingResponse {
std::string message = GREETING_MESSAGE;
std::string version = SERVICE_VERSION;
std::chrono::system_clock::time_point t;
};


struct HealthResponse {
std::string status = HEALTH_STATUS;
};


inline GreetingResponse make_greeting(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()){
GreetingResponse g; g.t = now; return g;
}


// ordered_json keeps the field order of the wire format: message, version, timestamp
inline nlohmann::ordered_json greeting_to_json(const GreetingResponse& g){
using nlohmann::ordered_json;
return ordered_json{
{"message", g.message},
{"version", g.version},
{"timestamp", iso8601_ms(g.t)}
};
}


inline nlohmann::json health_to_json(const HealthResponse& h){
return nlohmann::json{{"status", h.status}};
}
