/*
 * File: src/greet_state.hpp
 * Project: Greet Service
 * Purpose: Process lifecycle state (starting -> serving)
 * Notes:
 *  - The request path never touches this; it is read by logs and tests
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>


enum class ServicePhase { starting, serving };

inline const char* phase_name(ServicePhase p){
return p == ServicePhase::serving ? "serving" : "starting";
}


struct ServiceState {
std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now();
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
std::atomic<ServicePhase> phase{ServicePhase::starting};
};
