/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: log.cpp
 * ============================================================================
 */

#include "log.hpp"

#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace conduit {

namespace {

std::deque<std::string> system_logs;
std::size_t log_capacity = 200;
std::mutex log_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

} // namespace

void conduit_log(const std::string& level, const std::string& message) {
    std::string log_entry = "[" + timestamp() + "] [" + level + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_capacity > 0) {
        while (system_logs.size() >= log_capacity) {
            system_logs.pop_front();
        }
        system_logs.push_back(log_entry);
    }

    std::cout << log_entry << std::endl;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void set_log_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_capacity = capacity;
    while (system_logs.size() > log_capacity) {
        system_logs.pop_front();
    }
}

void clear_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    system_logs.clear();
}

} // namespace conduit
