/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: log.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide logger. Every line goes to stdout and into a bounded
 * in-memory ring so the host can expose recent activity (see
 * /api/system/logs in main.cpp).
 * ============================================================================
 */

#ifndef CONDUIT_LOG_HPP
#define CONDUIT_LOG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace conduit {

    /**
     * @brief Writes "[HH:MM:SS] [LEVEL] message" to stdout and the ring.
     */
    void conduit_log(const std::string& level, const std::string& message);

    /**
     * @brief Snapshot of the retained log lines, oldest first.
     */
    std::vector<std::string> recent_logs();

    /**
     * @brief Changes how many lines are retained. Excess lines are dropped
     * from the front immediately. A capacity of zero disables retention.
     */
    void set_log_capacity(std::size_t capacity);

    // Drops every retained line.
    void clear_logs();

} // namespace conduit

#endif // CONDUIT_LOG_HPP
