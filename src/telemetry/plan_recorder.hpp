/**
 * @file plan_recorder.hpp
 * @brief Structured plan trace as NDJSON.
 *
 * Records each chosen lineup, every filled slot with its GSS factors, the
 * worker states entering each event, and infeasibility reports. Downstream
 * explainability and timeline tooling consumes these lines; nothing in the
 * optimizer reads them back.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "roster/worker.hpp"
#include "solver/assignment.hpp"

#include <memory>
#include <mutex>

namespace squad_rotation {

class PlanRecorder {
public:
    explicit PlanRecorder(std::unique_ptr<ILogSink> sink);

    /// One "assignment" line plus one "slot" line per filled slot.
    void record_assignment(const Assignment& assignment);
    /// One "worker_state" line per worker entering the event.
    void record_states(size_t event_index, const Roster& roster, const PropagationConfig& config);
    void record_infeasible(size_t event_index, const Error& error);

    void flush();

    [[nodiscard]] size_t records_written() const;

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    size_t records_{0};
};

}  // namespace squad_rotation
