/**
 * @file plan_recorder.cpp
 * @brief PlanRecorder implementation.
 */

#include "telemetry/plan_recorder.hpp"

#include <sstream>

namespace squad_rotation {

namespace {

void write_id_array(std::ostringstream& oss, const std::vector<std::string>& ids) {
    oss << '[';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(ids[i]) << '"';
    }
    oss << ']';
}

}  // namespace

PlanRecorder::PlanRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void PlanRecorder::record_assignment(const Assignment& assignment) {
    {
        std::ostringstream oss;
        oss << R"({"event":"assignment")"
            << R"(,"index":)" << assignment.event_index
            << R"(,"id":")" << json_escape(assignment.event_id) << "\""
            << R"(,"importance":")" << to_string(assignment.importance) << "\""
            << R"(,"total_gss":)" << assignment.total_gss
            << R"(,"total_cost":)" << assignment.total_cost
            << R"(,"goalkeeper_relaxed":)" << (assignment.goalkeeper_relaxed ? "true" : "false")
            << R"(,"bench":)";
        write_id_array(oss, assignment.bench);
        oss << R"(,"rested":)";
        write_id_array(oss, assignment.rested);
        oss << "}";
        emit(oss.str());
    }

    for (const auto& entry : assignment.lineup) {
        const auto& b = entry.breakdown;
        std::ostringstream oss;
        oss << R"({"event":"slot")"
            << R"(,"index":)" << assignment.event_index
            << R"(,"slot":")" << json_escape(entry.slot) << "\""
            << R"(,"worker":")" << json_escape(entry.worker) << "\""
            << R"(,"gss":)" << b.gss
            << R"(,"base":)" << b.base_rating
            << R"(,"readiness_mult":)" << b.readiness_multiplier
            << R"(,"sharpness_mult":)" << b.sharpness_multiplier
            << R"(,"familiarity_mult":)" << b.familiarity_multiplier
            << R"(,"load_mult":)" << b.load_multiplier
            << R"(,"tier":")" << to_string(b.tier) << "\""
            << R"(,"load":")" << to_string(b.load) << "\""
            << R"(,"shadow":)" << entry.shadow_price
            << R"(,"stability":)" << entry.stability_cost
            << R"(,"locked":)" << (entry.locked ? "true" : "false")
            << R"(,"fallback":)" << (entry.fallback ? "true" : "false")
            << "}";
        emit(oss.str());
    }
}

void PlanRecorder::record_states(size_t event_index, const Roster& roster, const PropagationConfig& config) {
    for (const auto& worker : roster) {
        const auto& s = worker.state;
        std::ostringstream oss;
        oss << R"({"event":"worker_state")"
            << R"(,"index":)" << event_index
            << R"(,"worker":")" << json_escape(worker.id) << "\""
            << R"(,"readiness":)" << s.readiness
            << R"(,"sharpness":)" << s.sharpness
            << R"(,"window_minutes":)" << s.window_minutes()
            << R"(,"streak":)" << s.consecutive_appearances
            << R"(,"load":")" << to_string(load_category(s, worker.profile, config)) << "\""
            << R"(,"available":)" << (worker.available() ? "true" : "false")
            << "}";
        emit(oss.str());
    }
}

void PlanRecorder::record_infeasible(size_t event_index, const Error& error) {
    std::ostringstream oss;
    oss << R"({"event":"infeasible")"
        << R"(,"index":)" << event_index
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"message":")" << json_escape(error.message) << "\""
        << R"(,"subjects":)";
    write_id_array(oss, error.subjects);
    oss << "}";
    emit(oss.str());
}

void PlanRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++records_;
}

void PlanRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

size_t PlanRecorder::records_written() const {
    std::lock_guard lock(write_mutex_);
    return records_;
}

}  // namespace squad_rotation
