#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "metricstore/core/types.h"

namespace metricstore {
namespace testutil {

// 2025-06-15T12:30:00Z, mid-hour so hour and day flooring both matter
constexpr core::Timestamp kTestNow = 1749990600000;

/**
 * @brief Settable wall clock shared by every component of a test
 */
class ManualClock {
public:
    explicit ManualClock(core::Timestamp now = kTestNow)
        : now_(std::make_shared<std::atomic<core::Timestamp>>(now)) {}

    core::Timestamp now() const { return now_->load(); }
    void set(core::Timestamp now) { now_->store(now); }
    void advance(core::Duration by) { now_->fetch_add(by); }

    std::function<core::Timestamp()> fn() const {
        auto now = now_;
        return [now]() { return now->load(); };
    }

private:
    std::shared_ptr<std::atomic<core::Timestamp>> now_;
};

inline core::TaskMetric MakeTask(const std::string& task_id, const std::string& agent_id,
                                 core::Timestamp timestamp, int64_t duration_ms,
                                 core::TaskOutcome outcome = core::TaskOutcome::SUCCESS,
                                 int64_t tokens_used = 100, int64_t files_changed = 1) {
    core::TaskMetric task;
    task.task_id = task_id;
    task.agent_id = agent_id;
    task.timestamp = timestamp;
    task.duration_ms = duration_ms;
    task.outcome = outcome;
    task.tokens_used = tokens_used;
    task.files_changed = files_changed;
    return task;
}

inline core::AgentMetric MakeAgentMetric(const std::string& agent_id, const std::string& kind,
                                         core::Timestamp timestamp, double value) {
    core::AgentMetric metric;
    metric.agent_id = agent_id;
    metric.metric_kind = kind;
    metric.timestamp = timestamp;
    metric.value = value;
    return metric;
}

inline core::SwarmMetric MakeSwarmMetric(const std::string& swarm_id, const std::string& kind,
                                         core::Timestamp timestamp, double value) {
    core::SwarmMetric metric;
    metric.swarm_id = swarm_id;
    metric.metric_kind = kind;
    metric.timestamp = timestamp;
    metric.value = value;
    return metric;
}

} // namespace testutil
} // namespace metricstore
