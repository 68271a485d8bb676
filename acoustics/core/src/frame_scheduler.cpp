#include <acoustics/core/frame_scheduler.hpp>
#include <algorithm>
#include <iterator>

namespace acoustics::core {

void FrameScheduler::add(Phase phase, FrameTask fn, int priority) {
    add(phase, std::move(fn), "", priority);
}

void FrameScheduler::add(Phase phase, FrameTask fn, const std::string& name, int priority) {
    if (!fn) return;

    // Growing the list would move the task that is currently executing
    if (m_run_depth > 0) {
        m_pending[static_cast<int>(phase)].push_back({priority, std::move(fn), name, true});
        return;
    }

    m_tasks[static_cast<int>(phase)].push_back({priority, std::move(fn), name, true});
    sort_phase(phase);
}

void FrameScheduler::remove(const std::string& name) {
    if (name.empty()) return;

    for (auto& pending : m_pending) {
        std::erase_if(pending, [&name](const TaskEntry& entry) { return entry.name == name; });
    }

    for (auto& tasks : m_tasks) {
        if (m_run_depth > 0) {
            // Erased once the outermost run returns; a task may be removing itself
            for (auto& entry : tasks) {
                if (entry.name == name) entry.removed = true;
            }
        } else {
            std::erase_if(tasks, [&name](const TaskEntry& entry) { return entry.name == name; });
        }
    }
}

bool FrameScheduler::contains(const std::string& name) const {
    return find(name) != nullptr;
}

void FrameScheduler::run(double dt, Phase phase) {
    auto& tasks = m_tasks[static_cast<int>(phase)];

    ++m_run_depth;
    // No insertions happen while running, so the count and indices stay valid
    const size_t count = tasks.size();
    for (size_t i = 0; i < count; ++i) {
        if (tasks[i].enabled && !tasks[i].removed) {
            tasks[i].fn(dt);
        }
    }
    --m_run_depth;

    if (m_run_depth == 0) {
        flush_pending();
    }
}

void FrameScheduler::tick(double dt) {
    for (int phase = 0; phase < kPhaseCount; ++phase) {
        run(dt, static_cast<Phase>(phase));
    }
    ++m_frame_count;
}

void FrameScheduler::clear() {
    for (auto& pending : m_pending) {
        pending.clear();
    }

    for (auto& tasks : m_tasks) {
        if (m_run_depth > 0) {
            for (auto& entry : tasks) entry.removed = true;
        } else {
            tasks.clear();
        }
    }
}

void FrameScheduler::set_enabled(const std::string& name, bool enabled) {
    if (name.empty()) return;

    for (auto* lists : {m_tasks, m_pending}) {
        for (int phase = 0; phase < kPhaseCount; ++phase) {
            for (auto& entry : lists[phase]) {
                if (entry.name == name && !entry.removed) {
                    entry.enabled = enabled;
                }
            }
        }
    }
}

bool FrameScheduler::is_enabled(const std::string& name) const {
    const TaskEntry* entry = find(name);
    return entry && entry->enabled;
}

const FrameScheduler::TaskEntry* FrameScheduler::find(const std::string& name) const {
    if (name.empty()) return nullptr;

    for (const auto* lists : {m_tasks, m_pending}) {
        for (int phase = 0; phase < kPhaseCount; ++phase) {
            for (const auto& entry : lists[phase]) {
                if (entry.name == name && !entry.removed) return &entry;
            }
        }
    }
    return nullptr;
}

void FrameScheduler::sort_phase(Phase phase) {
    auto& tasks = m_tasks[static_cast<int>(phase)];
    std::stable_sort(tasks.begin(), tasks.end(),
        [](const TaskEntry& a, const TaskEntry& b) {
            return a.priority > b.priority;
        });
}

void FrameScheduler::flush_pending() {
    for (int phase = 0; phase < kPhaseCount; ++phase) {
        auto& tasks = m_tasks[phase];
        std::erase_if(tasks, [](const TaskEntry& entry) { return entry.removed; });

        auto& pending = m_pending[phase];
        if (pending.empty()) continue;

        tasks.insert(tasks.end(), std::make_move_iterator(pending.begin()), std::make_move_iterator(pending.end()));
        pending.clear();
        sort_phase(static_cast<Phase>(phase));
    }
}

} // namespace acoustics::core
