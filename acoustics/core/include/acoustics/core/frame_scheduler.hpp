#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace acoustics::core {

// Frame execution phases, run in declaration order by tick()
enum class Phase {
    PreUpdate,      // Input, streaming
    Update,         // Gameplay, animation
    PostUpdate,     // Transform propagation
    EndOfFrame      // After every transform write of the frame
};

constexpr int kPhaseCount = 4;

// Task signature: receives the frame delta time in seconds
using FrameTask = std::function<void(double)>;

// Host frame clock. Tasks are plain function calls on the frame cadence.
// A task stops running as soon as it is removed, including later in the phase that
// is currently running. Tasks added from inside a task start on the next run.
class FrameScheduler {
public:
    FrameScheduler() = default;

    // Register a task for a specific phase
    // Higher priority tasks run first (default 0)
    void add(Phase phase, FrameTask fn, int priority = 0);
    void add(Phase phase, FrameTask fn, const std::string& name, int priority = 0);

    // Remove a task by name
    void remove(const std::string& name);
    bool contains(const std::string& name) const;

    // Run all tasks of one phase
    void run(double dt, Phase phase);

    // Run every phase in order and advance the frame counter
    void tick(double dt);

    void clear();

    // Enable/disable a task by name
    void set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;

    uint64_t frame_count() const { return m_frame_count; }

private:
    struct TaskEntry {
        int priority;
        FrameTask fn;
        std::string name;
        bool enabled = true;
        bool removed = false;
    };

    std::vector<TaskEntry> m_tasks[kPhaseCount];
    std::vector<TaskEntry> m_pending[kPhaseCount];
    int m_run_depth = 0;
    uint64_t m_frame_count = 0;

    const TaskEntry* find(const std::string& name) const;
    void sort_phase(Phase phase);
    void flush_pending();
};

} // namespace acoustics::core
