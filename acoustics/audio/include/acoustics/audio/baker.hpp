#pragma once

#include <acoustics/audio/backend.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

enum class BakeStatus : uint8_t {
    Idle,
    Baking,
    Complete,
    Cancelled,
    Failed
};

const char* to_string(BakeStatus status);

// Offline probe baking on a worker thread. Regions are baked one after another;
// progress covers the whole batch.
class Baker {
public:
    Baker() = default;
    ~Baker();

    Baker(const Baker&) = delete;
    Baker& operator=(const Baker&) = delete;

    // Starts baking and returns immediately. Fails while a bake is running.
    AudioResult begin_bake(IAcousticsBackend& backend,
                           EnvironmentHandle environment,
                           const BakingSettings& settings,
                           std::vector<ProbeRegion> regions,
                           BakingMode mode,
                           const std::string& identifier);

    // Waits for the running bake and returns its outcome
    AudioResult end_bake();

    // Asks the backend to stop; end_bake() still has to be called
    void cancel_bake();

    BakeStatus status() const { return m_status.load(); }
    bool is_baking() const { return status() == BakeStatus::Baking; }

    // [0, 1] over all regions of the current/last bake
    float progress() const { return m_progress.load(); }
    uint32_t regions_baked() const { return m_regions_baked.load(); }

private:
    void run(std::vector<ProbeRegion> regions, BakingMode mode, std::string identifier);

    IAcousticsBackend* m_backend = nullptr;
    EnvironmentHandle m_environment;
    BakingSettings m_settings;

    std::thread m_thread;
    std::atomic<BakeStatus> m_status{BakeStatus::Idle};
    std::atomic<float> m_progress{0.0f};
    std::atomic<uint32_t> m_regions_baked{0};
    std::atomic<bool> m_cancel_requested{false};

    std::mutex m_result_mutex;
    AudioResult m_result;
};

} // namespace acoustics::audio
