#include <acoustics/audio/baker.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>
#include <exception>

namespace acoustics::audio {

using namespace acoustics::core;

const char* to_string(BakeStatus status) {
    switch (status) {
        case BakeStatus::Idle:      return "idle";
        case BakeStatus::Baking:    return "baking";
        case BakeStatus::Complete:  return "complete";
        case BakeStatus::Cancelled: return "cancelled";
        case BakeStatus::Failed:    return "failed";
    }
    return "idle";
}

Baker::~Baker() {
    if (m_thread.joinable()) {
        cancel_bake();
        m_thread.join();
    }
}

AudioResult Baker::begin_bake(IAcousticsBackend& backend,
                              EnvironmentHandle environment,
                              const BakingSettings& settings,
                              std::vector<ProbeRegion> regions,
                              BakingMode mode,
                              const std::string& identifier) {
    if (is_baking()) {
        return AudioResult::failure(AudioError::BakeInProgress, "A bake is already running");
    }
    if (!environment.valid()) {
        log(LogLevel::Error, "[Baker] Cannot bake " + identifier + ": environment not available");
        return AudioResult::failure(AudioError::SceneNotFound, "Environment not available");
    }
    if (regions.empty()) {
        log(LogLevel::Warn, "[Baker] No probe regions selected for " + identifier);
        return AudioResult::failure(AudioError::InvalidArgument, "No probe regions selected");
    }

    // Previous bake finished but was never collected
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_backend = &backend;
    m_environment = environment;
    m_settings = settings;
    m_progress = 0.0f;
    m_regions_baked = 0;
    m_cancel_requested = false;
    {
        std::lock_guard<std::mutex> lock(m_result_mutex);
        m_result = {};
    }
    m_status = BakeStatus::Baking;

    log(LogLevel::Info, "[Baker] Baking " + std::to_string(regions.size()) + " probe region(s) for " + identifier);
    m_thread = std::thread(&Baker::run, this, std::move(regions), mode, identifier);
    return {};
}

AudioResult Baker::end_bake() {
    if (m_thread.joinable()) {
        m_thread.join();
    }

    std::lock_guard<std::mutex> lock(m_result_mutex);
    switch (m_status.load()) {
        case BakeStatus::Complete:
            log(LogLevel::Info, "[Baker] Bake complete (" + std::to_string(m_regions_baked.load()) + " region(s))");
            break;
        case BakeStatus::Cancelled:
            log(LogLevel::Warn, "[Baker] Bake cancelled");
            break;
        case BakeStatus::Failed:
            log(LogLevel::Error, "[Baker] Bake failed: " + m_result.message);
            break;
        default:
            break;
    }
    return m_result;
}

void Baker::cancel_bake() {
    if (!is_baking()) return;
    m_cancel_requested = true;
    if (m_backend) {
        m_backend->cancel_bake();
    }
}

void Baker::run(std::vector<ProbeRegion> regions, BakingMode mode, std::string identifier) {
    const float region_share = 1.0f / static_cast<float>(regions.size());
    AudioResult result;

    for (size_t i = 0; i < regions.size(); ++i) {
        if (m_cancel_requested) {
            result = AudioResult::failure(AudioError::BakeCancelled, "Cancelled");
            break;
        }

        const float base = region_share * static_cast<float>(i);
        auto on_progress = [this, base, region_share](float fraction) {
            m_progress = base + region_share * std::clamp(fraction, 0.0f, 1.0f);
        };

        try {
            result = m_backend->bake_reverb(m_environment, regions[i], mode, m_settings, identifier, on_progress);
        } catch (const std::exception& e) {
            log(LogLevel::Error, "[Baker] Backend threw while baking " + regions[i].name + ": " + e.what());
            result = AudioResult::failure(AudioError::BakeFailed, e.what());
        }
        if (!result) {
            if (result.error != AudioError::BakeCancelled) {
                result.message = regions[i].name + ": " + result.message;
            }
            break;
        }

        ++m_regions_baked;
        m_progress = base + region_share;
    }

    {
        std::lock_guard<std::mutex> lock(m_result_mutex);
        m_result = result;
    }

    if (result.ok()) {
        m_status = BakeStatus::Complete;
    } else if (result.error == AudioError::BakeCancelled) {
        m_status = BakeStatus::Cancelled;
    } else {
        m_status = BakeStatus::Failed;
    }
}

} // namespace acoustics::audio
