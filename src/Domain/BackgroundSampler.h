#pragma once

#include "Domain/ProcessRecord.h"
#include "Domain/ProcessSampler.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace Domain
{

/// Configuration for background sampling.
struct SamplerConfig
{
    std::chrono::milliseconds interval{3000};
};

/// Runs ProcessSampler on a separate thread at a fixed cadence.
///
/// Each finished Sample is handed to the callback on the sampler thread, so the
/// callback must only hand the sample off (see ProcessListModel::submit). The wait
/// between samples is interruptible: requestRefresh() and stop() wake the thread
/// immediately rather than at the next tick.
class BackgroundSampler
{
  public:
    using SampleCallback = std::function<void(Sample)>;

    explicit BackgroundSampler(std::unique_ptr<ProcessSampler> sampler, SamplerConfig config = {});
    ~BackgroundSampler();

    BackgroundSampler(const BackgroundSampler&) = delete;
    BackgroundSampler& operator=(const BackgroundSampler&) = delete;
    BackgroundSampler(BackgroundSampler&&) = delete;
    BackgroundSampler& operator=(BackgroundSampler&&) = delete;

    /// Start background sampling thread.
    void start();

    /// Stop the sampling thread and wait for it. No callback runs after this returns.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Set callback for when a new sample is ready.
    void setCallback(SampleCallback callback);

    /// Take one sample on the calling thread (initial population).
    [[nodiscard]] Sample sampleNow();

    /// Wake the sampler thread early for an immediate sample.
    void requestRefresh();

    [[nodiscard]] std::chrono::milliseconds interval() const;

    /// Set sampling interval (clamped; takes effect on next iteration).
    void setInterval(std::chrono::milliseconds interval);

    [[nodiscard]] const EssentialProcessPolicy& policy() const noexcept
    {
        return m_Sampler->policy();
    }

  private:
    void samplerLoop(const std::stop_token& stopToken);

    /// Blocks until the interval since @p cycleStart has elapsed, a refresh is requested
    /// or stop is requested. Returns false on stop.
    bool waitForNextCycle(std::chrono::steady_clock::time_point cycleStart, const std::stop_token& stopToken);

    std::unique_ptr<ProcessSampler> m_Sampler;

    std::jthread m_SamplerThread;
    std::atomic<bool> m_Running{false};

    mutable std::mutex m_CallbackMutex;
    SampleCallback m_Callback;

    // Guards m_Config and m_RefreshRequested; m_WakeCv waits on it.
    mutable std::mutex m_StateMutex;
    std::condition_variable_any m_WakeCv;
    SamplerConfig m_Config;
    bool m_RefreshRequested = false;
};

} // namespace Domain
