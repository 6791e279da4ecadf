#include "BackgroundSampler.h"

#include "SamplingConfig.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace Domain
{

BackgroundSampler::BackgroundSampler(std::unique_ptr<ProcessSampler> sampler, SamplerConfig config)
    : m_Sampler(std::move(sampler)), m_Config(config)
{
    m_Config.interval = Sampling::clampRefreshInterval(m_Config.interval);
    spdlog::debug("BackgroundSampler: created with {}ms interval", m_Config.interval.count());
}

BackgroundSampler::~BackgroundSampler()
{
    stop();
}

void BackgroundSampler::start()
{
    if (m_Running.exchange(true))
    {
        spdlog::warn("BackgroundSampler: already running");
        return;
    }

    spdlog::info("BackgroundSampler: starting with {}ms interval", interval().count());
    m_SamplerThread = std::jthread([this](const std::stop_token& stopToken) { samplerLoop(stopToken); });
}

void BackgroundSampler::stop()
{
    if (!m_Running.exchange(false))
    {
        return;
    }

    spdlog::info("BackgroundSampler: stopping");

    // request_stop() wakes the condition_variable_any wait through the stop token.
    m_SamplerThread.request_stop();
    if (m_SamplerThread.joinable())
    {
        m_SamplerThread.join();
    }

    spdlog::debug("BackgroundSampler: stopped");
}

bool BackgroundSampler::isRunning() const
{
    return m_Running.load();
}

void BackgroundSampler::setCallback(SampleCallback callback)
{
    std::lock_guard lock(m_CallbackMutex);
    m_Callback = std::move(callback);
}

Sample BackgroundSampler::sampleNow()
{
    return m_Sampler->sample();
}

void BackgroundSampler::requestRefresh()
{
    {
        std::lock_guard lock(m_StateMutex);
        m_RefreshRequested = true;
    }
    m_WakeCv.notify_all();
    spdlog::debug("BackgroundSampler: refresh requested");
}

std::chrono::milliseconds BackgroundSampler::interval() const
{
    std::lock_guard lock(m_StateMutex);
    return m_Config.interval;
}

void BackgroundSampler::setInterval(std::chrono::milliseconds newInterval)
{
    const auto clamped = Sampling::clampRefreshInterval(newInterval);
    {
        std::lock_guard lock(m_StateMutex);
        if (m_Config.interval == clamped)
        {
            return;
        }
        m_Config.interval = clamped;
    }
    // Re-evaluate the pending deadline against the new interval
    m_WakeCv.notify_all();
    spdlog::info("BackgroundSampler: interval changed to {}ms", clamped.count());
}

bool BackgroundSampler::waitForNextCycle(std::chrono::steady_clock::time_point cycleStart, const std::stop_token& stopToken)
{
    std::unique_lock lock(m_StateMutex);
    while (!m_RefreshRequested)
    {
        const auto deadline = cycleStart + m_Config.interval;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            break;
        }
        // Returns early on notify (refresh, interval change) or stop; the loop re-reads the deadline.
        m_WakeCv.wait_until(lock, stopToken, deadline, [this] { return m_RefreshRequested; });
        if (stopToken.stop_requested())
        {
            return false;
        }
    }
    // Cleared before sampling so a request arriving mid-sample triggers another pass
    m_RefreshRequested = false;
    return !stopToken.stop_requested();
}

void BackgroundSampler::samplerLoop(const std::stop_token& stopToken)
{
    spdlog::debug("BackgroundSampler: thread started");

    std::chrono::steady_clock::time_point cycleStart;
    {
        std::lock_guard lock(m_StateMutex);
        m_RefreshRequested = false;
    }

    do
    {
        cycleStart = std::chrono::steady_clock::now();
        auto sample = m_Sampler->sample();

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - cycleStart);
        spdlog::trace("BackgroundSampler: sample #{} with {} processes in {}ms", sample.sequence, sample.processes.size(), elapsed.count());

        // A stop requested while sampling discards the result.
        if (stopToken.stop_requested())
        {
            break;
        }

        std::lock_guard lock(m_CallbackMutex);
        if (m_Callback)
        {
            m_Callback(std::move(sample));
        }
    } while (waitForNextCycle(cycleStart, stopToken));

    spdlog::debug("BackgroundSampler: thread exiting");
}

} // namespace Domain
