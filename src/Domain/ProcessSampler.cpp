#include "ProcessSampler.h"

#include "Numeric.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace Domain
{

ProcessSampler::ProcessSampler(std::unique_ptr<Platform::IProcessProbe> processProbe,
                               std::unique_ptr<Platform::ISystemProbe> systemProbe,
                               EssentialProcessPolicy policy)
    : m_ProcessProbe(std::move(processProbe)), m_SystemProbe(std::move(systemProbe)), m_Policy(std::move(policy))
{
}

Sample ProcessSampler::sample()
{
    Sample result;
    result.takenAt = std::chrono::steady_clock::now();
    result.sequence = m_Sequence.fetch_add(1) + 1;

    // System memory is read independently so a failure here never hides the process list.
    if (m_SystemProbe)
    {
        if (auto memory = m_SystemProbe->readMemory())
        {
            result.memory = summarize(*memory);
        }
        else
        {
            spdlog::warn("ProcessSampler: system memory summary unavailable");
        }
    }

    if (!m_ProcessProbe)
    {
        return result;
    }

    auto counters = m_ProcessProbe->enumerate();
    result.processes.reserve(counters.size());

    for (auto& current : counters)
    {
        ProcessRecord record;
        record.pid = current.pid;
        if (current.name.has_value() && !current.name->empty())
        {
            record.displayName = std::move(*current.name);
        }
        record.residentMemoryBytes = current.rssBytes.value_or(0);
        record.isEssential = m_Policy.isEssential(record.pid, record.displayName);
        result.processes.push_back(std::move(record));
    }

    spdlog::debug("ProcessSampler: sample #{} with {} processes, memory={}",
                  result.sequence,
                  result.processes.size(),
                  result.memory.has_value() ? "ok" : "unavailable");
    return result;
}

SystemMemorySummary ProcessSampler::summarize(const Platform::MemoryCounters& memory)
{
    SystemMemorySummary summary;
    summary.totalBytes = memory.totalBytes;

    if (memory.hasAvailable)
    {
        summary.availableBytes = memory.availableBytes;
        summary.usedBytes = Numeric::saturatingSub(memory.totalBytes, memory.availableBytes);
    }
    else
    {
        // Pre-3.14 kernels: approximate available as free + reclaimable page cache
        summary.availableBytes = memory.freeBytes + memory.buffersBytes + memory.cachedBytes;
        summary.usedBytes = Numeric::saturatingSub(memory.totalBytes, summary.availableBytes);
    }

    return summary;
}

} // namespace Domain
