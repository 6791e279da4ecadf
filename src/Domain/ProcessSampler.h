#pragma once

#include "Domain/EssentialProcessPolicy.h"
#include "Domain/ProcessRecord.h"
#include "Platform/IProcessProbe.h"
#include "Platform/ISystemProbe.h"

#include <atomic>
#include <cstdint>
#include <memory>

namespace Domain
{

/// Produces one Sample per call: every visible process plus whole-system memory totals.
/// Holds no state between calls beyond a sequence counter.
class ProcessSampler
{
  public:
    ProcessSampler(std::unique_ptr<Platform::IProcessProbe> processProbe,
                   std::unique_ptr<Platform::ISystemProbe> systemProbe,
                   EssentialProcessPolicy policy = {});
    ~ProcessSampler() = default;

    ProcessSampler(const ProcessSampler&) = delete;
    ProcessSampler& operator=(const ProcessSampler&) = delete;
    ProcessSampler(ProcessSampler&&) = delete;
    ProcessSampler& operator=(ProcessSampler&&) = delete;

    /// Take a sample. Never throws for per-process failures; a failed memory read
    /// leaves Sample::memory empty.
    [[nodiscard]] Sample sample();

    [[nodiscard]] const EssentialProcessPolicy& policy() const noexcept
    {
        return m_Policy;
    }

    /// Convert raw memory counters to the display summary.
    [[nodiscard]] static SystemMemorySummary summarize(const Platform::MemoryCounters& memory);

  private:
    std::unique_ptr<Platform::IProcessProbe> m_ProcessProbe;
    std::unique_ptr<Platform::ISystemProbe> m_SystemProbe;
    EssentialProcessPolicy m_Policy;
    std::atomic<std::uint64_t> m_Sequence{0};
};

} // namespace Domain
