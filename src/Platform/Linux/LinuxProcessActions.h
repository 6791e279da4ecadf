#pragma once

#include "Platform/IProcessActions.h"

namespace Platform
{

/// Sends SIGTERM with kill(2). Stateless; safe to call from any thread.
class LinuxProcessActions : public IProcessActions
{
  public:
    [[nodiscard]] ProcessActionCapabilities actionCapabilities() const override;
    [[nodiscard]] ProcessActionResult terminate(std::int32_t pid) override;
};

} // namespace Platform
