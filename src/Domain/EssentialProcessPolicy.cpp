#include "EssentialProcessPolicy.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace Domain
{

EssentialProcessPolicy::EssentialProcessPolicy() : EssentialProcessPolicy(defaultProtectedPids(), defaultProtectedNames())
{
}

EssentialProcessPolicy::EssentialProcessPolicy(std::vector<std::int32_t> protectedPids, std::vector<std::string> protectedNames)
    : m_ProtectedPids(protectedPids.begin(), protectedPids.end())
{
    for (auto& name : protectedNames)
    {
        if (name.empty())
        {
            continue;
        }
        if (name.size() > KERNEL_COMM_MAX_LENGTH)
        {
            m_TruncatedNames.insert(name.substr(0, KERNEL_COMM_MAX_LENGTH));
        }
        m_ProtectedNames.insert(std::move(name));
    }

    spdlog::debug("EssentialProcessPolicy: {} protected PIDs, {} protected names", m_ProtectedPids.size(), m_ProtectedNames.size());
}

bool EssentialProcessPolicy::isEssential(std::int32_t pid, std::string_view name) const
{
    return isProtectedPid(pid) || isProtectedName(name);
}

std::vector<std::int32_t> EssentialProcessPolicy::defaultProtectedPids()
{
    // 0 = kernel / swapper, 1 = init (launchd, systemd)
    return {0, 1};
}

std::vector<std::string> EssentialProcessPolicy::defaultProtectedNames()
{
    return {
        // macOS system daemons
        "kernel_task",
        "launchd",
        "WindowServer",
        "hidd",
        "distnoted",
        "powerd",
        "loginwindow",
        "systemstats",
        "notifyd",
        "syslogd",
        "mdworker",
        "mds",
        "mds_stores",
        "bluetoothd",
        "configd",
        // Linux counterparts
        "systemd",
        "init",
        "kthreadd",
        "systemd-journald",
        "systemd-logind",
        "systemd-udevd",
        "dbus-daemon",
        "dbus-broker",
        "Xorg",
        "Xwayland",
        "gnome-shell",
        "kwin_wayland",
        "kwin_x11",
        "sddm",
        "gdm",
        "NetworkManager",
        "sshd",
    };
}

} // namespace Domain
