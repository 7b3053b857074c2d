#pragma once

#include "ControlPlaneMessages.hpp"

#include <mutex>
#include <string>

// Samples host metrics for heartbeats. CPU usage is the busy share of jiffies since the previous
// Collect(), so the first sample reports 0.
class SysMonitor {
public:
    // `diskPath` is the mount whose free space is reported; `procRoot` is overridable for tests.
    explicit SysMonitor(std::string diskPath, std::string procRoot = "/proc");

    SystemMetrics Collect();

private:
    std::string diskPath_;
    std::string procRoot_;

    std::mutex mutex_;
    unsigned long long prevIdle_ = 0;
    unsigned long long prevTotal_ = 0;
};
