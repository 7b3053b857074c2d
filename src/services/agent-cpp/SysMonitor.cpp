#include "SysMonitor.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace {
bool ReadCpuTimes(const std::string& procRoot, unsigned long long& idle, unsigned long long& total) {
    std::ifstream statFile(procRoot + "/stat");
    if (!statFile.is_open()) {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line)) {
        return false;
    }

    std::istringstream iss(line);
    std::string label;
    iss >> label;
    if (label != "cpu") {
        return false;
    }

    unsigned long long user = 0;
    unsigned long long nice = 0;
    unsigned long long system = 0;
    unsigned long long idleVal = 0;
    unsigned long long iowait = 0;
    unsigned long long irq = 0;
    unsigned long long softirq = 0;
    unsigned long long steal = 0;

    // guest and guest_nice are already counted in user and nice.
    iss >> user >> nice >> system >> idleVal >> iowait >> irq >> softirq >> steal;

    idle = idleVal + iowait;
    total = user + nice + system + idleVal + iowait + irq + softirq + steal;
    return true;
}

bool ReadMemInfo(const std::string& procRoot, unsigned long long& totalKb, unsigned long long& availableKb) {
    std::ifstream memFile(procRoot + "/meminfo");
    if (!memFile.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
        }

        if (totalKb > 0 && availableKb > 0) {
            return true;
        }
    }

    return totalKb > 0;
}

bool ReadUptime(const std::string& procRoot, double& seconds) {
    std::ifstream uptimeFile(procRoot + "/uptime");
    return uptimeFile.is_open() && static_cast<bool>(uptimeFile >> seconds);
}

bool ReadDisk(const std::string& path, DiskMetrics& disk) {
    struct statvfs info;
    if (path.empty() || ::statvfs(path.c_str(), &info) != 0) {
        return false;
    }
    disk.name = path;
    disk.totalBytes = static_cast<uint64_t>(info.f_blocks) * info.f_frsize;
    disk.availableBytes = static_cast<uint64_t>(info.f_bavail) * info.f_frsize;
    return true;
}

std::string DescribeOs() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "Linux";
    }
    return std::string(info.sysname) + " " + info.release + " " + info.machine;
}
} // namespace

SysMonitor::SysMonitor(std::string diskPath, std::string procRoot)
    : diskPath_(std::move(diskPath)),
      procRoot_(std::move(procRoot)) {}

SystemMetrics SysMonitor::Collect() {
    SystemMetrics metrics;
    metrics.processorCount = static_cast<int>(std::thread::hardware_concurrency());
    metrics.osDescription = DescribeOs();

    unsigned long long idle = 0;
    unsigned long long total = 0;
    if (ReadCpuTimes(procRoot_, idle, total) && total > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (prevTotal_ > 0 && total > prevTotal_ && idle >= prevIdle_) {
            const unsigned long long idleDelta = idle - prevIdle_;
            const unsigned long long totalDelta = total - prevTotal_;
            const double idleShare = static_cast<double>(idleDelta) / static_cast<double>(totalDelta);
            metrics.cpuUsagePercent = idleShare >= 1.0 ? 0.0 : (1.0 - idleShare) * 100.0;
        }

        prevIdle_ = idle;
        prevTotal_ = total;
    }

    unsigned long long totalKb = 0;
    unsigned long long availableKb = 0;
    if (ReadMemInfo(procRoot_, totalKb, availableKb)) {
        metrics.totalMemoryBytes = totalKb * 1024ULL;
        metrics.availableMemoryBytes = availableKb * 1024ULL;
    }

    double uptimeSeconds = 0.0;
    if (ReadUptime(procRoot_, uptimeSeconds) && uptimeSeconds > 0.0) {
        metrics.systemUptime = std::chrono::seconds(static_cast<long long>(uptimeSeconds));
    }

    DiskMetrics disk;
    if (ReadDisk(diskPath_, disk)) {
        metrics.disks.push_back(std::move(disk));
    }

    return metrics;
}
