#include "ResourceManager.h"
#include "Logger.h"
#include <QThread>
#include <QThreadPool>
#include <cmath>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

#ifdef Q_OS_WIN
#include <windows.h>
#endif

#ifdef Q_OS_LINUX
#include <sys/sysinfo.h>
#endif

ResourceManager& ResourceManager::instance() {
    static ResourceManager _instance;
    return _instance;
}

ResourceManager::ResourceManager() {
    // Default safe fallback
    m_maxThreads = std::max(1, QThread::idealThreadCount() - 1);
}

void ResourceManager::init(int requestedThreads) {
    int totalCores = QThread::idealThreadCount();

    if (requestedThreads > 0) {
        m_maxThreads = requestedThreads;
    } else {
        // 90% rule, floored, at least one thread.
        // Example: 16 cores * 0.9 = 14.4 -> 14 threads.
        // Example: 4 cores * 0.9 = 3.6 -> 3 threads.
        m_maxThreads = std::max(1, static_cast<int>(std::floor(totalCores * 0.9)));
    }

    Logger::info(QString("CPU limit set to %1 threads (total: %2)").arg(m_maxThreads).arg(totalCores),
                 "ResourceManager");

#ifdef _OPENMP
    omp_set_num_threads(m_maxThreads);
    Logger::info("OpenMP configured", "ResourceManager");
#endif

    // Enforce limit on QtConcurrent global pool
    QThreadPool::globalInstance()->setMaxThreadCount(m_maxThreads);
}

int ResourceManager::maxThreads() const {
    return m_maxThreads;
}

double ResourceManager::getMemoryUsagePercent() const {
#ifdef Q_OS_WIN
    MEMORYSTATUSEX memInfo;
    memInfo.dwLength = sizeof(MEMORYSTATUSEX);
    if (GlobalMemoryStatusEx(&memInfo)) {
        return static_cast<double>(memInfo.dwMemoryLoad);
    }
#elif defined(Q_OS_LINUX)
    struct sysinfo memInfo;
    if (sysinfo(&memInfo) == 0) {
        long long total = memInfo.totalram;
        long long free = memInfo.freeram;
        total *= memInfo.mem_unit;
        free *= memInfo.mem_unit;
        if (total <= 0) return 0.0;
        return (1.0 - (double)free / total) * 100.0;
    }
#endif
    return 0.0; // Unknown
}

bool ResourceManager::isMemorySafe(size_t estimatedBytes) const {
    double usage = getMemoryUsagePercent();

    // If we can't measure, assume safe (don't block user)
    if (usage <= 0.1) return true;

    // Hard limit: 90%
    if (usage >= 90.0) {
        Logger::warning(QString("High memory usage detected: %1%").arg(usage, 0, 'f', 1), "ResourceManager");
        return false;
    }

    if (estimatedBytes == 0) return true;

#ifdef Q_OS_LINUX
    struct sysinfo memInfo;
    if (sysinfo(&memInfo) == 0) {
        const double total = static_cast<double>(memInfo.totalram) * memInfo.mem_unit;
        const double used = total * usage / 100.0;
        const double projected = (used + static_cast<double>(estimatedBytes)) / total * 100.0;
        if (projected >= 90.0) {
            Logger::warning(QString("Operation would exceed 90% RAM limit. Projected: %1%")
                                .arg(projected, 0, 'f', 1), "ResourceManager");
            return false;
        }
    }
#elif defined(Q_OS_WIN)
    MEMORYSTATUSEX memInfo;
    memInfo.dwLength = sizeof(MEMORYSTATUSEX);
    if (GlobalMemoryStatusEx(&memInfo)) {
        unsigned long long avail = memInfo.ullAvailPhys;
        if (estimatedBytes > avail) {
            Logger::warning(QString("Not enough physical RAM for operation. Needed: %1 Available: %2")
                                .arg(estimatedBytes).arg(avail), "ResourceManager");
            return false;
        }
        unsigned long long total = memInfo.ullTotalPhys;
        unsigned long long used = total - avail;
        double projected = (double)(used + estimatedBytes) / total * 100.0;
        if (projected >= 90.0) {
            Logger::warning(QString("Operation would exceed 90% RAM limit. Projected: %1%")
                                .arg(projected, 0, 'f', 1), "ResourceManager");
            return false;
        }
    }
#endif

    return true;
}
