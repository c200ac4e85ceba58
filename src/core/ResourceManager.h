#ifndef RESOURCEMANAGER_H
#define RESOURCEMANAGER_H

#include <QtGlobal>
#include <cstddef>

/**
 * @brief Manages system resource limits (CPU/RAM)
 *
 * Default policy: use at most 90% of the logical cores and warn before an
 * operation would push RAM usage past 90%.
 */
class ResourceManager {
public:
    static ResourceManager& instance();

    /**
     * @brief Initialize resource limits
     * @param requestedThreads Explicit thread budget; 0 applies the 90% rule.
     *
     * Also configures the OpenMP default team size and the global QThreadPool.
     */
    void init(int requestedThreads = 0);

    /**
     * @brief Get the maximum number of threads allowed
     * @return Thread budget, minimum 1
     */
    int maxThreads() const;

    /**
     * @brief Check if specific amount of memory can be allocated without exceeding 90% system load
     * @param estimatedBytes Bytes intended to be allocated
     * @return true if safe to proceed
     */
    bool isMemorySafe(size_t estimatedBytes = 0) const;

    /**
     * @brief Get current system memory usage percentage
     */
    double getMemoryUsagePercent() const;

private:
    ResourceManager();
    ~ResourceManager() = default;
    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    int m_maxThreads = 1;
};

#endif // RESOURCEMANAGER_H
