#ifndef ARNOLDSWEEP_CORE_VERSION_H
#define ARNOLDSWEEP_CORE_VERSION_H

namespace ArnoldSweep {
    /**
     * @brief Get the application version string.
     * @return The version string (e.g., "1.2.3").
     */
    const char* getVersion();
}

#endif // ARNOLDSWEEP_CORE_VERSION_H
