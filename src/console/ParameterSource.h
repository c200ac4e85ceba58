/**
 * @file ParameterSource.h
 * @brief Where the source image path and the search ranges come from
 */

#ifndef CONSOLE_PARAMETER_SOURCE_H
#define CONSOLE_PARAMETER_SOURCE_H

#include "sweep/ParameterRange.h"
#include <QString>

namespace Console {

/**
 * @brief Supplier of a validated image path and a validated search space
 *
 * Implementations either ask until the input is valid (interactive) or fail
 * on the first invalid value (command line).
 */
class ParameterSource {
public:
    virtual ~ParameterSource() = default;

    /**
     * @param path Set to an existing file on success
     * @return false on unrecoverable input (closed stdin, invalid argument)
     */
    virtual bool imagePath(QString& path, QString* errorMsg = nullptr) = 0;

    /**
     * @param ranges Set to three parsed ranges on success (k >= 0)
     */
    virtual bool searchRanges(Sweep::SearchRanges& ranges, QString* errorMsg = nullptr) = 0;
};

/**
 * @brief Clean up a pasted path: trim, strip surrounding quotes, '\' -> '/'
 */
QString normalizePathInput(const QString& input);

} // namespace Console

#endif // CONSOLE_PARAMETER_SOURCE_H
