#ifndef CONSOLE_ARGUMENT_PARAMETER_SOURCE_H
#define CONSOLE_ARGUMENT_PARAMETER_SOURCE_H

#include "ParameterSource.h"

namespace Console {

/**
 * @brief Non-interactive source built from command-line values
 *
 * Any invalid value is an error; nothing is asked.
 */
class ArgumentParameterSource : public ParameterSource {
public:
    ArgumentParameterSource(const QString& imagePath, const QString& iterations,
                            const QString& a, const QString& b);

    /**
     * @brief True when every value is present, so nothing has to be asked
     */
    static bool isComplete(const QString& imagePath, const QString& iterations,
                           const QString& a, const QString& b);

    bool imagePath(QString& path, QString* errorMsg = nullptr) override;
    bool searchRanges(Sweep::SearchRanges& ranges, QString* errorMsg = nullptr) override;

private:
    QString m_imagePath;
    QString m_iterations;
    QString m_a;
    QString m_b;
};

} // namespace Console

#endif // CONSOLE_ARGUMENT_PARAMETER_SOURCE_H
