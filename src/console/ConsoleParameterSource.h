#ifndef CONSOLE_CONSOLE_PARAMETER_SOURCE_H
#define CONSOLE_CONSOLE_PARAMETER_SOURCE_H

#include "ParameterSource.h"
#include <QTextStream>
#include <optional>

namespace Console {

/**
 * @brief Interactive source: prompts on a text stream and re-prompts until valid
 *
 * Values already known from the command line can be preset; their prompts
 * are skipped. End of input is reported as an error.
 */
class ConsoleParameterSource : public ParameterSource {
public:
    ConsoleParameterSource(QTextStream& in, QTextStream& out);

    void presetImagePath(const QString& path) { m_presetPath = path; }
    void presetIterations(const Sweep::ParameterRange& r) { m_presetK = r; }
    void presetA(const Sweep::ParameterRange& r) { m_presetA = r; }
    void presetB(const Sweep::ParameterRange& r) { m_presetB = r; }

    bool imagePath(QString& path, QString* errorMsg = nullptr) override;
    bool searchRanges(Sweep::SearchRanges& ranges, QString* errorMsg = nullptr) override;

private:
    bool readLine(const QString& prompt, QString& line, QString* errorMsg);
    bool readRange(const QString& prompt, bool isIterations, Sweep::ParameterRange& range, QString* errorMsg);

    QTextStream& m_in;
    QTextStream& m_out;
    QString m_presetPath;
    std::optional<Sweep::ParameterRange> m_presetK;
    std::optional<Sweep::ParameterRange> m_presetA;
    std::optional<Sweep::ParameterRange> m_presetB;
};

} // namespace Console

#endif // CONSOLE_CONSOLE_PARAMETER_SOURCE_H
