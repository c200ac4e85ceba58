#include "ConsoleParameterSource.h"
#include "core/Logger.h"
#include "core/ErrorHandling.h"

namespace Console {

QString normalizePathInput(const QString& input)
{
    QString s = input.trimmed();
    while (!s.isEmpty() && (s.startsWith('"') || s.startsWith('\''))) s.remove(0, 1);
    while (!s.isEmpty() && (s.endsWith('"') || s.endsWith('\''))) s.chop(1);
    s.replace('\\', '/');
    return s;
}

ConsoleParameterSource::ConsoleParameterSource(QTextStream& in, QTextStream& out)
    : m_in(in), m_out(out)
{
}

bool ConsoleParameterSource::readLine(const QString& prompt, QString& line, QString* errorMsg)
{
    m_out << prompt;
    m_out.flush();

    QString raw;
    if (!m_in.readLineInto(&raw)) {
        if (errorMsg) *errorMsg = "Input closed before a value was entered";
        return false;
    }
    line = raw.trimmed();
    return true;
}

bool ConsoleParameterSource::imagePath(QString& path, QString* errorMsg)
{
    if (!m_presetPath.isEmpty()) {
        const QString p = normalizePathInput(m_presetPath);
        if (!validateFileExists(p, errorMsg)) return false;
        path = p;
        return true;
    }

    for (;;) {
        QString line;
        if (!readLine("Image path: ", line, errorMsg)) return false;

        const QString p = normalizePathInput(line);
        QString pathError;
        if (validateFileExists(p, &pathError)) {
            path = p;
            return true;
        }
        m_out << pathError << "\n";
        Logger::debug(QString("Rejected image path '%1'").arg(line), "Console");
    }
}

bool ConsoleParameterSource::readRange(const QString& prompt, bool isIterations,
                                       Sweep::ParameterRange& range, QString* errorMsg)
{
    for (;;) {
        QString line;
        if (!readLine(prompt, line, errorMsg)) return false;

        const Result<Sweep::ParameterRange> parsed = Sweep::ParameterRange::parse(line);
        if (parsed.isError()) {
            m_out << "Invalid format (" << parsed.error()
                  << "). Enter a single number (e.g. '8') or a range (e.g. '0-10')\n";
            continue;
        }
        QString rangeError;
        if (isIterations && !Sweep::SearchRanges::validateIterations(parsed.value(), &rangeError)) {
            m_out << rangeError << "\n";
            continue;
        }
        range = parsed.value();
        return true;
    }
}

bool ConsoleParameterSource::searchRanges(Sweep::SearchRanges& ranges, QString* errorMsg)
{
    if (!(m_presetK && m_presetA && m_presetB)) {
        m_out << "Enter the parameter ranges to sweep\n";
    }

    if (m_presetK) ranges.iterations = *m_presetK;
    else if (!readRange("   - iterations k (e.g. '8' or '0-10'): ", true, ranges.iterations, errorMsg)) return false;

    if (m_presetA) ranges.a = *m_presetA;
    else if (!readRange("   - coefficient a (e.g. '8' or '0-10'): ", false, ranges.a, errorMsg)) return false;

    if (m_presetB) ranges.b = *m_presetB;
    else if (!readRange("   - coefficient b (e.g. '8' or '0-10'): ", false, ranges.b, errorMsg)) return false;

    return ranges.validate(errorMsg);
}

} // namespace Console
