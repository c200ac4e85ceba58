#include "ArgumentParameterSource.h"
#include "core/ErrorHandling.h"

namespace Console {

namespace {

bool parseOption(const QString& name, const QString& text, Sweep::ParameterRange& out, QString* errorMsg)
{
    const Result<Sweep::ParameterRange> r = Sweep::ParameterRange::parse(text);
    if (r.isError()) {
        if (errorMsg) *errorMsg = QString("Invalid value for %1: %2").arg(name, r.error());
        return false;
    }
    out = r.value();
    return true;
}

} // namespace

ArgumentParameterSource::ArgumentParameterSource(const QString& imagePath, const QString& iterations,
                                                 const QString& a, const QString& b)
    : m_imagePath(imagePath), m_iterations(iterations), m_a(a), m_b(b)
{
}

bool ArgumentParameterSource::isComplete(const QString& imagePath, const QString& iterations,
                                         const QString& a, const QString& b)
{
    return !imagePath.trimmed().isEmpty() && !iterations.trimmed().isEmpty()
           && !a.trimmed().isEmpty() && !b.trimmed().isEmpty();
}

bool ArgumentParameterSource::imagePath(QString& path, QString* errorMsg)
{
    const QString p = normalizePathInput(m_imagePath);
    if (!validateFileExists(p, errorMsg)) return false;
    path = p;
    return true;
}

bool ArgumentParameterSource::searchRanges(Sweep::SearchRanges& ranges, QString* errorMsg)
{
    Sweep::SearchRanges r;
    if (!parseOption("--iterations", m_iterations, r.iterations, errorMsg)) return false;
    if (!parseOption("--coef-a", m_a, r.a, errorMsg)) return false;
    if (!parseOption("--coef-b", m_b, r.b, errorMsg)) return false;
    if (!r.validate(errorMsg)) return false;
    ranges = r;
    return true;
}

} // namespace Console
