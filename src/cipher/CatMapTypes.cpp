#include "CatMapTypes.h"
#include <QFileInfo>
#include <QStringList>

namespace Cipher {

QString TransformParams::fileName(const QString& extension) const {
    return QString("%1_%2_%3.%4").arg(iterations).arg(a).arg(b).arg(extension);
}

std::optional<TransformParams> TransformParams::fromFileName(const QString& fileName) {
    // completeBaseName keeps "-" signs and drops only the last suffix
    const QString base = QFileInfo(fileName).completeBaseName();
    const QStringList parts = base.split('_');
    if (parts.size() != 3) {
        return std::nullopt;
    }

    bool okK = false, okA = false, okB = false;
    TransformParams p;
    p.iterations = parts[0].toInt(&okK);
    p.a = parts[1].toLongLong(&okA);
    p.b = parts[2].toLongLong(&okB);
    if (!okK || !okA || !okB || p.iterations < 0) {
        return std::nullopt;
    }
    return p;
}

QString TransformParams::toString() const {
    return QString("k=%1 a=%2 b=%3").arg(iterations).arg(a).arg(b);
}

} // namespace Cipher
