#include "version.h"
#include <QStringList>

static bool parseField(const QString& field, int& out) {
    if (field.isEmpty()) return false;
    for (QChar c : field) {
        if (!c.isDigit()) return false;
    }
    // No leading zeros, except "0" itself.
    if (field.size() > 1 && field.front() == QLatin1Char('0')) return false;
    bool ok = false;
    out = field.toInt(&ok);
    return ok;
}

std::optional<SemVer> SemVer::parse(const QString& text) {
    QString core = text.trimmed();
    const qsizetype meta = core.indexOf(QLatin1Char('+'));
    if (meta >= 0) core.truncate(meta);
    const qsizetype pre = core.indexOf(QLatin1Char('-'));
    if (pre >= 0) core.truncate(pre);

    const QStringList parts = core.split(QLatin1Char('.'));
    if (parts.size() != 3) return std::nullopt;

    SemVer v;
    if (!parseField(parts[0], v.majorVersion)) return std::nullopt;
    if (!parseField(parts[1], v.minorVersion)) return std::nullopt;
    if (!parseField(parts[2], v.patchVersion)) return std::nullopt;
    return v;
}

QString SemVer::toString() const {
    return QStringLiteral("%1.%2.%3").arg(majorVersion).arg(minorVersion).arg(patchVersion);
}
