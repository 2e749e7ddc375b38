#pragma once
#include <QString>
#include <optional>

// MAJOR.MINOR.PATCH with numeric field ordering. Pre-release and build
// metadata suffixes are accepted but never compared.
struct SemVer {
    int majorVersion = 0;
    int minorVersion = 0;
    int patchVersion = 0;

    static std::optional<SemVer> parse(const QString& text);
    QString toString() const;

    friend bool operator==(const SemVer& a, const SemVer& b) {
        return a.majorVersion == b.majorVersion && a.minorVersion == b.minorVersion && a.patchVersion == b.patchVersion;
    }
    friend bool operator<(const SemVer& a, const SemVer& b) {
        if (a.majorVersion != b.majorVersion) return a.majorVersion < b.majorVersion;
        if (a.minorVersion != b.minorVersion) return a.minorVersion < b.minorVersion;
        return a.patchVersion < b.patchVersion;
    }
};

// Half-open range [min, max).
struct VersionRange {
    SemVer min{1, 0, 0};
    SemVer max{2, 0, 0};

    bool contains(const SemVer& v) const { return !(v < min) && v < max; }
    QString toString() const {
        return QStringLiteral("[%1, %2)").arg(min.toString(), max.toString());
    }
};
