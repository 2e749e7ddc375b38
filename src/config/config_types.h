#pragma once
#include "semantic/version.h"
#include <QString>

struct EngineConfig {
    QString minSpecVersion = QStringLiteral("1.0.0");
    QString maxSpecVersion = QStringLiteral("2.0.0");   // exclusive
    int defaultTimeoutMs = 30000;
    qint64 maxResponseBytes = 32LL * 1024 * 1024;
    QString userAgent = QStringLiteral("specbridge/1.0");
    QString logDir;                                     // empty = no file log
    QString logLevel = QStringLiteral("info");
    bool debugMode = false;

    // Falls back to the default bound for any endpoint that does not parse.
    VersionRange versionRange() const {
        VersionRange range;
        if (auto min = SemVer::parse(minSpecVersion))
            range.min = *min;
        if (auto max = SemVer::parse(maxSpecVersion))
            range.max = *max;
        return range;
    }
};
