#pragma once
#include "types.h"
#include <QJsonObject>
#include <QList>
#include <QString>

QString severityName(Severity severity);
QString lossinessCodeName(LossinessCode code);

// A non-fatal note describing a degradation applied during translation.
struct Diagnostic {
    LossinessCode code = LossinessCode::Drop;
    QString feature;
    QString path;
    QString message;
    Severity severity = Severity::Warning;

    QJsonObject toJson() const;
};

using DiagnosticList = QList<Diagnostic>;

struct Finding {
    Severity severity = Severity::Error;
    QString path;
    QString message;

    QJsonObject toJson() const;
};

struct ValidationReport {
    SpecKind kind = SpecKind::PromptSpec;
    ValidationMode mode = ValidationMode::Basic;
    QList<Finding> findings;

    void error(const QString& path, const QString& message) {
        findings.append({Severity::Error, path, message});
    }
    void warning(const QString& path, const QString& message) {
        findings.append({Severity::Warning, path, message});
    }

    bool isValid() const;
    int errorCount() const;
    int warningCount() const;
    QJsonObject toJson() const;
};
