#include "diagnostic.h"
#include <QJsonArray>

QString severityName(Severity severity) {
    switch (severity) {
    case Severity::Info:    return QStringLiteral("info");
    case Severity::Warning: return QStringLiteral("warning");
    case Severity::Error:   return QStringLiteral("error");
    }
    return QString();
}

QString lossinessCodeName(LossinessCode code) {
    switch (code) {
    case LossinessCode::Clamp:       return QStringLiteral("Clamp");
    case LossinessCode::Drop:        return QStringLiteral("Drop");
    case LossinessCode::Emulate:     return QStringLiteral("Emulate");
    case LossinessCode::MapFallback: return QStringLiteral("MapFallback");
    case LossinessCode::Unsupported: return QStringLiteral("Unsupported");
    }
    return QString();
}

QJsonObject Diagnostic::toJson() const {
    QJsonObject obj;
    obj["code"] = lossinessCodeName(code);
    obj["feature"] = feature;
    obj["path"] = path;
    obj["message"] = message;
    obj["severity"] = severityName(severity);
    return obj;
}

QJsonObject Finding::toJson() const {
    QJsonObject obj;
    obj["severity"] = severityName(severity);
    obj["path"] = path;
    obj["message"] = message;
    return obj;
}

bool ValidationReport::isValid() const {
    return errorCount() == 0;
}

int ValidationReport::errorCount() const {
    int n = 0;
    for (const auto& f : findings) {
        if (f.severity == Severity::Error) ++n;
    }
    return n;
}

int ValidationReport::warningCount() const {
    int n = 0;
    for (const auto& f : findings) {
        if (f.severity == Severity::Warning) ++n;
    }
    return n;
}

QJsonObject ValidationReport::toJson() const {
    QJsonArray all;
    QJsonArray errors;
    QJsonArray warnings;
    for (const auto& f : findings) {
        all.append(f.toJson());
        const QString line = f.path.isEmpty() ? f.message : f.path + QStringLiteral(": ") + f.message;
        if (f.severity == Severity::Error)
            errors.append(line);
        else if (f.severity == Severity::Warning)
            warnings.append(line);
    }

    static const char* modeNames[] = {"basic", "partial", "strict"};
    QJsonObject root;
    root["is_valid"] = isValid();
    root["spec_type"] = kind == SpecKind::PromptSpec ? QStringLiteral("prompt_spec")
                                                     : QStringLiteral("provider_spec");
    root["mode"] = QString::fromLatin1(modeNames[static_cast<int>(mode)]);
    root["findings"] = all;
    root["errors"] = errors;
    root["warnings"] = warnings;
    return root;
}
