#pragma once
#include "diagnostic.h"
#include "ports.h"
#include "version.h"
#include <QByteArray>
#include <QJsonObject>

std::optional<SpecKind> specKindFromName(const QString& name);
std::optional<ValidationMode> validationModeFromName(const QString& name);

// Schema validation. A spec that breaks the rules is described by the report;
// only an unusable invocation (unknown spec type or mode, unreadable bytes)
// comes back as a failure.
namespace Validate {
    Result<ValidationReport> document(const QByteArray& bytes,
                                      const QString& specType,
                                      const QString& mode,
                                      const VersionRange& supported = {});

    ValidationReport spec(const QJsonValue& root, SpecKind kind,
                          ValidationMode mode, const VersionRange& supported = {});
    ValidationReport promptSpec(const QJsonValue& root, ValidationMode mode,
                                const VersionRange& supported = {});
    ValidationReport providerSpec(const QJsonValue& root, ValidationMode mode,
                                  const VersionRange& supported = {});
}
