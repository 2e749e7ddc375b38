#pragma once
#include "provider.h"
#include <QMap>
#include <QString>
#include <optional>

QString capabilityName(Capability capability);
std::optional<Capability> capabilityFromName(const QString& name);

QString inputModeName(InputMode mode);
std::optional<InputMode> inputModeFromName(const QString& name);

QString roleName(MessageRole role);
std::optional<MessageRole> roleFromName(const QString& name);

// Read-only facts about one resolved model, as seen by the translator.
struct ModelCapabilities {
    QString providerName;
    QString baseUrl;
    QMap<QString, QString> providerHeaders;
    ModelSpec model;

    bool supports(InputMode mode) const { return model.inputModes.value(mode, false); }
    bool hasEndpoint(Capability capability) const { return model.endpoints.contains(capability); }
    std::optional<EndpointDescriptor> endpoint(Capability capability) const;
};
