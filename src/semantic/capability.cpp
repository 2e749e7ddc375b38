#include "capability.h"

QString capabilityName(Capability capability) {
    switch (capability) {
    case Capability::ChatCompletion:          return QStringLiteral("chat_completion");
    case Capability::StreamingChatCompletion: return QStringLiteral("streaming_chat_completion");
    }
    return QString();
}

std::optional<Capability> capabilityFromName(const QString& name) {
    if (name == QStringLiteral("chat_completion"))
        return Capability::ChatCompletion;
    if (name == QStringLiteral("streaming_chat_completion"))
        return Capability::StreamingChatCompletion;
    return std::nullopt;
}

QString inputModeName(InputMode mode) {
    switch (mode) {
    case InputMode::Messages:   return QStringLiteral("messages");
    case InputMode::SingleText: return QStringLiteral("single_text");
    case InputMode::Images:     return QStringLiteral("images");
    }
    return QString();
}

std::optional<InputMode> inputModeFromName(const QString& name) {
    if (name == QStringLiteral("messages"))
        return InputMode::Messages;
    if (name == QStringLiteral("single_text"))
        return InputMode::SingleText;
    if (name == QStringLiteral("images"))
        return InputMode::Images;
    return std::nullopt;
}

QString roleName(MessageRole role) {
    switch (role) {
    case MessageRole::System:    return QStringLiteral("system");
    case MessageRole::User:      return QStringLiteral("user");
    case MessageRole::Assistant: return QStringLiteral("assistant");
    }
    return QString();
}

std::optional<MessageRole> roleFromName(const QString& name) {
    if (name == QStringLiteral("system"))
        return MessageRole::System;
    if (name == QStringLiteral("user"))
        return MessageRole::User;
    if (name == QStringLiteral("assistant"))
        return MessageRole::Assistant;
    return std::nullopt;
}

std::optional<EndpointDescriptor> ModelCapabilities::endpoint(Capability capability) const {
    auto it = model.endpoints.constFind(capability);
    if (it == model.endpoints.constEnd())
        return std::nullopt;
    return it.value();
}
