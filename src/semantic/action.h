#pragma once
#include <QString>
#include <QJsonObject>
#include <optional>

struct ActionSpec {
    QString name;
    QString description;
    QJsonObject parameters;
};

struct ToolChoice {
    enum class Mode : quint8 { Auto, Required, None, Specific };
    Mode mode = Mode::Auto;
    QString name;
};

struct ResponseFormat {
    enum class Type : quint8 { Text, JsonObject, JsonSchema };
    Type type = Type::Text;
    QJsonObject schema;
    std::optional<bool> strict;

    bool wantsJson() const { return type != Type::Text; }
};
