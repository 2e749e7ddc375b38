#pragma once
#include "ports.h"
#include "request.h"
#include "provider.h"
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <variant>

using ParsedSpec = std::variant<PromptSpec, ProviderSpec>;

// Pure functions from document bytes to typed specs. Invalid UTF-8 yields
// Utf8Error, broken JSON yields JsonError, a well-formed document of the wrong
// shape yields InvalidInput with a $-rooted locator in the message.
class SpecParser {
public:
    static Result<QJsonDocument> parseJson(const QByteArray& bytes);
    static Result<QJsonObject> parseDocument(const QByteArray& bytes);

    static Result<PromptSpec> parsePrompt(const QByteArray& bytes);
    static Result<PromptSpec> promptFromJson(const QJsonObject& root);

    static Result<ProviderSpec> parseProvider(const QByteArray& bytes);
    static Result<ProviderSpec> providerFromJson(const QJsonObject& root);

    static Result<ParsedSpec> parse(SpecKind kind, const QByteArray& bytes);

    // Accepts {"prompt": {...}, "config": {...}} as well as a bare prompt.
    static QJsonObject unwrapPrompt(const QJsonObject& root);
};
