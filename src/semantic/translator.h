#pragma once
#include "ports.h"
#include "diagnostic.h"
#include "policy.h"
#include <QJsonObject>
#include <memory>

std::optional<TranslationMode> translationModeFromName(const QString& name);
QString translationModeName(TranslationMode mode);

struct TranslationResult {
    QJsonObject payload;
    Capability capability = Capability::ChatCompletion;
    EndpointDescriptor endpoint;    // path already has {model} substituted
    QString url;
    QMap<QString, QString> headers; // ${ENV:...} references left unexpanded
    DiagnosticList diagnostics;
    QString adapterId;
    QString providerName;
    QString modelId;
    QString family;
    TranslationMode mode = TranslationMode::Standard;

    QJsonObject toJson() const;
    ProviderRequest toProviderRequest() const;
};

class Translator {
public:
    explicit Translator(std::shared_ptr<const IAdapterRegistry> adapters);

    Result<TranslationResult> translate(const PromptSpec& prompt,
                                        const ModelCapabilities& caps,
                                        TranslationMode mode) const;

    // Moves top-level payload fields to the dotted provider paths a model declares.
    static void applyPathMappings(QJsonObject& payload, const QMap<QString, QString>& mappings);
    // Dialect defaults, then provider headers, then endpoint headers; names compare case-insensitively.
    static QMap<QString, QString> requestHeaders(const IOutboundAdapter& adapter,
                                                 const ModelCapabilities& caps,
                                                 const EndpointDescriptor& endpoint);
    static QString joinUrl(const QString& baseUrl, const QString& path, const QMap<QString, QString>& query);

private:
    std::shared_ptr<const IAdapterRegistry> m_adapters;

    static void applyFallback(Fallback fallback, const FeatureGap& gap, const ModelCapabilities& caps,
                              PromptSpec& working, Capability& capability, Diagnostic& diag);
};
