#pragma once
#include "config/config_types.h"
#include "semantic/diagnostic.h"
#include "semantic/ports.h"
#include "semantic/translator.h"
#include <QByteArray>
#include <QJsonObject>
#include <memory>

class CancelToken;

// Stateless facade over parse -> resolve -> translate -> execute. All methods
// are const; one engine may serve any number of threads.
class Engine {
public:
    struct Ports {
        std::shared_ptr<const IAdapterRegistry> adapters;
        std::shared_ptr<const ICapabilityResolver> capabilities;
        std::shared_ptr<const IExecutor> executor;
    };

    // Wires the built-in dialects, the spec resolver and the Qt executor.
    explicit Engine(const EngineConfig& config = {});
    Engine(const EngineConfig& config, Ports ports);

    const EngineConfig& config() const { return m_config; }

    Result<QByteArray> translate(const QByteArray& promptSpec,
                                 const QByteArray& providerSpec,
                                 const QString& modelId,
                                 const QString& mode) const;
    Result<TranslationResult> translate(const PromptSpec& prompt,
                                        const ProviderSpec& provider,
                                        const QString& modelId,
                                        TranslationMode mode) const;

    // Accepts a translate() document or {"provider_spec", "model_id", "request"}.
    Result<QByteArray> run(const QByteArray& providerRequest,
                           int timeoutSeconds,
                           const CancelToken* cancel = nullptr) const;
    Result<QJsonObject> run(const ProviderRequest& request,
                            int timeoutMs,
                            const CancelToken* cancel = nullptr) const;

    Result<QByteArray> validate(const QByteArray& spec,
                                const QString& specType,
                                const QString& mode) const;
    ValidationReport validate(const QJsonValue& spec, SpecKind kind, ValidationMode mode) const;

    Result<ProviderRequest> requestFromDocument(const QJsonObject& root) const;

private:
    EngineConfig m_config;
    Ports m_ports;
    Translator m_translator;

    Result<ProviderRequest> requestFromTranslation(const QJsonObject& root) const;
    Result<ProviderRequest> requestFromProviderSpec(const QJsonObject& root) const;
    QJsonObject outcomeToJson(const ExecutionOutcome& outcome) const;
};
