#include "engine.h"
#include "log_manager.h"
#include "adapters/capability/spec_resolver.h"
#include "adapters/executor/qt_executor.h"
#include "adapters/outbound/multi_router.h"
#include "semantic/spec_parser.h"
#include "semantic/validate.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <limits>

namespace {

QByteArray toDocument(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Indented);
}

ExecutorOptions executorOptions(const EngineConfig& config) {
    ExecutorOptions options;
    options.defaultTimeoutMs = config.defaultTimeoutMs;
    options.maxResponseBytes = config.maxResponseBytes;
    options.userAgent = config.userAgent;
    return options;
}

// The provider spec may arrive embedded as an object or as a JSON string.
Result<ProviderSpec> embeddedProviderSpec(const QJsonValue& value) {
    if (value.isObject())
        return SpecParser::providerFromJson(value.toObject());
    if (value.isString())
        return SpecParser::parseProvider(value.toString().toUtf8());
    return std::unexpected(DomainFailure::invalidInput(
        QStringLiteral("invalid_type"), QStringLiteral("$.provider_spec: expected an object")));
}

} // namespace

Engine::Engine(const EngineConfig& config)
    : Engine(config, Ports{OutboundRouter::withBuiltins(),
                           std::make_shared<const SpecCapabilityResolver>(),
                           std::make_shared<const QtExecutor>(executorOptions(config))}) {
}

Engine::Engine(const EngineConfig& config, Ports ports)
    : m_config(config)
    , m_ports(std::move(ports))
    , m_translator(m_ports.adapters) {
}

Result<QByteArray> Engine::translate(const QByteArray& promptSpec,
                                     const QByteArray& providerSpec,
                                     const QString& modelId,
                                     const QString& mode) const {
    const auto translationMode = translationModeFromName(mode);
    if (!translationMode)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_mode"),
            QStringLiteral("unknown translation mode '%1' (expected standard or strict)").arg(mode)));

    auto prompt = SpecParser::parsePrompt(promptSpec);
    if (!prompt)
        return std::unexpected(prompt.error());
    auto provider = SpecParser::parseProvider(providerSpec);
    if (!provider)
        return std::unexpected(provider.error());

    auto result = translate(*prompt, *provider, modelId, *translationMode);
    if (!result)
        return std::unexpected(result.error());
    return toDocument(result->toJson());
}

Result<TranslationResult> Engine::translate(const PromptSpec& prompt,
                                            const ProviderSpec& provider,
                                            const QString& modelId,
                                            TranslationMode mode) const {
    if (prompt.messages.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("empty_messages"), QStringLiteral("prompt has no messages")));
    if (!m_ports.capabilities)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no capability resolver configured")));

    auto caps = m_ports.capabilities->resolve(provider, modelId);
    if (!caps) {
        LogManager::instance().log(LogManager::Info, "translate",
            QStringLiteral("resolve %1 failed: %2").arg(modelId, caps.error().message));
        return std::unexpected(caps.error());
    }
    return m_translator.translate(prompt, *caps, mode);
}

Result<QByteArray> Engine::run(const QByteArray& providerRequest,
                               int timeoutSeconds,
                               const CancelToken* cancel) const {
    if (timeoutSeconds < 0)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_timeout"), QStringLiteral("timeout_seconds must not be negative")));

    auto root = SpecParser::parseDocument(providerRequest);
    if (!root)
        return std::unexpected(root.error());
    auto request = requestFromDocument(*root);
    if (!request)
        return std::unexpected(request.error());

    // Saturates at INT_MAX milliseconds.
    const qint64 timeoutMs = qMin<qint64>(static_cast<qint64>(timeoutSeconds) * 1000,
                                          std::numeric_limits<int>::max());
    auto outcome = run(*request, static_cast<int>(timeoutMs), cancel);
    if (!outcome)
        return std::unexpected(outcome.error());
    return toDocument(*outcome);
}

Result<QJsonObject> Engine::run(const ProviderRequest& request,
                                int timeoutMs,
                                const CancelToken* cancel) const {
    if (!m_ports.executor)
        return std::unexpected(DomainFailure::internal(QStringLiteral("no executor configured")));

    auto outcome = m_ports.executor->execute(request, timeoutMs, cancel);
    if (!outcome)
        return std::unexpected(outcome.error());
    return outcomeToJson(*outcome);
}

Result<ProviderRequest> Engine::requestFromDocument(const QJsonObject& root) const {
    if (root.contains(QStringLiteral("provider_request_json")))
        return requestFromTranslation(root);
    if (root.contains(QStringLiteral("provider_spec")))
        return requestFromProviderSpec(root);
    return std::unexpected(DomainFailure::invalidInput(
        QStringLiteral("missing_field"),
        QStringLiteral("$: expected provider_request_json or provider_spec")));
}

Result<ProviderRequest> Engine::requestFromTranslation(const QJsonObject& root) const {
    const QJsonValue payload = root.value(QStringLiteral("provider_request_json"));
    if (!payload.isObject())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_type"), QStringLiteral("$.provider_request_json: expected an object")));

    const QJsonObject endpoint = root.value(QStringLiteral("endpoint")).toObject();
    const QString url = endpoint.value(QStringLiteral("url")).toString();
    if (url.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_field"), QStringLiteral("$.endpoint.url: required")));

    ProviderRequest req;
    req.capability = capabilityFromName(endpoint.value(QStringLiteral("capability")).toString())
                         .value_or(Capability::ChatCompletion);
    req.method = endpoint.value(QStringLiteral("method")).toString(QStringLiteral("POST")).toUpper();
    req.protocol = endpoint.value(QStringLiteral("protocol")).toString(QStringLiteral("http")).toLower();
    req.url = url;
    req.body = QJsonDocument(payload.toObject()).toJson(QJsonDocument::Compact);
    req.adapterHint = root.value(QStringLiteral("metadata")).toObject()
                          .value(QStringLiteral("adapter")).toString();

    const QJsonObject headers = root.value(QStringLiteral("headers")).toObject();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        req.headers.insert(it.key(), it.value().toString());
    return req;
}

Result<ProviderRequest> Engine::requestFromProviderSpec(const QJsonObject& root) const {
    auto spec = embeddedProviderSpec(root.value(QStringLiteral("provider_spec")));
    if (!spec)
        return std::unexpected(spec.error());

    const QString modelId = root.value(QStringLiteral("model_id")).toString();
    if (modelId.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_field"), QStringLiteral("$.model_id: required")));
    const QJsonValue body = root.value(QStringLiteral("request"));
    if (!body.isObject())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_type"), QStringLiteral("$.request: expected an object")));

    if (!m_ports.capabilities || !m_ports.adapters)
        return std::unexpected(DomainFailure::internal(QStringLiteral("engine ports are not configured")));
    auto caps = m_ports.capabilities->resolve(*spec, modelId);
    if (!caps)
        return std::unexpected(caps.error());

    const bool wantsStream = body.toObject().value(QStringLiteral("stream")).toBool(false);
    Capability capability = Capability::ChatCompletion;
    if (wantsStream && caps->hasEndpoint(Capability::StreamingChatCompletion))
        capability = Capability::StreamingChatCompletion;
    auto endpoint = caps->endpoint(capability);
    if (!endpoint)
        return std::unexpected(DomainFailure::notImplemented(
            QStringLiteral("missing_endpoint"),
            QStringLiteral("model '%1' has no %2 endpoint").arg(caps->model.id, capabilityName(capability))));

    const IOutboundAdapter* adapter = m_ports.adapters->resolve(*caps);
    if (!adapter) {
        LogManager::instance().log(LogManager::Error, "execute",
            QStringLiteral("no payload dialect for provider=%1 model=%2").arg(caps->providerName, caps->model.id));
        return std::unexpected(DomainFailure::internal(QStringLiteral("no payload dialect registered")));
    }

    const QString path = QString(endpoint->path).replace(QStringLiteral("{model}"), caps->model.id);

    ProviderRequest req;
    req.capability = capability;
    req.method = endpoint->method;
    req.protocol = endpoint->protocol;
    req.url = Translator::joinUrl(caps->baseUrl, path, endpoint->query);
    req.headers = Translator::requestHeaders(*adapter, *caps, *endpoint);
    req.body = QJsonDocument(body.toObject()).toJson(QJsonDocument::Compact);
    req.adapterHint = adapter->adapterId();
    return req;
}

QJsonObject Engine::outcomeToJson(const ExecutionOutcome& outcome) const {
    const ProviderRequest& req = outcome.request;

    QJsonObject endpoint;
    endpoint["capability"] = capabilityName(req.capability);
    endpoint["method"] = req.method;
    endpoint["protocol"] = req.protocol;
    endpoint["url"] = req.url;

    QJsonObject root;
    root["success"] = true;
    root["status"] = outcome.response.statusCode;
    root["endpoint"] = endpoint;
    root["elapsed_ms"] = outcome.elapsedMs;

    const IOutboundAdapter* adapter = m_ports.adapters ? m_ports.adapters->byId(req.adapterHint) : nullptr;

    if (!outcome.events.isEmpty()) {
        QJsonArray events;
        QString streamed;
        for (const ProviderChunk& chunk : outcome.events) {
            QJsonParseError err;
            const QJsonDocument doc = QJsonDocument::fromJson(chunk.data, &err);
            if (err.error == QJsonParseError::NoError && doc.isObject())
                events.append(doc.object());
            else
                events.append(QString::fromUtf8(chunk.data));

            if (!adapter)
                continue;
            auto delta = adapter->parseChunk(chunk);
            if (delta) {
                streamed += *delta;
            } else {
                LogManager::instance().log(LogManager::Warning, "execute",
                    QStringLiteral("skipping undecodable %1 event: %2").arg(req.adapterHint, delta.error().message));
            }
        }
        root["events"] = events;
        root["response"] = QString::fromUtf8(outcome.response.body);

        NormalizedResponse normalized;
        if (!streamed.isEmpty())
            normalized.content = streamed;
        root["normalized"] = normalized.toJson();
        return root;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(outcome.response.body, &err);
    if (err.error == QJsonParseError::NoError && !doc.isNull())
        root["response"] = doc.isObject() ? QJsonValue(doc.object()) : QJsonValue(doc.array());
    else
        root["response"] = QString::fromUtf8(outcome.response.body);

    if (adapter) {
        auto normalized = adapter->parseResponse(outcome.response);
        if (normalized)
            root["normalized"] = normalized->toJson();
        else
            LogManager::instance().log(LogManager::Warning, "execute",
                QStringLiteral("response not normalized: %1").arg(normalized.error().message));
    }
    return root;
}

Result<QByteArray> Engine::validate(const QByteArray& spec,
                                    const QString& specType,
                                    const QString& mode) const {
    auto report = Validate::document(spec, specType, mode, m_config.versionRange());
    if (!report)
        return std::unexpected(report.error());
    return toDocument(report->toJson());
}

ValidationReport Engine::validate(const QJsonValue& spec, SpecKind kind, ValidationMode mode) const {
    return Validate::spec(spec, kind, mode, m_config.versionRange());
}
