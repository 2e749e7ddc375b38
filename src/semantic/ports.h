#pragma once
#include "request.h"
#include "provider.h"
#include "capability.h"
#include "diagnostic.h"
#include "failure.h"
#include "response.h"
#include <expected>
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

class CancelToken;

struct ProviderRequest {
    Capability capability = Capability::ChatCompletion;
    QString method = QStringLiteral("POST");
    QString url;
    QString protocol = QStringLiteral("http");
    QMap<QString, QString> headers;
    QByteArray body;
    QString adapterHint;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
    QString adapterHint;
};

struct ProviderChunk {
    QString type;
    QByteArray data;
    QString adapterHint;
};

struct ExecutionOutcome {
    ProviderResponse response;
    qint64 elapsedMs = 0;
    ProviderRequest request;
    QList<ProviderChunk> events;    // SSE payloads in arrival order, [DONE] excluded
};

class IOutboundAdapter {
public:
    virtual ~IOutboundAdapter() = default;
    virtual QString adapterId() const = 0;
    virtual Result<QJsonObject> buildPayload(const PromptSpec& prompt,
                                             const ModelCapabilities& caps,
                                             Capability capability) const = 0;
    // One Drop diagnostic per prompt field this dialect has no wire field for.
    virtual DiagnosticList unmappedFields(const PromptSpec& prompt,
                                          const ModelCapabilities& caps) const = 0;
    // Headers added when the provider spec does not set them itself.
    virtual QMap<QString, QString> defaultHeaders() const = 0;
    virtual Result<NormalizedResponse> parseResponse(const ProviderResponse& response) const = 0;
    // Text delta carried by one streamed event; empty when the event has none.
    virtual Result<QString> parseChunk(const ProviderChunk& chunk) const = 0;
};

class IAdapterRegistry {
public:
    virtual ~IAdapterRegistry() = default;
    virtual const IOutboundAdapter* resolve(const ModelCapabilities& caps) const = 0;
    virtual const IOutboundAdapter* byId(const QString& adapterId) const = 0;
};

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual Result<ExecutionOutcome> execute(const ProviderRequest& request,
                                             int timeoutMs,
                                             const CancelToken* cancel = nullptr) const = 0;
};

class ICapabilityResolver {
public:
    virtual ~ICapabilityResolver() = default;
    virtual Result<ModelCapabilities> resolve(const ProviderSpec& spec,
                                              const QString& modelId) const = 0;
};
