#pragma once
#include "outbound_adapter.h"

// OpenAI-compatible chat completions. Also the fallback dialect.
class OpenAIOutbound : public IOutboundAdapter {
public:
    OpenAIOutbound() = default;
    ~OpenAIOutbound() override = default;

    QString adapterId() const override;

    Result<QJsonObject> buildPayload(const PromptSpec& prompt,
                                     const ModelCapabilities& caps,
                                     Capability capability) const override;
    DiagnosticList unmappedFields(const PromptSpec& prompt,
                                  const ModelCapabilities& caps) const override;
    QMap<QString, QString> defaultHeaders() const override;
    Result<NormalizedResponse> parseResponse(const ProviderResponse& response) const override;
    Result<QString> parseChunk(const ProviderChunk& chunk) const override;

protected:
    QJsonArray buildMessages(const QList<InteractionItem>& items, SystemPromptLocation location) const;
    QJsonValue buildContent(const QList<Segment>& segments) const;
    QJsonArray buildToolDefs(const QList<ActionSpec>& tools) const;
    QJsonValue buildToolChoice(const ToolChoice& choice) const;
    void buildConstraints(QJsonObject& body, const ConstraintSet& constraints) const;
};
