#pragma once
#include "outbound_adapter.h"

// Anthropic Messages API: top-level system prompt, mandatory max_tokens.
class AnthropicOutbound : public IOutboundAdapter {
public:
    AnthropicOutbound() = default;
    ~AnthropicOutbound() override = default;

    QString adapterId() const override;

    Result<QJsonObject> buildPayload(const PromptSpec& prompt,
                                     const ModelCapabilities& caps,
                                     Capability capability) const override;
    DiagnosticList unmappedFields(const PromptSpec& prompt,
                                  const ModelCapabilities& caps) const override;
    QMap<QString, QString> defaultHeaders() const override;
    Result<NormalizedResponse> parseResponse(const ProviderResponse& response) const override;
    Result<QString> parseChunk(const ProviderChunk& chunk) const override;

    static constexpr int kDefaultMaxTokens = 4096;

private:
    QJsonArray buildMessages(const QList<InteractionItem>& items) const;
    QJsonArray segmentsToContentBlocks(const QList<Segment>& segments) const;
    QJsonArray buildToolDefs(const QList<ActionSpec>& tools) const;
    QJsonObject buildToolChoice(const ToolChoice& choice) const;
};
