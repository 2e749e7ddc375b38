#pragma once
#include "outbound_adapter.h"

// Google Gemini generateContent: contents/parts, systemInstruction and
// generationConfig. The model travels in the endpoint path, not the body.
class GeminiOutbound : public IOutboundAdapter {
public:
    GeminiOutbound() = default;
    ~GeminiOutbound() override = default;

    QString adapterId() const override;

    Result<QJsonObject> buildPayload(const PromptSpec& prompt,
                                     const ModelCapabilities& caps,
                                     Capability capability) const override;
    DiagnosticList unmappedFields(const PromptSpec& prompt,
                                  const ModelCapabilities& caps) const override;
    QMap<QString, QString> defaultHeaders() const override;
    Result<NormalizedResponse> parseResponse(const ProviderResponse& response) const override;
    Result<QString> parseChunk(const ProviderChunk& chunk) const override;

private:
    QJsonArray buildContents(const QList<InteractionItem>& items) const;
    QJsonObject buildGenerationConfig(const PromptSpec& prompt, const ModelCapabilities& caps) const;
    QJsonArray buildToolDeclarations(const QList<ActionSpec>& tools) const;
    QString candidateText(const QJsonObject& root) const;
};
