#include "gemini.h"

QString GeminiOutbound::adapterId() const
{
    return QStringLiteral("gemini");
}

Result<QJsonObject> GeminiOutbound::buildPayload(const PromptSpec& prompt,
                                                 const ModelCapabilities& caps,
                                                 Capability capability) const
{
    Q_UNUSED(capability);

    QJsonObject body;
    body[QStringLiteral("contents")] = buildContents(prompt.messages);

    const QString system = Outbound::systemText(prompt.messages);
    if (!system.isEmpty()) {
        QJsonArray parts;
        parts.append(QJsonObject{{QStringLiteral("text"), system}});
        QJsonObject sysObj;
        sysObj[QStringLiteral("parts")] = parts;
        body[QStringLiteral("systemInstruction")] = sysObj;
    }

    QJsonObject genConfig = buildGenerationConfig(prompt, caps);
    if (!genConfig.isEmpty()) {
        body[QStringLiteral("generationConfig")] = genConfig;
    }

    if (!prompt.tools.isEmpty()) {
        QJsonObject toolObj;
        toolObj[QStringLiteral("functionDeclarations")] = buildToolDeclarations(prompt.tools);
        QJsonArray toolsArr;
        toolsArr.append(toolObj);
        body[QStringLiteral("tools")] = toolsArr;

        if (prompt.toolChoice) {
            QJsonObject fcc;
            switch (prompt.toolChoice->mode) {
            case ToolChoice::Mode::Auto:
                fcc[QStringLiteral("mode")] = QStringLiteral("AUTO");
                break;
            case ToolChoice::Mode::Required:
                fcc[QStringLiteral("mode")] = QStringLiteral("ANY");
                break;
            case ToolChoice::Mode::None:
                fcc[QStringLiteral("mode")] = QStringLiteral("NONE");
                break;
            case ToolChoice::Mode::Specific:
                fcc[QStringLiteral("mode")] = QStringLiteral("ANY");
                fcc[QStringLiteral("allowedFunctionNames")] = QJsonArray{prompt.toolChoice->name};
                break;
            }
            QJsonObject toolConfig;
            toolConfig[QStringLiteral("functionCallingConfig")] = fcc;
            body[QStringLiteral("toolConfig")] = toolConfig;
        }
    }
    return body;
}

DiagnosticList GeminiOutbound::unmappedFields(const PromptSpec& prompt,
                                              const ModelCapabilities& caps) const
{
    Q_UNUSED(caps);
    DiagnosticList dropped;
    if (prompt.constraints.maxPromptTokens)
        dropped.append(Outbound::droppedField(QStringLiteral("max_prompt_tokens"),
                                              QStringLiteral("$.limits.max_prompt_tokens"), adapterId()));
    return dropped;
}

QMap<QString, QString> GeminiOutbound::defaultHeaders() const
{
    return {{QStringLiteral("Content-Type"), QStringLiteral("application/json")}};
}

Result<NormalizedResponse> GeminiOutbound::parseResponse(const ProviderResponse& response) const
{
    auto root = Outbound::parseJsonBody(response.body, QStringLiteral("Gemini"));
    if (!root) return std::unexpected(root.error());

    NormalizedResponse nr;
    nr.id = root->value(QStringLiteral("responseId")).toString();
    nr.model = root->value(QStringLiteral("modelVersion")).toString();

    const QJsonArray candidates = root->value(QStringLiteral("candidates")).toArray();
    if (!candidates.isEmpty()) {
        nr.content = candidateText(*root);
        const QJsonValue finish = candidates.first().toObject().value(QStringLiteral("finishReason"));
        if (finish.isString())
            nr.finishReason = finish.toString();
    }

    const QJsonValue usageVal = root->value(QStringLiteral("usageMetadata"));
    if (usageVal.isObject()) {
        const QJsonObject usageMeta = usageVal.toObject();
        UsageEntry u;
        if (usageMeta.contains(QStringLiteral("promptTokenCount")))
            u.promptTokens = usageMeta.value(QStringLiteral("promptTokenCount")).toInt();
        if (usageMeta.contains(QStringLiteral("candidatesTokenCount")))
            u.completionTokens = usageMeta.value(QStringLiteral("candidatesTokenCount")).toInt();
        if (usageMeta.contains(QStringLiteral("totalTokenCount")))
            u.totalTokens = usageMeta.value(QStringLiteral("totalTokenCount")).toInt();
        nr.usage = u;
    }
    return nr;
}

Result<QString> GeminiOutbound::parseChunk(const ProviderChunk& chunk) const
{
    if (chunk.data.trimmed().isEmpty())
        return QString();
    auto root = Outbound::parseJsonBody(chunk.data, QStringLiteral("Gemini chunk"));
    if (!root) return std::unexpected(root.error());
    return candidateText(*root);
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

QJsonArray GeminiOutbound::buildContents(const QList<InteractionItem>& items) const
{
    QJsonArray contents;
    for (const auto& item : items) {
        if (item.role == MessageRole::System)
            continue;

        QJsonArray parts;
        for (const auto& seg : item.content) {
            if (seg.kind == PartKind::Text) {
                parts.append(QJsonObject{{QStringLiteral("text"), seg.text}});
            } else if (!seg.media.inlineData.isEmpty()) {
                QJsonObject inlineData;
                inlineData[QStringLiteral("mimeType")] = seg.media.mimeType;
                inlineData[QStringLiteral("data")] = seg.media.inlineData;
                parts.append(QJsonObject{{QStringLiteral("inlineData"), inlineData}});
            } else {
                QJsonObject fileData;
                if (!seg.media.mimeType.isEmpty())
                    fileData[QStringLiteral("mimeType")] = seg.media.mimeType;
                fileData[QStringLiteral("fileUri")] = seg.media.uri;
                parts.append(QJsonObject{{QStringLiteral("fileData"), fileData}});
            }
        }

        QJsonObject content;
        content[QStringLiteral("role")] = item.role == MessageRole::Assistant
            ? QStringLiteral("model") : QStringLiteral("user");
        content[QStringLiteral("parts")] = parts;
        contents.append(content);
    }
    return contents;
}

QJsonObject GeminiOutbound::buildGenerationConfig(const PromptSpec& prompt,
                                                  const ModelCapabilities& caps) const
{
    const ConstraintSet& c = prompt.constraints;
    QJsonObject config;
    if (c.temperature.has_value())
        config[QStringLiteral("temperature")] = c.temperature.value();
    if (c.topP.has_value())
        config[QStringLiteral("topP")] = c.topP.value();
    if (c.topK.has_value())
        config[QStringLiteral("topK")] = c.topK.value();
    if (c.maxOutputTokens.has_value())
        config[QStringLiteral("maxOutputTokens")] = c.maxOutputTokens.value();
    else if (caps.model.constraints.maxOutputTokensRequired)
        config[QStringLiteral("maxOutputTokens")] = 4096;
    if (c.frequencyPenalty.has_value())
        config[QStringLiteral("frequencyPenalty")] = c.frequencyPenalty.value();
    if (c.presencePenalty.has_value())
        config[QStringLiteral("presencePenalty")] = c.presencePenalty.value();
    if (!c.stopSequences.isEmpty())
        config[QStringLiteral("stopSequences")] = Outbound::stringArray(c.stopSequences);
    if (c.reasoningTokens.has_value())
        config[QStringLiteral("thinkingConfig")] =
            QJsonObject{{QStringLiteral("thinkingBudget"), c.reasoningTokens.value()}};

    if (prompt.responseFormat && prompt.responseFormat->wantsJson()) {
        config[QStringLiteral("responseMimeType")] = QStringLiteral("application/json");
        if (prompt.responseFormat->type == ResponseFormat::Type::JsonSchema) {
            const QJsonObject& schema = prompt.responseFormat->schema;
            config[QStringLiteral("responseSchema")] = schema.value(QStringLiteral("schema")).isObject()
                ? schema.value(QStringLiteral("schema")).toObject() : schema;
        }
    }
    return config;
}

QJsonArray GeminiOutbound::buildToolDeclarations(const QList<ActionSpec>& tools) const
{
    QJsonArray decls;
    for (const auto& tool : tools) {
        QJsonObject decl;
        decl[QStringLiteral("name")] = tool.name;
        if (!tool.description.isEmpty())
            decl[QStringLiteral("description")] = tool.description;
        if (!tool.parameters.isEmpty())
            decl[QStringLiteral("parameters")] = tool.parameters;
        decls.append(decl);
    }
    return decls;
}

QString GeminiOutbound::candidateText(const QJsonObject& root) const
{
    const QJsonArray candidates = root.value(QStringLiteral("candidates")).toArray();
    if (candidates.isEmpty())
        return QString();
    const QJsonObject content = candidates.first().toObject().value(QStringLiteral("content")).toObject();
    QString text;
    for (const QJsonValue& part : content.value(QStringLiteral("parts")).toArray())
        text += part.toObject().value(QStringLiteral("text")).toString();
    return text;
}
