#include "anthropic.h"

QString AnthropicOutbound::adapterId() const
{
    return QStringLiteral("anthropic");
}

Result<QJsonObject> AnthropicOutbound::buildPayload(const PromptSpec& prompt,
                                                    const ModelCapabilities& caps,
                                                    Capability capability) const
{
    QJsonObject body;
    body[QStringLiteral("model")] = caps.model.id;
    body[QStringLiteral("messages")] = buildMessages(prompt.messages);

    const QString systemPrompt = Outbound::systemText(prompt.messages);
    if (!systemPrompt.isEmpty()) {
        body[QStringLiteral("system")] = systemPrompt;
    }

    if (!prompt.tools.isEmpty()) {
        body[QStringLiteral("tools")] = buildToolDefs(prompt.tools);
        if (prompt.toolChoice)
            body[QStringLiteral("tool_choice")] = buildToolChoice(*prompt.toolChoice);
    }

    // max_tokens is required for Anthropic
    body[QStringLiteral("max_tokens")] = prompt.constraints.maxOutputTokens.value_or(kDefaultMaxTokens);

    if (prompt.constraints.temperature.has_value()) {
        body[QStringLiteral("temperature")] = prompt.constraints.temperature.value();
    }
    if (prompt.constraints.topP.has_value()) {
        body[QStringLiteral("top_p")] = prompt.constraints.topP.value();
    }
    if (prompt.constraints.topK.has_value()) {
        body[QStringLiteral("top_k")] = prompt.constraints.topK.value();
    }
    if (!prompt.constraints.stopSequences.isEmpty()) {
        body[QStringLiteral("stop_sequences")] = Outbound::stringArray(prompt.constraints.stopSequences);
    }
    if (prompt.constraints.reasoningTokens.has_value()) {
        QJsonObject thinking;
        thinking[QStringLiteral("type")] = QStringLiteral("enabled");
        thinking[QStringLiteral("budget_tokens")] = prompt.constraints.reasoningTokens.value();
        body[QStringLiteral("thinking")] = thinking;
    }

    if (capability == Capability::StreamingChatCompletion) {
        body[QStringLiteral("stream")] = true;
    }
    return body;
}

DiagnosticList AnthropicOutbound::unmappedFields(const PromptSpec& prompt,
                                                 const ModelCapabilities& caps) const
{
    Q_UNUSED(caps);
    DiagnosticList dropped;
    if (prompt.constraints.frequencyPenalty)
        dropped.append(Outbound::droppedField(QStringLiteral("frequency_penalty"),
                                              QStringLiteral("$.sampling.frequency_penalty"), adapterId()));
    if (prompt.constraints.presencePenalty)
        dropped.append(Outbound::droppedField(QStringLiteral("presence_penalty"),
                                              QStringLiteral("$.sampling.presence_penalty"), adapterId()));
    // Messages API has no JSON mode parameter, even for models that declare one.
    if (prompt.responseFormat && prompt.responseFormat->wantsJson())
        dropped.append(Outbound::droppedField(QStringLiteral("response_format"),
                                              QStringLiteral("$.response_format"), adapterId()));
    if (prompt.constraints.maxPromptTokens)
        dropped.append(Outbound::droppedField(QStringLiteral("max_prompt_tokens"),
                                              QStringLiteral("$.limits.max_prompt_tokens"), adapterId()));
    return dropped;
}

QMap<QString, QString> AnthropicOutbound::defaultHeaders() const
{
    return {
        {QStringLiteral("Content-Type"), QStringLiteral("application/json")},
        {QStringLiteral("anthropic-version"), QStringLiteral("2023-06-01")}
    };
}

Result<NormalizedResponse> AnthropicOutbound::parseResponse(const ProviderResponse& response) const
{
    auto root = Outbound::parseJsonBody(response.body, QStringLiteral("Anthropic"));
    if (!root) return std::unexpected(root.error());

    NormalizedResponse nr;
    nr.id = root->value(QStringLiteral("id")).toString();
    nr.model = root->value(QStringLiteral("model")).toString();
    nr.role = root->value(QStringLiteral("role")).toString(QStringLiteral("assistant"));

    const QJsonValue contentVal = root->value(QStringLiteral("content"));
    if (contentVal.isArray()) {
        QString text;
        for (const QJsonValue& block : contentVal.toArray()) {
            const QJsonObject obj = block.toObject();
            if (obj.value(QStringLiteral("type")).toString() == QStringLiteral("text"))
                text += obj.value(QStringLiteral("text")).toString();
        }
        nr.content = text;
    }

    const QJsonValue stopReason = root->value(QStringLiteral("stop_reason"));
    if (stopReason.isString())
        nr.finishReason = stopReason.toString();

    const QJsonValue usageVal = root->value(QStringLiteral("usage"));
    if (usageVal.isObject()) {
        const QJsonObject usage = usageVal.toObject();
        UsageEntry u;
        if (usage.contains(QStringLiteral("input_tokens")))
            u.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
        if (usage.contains(QStringLiteral("output_tokens")))
            u.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
        if (u.promptTokens && u.completionTokens)
            u.totalTokens = *u.promptTokens + *u.completionTokens;
        nr.usage = u;
    }
    return nr;
}

Result<QString> AnthropicOutbound::parseChunk(const ProviderChunk& chunk) const
{
    auto root = Outbound::parseJsonBody(chunk.data, QStringLiteral("Anthropic chunk"));
    if (!root) return std::unexpected(root.error());

    QString eventType = root->value(QStringLiteral("type")).toString();
    if (eventType.isEmpty())
        eventType = chunk.type;

    if (eventType == QStringLiteral("error")) {
        const QJsonObject err = root->value(QStringLiteral("error")).toObject();
        return std::unexpected(DomainFailure::network(
            err.value(QStringLiteral("type")).toString(QStringLiteral("stream_error")),
            err.value(QStringLiteral("message")).toString()));
    }
    if (eventType != QStringLiteral("content_block_delta"))
        return QString();

    const QJsonObject delta = root->value(QStringLiteral("delta")).toObject();
    if (delta.value(QStringLiteral("type")).toString() == QStringLiteral("text_delta"))
        return delta.value(QStringLiteral("text")).toString();
    return QString();
}

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

QJsonArray AnthropicOutbound::buildMessages(const QList<InteractionItem>& items) const
{
    QJsonArray messages;
    for (const auto& item : items) {
        // System messages travel in the top-level "system" field
        if (item.role == MessageRole::System)
            continue;

        QJsonObject msg;
        msg[QStringLiteral("role")] = roleName(item.role);
        if (item.content.size() == 1 && item.content.first().kind == PartKind::Text) {
            msg[QStringLiteral("content")] = item.content.first().text;
        } else {
            msg[QStringLiteral("content")] = segmentsToContentBlocks(item.content);
        }
        messages.append(msg);
    }
    return messages;
}

QJsonArray AnthropicOutbound::segmentsToContentBlocks(const QList<Segment>& segments) const
{
    QJsonArray blocks;
    for (const auto& seg : segments) {
        QJsonObject block;
        if (seg.kind == PartKind::Text) {
            block[QStringLiteral("type")] = QStringLiteral("text");
            block[QStringLiteral("text")] = seg.text;
        } else {
            block[QStringLiteral("type")] = QStringLiteral("image");
            QJsonObject source;
            if (!seg.media.inlineData.isEmpty()) {
                source[QStringLiteral("type")] = QStringLiteral("base64");
                source[QStringLiteral("media_type")] = seg.media.mimeType;
                source[QStringLiteral("data")] = seg.media.inlineData;
            } else {
                source[QStringLiteral("type")] = QStringLiteral("url");
                source[QStringLiteral("url")] = seg.media.uri;
            }
            block[QStringLiteral("source")] = source;
        }
        blocks.append(block);
    }
    return blocks;
}

QJsonArray AnthropicOutbound::buildToolDefs(const QList<ActionSpec>& tools) const
{
    QJsonArray arr;
    for (const auto& tool : tools) {
        QJsonObject toolObj;
        toolObj[QStringLiteral("name")] = tool.name;
        if (!tool.description.isEmpty())
            toolObj[QStringLiteral("description")] = tool.description;
        toolObj[QStringLiteral("input_schema")] = tool.parameters.isEmpty()
            ? QJsonObject{{QStringLiteral("type"), QStringLiteral("object")}} : tool.parameters;
        arr.append(toolObj);
    }
    return arr;
}

QJsonObject AnthropicOutbound::buildToolChoice(const ToolChoice& choice) const
{
    QJsonObject obj;
    switch (choice.mode) {
    case ToolChoice::Mode::Auto:
        obj[QStringLiteral("type")] = QStringLiteral("auto");
        break;
    case ToolChoice::Mode::Required:
        obj[QStringLiteral("type")] = QStringLiteral("any");
        break;
    case ToolChoice::Mode::None:
        obj[QStringLiteral("type")] = QStringLiteral("none");
        break;
    case ToolChoice::Mode::Specific:
        obj[QStringLiteral("type")] = QStringLiteral("tool");
        obj[QStringLiteral("name")] = choice.name;
        break;
    }
    return obj;
}
