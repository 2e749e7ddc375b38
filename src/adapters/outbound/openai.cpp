#include "openai.h"

QString OpenAIOutbound::adapterId() const
{
    return QStringLiteral("openai");
}

Result<QJsonObject> OpenAIOutbound::buildPayload(const PromptSpec& prompt,
                                                 const ModelCapabilities& caps,
                                                 Capability capability) const
{
    const SystemPromptLocation location = caps.model.constraints.systemPromptLocation;

    QJsonObject body;
    body[QStringLiteral("model")] = caps.model.id;
    body[QStringLiteral("messages")] = buildMessages(prompt.messages, location);

    if (location == SystemPromptLocation::TopLevel) {
        const QString system = Outbound::systemText(prompt.messages);
        if (!system.isEmpty())
            body[QStringLiteral("system")] = system;
    }

    if (!prompt.tools.isEmpty()) {
        body[QStringLiteral("tools")] = buildToolDefs(prompt.tools);
        if (prompt.toolChoice)
            body[QStringLiteral("tool_choice")] = buildToolChoice(*prompt.toolChoice);
        body[QStringLiteral("parallel_tool_calls")] = caps.model.tooling.parallelToolCallsDefault;
    }

    if (prompt.responseFormat && prompt.responseFormat->wantsJson()) {
        QJsonObject fmt;
        if (prompt.responseFormat->type == ResponseFormat::Type::JsonSchema) {
            fmt[QStringLiteral("type")] = QStringLiteral("json_schema");
            QJsonObject schema = prompt.responseFormat->schema;
            if (prompt.responseFormat->strict)
                schema[QStringLiteral("strict")] = *prompt.responseFormat->strict;
            fmt[QStringLiteral("json_schema")] = schema;
        } else {
            fmt[QStringLiteral("type")] = QStringLiteral("json_object");
        }
        body[QStringLiteral("response_format")] = fmt;
    }

    if (capability == Capability::StreamingChatCompletion)
        body[QStringLiteral("stream")] = true;

    buildConstraints(body, prompt.constraints);
    if (!prompt.constraints.maxOutputTokens && caps.model.constraints.maxOutputTokensRequired)
        body[QStringLiteral("max_tokens")] = 4096;

    return body;
}

DiagnosticList OpenAIOutbound::unmappedFields(const PromptSpec& prompt,
                                              const ModelCapabilities& caps) const
{
    Q_UNUSED(caps);
    DiagnosticList dropped;
    if (prompt.constraints.reasoningTokens)
        dropped.append(Outbound::droppedField(QStringLiteral("reasoning_tokens"),
                                              QStringLiteral("$.limits.reasoning_tokens"), adapterId()));
    if (prompt.constraints.maxPromptTokens)
        dropped.append(Outbound::droppedField(QStringLiteral("max_prompt_tokens"),
                                              QStringLiteral("$.limits.max_prompt_tokens"), adapterId()));
    return dropped;
}

QMap<QString, QString> OpenAIOutbound::defaultHeaders() const
{
    return {{QStringLiteral("Content-Type"), QStringLiteral("application/json")}};
}

Result<NormalizedResponse> OpenAIOutbound::parseResponse(const ProviderResponse& response) const
{
    auto root = Outbound::parseJsonBody(response.body, QStringLiteral("OpenAI"));
    if (!root) return std::unexpected(root.error());

    NormalizedResponse nr;
    nr.id = root->value(QStringLiteral("id")).toString();
    nr.model = root->value(QStringLiteral("model")).toString();

    const QJsonArray choices = root->value(QStringLiteral("choices")).toArray();
    if (!choices.isEmpty()) {
        const QJsonObject choice = choices.first().toObject();
        const QJsonObject msg = choice.value(QStringLiteral("message")).toObject();
        nr.role = msg.value(QStringLiteral("role")).toString(QStringLiteral("assistant"));

        const QJsonValue contentVal = msg.value(QStringLiteral("content"));
        if (contentVal.isString()) {
            nr.content = contentVal.toString();
        } else if (contentVal.isArray()) {
            QString text;
            for (const QJsonValue& part : contentVal.toArray()) {
                const QJsonObject partObj = part.toObject();
                if (partObj.value(QStringLiteral("type")).toString() == QStringLiteral("text"))
                    text += partObj.value(QStringLiteral("text")).toString();
            }
            nr.content = text;
        }

        const QJsonValue finish = choice.value(QStringLiteral("finish_reason"));
        if (finish.isString())
            nr.finishReason = finish.toString();
    }

    const QJsonValue usageVal = root->value(QStringLiteral("usage"));
    if (usageVal.isObject()) {
        const QJsonObject usage = usageVal.toObject();
        UsageEntry u;
        if (usage.contains(QStringLiteral("prompt_tokens")))
            u.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
        if (usage.contains(QStringLiteral("completion_tokens")))
            u.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
        if (usage.contains(QStringLiteral("total_tokens")))
            u.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt();
        nr.usage = u;
    }

    return nr;
}

Result<QString> OpenAIOutbound::parseChunk(const ProviderChunk& chunk) const
{
    auto root = Outbound::parseJsonBody(chunk.data, QStringLiteral("OpenAI chunk"));
    if (!root) return std::unexpected(root.error());

    const QJsonArray choices = root->value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return QString();
    const QJsonObject delta = choices.first().toObject().value(QStringLiteral("delta")).toObject();
    return delta.value(QStringLiteral("content")).toString();
}

// ---------------------------------------------------------------------------
// Protected helpers
// ---------------------------------------------------------------------------

QJsonArray OpenAIOutbound::buildMessages(const QList<InteractionItem>& items,
                                         SystemPromptLocation location) const
{
    QJsonArray messages;
    QString pendingSystem;
    if (location == SystemPromptLocation::None)
        pendingSystem = Outbound::systemText(items);

    for (const auto& item : items) {
        if (item.role == MessageRole::System && location != SystemPromptLocation::MessageRole)
            continue;

        QJsonObject msg;
        msg[QStringLiteral("role")] = roleName(item.role);
        if (!item.name.isEmpty())
            msg[QStringLiteral("name")] = item.name;

        QList<Segment> content = item.content;
        // Models without a system slot get the instructions prefixed to the first user turn.
        if (!pendingSystem.isEmpty() && item.role == MessageRole::User) {
            content.prepend(Segment::fromText(pendingSystem));
            pendingSystem.clear();
        }
        msg[QStringLiteral("content")] = buildContent(content);
        messages.append(msg);
    }
    return messages;
}

QJsonValue OpenAIOutbound::buildContent(const QList<Segment>& segments) const
{
    bool textOnly = true;
    for (const auto& seg : segments) {
        if (seg.isImage())
            textOnly = false;
    }
    if (textOnly) {
        QString text;
        for (const auto& seg : segments) {
            if (!text.isEmpty())
                text += QLatin1Char('\n');
            text += seg.text;
        }
        return text;
    }

    QJsonArray contentArr;
    for (const auto& seg : segments) {
        QJsonObject part;
        if (seg.kind == PartKind::Text) {
            part[QStringLiteral("type")] = QStringLiteral("text");
            part[QStringLiteral("text")] = seg.text;
        } else {
            part[QStringLiteral("type")] = QStringLiteral("image_url");
            QJsonObject imageUrl;
            imageUrl[QStringLiteral("url")] = seg.media.uri.isEmpty()
                ? Outbound::dataUri(seg.media) : seg.media.uri;
            part[QStringLiteral("image_url")] = imageUrl;
        }
        contentArr.append(part);
    }
    return contentArr;
}

QJsonArray OpenAIOutbound::buildToolDefs(const QList<ActionSpec>& tools) const
{
    QJsonArray arr;
    for (const auto& tool : tools) {
        QJsonObject toolObj;
        toolObj[QStringLiteral("type")] = QStringLiteral("function");
        QJsonObject fn;
        fn[QStringLiteral("name")] = tool.name;
        if (!tool.description.isEmpty())
            fn[QStringLiteral("description")] = tool.description;
        fn[QStringLiteral("parameters")] = tool.parameters.isEmpty()
            ? QJsonObject{{QStringLiteral("type"), QStringLiteral("object")}} : tool.parameters;
        toolObj[QStringLiteral("function")] = fn;
        arr.append(toolObj);
    }
    return arr;
}

QJsonValue OpenAIOutbound::buildToolChoice(const ToolChoice& choice) const
{
    switch (choice.mode) {
    case ToolChoice::Mode::Auto:     return QStringLiteral("auto");
    case ToolChoice::Mode::Required: return QStringLiteral("required");
    case ToolChoice::Mode::None:     return QStringLiteral("none");
    case ToolChoice::Mode::Specific: {
        QJsonObject fn;
        fn[QStringLiteral("name")] = choice.name;
        QJsonObject obj;
        obj[QStringLiteral("type")] = QStringLiteral("function");
        obj[QStringLiteral("function")] = fn;
        return obj;
    }
    }
    return QStringLiteral("auto");
}

void OpenAIOutbound::buildConstraints(QJsonObject& body, const ConstraintSet& constraints) const
{
    if (constraints.temperature.has_value()) {
        body[QStringLiteral("temperature")] = constraints.temperature.value();
    }
    if (constraints.topP.has_value()) {
        body[QStringLiteral("top_p")] = constraints.topP.value();
    }
    if (constraints.topK.has_value()) {
        body[QStringLiteral("top_k")] = constraints.topK.value();
    }
    if (constraints.maxOutputTokens.has_value()) {
        body[QStringLiteral("max_tokens")] = constraints.maxOutputTokens.value();
    }
    if (constraints.frequencyPenalty.has_value()) {
        body[QStringLiteral("frequency_penalty")] = constraints.frequencyPenalty.value();
    }
    if (constraints.presencePenalty.has_value()) {
        body[QStringLiteral("presence_penalty")] = constraints.presencePenalty.value();
    }
    if (!constraints.stopSequences.isEmpty()) {
        body[QStringLiteral("stop")] = Outbound::stringArray(constraints.stopSequences);
    }
}
