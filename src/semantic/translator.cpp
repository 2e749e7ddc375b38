#include "translator.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <algorithm>

std::optional<TranslationMode> translationModeFromName(const QString& name) {
    if (name == QStringLiteral("standard"))
        return TranslationMode::Standard;
    if (name == QStringLiteral("strict"))
        return TranslationMode::Strict;
    return std::nullopt;
}

QString translationModeName(TranslationMode mode) {
    return mode == TranslationMode::Strict ? QStringLiteral("strict") : QStringLiteral("standard");
}

namespace {

void setPath(QJsonObject& obj, QStringList parts, const QJsonValue& value) {
    const QString head = parts.takeFirst();
    if (parts.isEmpty()) {
        obj[head] = value;
        return;
    }
    QJsonObject child = obj.value(head).toObject();
    setPath(child, parts, value);
    obj[head] = child;
}

QStringList payloadKeysFor(const QString& canonical) {
    if (canonical == QStringLiteral("max_output_tokens"))
        return {canonical, QStringLiteral("max_tokens")};
    if (canonical == QStringLiteral("stop"))
        return {canonical, QStringLiteral("stop_sequences")};
    return {canonical};
}

void setHeader(QMap<QString, QString>& headers, const QString& name, const QString& value) {
    for (auto it = headers.begin(); it != headers.end();) {
        if (it.key().compare(name, Qt::CaseInsensitive) == 0)
            it = headers.erase(it);
        else
            ++it;
    }
    headers.insert(name, value);
}

QString flattenConversation(const QList<InteractionItem>& items) {
    QStringList blocks;
    for (const auto& item : items) {
        const QString text = item.joinedText();
        if (text.isEmpty())
            continue;
        blocks.append(QStringLiteral("%1: %2").arg(roleName(item.role), text));
    }
    return blocks.join(QStringLiteral("\n\n"));
}

QString jsonInstruction(const ResponseFormat& format) {
    QString text = QStringLiteral("Respond only with a valid JSON object.");
    if (format.type == ResponseFormat::Type::JsonSchema && !format.schema.isEmpty()) {
        const QJsonObject schema = format.schema.value(QStringLiteral("schema")).isObject()
            ? format.schema.value(QStringLiteral("schema")).toObject() : format.schema;
        text += QStringLiteral(" The JSON must conform to this schema: ")
              + QString::fromUtf8(QJsonDocument(schema).toJson(QJsonDocument::Compact));
    }
    return text;
}

void appendToUserText(QList<InteractionItem>& items, const QString& text) {
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        if (it->role != MessageRole::User)
            continue;
        for (auto seg = it->content.rbegin(); seg != it->content.rend(); ++seg) {
            if (seg->kind == PartKind::Text) {
                seg->text += QStringLiteral("\n\n") + text;
                return;
            }
        }
        it->content.append(Segment::fromText(text));
        return;
    }
    InteractionItem user;
    user.role = MessageRole::User;
    user.content.append(Segment::fromText(text));
    items.append(user);
}

// Cuts at a UTF-8 sequence boundary so no character is split.
QString truncateUtf8(const QString& text, qsizetype maxBytes) {
    const QByteArray utf8 = text.toUtf8();
    if (utf8.size() <= maxBytes)
        return text;
    qsizetype cut = qMax<qsizetype>(0, maxBytes);
    while (cut > 0 && (static_cast<unsigned char>(utf8.at(cut)) & 0xC0) == 0x80)
        --cut;
    return QString::fromUtf8(utf8.left(cut));
}

// Keeps system text within maxBytes, counting the newline that joins turns.
void truncateSystemText(QList<InteractionItem>& items, qsizetype maxBytes) {
    qsizetype remaining = maxBytes;
    for (auto& item : items) {
        if (item.role != MessageRole::System)
            continue;
        for (auto& seg : item.content) {
            if (seg.kind != PartKind::Text)
                continue;
            seg.text = remaining > 0 ? truncateUtf8(seg.text, remaining) : QString();
            if (!seg.text.isEmpty())
                remaining -= seg.text.toUtf8().size() + 1;
        }
        item.content.removeIf([](const Segment& seg) { return seg.kind == PartKind::Text && seg.text.isEmpty(); });
    }
    items.removeIf([](const InteractionItem& item) {
        return item.role == MessageRole::System && item.content.isEmpty();
    });
}

QString formatNumber(double value) {
    return QString::number(value, 'g', 10);
}

} // namespace

QJsonObject TranslationResult::toJson() const {
    QJsonObject ep;
    ep["capability"] = capabilityName(capability);
    ep["method"] = endpoint.method;
    ep["path"] = endpoint.path;
    ep["protocol"] = endpoint.protocol;
    ep["url"] = url;

    QJsonObject hdrs;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        hdrs[it.key()] = it.value();

    QJsonArray diags;
    for (const auto& d : diagnostics)
        diags.append(d.toJson());

    QJsonObject meta;
    meta["provider"] = providerName;
    meta["model"] = modelId;
    meta["family"] = family;
    meta["adapter"] = adapterId;
    meta["mode"] = translationModeName(mode);

    QJsonObject root;
    root["provider_request_json"] = payload;
    root["endpoint"] = ep;
    root["headers"] = hdrs;
    root["diagnostics"] = diags;
    root["metadata"] = meta;
    return root;
}

ProviderRequest TranslationResult::toProviderRequest() const {
    ProviderRequest pr;
    pr.capability = capability;
    pr.method = endpoint.method;
    pr.url = url;
    pr.protocol = endpoint.protocol;
    pr.headers = headers;
    pr.body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    pr.adapterHint = adapterId;
    return pr;
}

Translator::Translator(std::shared_ptr<const IAdapterRegistry> adapters)
    : m_adapters(std::move(adapters)) {
}

Result<TranslationResult> Translator::translate(const PromptSpec& prompt,
                                                const ModelCapabilities& caps,
                                                TranslationMode mode) const {
    if (prompt.messages.isEmpty())
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("empty_messages"), QStringLiteral("prompt has no messages")));
    if (caps.model.endpoints.isEmpty())
        return std::unexpected(DomainFailure::modelNotFound(
            QStringLiteral("no_endpoints"),
            QStringLiteral("model '%1' declares no endpoints").arg(caps.model.id)));

    const IOutboundAdapter* adapter = m_adapters ? m_adapters->resolve(caps) : nullptr;
    if (!adapter) {
        LogManager::instance().log(LogManager::Error, "translate",
            QStringLiteral("no payload dialect for provider=%1 family=%2 model=%3")
                .arg(caps.providerName, caps.model.family, caps.model.id));
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("no payload dialect registered for provider '%1'").arg(caps.providerName)));
    }

    const QList<FeatureGap> gaps = DegradationPolicy::missingFeatures(prompt, caps);

    if (mode == TranslationMode::Strict) {
        QStringList names;
        for (const auto& gap : gaps)
            names.append(featureName(gap.feature));
        for (const auto& dropped : adapter->unmappedFields(prompt, caps))
            names.append(dropped.feature);
        if (!names.isEmpty()) {
            std::sort(names.begin(), names.end());
            names.erase(std::unique(names.begin(), names.end()), names.end());
            return std::unexpected(DomainFailure::notImplemented(
                QStringLiteral("capability_mismatch"),
                QStringLiteral("model '%1' lacks required features: %2")
                    .arg(caps.model.id, names.join(QStringLiteral(", ")))));
        }
    }

    PromptSpec working = prompt;
    Capability capability = prompt.stream ? Capability::StreamingChatCompletion
                                          : Capability::ChatCompletion;
    DiagnosticList diagnostics;

    for (const auto& gap : gaps) {
        const PolicyDecision decision = DegradationPolicy::decide(gap.feature, mode, caps);
        if (decision.fallback == Fallback::Reject) {
            return std::unexpected(DomainFailure::notImplemented(
                decision.reason,
                QStringLiteral("%1 and no fallback is available for model '%2'")
                    .arg(gap.detail, caps.model.id)));
        }
        Diagnostic diag;
        diag.code = decision.code;
        diag.severity = decision.severity;
        diag.feature = featureName(gap.feature);
        diag.path = gap.path;
        applyFallback(decision.fallback, gap, caps, working, capability, diag);
        diagnostics.append(diag);
    }

    if (working.messages.isEmpty())
        return std::unexpected(DomainFailure::notImplemented(
            QStringLiteral("no_fallback"),
            QStringLiteral("no content left for model '%1' after dropping unsupported parts")
                .arg(caps.model.id)));
    diagnostics.append(adapter->unmappedFields(working, caps));

    auto endpoint = caps.endpoint(capability);
    if (!endpoint)
        return std::unexpected(DomainFailure::notImplemented(
            QStringLiteral("missing_endpoint"),
            QStringLiteral("model '%1' has no %2 endpoint")
                .arg(caps.model.id, capabilityName(capability))));

    auto payload = adapter->buildPayload(working, caps, capability);
    if (!payload)
        return std::unexpected(payload.error());
    applyPathMappings(*payload, caps.model.mappings);

    TranslationResult result;
    result.payload = *payload;
    result.capability = capability;
    result.endpoint = *endpoint;
    result.endpoint.path.replace(QStringLiteral("{model}"), caps.model.id);
    result.url = joinUrl(caps.baseUrl, result.endpoint.path, endpoint->query);
    result.diagnostics = diagnostics;
    result.adapterId = adapter->adapterId();
    result.providerName = caps.providerName;
    result.modelId = caps.model.id;
    result.family = caps.model.family;
    result.mode = mode;

    result.headers = requestHeaders(*adapter, caps, *endpoint);

    LogManager::instance().log(LogManager::Debug, "translate",
        QStringLiteral("%1/%2 via %3: %4 diagnostic(s)")
            .arg(caps.providerName, caps.model.id, result.adapterId)
            .arg(diagnostics.size()));
    return result;
}

QMap<QString, QString> Translator::requestHeaders(const IOutboundAdapter& adapter,
                                                 const ModelCapabilities& caps,
                                                 const EndpointDescriptor& endpoint) {
    QMap<QString, QString> headers;
    const QMap<QString, QString> defaults = adapter.defaultHeaders();
    for (auto it = defaults.constBegin(); it != defaults.constEnd(); ++it)
        setHeader(headers, it.key(), it.value());
    for (auto it = caps.providerHeaders.constBegin(); it != caps.providerHeaders.constEnd(); ++it)
        setHeader(headers, it.key(), it.value());
    for (auto it = endpoint.headers.constBegin(); it != endpoint.headers.constEnd(); ++it)
        setHeader(headers, it.key(), it.value());
    return headers;
}

void Translator::applyFallback(Fallback fallback, const FeatureGap& gap, const ModelCapabilities& caps,
                               PromptSpec& working, Capability& capability, Diagnostic& diag) {
    switch (fallback) {
    case Fallback::FlattenToText: {
        InteractionItem merged;
        merged.role = MessageRole::User;
        merged.content.append(Segment::fromText(flattenConversation(working.messages)));
        for (const auto& item : working.messages) {
            for (const auto& seg : item.content) {
                if (seg.isImage())
                    merged.content.append(seg);
            }
        }
        diag.message = QStringLiteral("model accepts single_text only; %1 messages flattened into one user message")
                           .arg(working.messages.size());
        working.messages = {merged};
        break;
    }
    case Fallback::DropImages: {
        int dropped = 0;
        for (auto& item : working.messages) {
            const qsizetype before = item.content.size();
            item.content.removeIf([](const Segment& seg) { return seg.isImage(); });
            dropped += static_cast<int>(before - item.content.size());
        }
        // No message may go out with empty content.
        const qsizetype emptied = working.messages.removeIf(
            [](const InteractionItem& item) { return item.content.isEmpty(); });
        diag.message = QStringLiteral("model does not accept images; %1 image part(s) dropped").arg(dropped);
        if (emptied > 0)
            diag.message += QStringLiteral(", %1 image-only message(s) removed").arg(emptied);
        break;
    }
    case Fallback::UseChatEndpoint:
        capability = Capability::ChatCompletion;
        working.stream = false;
        diag.message = QStringLiteral("model has no streaming_chat_completion endpoint; using chat_completion");
        break;
    case Fallback::DropTools:
        diag.message = QStringLiteral("model does not support tools; %1 tool definition(s) dropped")
                           .arg(working.tools.size());
        working.tools.clear();
        working.toolChoice.reset();
        break;
    case Fallback::EmulateJsonInstruction: {
        const QString instruction = jsonInstruction(*working.responseFormat);
        working.responseFormat.reset();
        if (!caps.supports(InputMode::Messages)) {
            // Single-text models take exactly one user turn.
            appendToUserText(working.messages, instruction);
            diag.message = QStringLiteral("model has no native JSON output; instruction appended to the user text");
            break;
        }
        if (!working.messages.isEmpty() && working.messages.first().role == MessageRole::System) {
            working.messages.first().content.append(Segment::fromText(instruction));
        } else {
            InteractionItem system;
            system.role = MessageRole::System;
            system.content.append(Segment::fromText(instruction));
            working.messages.prepend(system);
        }
        diag.message = QStringLiteral("model has no native JSON output; instruction appended to the system prompt");
        break;
    }
    case Fallback::DropResponseFormat:
        working.responseFormat.reset();
        diag.message = QStringLiteral("model has no native JSON output; response_format dropped");
        break;
    case Fallback::ClampToRange: {
        auto range = DegradationPolicy::parameterRange(caps, gap.feature);
        if (!range)
            break;
        double before = 0;
        double after = 0;
        if (gap.feature == Feature::Temperature && working.constraints.temperature) {
            before = *working.constraints.temperature;
            after = range->clamp(before);
            working.constraints.temperature = after;
        } else if (gap.feature == Feature::TopP && working.constraints.topP) {
            before = *working.constraints.topP;
            after = range->clamp(before);
            working.constraints.topP = after;
        } else if (gap.feature == Feature::MaxOutputTokens && working.constraints.maxOutputTokens) {
            before = *working.constraints.maxOutputTokens;
            const int clamped = static_cast<int>(std::clamp(range->clamp(before), 0.0, 2147483647.0));
            working.constraints.maxOutputTokens = clamped;
            after = clamped;
        }
        diag.message = QStringLiteral("%1 %2 clamped to %3")
                           .arg(featureName(gap.feature), formatNumber(before), formatNumber(after));
        break;
    }
    case Fallback::TruncateSystemPrompt: {
        const qsizetype limit = caps.model.constraints.maxSystemPromptBytes.value_or(0);
        const qsizetype before = DegradationPolicy::systemPromptBytes(working);
        truncateSystemText(working.messages, limit);
        diag.message = QStringLiteral("system prompt truncated from %1 to %2 bytes")
                           .arg(before).arg(DegradationPolicy::systemPromptBytes(working));
        break;
    }
    case Fallback::DropOversizedTools: {
        const qsizetype limit = caps.model.constraints.maxToolSchemaBytes.value_or(0);
        QStringList removed;
        working.tools.removeIf([&](const ActionSpec& tool) {
            if (DegradationPolicy::toolSchemaBytes(tool) <= limit)
                return false;
            removed.append(tool.name);
            return true;
        });
        if (working.toolChoice && (working.tools.isEmpty()
                || (working.toolChoice->mode == ToolChoice::Mode::Specific
                    && removed.contains(working.toolChoice->name))))
            working.toolChoice.reset();
        diag.message = QStringLiteral("tool schema over %1 bytes; dropped %2")
                           .arg(limit).arg(removed.join(QStringLiteral(", ")));
        break;
    }
    case Fallback::DropConflictingFields: {
        const QString winner = DegradationPolicy::conflictWinner(
            gap.fields, caps.model.constraints.resolutionPreferences);
        QStringList losers;
        for (const QString& field : gap.fields) {
            if (field == winner)
                continue;
            clearConstraintField(working.constraints, field);
            losers.append(field);
        }
        diag.message = QStringLiteral("%1 cannot be sent with %2; kept %2, dropped %1")
                           .arg(losers.join(QStringLiteral(", ")), winner);
        break;
    }
    case Fallback::Reject:
        break;
    }
}

void Translator::applyPathMappings(QJsonObject& payload, const QMap<QString, QString>& mappings) {
    for (auto it = mappings.constBegin(); it != mappings.constEnd(); ++it) {
        const QString target = it.value().trimmed();
        if (target.isEmpty())
            continue;
        for (const QString& key : payloadKeysFor(it.key())) {
            if (!payload.contains(key) || key == target)
                continue;
            const QJsonValue value = payload.take(key);
            setPath(payload, target.split(QLatin1Char('.'), Qt::SkipEmptyParts), value);
            break;
        }
    }
}

QString Translator::joinUrl(const QString& baseUrl, const QString& path, const QMap<QString, QString>& query) {
    QString base = baseUrl.trimmed();
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    QString p = path;
    if (!p.isEmpty() && !p.startsWith(QLatin1Char('/')))
        p.prepend(QLatin1Char('/'));

    QString url = base + p;
    if (!query.isEmpty()) {
        // Values stay verbatim so ${ENV:...} references survive until execution.
        QStringList items;
        for (auto it = query.constBegin(); it != query.constEnd(); ++it)
            items.append(it.key() + QLatin1Char('=') + it.value());
        url += (url.contains(QLatin1Char('?')) ? QLatin1Char('&') : QLatin1Char('?'))
             + items.join(QLatin1Char('&'));
    }
    return url;
}
