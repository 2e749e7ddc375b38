#include "policy.h"
#include <QJsonDocument>

QString featureName(Feature feature) {
    switch (feature) {
    case Feature::SystemPromptSize: return QStringLiteral("system_prompt_bytes");
    case Feature::Messages:        return QStringLiteral("messages");
    case Feature::Images:          return QStringLiteral("images");
    case Feature::Streaming:       return QStringLiteral("streaming");
    case Feature::Tools:           return QStringLiteral("tools");
    case Feature::ToolSchemaSize:  return QStringLiteral("tool_schema_bytes");
    case Feature::ResponseFormat:  return QStringLiteral("response_format");
    case Feature::Temperature:     return QStringLiteral("temperature");
    case Feature::TopP:            return QStringLiteral("top_p");
    case Feature::MaxOutputTokens: return QStringLiteral("max_output_tokens");
    case Feature::MutuallyExclusive: return QStringLiteral("mutually_exclusive");
    }
    return QString();
}

const QList<Feature>& featureEvaluationOrder() {
    // System prompt truncation runs before flattening can fold it into user text.
    static const QList<Feature> order = {
        Feature::SystemPromptSize, Feature::Messages, Feature::Images, Feature::Streaming,
        Feature::Tools, Feature::ToolSchemaSize, Feature::ResponseFormat, Feature::Temperature,
        Feature::TopP, Feature::MaxOutputTokens, Feature::MutuallyExclusive
    };
    return order;
}

namespace {

QString canonicalField(const QString& field) {
    if (field == QStringLiteral("max_tokens"))
        return QStringLiteral("max_output_tokens");
    if (field == QStringLiteral("stop_sequences"))
        return QStringLiteral("stop");
    return field;
}

} // namespace

bool hasConstraintField(const ConstraintSet& c, const QString& field) {
    const QString name = canonicalField(field);
    if (name == QStringLiteral("temperature"))       return c.temperature.has_value();
    if (name == QStringLiteral("top_p"))             return c.topP.has_value();
    if (name == QStringLiteral("top_k"))             return c.topK.has_value();
    if (name == QStringLiteral("frequency_penalty")) return c.frequencyPenalty.has_value();
    if (name == QStringLiteral("presence_penalty"))  return c.presencePenalty.has_value();
    if (name == QStringLiteral("max_output_tokens")) return c.maxOutputTokens.has_value();
    if (name == QStringLiteral("reasoning_tokens"))  return c.reasoningTokens.has_value();
    if (name == QStringLiteral("stop"))              return !c.stopSequences.isEmpty();
    return false;
}

void clearConstraintField(ConstraintSet& c, const QString& field) {
    const QString name = canonicalField(field);
    if (name == QStringLiteral("temperature"))            c.temperature.reset();
    else if (name == QStringLiteral("top_p"))             c.topP.reset();
    else if (name == QStringLiteral("top_k"))             c.topK.reset();
    else if (name == QStringLiteral("frequency_penalty")) c.frequencyPenalty.reset();
    else if (name == QStringLiteral("presence_penalty"))  c.presencePenalty.reset();
    else if (name == QStringLiteral("max_output_tokens")) c.maxOutputTokens.reset();
    else if (name == QStringLiteral("reasoning_tokens"))  c.reasoningTokens.reset();
    else if (name == QStringLiteral("stop"))              c.stopSequences.clear();
}

QString constraintFieldPath(const QString& field) {
    const QString name = canonicalField(field);
    if (name == QStringLiteral("max_output_tokens") || name == QStringLiteral("reasoning_tokens"))
        return QStringLiteral("$.limits.") + name;
    if (name == QStringLiteral("stop"))
        return QStringLiteral("$.stop");
    return QStringLiteral("$.sampling.") + name;
}

namespace {

std::optional<ParameterRange> rangeFor(const ModelCapabilities& caps, const QString& name) {
    auto it = caps.model.parameters.constFind(name);
    if (it != caps.model.parameters.constEnd())
        return it.value();
    if (name == QStringLiteral("max_output_tokens")) {
        it = caps.model.parameters.constFind(QStringLiteral("max_tokens"));
        if (it != caps.model.parameters.constEnd())
            return it.value();
    }
    return std::nullopt;
}

void checkRange(QList<FeatureGap>& gaps, Feature feature, const QString& path,
                std::optional<double> value, const ModelCapabilities& caps) {
    if (!value)
        return;
    auto range = DegradationPolicy::parameterRange(caps, feature);
    if (!range || range->contains(*value))
        return;
    gaps.append({feature, path,
                 QStringLiteral("%1 %2 outside supported range").arg(featureName(feature)).arg(*value)});
}

} // namespace

std::optional<ParameterRange> DegradationPolicy::parameterRange(const ModelCapabilities& caps,
                                                               Feature feature) {
    return rangeFor(caps, featureName(feature));
}

QString DegradationPolicy::conflictWinner(const QStringList& fields, const QStringList& preferences) {
    for (const QString& preferred : preferences) {
        for (const QString& field : fields) {
            if (canonicalField(field) == canonicalField(preferred))
                return field;
        }
    }
    return fields.isEmpty() ? QString() : fields.first();
}

qsizetype DegradationPolicy::systemPromptBytes(const PromptSpec& prompt) {
    qsizetype bytes = 0;
    bool first = true;
    for (const auto& item : prompt.messages) {
        if (item.role != MessageRole::System)
            continue;
        const QString text = item.joinedText();
        if (text.isEmpty())
            continue;
        bytes += text.toUtf8().size() + (first ? 0 : 1);
        first = false;
    }
    return bytes;
}

qsizetype DegradationPolicy::toolSchemaBytes(const ActionSpec& tool) {
    return QJsonDocument(tool.parameters).toJson(QJsonDocument::Compact).size();
}

QList<FeatureGap> DegradationPolicy::missingFeatures(const PromptSpec& prompt,
                                                     const ModelCapabilities& caps) {
    QList<FeatureGap> gaps;
    const ModelConstraints& limits = caps.model.constraints;

    if (limits.maxSystemPromptBytes) {
        const qsizetype bytes = systemPromptBytes(prompt);
        if (bytes > *limits.maxSystemPromptBytes)
            gaps.append({Feature::SystemPromptSize, QStringLiteral("$.messages"),
                         QStringLiteral("system prompt is %1 bytes; model accepts at most %2")
                             .arg(bytes).arg(*limits.maxSystemPromptBytes), {}});
    }

    bool conversational = prompt.messages.size() > 1;
    for (const auto& item : prompt.messages) {
        if (item.role != MessageRole::User)
            conversational = true;
    }
    if (conversational && !caps.supports(InputMode::Messages))
        gaps.append({Feature::Messages, QStringLiteral("$.messages"),
                     QStringLiteral("model does not accept multi-message input")});

    if (prompt.hasImages() && !caps.supports(InputMode::Images))
        gaps.append({Feature::Images, QStringLiteral("$.messages"),
                     QStringLiteral("model does not accept image input")});

    if (prompt.stream && !caps.hasEndpoint(Capability::StreamingChatCompletion))
        gaps.append({Feature::Streaming, QStringLiteral("$.stream"),
                     QStringLiteral("model has no streaming_chat_completion endpoint")});

    if (!prompt.tools.isEmpty() && !caps.model.tooling.toolsSupported)
        gaps.append({Feature::Tools, QStringLiteral("$.tools"),
                     QStringLiteral("model does not support tools")});

    if (!prompt.tools.isEmpty() && caps.model.tooling.toolsSupported && limits.maxToolSchemaBytes) {
        QStringList oversized;
        for (const auto& tool : prompt.tools) {
            if (toolSchemaBytes(tool) > *limits.maxToolSchemaBytes)
                oversized.append(tool.name);
        }
        if (!oversized.isEmpty())
            gaps.append({Feature::ToolSchemaSize, QStringLiteral("$.tools"),
                         QStringLiteral("tool schema(s) over %1 bytes: %2")
                             .arg(*limits.maxToolSchemaBytes)
                             .arg(oversized.join(QStringLiteral(", "))), {}});
    }

    if (prompt.responseFormat && prompt.responseFormat->wantsJson() && !caps.model.jsonOutput.nativeParam)
        gaps.append({Feature::ResponseFormat, QStringLiteral("$.response_format"),
                     QStringLiteral("model has no native JSON output parameter")});

    checkRange(gaps, Feature::Temperature, QStringLiteral("$.sampling.temperature"),
               prompt.constraints.temperature, caps);
    checkRange(gaps, Feature::TopP, QStringLiteral("$.sampling.top_p"),
               prompt.constraints.topP, caps);
    std::optional<double> maxOut;
    if (prompt.constraints.maxOutputTokens)
        maxOut = *prompt.constraints.maxOutputTokens;
    checkRange(gaps, Feature::MaxOutputTokens, QStringLiteral("$.limits.max_output_tokens"), maxOut, caps);

    for (const QStringList& group : limits.mutuallyExclusive) {
        QStringList present;
        for (const QString& field : group) {
            if (hasConstraintField(prompt.constraints, field))
                present.append(field);
        }
        if (present.size() < 2)
            continue;
        const QString winner = conflictWinner(present, limits.resolutionPreferences);
        const QString firstLoser = present.first() == winner ? present.at(1) : present.first();
        gaps.append({Feature::MutuallyExclusive, constraintFieldPath(firstLoser),
                     QStringLiteral("model rejects %1 together").arg(present.join(QStringLiteral(" and "))),
                     present});
    }

    return gaps;
}

PolicyDecision DegradationPolicy::decide(Feature feature, TranslationMode mode,
                                         const ModelCapabilities& caps) {
    if (mode == TranslationMode::Strict)
        return {Fallback::Reject, LossinessCode::Unsupported, Severity::Error,
                QStringLiteral("capability_mismatch")};

    switch (feature) {
    case Feature::Messages:
        if (caps.supports(InputMode::SingleText))
            return {Fallback::FlattenToText, LossinessCode::Emulate, Severity::Info, {}};
        return {Fallback::Reject, LossinessCode::Unsupported, Severity::Error, QStringLiteral("no_fallback")};
    case Feature::Images:
        return {Fallback::DropImages, LossinessCode::Drop, Severity::Warning, {}};
    case Feature::Streaming:
        return {Fallback::UseChatEndpoint, LossinessCode::MapFallback, Severity::Warning, {}};
    case Feature::Tools:
        return {Fallback::DropTools, LossinessCode::Drop, Severity::Warning, {}};
    case Feature::ResponseFormat:
        if (caps.model.jsonOutput.strategy == QStringLiteral("system_prompt"))
            return {Fallback::EmulateJsonInstruction, LossinessCode::Emulate, Severity::Info, {}};
        return {Fallback::DropResponseFormat, LossinessCode::Drop, Severity::Warning, {}};
    case Feature::Temperature:
    case Feature::TopP:
    case Feature::MaxOutputTokens:
        return {Fallback::ClampToRange, LossinessCode::Clamp, Severity::Warning, {}};
    case Feature::SystemPromptSize:
        return {Fallback::TruncateSystemPrompt, LossinessCode::Clamp, Severity::Warning, {}};
    case Feature::ToolSchemaSize:
        return {Fallback::DropOversizedTools, LossinessCode::Drop, Severity::Warning, {}};
    case Feature::MutuallyExclusive:
        return {Fallback::DropConflictingFields, LossinessCode::Drop, Severity::Warning, {}};
    }
    return {Fallback::Reject, LossinessCode::Unsupported, Severity::Error, QStringLiteral("no_fallback")};
}
