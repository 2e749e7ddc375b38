#include "spec_parser.h"
#include "capability.h"
#include <QJsonArray>
#include <QJsonParseError>
#include <QSet>
#include <QStringDecoder>
#include <cmath>

namespace {

DomainFailure shapeError(const QString& code, const QString& path, const QString& what) {
    return DomainFailure::invalidInput(code, QStringLiteral("%1: %2").arg(path, what));
}

Result<std::optional<double>> optionalNumber(const QJsonObject& obj,
                                             const QString& key,
                                             const QString& path) {
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return std::optional<double>{};
    if (!v.isDouble())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"),
                                          path + QLatin1Char('.') + key,
                                          QStringLiteral("expected a number")));
    return std::optional<double>(v.toDouble());
}

Result<std::optional<int>> optionalInteger(const QJsonObject& obj,
                                           const QString& key,
                                           const QString& path) {
    auto num = optionalNumber(obj, key, path);
    if (!num) return std::unexpected(num.error());
    if (!num->has_value())
        return std::optional<int>{};
    const double d = **num;
    if (d < 0 || d > 2147483647.0 || std::trunc(d) != d)
        return std::unexpected(shapeError(QStringLiteral("invalid_type"),
                                          path + QLatin1Char('.') + key,
                                          QStringLiteral("expected a non-negative integer")));
    return std::optional<int>(static_cast<int>(d));
}

Result<QMap<QString, QString>> stringMap(const QJsonValue& v, const QString& path) {
    QMap<QString, QString> out;
    if (v.isUndefined() || v.isNull())
        return out;
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path,
                                          QStringLiteral("expected an object of strings")));
    const QJsonObject obj = v.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!it.value().isString())
            return std::unexpected(shapeError(QStringLiteral("invalid_type"),
                                              path + QLatin1Char('.') + it.key(),
                                              QStringLiteral("expected a string")));
        out.insert(it.key(), it.value().toString());
    }
    return out;
}

Result<QStringList> stringList(const QJsonValue& v, const QString& path) {
    QStringList out;
    if (v.isUndefined() || v.isNull())
        return out;
    if (!v.isArray())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path,
                                          QStringLiteral("expected an array of strings")));
    const QJsonArray arr = v.toArray();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        if (!arr[i].isString())
            return std::unexpected(shapeError(QStringLiteral("invalid_type"),
                                              QStringLiteral("%1[%2]").arg(path).arg(i),
                                              QStringLiteral("expected a string")));
        out.append(arr[i].toString());
    }
    return out;
}

Result<QList<QStringList>> parseExclusiveGroups(const QJsonValue& v, const QString& path) {
    QList<QStringList> groups;
    if (v.isUndefined() || v.isNull())
        return groups;
    if (!v.isArray())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path,
                                          QStringLiteral("expected an array of field groups")));
    const QJsonArray arr = v.toArray();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QString groupPath = QStringLiteral("%1[%2]").arg(path).arg(i);
        if (!arr[i].isArray())
            return std::unexpected(shapeError(QStringLiteral("invalid_type"), groupPath,
                                              QStringLiteral("expected an array of strings")));
        auto group = stringList(arr[i], groupPath);
        if (!group) return std::unexpected(group.error());
        if (group->size() > 1)
            groups.append(*group);
    }
    return groups;
}

// "data:image/png;base64,AAAA" -> mime + payload; anything else is raw base64.
MediaRef mediaFromData(const QString& data, const QString& mimeType) {
    MediaRef ref;
    ref.mimeType = mimeType;
    if (data.startsWith(QStringLiteral("data:"))) {
        const qsizetype comma = data.indexOf(QLatin1Char(','));
        const QString header = data.mid(5, comma < 0 ? -1 : comma - 5);
        const qsizetype semi = header.indexOf(QLatin1Char(';'));
        if (ref.mimeType.isEmpty())
            ref.mimeType = semi < 0 ? header : header.left(semi);
        ref.inlineData = comma < 0 ? QString() : data.mid(comma + 1);
    } else {
        ref.inlineData = data;
    }
    if (ref.mimeType.isEmpty())
        ref.mimeType = QStringLiteral("image/png");
    return ref;
}

Result<MediaRef> parseImageRef(const QJsonValue& v, const QString& path) {
    if (v.isString()) {
        const QString s = v.toString();
        if (s.startsWith(QStringLiteral("data:")))
            return mediaFromData(s, QString());
        MediaRef ref;
        ref.uri = s;
        return ref;
    }
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_image"), path,
                                          QStringLiteral("expected an image reference")));

    const QJsonObject obj = v.toObject();
    const QString mime = obj.value(QStringLiteral("mime_type")).toString();
    if (obj.contains(QStringLiteral("data")))
        return mediaFromData(obj.value(QStringLiteral("data")).toString(), mime);

    QJsonValue url = obj.value(QStringLiteral("url"));
    if (url.isUndefined())
        url = obj.value(QStringLiteral("image_url"));
    if (url.isObject())
        url = url.toObject().value(QStringLiteral("url"));
    if (!url.isString() || url.toString().isEmpty())
        return std::unexpected(shapeError(QStringLiteral("invalid_image"), path,
                                          QStringLiteral("image needs url, image_url or data")));
    if (url.toString().startsWith(QStringLiteral("data:")))
        return mediaFromData(url.toString(), mime);

    MediaRef ref;
    ref.uri = url.toString();
    ref.mimeType = mime;
    return ref;
}

Result<QList<Segment>> parseContent(const QJsonValue& content, const QString& path) {
    QList<Segment> segments;
    if (content.isUndefined() || content.isNull())
        return segments;
    if (content.isString()) {
        segments.append(Segment::fromText(content.toString()));
        return segments;
    }
    if (!content.isArray())
        return std::unexpected(shapeError(QStringLiteral("invalid_content"), path,
                                          QStringLiteral("content must be a string or an array of parts")));

    const QJsonArray parts = content.toArray();
    for (qsizetype i = 0; i < parts.size(); ++i) {
        const QString partPath = QStringLiteral("%1[%2]").arg(path).arg(i);
        if (!parts[i].isObject())
            return std::unexpected(shapeError(QStringLiteral("invalid_content"), partPath,
                                              QStringLiteral("part must be an object")));
        const QJsonObject p = parts[i].toObject();
        const QString type = p.value(QStringLiteral("type")).toString();
        if (type == QStringLiteral("text")) {
            const QJsonValue text = p.value(QStringLiteral("text"));
            if (!text.isString())
                return std::unexpected(shapeError(QStringLiteral("invalid_content"),
                                                  partPath + QStringLiteral(".text"),
                                                  QStringLiteral("expected a string")));
            segments.append(Segment::fromText(text.toString()));
        } else if (type == QStringLiteral("image") || type == QStringLiteral("image_url")) {
            auto ref = parseImageRef(p, partPath);
            if (!ref) return std::unexpected(ref.error());
            segments.append(Segment::fromImage(*ref));
        } else {
            return std::unexpected(shapeError(QStringLiteral("unknown_part_type"), partPath,
                                              QStringLiteral("unknown part type '%1'").arg(type)));
        }
    }
    return segments;
}

Result<ActionSpec> parseTool(const QJsonValue& v, const QString& path) {
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_tool"), path,
                                          QStringLiteral("tool must be an object")));
    QJsonObject t = v.toObject();
    // OpenAI-style {"type":"function","function":{...}}
    if (t.value(QStringLiteral("function")).isObject())
        t = t.value(QStringLiteral("function")).toObject();

    const QJsonValue name = t.value(QStringLiteral("name"));
    if (!name.isString() || name.toString().isEmpty())
        return std::unexpected(shapeError(QStringLiteral("invalid_tool"), path + QStringLiteral(".name"),
                                          QStringLiteral("tool name is required")));
    ActionSpec spec;
    spec.name = name.toString();
    spec.description = t.value(QStringLiteral("description")).toString();
    if (t.value(QStringLiteral("json_schema")).isObject())
        spec.parameters = t.value(QStringLiteral("json_schema")).toObject();
    else if (t.value(QStringLiteral("parameters")).isObject())
        spec.parameters = t.value(QStringLiteral("parameters")).toObject();
    return spec;
}

Result<ToolChoice> parseToolChoice(const QJsonValue& v) {
    const QString path = QStringLiteral("$.tool_choice");
    ToolChoice choice;
    if (v.isString()) {
        const QString s = v.toString();
        if (s == QStringLiteral("auto"))          choice.mode = ToolChoice::Mode::Auto;
        else if (s == QStringLiteral("required")) choice.mode = ToolChoice::Mode::Required;
        else if (s == QStringLiteral("none"))     choice.mode = ToolChoice::Mode::None;
        else
            return std::unexpected(shapeError(QStringLiteral("invalid_tool_choice"), path,
                                              QStringLiteral("unknown tool_choice '%1'").arg(s)));
        return choice;
    }
    if (v.isObject()) {
        QJsonObject obj = v.toObject();
        if (obj.value(QStringLiteral("function")).isObject())
            obj = obj.value(QStringLiteral("function")).toObject();
        const QString name = obj.value(QStringLiteral("name")).toString();
        if (name.isEmpty())
            return std::unexpected(shapeError(QStringLiteral("invalid_tool_choice"), path,
                                              QStringLiteral("named tool_choice needs a name")));
        choice.mode = ToolChoice::Mode::Specific;
        choice.name = name;
        return choice;
    }
    return std::unexpected(shapeError(QStringLiteral("invalid_tool_choice"), path,
                                      QStringLiteral("expected a string or an object")));
}

Result<ResponseFormat> parseResponseFormat(const QJsonValue& v) {
    const QString path = QStringLiteral("$.response_format");
    ResponseFormat fmt;
    QString type;
    QJsonObject obj;
    if (v.isString()) {
        type = v.toString();
    } else if (v.isObject()) {
        obj = v.toObject();
        type = obj.value(QStringLiteral("type")).toString();
    } else {
        return std::unexpected(shapeError(QStringLiteral("invalid_response_format"), path,
                                          QStringLiteral("expected a string or an object")));
    }

    if (type == QStringLiteral("text")) {
        fmt.type = ResponseFormat::Type::Text;
    } else if (type == QStringLiteral("json_object") || type == QStringLiteral("json")) {
        fmt.type = ResponseFormat::Type::JsonObject;
    } else if (type == QStringLiteral("json_schema")) {
        fmt.type = ResponseFormat::Type::JsonSchema;
        const QJsonValue schema = obj.value(QStringLiteral("json_schema"));
        if (schema.isObject())
            fmt.schema = schema.toObject();
        else if (obj.value(QStringLiteral("schema")).isObject())
            fmt.schema = obj.value(QStringLiteral("schema")).toObject();
        if (obj.value(QStringLiteral("strict")).isBool())
            fmt.strict = obj.value(QStringLiteral("strict")).toBool();
    } else {
        return std::unexpected(shapeError(QStringLiteral("invalid_response_format"), path,
                                          QStringLiteral("unknown response_format '%1'").arg(type)));
    }
    return fmt;
}

Result<EndpointDescriptor> parseEndpoint(const QJsonValue& v, const QString& path) {
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_endpoint"), path,
                                          QStringLiteral("endpoint must be an object")));
    const QJsonObject obj = v.toObject();
    EndpointDescriptor ep;

    const QJsonValue epPath = obj.value(QStringLiteral("path"));
    if (!epPath.isString())
        return std::unexpected(shapeError(QStringLiteral("invalid_endpoint"), path + QStringLiteral(".path"),
                                          QStringLiteral("path is required")));
    ep.path = epPath.toString();

    const QJsonValue method = obj.value(QStringLiteral("method"));
    if (method.isString())
        ep.method = method.toString().toUpper();
    else if (!method.isUndefined())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path + QStringLiteral(".method"),
                                          QStringLiteral("expected a string")));

    const QJsonValue protocol = obj.value(QStringLiteral("protocol"));
    if (protocol.isString())
        ep.protocol = protocol.toString().toLower();
    else if (!protocol.isUndefined())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path + QStringLiteral(".protocol"),
                                          QStringLiteral("expected a string")));

    auto headers = stringMap(obj.value(QStringLiteral("headers")), path + QStringLiteral(".headers"));
    if (!headers) return std::unexpected(headers.error());
    ep.headers = *headers;

    auto query = stringMap(obj.value(QStringLiteral("query")), path + QStringLiteral(".query"));
    if (!query) return std::unexpected(query.error());
    ep.query = *query;
    return ep;
}

Result<QMap<InputMode, bool>> parseInputModes(const QJsonValue& v, const QString& path) {
    QMap<InputMode, bool> modes;
    if (v.isUndefined() || v.isNull()) {
        modes.insert(InputMode::Messages, true);
        return modes;
    }
    if (v.isArray()) {
        for (const QJsonValue& item : v.toArray()) {
            if (!item.isString())
                return std::unexpected(shapeError(QStringLiteral("invalid_type"), path,
                                                  QStringLiteral("input mode names must be strings")));
            if (auto mode = inputModeFromName(item.toString()))
                modes.insert(*mode, true);
        }
        return modes;
    }
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path,
                                          QStringLiteral("expected an object of booleans or an array")));
    const QJsonObject obj = v.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (!it.value().isBool())
            return std::unexpected(shapeError(QStringLiteral("invalid_type"),
                                              path + QLatin1Char('.') + it.key(),
                                              QStringLiteral("expected a boolean")));
        if (auto mode = inputModeFromName(it.key()))
            modes.insert(*mode, it.value().toBool());
    }
    return modes;
}

Result<ModelSpec> parseModel(const QJsonValue& v, const QString& path) {
    if (!v.isObject())
        return std::unexpected(shapeError(QStringLiteral("invalid_model"), path,
                                          QStringLiteral("model must be an object")));
    const QJsonObject obj = v.toObject();
    ModelSpec model;

    const QJsonValue id = obj.value(QStringLiteral("id"));
    if (!id.isString() || id.toString().isEmpty())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), path + QStringLiteral(".id"),
                                          QStringLiteral("model id is required")));
    model.id = id.toString();
    model.family = obj.value(QStringLiteral("family")).toString();

    for (const QJsonValue& alias : obj.value(QStringLiteral("aliases")).toArray()) {
        if (alias.isString())
            model.aliases.append(alias.toString());
    }

    const QJsonValue endpoints = obj.value(QStringLiteral("endpoints"));
    if (endpoints.isObject()) {
        const QJsonObject eps = endpoints.toObject();
        for (auto it = eps.constBegin(); it != eps.constEnd(); ++it) {
            auto capability = capabilityFromName(it.key());
            if (!capability)
                continue;
            auto ep = parseEndpoint(it.value(), path + QStringLiteral(".endpoints.") + it.key());
            if (!ep) return std::unexpected(ep.error());
            model.endpoints.insert(*capability, *ep);
        }
    } else if (!endpoints.isUndefined() && !endpoints.isNull()) {
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), path + QStringLiteral(".endpoints"),
                                          QStringLiteral("expected an object")));
    }

    auto modes = parseInputModes(obj.value(QStringLiteral("input_modes")), path + QStringLiteral(".input_modes"));
    if (!modes) return std::unexpected(modes.error());
    model.inputModes = *modes;

    const QJsonObject tooling = obj.value(QStringLiteral("tooling")).toObject();
    model.tooling.toolsSupported = tooling.value(QStringLiteral("tools_supported")).toBool(false);
    model.tooling.parallelToolCallsDefault =
        tooling.value(QStringLiteral("parallel_tool_calls_default")).toBool(false);

    const QJsonObject jsonOutput = obj.value(QStringLiteral("json_output")).toObject();
    model.jsonOutput.nativeParam = jsonOutput.value(QStringLiteral("native_param")).toBool(false);
    model.jsonOutput.strategy = jsonOutput.value(QStringLiteral("strategy")).toString();

    const QJsonObject params = obj.value(QStringLiteral("parameters")).toObject();
    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        const QJsonObject range = it.value().toObject();
        ParameterRange r;
        if (range.value(QStringLiteral("min")).isDouble())
            r.min = range.value(QStringLiteral("min")).toDouble();
        if (range.value(QStringLiteral("max")).isDouble())
            r.max = range.value(QStringLiteral("max")).toDouble();
        if (r.min && r.max && *r.min > *r.max)
            return std::unexpected(shapeError(QStringLiteral("invalid_range"),
                                              path + QStringLiteral(".parameters.") + it.key(),
                                              QStringLiteral("min is greater than max")));
        model.parameters.insert(it.key(), r);
    }

    const QJsonObject constraints = obj.value(QStringLiteral("constraints")).toObject();
    const QString location = constraints.value(QStringLiteral("system_prompt_location")).toString();
    if (location == QStringLiteral("top_level"))
        model.constraints.systemPromptLocation = SystemPromptLocation::TopLevel;
    else if (location == QStringLiteral("none"))
        model.constraints.systemPromptLocation = SystemPromptLocation::None;
    model.constraints.maxOutputTokensRequired =
        constraints.value(QStringLiteral("max_output_tokens_required")).toBool(false);

    const QString constraintsPath = path + QStringLiteral(".constraints");
    auto exclusive = parseExclusiveGroups(constraints.value(QStringLiteral("mutually_exclusive")),
                                          constraintsPath + QStringLiteral(".mutually_exclusive"));
    if (!exclusive) return std::unexpected(exclusive.error());
    model.constraints.mutuallyExclusive = *exclusive;
    auto preferences = stringList(constraints.value(QStringLiteral("resolution_preferences")),
                                  constraintsPath + QStringLiteral(".resolution_preferences"));
    if (!preferences) return std::unexpected(preferences.error());
    model.constraints.resolutionPreferences = *preferences;

    const QJsonObject limits = constraints.value(QStringLiteral("limits")).toObject();
    const QString limitsPath = constraintsPath + QStringLiteral(".limits");
    auto toolSchemaBytes = optionalInteger(limits, QStringLiteral("max_tool_schema_bytes"), limitsPath);
    if (!toolSchemaBytes) return std::unexpected(toolSchemaBytes.error());
    model.constraints.maxToolSchemaBytes = *toolSchemaBytes;
    auto systemPromptBytes = optionalInteger(limits, QStringLiteral("max_system_prompt_bytes"), limitsPath);
    if (!systemPromptBytes) return std::unexpected(systemPromptBytes.error());
    model.constraints.maxSystemPromptBytes = *systemPromptBytes;

    const QJsonObject mappings = obj.value(QStringLiteral("mappings")).toObject();
    auto paths = stringMap(mappings.value(QStringLiteral("paths")), path + QStringLiteral(".mappings.paths"));
    if (!paths) return std::unexpected(paths.error());
    model.mappings = *paths;

    return model;
}

} // namespace

Result<QJsonDocument> SpecParser::parseJson(const QByteArray& bytes) {
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString text = decoder(bytes);
    Q_UNUSED(text);
    if (decoder.hasError())
        return std::unexpected(DomainFailure::utf8Error(
            QStringLiteral("input is not valid UTF-8")));

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError)
        return std::unexpected(DomainFailure::jsonError(
            QStringLiteral("malformed JSON at offset %1: %2").arg(err.offset).arg(err.errorString())));
    return doc;
}

Result<QJsonObject> SpecParser::parseDocument(const QByteArray& bytes) {
    auto doc = parseJson(bytes);
    if (!doc) return std::unexpected(doc.error());
    if (!doc->isObject())
        return std::unexpected(shapeError(QStringLiteral("not_an_object"), QStringLiteral("$"),
                                          QStringLiteral("document root must be an object")));
    return doc->object();
}

QJsonObject SpecParser::unwrapPrompt(const QJsonObject& root) {
    if (!root.contains(QStringLiteral("messages")) && root.value(QStringLiteral("prompt")).isObject())
        return root.value(QStringLiteral("prompt")).toObject();
    return root;
}

Result<PromptSpec> SpecParser::parsePrompt(const QByteArray& bytes) {
    auto root = parseDocument(bytes);
    if (!root) return std::unexpected(root.error());
    return promptFromJson(*root);
}

Result<PromptSpec> SpecParser::promptFromJson(const QJsonObject& input) {
    const QJsonObject root = unwrapPrompt(input);
    PromptSpec spec;

    spec.specVersion = root.value(QStringLiteral("spec_version")).toString();
    spec.id = root.value(QStringLiteral("id")).toString();
    if (root.value(QStringLiteral("model_class")).isString())
        spec.modelClass = root.value(QStringLiteral("model_class")).toString();
    spec.strictMode = root.value(QStringLiteral("strict_mode")).toString();

    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (messages.isUndefined())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), QStringLiteral("$.messages"),
                                          QStringLiteral("messages is required")));
    if (!messages.isArray())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), QStringLiteral("$.messages"),
                                          QStringLiteral("messages must be an array")));

    const QJsonValue system = root.value(QStringLiteral("system"));
    if (system.isString() && !system.toString().isEmpty()) {
        InteractionItem item;
        item.role = MessageRole::System;
        item.content.append(Segment::fromText(system.toString()));
        spec.messages.append(item);
    }

    const QJsonArray msgs = messages.toArray();
    for (qsizetype i = 0; i < msgs.size(); ++i) {
        const QString path = QStringLiteral("$.messages[%1]").arg(i);
        if (!msgs[i].isObject())
            return std::unexpected(shapeError(QStringLiteral("invalid_message"), path,
                                              QStringLiteral("message must be an object")));
        const QJsonObject m = msgs[i].toObject();
        const QString role = m.value(QStringLiteral("role")).toString();
        auto parsedRole = roleFromName(role);
        if (!parsedRole)
            return std::unexpected(shapeError(QStringLiteral("unknown_role"), path + QStringLiteral(".role"),
                                              QStringLiteral("unknown role '%1'").arg(role)));
        auto content = parseContent(m.value(QStringLiteral("content")), path + QStringLiteral(".content"));
        if (!content) return std::unexpected(content.error());

        InteractionItem item;
        item.role = *parsedRole;
        item.content = *content;
        item.name = m.value(QStringLiteral("name")).toString();
        spec.messages.append(item);
    }

    // Sampling: nested block first, top-level shorthand wins when both are set.
    const QJsonObject sampling = root.value(QStringLiteral("sampling")).toObject();
    for (const QJsonObject* src : {&sampling, &root}) {
        const QString base = src == &root ? QStringLiteral("$") : QStringLiteral("$.sampling");
        auto temperature = optionalNumber(*src, QStringLiteral("temperature"), base);
        if (!temperature) return std::unexpected(temperature.error());
        if (*temperature) spec.constraints.temperature = *temperature;

        auto topP = optionalNumber(*src, QStringLiteral("top_p"), base);
        if (!topP) return std::unexpected(topP.error());
        if (*topP) spec.constraints.topP = *topP;
    }
    auto topK = optionalInteger(sampling, QStringLiteral("top_k"), QStringLiteral("$.sampling"));
    if (!topK) return std::unexpected(topK.error());
    spec.constraints.topK = *topK;
    auto freq = optionalNumber(sampling, QStringLiteral("frequency_penalty"), QStringLiteral("$.sampling"));
    if (!freq) return std::unexpected(freq.error());
    spec.constraints.frequencyPenalty = *freq;
    auto presence = optionalNumber(sampling, QStringLiteral("presence_penalty"), QStringLiteral("$.sampling"));
    if (!presence) return std::unexpected(presence.error());
    spec.constraints.presencePenalty = *presence;

    const QJsonObject limits = root.value(QStringLiteral("limits")).toObject();
    auto maxOut = optionalInteger(limits, QStringLiteral("max_output_tokens"), QStringLiteral("$.limits"));
    if (!maxOut) return std::unexpected(maxOut.error());
    spec.constraints.maxOutputTokens = *maxOut;
    auto maxTokens = optionalInteger(root, QStringLiteral("max_tokens"), QStringLiteral("$"));
    if (!maxTokens) return std::unexpected(maxTokens.error());
    if (*maxTokens) spec.constraints.maxOutputTokens = *maxTokens;
    auto reasoning = optionalInteger(limits, QStringLiteral("reasoning_tokens"), QStringLiteral("$.limits"));
    if (!reasoning) return std::unexpected(reasoning.error());
    spec.constraints.reasoningTokens = *reasoning;
    auto maxPrompt = optionalInteger(limits, QStringLiteral("max_prompt_tokens"), QStringLiteral("$.limits"));
    if (!maxPrompt) return std::unexpected(maxPrompt.error());
    spec.constraints.maxPromptTokens = *maxPrompt;

    const QJsonValue stop = root.value(QStringLiteral("stop"));
    if (stop.isString()) {
        spec.constraints.stopSequences.append(stop.toString());
    } else if (stop.isArray()) {
        for (const QJsonValue& s : stop.toArray()) {
            if (!s.isString())
                return std::unexpected(shapeError(QStringLiteral("invalid_type"), QStringLiteral("$.stop"),
                                                  QStringLiteral("stop sequences must be strings")));
            spec.constraints.stopSequences.append(s.toString());
        }
    } else if (!stop.isUndefined() && !stop.isNull()) {
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), QStringLiteral("$.stop"),
                                          QStringLiteral("expected a string or an array")));
    }

    const QJsonValue stream = root.value(QStringLiteral("stream"));
    if (stream.isBool())
        spec.stream = stream.toBool();
    else if (!stream.isUndefined() && !stream.isNull())
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), QStringLiteral("$.stream"),
                                          QStringLiteral("expected a boolean")));

    const QJsonValue tools = root.value(QStringLiteral("tools"));
    if (tools.isArray()) {
        const QJsonArray arr = tools.toArray();
        for (qsizetype i = 0; i < arr.size(); ++i) {
            auto tool = parseTool(arr[i], QStringLiteral("$.tools[%1]").arg(i));
            if (!tool) return std::unexpected(tool.error());
            spec.tools.append(*tool);
        }
    } else if (!tools.isUndefined() && !tools.isNull()) {
        return std::unexpected(shapeError(QStringLiteral("invalid_type"), QStringLiteral("$.tools"),
                                          QStringLiteral("expected an array")));
    }

    const QJsonValue toolChoice = root.value(QStringLiteral("tool_choice"));
    if (!toolChoice.isUndefined() && !toolChoice.isNull()) {
        auto choice = parseToolChoice(toolChoice);
        if (!choice) return std::unexpected(choice.error());
        spec.toolChoice = *choice;
    }

    const QJsonValue responseFormat = root.value(QStringLiteral("response_format"));
    if (!responseFormat.isUndefined() && !responseFormat.isNull()) {
        auto fmt = parseResponseFormat(responseFormat);
        if (!fmt) return std::unexpected(fmt.error());
        spec.responseFormat = *fmt;
    }

    const QJsonArray images = root.value(QStringLiteral("media")).toObject()
                                  .value(QStringLiteral("input_images")).toArray();
    if (!images.isEmpty()) {
        qsizetype target = -1;
        for (qsizetype i = spec.messages.size() - 1; i >= 0; --i) {
            if (spec.messages[i].role == MessageRole::User) {
                target = i;
                break;
            }
        }
        if (target < 0) {
            spec.messages.append(InteractionItem{});
            target = spec.messages.size() - 1;
        }
        for (qsizetype i = 0; i < images.size(); ++i) {
            auto ref = parseImageRef(images[i], QStringLiteral("$.media.input_images[%1]").arg(i));
            if (!ref) return std::unexpected(ref.error());
            spec.messages[target].content.append(Segment::fromImage(*ref));
        }
    }

    return spec;
}

Result<ProviderSpec> SpecParser::parseProvider(const QByteArray& bytes) {
    auto root = parseDocument(bytes);
    if (!root) return std::unexpected(root.error());
    return providerFromJson(*root);
}

Result<ProviderSpec> SpecParser::providerFromJson(const QJsonObject& root) {
    ProviderSpec spec;
    spec.specVersion = root.value(QStringLiteral("spec_version")).toString();

    const QJsonValue provider = root.value(QStringLiteral("provider"));
    if (!provider.isObject())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), QStringLiteral("$.provider"),
                                          QStringLiteral("provider object is required")));
    const QJsonObject p = provider.toObject();
    const QJsonValue name = p.value(QStringLiteral("name"));
    if (!name.isString() || name.toString().isEmpty())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), QStringLiteral("$.provider.name"),
                                          QStringLiteral("provider name is required")));
    const QJsonValue baseUrl = p.value(QStringLiteral("base_url"));
    if (!baseUrl.isString())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), QStringLiteral("$.provider.base_url"),
                                          QStringLiteral("base_url is required")));
    spec.provider.name = name.toString();
    spec.provider.baseUrl = baseUrl.toString();
    auto headers = stringMap(p.value(QStringLiteral("headers")), QStringLiteral("$.provider.headers"));
    if (!headers) return std::unexpected(headers.error());
    spec.provider.headers = *headers;

    const QJsonValue models = root.value(QStringLiteral("models"));
    if (!models.isArray())
        return std::unexpected(shapeError(QStringLiteral("missing_field"), QStringLiteral("$.models"),
                                          QStringLiteral("models must be an array")));

    QSet<QString> seen;
    const QJsonArray arr = models.toArray();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QString path = QStringLiteral("$.models[%1]").arg(i);
        auto model = parseModel(arr[i], path);
        if (!model) return std::unexpected(model.error());
        if (seen.contains(model->id))
            return std::unexpected(shapeError(QStringLiteral("duplicate_model_id"), path + QStringLiteral(".id"),
                                              QStringLiteral("duplicate model id '%1'").arg(model->id)));
        seen.insert(model->id);
        spec.models.append(*model);
    }
    return spec;
}

Result<ParsedSpec> SpecParser::parse(SpecKind kind, const QByteArray& bytes) {
    if (kind == SpecKind::PromptSpec) {
        auto prompt = parsePrompt(bytes);
        if (!prompt) return std::unexpected(prompt.error());
        return ParsedSpec(std::move(*prompt));
    }
    auto provider = parseProvider(bytes);
    if (!provider) return std::unexpected(provider.error());
    return ParsedSpec(std::move(*provider));
}
