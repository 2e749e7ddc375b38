#include "validate.h"
#include "capability.h"
#include "spec_parser.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QRegularExpression>
#include <QSet>
#include <cmath>

std::optional<SpecKind> specKindFromName(const QString& name) {
    if (name == QStringLiteral("prompt_spec"))
        return SpecKind::PromptSpec;
    if (name == QStringLiteral("provider_spec"))
        return SpecKind::ProviderSpec;
    return std::nullopt;
}

std::optional<ValidationMode> validationModeFromName(const QString& name) {
    if (name == QStringLiteral("basic"))
        return ValidationMode::Basic;
    if (name == QStringLiteral("partial"))
        return ValidationMode::Partial;
    if (name == QStringLiteral("strict"))
        return ValidationMode::Strict;
    return std::nullopt;
}

namespace {

QString at(const QString& base, const QString& key) {
    return base + QLatin1Char('.') + key;
}

QString at(const QString& base, qsizetype index) {
    return QStringLiteral("%1[%2]").arg(base).arg(index);
}

void checkVersion(ValidationReport& report, const QJsonObject& root, const VersionRange& supported) {
    const QJsonValue v = root.value(QStringLiteral("spec_version"));
    if (v.isUndefined()) {
        report.error(QStringLiteral("$.spec_version"), QStringLiteral("spec_version is required"));
        return;
    }
    if (!v.isString()) {
        report.error(QStringLiteral("$.spec_version"), QStringLiteral("spec_version must be a string"));
        return;
    }
    auto version = SemVer::parse(v.toString());
    if (!version) {
        report.error(QStringLiteral("$.spec_version"),
                     QStringLiteral("'%1' is not a MAJOR.MINOR.PATCH version").arg(v.toString()));
        return;
    }
    if (!supported.contains(*version)) {
        report.error(QStringLiteral("$.spec_version"),
                     QStringLiteral("incompatible spec_version %1; supported range is %2")
                         .arg(v.toString(), supported.toString()));
    }
}

void expectType(ValidationReport& report, const QJsonObject& obj, const QString& key,
                const QString& base, QJsonValue::Type type, const QString& typeName) {
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return;
    if (v.type() != type)
        report.error(at(base, key), QStringLiteral("must be %1").arg(typeName));
}

void expectNonNegativeInt(ValidationReport& report, const QJsonObject& obj,
                          const QString& key, const QString& base) {
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull())
        return;
    const double d = v.toDouble(-1);
    if (!v.isDouble() || d < 0 || d > 2147483647.0 || std::trunc(d) != d)
        report.error(at(base, key), QStringLiteral("must be a non-negative integer"));
}

// ---------------------------------------------------------------- prompt

void promptBasic(ValidationReport& report, const QJsonObject& root) {
    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (messages.isUndefined()) {
        report.error(QStringLiteral("$.messages"), QStringLiteral("messages is required"));
    } else if (!messages.isArray()) {
        report.error(QStringLiteral("$.messages"), QStringLiteral("messages must be an array"));
    } else if (messages.toArray().isEmpty()) {
        report.error(QStringLiteral("$.messages"), QStringLiteral("messages must not be empty"));
    } else {
        const QJsonArray msgs = messages.toArray();
        for (qsizetype i = 0; i < msgs.size(); ++i) {
            const QString path = at(QStringLiteral("$.messages"), i);
            if (!msgs[i].isObject()) {
                report.error(path, QStringLiteral("message must be an object"));
                continue;
            }
            const QJsonObject m = msgs[i].toObject();
            const QJsonValue role = m.value(QStringLiteral("role"));
            if (!role.isString())
                report.error(at(path, QStringLiteral("role")), QStringLiteral("role is required"));
            else if (!roleFromName(role.toString()))
                report.error(at(path, QStringLiteral("role")),
                             QStringLiteral("unknown role '%1'").arg(role.toString()));

            const QJsonValue content = m.value(QStringLiteral("content"));
            const QString contentPath = at(path, QStringLiteral("content"));
            if (content.isString())
                continue;
            if (!content.isArray()) {
                report.error(contentPath, QStringLiteral("content must be a string or an array of parts"));
                continue;
            }
            const QJsonArray parts = content.toArray();
            for (qsizetype j = 0; j < parts.size(); ++j) {
                const QString partPath = at(contentPath, j);
                const QJsonObject part = parts[j].toObject();
                const QString type = part.value(QStringLiteral("type")).toString();
                if (type == QStringLiteral("text")) {
                    if (!part.value(QStringLiteral("text")).isString())
                        report.error(at(partPath, QStringLiteral("text")), QStringLiteral("text must be a string"));
                } else if (type == QStringLiteral("image") || type == QStringLiteral("image_url")) {
                    if (!part.contains(QStringLiteral("url")) && !part.contains(QStringLiteral("image_url"))
                        && !part.contains(QStringLiteral("data")))
                        report.error(partPath, QStringLiteral("image part needs url, image_url or data"));
                } else {
                    report.error(at(partPath, QStringLiteral("type")),
                                 QStringLiteral("unknown part type '%1'").arg(type));
                }
            }
        }
    }

    const QString base = QStringLiteral("$");
    expectType(report, root, QStringLiteral("spec_version"), base, QJsonValue::String, QStringLiteral("a string"));
    expectType(report, root, QStringLiteral("model_class"), base, QJsonValue::String, QStringLiteral("a string"));
    expectType(report, root, QStringLiteral("system"), base, QJsonValue::String, QStringLiteral("a string"));
    expectType(report, root, QStringLiteral("stream"), base, QJsonValue::Bool, QStringLiteral("a boolean"));
    expectType(report, root, QStringLiteral("tools"), base, QJsonValue::Array, QStringLiteral("an array"));
    expectType(report, root, QStringLiteral("sampling"), base, QJsonValue::Object, QStringLiteral("an object"));
    expectType(report, root, QStringLiteral("limits"), base, QJsonValue::Object, QStringLiteral("an object"));
    expectType(report, root, QStringLiteral("media"), base, QJsonValue::Object, QStringLiteral("an object"));
    expectType(report, root, QStringLiteral("temperature"), base, QJsonValue::Double, QStringLiteral("a number"));
    expectType(report, root, QStringLiteral("top_p"), base, QJsonValue::Double, QStringLiteral("a number"));
    expectNonNegativeInt(report, root, QStringLiteral("max_tokens"), base);

    const QJsonValue stop = root.value(QStringLiteral("stop"));
    if (!stop.isUndefined() && !stop.isNull() && !stop.isString() && !stop.isArray())
        report.error(QStringLiteral("$.stop"), QStringLiteral("must be a string or an array of strings"));

    for (const QString& key : {QStringLiteral("tool_choice"), QStringLiteral("response_format")}) {
        const QJsonValue v = root.value(key);
        if (!v.isUndefined() && !v.isNull() && !v.isString() && !v.isObject())
            report.error(at(base, key), QStringLiteral("must be a string or an object"));
    }

    const QJsonObject sampling = root.value(QStringLiteral("sampling")).toObject();
    const QString samplingBase = QStringLiteral("$.sampling");
    for (const QString& key : {QStringLiteral("temperature"), QStringLiteral("top_p"),
                               QStringLiteral("frequency_penalty"), QStringLiteral("presence_penalty")})
        expectType(report, sampling, key, samplingBase, QJsonValue::Double, QStringLiteral("a number"));
    expectNonNegativeInt(report, sampling, QStringLiteral("top_k"), samplingBase);

    const QJsonObject limits = root.value(QStringLiteral("limits")).toObject();
    for (const QString& key : {QStringLiteral("max_output_tokens"), QStringLiteral("reasoning_tokens"),
                               QStringLiteral("max_prompt_tokens")})
        expectNonNegativeInt(report, limits, key, QStringLiteral("$.limits"));

    const QJsonArray tools = root.value(QStringLiteral("tools")).toArray();
    for (qsizetype i = 0; i < tools.size(); ++i) {
        QJsonObject t = tools[i].toObject();
        if (t.value(QStringLiteral("function")).isObject())
            t = t.value(QStringLiteral("function")).toObject();
        if (!t.value(QStringLiteral("name")).isString() || t.value(QStringLiteral("name")).toString().isEmpty())
            report.error(at(at(QStringLiteral("$.tools"), i), QStringLiteral("name")),
                         QStringLiteral("tool name is required"));
    }
}

void promptPartial(ValidationReport& report, const QJsonObject& root) {
    QSet<QString> toolNames;
    const QJsonArray tools = root.value(QStringLiteral("tools")).toArray();
    for (qsizetype i = 0; i < tools.size(); ++i) {
        QJsonObject t = tools[i].toObject();
        if (t.value(QStringLiteral("function")).isObject())
            t = t.value(QStringLiteral("function")).toObject();
        const QString name = t.value(QStringLiteral("name")).toString();
        if (name.isEmpty())
            continue;
        if (toolNames.contains(name))
            report.error(at(at(QStringLiteral("$.tools"), i), QStringLiteral("name")),
                         QStringLiteral("duplicate tool name '%1'").arg(name));
        toolNames.insert(name);
    }

    const QJsonValue choice = root.value(QStringLiteral("tool_choice"));
    if (!choice.isUndefined() && !choice.isNull() && choice.toString() != QStringLiteral("none")) {
        if (toolNames.isEmpty()) {
            report.error(QStringLiteral("$.tool_choice"), QStringLiteral("tool_choice requires a non-empty tools list"));
        } else if (choice.isObject()) {
            QJsonObject obj = choice.toObject();
            if (obj.value(QStringLiteral("function")).isObject())
                obj = obj.value(QStringLiteral("function")).toObject();
            const QString name = obj.value(QStringLiteral("name")).toString();
            if (!toolNames.contains(name))
                report.error(QStringLiteral("$.tool_choice.name"),
                             QStringLiteral("tool '%1' is not declared in tools").arg(name));
        }
    }

    const QJsonArray msgs = root.value(QStringLiteral("messages")).toArray();
    int systemCount = root.value(QStringLiteral("system")).isString() ? 1 : 0;
    for (qsizetype i = 0; i < msgs.size(); ++i) {
        if (msgs[i].toObject().value(QStringLiteral("role")).toString() != QStringLiteral("system"))
            continue;
        ++systemCount;
        if (i != 0)
            report.warning(at(QStringLiteral("$.messages"), i),
                           QStringLiteral("system message is expected only at index 0"));
    }
    if (systemCount > 1)
        report.warning(QStringLiteral("$.messages"),
                       QStringLiteral("%1 system messages; at most one is expected").arg(systemCount));

    const QJsonObject limits = root.value(QStringLiteral("limits")).toObject();
    const QString modelClass = root.value(QStringLiteral("model_class")).toString(QStringLiteral("Chat"));
    if (limits.contains(QStringLiteral("reasoning_tokens")) && modelClass != QStringLiteral("ReasoningChat"))
        report.error(QStringLiteral("$.limits.reasoning_tokens"),
                     QStringLiteral("reasoning_tokens is only valid for model_class ReasoningChat"));

    const QJsonObject sampling = root.value(QStringLiteral("sampling")).toObject();
    for (const QJsonObject* src : {&sampling, &root}) {
        const QString base = src == &root ? QStringLiteral("$") : QStringLiteral("$.sampling");
        const QJsonValue topP = src->value(QStringLiteral("top_p"));
        if (topP.isDouble() && (topP.toDouble() < 0.0 || topP.toDouble() > 1.0))
            report.error(at(base, QStringLiteral("top_p")), QStringLiteral("top_p must be within [0, 1]"));
        const QJsonValue temperature = src->value(QStringLiteral("temperature"));
        if (temperature.isDouble() && (temperature.toDouble() < 0.0 || temperature.toDouble() > 2.0))
            report.warning(at(base, QStringLiteral("temperature")),
                           QStringLiteral("temperature is outside the usual range [0, 2]"));
    }
}

void promptStrict(ValidationReport& report, const QJsonObject& root, const VersionRange& supported) {
    checkVersion(report, root, supported);

    if (!root.value(QStringLiteral("model_class")).isString())
        report.error(QStringLiteral("$.model_class"), QStringLiteral("model_class is required"));

    static const QSet<QString> known = {
        QStringLiteral("spec_version"), QStringLiteral("id"), QStringLiteral("model_class"),
        QStringLiteral("messages"), QStringLiteral("system"), QStringLiteral("sampling"),
        QStringLiteral("temperature"), QStringLiteral("top_p"), QStringLiteral("limits"),
        QStringLiteral("max_tokens"), QStringLiteral("stop"), QStringLiteral("stream"),
        QStringLiteral("tools"), QStringLiteral("tool_choice"), QStringLiteral("response_format"),
        QStringLiteral("media"), QStringLiteral("strict_mode"), QStringLiteral("metadata")
    };
    const bool strictPrompt = root.value(QStringLiteral("strict_mode")).toString() == QStringLiteral("Strict");
    for (const QString& key : root.keys()) {
        if (known.contains(key))
            continue;
        const QString msg = QStringLiteral("unknown field '%1'").arg(key);
        if (strictPrompt)
            report.error(at(QStringLiteral("$"), key), msg);
        else
            report.warning(at(QStringLiteral("$"), key), msg);
    }
}

// -------------------------------------------------------------- provider

void providerBasic(ValidationReport& report, const QJsonObject& root) {
    expectType(report, root, QStringLiteral("spec_version"), QStringLiteral("$"),
               QJsonValue::String, QStringLiteral("a string"));

    const QJsonValue provider = root.value(QStringLiteral("provider"));
    if (!provider.isObject()) {
        report.error(QStringLiteral("$.provider"), QStringLiteral("provider object is required"));
    } else {
        const QJsonObject p = provider.toObject();
        if (!p.value(QStringLiteral("name")).isString())
            report.error(QStringLiteral("$.provider.name"), QStringLiteral("name must be a string"));
        if (!p.value(QStringLiteral("base_url")).isString())
            report.error(QStringLiteral("$.provider.base_url"), QStringLiteral("base_url must be a string"));
    }

    const QJsonValue models = root.value(QStringLiteral("models"));
    if (!models.isArray()) {
        report.error(QStringLiteral("$.models"), QStringLiteral("models must be an array"));
        return;
    }

    const QJsonArray arr = models.toArray();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QString path = at(QStringLiteral("$.models"), i);
        if (!arr[i].isObject()) {
            report.error(path, QStringLiteral("model must be an object"));
            continue;
        }
        const QJsonObject m = arr[i].toObject();
        if (!m.value(QStringLiteral("id")).isString() || m.value(QStringLiteral("id")).toString().isEmpty())
            report.error(at(path, QStringLiteral("id")), QStringLiteral("id must be a non-empty string"));

        const QJsonValue endpoints = m.value(QStringLiteral("endpoints"));
        if (!endpoints.isObject()) {
            report.error(at(path, QStringLiteral("endpoints")), QStringLiteral("endpoints must be an object"));
        } else {
            const QJsonObject eps = endpoints.toObject();
            for (auto it = eps.constBegin(); it != eps.constEnd(); ++it) {
                const QString epPath = at(at(path, QStringLiteral("endpoints")), it.key());
                if (!it.value().isObject()) {
                    report.error(epPath, QStringLiteral("endpoint must be an object"));
                    continue;
                }
                const QJsonObject ep = it.value().toObject();
                for (const QString& key : {QStringLiteral("method"), QStringLiteral("path"), QStringLiteral("protocol")}) {
                    if (!ep.value(key).isString())
                        report.error(at(epPath, key), QStringLiteral("%1 must be a string").arg(key));
                }
            }
        }

        const QJsonValue modes = m.value(QStringLiteral("input_modes"));
        if (modes.isObject()) {
            const QJsonObject obj = modes.toObject();
            for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
                if (!it.value().isBool())
                    report.error(at(at(path, QStringLiteral("input_modes")), it.key()),
                                 QStringLiteral("must be a boolean"));
            }
        } else if (modes.isArray()) {
            for (const QJsonValue& v : modes.toArray()) {
                if (!v.isString()) {
                    report.error(at(path, QStringLiteral("input_modes")),
                                 QStringLiteral("input mode names must be strings"));
                    break;
                }
            }
        } else if (!modes.isUndefined()) {
            report.error(at(path, QStringLiteral("input_modes")),
                         QStringLiteral("must be an object of booleans or an array of names"));
        }

        const QJsonObject constraints = m.value(QStringLiteral("constraints")).toObject();
        const QString constraintsPath = at(path, QStringLiteral("constraints"));
        const QJsonObject limits = constraints.value(QStringLiteral("limits")).toObject();
        for (const QString& key : {QStringLiteral("max_tool_schema_bytes"), QStringLiteral("max_system_prompt_bytes")})
            expectNonNegativeInt(report, limits, key, at(constraintsPath, QStringLiteral("limits")));
        const QJsonValue exclusive = constraints.value(QStringLiteral("mutually_exclusive"));
        if (!exclusive.isUndefined() && !exclusive.isNull()) {
            bool wellFormed = exclusive.isArray();
            for (const QJsonValue& group : exclusive.toArray()) {
                if (!group.isArray())
                    wellFormed = false;
                for (const QJsonValue& field : group.toArray())
                    wellFormed = wellFormed && field.isString();
            }
            if (!wellFormed)
                report.error(at(constraintsPath, QStringLiteral("mutually_exclusive")),
                             QStringLiteral("must be an array of arrays of field names"));
        }
        expectType(report, constraints, QStringLiteral("resolution_preferences"), constraintsPath,
                   QJsonValue::Array, QStringLiteral("an array"));
    }
}

void checkHeaderRefs(ValidationReport& report, const QJsonObject& headers, const QString& base) {
    static const QRegularExpression valid(QStringLiteral("^\\$\\{ENV:[A-Za-z_][A-Za-z0-9_]*\\}$"));
    static const QRegularExpression ref(QStringLiteral("\\$\\{[^}]*\\}?"));
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        auto matches = ref.globalMatch(it.value().toString());
        while (matches.hasNext()) {
            const QString token = matches.next().captured(0);
            if (!valid.match(token).hasMatch()) {
                report.error(at(base, it.key()),
                             QStringLiteral("malformed environment reference '%1'").arg(token));
                break;
            }
        }
    }
}

void providerPartial(ValidationReport& report, const QJsonObject& root) {
    static const QSet<QString> protocols = {
        QStringLiteral("http"), QStringLiteral("https"), QStringLiteral("sse"),
        QStringLiteral("ws"), QStringLiteral("wss")
    };
    static const QSet<QString> methods = {
        QStringLiteral("GET"), QStringLiteral("POST"), QStringLiteral("PUT"),
        QStringLiteral("PATCH"), QStringLiteral("DELETE")
    };

    const QJsonObject provider = root.value(QStringLiteral("provider")).toObject();
    const QString baseUrl = provider.value(QStringLiteral("base_url")).toString();
    if (provider.value(QStringLiteral("base_url")).isString()
        && !baseUrl.startsWith(QStringLiteral("http://")) && !baseUrl.startsWith(QStringLiteral("https://")))
        report.error(QStringLiteral("$.provider.base_url"), QStringLiteral("base_url must use http or https"));
    checkHeaderRefs(report, provider.value(QStringLiteral("headers")).toObject(),
                    QStringLiteral("$.provider.headers"));

    QSet<QString> ids;
    const QJsonArray arr = root.value(QStringLiteral("models")).toArray();
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QString path = at(QStringLiteral("$.models"), i);
        const QJsonObject m = arr[i].toObject();
        const QString id = m.value(QStringLiteral("id")).toString();
        if (!id.isEmpty()) {
            if (ids.contains(id))
                report.error(at(path, QStringLiteral("id")), QStringLiteral("duplicate model id '%1'").arg(id));
            ids.insert(id);
        }

        const QJsonObject eps = m.value(QStringLiteral("endpoints")).toObject();
        if (m.value(QStringLiteral("endpoints")).isObject() && !eps.contains(QStringLiteral("chat_completion")))
            report.error(at(path, QStringLiteral("endpoints")), QStringLiteral("chat_completion endpoint is required"));
        for (auto it = eps.constBegin(); it != eps.constEnd(); ++it) {
            const QString epPath = at(at(path, QStringLiteral("endpoints")), it.key());
            if (!capabilityFromName(it.key()))
                report.warning(epPath, QStringLiteral("unknown capability '%1'").arg(it.key()));
            const QJsonObject ep = it.value().toObject();
            const QJsonValue protocol = ep.value(QStringLiteral("protocol"));
            if (protocol.isString() && !protocols.contains(protocol.toString().toLower()))
                report.error(at(epPath, QStringLiteral("protocol")),
                             QStringLiteral("unsupported protocol '%1'").arg(protocol.toString()));
            const QJsonValue method = ep.value(QStringLiteral("method"));
            if (method.isString() && !methods.contains(method.toString().toUpper()))
                report.error(at(epPath, QStringLiteral("method")),
                             QStringLiteral("unsupported method '%1'").arg(method.toString()));
            const QJsonValue epPathValue = ep.value(QStringLiteral("path"));
            if (epPathValue.isString() && !epPathValue.toString().startsWith(QLatin1Char('/')))
                report.error(at(epPath, QStringLiteral("path")), QStringLiteral("path must start with '/'"));
            checkHeaderRefs(report, ep.value(QStringLiteral("headers")).toObject(), at(epPath, QStringLiteral("headers")));
        }

        const QJsonValue modes = m.value(QStringLiteral("input_modes"));
        QSet<QString> enabled;
        if (modes.isUndefined()) {
            enabled.insert(QStringLiteral("messages"));
        } else if (modes.isObject()) {
            const QJsonObject obj = modes.toObject();
            for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
                if (!inputModeFromName(it.key()))
                    report.warning(at(at(path, QStringLiteral("input_modes")), it.key()),
                                   QStringLiteral("unknown input mode '%1'").arg(it.key()));
                if (it.value().toBool())
                    enabled.insert(it.key());
            }
        } else if (modes.isArray()) {
            for (const QJsonValue& v : modes.toArray()) {
                if (!inputModeFromName(v.toString()))
                    report.warning(at(path, QStringLiteral("input_modes")),
                                   QStringLiteral("unknown input mode '%1'").arg(v.toString()));
                enabled.insert(v.toString());
            }
        }
        if (!enabled.contains(QStringLiteral("messages")) && !enabled.contains(QStringLiteral("single_text")))
            report.error(at(path, QStringLiteral("input_modes")),
                         QStringLiteral("model must accept messages or single_text"));

        static const QSet<QString> exclusiveFields = {
            QStringLiteral("temperature"), QStringLiteral("top_p"), QStringLiteral("top_k"),
            QStringLiteral("frequency_penalty"), QStringLiteral("presence_penalty"),
            QStringLiteral("max_output_tokens"), QStringLiteral("max_tokens"),
            QStringLiteral("reasoning_tokens"), QStringLiteral("stop"), QStringLiteral("stop_sequences")
        };
        const QJsonObject constraints = m.value(QStringLiteral("constraints")).toObject();
        const QString exclusivePath = at(at(path, QStringLiteral("constraints")), QStringLiteral("mutually_exclusive"));
        const QJsonArray groups = constraints.value(QStringLiteral("mutually_exclusive")).toArray();
        QSet<QString> grouped;
        for (qsizetype g = 0; g < groups.size(); ++g) {
            for (const QJsonValue& field : groups[g].toArray()) {
                grouped.insert(field.toString());
                if (field.isString() && !exclusiveFields.contains(field.toString()))
                    report.warning(at(exclusivePath, g),
                                   QStringLiteral("'%1' is not a sampling or limit field").arg(field.toString()));
            }
        }
        for (const QJsonValue& preferred : constraints.value(QStringLiteral("resolution_preferences")).toArray()) {
            if (!grouped.contains(preferred.toString()))
                report.warning(at(at(path, QStringLiteral("constraints")), QStringLiteral("resolution_preferences")),
                               QStringLiteral("'%1' is not in any mutually_exclusive group").arg(preferred.toString()));
        }

        const QJsonObject paths = m.value(QStringLiteral("mappings")).toObject()
                                      .value(QStringLiteral("paths")).toObject();
        for (auto it = paths.constBegin(); it != paths.constEnd(); ++it) {
            if (it.value().toString().isEmpty())
                report.error(at(at(path, QStringLiteral("mappings.paths")), it.key()),
                             QStringLiteral("mapping target must be a non-empty string"));
        }
    }
}

void providerStrict(ValidationReport& report, const QJsonObject& root, const VersionRange& supported) {
    checkVersion(report, root, supported);

    const QJsonArray arr = root.value(QStringLiteral("models")).toArray();
    if (root.value(QStringLiteral("models")).isArray() && arr.isEmpty())
        report.error(QStringLiteral("$.models"), QStringLiteral("at least one model is required"));
    for (qsizetype i = 0; i < arr.size(); ++i) {
        const QString path = at(QStringLiteral("$.models"), i);
        const QJsonObject m = arr[i].toObject();
        if (!m.value(QStringLiteral("family")).isString() || m.value(QStringLiteral("family")).toString().isEmpty())
            report.error(at(path, QStringLiteral("family")), QStringLiteral("family is required"));
        if (!m.contains(QStringLiteral("input_modes")))
            report.error(at(path, QStringLiteral("input_modes")), QStringLiteral("input_modes is required"));
    }
}

} // namespace

namespace Validate {

ValidationReport promptSpec(const QJsonValue& root, ValidationMode mode, const VersionRange& supported) {
    ValidationReport report;
    report.kind = SpecKind::PromptSpec;
    report.mode = mode;
    if (!root.isObject()) {
        report.error(QStringLiteral("$"), QStringLiteral("document root must be an object"));
        return report;
    }
    const QJsonObject obj = SpecParser::unwrapPrompt(root.toObject());
    promptBasic(report, obj);
    if (mode == ValidationMode::Basic)
        return report;
    promptPartial(report, obj);
    if (mode == ValidationMode::Partial)
        return report;
    promptStrict(report, obj, supported);
    return report;
}

ValidationReport providerSpec(const QJsonValue& root, ValidationMode mode, const VersionRange& supported) {
    ValidationReport report;
    report.kind = SpecKind::ProviderSpec;
    report.mode = mode;
    if (!root.isObject()) {
        report.error(QStringLiteral("$"), QStringLiteral("document root must be an object"));
        return report;
    }
    const QJsonObject obj = root.toObject();
    providerBasic(report, obj);
    if (mode == ValidationMode::Basic)
        return report;
    providerPartial(report, obj);
    if (mode == ValidationMode::Partial)
        return report;
    providerStrict(report, obj, supported);
    return report;
}

ValidationReport spec(const QJsonValue& root, SpecKind kind, ValidationMode mode, const VersionRange& supported) {
    return kind == SpecKind::PromptSpec ? promptSpec(root, mode, supported)
                                        : providerSpec(root, mode, supported);
}

Result<ValidationReport> document(const QByteArray& bytes,
                                  const QString& specType,
                                  const QString& mode,
                                  const VersionRange& supported) {
    auto kind = specKindFromName(specType);
    if (!kind)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_spec_type"),
            QStringLiteral("unknown spec_type '%1'; expected prompt_spec or provider_spec").arg(specType)));
    auto parsedMode = validationModeFromName(mode);
    if (!parsedMode)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_mode"),
            QStringLiteral("unknown validation mode '%1'; expected basic, partial or strict").arg(mode)));

    auto doc = SpecParser::parseJson(bytes);
    if (!doc)
        return std::unexpected(doc.error());

    const QJsonValue root = doc->isObject() ? QJsonValue(doc->object()) : QJsonValue(doc->array());
    ValidationReport report = spec(root, *kind, *parsedMode, supported);
    LogManager::instance().log(LogManager::Debug, "validate",
        QStringLiteral("%1/%2: %3 error(s), %4 warning(s)")
            .arg(specType, mode)
            .arg(report.errorCount())
            .arg(report.warningCount()));
    return report;
}

}
