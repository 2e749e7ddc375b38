#include <QTest>
#include <QJsonObject>
#include "semantic/spec_parser.h"

class TestSpecParser : public QObject {
    Q_OBJECT

private slots:
    void testParseSimplePrompt() {
        auto prompt = SpecParser::parsePrompt(R"({
            "spec_version": "1.0.0",
            "system": "Be brief.",
            "messages": [{"role": "user", "content": "Hello"}],
            "sampling": {"temperature": 0.2, "top_p": 0.9, "top_k": 40},
            "limits": {"max_output_tokens": 256},
            "stop": ["END"]
        })");
        QVERIFY(prompt.has_value());
        QCOMPARE(prompt->messages.size(), 2);
        QCOMPARE(prompt->messages[0].role, MessageRole::System);
        QCOMPARE(prompt->messages[0].joinedText(), QStringLiteral("Be brief."));
        QCOMPARE(prompt->messages[1].role, MessageRole::User);
        QCOMPARE(*prompt->constraints.temperature, 0.2);
        QCOMPARE(*prompt->constraints.topP, 0.9);
        QCOMPARE(*prompt->constraints.topK, 40);
        QCOMPARE(*prompt->constraints.maxOutputTokens, 256);
        QCOMPARE(prompt->constraints.stopSequences, QStringList{QStringLiteral("END")});
        QCOMPARE(prompt->modelClass, QStringLiteral("Chat"));
    }

    void testTopLevelShorthandWins() {
        auto prompt = SpecParser::parsePrompt(R"({
            "messages": [{"role": "user", "content": "x"}],
            "sampling": {"temperature": 0.2},
            "temperature": 0.7,
            "limits": {"max_output_tokens": 100},
            "max_tokens": 50
        })");
        QVERIFY(prompt.has_value());
        QCOMPARE(*prompt->constraints.temperature, 0.7);
        QCOMPARE(*prompt->constraints.maxOutputTokens, 50);
    }

    void testImagePartsAndMedia() {
        auto prompt = SpecParser::parsePrompt(R"({
            "messages": [
                {"role": "user", "content": [
                    {"type": "text", "text": "What is this?"},
                    {"type": "image", "url": "https://example.com/cat.png"}
                ]},
                {"role": "assistant", "content": "A cat."},
                {"role": "user", "content": "And this?"}
            ],
            "media": {"input_images": ["data:image/jpeg;base64,QUJD"]}
        })");
        QVERIFY(prompt.has_value());
        QVERIFY(prompt->hasImages());
        QCOMPARE(prompt->messages[0].content[1].media.uri, QStringLiteral("https://example.com/cat.png"));

        const auto& last = prompt->messages[2];
        QCOMPARE(last.content.size(), 2);
        QVERIFY(last.content[1].isImage());
        QCOMPARE(last.content[1].media.mimeType, QStringLiteral("image/jpeg"));
        QCOMPARE(last.content[1].media.inlineData, QStringLiteral("QUJD"));
    }

    void testToolsAndChoice() {
        auto prompt = SpecParser::parsePrompt(R"({
            "messages": [{"role": "user", "content": "weather?"}],
            "tools": [
                {"name": "get_weather", "json_schema": {"type": "object"}},
                {"type": "function", "function": {"name": "get_time", "parameters": {"type": "object"}}}
            ],
            "tool_choice": {"name": "get_weather"},
            "response_format": "json_object"
        })");
        QVERIFY(prompt.has_value());
        QCOMPARE(prompt->tools.size(), 2);
        QCOMPARE(prompt->tools[1].name, QStringLiteral("get_time"));
        QVERIFY(prompt->toolChoice.has_value());
        QCOMPARE(prompt->toolChoice->mode, ToolChoice::Mode::Specific);
        QCOMPARE(prompt->toolChoice->name, QStringLiteral("get_weather"));
        QVERIFY(prompt->responseFormat->wantsJson());
    }

    void testUnwrapsPromptEnvelope() {
        auto prompt = SpecParser::parsePrompt(R"({"prompt": {"messages": [{"role": "user", "content": "hi"}]}, "config": {}})");
        QVERIFY(prompt.has_value());
        QCOMPARE(prompt->messages.size(), 1);
    }

    void testMalformedJson() {
        auto prompt = SpecParser::parsePrompt(R"({"messages": [{"role": "user")");
        QVERIFY(!prompt.has_value());
        QCOMPARE(prompt.error().kind, ErrorKind::JsonError);
    }

    void testInvalidUtf8() {
        QByteArray bytes("{\"messages\": [{\"role\": \"user\", \"content\": \"");
        bytes.append(char(0xC3));
        bytes.append(char(0x28));
        bytes.append("\"}]}");
        auto prompt = SpecParser::parsePrompt(bytes);
        QVERIFY(!prompt.has_value());
        QCOMPARE(prompt.error().kind, ErrorKind::Utf8Error);
    }

    void testWrongShapeIsInvalidInput() {
        auto arrayRoot = SpecParser::parsePrompt("[1, 2]");
        QVERIFY(!arrayRoot.has_value());
        QCOMPARE(arrayRoot.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(arrayRoot.error().code, QStringLiteral("not_an_object"));

        auto badRole = SpecParser::parsePrompt(R"({"messages": [{"role": "robot", "content": "x"}]})");
        QVERIFY(!badRole.has_value());
        QCOMPARE(badRole.error().code, QStringLiteral("unknown_role"));
        QVERIFY(badRole.error().message.startsWith(QStringLiteral("$.messages[0].role")));

        auto noMessages = SpecParser::parsePrompt(R"({"system": "x"})");
        QVERIFY(!noMessages.has_value());
        QCOMPARE(noMessages.error().code, QStringLiteral("missing_field"));
    }

    void testParseProvider() {
        auto provider = SpecParser::parseProvider(R"({
            "spec_version": "1.0.0",
            "provider": {"name": "openai", "base_url": "https://api.openai.com", "headers": {"Authorization": "Bearer ${ENV:OPENAI_API_KEY}"}},
            "models": [{
                "id": "gpt-x",
                "aliases": ["gpt-latest"],
                "family": "gpt",
                "endpoints": {
                    "chat_completion": {"method": "post", "path": "/v1/chat/completions", "protocol": "HTTPS"},
                    "streaming_chat_completion": {"method": "POST", "path": "/v1/chat/completions", "protocol": "sse"},
                    "embeddings": {"method": "POST", "path": "/v1/embeddings", "protocol": "https"}
                },
                "input_modes": {"messages": true, "images": false},
                "tooling": {"tools_supported": true},
                "parameters": {"temperature": {"min": 0, "max": 2}},
                "constraints": {"system_prompt_location": "top_level"}
            }]
        })");
        QVERIFY(provider.has_value());
        QCOMPARE(provider->provider.name, QStringLiteral("openai"));
        QCOMPARE(provider->models.size(), 1);

        const ModelSpec& m = provider->models[0];
        QCOMPARE(m.aliases, QStringList{QStringLiteral("gpt-latest")});
        QCOMPARE(m.endpoints.size(), 2);
        QCOMPARE(m.endpoints[Capability::ChatCompletion].method, QStringLiteral("POST"));
        QCOMPARE(m.endpoints[Capability::ChatCompletion].protocol, QStringLiteral("https"));
        QVERIFY(m.endpoints[Capability::StreamingChatCompletion].isStreaming());
        QVERIFY(m.inputModes.value(InputMode::Messages));
        QVERIFY(!m.inputModes.value(InputMode::Images));
        QVERIFY(m.tooling.toolsSupported);
        QCOMPARE(*m.parameters[QStringLiteral("temperature")].max, 2.0);
        QCOMPARE(m.constraints.systemPromptLocation, SystemPromptLocation::TopLevel);
    }

    void testProviderDefaults() {
        auto provider = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "m", "endpoints": {"chat_completion": {"path": "/chat"}}}]
        })");
        QVERIFY(provider.has_value());
        const ModelSpec& m = provider->models[0];
        QCOMPARE(m.endpoints[Capability::ChatCompletion].method, QStringLiteral("POST"));
        QCOMPARE(m.endpoints[Capability::ChatCompletion].protocol, QStringLiteral("http"));
        QVERIFY(m.inputModes.value(InputMode::Messages));
    }

    void testDuplicateModelIds() {
        auto provider = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "a"}, {"id": "a"}]
        })");
        QVERIFY(!provider.has_value());
        QCOMPARE(provider.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(provider.error().code, QStringLiteral("duplicate_model_id"));
    }

    void testInvertedRange() {
        auto provider = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "a", "parameters": {"top_p": {"min": 1, "max": 0}}}]
        })");
        QVERIFY(!provider.has_value());
        QCOMPARE(provider.error().code, QStringLiteral("invalid_range"));
    }

    void testOutOfRangeIntegersRejected() {
        auto huge = SpecParser::parsePrompt(R"({"messages": [{"role": "user", "content": "x"}],
            "max_tokens": 1e300})");
        QVERIFY(!huge.has_value());
        QCOMPARE(huge.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(huge.error().code, QStringLiteral("invalid_type"));
        QVERIFY(huge.error().message.startsWith(QStringLiteral("$.max_tokens")));

        auto negative = SpecParser::parsePrompt(R"({"messages": [{"role": "user", "content": "x"}],
            "limits": {"reasoning_tokens": -1e300}})");
        QVERIFY(!negative.has_value());
        QVERIFY(negative.error().message.startsWith(QStringLiteral("$.limits.reasoning_tokens")));

        auto fractional = SpecParser::parsePrompt(R"({"messages": [{"role": "user", "content": "x"}],
            "sampling": {"top_k": 2.5}})");
        QVERIFY(!fractional.has_value());
        QCOMPARE(fractional.error().code, QStringLiteral("invalid_type"));

        auto edge = SpecParser::parsePrompt(R"({"messages": [{"role": "user", "content": "x"}],
            "max_tokens": 2147483647})");
        QVERIFY(edge.has_value());
        QCOMPARE(*edge->constraints.maxOutputTokens, 2147483647);

        auto limit = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "a", "constraints": {"limits": {"max_system_prompt_bytes": 1e300}}}]
        })");
        QVERIFY(!limit.has_value());
        QVERIFY(limit.error().message.startsWith(
            QStringLiteral("$.models[0].constraints.limits.max_system_prompt_bytes")));
    }

    void testProviderConstraints() {
        auto provider = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "a", "constraints": {
                "mutually_exclusive": [["temperature", "top_p"], ["stop"]],
                "resolution_preferences": ["top_p"],
                "limits": {"max_tool_schema_bytes": 2048, "max_system_prompt_bytes": 512}}}]
        })");
        QVERIFY(provider.has_value());
        const ModelConstraints& c = provider->models[0].constraints;
        // Single-field groups cannot conflict and are skipped.
        QCOMPARE(c.mutuallyExclusive.size(), 1);
        QCOMPARE(c.mutuallyExclusive[0], (QStringList{QStringLiteral("temperature"), QStringLiteral("top_p")}));
        QCOMPARE(c.resolutionPreferences, QStringList{QStringLiteral("top_p")});
        QCOMPARE(c.maxToolSchemaBytes.value_or(0), 2048);
        QCOMPARE(c.maxSystemPromptBytes.value_or(0), 512);

        auto flat = SpecParser::parseProvider(R"({
            "provider": {"name": "p", "base_url": "http://localhost"},
            "models": [{"id": "a", "constraints": {"mutually_exclusive": ["temperature", "top_p"]}}]
        })");
        QVERIFY(!flat.has_value());
        QCOMPARE(flat.error().code, QStringLiteral("invalid_type"));
        QVERIFY(flat.error().message.startsWith(QStringLiteral("$.models[0].constraints.mutually_exclusive[0]")));
    }

    void testParseByKind() {
        auto parsed = SpecParser::parse(SpecKind::ProviderSpec,
            R"({"provider": {"name": "p", "base_url": "http://x"}, "models": []})");
        QVERIFY(parsed.has_value());
        QVERIFY(std::holds_alternative<ProviderSpec>(*parsed));
        QVERIFY(std::get<ProviderSpec>(*parsed).models.isEmpty());
    }
};

QTEST_MAIN(TestSpecParser)
#include "tst_spec_parser.moc"
