#include <QTest>
#include <QJsonArray>
#include <QJsonObject>
#include "adapters/outbound/anthropic.h"
#include "adapters/outbound/gemini.h"
#include "adapters/outbound/multi_router.h"
#include "adapters/outbound/openai.h"

namespace {

ModelCapabilities caps(const QString& provider, const QString& family, const QString& modelId)
{
    ModelCapabilities c;
    c.providerName = provider;
    c.model.family = family;
    c.model.id = modelId;
    return c;
}

ProviderResponse response(const QByteArray& body)
{
    ProviderResponse r;
    r.statusCode = 200;
    r.body = body;
    return r;
}

ProviderChunk chunk(const QByteArray& data, const QString& type = QString())
{
    ProviderChunk c;
    c.type = type;
    c.data = data;
    return c;
}

PromptSpec conversation()
{
    PromptSpec prompt;
    prompt.messages.append({MessageRole::System, {Segment::fromText(QStringLiteral("Be brief."))}, {}});
    prompt.messages.append({MessageRole::User, {Segment::fromText(QStringLiteral("Hi"))}, {}});
    prompt.messages.append({MessageRole::Assistant, {Segment::fromText(QStringLiteral("Hello"))}, {}});
    return prompt;
}

}

class TestOutbound : public QObject {
    Q_OBJECT

private slots:
    void testRouterResolveOrder() {
        auto router = OutboundRouter::withBuiltins();
        QCOMPARE(router->adapterIds().size(), 3);

        QCOMPARE(router->resolve(caps(QStringLiteral("Anthropic"), QString(), QStringLiteral("x")))->adapterId(),
                 QStringLiteral("anthropic"));
        QCOMPARE(router->resolve(caps(QStringLiteral("acme"), QStringLiteral("gemini"), QStringLiteral("x")))->adapterId(),
                 QStringLiteral("gemini"));
        QCOMPARE(router->resolve(caps(QStringLiteral("acme"), QString(), QStringLiteral("claude-3-haiku")))->adapterId(),
                 QStringLiteral("anthropic"));
        QCOMPARE(router->resolve(caps(QStringLiteral("acme"), QString(), QStringLiteral("gemini-1.5-pro")))->adapterId(),
                 QStringLiteral("gemini"));
        QCOMPARE(router->resolve(caps(QStringLiteral("acme"), QStringLiteral("llama"), QStringLiteral("l3")))->adapterId(),
                 QStringLiteral("openai"));
        // Provider name wins over family.
        QCOMPARE(router->resolve(caps(QStringLiteral("openai"), QStringLiteral("claude"), QStringLiteral("claude-x")))->adapterId(),
                 QStringLiteral("openai"));
    }

    void testRouterById() {
        auto router = OutboundRouter::withBuiltins();
        QVERIFY(router->byId(QStringLiteral(" Gemini ")) != nullptr);
        QVERIFY(router->byId(QStringLiteral("cohere")) == nullptr);
        QVERIFY(router->byId(QString()) == nullptr);
    }

    void testOpenAIParseResponse() {
        OpenAIOutbound adapter;
        auto nr = adapter.parseResponse(response(R"({"id": "cmpl-1", "model": "gpt-x",
            "choices": [{"message": {"role": "assistant", "content": "Hi there"}, "finish_reason": "stop"}],
            "usage": {"prompt_tokens": 3, "completion_tokens": 2, "total_tokens": 5}})"));
        QVERIFY(nr.has_value());
        QCOMPARE(nr->id, QStringLiteral("cmpl-1"));
        QCOMPARE(*nr->content, QStringLiteral("Hi there"));
        QCOMPARE(*nr->finishReason, QStringLiteral("stop"));
        QCOMPARE(*nr->usage->totalTokens, 5);

        const QJsonObject json = nr->toJson();
        QCOMPARE(json[QStringLiteral("usage")].toObject()[QStringLiteral("prompt_tokens")].toInt(), 3);
    }

    void testOpenAIMissingFieldsRenderNull() {
        OpenAIOutbound adapter;
        auto nr = adapter.parseResponse(response(R"({"choices": []})"));
        QVERIFY(nr.has_value());
        const QJsonObject json = nr->toJson();
        QVERIFY(json[QStringLiteral("content")].isNull());
        QVERIFY(json[QStringLiteral("usage")].isNull());
        QCOMPARE(json[QStringLiteral("role")].toString(), QStringLiteral("assistant"));
    }

    void testOpenAIChunks() {
        OpenAIOutbound adapter;
        QCOMPARE(*adapter.parseChunk(chunk(R"({"choices": [{"delta": {"content": "Hel"}}]})")), QStringLiteral("Hel"));
        QCOMPARE(*adapter.parseChunk(chunk(R"({"choices": []})")), QString());

        auto bad = adapter.parseChunk(chunk("not json"));
        QVERIFY(!bad.has_value());
        QCOMPARE(bad.error().kind, ErrorKind::JsonError);
    }

    void testAnthropicPayload() {
        AnthropicOutbound adapter;
        auto body = adapter.buildPayload(conversation(), caps(QStringLiteral("anthropic"), QString(),
                                         QStringLiteral("claude-x")), Capability::StreamingChatCompletion);
        QVERIFY(body.has_value());
        QCOMPARE((*body)[QStringLiteral("system")].toString(), QStringLiteral("Be brief."));
        QCOMPARE((*body)[QStringLiteral("messages")].toArray().size(), 2);
        QCOMPARE((*body)[QStringLiteral("max_tokens")].toInt(), 4096);
        QVERIFY((*body)[QStringLiteral("stream")].toBool());
        QCOMPARE(adapter.defaultHeaders().value(QStringLiteral("anthropic-version")), QStringLiteral("2023-06-01"));
    }

    void testAnthropicParse() {
        AnthropicOutbound adapter;
        auto nr = adapter.parseResponse(response(R"({"id": "msg_1", "model": "claude-x", "role": "assistant",
            "content": [{"type": "text", "text": "Hi "}, {"type": "tool_use", "id": "t"}, {"type": "text", "text": "there"}],
            "stop_reason": "end_turn", "usage": {"input_tokens": 4, "output_tokens": 6}})"));
        QVERIFY(nr.has_value());
        QCOMPARE(*nr->content, QStringLiteral("Hi there"));
        QCOMPARE(*nr->finishReason, QStringLiteral("end_turn"));
        QCOMPARE(*nr->usage->totalTokens, 10);

        QCOMPARE(*adapter.parseChunk(chunk(R"({"type": "content_block_delta",
            "delta": {"type": "text_delta", "text": "ok"}})")), QStringLiteral("ok"));
        QCOMPARE(*adapter.parseChunk(chunk(R"({"type": "message_start"})")), QString());

        auto failure = adapter.parseChunk(chunk(R"({"type": "error",
            "error": {"type": "overloaded_error", "message": "busy"}})"));
        QVERIFY(!failure.has_value());
        QCOMPARE(failure.error().code, QStringLiteral("overloaded_error"));
    }

    void testGeminiPayloadAndParse() {
        GeminiOutbound adapter;
        auto body = adapter.buildPayload(conversation(), caps(QStringLiteral("google"), QString(),
                                         QStringLiteral("gemini-x")), Capability::ChatCompletion);
        QVERIFY(body.has_value());
        const QJsonArray contents = (*body)[QStringLiteral("contents")].toArray();
        QCOMPARE(contents.size(), 2);
        QCOMPARE(contents[1].toObject()[QStringLiteral("role")].toString(), QStringLiteral("model"));
        QVERIFY((*body)[QStringLiteral("systemInstruction")].isObject());

        auto nr = adapter.parseResponse(response(R"({"responseId": "r1", "modelVersion": "gemini-x",
            "candidates": [{"content": {"parts": [{"text": "Bon"}, {"text": "jour"}]}, "finishReason": "STOP"}],
            "usageMetadata": {"promptTokenCount": 2, "candidatesTokenCount": 1, "totalTokenCount": 3}})"));
        QVERIFY(nr.has_value());
        QCOMPARE(*nr->content, QStringLiteral("Bonjour"));
        QCOMPARE(*nr->finishReason, QStringLiteral("STOP"));
        QCOMPARE(*nr->usage->promptTokens, 2);

        QCOMPARE(*adapter.parseChunk(chunk(R"({"candidates": [{"content": {"parts": [{"text": "x"}]}}]})")),
                 QStringLiteral("x"));
        QCOMPARE(*adapter.parseChunk(chunk("  ")), QString());
    }
};

QTEST_MAIN(TestOutbound)
#include "tst_outbound.moc"
