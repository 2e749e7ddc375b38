#include "multi_router.h"
#include "anthropic.h"
#include "gemini.h"
#include "openai.h"

std::shared_ptr<const OutboundRouter> OutboundRouter::withBuiltins()
{
    auto router = std::make_shared<OutboundRouter>();
    router->registerAdapter(std::make_unique<OpenAIOutbound>());
    router->registerAdapter(std::make_unique<AnthropicOutbound>());
    router->registerAdapter(std::make_unique<GeminiOutbound>());
    return router;
}

void OutboundRouter::registerAdapter(std::unique_ptr<IOutboundAdapter> adapter)
{
    if (!adapter) {
        return;
    }

    QString id = adapter->adapterId().trimmed().toLower();
    if (id.isEmpty()) {
        return;
    }
    m_adapters[id] = adapter.get();
    m_owned.push_back(std::move(adapter));
}

const IOutboundAdapter* OutboundRouter::byId(const QString& adapterId) const
{
    if (adapterId.isEmpty()) {
        return nullptr;
    }
    return m_adapters.value(adapterId.trimmed().toLower(), nullptr);
}

const IOutboundAdapter* OutboundRouter::matchName(const QString& name) const
{
    const QString n = name.trimmed().toLower();
    if (n.isEmpty())
        return nullptr;
    if (const IOutboundAdapter* a = m_adapters.value(n, nullptr))
        return a;
    if (n.contains(QStringLiteral("anthropic")) || n.contains(QStringLiteral("claude")))
        return m_adapters.value(QStringLiteral("anthropic"), nullptr);
    if (n.contains(QStringLiteral("gemini")) || n.contains(QStringLiteral("google")))
        return m_adapters.value(QStringLiteral("gemini"), nullptr);
    if (n.contains(QStringLiteral("openai")) || n.startsWith(QStringLiteral("gpt")))
        return m_adapters.value(QStringLiteral("openai"), nullptr);
    return nullptr;
}

const IOutboundAdapter* OutboundRouter::resolve(const ModelCapabilities& caps) const
{
    // 1. Provider name
    if (const IOutboundAdapter* a = matchName(caps.providerName))
        return a;

    // 2. Model family
    if (const IOutboundAdapter* a = matchName(caps.model.family))
        return a;

    // 3. Model id prefix
    const QString model = caps.model.id.toLower();
    if (model.startsWith(QStringLiteral("claude")))
        return m_adapters.value(QStringLiteral("anthropic"), nullptr);
    if (model.startsWith(QStringLiteral("gemini")))
        return m_adapters.value(QStringLiteral("gemini"), nullptr);

    // 4. Default to openai
    return m_adapters.value(QStringLiteral("openai"), nullptr);
}
