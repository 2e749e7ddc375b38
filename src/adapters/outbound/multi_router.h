#pragma once
#include "outbound_adapter.h"
#include <QMap>
#include <memory>
#include <vector>

// Registry of payload dialects. Populated once, read-only afterwards, so a
// single router can be shared by concurrent translations.
class OutboundRouter : public IAdapterRegistry {
public:
    OutboundRouter() = default;
    ~OutboundRouter() override = default;

    // Router with the openai, anthropic and gemini dialects registered.
    static std::shared_ptr<const OutboundRouter> withBuiltins();

    void registerAdapter(std::unique_ptr<IOutboundAdapter> adapter);

    // Provider name, then model family, then model id prefix; openai otherwise.
    const IOutboundAdapter* resolve(const ModelCapabilities& caps) const override;
    const IOutboundAdapter* byId(const QString& adapterId) const override;

    QStringList adapterIds() const { return m_adapters.keys(); }

private:
    QMap<QString, IOutboundAdapter*> m_adapters;
    std::vector<std::unique_ptr<IOutboundAdapter>> m_owned;

    const IOutboundAdapter* matchName(const QString& name) const;
};
