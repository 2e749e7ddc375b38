#pragma once
#include "semantic/ports.h"

// Looks a model up in a parsed provider spec: exact id first, then alias.
class SpecCapabilityResolver : public ICapabilityResolver {
public:
    Result<ModelCapabilities> resolve(const ProviderSpec& spec,
                                      const QString& modelId) const override;
};
