#include "spec_resolver.h"
#include <QStringList>

Result<ModelCapabilities> SpecCapabilityResolver::resolve(const ProviderSpec& spec,
                                                          const QString& modelId) const {
    if (spec.models.isEmpty())
        return std::unexpected(DomainFailure::providerNotFound(
            QStringLiteral("provider '%1' declares no models").arg(spec.provider.name)));

    const ModelSpec* match = nullptr;
    for (const auto& model : spec.models) {
        if (model.id == modelId) {
            match = &model;
            break;
        }
    }
    if (!match) {
        for (const auto& model : spec.models) {
            if (model.aliases.contains(modelId)) {
                match = &model;
                break;
            }
        }
    }

    if (!match) {
        QStringList known;
        for (const auto& model : spec.models)
            known.append(model.id);
        return std::unexpected(DomainFailure::modelNotFound(
            QStringLiteral("model_not_found"),
            QStringLiteral("model '%1' not found; known models: %2").arg(modelId, known.join(QStringLiteral(", ")))));
    }

    if (match->endpoints.isEmpty())
        return std::unexpected(DomainFailure::modelNotFound(
            QStringLiteral("no_endpoints"),
            QStringLiteral("model '%1' declares no endpoints").arg(match->id)));

    ModelCapabilities caps;
    caps.providerName = spec.provider.name;
    caps.baseUrl = spec.provider.baseUrl;
    caps.providerHeaders = spec.provider.headers;
    caps.model = *match;
    return caps;
}
