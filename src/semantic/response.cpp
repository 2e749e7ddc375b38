#include "response.h"
#include <QJsonValue>

static QJsonValue optionalInt(const std::optional<int>& v) {
    return v ? QJsonValue(*v) : QJsonValue(QJsonValue::Null);
}

QJsonObject NormalizedResponse::toJson() const {
    QJsonObject obj;
    obj["id"] = id.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(id);
    obj["model"] = model.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(model);
    obj["role"] = role;
    obj["content"] = content ? QJsonValue(*content) : QJsonValue(QJsonValue::Null);
    obj["finish_reason"] = finishReason ? QJsonValue(*finishReason) : QJsonValue(QJsonValue::Null);
    if (usage) {
        QJsonObject u;
        u["prompt_tokens"] = optionalInt(usage->promptTokens);
        u["completion_tokens"] = optionalInt(usage->completionTokens);
        u["total_tokens"] = optionalInt(usage->totalTokens);
        obj["usage"] = u;
    } else {
        obj["usage"] = QJsonValue(QJsonValue::Null);
    }
    return obj;
}
