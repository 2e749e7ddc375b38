#pragma once
#include "segment.h"
#include "action.h"
#include "constraints.h"
#include "types.h"
#include <QList>
#include <QString>
#include <optional>

struct InteractionItem {
    MessageRole role = MessageRole::User;
    QList<Segment> content;
    QString name;

    bool hasImages() const {
        for (const auto& seg : content) {
            if (seg.isImage()) return true;
        }
        return false;
    }

    QString joinedText() const {
        QString out;
        for (const auto& seg : content) {
            if (seg.kind != PartKind::Text) continue;
            if (!out.isEmpty()) out += QLatin1Char('\n');
            out += seg.text;
        }
        return out;
    }
};

// Provider-agnostic prompt specification.
struct PromptSpec {
    QString specVersion;
    QString id;
    QString modelClass = QStringLiteral("Chat");
    QList<InteractionItem> messages;
    ConstraintSet constraints;
    QList<ActionSpec> tools;
    std::optional<ToolChoice> toolChoice;
    std::optional<ResponseFormat> responseFormat;
    bool stream = false;
    QString strictMode;

    bool hasImages() const {
        for (const auto& item : messages) {
            if (item.hasImages()) return true;
        }
        return false;
    }
};
