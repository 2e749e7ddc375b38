#pragma once
#include "types.h"
#include <QString>

struct MediaRef {
    QString mimeType;
    QString uri;
    QString inlineData;   // base64, without the data: prefix
};

struct Segment {
    PartKind kind = PartKind::Text;
    QString text;
    MediaRef media;

    bool isImage() const { return kind == PartKind::Image; }

    static Segment fromText(const QString& text) {
        return Segment{PartKind::Text, text, {}};
    }
    static Segment fromImage(const MediaRef& ref) {
        return Segment{PartKind::Image, {}, ref};
    }
};
