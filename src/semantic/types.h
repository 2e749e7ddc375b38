#pragma once
#include <QtGlobal>

enum class SpecKind : quint8 {
    PromptSpec, ProviderSpec
};

enum class MessageRole : quint8 {
    System, User, Assistant
};

enum class PartKind : quint8 {
    Text, Image
};

// Closed set of endpoint capabilities a model can declare.
enum class Capability : quint8 {
    ChatCompletion, StreamingChatCompletion
};

enum class InputMode : quint8 {
    Messages, SingleText, Images
};

enum class TranslationMode : quint8 {
    Standard, Strict
};

enum class ValidationMode : quint8 {
    Basic, Partial, Strict
};

enum class Severity : quint8 {
    Info, Warning, Error
};

enum class LossinessCode : quint8 {
    Clamp, Drop, Emulate, MapFallback, Unsupported
};

// Wire values are part of the public contract and must not change.
enum class ErrorKind : qint8 {
    Success             = 0,
    InvalidInput        = -1,
    JsonError           = -2,
    ProviderNotFound    = -3,
    ModelNotFound       = -4,
    NetworkError        = -5,
    AuthenticationError = -6,
    RateLimitError      = -7,
    TimeoutError        = -8,
    InternalError       = -9,
    MemoryError         = -10,
    Utf8Error           = -11,
    NullPointer         = -12,
    Cancelled           = -13,
    NotImplemented      = -14,
    Unknown             = -99
};
