#pragma once
#include "capability.h"
#include "diagnostic.h"
#include "request.h"
#include <QList>

// Features a prompt can ask for. The declaration order is the evaluation
// order, and therefore the order of emitted diagnostics.
enum class Feature : quint8 {
    SystemPromptSize, Messages, Images, Streaming, Tools, ToolSchemaSize, ResponseFormat,
    Temperature, TopP, MaxOutputTokens, MutuallyExclusive
};

QString featureName(Feature feature);
const QList<Feature>& featureEvaluationOrder();

// What the translator does to the prompt when a feature is missing.
enum class Fallback : quint8 {
    Reject,             // Strict mode, or no fallback exists
    FlattenToText,
    DropImages,
    UseChatEndpoint,
    DropTools,
    EmulateJsonInstruction,
    DropResponseFormat,
    ClampToRange,
    TruncateSystemPrompt,
    DropOversizedTools,
    DropConflictingFields
};

struct FeatureGap {
    Feature feature = Feature::Messages;
    QString path;
    QString detail;
    QStringList fields;     // conflicting fields present, in group order
};

struct PolicyDecision {
    Fallback fallback = Fallback::Reject;
    LossinessCode code = LossinessCode::Unsupported;
    Severity severity = Severity::Error;
    QString reason;     // failure code when fallback == Reject
};

class DegradationPolicy {
public:
    // Required features the model cannot serve as asked, in evaluation order.
    static QList<FeatureGap> missingFeatures(const PromptSpec& prompt,
                                             const ModelCapabilities& caps);

    static std::optional<ParameterRange> parameterRange(const ModelCapabilities& caps,
                                                        Feature feature);

    static PolicyDecision decide(Feature feature, TranslationMode mode,
                                 const ModelCapabilities& caps);

    // First entry of the model's resolution preferences among the conflicting
    // fields, else the first field of the group.
    static QString conflictWinner(const QStringList& fields, const QStringList& preferences);

    static qsizetype systemPromptBytes(const PromptSpec& prompt);
    static qsizetype toolSchemaBytes(const ActionSpec& tool);
};

// Canonical sampling and limit fields named by mutually_exclusive groups.
// "max_tokens" and "stop_sequences" are accepted as aliases.
bool hasConstraintField(const ConstraintSet& constraints, const QString& field);
void clearConstraintField(ConstraintSet& constraints, const QString& field);
QString constraintFieldPath(const QString& field);
