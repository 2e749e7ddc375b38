#pragma once
#include <QStringList>
#include <optional>

struct ConstraintSet {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;
    std::optional<double> frequencyPenalty;
    std::optional<double> presencePenalty;
    std::optional<int> maxOutputTokens;
    std::optional<int> reasoningTokens;
    std::optional<int> maxPromptTokens;
    QStringList stopSequences;
};
