#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace rs {

// PreparationSegmenter -- reassembles numbered preparation steps from
// recognised blocks.
//
// A block is one of: a bare step number, a numbered step ("2. Bake\n..."),
// a step title waiting for a bare number seen earlier, or description text
// for the open step. Steps come out sorted by their number, not by the
// order their blocks were recognised in.
class PreparationSegmenter {
public:
    explicit PreparationSegmenter(const ExtractionSettings& settings = ExtractionSettings());

    std::vector<PreparationStep> segment(const RecognizedDocument& document) const;

    // Leading step number; nullopt for time values such as "10 min".
    static std::optional<int> stepNumber(const QString& text);
    static bool startsWithTimeValue(const QString& text);
    static bool isNumberOnly(const QString& text);
    static bool hasLetters(const QString& text);

    bool looksLikeTitle(const QString& text) const;

    // "LA PRÉPARATION" -> "La préparation"
    static QString formatTitle(const QString& title);

    // "•Émincez l'oignon." -> "•émincez l'oignon."
    static QString formatDescription(const QString& description);

    // "1. Mix\nthe flour" -> {"Mix", "the flour"}
    static PreparationStep parseStepContent(const QString& text);

private:
    ExtractionSettings m_settings;
};

} // namespace rs
