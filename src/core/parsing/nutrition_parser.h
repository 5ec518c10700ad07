#pragma once

#include "core/matching/fuzzy_matcher.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/terms/term_provider.h"

#include <QString>

#include <optional>
#include <vector>

namespace rs {

// NutritionParser -- reads a per-100 g nutrition table.
//
// The "per 100 g" anchor line splits labels from values. Labels sit
// before the anchor on some recognizers and after it on others; values
// always follow it, up to an optional "per portion" column. Labels and
// values are then paired by position.
class NutritionParser {
public:
    NutritionParser(const TermSet& terms, const FuzzyMatcher& matcher,
                    const ExtractionSettings& settings = ExtractionSettings());

    NutritionRecord parse(const std::vector<QString>& lines) const;

    // Index of the anchor line, or -1. Consecutive lines that together
    // still match the anchor ("Pour" / "100 g") are merged in place.
    int findPer100gIndex(std::vector<QString>& lines) const;

    std::vector<QString> extractLabels(const std::vector<QString>& lines, int anchor) const;
    std::vector<QString> extractValues(const std::vector<QString>& lines, int anchor) const;

    // Best-scoring nutrition key for a label line.
    std::optional<NutritionKey> labelKey(const QString& line) const;
    bool isLabel(const QString& line) const;

    // "2,0 g" -> 2.0, "219" -> 21 (trailing 'g' read as '9').
    static std::optional<double> parseValue(const QString& text, double maxValue = 10000.0);

private:
    bool matchesAny(const QString& line, const QStringList& terms) const;
    void assignEnergy(NutritionRecord& record, double value) const;

    TermSet m_terms;
    const FuzzyMatcher& m_matcher;
    ExtractionSettings m_settings;
};

} // namespace rs
