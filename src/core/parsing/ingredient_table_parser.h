#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>

#include <vector>

namespace rs {

// One serving-count column of an ingredient table: the marker it was read
// under and one quantity per ingredient header, aligned by index.
struct IngredientGroup {
    QString marker;
    std::vector<QString> quantities;
};

// IngredientTableParser -- rebuilds the ingredient x serving-count grid
// from the flattened lines of a recipe card.
//
// Header lines carry the name and unit ("Flour (g)"); data lines carry
// serving markers ("2p") and the quantities below them. When no marker is
// present the lines are read as a names half and a quantities half.
class IngredientTableParser {
public:
    explicit IngredientTableParser(const ExtractionSettings& settings = ExtractionSettings());

    // Full pipeline over normalised lines.
    std::vector<IngredientRecord> parse(const std::vector<QString>& lines) const;

    // "Flour (g) (sifted)" -> {name "Flour", unit "g", note "sifted"}
    static std::vector<IngredientRecord> parseHeaders(const std::vector<QString>& headers);

    // Splits data lines into groups of ingredientCount quantities.
    static std::vector<IngredientGroup> buildGroups(const std::vector<QString>& dataLines,
                                                    int ingredientCount);

    // Merges header pairs that OCR split apart, judging by the first group,
    // then returns the groups that are free of suspicious quantities.
    // The first group is always kept.
    std::vector<IngredientGroup> correctSuspiciousGroups(
        std::vector<IngredientRecord>& ingredients,
        const std::vector<IngredientGroup>& groups) const;

    static void assignQuantities(const std::vector<IngredientGroup>& groups,
                                 std::vector<IngredientRecord>& ingredients);

    // Fallback when no serving marker was found.
    static std::vector<IngredientRecord> parseWithoutHeader(const std::vector<QString>& lines);

    bool isSuspicious(const QString& quantity, const QString& unit) const;

    // "4p" -> 4; kUnknownServings when the marker holds no count.
    static int servingsFromMarker(const QString& marker);

private:
    // Index of the first suspicious quantity of group, or -1.
    int firstSuspiciousIndex(const IngredientGroup& group,
                             const std::vector<IngredientRecord>& ingredients) const;
    bool canMerge(int index, const IngredientGroup& firstGroup,
                  const std::vector<IngredientRecord>& ingredients) const;
    static void mergeAdjacent(std::vector<IngredientRecord>& ingredients, int index);

    ExtractionSettings m_settings;
};

} // namespace rs
