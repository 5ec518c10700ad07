#pragma once

#include "core/shared/types.h"

#include <QString>

namespace rs {

// QuantityScaler -- rescales ingredient quantity strings and nutrition
// records.
//
// Only strings holding exactly one number ("200", "1,5 cs") are touched;
// ranges and free text ("2-3", "a pinch") pass through unchanged. Output
// uses ',' as decimal separator.
class QuantityScaler {
public:
    // Scales by toPersons / fromPersons, rounded to 4 decimals.
    static QString scaleQuantityForPersons(const QString& quantity, int fromPersons,
                                           int toPersons);

    // Rounds the number to 2 decimals for display.
    static QString formatQuantityForDisplay(const QString& quantity);

    // Scales a per-100 g record to a portion weight.
    static NutritionRecord nutritionPerPortion(const NutritionRecord& per100g,
                                               double portionWeightGrams);

private:
    static QString replaceNumber(const QString& quantity, double factor, int decimals);
};

} // namespace rs
