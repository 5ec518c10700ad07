#pragma once

#include <QString>

namespace rs {

struct ExtractionSettings {
    // Active term-list language ("en", "fr", ...)
    QString language = QStringLiteral("en");

    // Block order: a serving marker within this many leading lines may
    // indicate the names were emitted after the data.
    int reversedOrderThreshold = 3;

    // Ingredient quantities above this, with no unit, are treated as a
    // sign of two OCR-merged header lines.
    double suspiciousQuantityThreshold = 10.0;

    // Fuzzy matching (edit distance / candidate length)
    double fuzzyThreshold = 0.2;

    // Nutrition
    double energyKcalCeiling = 1000.0;
    double maxNutritionValue = 10000.0;

    // Preparation step titles
    int minStepTitleLength = 3;
    int maxStepTitleLength = 49;

    // Recognition engine
    QString tessdataPath;                              // empty = engine default
    QString recognitionLanguage = QStringLiteral("eng");
};

} // namespace rs
