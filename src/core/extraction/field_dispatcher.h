#pragma once

#include "core/extraction/extraction_patch.h"
#include "core/matching/fuzzy_matcher.h"
#include "core/parsing/scalar_extractor.h"
#include "core/recognition/recognizer.h"
#include "core/shared/settings.h"
#include "core/terms/term_provider.h"

#include <memory>

namespace rs {

// Parsed content of one recognised image, tagged by the field it was read
// for. Only the payload matching field is populated.
struct FieldReading {
    RecipeField field = RecipeField::Unknown;

    QString text;                               // Image, Title, Description
    std::vector<Tag> tags;                      // Tags
    ScalarReading scalar;                       // Persons, Time
    std::vector<PreparationStep> steps;         // Preparation
    std::vector<IngredientRecord> ingredients;  // Ingredients
    NutritionRecord nutrition;                  // Nutrition
};

// FieldDispatcher -- turns an image into a patch for one recipe field.
//
// Runs the recognizer, routes the document to the parser for the
// requested field, then merges the result with the caller's form state
// (appending steps/tags/ingredients, rescaling ingredient quantities to
// the form's serving count). Shape mismatches become warnings, never
// errors.
//
// Usage:
//   FieldDispatcher dispatcher(std::make_unique<TesseractRecognizer>(),
//                              std::make_unique<BuiltinTermProvider>(),
//                              std::make_unique<EditDistanceMatcher>(), settings);
//   ExtractionOutcome out = dispatcher.extract(path, RecipeField::Ingredients, state);
class FieldDispatcher {
public:
    FieldDispatcher(std::unique_ptr<TextRecognizer> recognizer,
                    std::unique_ptr<TermProvider> termProvider,
                    std::unique_ptr<FuzzyMatcher> matcher,
                    const ExtractionSettings& settings = ExtractionSettings());
    ~FieldDispatcher();

    // Non-copyable (owns recognizer state)
    FieldDispatcher(const FieldDispatcher&) = delete;
    FieldDispatcher& operator=(const FieldDispatcher&) = delete;

    // Warnings are returned in the outcome and also passed to onWarn;
    // without a handler they are logged.
    ExtractionOutcome extract(const QString& imagePath, RecipeField field,
                              const RecipeFormState& state,
                              const WarningHandler& onWarn = WarningHandler());

    // Parse an already recognised document.
    FieldReading read(const RecognizedDocument& document, RecipeField field) const;

    // Build the patch for reading. context is appended to every warning.
    ExtractionOutcome merge(const FieldReading& reading, const RecipeFormState& state,
                            const QString& context) const;

    const ExtractionSettings& settings() const { return m_settings; }
    void setSettings(const ExtractionSettings& settings) { m_settings = settings; }

private:
    std::optional<TermSet> activeTerms() const;
    ExtractionOutcome mergeIngredients(const FieldReading& reading, const RecipeFormState& state,
                                       const QString& context) const;

    std::unique_ptr<TextRecognizer> m_recognizer;
    std::unique_ptr<TermProvider> m_termProvider;
    std::unique_ptr<FuzzyMatcher> m_matcher;
    ExtractionSettings m_settings;
};

} // namespace rs
