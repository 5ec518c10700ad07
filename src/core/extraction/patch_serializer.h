#pragma once

#include "core/extraction/extraction_patch.h"
#include "core/shared/types.h"

#include <QJsonArray>
#include <QJsonObject>

#include <vector>

namespace rs {

// PatchSerializer -- JSON views of extraction results for the CLI and
// for logging. Absent patch fields are omitted.
//
//   { "patch": { "ingredients": [ { "name": ..., "unit": ...,
//                                   "quantity": ..., "note": ... } ] },
//     "warnings": [ "..." ] }
class PatchSerializer {
public:
    static QJsonObject toJson(const ExtractionOutcome& outcome);
    static QJsonObject patchToJson(const ExtractionPatch& patch);

    static QJsonObject nutritionToJson(const NutritionRecord& record);
    static QJsonArray ingredientsToJson(const std::vector<FormIngredient>& ingredients);
    static QJsonArray ingredientRecordsToJson(const std::vector<IngredientRecord>& records);
    static QJsonArray stepsToJson(const std::vector<PreparationStep>& steps);
    static QJsonArray tagsToJson(const std::vector<Tag>& tags);
};

} // namespace rs
