#include "core/extraction/patch_serializer.h"

namespace rs {

QJsonObject PatchSerializer::toJson(const ExtractionOutcome& outcome)
{
    QJsonArray warnings;
    for (const QString& warning : outcome.warnings) {
        warnings.append(warning);
    }

    QJsonObject json;
    json[QStringLiteral("patch")] = patchToJson(outcome.patch);
    json[QStringLiteral("warnings")] = warnings;
    return json;
}

QJsonObject PatchSerializer::patchToJson(const ExtractionPatch& patch)
{
    QJsonObject json;
    if (patch.image) {
        json[QStringLiteral("image")] = *patch.image;
    }
    if (patch.title) {
        json[QStringLiteral("title")] = *patch.title;
    }
    if (patch.description) {
        json[QStringLiteral("description")] = *patch.description;
    }
    if (patch.tags) {
        json[QStringLiteral("tags")] = tagsToJson(*patch.tags);
    }
    if (patch.preparation) {
        json[QStringLiteral("preparation")] = stepsToJson(*patch.preparation);
    }
    if (patch.persons) {
        json[QStringLiteral("persons")] = *patch.persons;
    }
    if (patch.time) {
        json[QStringLiteral("time")] = *patch.time;
    }
    if (patch.ingredients) {
        json[QStringLiteral("ingredients")] = ingredientsToJson(*patch.ingredients);
    }
    if (patch.nutrition) {
        json[QStringLiteral("nutrition")] = nutritionToJson(*patch.nutrition);
    }
    return json;
}

QJsonObject PatchSerializer::nutritionToJson(const NutritionRecord& record)
{
    QJsonObject json;
    for (const auto& entry : record.values) {
        json[nutritionKeyToString(entry.first)] = entry.second;
    }
    return json;
}

QJsonArray PatchSerializer::ingredientsToJson(const std::vector<FormIngredient>& ingredients)
{
    QJsonArray array;
    for (const FormIngredient& ingredient : ingredients) {
        QJsonObject obj;
        obj[QStringLiteral("name")] = ingredient.name;
        obj[QStringLiteral("unit")] = ingredient.unit;
        obj[QStringLiteral("quantity")] = ingredient.quantity;
        if (ingredient.note) {
            obj[QStringLiteral("note")] = *ingredient.note;
        }
        array.append(obj);
    }
    return array;
}

QJsonArray PatchSerializer::ingredientRecordsToJson(const std::vector<IngredientRecord>& records)
{
    QJsonArray array;
    for (const IngredientRecord& record : records) {
        QJsonArray columns;
        for (const QuantityPerServings& column : record.quantityPerServings) {
            QJsonObject col;
            col[QStringLiteral("servings")] = column.servings;
            col[QStringLiteral("quantity")] = column.quantity;
            columns.append(col);
        }

        QJsonObject obj;
        obj[QStringLiteral("name")] = record.name;
        obj[QStringLiteral("unit")] = record.unit;
        if (record.note) {
            obj[QStringLiteral("note")] = *record.note;
        }
        obj[QStringLiteral("quantityPerServings")] = columns;
        array.append(obj);
    }
    return array;
}

QJsonArray PatchSerializer::stepsToJson(const std::vector<PreparationStep>& steps)
{
    QJsonArray array;
    for (const PreparationStep& step : steps) {
        QJsonObject obj;
        obj[QStringLiteral("title")] = step.title;
        obj[QStringLiteral("description")] = step.description;
        array.append(obj);
    }
    return array;
}

QJsonArray PatchSerializer::tagsToJson(const std::vector<Tag>& tags)
{
    QJsonArray array;
    for (const Tag& tag : tags) {
        QJsonObject obj;
        obj[QStringLiteral("name")] = tag.name;
        array.append(obj);
    }
    return array;
}

} // namespace rs
