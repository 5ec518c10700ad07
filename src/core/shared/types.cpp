#include "core/shared/types.h"

namespace rs {

QString recipeFieldToString(RecipeField field)
{
    switch (field) {
    case RecipeField::Image:       return QStringLiteral("image");
    case RecipeField::Title:       return QStringLiteral("title");
    case RecipeField::Description: return QStringLiteral("description");
    case RecipeField::Tags:        return QStringLiteral("tags");
    case RecipeField::Persons:     return QStringLiteral("persons");
    case RecipeField::Time:        return QStringLiteral("time");
    case RecipeField::Preparation: return QStringLiteral("preparation");
    case RecipeField::Ingredients: return QStringLiteral("ingredients");
    case RecipeField::Nutrition:   return QStringLiteral("nutrition");
    case RecipeField::Unknown:     return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

RecipeField recipeFieldFromString(const QString& str)
{
    const QString lower = str.trimmed().toLower();
    if (lower == QLatin1String("image"))       return RecipeField::Image;
    if (lower == QLatin1String("title"))       return RecipeField::Title;
    if (lower == QLatin1String("description")) return RecipeField::Description;
    if (lower == QLatin1String("tags"))        return RecipeField::Tags;
    if (lower == QLatin1String("persons"))     return RecipeField::Persons;
    if (lower == QLatin1String("time"))        return RecipeField::Time;
    if (lower == QLatin1String("preparation")) return RecipeField::Preparation;
    if (lower == QLatin1String("ingredients")) return RecipeField::Ingredients;
    if (lower == QLatin1String("nutrition"))   return RecipeField::Nutrition;
    return RecipeField::Unknown;
}

QString TextBlock::text() const
{
    QStringList parts;
    parts.reserve(static_cast<int>(lines.size()));
    for (const QString& line : lines) {
        parts.append(line);
    }
    return parts.join(QLatin1Char('\n'));
}

bool RecognizedDocument::isEmpty() const
{
    for (const TextBlock& block : blocks) {
        if (!block.lines.empty()) {
            return false;
        }
    }
    return true;
}

std::vector<QString> RecognizedDocument::allLines() const
{
    std::vector<QString> lines;
    for (const TextBlock& block : blocks) {
        lines.insert(lines.end(), block.lines.begin(), block.lines.end());
    }
    return lines;
}

QString RecognizedDocument::text() const
{
    QStringList parts;
    parts.reserve(static_cast<int>(blocks.size()));
    for (const TextBlock& block : blocks) {
        parts.append(block.text());
    }
    return parts.join(QLatin1Char('\n'));
}

const std::vector<NutritionKey>& allNutritionKeys()
{
    static const std::vector<NutritionKey> kKeys = {
        NutritionKey::EnergyKj,      NutritionKey::EnergyKcal, NutritionKey::Fat,
        NutritionKey::SaturatedFat,  NutritionKey::Carbohydrates,
        NutritionKey::Sugars,        NutritionKey::Fiber,      NutritionKey::Protein,
        NutritionKey::Salt,
    };
    return kKeys;
}

QString nutritionKeyToString(NutritionKey key)
{
    switch (key) {
    case NutritionKey::EnergyKj:      return QStringLiteral("energyKj");
    case NutritionKey::EnergyKcal:    return QStringLiteral("energyKcal");
    case NutritionKey::Fat:           return QStringLiteral("fat");
    case NutritionKey::SaturatedFat:  return QStringLiteral("saturatedFat");
    case NutritionKey::Carbohydrates: return QStringLiteral("carbohydrates");
    case NutritionKey::Sugars:        return QStringLiteral("sugars");
    case NutritionKey::Fiber:         return QStringLiteral("fiber");
    case NutritionKey::Protein:       return QStringLiteral("protein");
    case NutritionKey::Salt:          return QStringLiteral("salt");
    }
    return QString();
}

std::optional<NutritionKey> nutritionKeyFromString(const QString& str)
{
    for (NutritionKey key : allNutritionKeys()) {
        if (nutritionKeyToString(key) == str) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<double> NutritionRecord::value(NutritionKey key) const
{
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rs
