#pragma once

#include <QString>
#include <QStringList>

#include <map>
#include <optional>
#include <vector>

namespace rs {

// Recipe field a caller can ask to be read from an image.
enum class RecipeField {
    Image,
    Title,
    Description,
    Tags,
    Persons,
    Time,
    Preparation,
    Ingredients,
    Nutrition,
    Unknown,
};

QString recipeFieldToString(RecipeField field);
RecipeField recipeFieldFromString(const QString& str);

// ── Recognized text ─────────────────────────────────────────

// One block of recognized text. Lines keep the recognizer's order,
// which is platform dependent and not guaranteed to be reading order.
struct TextBlock {
    std::vector<QString> lines;

    // Lines joined with '\n'.
    QString text() const;
};

struct RecognizedDocument {
    std::vector<TextBlock> blocks;

    bool isEmpty() const;

    // All lines of all blocks, flattened in block order.
    std::vector<QString> allLines() const;

    // All block texts joined with '\n'.
    QString text() const;
};

// ── Ingredients ─────────────────────────────────────────────

// Serving count used when the table carried no serving marker.
constexpr int kUnknownServings = -1;

struct QuantityPerServings {
    int servings = kUnknownServings;
    QString quantity;

    bool operator==(const QuantityPerServings& other) const
    {
        return servings == other.servings && quantity == other.quantity;
    }
};

struct IngredientRecord {
    QString name;
    QString unit;
    std::optional<QString> note;
    std::vector<QuantityPerServings> quantityPerServings;

    bool operator==(const IngredientRecord& other) const
    {
        return name == other.name && unit == other.unit && note == other.note
               && quantityPerServings == other.quantityPerServings;
    }
};

// Ingredient as it lives in the caller's recipe form: one quantity,
// already scaled to the form's serving count.
struct FormIngredient {
    QString name;
    QString unit;
    QString quantity;
    std::optional<QString> note;

    bool operator==(const FormIngredient& other) const
    {
        return name == other.name && unit == other.unit && quantity == other.quantity
               && note == other.note;
    }
};

// ── Preparation ─────────────────────────────────────────────

struct PreparationStep {
    QString title;
    QString description;

    bool operator==(const PreparationStep& other) const
    {
        return title == other.title && description == other.description;
    }
};

// ── Tags ────────────────────────────────────────────────────

struct Tag {
    QString name;

    bool operator==(const Tag& other) const { return name == other.name; }
};

// ── Nutrition ───────────────────────────────────────────────

// Declaration order is also the tie-break order when a label matches
// several keys equally well.
enum class NutritionKey {
    EnergyKj,
    EnergyKcal,
    Fat,
    SaturatedFat,
    Carbohydrates,
    Sugars,
    Fiber,
    Protein,
    Salt,
};

const std::vector<NutritionKey>& allNutritionKeys();
QString nutritionKeyToString(NutritionKey key);
std::optional<NutritionKey> nutritionKeyFromString(const QString& str);

// Sparse per-100 g nutrition values.
struct NutritionRecord {
    std::map<NutritionKey, double> values;

    bool isEmpty() const { return values.empty(); }
    bool has(NutritionKey key) const { return values.count(key) > 0; }
    std::optional<double> value(NutritionKey key) const;
    void set(NutritionKey key, double v) { values[key] = v; }

    bool operator==(const NutritionRecord& other) const { return values == other.values; }
};

} // namespace rs
