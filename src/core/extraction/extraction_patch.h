#pragma once

#include "core/shared/types.h"

#include <QString>

#include <functional>
#include <optional>
#include <vector>

namespace rs {

// Fields produced by one extraction call. Only the requested field (and
// for persons/time possibly its sibling) is ever set.
struct ExtractionPatch {
    std::optional<QString> image;
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<std::vector<Tag>> tags;
    std::optional<std::vector<PreparationStep>> preparation;
    std::optional<int> persons;
    std::optional<int> time;
    std::optional<std::vector<FormIngredient>> ingredients;
    std::optional<NutritionRecord> nutrition;

    bool isEmpty() const
    {
        return !image && !title && !description && !tags && !preparation && !persons && !time
               && !ingredients && !nutrition;
    }
};

// Snapshot of the caller's recipe form, read when merging.
struct RecipeFormState {
    std::vector<PreparationStep> preparation;
    int persons = 0;  // <= 0 when unknown
    std::vector<Tag> tags;
    std::vector<FormIngredient> ingredients;
};

struct ExtractionOutcome {
    ExtractionPatch patch;
    std::vector<QString> warnings;
};

using WarningHandler = std::function<void(const QString&)>;

} // namespace rs
