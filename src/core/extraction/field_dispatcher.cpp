#include "core/extraction/field_dispatcher.h"
#include "core/parsing/ingredient_table_parser.h"
#include "core/parsing/nutrition_parser.h"
#include "core/parsing/preparation_segmenter.h"
#include "core/parsing/quantity_scaler.h"
#include "core/parsing/text_normalizer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

#include <utility>

namespace rs {

namespace {

QString joinedLines(const RecognizedDocument& document)
{
    QStringList parts;
    for (const QString& line : document.allLines()) {
        parts.append(line);
    }
    return parts.join(QLatin1Char(' '));
}

} // anonymous namespace

FieldDispatcher::FieldDispatcher(std::unique_ptr<TextRecognizer> recognizer,
                                 std::unique_ptr<TermProvider> termProvider,
                                 std::unique_ptr<FuzzyMatcher> matcher,
                                 const ExtractionSettings& settings)
    : m_recognizer(std::move(recognizer))
    , m_termProvider(std::move(termProvider))
    , m_matcher(std::move(matcher))
    , m_settings(settings)
{
}

FieldDispatcher::~FieldDispatcher() = default;

std::optional<TermSet> FieldDispatcher::activeTerms() const
{
    if (!m_termProvider) {
        return std::nullopt;
    }
    return m_termProvider->termsFor(m_settings.language);
}

// ── Entry point ─────────────────────────────────────────────

ExtractionOutcome FieldDispatcher::extract(const QString& imagePath, RecipeField field,
                                           const RecipeFormState& state,
                                           const WarningHandler& onWarn)
{
    ExtractionOutcome outcome;

    if (field == RecipeField::Image) {
        outcome.patch.image = imagePath;
        return outcome;
    }

    if (field == RecipeField::Unknown) {
        LOG_ERROR(rsParse, "Unrecognized field requested for %s", qUtf8Printable(imagePath));
        return outcome;
    }

    if (!m_recognizer) {
        LOG_ERROR(rsOcr, "No text recognizer configured");
        return outcome;
    }

    const RecognitionResult recognition = m_recognizer->recognize(imagePath);
    if (recognition.status != RecognitionResult::Status::Success) {
        LOG_WARN(rsOcr, "Text recognition failed for %s (%s): %s",
                 qUtf8Printable(imagePath),
                 qUtf8Printable(recognitionStatusToString(recognition.status)),
                 qUtf8Printable(recognition.errorMessage.value_or(QString())));
        return outcome;
    }

    const FieldReading reading = read(recognition.document, field);
    const QString context = QStringLiteral(" {image: %1, field: %2, text: %3}")
                                .arg(imagePath,
                                     recipeFieldToString(field),
                                     recognition.document.text());

    outcome = merge(reading, state, context);

    for (const QString& warning : outcome.warnings) {
        if (onWarn) {
            onWarn(warning);
        } else {
            LOG_WARN(rsParse, "Extraction warning: %s", qUtf8Printable(warning));
        }
    }
    return outcome;
}

// ── Routing ─────────────────────────────────────────────────

FieldReading FieldDispatcher::read(const RecognizedDocument& document, RecipeField field) const
{
    FieldReading reading;
    reading.field = field;

    switch (field) {
    case RecipeField::Image:
    case RecipeField::Unknown:
        break;

    case RecipeField::Title:
    case RecipeField::Description:
        reading.text = joinedLines(document);
        break;

    case RecipeField::Tags: {
        const QStringList words = joinedLines(document).split(
            QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts);
        for (const QString& word : words) {
            reading.tags.push_back(Tag{word});
        }
        break;
    }

    case RecipeField::Persons:
    case RecipeField::Time:
        reading.scalar = ScalarExtractor::extract(document.allLines());
        break;

    case RecipeField::Preparation:
        reading.steps = PreparationSegmenter(m_settings).segment(document);
        break;

    case RecipeField::Ingredients: {
        const std::optional<TermSet> terms = activeTerms();
        const std::vector<QString> lines = TextNormalizer::normalizeLines(
            document,
            terms ? terms->boxHeaders : QStringList(),
            terms ? terms->servingsSuffixes : QStringList());
        LOG_DEBUG(rsParse, "Ingredient lines after normalisation: %d",
                  static_cast<int>(lines.size()));
        reading.ingredients = IngredientTableParser(m_settings).parse(lines);
        break;
    }

    case RecipeField::Nutrition: {
        const std::optional<TermSet> terms = activeTerms();
        if (!terms.has_value() || !m_matcher) {
            LOG_INFO(rsParse, "No nutrition terms for language '%s'",
                     qUtf8Printable(m_settings.language));
            break;
        }
        reading.nutrition = NutritionParser(*terms, *m_matcher, m_settings)
                                .parse(document.allLines());
        break;
    }
    }

    return reading;
}

// ── Merging ─────────────────────────────────────────────────

ExtractionOutcome FieldDispatcher::merge(const FieldReading& reading,
                                         const RecipeFormState& state,
                                         const QString& context) const
{
    ExtractionOutcome outcome;
    const auto warn = [&outcome, &context](const QString& message) {
        outcome.warnings.push_back(message + context);
    };

    switch (reading.field) {
    case RecipeField::Image:
        if (!reading.text.isEmpty()) {
            outcome.patch.image = reading.text;
        }
        break;

    case RecipeField::Title:
        if (reading.text.trimmed().isEmpty()) {
            warn(QStringLiteral("Expected text for title"));
        } else {
            outcome.patch.title = reading.text;
        }
        break;

    case RecipeField::Description:
        if (reading.text.trimmed().isEmpty()) {
            warn(QStringLiteral("Expected text for description"));
        } else {
            outcome.patch.description = reading.text;
        }
        break;

    case RecipeField::Tags:
        if (reading.tags.empty()) {
            warn(QStringLiteral("Expected non empty list of tags"));
        } else {
            std::vector<Tag> tags = state.tags;
            tags.insert(tags.end(), reading.tags.begin(), reading.tags.end());
            outcome.patch.tags = tags;
        }
        break;

    case RecipeField::Preparation:
        if (reading.steps.empty()) {
            warn(QStringLiteral("Expected non empty list of preparation steps"));
        } else {
            std::vector<PreparationStep> steps = state.preparation;
            steps.insert(steps.end(), reading.steps.begin(), reading.steps.end());
            outcome.patch.preparation = steps;
        }
        break;

    case RecipeField::Persons:
    case RecipeField::Time:
        switch (reading.scalar.kind) {
        case ScalarReading::Kind::Single:
        case ScalarReading::Kind::List: {
            // Several values: the first one wins
            const int value = qRound(reading.scalar.values.front());
            if (reading.field == RecipeField::Persons) {
                outcome.patch.persons = value;
            } else {
                outcome.patch.time = value;
            }
            break;
        }
        case ScalarReading::Kind::Pairs:
            outcome.patch.persons = qRound(reading.scalar.pairs.front().persons);
            outcome.patch.time = qRound(reading.scalar.pairs.front().time);
            break;
        case ScalarReading::Kind::None:
            warn(QStringLiteral("Could not parse persons/time field"));
            break;
        }
        break;

    case RecipeField::Ingredients:
        return mergeIngredients(reading, state, context);

    case RecipeField::Nutrition:
        // An unreadable table is logged by the parser; not a shape mismatch
        if (!reading.nutrition.isEmpty()) {
            outcome.patch.nutrition = reading.nutrition;
        }
        break;

    case RecipeField::Unknown:
        LOG_ERROR(rsParse, "Unrecognized field in merge");
        break;
    }

    return outcome;
}

ExtractionOutcome FieldDispatcher::mergeIngredients(const FieldReading& reading,
                                                    const RecipeFormState& state,
                                                    const QString& context) const
{
    ExtractionOutcome outcome;
    const auto warn = [&outcome, &context](const QString& message) {
        outcome.warnings.push_back(message + context);
    };

    if (reading.ingredients.empty()
        || reading.ingredients.front().quantityPerServings.empty()) {
        warn(QStringLiteral("Expected non empty list of ingredients"));
        return outcome;
    }

    const std::vector<QuantityPerServings>& columns =
        reading.ingredients.front().quantityPerServings;

    size_t column = 0;
    int fromPersons = columns.front().servings;
    int toPersons = state.persons;

    if (state.persons > 0) {
        bool found = false;
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i].servings == state.persons) {
                column = i;
                fromPersons = state.persons;
                found = true;
                break;
            }
        }
        if (!found) {
            warn(QStringLiteral("Couldn't find exact match for persons (%1) in ingredient. "
                                "Using %2 and scaling to %3.")
                     .arg(state.persons)
                     .arg(fromPersons)
                     .arg(toPersons));
        }
    } else {
        toPersons = fromPersons;
        warn(QStringLiteral("Couldn't find exact match for persons in ingredient. "
                            "Using first available : %1.")
                 .arg(fromPersons));
    }

    std::vector<FormIngredient> ingredients = state.ingredients;
    for (const IngredientRecord& record : reading.ingredients) {
        const QString quantity = column < record.quantityPerServings.size()
                                     ? record.quantityPerServings[column].quantity
                                     : QString();

        FormIngredient ingredient;
        ingredient.name = record.name;
        ingredient.unit = record.unit;
        ingredient.quantity =
            QuantityScaler::scaleQuantityForPersons(quantity, fromPersons, toPersons);
        ingredient.note = record.note;
        ingredients.push_back(ingredient);
    }
    outcome.patch.ingredients = ingredients;

    return outcome;
}

} // namespace rs
