#include <QtTest/QtTest>

#include "core/extraction/field_dispatcher.h"
#include "core/matching/edit_distance_matcher.h"
#include "ocr_fixtures.h"

#include <memory>

class TestFieldDispatcher : public QObject {
    Q_OBJECT

private slots:
    void testImagePassesPathThrough();
    void testRecognitionFailureYieldsEmptyOutcome();
    void testUnknownFieldYieldsEmptyOutcome();
    void testEmptyDocumentNeverFails();
    void testTitleJoinsLines();
    void testTagsAreAppended();
    void testPreparationIsAppended();
    void testPersonsAndTimePairs();
    void testTimeAlone();
    void testIngredientsExactServings();
    void testIngredientsScaledToFormServings();
    void testIngredientsWithoutFormServings();
    void testNutrition();
    void testNutritionWithoutTerms();
    void testWarningHandlerReceivesWarnings();
};

namespace {

const QString kCardPath = QStringLiteral("/cards/card.png");

struct Harness {
    rs::test::FakeRecognizer* recognizer = nullptr;
    std::unique_ptr<rs::FieldDispatcher> dispatcher;
};

Harness makeHarness(const rs::RecognizedDocument& document,
                    const QString& language = QStringLiteral("en"))
{
    auto recognizer = std::make_unique<rs::test::FakeRecognizer>();
    recognizer->setDocument(kCardPath, document);

    rs::ExtractionSettings settings;
    settings.language = language;

    Harness harness;
    harness.recognizer = recognizer.get();
    harness.dispatcher = std::make_unique<rs::FieldDispatcher>(
        std::move(recognizer), std::make_unique<rs::BuiltinTermProvider>(),
        std::make_unique<rs::EditDistanceMatcher>(), settings);
    return harness;
}

rs::RecognizedDocument ingredientCard()
{
    return rs::test::documentFromLines(
        {QStringLiteral("In your box"), QStringLiteral("Flour (g)"), QStringLiteral("Sugar (g)"),
         QStringLiteral("2"), QStringLiteral("pers."), QStringLiteral("200"),
         QStringLiteral("100"), QStringLiteral("4"), QStringLiteral("pers."),
         QStringLiteral("400"), QStringLiteral("200")});
}

} // anonymous namespace

void TestFieldDispatcher::testImagePassesPathThrough()
{
    Harness harness = makeHarness(rs::RecognizedDocument());
    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Image, rs::RecipeFormState());

    QCOMPARE(outcome.patch.image.value_or(QString()), kCardPath);
    QVERIFY(!outcome.patch.title.has_value());
    QVERIFY(outcome.warnings.empty());
    QCOMPARE(harness.recognizer->callCount(), 0);
}

void TestFieldDispatcher::testRecognitionFailureYieldsEmptyOutcome()
{
    Harness harness = makeHarness(rs::RecognizedDocument());
    harness.recognizer->setFailure(kCardPath, rs::RecognitionResult::Status::CorruptedFile,
                                   QStringLiteral("truncated"));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Title, rs::RecipeFormState());
    QVERIFY(outcome.patch.isEmpty());
    QVERIFY(outcome.warnings.empty());
    QCOMPARE(harness.recognizer->callCount(), 1);

    const rs::ExtractionOutcome missing = harness.dispatcher->extract(
        QStringLiteral("/cards/other.png"), rs::RecipeField::Ingredients, rs::RecipeFormState());
    QVERIFY(missing.patch.isEmpty());
    QVERIFY(missing.warnings.empty());
}

void TestFieldDispatcher::testUnknownFieldYieldsEmptyOutcome()
{
    Harness harness = makeHarness(rs::test::documentFromLines({QStringLiteral("Soup")}));
    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Unknown, rs::RecipeFormState());

    QVERIFY(outcome.patch.isEmpty());
    QVERIFY(outcome.warnings.empty());
    QCOMPARE(harness.recognizer->callCount(), 0);
}

void TestFieldDispatcher::testEmptyDocumentNeverFails()
{
    Harness harness = makeHarness(rs::RecognizedDocument());
    const rs::RecipeField fields[] = {
        rs::RecipeField::Title,       rs::RecipeField::Description, rs::RecipeField::Tags,
        rs::RecipeField::Persons,     rs::RecipeField::Time,        rs::RecipeField::Preparation,
        rs::RecipeField::Ingredients, rs::RecipeField::Nutrition,
    };

    for (rs::RecipeField field : fields) {
        const rs::ExtractionOutcome outcome =
            harness.dispatcher->extract(kCardPath, field, rs::RecipeFormState());
        QVERIFY2(outcome.patch.isEmpty(), qPrintable(rs::recipeFieldToString(field)));
        if (field == rs::RecipeField::Nutrition) {
            QVERIFY(outcome.warnings.empty());
        } else {
            QCOMPARE(static_cast<int>(outcome.warnings.size()), 1);
        }
    }

    const rs::ExtractionOutcome ingredients =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Ingredients, rs::RecipeFormState());
    QVERIFY(ingredients.warnings.front().startsWith(
        QStringLiteral("Expected non empty list of ingredients")));
    QVERIFY(ingredients.warnings.front().contains(
        QStringLiteral("{image: /cards/card.png, field: ingredients")));
}

void TestFieldDispatcher::testTitleJoinsLines()
{
    Harness harness = makeHarness(rs::test::documentFromBlocks(
        {QStringLiteral("Poulet satay"), QStringLiteral("et riz basmati")}));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Title, rs::RecipeFormState());
    QCOMPARE(outcome.patch.title.value_or(QString()),
             QStringLiteral("Poulet satay et riz basmati"));
    QVERIFY(outcome.warnings.empty());
}

void TestFieldDispatcher::testTagsAreAppended()
{
    Harness harness = makeHarness(
        rs::test::documentFromLines({QStringLiteral("Veggie  Quick"), QStringLiteral("Spicy")}));

    rs::RecipeFormState state;
    state.tags = {rs::Tag{QStringLiteral("Family")}};

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Tags, state);
    QVERIFY(outcome.patch.tags.has_value());
    const std::vector<rs::Tag> expected = {
        rs::Tag{QStringLiteral("Family")}, rs::Tag{QStringLiteral("Veggie")},
        rs::Tag{QStringLiteral("Quick")}, rs::Tag{QStringLiteral("Spicy")}};
    QVERIFY(*outcome.patch.tags == expected);
}

void TestFieldDispatcher::testPreparationIsAppended()
{
    Harness harness = makeHarness(rs::test::documentFromBlocks(
        {QStringLiteral("1"), QStringLiteral("Mix"), QStringLiteral("2. Bake\nfor 10 minutes")}));

    rs::RecipeFormState state;
    state.preparation = {rs::PreparationStep{QStringLiteral("Preheat"), QString()}};

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Preparation, state);
    QVERIFY(outcome.patch.preparation.has_value());
    const std::vector<rs::PreparationStep>& steps = *outcome.patch.preparation;
    QCOMPARE(static_cast<int>(steps.size()), 3);
    QCOMPARE(steps[0].title, QStringLiteral("Preheat"));
    QCOMPARE(steps[1].title, QStringLiteral("Mix"));
    QCOMPARE(steps[2],
             (rs::PreparationStep{QStringLiteral("Bake"), QStringLiteral("for 10 minutes")}));
    QVERIFY(outcome.warnings.empty());
}

void TestFieldDispatcher::testPersonsAndTimePairs()
{
    Harness harness = makeHarness(rs::test::documentFromLines(
        {QStringLiteral("2 pers."), QStringLiteral("4 pers."), QStringLiteral(">"),
         QStringLiteral("25 min"), QStringLiteral("30 min")}));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Persons, rs::RecipeFormState());
    QCOMPARE(outcome.patch.persons.value_or(-1), 2);
    QCOMPARE(outcome.patch.time.value_or(-1), 25);
    QVERIFY(outcome.warnings.empty());
}

void TestFieldDispatcher::testTimeAlone()
{
    Harness harness = makeHarness(
        rs::test::documentFromLines({QStringLiteral("35 min"), QStringLiteral("40 min")}));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Time, rs::RecipeFormState());
    QCOMPARE(outcome.patch.time.value_or(-1), 35);
    QVERIFY(!outcome.patch.persons.has_value());

    Harness unreadable = makeHarness(
        rs::test::documentFromLines({QStringLiteral("pers."), QStringLiteral("hello")}));
    const rs::ExtractionOutcome none =
        unreadable.dispatcher->extract(kCardPath, rs::RecipeField::Time, rs::RecipeFormState());
    QVERIFY(none.patch.isEmpty());
    QCOMPARE(static_cast<int>(none.warnings.size()), 1);
    QVERIFY(none.warnings.front().startsWith(QStringLiteral("Could not parse persons/time field")));
}

void TestFieldDispatcher::testIngredientsExactServings()
{
    Harness harness = makeHarness(ingredientCard());

    rs::RecipeFormState state;
    state.persons = 4;
    state.ingredients = {rs::FormIngredient{QStringLiteral("Salt"), QString(),
                                            QStringLiteral("1 pinch"), std::nullopt}};

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Ingredients, state);
    QVERIFY(outcome.warnings.empty());
    QVERIFY(outcome.patch.ingredients.has_value());

    const std::vector<rs::FormIngredient> expected = {
        rs::FormIngredient{QStringLiteral("Salt"), QString(), QStringLiteral("1 pinch"),
                           std::nullopt},
        rs::FormIngredient{QStringLiteral("Flour"), QStringLiteral("g"), QStringLiteral("400"),
                           std::nullopt},
        rs::FormIngredient{QStringLiteral("Sugar"), QStringLiteral("g"), QStringLiteral("200"),
                           std::nullopt},
    };
    QVERIFY(*outcome.patch.ingredients == expected);
}

void TestFieldDispatcher::testIngredientsScaledToFormServings()
{
    Harness harness = makeHarness(ingredientCard());

    rs::RecipeFormState state;
    state.persons = 6;

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Ingredients, state);
    QVERIFY(outcome.patch.ingredients.has_value());
    const std::vector<rs::FormIngredient>& ingredients = *outcome.patch.ingredients;
    QCOMPARE(static_cast<int>(ingredients.size()), 2);
    QCOMPARE(ingredients[0].quantity, QStringLiteral("600"));
    QCOMPARE(ingredients[1].quantity, QStringLiteral("300"));

    QCOMPARE(static_cast<int>(outcome.warnings.size()), 1);
    QVERIFY(outcome.warnings.front().startsWith(
        QStringLiteral("Couldn't find exact match for persons (6) in ingredient. "
                       "Using 2 and scaling to 6.")));
}

void TestFieldDispatcher::testIngredientsWithoutFormServings()
{
    Harness harness = makeHarness(ingredientCard());

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Ingredients, rs::RecipeFormState());
    QVERIFY(outcome.patch.ingredients.has_value());
    QCOMPARE(outcome.patch.ingredients->at(0).quantity, QStringLiteral("200"));
    QCOMPARE(outcome.patch.ingredients->at(1).quantity, QStringLiteral("100"));

    QCOMPARE(static_cast<int>(outcome.warnings.size()), 1);
    QVERIFY(outcome.warnings.front().contains(QStringLiteral("Using first available : 2.")));
}

void TestFieldDispatcher::testNutrition()
{
    Harness harness = makeHarness(rs::test::documentFromLines(
        {QStringLiteral("Energy"), QStringLiteral("per 100g"), QStringLiteral("250 kcal"),
         QStringLiteral("1046 kJ")}));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Nutrition, rs::RecipeFormState());
    QVERIFY(outcome.patch.nutrition.has_value());
    QCOMPARE(outcome.patch.nutrition->value(rs::NutritionKey::EnergyKcal).value_or(-1), 250.0);
    QCOMPARE(outcome.patch.nutrition->value(rs::NutritionKey::EnergyKj).value_or(-1), 1046.0);
    QVERIFY(outcome.warnings.empty());
}

void TestFieldDispatcher::testNutritionWithoutTerms()
{
    Harness harness = makeHarness(
        rs::test::documentFromLines({QStringLiteral("Energy"), QStringLiteral("per 100g"),
                                     QStringLiteral("250 kcal")}),
        QStringLiteral("de"));

    const rs::ExtractionOutcome outcome =
        harness.dispatcher->extract(kCardPath, rs::RecipeField::Nutrition, rs::RecipeFormState());
    QVERIFY(outcome.patch.isEmpty());
    QVERIFY(outcome.warnings.empty());
}

void TestFieldDispatcher::testWarningHandlerReceivesWarnings()
{
    Harness harness = makeHarness(ingredientCard());

    rs::RecipeFormState state;
    state.persons = 3;

    std::vector<QString> received;
    const rs::ExtractionOutcome outcome = harness.dispatcher->extract(
        kCardPath, rs::RecipeField::Ingredients, state,
        [&received](const QString& warning) { received.push_back(warning); });

    QCOMPARE(static_cast<int>(received.size()), 1);
    QVERIFY(received == outcome.warnings);
    QCOMPARE(outcome.patch.ingredients->at(0).quantity, QStringLiteral("300"));
    QCOMPARE(outcome.patch.ingredients->at(1).quantity, QStringLiteral("150"));
}

QTEST_MAIN(TestFieldDispatcher)
#include "test_field_dispatcher.moc"
