#include <QtTest/QtTest>

#include "core/extraction/patch_serializer.h"

class TestPatchSerializer : public QObject {
    Q_OBJECT

private slots:
    void testAbsentFieldsAreOmitted();
    void testIngredientsAndWarnings();
    void testNutritionKeys();
    void testIngredientRecordColumns();
};

void TestPatchSerializer::testAbsentFieldsAreOmitted()
{
    rs::ExtractionPatch patch;
    patch.persons = 2;
    patch.time = 25;

    const QJsonObject json = rs::PatchSerializer::patchToJson(patch);
    QCOMPARE(json.keys(), (QStringList{QStringLiteral("persons"), QStringLiteral("time")}));
    QCOMPARE(json.value(QStringLiteral("persons")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("time")).toInt(), 25);

    QVERIFY(rs::PatchSerializer::patchToJson(rs::ExtractionPatch()).isEmpty());
}

void TestPatchSerializer::testIngredientsAndWarnings()
{
    rs::ExtractionOutcome outcome;
    outcome.patch.ingredients = std::vector<rs::FormIngredient>{
        {QStringLiteral("riz basmati"), QStringLiteral("g"), QStringLiteral("150"),
         QStringLiteral("Bio")},
        {QStringLiteral("filet de poulet"), QString(), QStringLiteral("2"), std::nullopt},
    };
    outcome.warnings.push_back(QStringLiteral("Couldn't find exact match"));

    const QJsonObject json = rs::PatchSerializer::toJson(outcome);
    const QJsonArray ingredients =
        json.value(QStringLiteral("patch")).toObject().value(QStringLiteral("ingredients")).toArray();
    QCOMPARE(ingredients.size(), 2);

    const QJsonObject rice = ingredients.at(0).toObject();
    QCOMPARE(rice.value(QStringLiteral("name")).toString(), QStringLiteral("riz basmati"));
    QCOMPARE(rice.value(QStringLiteral("unit")).toString(), QStringLiteral("g"));
    QCOMPARE(rice.value(QStringLiteral("quantity")).toString(), QStringLiteral("150"));
    QCOMPARE(rice.value(QStringLiteral("note")).toString(), QStringLiteral("Bio"));
    QVERIFY(!ingredients.at(1).toObject().contains(QStringLiteral("note")));

    const QJsonArray warnings = json.value(QStringLiteral("warnings")).toArray();
    QCOMPARE(warnings.size(), 1);
    QCOMPARE(warnings.at(0).toString(), QStringLiteral("Couldn't find exact match"));
}

void TestPatchSerializer::testNutritionKeys()
{
    rs::NutritionRecord record;
    record.set(rs::NutritionKey::EnergyKcal, 463);
    record.set(rs::NutritionKey::SaturatedFat, 2);
    record.set(rs::NutritionKey::Salt, 0);

    const QJsonObject json = rs::PatchSerializer::nutritionToJson(record);
    QCOMPARE(json.size(), 3);
    QCOMPARE(json.value(QStringLiteral("energyKcal")).toDouble(), 463.0);
    QCOMPARE(json.value(QStringLiteral("saturatedFat")).toDouble(), 2.0);
    QVERIFY(json.contains(QStringLiteral("salt")));
    QCOMPARE(json.value(QStringLiteral("salt")).toDouble(-1), 0.0);
}

void TestPatchSerializer::testIngredientRecordColumns()
{
    rs::IngredientRecord record;
    record.name = QStringLiteral("Flour");
    record.unit = QStringLiteral("g");
    record.quantityPerServings = {{2, QStringLiteral("200")}, {4, QStringLiteral("400")}};

    const QJsonArray array = rs::PatchSerializer::ingredientRecordsToJson({record});
    QCOMPARE(array.size(), 1);
    const QJsonArray columns =
        array.at(0).toObject().value(QStringLiteral("quantityPerServings")).toArray();
    QCOMPARE(columns.size(), 2);
    QCOMPARE(columns.at(1).toObject().value(QStringLiteral("servings")).toInt(), 4);
    QCOMPARE(columns.at(1).toObject().value(QStringLiteral("quantity")).toString(),
             QStringLiteral("400"));
}

QTEST_MAIN(TestPatchSerializer)
#include "test_patch_serializer.moc"
