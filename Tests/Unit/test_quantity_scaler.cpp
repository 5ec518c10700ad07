#include <QtTest/QtTest>

#include "core/parsing/quantity_scaler.h"

class TestQuantityScaler : public QObject {
    Q_OBJECT

private slots:
    void testScaleQuantityForPersons_data();
    void testScaleQuantityForPersons();
    void testUnscalableQuantitiesPassThrough();
    void testFormatQuantityForDisplay();
    void testNutritionPerPortion();
};

void TestQuantityScaler::testScaleQuantityForPersons_data()
{
    QTest::addColumn<QString>("quantity");
    QTest::addColumn<int>("from");
    QTest::addColumn<int>("to");
    QTest::addColumn<QString>("expected");

    QTest::newRow("up") << QStringLiteral("100") << 2 << 6 << QStringLiteral("300");
    QTest::newRow("decimal up") << QStringLiteral("0.5") << 2 << 6 << QStringLiteral("1,5");
    QTest::newRow("down") << QStringLiteral("35") << 2 << 1 << QStringLiteral("17,5");
    QTest::newRow("quarter") << QStringLiteral("0.5") << 2 << 1 << QStringLiteral("0,25");
    QTest::newRow("comma input") << QStringLiteral("1,5") << 1 << 3 << QStringLiteral("4,5");
    QTest::newRow("thirds") << QStringLiteral("1") << 3 << 1 << QStringLiteral("0,3333");
    QTest::newRow("unit kept") << QStringLiteral("200 g") << 4 << 2 << QStringLiteral("100 g");
}

void TestQuantityScaler::testScaleQuantityForPersons()
{
    QFETCH(QString, quantity);
    QFETCH(int, from);
    QFETCH(int, to);
    QFETCH(QString, expected);

    QCOMPARE(rs::QuantityScaler::scaleQuantityForPersons(quantity, from, to), expected);
}

void TestQuantityScaler::testUnscalableQuantitiesPassThrough()
{
    using rs::QuantityScaler;
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QStringLiteral("1à3"), 2, 6),
             QStringLiteral("1à3"));
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QStringLiteral("a pinch"), 2, 6),
             QStringLiteral("a pinch"));
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QString(), 2, 6), QString());
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QStringLiteral("200"), 2, 2),
             QStringLiteral("200"));
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QStringLiteral("200"), 0, 4),
             QStringLiteral("200"));
    QCOMPARE(QuantityScaler::scaleQuantityForPersons(QStringLiteral("200"), rs::kUnknownServings, 4),
             QStringLiteral("200"));
}

void TestQuantityScaler::testFormatQuantityForDisplay()
{
    using rs::QuantityScaler;
    QCOMPARE(QuantityScaler::formatQuantityForDisplay(QStringLiteral("0,3333")),
             QStringLiteral("0,33"));
    QCOMPARE(QuantityScaler::formatQuantityForDisplay(QStringLiteral("1.005 cs")),
             QStringLiteral("1 cs"));
    QCOMPARE(QuantityScaler::formatQuantityForDisplay(QStringLiteral("250")),
             QStringLiteral("250"));
    QCOMPARE(QuantityScaler::formatQuantityForDisplay(QString()), QString());
}

void TestQuantityScaler::testNutritionPerPortion()
{
    rs::NutritionRecord per100g;
    per100g.set(rs::NutritionKey::EnergyKj, 911);
    per100g.set(rs::NutritionKey::EnergyKcal, 218);
    per100g.set(rs::NutritionKey::Fat, 8.53);
    per100g.set(rs::NutritionKey::Salt, 0.657);

    const rs::NutritionRecord portion = rs::QuantityScaler::nutritionPerPortion(per100g, 200);

    QCOMPARE(portion.value(rs::NutritionKey::EnergyKj).value_or(-1), 1822.0);
    QCOMPARE(portion.value(rs::NutritionKey::EnergyKcal).value_or(-1), 436.0);
    QCOMPARE(portion.value(rs::NutritionKey::Fat).value_or(-1), 17.1);
    QCOMPARE(portion.value(rs::NutritionKey::Salt).value_or(-1), 1.31);
    QVERIFY(!portion.has(rs::NutritionKey::Protein));

    QVERIFY(rs::QuantityScaler::nutritionPerPortion(rs::NutritionRecord(), 200).isEmpty());
}

QTEST_MAIN(TestQuantityScaler)
#include "test_quantity_scaler.moc"
