#include <QtTest/QtTest>

#include "core/terms/term_provider.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

class TestTermProvider : public QObject {
    Q_OBJECT

private slots:
    void testBuiltinLanguages();
    void testBuiltinCoversEveryNutritionKey();
    void testJsonRoundTrip();
    void testLoadFromFile();
    void testUnreadableFile();
};

void TestTermProvider::testBuiltinLanguages()
{
    const rs::BuiltinTermProvider provider;

    const std::optional<rs::TermSet> fr = provider.termsFor(QStringLiteral("fr-FR"));
    QVERIFY(fr.has_value());
    QVERIFY(fr->boxHeaders.contains(QStringLiteral("dans votre box")));
    QVERIFY(fr->per100g.contains(QStringLiteral("pour 100g")));

    const std::optional<rs::TermSet> en = provider.termsFor(QStringLiteral("EN_gb"));
    QVERIFY(en.has_value());
    QVERIFY(en->nutritionTerms(rs::NutritionKey::EnergyKcal)
                .contains(QStringLiteral("Energy")));

    QVERIFY(!provider.termsFor(QStringLiteral("de")).has_value());
    QVERIFY(!provider.termsFor(QString()).has_value());
}

void TestTermProvider::testBuiltinCoversEveryNutritionKey()
{
    const rs::BuiltinTermProvider provider;
    for (const QString& lang : {QStringLiteral("en"), QStringLiteral("fr")}) {
        const rs::TermSet terms = *provider.termsFor(lang);
        for (rs::NutritionKey key : rs::allNutritionKeys()) {
            QVERIFY2(!terms.nutritionTerms(key).isEmpty(),
                     qPrintable(lang + QLatin1Char(':') + rs::nutritionKeyToString(key)));
        }
        QVERIFY(!terms.perPortion.isEmpty());
        QVERIFY(!terms.servingsSuffixes.isEmpty());
    }
}

void TestTermProvider::testJsonRoundTrip()
{
    const rs::TermSet fr = *rs::BuiltinTermProvider().termsFor(QStringLiteral("fr"));
    const QJsonObject json = rs::JsonTermProvider::termSetToJson(fr);

    QVERIFY(json.value(QStringLiteral("nutrition")).toObject().contains(QStringLiteral("saturatedFat")));

    const rs::TermSet back = rs::JsonTermProvider::termSetFromJson(json);
    QCOMPARE(back.boxHeaders, fr.boxHeaders);
    QCOMPARE(back.servingsSuffixes, fr.servingsSuffixes);
    QCOMPARE(back.per100g, fr.per100g);
    QCOMPARE(back.perPortion, fr.perPortion);
    QVERIFY(back.nutrition == fr.nutrition);
}

void TestTermProvider::testLoadFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/terms.json");

    QJsonObject nutrition;
    nutrition.insert(QStringLiteral("salt"), QJsonArray{QStringLiteral("Salz")});
    nutrition.insert(QStringLiteral("per100g"), QJsonArray{QStringLiteral("pro 100 g")});
    nutrition.insert(QStringLiteral("unknownKey"), QJsonArray{QStringLiteral("ignored")});
    QJsonObject de;
    de.insert(QStringLiteral("servingsSuffixes"), QJsonArray{QStringLiteral("Pers.")});
    de.insert(QStringLiteral("nutrition"), nutrition);
    QJsonObject root;
    root.insert(QStringLiteral("de-DE"), de);
    root.insert(QStringLiteral("xx"), QStringLiteral("not an object"));

    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(QJsonDocument(root).toJson());
        file.close();
    }

    const std::optional<rs::JsonTermProvider> provider = rs::JsonTermProvider::loadFrom(path);
    QVERIFY(provider.has_value());
    QCOMPARE(provider->languages(), QStringList{QStringLiteral("de")});

    const std::optional<rs::TermSet> terms = provider->termsFor(QStringLiteral("de"));
    QVERIFY(terms.has_value());
    QCOMPARE(terms->servingsSuffixes, QStringList{QStringLiteral("Pers.")});
    QCOMPARE(terms->nutritionTerms(rs::NutritionKey::Salt), QStringList{QStringLiteral("Salz")});
    QVERIFY(terms->nutritionTerms(rs::NutritionKey::Fat).isEmpty());
    QCOMPARE(terms->per100g, QStringList{QStringLiteral("pro 100 g")});
    QVERIFY(terms->boxHeaders.isEmpty());

    QVERIFY(!provider->termsFor(QStringLiteral("fr")).has_value());
}

void TestTermProvider::testUnreadableFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!rs::JsonTermProvider::loadFrom(dir.path() + QStringLiteral("/missing.json"))
                 .has_value());

    const QString brokenPath = dir.path() + QStringLiteral("/broken.json");
    {
        QFile file(brokenPath);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write("not json at all");
        file.close();
    }
    QVERIFY(!rs::JsonTermProvider::loadFrom(brokenPath).has_value());
}

QTEST_MAIN(TestTermProvider)
#include "test_term_provider.moc"
