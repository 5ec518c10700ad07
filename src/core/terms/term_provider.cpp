#include "core/terms/term_provider.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

#include <utility>

namespace rs {

namespace {

TermSet englishTerms()
{
    TermSet terms;
    terms.boxHeaders = {QStringLiteral("box"), QStringLiteral("in your box")};
    terms.servingsSuffixes = {QStringLiteral("pers."), QStringLiteral("pers"),
                              QStringLiteral("persons")};

    terms.nutrition[NutritionKey::EnergyKj] = {QStringLiteral("Energy"),
                                               QStringLiteral("Energy (kJ)")};
    terms.nutrition[NutritionKey::EnergyKcal] = {QStringLiteral("Energy"),
                                                 QStringLiteral("Energy (kcal)")};
    terms.nutrition[NutritionKey::Fat] = {QStringLiteral("fat")};
    terms.nutrition[NutritionKey::SaturatedFat] = {QStringLiteral("saturated fat"),
                                                   QStringLiteral("of which saturated")};
    terms.nutrition[NutritionKey::Carbohydrates] = {QStringLiteral("carbohydrates"),
                                                    QStringLiteral("carbs")};
    terms.nutrition[NutritionKey::Sugars] = {QStringLiteral("of which sugars"),
                                             QStringLiteral("sugars")};
    terms.nutrition[NutritionKey::Fiber] = {QStringLiteral("fiber")};
    terms.nutrition[NutritionKey::Protein] = {QStringLiteral("protein")};
    terms.nutrition[NutritionKey::Salt] = {QStringLiteral("salt")};

    terms.per100g = {QStringLiteral("per 100 g")};
    terms.perPortion = {QStringLiteral("Per portion")};
    return terms;
}

TermSet frenchTerms()
{
    TermSet terms;
    terms.boxHeaders = {QStringLiteral("dans votre box"), QStringLiteral("box")};
    terms.servingsSuffixes = {QStringLiteral("pers."), QStringLiteral("pers"),
                              QStringLiteral("personnes")};

    terms.nutrition[NutritionKey::EnergyKj] = {
        QStringLiteral("Energie"), QStringLiteral("Énergie"),
        QStringLiteral("Énergie (kJ)"), QStringLiteral("Energie (kJ)")};
    terms.nutrition[NutritionKey::EnergyKcal] = {
        QStringLiteral("Energie"), QStringLiteral("Énergie"),
        QStringLiteral("Énergie (kCal)"), QStringLiteral("Energie (kCal)")};
    terms.nutrition[NutritionKey::Fat] = {QStringLiteral("matières grasses"),
                                          QStringLiteral("matieres grasses"),
                                          QStringLiteral("lipides")};
    terms.nutrition[NutritionKey::SaturatedFat] = {QStringLiteral("dont acides gras saturés"),
                                                   QStringLiteral("dont saturés"),
                                                   QStringLiteral("dont satures")};
    terms.nutrition[NutritionKey::Carbohydrates] = {QStringLiteral("glucides")};
    terms.nutrition[NutritionKey::Sugars] = {QStringLiteral("dont sucres"),
                                             QStringLiteral("dont sucre")};
    terms.nutrition[NutritionKey::Fiber] = {QStringLiteral("fibres")};
    terms.nutrition[NutritionKey::Protein] = {QStringLiteral("protéines"),
                                              QStringLiteral("proteines")};
    terms.nutrition[NutritionKey::Salt] = {QStringLiteral("sel")};

    terms.per100g = {QStringLiteral("pour 100g")};
    terms.perPortion = {QStringLiteral("Par portion"), QStringLiteral("Pour ce plat")};
    return terms;
}

QStringList stringListFromJson(const QJsonValue& value)
{
    QStringList list;
    const QJsonArray array = value.toArray();
    list.reserve(array.size());
    for (const QJsonValue& item : array) {
        const QString str = item.toString();
        if (!str.isEmpty()) {
            list.append(str);
        }
    }
    return list;
}

// "fr-FR" and "fr_FR" resolve to "fr".
QString baseLanguage(const QString& language)
{
    QString lower = language.trimmed().toLower();
    const int sep = lower.indexOf(QRegularExpression(QStringLiteral("[-_]")));
    if (sep > 0) {
        lower.truncate(sep);
    }
    return lower;
}

} // anonymous namespace

QStringList TermSet::nutritionTerms(NutritionKey key) const
{
    auto it = nutrition.find(key);
    if (it == nutrition.end()) {
        return {};
    }
    return it->second;
}

// ── BuiltinTermProvider ─────────────────────────────────────

std::optional<TermSet> BuiltinTermProvider::termsFor(const QString& language) const
{
    const QString lang = baseLanguage(language);
    if (lang == QLatin1String("en")) {
        return englishTerms();
    }
    if (lang == QLatin1String("fr")) {
        return frenchTerms();
    }
    LOG_DEBUG(rsCore, "No built-in term list for language '%s'", qUtf8Printable(language));
    return std::nullopt;
}

// ── JsonTermProvider ────────────────────────────────────────

JsonTermProvider::JsonTermProvider(std::map<QString, TermSet> terms)
    : m_terms(std::move(terms))
{
}

std::optional<JsonTermProvider> JsonTermProvider::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rsCore, "Failed to open term file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rsCore,
                 "Failed to parse term JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

JsonTermProvider JsonTermProvider::fromJson(const QJsonObject& json)
{
    std::map<QString, TermSet> terms;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (!it.value().isObject()) {
            LOG_WARN(rsCore, "Ignoring term list '%s': not an object", qUtf8Printable(it.key()));
            continue;
        }
        terms[baseLanguage(it.key())] = termSetFromJson(it.value().toObject());
    }
    return JsonTermProvider(std::move(terms));
}

TermSet JsonTermProvider::termSetFromJson(const QJsonObject& json)
{
    TermSet terms;
    terms.boxHeaders = stringListFromJson(json.value(QStringLiteral("boxHeaders")));
    terms.servingsSuffixes = stringListFromJson(json.value(QStringLiteral("servingsSuffixes")));

    const QJsonObject nutrition = json.value(QStringLiteral("nutrition")).toObject();
    for (NutritionKey key : allNutritionKeys()) {
        const QStringList list = stringListFromJson(nutrition.value(nutritionKeyToString(key)));
        if (!list.isEmpty()) {
            terms.nutrition[key] = list;
        }
    }
    terms.per100g = stringListFromJson(nutrition.value(QStringLiteral("per100g")));
    terms.perPortion = stringListFromJson(nutrition.value(QStringLiteral("perPortion")));
    return terms;
}

QJsonObject JsonTermProvider::termSetToJson(const TermSet& terms)
{
    QJsonObject nutrition;
    for (const auto& entry : terms.nutrition) {
        nutrition.insert(nutritionKeyToString(entry.first),
                         QJsonArray::fromStringList(entry.second));
    }
    nutrition.insert(QStringLiteral("per100g"), QJsonArray::fromStringList(terms.per100g));
    nutrition.insert(QStringLiteral("perPortion"), QJsonArray::fromStringList(terms.perPortion));

    QJsonObject json;
    json.insert(QStringLiteral("boxHeaders"), QJsonArray::fromStringList(terms.boxHeaders));
    json.insert(QStringLiteral("servingsSuffixes"),
                QJsonArray::fromStringList(terms.servingsSuffixes));
    json.insert(QStringLiteral("nutrition"), nutrition);
    return json;
}

std::optional<TermSet> JsonTermProvider::termsFor(const QString& language) const
{
    auto it = m_terms.find(baseLanguage(language));
    if (it == m_terms.end()) {
        return std::nullopt;
    }
    return it->second;
}

QStringList JsonTermProvider::languages() const
{
    QStringList langs;
    for (const auto& entry : m_terms) {
        langs.append(entry.first);
    }
    return langs;
}

} // namespace rs
