#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <map>
#include <optional>

namespace rs {

// Localised phrase lists used by the parsers for one language.
struct TermSet {
    // First-line headers printed above ingredient tables ("in your box")
    QStringList boxHeaders;

    // Phrases OCR splits away from a serving marker ("pers.")
    QStringList servingsSuffixes;

    // Label terms per nutrition key
    std::map<NutritionKey, QStringList> nutrition;

    // Nutrition table column anchors
    QStringList per100g;
    QStringList perPortion;

    QStringList nutritionTerms(NutritionKey key) const;
};

// TermProvider -- abstract source of per-language term lists.
class TermProvider {
public:
    virtual ~TermProvider() = default;

    // Returns std::nullopt when the language has no term list.
    virtual std::optional<TermSet> termsFor(const QString& language) const = 0;
};

// BuiltinTermProvider -- English and French term lists compiled in.
class BuiltinTermProvider : public TermProvider {
public:
    std::optional<TermSet> termsFor(const QString& language) const override;
};

// JsonTermProvider -- term lists loaded from a JSON document:
//
//   { "fr": { "boxHeaders": [...], "servingsSuffixes": [...],
//             "nutrition": { "fat": [...], ..., "per100g": [...],
//                            "perPortion": [...] } } }
class JsonTermProvider : public TermProvider {
public:
    JsonTermProvider() = default;
    explicit JsonTermProvider(std::map<QString, TermSet> terms);

    // Returns std::nullopt if the file cannot be read or parsed.
    static std::optional<JsonTermProvider> loadFrom(const QString& filePath);
    static JsonTermProvider fromJson(const QJsonObject& json);

    static TermSet termSetFromJson(const QJsonObject& json);
    static QJsonObject termSetToJson(const TermSet& terms);

    std::optional<TermSet> termsFor(const QString& language) const override;

    QStringList languages() const;

private:
    std::map<QString, TermSet> m_terms;
};

} // namespace rs
