#include "core/parsing/quantity_scaler.h"

#include <QRegularExpression>

#include <cmath>

namespace rs {

namespace {

double roundTo(double value, int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

// 1.5 -> "1,5", 600 -> "600"
QString formatDecimal(double value, int decimals)
{
    QString str = QString::number(value, 'f', decimals);
    if (str.contains(QLatin1Char('.'))) {
        while (str.endsWith(QLatin1Char('0'))) {
            str.chop(1);
        }
        if (str.endsWith(QLatin1Char('.'))) {
            str.chop(1);
        }
    }
    return str.replace(QLatin1Char('.'), QLatin1Char(','));
}

} // anonymous namespace

QString QuantityScaler::replaceNumber(const QString& quantity, double factor, int decimals)
{
    static const QRegularExpression numberToken(QStringLiteral("\\d+(?:[.,]\\d+)?"));

    QRegularExpressionMatchIterator it = numberToken.globalMatch(quantity);
    if (!it.hasNext()) {
        return quantity;
    }
    const QRegularExpressionMatch match = it.next();
    if (it.hasNext()) {
        return quantity;
    }

    QString token = match.captured(0);
    token.replace(QLatin1Char(','), QLatin1Char('.'));
    bool ok = false;
    const double value = token.toDouble(&ok);
    if (!ok) {
        return quantity;
    }

    const double scaled = roundTo(value * factor, decimals);
    QString result = quantity;
    result.replace(match.capturedStart(0), match.capturedLength(0),
                   formatDecimal(scaled, decimals));
    return result;
}

QString QuantityScaler::scaleQuantityForPersons(const QString& quantity, int fromPersons,
                                                int toPersons)
{
    if (fromPersons <= 0 || toPersons <= 0 || fromPersons == toPersons) {
        return quantity;
    }
    const double factor = static_cast<double>(toPersons) / static_cast<double>(fromPersons);
    return replaceNumber(quantity, factor, 4);
}

QString QuantityScaler::formatQuantityForDisplay(const QString& quantity)
{
    if (quantity.isEmpty()) {
        return quantity;
    }
    return replaceNumber(quantity, 1.0, 2);
}

NutritionRecord QuantityScaler::nutritionPerPortion(const NutritionRecord& per100g,
                                                    double portionWeightGrams)
{
    const double factor = portionWeightGrams / 100.0;

    NutritionRecord portion;
    for (const auto& entry : per100g.values) {
        int decimals = 1;
        if (entry.first == NutritionKey::EnergyKj) {
            decimals = 0;
        } else if (entry.first == NutritionKey::Salt) {
            decimals = 2;
        }
        portion.set(entry.first, roundTo(entry.second * factor, decimals));
    }
    return portion;
}

} // namespace rs
