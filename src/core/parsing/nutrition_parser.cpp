#include "core/parsing/nutrition_parser.h"
#include "core/parsing/text_normalizer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

#include <cmath>

namespace rs {

namespace {

QString joinLines(const std::vector<QString>& lines, size_t from, size_t to)
{
    QStringList parts;
    for (size_t i = from; i <= to && i < lines.size(); ++i) {
        parts.append(lines[i]);
    }
    return parts.join(QLatin1Char(' '));
}

} // anonymous namespace

NutritionParser::NutritionParser(const TermSet& terms, const FuzzyMatcher& matcher,
                                 const ExtractionSettings& settings)
    : m_terms(terms)
    , m_matcher(matcher)
    , m_settings(settings)
{
}

bool NutritionParser::matchesAny(const QString& line, const QStringList& terms) const
{
    return m_matcher.isMatch(line, terms, m_settings.fuzzyThreshold);
}

// ── Anchor ──────────────────────────────────────────────────

int NutritionParser::findPer100gIndex(std::vector<QString>& lines) const
{
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!matchesAny(TextNormalizer::fixDigitConfusions(lines[i]), m_terms.per100g)) {
            continue;
        }

        size_t end = i;
        while (end + 1 < lines.size()) {
            const QString merged = TextNormalizer::fixDigitConfusions(joinLines(lines, i, end + 1));
            if (!matchesAny(merged, m_terms.per100g)) {
                break;
            }
            ++end;
        }

        if (end > i) {
            lines[i] = joinLines(lines, i, end);
            lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                        lines.begin() + static_cast<std::ptrdiff_t>(end) + 1);
        }
        return static_cast<int>(i);
    }
    return -1;
}

// ── Labels and values ───────────────────────────────────────

std::optional<NutritionKey> NutritionParser::labelKey(const QString& line) const
{
    std::optional<NutritionKey> bestKey;
    double bestScore = 0.0;

    // Strict '<' keeps the earlier key on ties
    for (NutritionKey key : allNutritionKeys()) {
        const std::optional<double> score = m_matcher.score(line, m_terms.nutritionTerms(key));
        if (!score.has_value() || *score > m_settings.fuzzyThreshold) {
            continue;
        }
        if (!bestKey.has_value() || *score < bestScore) {
            bestKey = key;
            bestScore = *score;
        }
    }
    return bestKey;
}

bool NutritionParser::isLabel(const QString& line) const
{
    return labelKey(line).has_value();
}

std::vector<QString> NutritionParser::extractLabels(const std::vector<QString>& lines,
                                                    int anchor) const
{
    std::vector<QString> labels;
    for (int i = 0; i <= anchor && i < static_cast<int>(lines.size()); ++i) {
        if (isLabel(lines[static_cast<size_t>(i)])) {
            labels.push_back(lines[static_cast<size_t>(i)]);
        }
    }

    if (labels.empty()) {
        for (size_t i = static_cast<size_t>(anchor) + 1; i < lines.size(); ++i) {
            if (isLabel(lines[i])) {
                labels.push_back(lines[i]);
            }
        }
    }

    // A single "Energy" label usually heads both the kJ and the kcal value
    int energyCount = 0;
    int energyIndex = -1;
    const QStringList energyTerms = m_terms.nutritionTerms(NutritionKey::EnergyKcal);
    for (int i = 0; i < static_cast<int>(labels.size()); ++i) {
        if (matchesAny(labels[static_cast<size_t>(i)], energyTerms)) {
            ++energyCount;
            energyIndex = i;
        }
    }
    if (energyCount == 1) {
        const QString label = labels[static_cast<size_t>(energyIndex)];
        labels.insert(labels.begin() + energyIndex + 1, label);
    }

    return labels;
}

std::vector<QString> NutritionParser::extractValues(const std::vector<QString>& lines,
                                                    int anchor) const
{
    std::vector<QString> values;
    for (size_t i = static_cast<size_t>(anchor) + 1; i < lines.size(); ++i) {
        if (matchesAny(lines[i], m_terms.perPortion)) {
            break;
        }
        if (isLabel(lines[i])) {
            continue;
        }
        values.push_back(lines[i]);
    }
    return values;
}

// ── Values ──────────────────────────────────────────────────

std::optional<double> NutritionParser::parseValue(const QString& text, double maxValue)
{
    static const QRegularExpression aside(QStringLiteral("\\([^)]*\\)"));
    static const QRegularExpression leadingI(QStringLiteral("^I(\\d)"));
    static const QRegularExpression startsWithLetter(QStringLiteral("^[a-zA-Z]"));
    static const QRegularExpression letterBetweenDigits(QStringLiteral("\\d[a-zA-Z].*\\d"));
    static const QRegularExpression trailingLetters(QStringLiteral("[a-zA-Z]+$"));
    static const QRegularExpression numeric(QStringLiteral("^[\\d.\\s]+$"));

    QString cleaned = text.trimmed();
    cleaned.remove(aside);
    cleaned = cleaned.simplified();
    cleaned.replace(leadingI, QStringLiteral("1\\1"));

    if (startsWithLetter.match(cleaned).hasMatch()
        || letterBetweenDigits.match(cleaned).hasMatch()) {
        return std::nullopt;
    }

    QString number;
    if (trailingLetters.match(cleaned).hasMatch()) {
        number = QString(cleaned).remove(trailingLetters).trimmed();
    } else if (cleaned.size() > 1) {
        // No unit: OCR read the trailing 'g' as a digit
        number = cleaned.left(cleaned.size() - 1);
    } else {
        return std::nullopt;
    }

    number.replace(QLatin1Char(','), QLatin1Char('.'));
    if (!numeric.match(number).hasMatch()) {
        return std::nullopt;
    }

    const QString firstToken = number.trimmed().section(QLatin1Char(' '), 0, 0);
    bool ok = false;
    const double value = firstToken.toDouble(&ok);
    if (!ok || value < 0.0 || value > maxValue) {
        return std::nullopt;
    }

    return std::round(value * 100.0) / 100.0;
}

void NutritionParser::assignEnergy(NutritionRecord& record, double value) const
{
    const std::optional<double> kcal = record.value(NutritionKey::EnergyKcal);
    const std::optional<double> kj = record.value(NutritionKey::EnergyKj);

    // The smaller of two energy values is the kcal one
    if (kcal.has_value()) {
        if (value < *kcal) {
            record.set(NutritionKey::EnergyKj, *kcal);
            record.set(NutritionKey::EnergyKcal, value);
        } else {
            record.set(NutritionKey::EnergyKj, value);
        }
    } else if (kj.has_value()) {
        if (value > *kj) {
            record.set(NutritionKey::EnergyKcal, *kj);
            record.set(NutritionKey::EnergyKj, value);
        } else {
            record.set(NutritionKey::EnergyKcal, value);
        }
    } else {
        record.set(value < m_settings.energyKcalCeiling ? NutritionKey::EnergyKcal
                                                        : NutritionKey::EnergyKj,
                   value);
    }
}

// ── Pipeline ────────────────────────────────────────────────

NutritionRecord NutritionParser::parse(const std::vector<QString>& input) const
{
    std::vector<QString> lines;
    lines.reserve(input.size());
    for (const QString& line : input) {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty()) {
            lines.push_back(trimmed);
        }
    }

    const int anchor = findPer100gIndex(lines);
    if (anchor < 0) {
        LOG_INFO(rsParse, "No per-100 g anchor found in %d nutrition lines",
                 static_cast<int>(lines.size()));
        return NutritionRecord();
    }

    const std::vector<QString> labels = extractLabels(lines, anchor);
    std::vector<QString> values = extractValues(lines, anchor);

    LOG_DEBUG(rsParse, "Nutrition anchor at %d: %d labels, %d values", anchor,
              static_cast<int>(labels.size()), static_cast<int>(values.size()));

    if (values.size() < labels.size()) {
        LOG_INFO(rsParse, "Fewer nutrition values (%d) than labels (%d)",
                 static_cast<int>(values.size()), static_cast<int>(labels.size()));
        return NutritionRecord();
    }
    values.resize(labels.size());

    NutritionRecord record;
    for (size_t i = 0; i < labels.size(); ++i) {
        const std::optional<NutritionKey> key = labelKey(labels[i]);
        if (!key.has_value()) {
            LOG_INFO(rsParse, "Label '%s' not found in nutrition terms", qUtf8Printable(labels[i]));
            continue;
        }

        const std::optional<double> value = parseValue(values[i], m_settings.maxNutritionValue);
        if (!value.has_value()) {
            LOG_INFO(rsParse, "Value '%s' could not be converted to a number",
                     qUtf8Printable(values[i]));
            continue;
        }

        if (*key == NutritionKey::EnergyKcal || *key == NutritionKey::EnergyKj) {
            assignEnergy(record, *value);
        } else {
            record.set(*key, *value);
        }
    }

    return record;
}

} // namespace rs
