#include "core/parsing/ingredient_table_parser.h"
#include "core/parsing/block_order_detector.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <cstddef>

namespace rs {

namespace {

const QRegularExpression& whitespace()
{
    static const QRegularExpression ws(QStringLiteral("\\s+"));
    return ws;
}

// A data line holding several values ("200 100") is several tokens.
void appendQuantityTokens(const QString& line, std::vector<QString>& out)
{
    const QString trimmed = line.trimmed();
    if (!trimmed.contains(QLatin1Char(' '))) {
        out.push_back(trimmed);
        return;
    }
    const QStringList parts = trimmed.split(whitespace(), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        out.push_back(part);
    }
}

void fitToCount(std::vector<QString>& quantities, int count)
{
    quantities.resize(static_cast<size_t>(std::max(count, 0)));
}

} // anonymous namespace

IngredientTableParser::IngredientTableParser(const ExtractionSettings& settings)
    : m_settings(settings)
{
}

// ── Pipeline ────────────────────────────────────────────────

std::vector<IngredientRecord> IngredientTableParser::parse(const std::vector<QString>& lines) const
{
    if (lines.empty()) {
        return {};
    }

    const std::optional<BlockOrder> order =
        BlockOrderDetector::detect(lines, m_settings.reversedOrderThreshold);
    if (!order.has_value()) {
        LOG_DEBUG(rsParse, "No serving marker found, reading %d lines as names/quantities halves",
                  static_cast<int>(lines.size()));
        return parseWithoutHeader(lines);
    }

    LOG_DEBUG(rsParse, "Ingredient table: %d header lines, %d data lines (reversed=%d)",
              static_cast<int>(order->names.size()),
              static_cast<int>(order->data.size()),
              order->reversed ? 1 : 0);

    std::vector<IngredientRecord> ingredients = parseHeaders(order->names);
    const std::vector<IngredientGroup> groups =
        buildGroups(order->data, static_cast<int>(ingredients.size()));
    const std::vector<IngredientGroup> kept = correctSuspiciousGroups(ingredients, groups);
    assignQuantities(kept, ingredients);
    return ingredients;
}

// ── Headers ─────────────────────────────────────────────────

std::vector<IngredientRecord> IngredientTableParser::parseHeaders(
    const std::vector<QString>& headers)
{
    static const QRegularExpression parenGroup(QStringLiteral("\\(([^)]*)\\)"));

    std::vector<IngredientRecord> ingredients;
    ingredients.reserve(headers.size());

    for (const QString& header : headers) {
        IngredientRecord record;

        QStringList inner;
        QRegularExpressionMatchIterator it = parenGroup.globalMatch(header);
        while (it.hasNext()) {
            inner.append(it.next().captured(1));
        }

        if (inner.isEmpty()) {
            record.name = header.trimmed();
            ingredients.push_back(record);
            continue;
        }

        record.unit = inner.front();

        QStringList notes;
        for (int i = 1; i < inner.size(); ++i) {
            if (!inner[i].trimmed().isEmpty()) {
                notes.append(inner[i]);
            }
        }
        if (!notes.isEmpty()) {
            record.note = notes.join(QStringLiteral(", "));
        }

        record.name = QString(header).remove(parenGroup).trimmed();
        ingredients.push_back(record);
    }

    return ingredients;
}

// ── Groups ──────────────────────────────────────────────────

std::vector<IngredientGroup> IngredientTableParser::buildGroups(
    const std::vector<QString>& dataLines, int ingredientCount)
{
    std::vector<QString> markers;
    std::vector<QString> quantities;
    for (const QString& line : dataLines) {
        if (BlockOrderDetector::isServingMarker(line)) {
            markers.push_back(line.trimmed());
        } else {
            appendQuantityTokens(line, quantities);
        }
    }

    // Positions of the markers, ordered by serving count
    std::vector<int> sortedPositions(markers.size());
    for (size_t i = 0; i < markers.size(); ++i) {
        sortedPositions[i] = static_cast<int>(i);
    }
    std::stable_sort(sortedPositions.begin(), sortedPositions.end(), [&markers](int a, int b) {
        return servingsFromMarker(markers[static_cast<size_t>(a)])
               < servingsFromMarker(markers[static_cast<size_t>(b)]);
    });

    bool outOfOrder = false;
    for (size_t i = 0; i < sortedPositions.size(); ++i) {
        if (sortedPositions[i] != static_cast<int>(i)) {
            outOfOrder = true;
            break;
        }
    }

    std::vector<IngredientGroup> groups;

    if (outOfOrder) {
        // The recognizer reordered the marker column but not the values:
        // each marker's quantities sit at its original position.
        LOG_DEBUG(rsParse, "Serving markers out of order, redistributing %d quantities",
                  static_cast<int>(quantities.size()));
        for (int position : sortedPositions) {
            IngredientGroup group;
            group.marker = markers[static_cast<size_t>(position)];
            const size_t start = static_cast<size_t>(position) * static_cast<size_t>(ingredientCount);
            for (size_t k = start; k < start + static_cast<size_t>(ingredientCount)
                                   && k < quantities.size(); ++k) {
                group.quantities.push_back(quantities[k]);
            }
            fitToCount(group.quantities, ingredientCount);
            groups.push_back(group);
        }
        return groups;
    }

    IngredientGroup current;
    bool open = false;
    for (const QString& line : dataLines) {
        if (BlockOrderDetector::isServingMarker(line)) {
            if (open) {
                fitToCount(current.quantities, ingredientCount);
                groups.push_back(current);
                current = IngredientGroup();
            }
            current.marker = line.trimmed();
            open = true;
        } else {
            appendQuantityTokens(line, current.quantities);
        }
    }
    if (open) {
        fitToCount(current.quantities, ingredientCount);
        groups.push_back(current);
    }

    return groups;
}

// ── Suspicion correction ────────────────────────────────────

bool IngredientTableParser::isSuspicious(const QString& quantity, const QString& unit) const
{
    if (quantity.isEmpty()) {
        return true;
    }
    if (!unit.isEmpty()) {
        return false;
    }

    static const QRegularExpression notNumeric(QStringLiteral("[^\\d.]"));
    QString digits = quantity;
    digits.replace(QLatin1Char(','), QLatin1Char('.'));
    digits.remove(notNumeric);

    bool ok = false;
    const double value = digits.toDouble(&ok);
    return ok && value > m_settings.suspiciousQuantityThreshold;
}

int IngredientTableParser::firstSuspiciousIndex(
    const IngredientGroup& group, const std::vector<IngredientRecord>& ingredients) const
{
    for (size_t i = 0; i < ingredients.size(); ++i) {
        const QString quantity = i < group.quantities.size() ? group.quantities[i] : QString();
        if (isSuspicious(quantity, ingredients[i].unit)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool IngredientTableParser::canMerge(int index, const IngredientGroup& firstGroup,
                                     const std::vector<IngredientRecord>& ingredients) const
{
    if (index + 1 >= static_cast<int>(ingredients.size())) {
        return false;
    }

    std::vector<IngredientRecord> merged = ingredients;
    mergeAdjacent(merged, index);

    const size_t limit = std::min(firstGroup.quantities.size(), merged.size());
    for (size_t k = static_cast<size_t>(index) + 1; k < limit; ++k) {
        if (isSuspicious(firstGroup.quantities[k], merged[k].unit)) {
            return false;
        }
    }
    return true;
}

void IngredientTableParser::mergeAdjacent(std::vector<IngredientRecord>& ingredients, int index)
{
    IngredientRecord& current = ingredients[static_cast<size_t>(index)];
    const IngredientRecord& next = ingredients[static_cast<size_t>(index) + 1];

    current.name = (current.name + QLatin1Char(' ') + next.name).trimmed();
    current.unit += next.unit;
    if (next.note.has_value()) {
        current.note = current.note.has_value()
                           ? *current.note + QStringLiteral(", ") + *next.note
                           : *next.note;
    }
    ingredients.erase(ingredients.begin() + index + 1);
}

std::vector<IngredientGroup> IngredientTableParser::correctSuspiciousGroups(
    std::vector<IngredientRecord>& ingredients, const std::vector<IngredientGroup>& groups) const
{
    if (groups.empty()) {
        return {};
    }

    const IngredientGroup& firstGroup = groups.front();
    int suspicious = firstSuspiciousIndex(firstGroup, ingredients);
    while (suspicious >= 0) {
        if (!canMerge(suspicious, firstGroup, ingredients)) {
            const size_t i = static_cast<size_t>(suspicious);
            LOG_WARN(rsParse, "Cannot merge ingredient '%s' with '%s'",
                     qUtf8Printable(ingredients[i].name),
                     i + 1 < ingredients.size() ? qUtf8Printable(ingredients[i + 1].name)
                                                : "<none>");
            break;
        }
        LOG_DEBUG(rsParse, "Merging split ingredient headers at %d", suspicious);
        mergeAdjacent(ingredients, suspicious);
        suspicious = firstSuspiciousIndex(firstGroup, ingredients);
    }

    std::vector<IngredientGroup> kept;
    kept.push_back(firstGroup);
    for (size_t g = 1; g < groups.size(); ++g) {
        if (firstSuspiciousIndex(groups[g], ingredients) < 0) {
            kept.push_back(groups[g]);
        } else {
            LOG_WARN(rsParse, "Dropping ingredient group '%s': suspicious quantities",
                     qUtf8Printable(groups[g].marker));
        }
    }
    return kept;
}

// ── Assignment ──────────────────────────────────────────────

int IngredientTableParser::servingsFromMarker(const QString& marker)
{
    static const QRegularExpression count(QStringLiteral("(\\d+)\\s*p\\s*$"),
                                          QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = count.match(marker);
    if (!match.hasMatch()) {
        return kUnknownServings;
    }
    bool ok = false;
    const int servings = match.captured(1).toInt(&ok);
    return ok ? servings : kUnknownServings;
}

void IngredientTableParser::assignQuantities(const std::vector<IngredientGroup>& groups,
                                             std::vector<IngredientRecord>& ingredients)
{
    for (const IngredientGroup& group : groups) {
        const int servings = servingsFromMarker(group.marker);
        for (size_t i = 0; i < ingredients.size(); ++i) {
            const QString quantity = i < group.quantities.size() ? group.quantities[i] : QString();
            ingredients[i].quantityPerServings.push_back({servings, quantity});
        }
    }
}

// ── No-header fallback ──────────────────────────────────────

std::vector<IngredientRecord> IngredientTableParser::parseWithoutHeader(
    const std::vector<QString>& lines)
{
    if (lines.empty()) {
        return {};
    }

    const size_t mid = lines.size() / 2;
    std::vector<QString> names(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(mid));
    std::vector<QString> quantities(lines.begin() + static_cast<std::ptrdiff_t>(mid), lines.end());

    if (!names.empty() && !names.front().isEmpty() && names.front().front().isDigit()) {
        std::swap(names, quantities);
    }

    std::vector<IngredientRecord> ingredients;
    const size_t count = std::min(names.size(), quantities.size());
    for (size_t i = 0; i < count; ++i) {
        const QStringList parts = quantities[i].split(whitespace(), Qt::SkipEmptyParts);

        IngredientRecord record;
        record.name = names[i];
        record.unit = parts.value(1);
        record.quantityPerServings.push_back({kUnknownServings, parts.value(0)});
        ingredients.push_back(record);
    }
    return ingredients;
}

} // namespace rs
