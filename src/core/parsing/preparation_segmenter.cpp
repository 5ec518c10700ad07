#include "core/parsing/preparation_segmenter.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace rs {

namespace {

struct OrderedStep {
    PreparationStep step;
    int order = 0;
};

int firstLetterIndex(const QString& text)
{
    for (int i = 0; i < text.size(); ++i) {
        if (text[i].isLetter()) {
            return i;
        }
    }
    return -1;
}

bool isEmptyStep(const PreparationStep& step)
{
    return step.title.isEmpty() && step.description.isEmpty();
}

} // anonymous namespace

PreparationSegmenter::PreparationSegmenter(const ExtractionSettings& settings)
    : m_settings(settings)
{
}

// ── Classification ──────────────────────────────────────────

bool PreparationSegmenter::hasLetters(const QString& text)
{
    return firstLetterIndex(text) >= 0;
}

bool PreparationSegmenter::startsWithTimeValue(const QString& text)
{
    static const QRegularExpression timeValue(
        QStringLiteral("^\\d+\\s*(min|minutes?|h|hours?|sec|seconds?|mn)\\b"),
        QRegularExpression::CaseInsensitiveOption);
    return timeValue.match(text).hasMatch();
}

std::optional<int> PreparationSegmenter::stepNumber(const QString& text)
{
    if (text.isEmpty() || !text.front().isDigit() || startsWithTimeValue(text)) {
        return std::nullopt;
    }

    // Only the part before the first letter can hold the step number
    const int letter = firstLetterIndex(text);
    const QString head = letter >= 0 ? text.left(letter) : text;

    static const QRegularExpression integer(QStringLiteral("\\b\\d+\\b"));
    const QRegularExpressionMatch match = integer.match(head);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool ok = false;
    const int number = match.captured(0).toInt(&ok);
    if (!ok || number <= 0) {
        return std::nullopt;
    }
    return number;
}

bool PreparationSegmenter::isNumberOnly(const QString& text)
{
    return !text.isEmpty() && text.front().isDigit() && !hasLetters(text);
}

bool PreparationSegmenter::looksLikeTitle(const QString& text) const
{
    static const QRegularExpression digit(QStringLiteral("\\d"));

    return text.size() >= m_settings.minStepTitleLength
           && text.size() <= m_settings.maxStepTitleLength
           && !text.startsWith(QChar(0x2022))  // •
           && !text.startsWith(QLatin1Char('.'))
           && !text.contains(QLatin1Char('\n'))
           && !text.endsWith(QLatin1Char('.'))
           && !text.contains(digit)
           && text.front().isLetter() && text.front().isUpper();
}

// ── Formatting ──────────────────────────────────────────────

QString PreparationSegmenter::formatTitle(const QString& title)
{
    const QString trimmed = title.trimmed();
    const int letter = firstLetterIndex(trimmed);
    if (letter < 0) {
        return trimmed.toLower();
    }
    return trimmed.at(letter).toUpper() + trimmed.mid(letter + 1).toLower();
}

QString PreparationSegmenter::formatDescription(const QString& description)
{
    int i = 0;
    while (i < description.size()
           && !description[i].isLetterOrNumber()
           && description[i] != QLatin1Char('_')) {
        ++i;
    }
    if (i >= description.size() || !description[i].isUpper()) {
        return description;
    }

    QString formatted = description;
    formatted[i] = formatted[i].toLower();
    return formatted;
}

PreparationStep PreparationSegmenter::parseStepContent(const QString& text)
{
    static const QRegularExpression numberedLine(QStringLiteral("^\\d+\\.?\\s*(.+)$"));

    const int newline = text.indexOf(QLatin1Char('\n'));
    const QString firstLine = newline >= 0 ? text.left(newline) : text;
    const QString rest = newline >= 0 ? text.mid(newline + 1) : QString();

    const QRegularExpressionMatch match = numberedLine.match(firstLine);
    if (!match.hasMatch()) {
        return {formatTitle(text), QString()};
    }

    PreparationStep step;
    step.title = formatTitle(match.captured(1));
    if (!rest.isEmpty()) {
        step.description = formatDescription(rest);
    }
    return step;
}

// ── State machine ───────────────────────────────────────────

std::vector<PreparationStep> PreparationSegmenter::segment(const RecognizedDocument& document) const
{
    std::vector<OrderedStep> closed;
    std::optional<PreparationStep> current;
    int currentOrder = 0;
    std::vector<int> pendingNumbers;

    const auto closeCurrent = [&]() {
        if (current.has_value() && !isEmptyStep(*current)) {
            closed.push_back({*current, currentOrder});
        }
    };

    for (const TextBlock& block : document.blocks) {
        const QString text = block.text().trimmed();
        if (text.isEmpty()) {
            continue;
        }

        const std::optional<int> number = stepNumber(text);

        if (number.has_value() && isNumberOnly(text)) {
            pendingNumbers.push_back(*number);
        } else if (!hasLetters(text)) {
            LOG_DEBUG(rsParse, "Skipping preparation block without text: %s",
                      qUtf8Printable(text));
        } else if (number.has_value()) {
            closeCurrent();
            currentOrder = *number;
            current = parseStepContent(text);
        } else if (!pendingNumbers.empty() && looksLikeTitle(text)) {
            auto smallest = std::min_element(pendingNumbers.begin(), pendingNumbers.end());
            const int order = *smallest;
            pendingNumbers.erase(smallest);

            closeCurrent();
            currentOrder = order;
            current = PreparationStep{formatTitle(text), QString()};
        } else if (current.has_value()) {
            if (!current->description.isEmpty()) {
                current->description += QLatin1Char('\n');
            }
            current->description += text;
        } else {
            LOG_DEBUG(rsParse, "Dropping preparation text before any step: %s",
                      qUtf8Printable(text));
        }
    }
    closeCurrent();

    std::stable_sort(closed.begin(), closed.end(),
                     [](const OrderedStep& a, const OrderedStep& b) { return a.order < b.order; });

    std::vector<PreparationStep> steps;
    steps.reserve(closed.size());
    for (const OrderedStep& ordered : closed) {
        steps.push_back(ordered.step);
    }
    return steps;
}

} // namespace rs
