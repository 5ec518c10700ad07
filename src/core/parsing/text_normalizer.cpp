#include "core/parsing/text_normalizer.h"

#include <QRegularExpression>

namespace rs {

std::vector<QString> TextNormalizer::normalizeLines(const RecognizedDocument& document,
                                                    const QStringList& boxHeaders,
                                                    const QStringList& servingsSuffixes)
{
    return normalizeLines(document.allLines(), boxHeaders, servingsSuffixes);
}

std::vector<QString> TextNormalizer::normalizeLines(const std::vector<QString>& lines,
                                                    const QStringList& boxHeaders,
                                                    const QStringList& servingsSuffixes)
{
    std::vector<QString> result;
    result.reserve(lines.size());

    size_t start = 0;
    if (!lines.empty() && containsAnyPhrase(lines.front(), boxHeaders)) {
        start = 1;
    }

    for (size_t i = start; i < lines.size(); ++i) {
        const QString trimmed = lines[i].trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }

        if (isSuffixOnlyLine(trimmed, servingsSuffixes)) {
            // OCR split "2" and "pers." onto separate lines
            if (!result.empty()) {
                result.back().append(QLatin1Char('p'));
            }
            continue;
        }

        result.push_back(fixDigitConfusions(trimmed));
    }

    return result;
}

QString TextNormalizer::fixDigitConfusions(const QString& line)
{
    static const QRegularExpression confusedZero(QStringLiteral("(?<=\\d)O|O(?=\\d)"));

    QString fixed = line;
    // A run like "1OO" needs one pass per O.
    for (;;) {
        const QString next = QString(fixed).replace(confusedZero, QStringLiteral("0"));
        if (next == fixed) {
            break;
        }
        fixed = next;
    }
    return fixed;
}

bool TextNormalizer::containsAnyPhrase(const QString& line, const QStringList& phrases)
{
    for (const QString& phrase : phrases) {
        if (!phrase.isEmpty() && line.contains(phrase, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

bool TextNormalizer::isSuffixOnlyLine(const QString& line, const QStringList& servingsSuffixes)
{
    if (servingsSuffixes.isEmpty()) {
        return false;
    }

    for (const QString& suffix : servingsSuffixes) {
        if (line.compare(suffix, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }

    const QStringList tokens = line.split(QRegularExpression(QStringLiteral("\\s+")),
                                          Qt::SkipEmptyParts);
    if (tokens.isEmpty()) {
        return false;
    }
    for (const QString& token : tokens) {
        if (!servingsSuffixes.contains(token, Qt::CaseInsensitive)) {
            return false;
        }
    }
    return true;
}

} // namespace rs
