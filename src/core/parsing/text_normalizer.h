#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace rs {

// TextNormalizer -- flattens recognised text into clean lines for the
// table parsers.
//
// Steps, in order:
//   1. Drop the first line if it contains a box-header phrase.
//   2. Fold a line made only of servings-suffix phrases ("pers.") into
//      the previous line as a 'p' marker suffix.
//   3. Drop blank lines.
//   4. Rewrite a capital O next to a digit as zero ("10O g" -> "100 g").
class TextNormalizer {
public:
    static std::vector<QString> normalizeLines(const RecognizedDocument& document,
                                               const QStringList& boxHeaders,
                                               const QStringList& servingsSuffixes);

    static std::vector<QString> normalizeLines(const std::vector<QString>& lines,
                                               const QStringList& boxHeaders,
                                               const QStringList& servingsSuffixes);

    static QString fixDigitConfusions(const QString& line);

    static bool containsAnyPhrase(const QString& line, const QStringList& phrases);
    static bool isSuffixOnlyLine(const QString& line, const QStringList& servingsSuffixes);
};

} // namespace rs
