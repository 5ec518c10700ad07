#include "core/parsing/scalar_extractor.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QStringList>

namespace rs {

namespace {

std::vector<QString> linesContaining(const std::vector<QString>& lines, QChar letter)
{
    std::vector<QString> matching;
    for (const QString& line : lines) {
        if (line.contains(letter, Qt::CaseInsensitive)
            && ScalarExtractor::leadingNumber(line).has_value()) {
            matching.push_back(line);
        }
    }
    return matching;
}

} // anonymous namespace

std::optional<double> ScalarExtractor::leadingNumber(const QString& fragment)
{
    static const QRegularExpression numberToken(QStringLiteral("\\d+(?:[.,]\\d+)?"));
    const QRegularExpressionMatch match = numberToken.match(fragment);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    QString token = match.captured(0);
    token.replace(QLatin1Char(','), QLatin1Char('.'));
    bool ok = false;
    const double value = token.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

ScalarReading ScalarExtractor::numbersOf(const std::vector<QString>& fragments)
{
    ScalarReading reading;
    for (const QString& fragment : fragments) {
        reading.values.push_back(*leadingNumber(fragment));
    }
    reading.kind = reading.values.size() > 1 ? ScalarReading::Kind::List
                                             : ScalarReading::Kind::Single;
    return reading;
}

ScalarReading ScalarExtractor::extract(const std::vector<QString>& lines)
{
    const std::vector<QString> persons = linesContaining(lines, QLatin1Char('p'));
    const std::vector<QString> times = linesContaining(lines, QLatin1Char('m'));

    if (!persons.empty()) {
        if (times.empty() || persons.size() != times.size()) {
            return numbersOf(persons);
        }

        ScalarReading reading;
        reading.kind = ScalarReading::Kind::Pairs;
        for (size_t i = 0; i < persons.size(); ++i) {
            reading.pairs.push_back({*leadingNumber(persons[i]), *leadingNumber(times[i])});
        }
        return reading;
    }

    if (!times.empty()) {
        return numbersOf(times);
    }

    QStringList joined;
    for (const QString& line : lines) {
        joined.append(line);
    }
    LOG_ERROR(rsParse, "Unable to read a number from: [%s]",
              qUtf8Printable(joined.join(QStringLiteral(" | "))));
    return ScalarReading();
}

} // namespace rs
