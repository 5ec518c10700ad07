#include "core/matching/edit_distance_matcher.h"

#include <QVector>

#include <algorithm>

namespace rs {

QString EditDistanceMatcher::foldForMatching(const QString& text)
{
    const QString decomposed = text.normalized(QString::NormalizationForm_D);

    QString folded;
    folded.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        if (ch.category() == QChar::Mark_NonSpacing) {
            continue;
        }
        folded.append(ch.toLower());
    }
    return folded.simplified();
}

int EditDistanceMatcher::substringDistance(const QString& pattern, const QString& text)
{
    const int pLen = pattern.size();
    const int tLen = text.size();

    if (pLen == 0) {
        return 0;
    }
    if (tLen == 0) {
        return pLen;
    }

    // Optimal string alignment with a free start and end in text:
    // row 0 is all zeros and the answer is the minimum of the last row.
    QVector<int> prevPrev(tLen + 1, 0);
    QVector<int> prev(tLen + 1, 0);
    QVector<int> curr(tLen + 1, 0);

    for (int i = 1; i <= pLen; ++i) {
        curr[0] = i;

        for (int j = 1; j <= tLen; ++j) {
            const int cost = (pattern[i - 1] == text[j - 1]) ? 0 : 1;
            const int deletion = prev[j] + 1;
            const int insertion = curr[j - 1] + 1;
            const int substitution = prev[j - 1] + cost;
            curr[j] = std::min({deletion, insertion, substitution});

            if (i > 1 && j > 1 && pattern[i - 1] == text[j - 2]
                && pattern[i - 2] == text[j - 1]) {
                curr[j] = std::min(curr[j], prevPrev[j - 2] + 1);
            }
        }

        prevPrev.swap(prev);
        prev.swap(curr);
    }

    return *std::min_element(prev.constBegin(), prev.constEnd());
}

std::optional<double> EditDistanceMatcher::score(const QString& candidate,
                                                 const QStringList& terms) const
{
    const QString folded = foldForMatching(candidate);
    if (folded.size() < kMinCandidateLength || terms.isEmpty()) {
        return std::nullopt;
    }

    std::optional<double> best;
    for (const QString& term : terms) {
        const int dist = substringDistance(folded, foldForMatching(term));
        const double ratio = static_cast<double>(dist) / static_cast<double>(folded.size());
        if (!best.has_value() || ratio < *best) {
            best = ratio;
        }
        if (*best == 0.0) {
            break;
        }
    }
    return best;
}

} // namespace rs
