#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace rs {

// FuzzyMatcher -- approximate matching of OCR text against term lists.
//
// Scores are normalised to [0, 1]; 0 is an exact match.
class FuzzyMatcher {
public:
    virtual ~FuzzyMatcher() = default;

    // Best score of candidate against any of terms, or std::nullopt when
    // terms is empty or the candidate cannot be scored.
    virtual std::optional<double> score(const QString& candidate,
                                        const QStringList& terms) const = 0;

    bool isMatch(const QString& candidate, const QStringList& terms, double threshold) const
    {
        const std::optional<double> best = score(candidate, terms);
        return best.has_value() && *best <= threshold;
    }
};

} // namespace rs
