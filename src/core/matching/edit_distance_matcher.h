#pragma once

#include "core/matching/fuzzy_matcher.h"

namespace rs {

// EditDistanceMatcher -- scores a candidate by how closely it occurs
// anywhere inside a term.
//
// Both sides are lowercased and stripped of diacritics. The distance is
// the restricted Damerau-Levenshtein (optimal string alignment) distance
// between the candidate and the closest substring of the term, divided by
// the candidate length.
class EditDistanceMatcher : public FuzzyMatcher {
public:
    std::optional<double> score(const QString& candidate,
                                const QStringList& terms) const override;

    // Lowercase, decompose and drop combining marks, collapse whitespace.
    static QString foldForMatching(const QString& text);

    // Edit distance between pattern and the best-matching substring of text.
    static int substringDistance(const QString& pattern, const QString& text);

    // Candidates shorter than this are never scored.
    static constexpr int kMinCandidateLength = 2;
};

} // namespace rs
