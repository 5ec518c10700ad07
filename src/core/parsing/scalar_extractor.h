#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>
#include <vector>

namespace rs {

struct PersonsAndTime {
    double persons = 0.0;
    double time = 0.0;

    bool operator==(const PersonsAndTime& other) const
    {
        return persons == other.persons && time == other.time;
    }
};

// What a persons/time card yielded. Exactly one payload is populated,
// selected by kind.
struct ScalarReading {
    enum class Kind {
        None,
        Single,
        List,
        Pairs,
    };

    Kind kind = Kind::None;
    std::vector<double> values;        // Single (one entry) and List
    std::vector<PersonsAndTime> pairs; // Pairs
};

// ScalarExtractor -- reads serving counts and durations from short
// fragments such as "2 p" or "30 min".
//
// Lines holding a 'p' are persons candidates, lines holding an 'm' are
// time candidates. Equal counts of both pair up; otherwise persons win.
class ScalarExtractor {
public:
    static ScalarReading extract(const std::vector<QString>& lines);

    // First numeric token, ',' or '.' as decimal separator.
    // "2,5 cups" -> 2.5
    static std::optional<double> leadingNumber(const QString& fragment);

private:
    static ScalarReading numbersOf(const std::vector<QString>& fragments);
};

} // namespace rs
