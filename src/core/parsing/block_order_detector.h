#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace rs {

// Ingredient table split into header lines and data lines.
struct BlockOrder {
    std::vector<QString> names;
    std::vector<QString> data;
    bool reversed = false;
    int boundary = -1;  // index of the first serving-marker line
};

// BlockOrderDetector -- decides whether an ingredient table came out of
// the recognizer names-first or data-first.
//
// Some recognizers walk the table row by row, others column by column.
// A serving marker within the first few lines, followed later by a
// "(unit)" header line, means the data came first.
class BlockOrderDetector {
public:
    // Returns std::nullopt when no line is a serving marker.
    static std::optional<BlockOrder> detect(const std::vector<QString>& lines,
                                            int reversedOrderThreshold = 3);

    // "2p", "4 P", "Pour 2 p"
    static bool isServingMarker(const QString& line);

    // "Flour (g)"
    static bool hasUnitGroup(const QString& line);
};

} // namespace rs
