#include "core/parsing/block_order_detector.h"

#include <QRegularExpression>

namespace rs {

bool BlockOrderDetector::isServingMarker(const QString& line)
{
    static const QRegularExpression marker(QStringLiteral("\\d+\\s*p\\s*$"),
                                           QRegularExpression::CaseInsensitiveOption);
    return marker.match(line).hasMatch();
}

bool BlockOrderDetector::hasUnitGroup(const QString& line)
{
    static const QRegularExpression unitGroup(QStringLiteral("\\([^)]+\\)"));
    return unitGroup.match(line).hasMatch();
}

std::optional<BlockOrder> BlockOrderDetector::detect(const std::vector<QString>& lines,
                                                     int reversedOrderThreshold)
{
    int boundary = -1;
    for (int i = 0; i < static_cast<int>(lines.size()); ++i) {
        if (isServingMarker(lines[i])) {
            boundary = i;
            break;
        }
    }
    if (boundary < 0) {
        return std::nullopt;
    }

    BlockOrder order;
    order.boundary = boundary;

    if (boundary < reversedOrderThreshold) {
        int firstUnitLine = -1;
        for (int i = 0; i < static_cast<int>(lines.size()); ++i) {
            if (hasUnitGroup(lines[i])) {
                firstUnitLine = i;
                break;
            }
        }

        if (firstUnitLine > boundary) {
            order.reversed = true;
            order.names.assign(lines.begin() + firstUnitLine, lines.end());
            order.data.assign(lines.begin() + boundary, lines.begin() + firstUnitLine);
            return order;
        }
    }

    order.names.assign(lines.begin(), lines.begin() + boundary);
    order.data.assign(lines.begin() + boundary, lines.end());
    return order;
}

} // namespace rs
