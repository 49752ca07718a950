// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "compensation/StretchComputer.h"

#include "compensation/LineTraversal.h"
#include "utils/math.h"

#include <cstddef>

namespace stretch
{

StretchComputer::StretchComputer(const StretchContext& context)
    : context_(context)
{
}

Point2D StretchComputer::relativeStretch(std::span<const GCodeLine> lines, const size_t index, const bool is_loop) const
{
    const Point2D location = lines[index].location.xy();
    const auto after = static_cast<std::ptrdiff_t>(index) + 1;
    const auto before = static_cast<std::ptrdiff_t>(index) - 1;

    LineTraversal forward(lines, after, is_loop, Direction::FORWARD);
    LineTraversal backward(lines, before, is_loop, Direction::BACKWARD);
    Point2D relative_stretch = (tangentEstimate(location, forward) + tangentEstimate(location, backward)) * damping;

    // The cross limit only looks at the neighbouring points, so it needs traversals of its own.
    LineTraversal cross_forward(lines, after, is_loop, Direction::FORWARD);
    LineTraversal cross_backward(lines, before, is_loop, Direction::BACKWARD);
    relative_stretch = crossLimit(relative_stretch, cross_forward, location);
    relative_stretch = crossLimit(relative_stretch, cross_backward, location);

    if (relative_stretch.vSize2() > 1.0)
    {
        relative_stretch = relative_stretch.normalized();
    }
    return relative_stretch;
}

Point2D StretchComputer::absoluteStretch(std::span<const GCodeLine> lines, const size_t index, const bool is_loop, const double maximum_stretch) const
{
    return relativeStretch(lines, index, is_loop) * maximum_stretch;
}

Point2D StretchComputer::tangentEstimate(const Point2D& location, LineTraversal& traversal) const
{
    const double lookahead = context_.stretch_lookahead_distance;
    Point2D last_point = location;
    double old_total_length = 0.0;
    while (const GCodeLine* line = traversal.nextLine())
    {
        const Point2D point = line->location.xy();
        const double segment_length = (point - last_point).vSize();
        const double total_length = old_total_length + segment_length;
        if (total_length >= lookahead && segment_length > 0.0)
        {
            const double ratio = (lookahead - old_total_length) / segment_length;
            const Point2D at_lookahead(lerp(last_point.x_, point.x_, ratio), lerp(last_point.y_, point.y_, ratio));
            return (location - at_lookahead).normalized();
        }
        last_point = point;
        old_total_length = total_length;
    }
    return (location - last_point).normalized();
}

Point2D StretchComputer::crossLimit(const Point2D& stretch, LineTraversal& traversal, const Point2D& location) const
{
    const GCodeLine* line = traversal.nextLine();
    if (! line)
    {
        return stretch;
    }
    const Point2D point_to_location = location - line->location.xy();
    const double distance = point_to_location.vSize();
    if (distance <= context_.cross_limit_distance_fraction)
    {
        return stretch;
    }
    const Point2D parallel_normal = point_to_location / distance;
    const Point2D parallel_stretch = parallel_normal * (parallel_normal * stretch);
    if (distance > context_.cross_limit_distance)
    {
        return parallel_stretch;
    }
    const Point2D cross_normal = parallel_normal.turnRight();
    const Point2D cross_stretch = cross_normal * (cross_normal * stretch);
    const double cross_portion = inverse_lerp_clamped(context_.cross_limit_distance_fraction, context_.cross_limit_distance, distance);
    return parallel_stretch + cross_stretch * cross_portion;
}

} // namespace stretch
