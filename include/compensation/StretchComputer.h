// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef COMPENSATION_STRETCH_COMPUTER_H
#define COMPENSATION_STRETCH_COMPUTER_H

#include "compensation/StretchContext.h"
#include "gcode/GCodeLine.h"
#include "utils/Point2D.h"

#include <cstddef>
#include <span>

namespace stretch
{
class LineTraversal;

/*!
 * \brief Computes how far a turning point of a thread is pushed outwards.
 *
 * The direction of the thread is read at the lookahead distance ahead of and
 * behind the point. On a thread that curves consistently, like the edge of a
 * hole, both directions point away from the centre of the curve, so their sum
 * pushes the point outwards. On a straight thread they cancel.
 */
class StretchComputer
{
public:
    /*!
     * Damping applied to the sum of both direction estimates.
     */
    static constexpr double damping = 0.8;

    explicit StretchComputer(const StretchContext& context);

    /*!
     * \brief The stretch of the linear move at \p index relative to the
     * maximum stretch of its feature. Its length is at most 1.
     * \param lines The lines of the layer of the move.
     * \param index The index of the move in \p lines.
     * \param is_loop Whether the move is part of a closed thread.
     */
    Point2D relativeStretch(std::span<const GCodeLine> lines, const size_t index, const bool is_loop) const;

    /*!
     * \brief The displacement of the linear move at \p index, in millimeters.
     * Its length is at most \p maximum_stretch.
     */
    Point2D absoluteStretch(std::span<const GCodeLine> lines, const size_t index, const bool is_loop, const double maximum_stretch) const;

    /*!
     * \brief Estimate the direction of the thread at the lookahead distance.
     *
     * Walks the traversal until the length of the visited segments reaches the
     * lookahead distance and interpolates the point at exactly that distance.
     * \return The unit vector from that point towards \p location. If the
     * traversal is exhausted first, the unit vector from the last visited point
     * towards \p location, or the zero vector if no point was visited.
     */
    Point2D tangentEstimate(const Point2D& location, LineTraversal& traversal) const;

    /*!
     * \brief Limit the stretch sideways to the next point of the traversal.
     *
     * A next point closer than a third of the cross limit distance is not
     * compared with, so the stretch is unchanged. Further than the cross limit
     * distance the thread is straight there, so only the part of the stretch
     * along the direction to that point is kept. In between, the part across
     * that direction is scaled linearly from nothing at a third of the cross
     * limit distance to all of it at the cross limit distance.
     */
    Point2D crossLimit(const Point2D& stretch, LineTraversal& traversal, const Point2D& location) const;

    const StretchContext& context() const
    {
        return context_;
    }

private:
    StretchContext context_;
};

} // namespace stretch

#endif // COMPENSATION_STRETCH_COMPUTER_H
