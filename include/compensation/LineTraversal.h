// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef COMPENSATION_LINE_TRAVERSAL_H
#define COMPENSATION_LINE_TRAVERSAL_H

#include "gcode/GCodeLine.h"

#include <cstddef>
#include <optional>
#include <span>

namespace stretch
{

enum class Direction : int
{
    FORWARD = 1,
    BACKWARD = -1,
};

/*!
 * \brief A cursor that walks the linear moves of one layer in one direction.
 *
 * Only linear moves are returned, other lines are skipped. The walk stays on
 * the current thread: it ends where the extruder is switched off (forward) or
 * where the moves before the extruder is switched on start (backward). On a
 * loop the walk wraps around to the other end of the thread instead, and it
 * ends when it comes back to where it started. A walk wraps at most once, so
 * no line is returned twice.
 *
 * The cursor only holds indices into the lines, which are not owned.
 */
class LineTraversal
{
public:
    /*!
     * \param lines The lines of the layer to walk.
     * \param start_index Index of the first line to look at. May be one past
     * either end of \p lines.
     * \param is_loop Whether the current thread is a closed loop.
     * \param direction Which way to walk.
     */
    LineTraversal(std::span<const GCodeLine> lines, const std::ptrdiff_t start_index, const bool is_loop, const Direction direction);

    /*!
     * \brief Get the index of the next linear move.
     * \return The index of the line in the layer, or an empty optional if the
     * traversal is exhausted. Once exhausted, it stays exhausted.
     */
    std::optional<size_t> next();

    /*!
     * \brief Get the next linear move.
     * \return The line, or nullptr if the traversal is exhausted.
     */
    const GCodeLine* nextLine();

private:
    /*!
     * Whether the line ends the thread in the direction of travel.
     */
    bool isThreadBoundary(const GCodeLine& line) const;

    /*!
     * Where to continue after wrapping around a loop: just after the extruder
     * was switched on (forward) or two lines before the extruder is switched
     * off (backward), which skips the move that closes the loop.
     */
    std::optional<std::ptrdiff_t> wrapIndex() const;

    /*!
     * Handle reaching the end of the thread. Returns false if the traversal is
     * exhausted.
     */
    bool wrapAround();

    std::optional<size_t> exhaust();

    std::span<const GCodeLine> lines_;
    std::ptrdiff_t index_;
    std::optional<std::ptrdiff_t> first_index_;
    bool is_loop_;
    Direction direction_;
    bool has_wrapped_ = false;
    bool exhausted_ = false;
};

/*!
 * \brief Whether the move at \p index is travelling towards the start of a
 * thread rather than being part of it: there are further moves between it and
 * the next extruder activation, and the extruder is not switched off first.
 *
 * If neither an activation nor a deactivation follows, the move is taken to be
 * part of the thread.
 */
bool isBeforeExtrusion(std::span<const GCodeLine> lines, const size_t index);

/*!
 * \brief Whether the extruder is switched on after the line at \p index before
 * any other linear move or deactivation.
 */
bool isJustBeforeExtrusion(std::span<const GCodeLine> lines, const size_t index);

} // namespace stretch

#endif // COMPENSATION_LINE_TRAVERSAL_H
