// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef COMPENSATION_FEATURE_STATE_H
#define COMPENSATION_FEATURE_STATE_H

#include <string_view>

namespace stretch
{
struct GCodeLine;

/*!
 * \brief The structural role of the thread that is being traced.
 */
enum class FeatureKind
{
    PATH, //!< Anything that is not a loop or an edge, like infill.
    LOOP, //!< Inner shells.
    INNER_EDGE, //!< Edge around a hole.
    OUTER_EDGE, //!< Outside edge of the part.
};

std::string_view toString(const FeatureKind kind);

/*!
 * \brief The state of the line scan: which feature is traced and whether the
 * extruder is on.
 *
 * The state is a plain value. Feed it every line in document order through
 * FeatureState::next to obtain the state after that line.
 */
struct FeatureState
{
    FeatureKind kind = FeatureKind::PATH;

    /*!
     * Whether the current thread is closed, so that traversal around it wraps.
     * Loops and both kinds of edges are closed.
     */
    bool is_loop = false;

    bool extruder_active = false;

    /*!
     * \brief The state after \p line has been processed.
     *
     * Switching the extruder off ends the thread and returns to the path state.
     * Markers that begin a loop or an edge change the feature, markers that end
     * them return to the path state. All other lines leave the state as it is.
     */
    [[nodiscard]] FeatureState next(const GCodeLine& line) const;

    bool operator==(const FeatureState&) const = default;
};

} // namespace stretch

#endif // COMPENSATION_FEATURE_STATE_H
