// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef COMPENSATION_STRETCH_CONTEXT_H
#define COMPENSATION_STRETCH_CONTEXT_H

#include "compensation/FeatureState.h"

namespace stretch
{
struct StretchSettings;

/*!
 * \brief The absolute distances of a stretch run, derived from one edge width.
 *
 * All distances are in millimeters and never negative.
 */
struct StretchContext
{
    double edge_width = 0.0;

    /*!
     * Neighbouring points further away than this are on a straight stretch of
     * the thread, so only stretch along the thread is kept.
     */
    double cross_limit_distance = 0.0;

    /*!
     * Neighbouring points closer than this are not compared with at all.
     * One third of the cross limit distance.
     */
    double cross_limit_distance_fraction = 0.0;

    //! cross_limit_distance - cross_limit_distance_fraction
    double cross_limit_distance_remainder = 0.0;

    //! Distance along the thread at which its direction is read.
    double stretch_lookahead_distance = 0.0;

    double path_maximum_stretch = 0.0;
    double loop_maximum_stretch = 0.0;
    double edge_inside_maximum_stretch = 0.0;
    double edge_outside_maximum_stretch = 0.0;

    /*!
     * \brief Compute the distances for the given edge width.
     * \throws exceptions::InvalidSettingException if the edge width is not
     * positive, or if any feature is stretched while the lookahead distance is
     * zero.
     */
    static StretchContext create(const StretchSettings& settings, const double edge_width);

    /*!
     * The largest distance a move of the given feature may be displaced.
     */
    double maximumStretch(const FeatureKind kind) const;
};

} // namespace stretch

#endif // COMPENSATION_STRETCH_CONTEXT_H
