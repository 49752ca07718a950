// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef STRETCH_FILTER_H
#define STRETCH_FILTER_H

#include "ProgramFilter.h"
#include "compensation/FeatureState.h"
#include "settings/StretchSettings.h"

#include <cstddef>

namespace stretch
{
class GCodeEmitter;
class StretchComputer;
struct Layer;

/*!
 * \brief Numbers about the last run of a StretchFilter.
 */
struct StretchStatistics
{
    size_t lines = 0; //!< Lines written.
    size_t stretched_moves = 0;
    double maximum_displacement = 0.0; //!< mm
    double edge_width = 0.0; //!< The edge width the distances were derived from.
};

/*!
 * \brief Stretches threads to compensate for the contraction of the filament
 * after it is extruded.
 *
 * Extruded holes come out smaller than designed, and corners sharper. This
 * filter pushes every linear move of an extruding thread outwards from the
 * centre of the curve the thread follows, by at most the maximum stretch of
 * the feature the thread belongs to.
 *
 * The lines of the initialization block at the start of the program are
 * passed through; the edge width declared there sets the scale of all stretch
 * distances. A program without the end of an initialization block is passed
 * through entirely.
 */
class StretchFilter : public ProgramFilter
{
public:
    explicit StretchFilter(const StretchSettings& settings);

    std::string_view getName() const override
    {
        return "stretch";
    }

    /*!
     * \throws exceptions::InsufficientHeightException if a minimum height is
     * configured and the program has no usable height.
     * \throws exceptions::InvalidSettingException if the distances derived
     * from the edge width are unusable.
     */
    void apply(const Program& program, std::ostream& output) override;

    /*!
     * \brief Process the line at \p index of \p layer in the given state.
     *
     * A linear move that qualifies is replaced by the stretched move, all other
     * lines are passed through.
     * \return The state after the line.
     */
    FeatureState processLine(const FeatureState& state, const Layer& layer, const size_t index, const StretchComputer& computer, GCodeEmitter& emitter);

    /*!
     * \brief Find the edge width declared in the initialization block of
     * \p program, or \p default_edge_width if it declares none.
     */
    static double findEdgeWidth(const Program& program, const double default_edge_width);

    const StretchStatistics& getStatistics() const
    {
        return statistics_;
    }

private:
    StretchSettings settings_;
    StretchStatistics statistics_;
};

} // namespace stretch

#endif // STRETCH_FILTER_H
