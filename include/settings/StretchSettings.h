// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_STRETCH_SETTINGS_H
#define SETTINGS_STRETCH_SETTINGS_H

#include "settings/types/Ratio.h"

#include <optional>

namespace stretch
{
class Settings;

/*!
 * \brief The typed configuration of a stretch run.
 *
 * All stretch magnitudes and distances are ratios of the edge width that is
 * found in the program (or the default edge width if the program declares none).
 */
struct StretchSettings
{
    bool activate_stretch = true;

    //! Maximum stretch of loop (inner shell) threads.
    Ratio loop_stretch_ratio = 0.11;

    //! Maximum stretch of threads which are not loops, like infill.
    Ratio path_stretch_ratio = 0.0;

    //! Maximum stretch of the inside edge thread. This is the most important setting.
    Ratio edge_inside_stretch_ratio = 0.32;

    //! Maximum stretch of the outside edge thread.
    Ratio edge_outside_stretch_ratio = 0.1;

    Ratio cross_limit_distance_ratio = 5.0;

    //! Distance ahead and behind a turning point at which the thread direction is read.
    Ratio stretch_lookahead_ratio = 2.0;

    double default_edge_width = 0.4; //!< mm
    double default_feed_rate = 959.0; //!< mm/min
    unsigned int output_coordinate_precision = 3;
    unsigned int output_feed_rate_precision = 1;

    /*!
     * Layers at or below this height are ignored when checking that the
     * program has a usable height. No check is made if it is not set.
     */
    std::optional<double> min_z_change;

    /*!
     * \brief Read the settings that are present in \p settings, keeping the
     * defaults for the others.
     *
     * \throws exceptions::InvalidSettingException if a ratio or distance is
     * negative or a value cannot be parsed.
     */
    static StretchSettings fromSettings(const Settings& settings);
};

} // namespace stretch

#endif // SETTINGS_STRETCH_SETTINGS_H
