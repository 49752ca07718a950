// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef GCODE_PROGRAM_H
#define GCODE_PROGRAM_H

#include "gcode/GCodeLine.h"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace stretch
{

/*!
 * \brief The lines of one layer, in source order.
 *
 * A layer starts at a layer start marker (which is its first line); the lines
 * before the first marker of a program form a layer of their own.
 */
struct Layer
{
    size_t index = 0; //!< Index of this layer in the program it was parsed from.
    std::vector<GCodeLine> lines;

    /*!
     * Height of the layer: the z of its first move, or else the height given
     * by its layer marker.
     */
    std::optional<double> z;

    bool has_extrusion = false; //!< Whether the layer activates the extruder or has moves with an E field.

    std::span<const GCodeLine> view() const
    {
        return { lines.data(), lines.size() };
    }
};

/*!
 * \brief Lowest and highest layer heights of a program that extrude.
 */
struct ZBounds
{
    double zmin = 0.0;
    double zmax = 0.0;

    double span() const
    {
        return zmax - zmin;
    }
};

/*!
 * \brief A parsed program: its layers in source order.
 *
 * The program is read-only once parsed.
 */
class Program
{
public:
    Program() = default;

    /*!
     * \brief Parse the full text of a program.
     *
     * Both "\n" and "\r\n" line endings are accepted. A final line ending does
     * not start another (empty) line.
     */
    static Program fromText(std::string_view text);

    /*!
     * \brief Parse a program given as separate lines.
     */
    static Program fromLines(const std::vector<std::string>& lines);

    const std::vector<Layer>& layers() const
    {
        return layers_;
    }

    /*!
     * The total number of lines in all layers.
     */
    size_t lineCount() const;

    /*!
     * \brief Heights of the first and last layers with extrusion, if any layer extrudes.
     */
    std::optional<ZBounds> bounds() const;

    /*!
     * \brief Get the usable height of the program.
     *
     * The lowest usable layer is the first layer with extrusion that lies above
     * \p min_z_change. Lower layers are usually printed with special settings
     * for adhesion.
     * \throws exceptions::InsufficientHeightException if there is no such layer
     * or if it is not below the highest layer with extrusion.
     */
    ZBounds requireHeight(const double min_z_change) const;

    /*!
     * \brief A program of the layers \p first up to and including \p last.
     *
     * The lines keep the locations they were parsed with.
     * \throws std::out_of_range if the range is empty or outside this program.
     */
    Program subRange(const size_t first, const size_t last) const;

private:
    void addLine(GCodeLine&& line);

    std::vector<Layer> layers_;
};

} // namespace stretch

#endif // GCODE_PROGRAM_H
