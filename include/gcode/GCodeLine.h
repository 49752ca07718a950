// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef GCODE_GCODE_LINE_H
#define GCODE_GCODE_LINE_H

#include "utils/Point3D.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace stretch
{

/*!
 * \brief The kind of command a line holds, as far as the stretch engine cares.
 */
enum class CommandType
{
    NONE, //!< Empty line, pure comment or a command that is passed through opaquely.
    RAPID_MOVE, //!< G0
    LINEAR_MOVE, //!< G1
    ARC_MOVE, //!< G2 or G3
    EXTRUDER_ON, //!< M101
    EXTRUDER_OFF, //!< M103
};

/*!
 * \brief Marker comments that structure the program.
 */
enum class MarkerType
{
    NONE,
    LAYER_START, //!< "(<layer> z )" or ";LAYER:n"
    LOOP_BEGIN, //!< "(<loop>"
    LOOP_END, //!< "(</loop>)"
    INNER_EDGE_BEGIN, //!< "(<edge>" not tagged outer
    OUTER_EDGE_BEGIN, //!< "(<edge> outer"
    EDGE_END, //!< "(</edge>)"
    EDGE_WIDTH, //!< "(<edgeWidth> w )"
    INITIALIZATION_END, //!< "(</extruderInitialization>)"
};

/*!
 * \brief One parsed line of a program.
 *
 * A line is never changed after parsing. The location is absolute: fields
 * that the line does not specify are carried forward from the location before
 * the line.
 */
struct GCodeLine
{
    std::string raw; //!< The line as it appeared in the input, without line ending.
    std::string command; //!< First word of the line, before any comment. Empty for comments.
    CommandType type = CommandType::NONE;
    MarkerType marker = MarkerType::NONE;
    size_t line_nr = 0; //!< 1-based line number in the parsed text.

    Point3D location; //!< Location of the machine after this line.

    std::optional<double> x; //!< The explicit X field, if any.
    std::optional<double> y;
    std::optional<double> z;
    std::optional<double> e;
    std::optional<double> f; //!< Explicit feed rate, in mm/min.

    std::optional<double> marker_value; //!< Number carried by a layer or edge width marker.
    std::string comment; //!< Trailing comment after the command, including its delimiter.

    /*!
     * \brief Parse a line of text.
     *
     * A numeric field that cannot be parsed is logged as malformed input and
     * treated as absent, so the coordinate is carried forward.
     * \param raw The text of the line, without line ending.
     * \param previous_location The location of the machine before this line.
     * \param line_nr The line number, for diagnostics.
     */
    static GCodeLine parse(std::string_view raw, const Point3D& previous_location, const size_t line_nr = 0);

    /*!
     * Whether this is a linear move, the only moves that are stretched and traversed.
     */
    bool isLinearMove() const
    {
        return type == CommandType::LINEAR_MOVE;
    }

    /*!
     * Whether this line carries X/Y/Z/E/F fields.
     */
    bool isMove() const
    {
        return type == CommandType::RAPID_MOVE || type == CommandType::LINEAR_MOVE || type == CommandType::ARC_MOVE;
    }
};

} // namespace stretch

#endif // GCODE_GCODE_LINE_H
