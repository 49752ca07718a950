// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef TEST_PROGRAMS_H
#define TEST_PROGRAMS_H

#include <string>
#include <vector>

namespace stretch
{

/*!
 * One layer with the edge of a square hole of 1x1mm at 0.4mm height.
 *
 * Line indices in the layer:
 *  2 is the move to the start of the edge, just before the extruder is
 *  switched on; 4 to 7 go around the square and 7 closes it at the start.
 */
inline std::vector<std::string> squareInnerEdgeLayer()
{
    return {
        "(<layer> 0.4 )",
        "(<edge> inner )",
        "G1 X0.0 Y0.0 Z0.4 F900.0",
        "M101",
        "G1 X1.0 Y0.0 Z0.4",
        "G1 X1.0 Y1.0 Z0.4",
        "G1 X0.0 Y1.0 Z0.4",
        "G1 X0.0 Y0.0 Z0.4",
        "M103",
        "(</edge>)",
    };
}

/*!
 * A straight line of extrusion along the X axis, from X0 to X3 in steps of 1mm.
 */
inline std::vector<std::string> straightPathLayer()
{
    return {
        "(<layer> 0.2 )",
        "G1 X0 Y0 Z0.2 F1200",
        "M101",
        "G1 X1 Y0",
        "G1 X2 Y0",
        "G1 X3 Y0",
        "M103",
    };
}

/*!
 * The end of an initialization block without any edge width declaration.
 * Nothing before it is stretched.
 */
inline std::vector<std::string> initializationEnd()
{
    return { "(</extruderInitialization>)" };
}

inline std::string joinLines(const std::vector<std::string>& lines)
{
    std::string text;
    for (const std::string& line : lines)
    {
        text += line;
        text += '\n';
    }
    return text;
}

} // namespace stretch

#endif // TEST_PROGRAMS_H
