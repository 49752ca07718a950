// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "StretchFilter.h"
#include "TestPrograms.h"
#include "gcode/Program.h"

#include <gtest/gtest.h>

#include <sstream>

// NOLINTBEGIN(*-magic-numbers)
namespace stretch
{

/*
 * Runs whole programs through the stretch filter and compares the parsed
 * output with the parsed input, line by line.
 */
class StretchScenarioTest : public testing::Test
{
public:
    StretchSettings settings;
    StretchStatistics statistics;

    std::string stretch(const std::string& text)
    {
        StretchFilter filter(settings);
        std::ostringstream output;
        filter.apply(Program::fromText(text), output);
        statistics = filter.getStatistics();
        return output.str();
    }

    static std::vector<GCodeLine> allLines(const Program& program)
    {
        std::vector<GCodeLine> lines;
        for (const Layer& layer : program.layers())
        {
            lines.insert(lines.end(), layer.lines.begin(), layer.lines.end());
        }
        return lines;
    }
};

TEST_F(StretchScenarioTest, SquareHolePushedOutwards)
{
    const std::string input = joinLines(initializationEnd()) + joinLines(squareInnerEdgeLayer());
    const std::vector<GCodeLine> before = allLines(Program::fromText(input));
    const std::vector<GCodeLine> after = allLines(Program::fromText(stretch(input)));
    ASSERT_EQ(before.size(), after.size());

    const double maximum_stretch = 0.4 * 0.32;
    const Point2D centroid(0.5, 0.5);
    size_t moved = 0;
    for (size_t index = 0; index < before.size(); index++)
    {
        if (! before[index].isLinearMove())
        {
            EXPECT_EQ(before[index].raw, after[index].raw);
            continue;
        }
        const Point2D displacement = after[index].location.xy() - before[index].location.xy();
        EXPECT_LE(displacement.vSize(), maximum_stretch + 0.001) << "Line " << index << " moved too far."; // Output is rounded to 3 decimals.
        EXPECT_GT(displacement * (before[index].location.xy() - centroid), 0.0) << "Line " << index << " did not move away from the centre of the hole.";
        EXPECT_DOUBLE_EQ(after[index].location.z_, before[index].location.z_);
        moved++;
    }
    EXPECT_EQ(moved, 5u);
}

TEST_F(StretchScenarioTest, NoExtrusionNoChange)
{
    const std::string input = joinLines({
        "(</extruderInitialization>)",
        "(<layer> 0.2 )",
        "(<edge> inner )",
        "G1 X0 Y0 Z0.2 F1200",
        "G1 X1 Y0",
        "G1 X1 Y1",
        "G1 X0 Y1",
        "(</edge>)",
    });
    EXPECT_EQ(stretch(input), input) << "Without extrusion, no move qualifies.";
    EXPECT_EQ(statistics.stretched_moves, 0u);
}

TEST_F(StretchScenarioTest, ZeroStretchIsIdempotent)
{
    settings.loop_stretch_ratio = 0.0;
    settings.path_stretch_ratio = 0.0;
    settings.edge_inside_stretch_ratio = 0.0;
    settings.edge_outside_stretch_ratio = 0.0;

    const std::string input = joinLines(initializationEnd()) + joinLines(squareInnerEdgeLayer()) + joinLines(straightPathLayer());
    const std::string once = stretch(input);
    EXPECT_EQ(once, input);
    EXPECT_EQ(stretch(once), once);
}

TEST_F(StretchScenarioTest, DefaultEdgeWidthForPaths)
{
    settings.path_stretch_ratio = 0.1;
    const std::string input = joinLines({
        "(</extruderInitialization>)",
        "G1 X0 Y0 Z0.2 F1200",
        "M101",
        "G1 X1 Y0",
        "G1 X1 Y1",
        "G1 X0 Y1",
        "M103",
    });

    stretch(input);
    EXPECT_DOUBLE_EQ(statistics.edge_width, 0.4) << "Without edge width marker, the default is used.";
    EXPECT_GT(statistics.stretched_moves, 0u);
    EXPECT_GT(statistics.maximum_displacement, 0.0) << "The turns of the path are stretched.";
    EXPECT_LE(statistics.maximum_displacement, 0.04 + 1e-9);
}

TEST_F(StretchScenarioTest, ZNeverChanges)
{
    settings.path_stretch_ratio = 0.2;
    const std::string input = joinLines({
        "(</extruderInitialization>)",
        "(<layer> 0.2 )",
        "G1 X0 Y0 Z0.2 F1200",
        "M101",
        "G1 X2 Y0 E0.1",
        "G1 X2 Y2 Z0.25 E0.2",
        "G1 X0 Y2 E0.3",
        "M103",
    });
    const std::vector<GCodeLine> before = allLines(Program::fromText(input));
    const std::vector<GCodeLine> after = allLines(Program::fromText(stretch(input)));
    ASSERT_EQ(before.size(), after.size());
    for (size_t index = 0; index < before.size(); index++)
    {
        EXPECT_DOUBLE_EQ(after[index].location.z_, before[index].location.z_) << "Line " << index;
        EXPECT_EQ(after[index].e, before[index].e) << "Line " << index;
    }
}

TEST_F(StretchScenarioTest, LayerRangeAsWholeProgram)
{
    const std::string initialization = joinLines(initializationEnd());
    const std::string first_layer = joinLines(squareInnerEdgeLayer());
    std::vector<std::string> second = squareInnerEdgeLayer();
    second[0] = "(<layer> 0.8 )";
    const std::string second_layer = joinLines(second);

    const Program program = Program::fromText(initialization + first_layer + second_layer);
    ASSERT_EQ(program.layers().size(), 3u) << "The initialization block forms a layer of its own.";

    std::ostringstream whole;
    StretchFilter(settings).apply(program, whole);
    std::ostringstream range;
    StretchFilter(settings).apply(program.subRange(0, 1), range);

    const std::string whole_output = whole.str();
    const std::string range_output = range.str();
    EXPECT_NE(range_output, initialization + first_layer);
    EXPECT_EQ(whole_output.substr(0, range_output.size()), range_output) << "A layer is stretched the same in a range as in the whole program.";
}

TEST_F(StretchScenarioTest, LayerRangeWithoutInitialization)
{
    const std::string initialization = joinLines(initializationEnd());
    const std::string layer = joinLines(squareInnerEdgeLayer());
    const Program program = Program::fromText(initialization + layer);

    std::ostringstream range;
    StretchFilter(settings).apply(program.subRange(1, 1), range);
    EXPECT_EQ(range.str(), layer) << "A range that leaves out the initialization block is passed through.";
}

} // namespace stretch
// NOLINTEND(*-magic-numbers)
