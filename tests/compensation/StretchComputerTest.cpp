// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "compensation/StretchComputer.h" //The class under test.

#include "TestPrograms.h"
#include "compensation/LineTraversal.h"
#include "gcode/Program.h"
#include "settings/StretchSettings.h"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <cmath>

// NOLINTBEGIN(*-magic-numbers)
namespace stretch
{

/*
 * Fixture with the default settings at an edge width of 0.4mm: a lookahead of
 * 0.8mm and a cross limit distance of 2mm.
 */
class StretchComputerTest : public testing::Test
{
public:
    StretchComputer computer{ StretchContext::create(StretchSettings(), 0.4) };
};

TEST_F(StretchComputerTest, TangentOnStraightLine)
{
    const Program program = Program::fromLines(straightPathLayer());
    const std::span<const GCodeLine> lines = program.layers()[0].view();
    const Point2D location = lines[3].location.xy(); // X1

    LineTraversal forward(lines, 4, false, Direction::FORWARD);
    const Point2D ahead = computer.tangentEstimate(location, forward);
    EXPECT_NEAR(ahead.x_, -1.0, 1e-9) << "The estimate points from the point ahead back to the location.";
    EXPECT_NEAR(ahead.y_, 0.0, 1e-9);

    LineTraversal backward(lines, 2, false, Direction::BACKWARD);
    const Point2D behind = computer.tangentEstimate(location, backward);
    EXPECT_NEAR(behind.x_, 1.0, 1e-9);
    EXPECT_NEAR(behind.y_, 0.0, 1e-9);
}

TEST_F(StretchComputerTest, TangentIsUnitVector)
{
    const Program program = Program::fromLines({ "M101", "G1 X0 Y0", "G1 X0.3 Y0", "G1 X0.3 Y0.3", "G1 X0.6 Y0.3", "G1 X0.6 Y0.9", "M103" });
    const std::span<const GCodeLine> lines = program.layers()[0].view();

    LineTraversal forward(lines, 2, false, Direction::FORWARD);
    const Point2D tangent = computer.tangentEstimate(lines[1].location.xy(), forward);
    EXPECT_NEAR(tangent.vSize(), 1.0, 1e-9);
    // At 0.8mm along the thread is (0.5, 0.3).
    EXPECT_NEAR(tangent.x_, -0.5 / std::sqrt(0.34), 1e-9);
    EXPECT_NEAR(tangent.y_, -0.3 / std::sqrt(0.34), 1e-9);
}

TEST_F(StretchComputerTest, TangentWhenExhaustedEarly)
{
    const Program program = Program::fromLines({ "M101", "G1 X0 Y0", "G1 X0.3 Y0", "M103" });
    const std::span<const GCodeLine> lines = program.layers()[0].view();

    LineTraversal short_thread(lines, 2, false, Direction::FORWARD);
    const Point2D tangent = computer.tangentEstimate(Point2D(0.0, 0.0), short_thread);
    EXPECT_NEAR(tangent.x_, -1.0, 1e-9) << "Falls back to the direction from the last visited point.";
    EXPECT_NEAR(tangent.y_, 0.0, 1e-9);

    LineTraversal empty(lines, 3, false, Direction::FORWARD);
    EXPECT_EQ(computer.tangentEstimate(Point2D(0.0, 0.0), empty), Point2D()) << "Without any point there is no direction.";
}

TEST_F(StretchComputerTest, NoStretchOnStraightLine)
{
    const Program program = Program::fromLines(straightPathLayer());
    const Point2D stretch = computer.relativeStretch(program.layers()[0].view(), 4, false);
    EXPECT_NEAR(stretch.x_, 0.0, 1e-9);
    EXPECT_NEAR(stretch.y_, 0.0, 1e-9);
}

TEST_F(StretchComputerTest, SquareCorner)
{
    const Program program = Program::fromLines(squareInnerEdgeLayer());
    const std::span<const GCodeLine> lines = program.layers()[0].view();

    // Corner at (1, 0): both directions push it outwards, both neighbours at 1mm limit it sideways.
    const Point2D relative = computer.relativeStretch(lines, 4, true);
    EXPECT_NEAR(relative.x_, 0.2, 1e-9);
    EXPECT_NEAR(relative.y_, -0.2, 1e-9);

    const Point2D absolute = computer.absoluteStretch(lines, 4, true, 0.128);
    EXPECT_NEAR(absolute.x_, 0.0256, 1e-9);
    EXPECT_NEAR(absolute.y_, -0.0256, 1e-9);
}

TEST_F(StretchComputerTest, RelativeStretchIsBounded)
{
    const Program program = Program::fromLines(squareInnerEdgeLayer());
    const std::span<const GCodeLine> lines = program.layers()[0].view();
    for (size_t index = 0; index < lines.size(); index++)
    {
        if (! lines[index].isLinearMove())
        {
            continue;
        }
        for (const bool is_loop : { false, true })
        {
            EXPECT_LE(computer.relativeStretch(lines, index, is_loop).vSize(), 1.0 + 1e-12) << "Line " << index;
        }
    }
}

/*
 * Cross limit against a single neighbour at a given distance along the X axis,
 * with a stretch straight across to it.
 */
class CrossLimitTest : public StretchComputerTest
{
public:
    Point2D crossLimitAt(const double distance, const Point2D& stretch)
    {
        const Program program = Program::fromLines({ "G1 X0 Y0", fmt::format("G1 X{} Y0", distance) });
        LineTraversal traversal(program.layers()[0].view(), 1, false, Direction::FORWARD);
        return computer.crossLimit(stretch, traversal, Point2D(0.0, 0.0));
    }
};

TEST_F(CrossLimitTest, CloseNeighbourIsIgnored)
{
    const Point2D result = crossLimitAt(0.5, Point2D(0.3, 1.0));
    EXPECT_NEAR(result.x_, 0.3, 1e-9);
    EXPECT_NEAR(result.y_, 1.0, 1e-9);
}

TEST_F(CrossLimitTest, FarNeighbourKeepsParallelOnly)
{
    const Point2D result = crossLimitAt(2.5, Point2D(0.3, 1.0));
    EXPECT_NEAR(result.x_, 0.3, 1e-9);
    EXPECT_NEAR(result.y_, 0.0, 1e-9);
}

TEST_F(CrossLimitTest, NoNeighbour)
{
    const Program program = Program::fromLines({ "G1 X0 Y0" });
    LineTraversal traversal(program.layers()[0].view(), 1, false, Direction::FORWARD);
    EXPECT_EQ(computer.crossLimit(Point2D(0.5, 0.5), traversal, Point2D()), Point2D(0.5, 0.5));
}

TEST_F(CrossLimitTest, Monotonic)
{
    const double fraction = computer.context().cross_limit_distance_fraction;
    const double limit = computer.context().cross_limit_distance;

    double previous = -1.0;
    for (double distance = limit; distance > fraction; distance -= 0.05)
    {
        const Point2D result = crossLimitAt(distance, Point2D(0.0, 1.0));
        EXPECT_NEAR(result.x_, 0.0, 1e-9);
        if (previous >= 0.0)
        {
            EXPECT_LE(result.y_, previous + 1e-12) << "The part across shrinks as the neighbour comes closer, at " << distance << "mm.";
        }
        previous = result.y_;
    }
    EXPECT_NEAR(crossLimitAt(limit, Point2D(0.0, 1.0)).y_, 1.0, 1e-6);
    EXPECT_NEAR(crossLimitAt(fraction + 1e-6, Point2D(0.0, 1.0)).y_, 0.0, 1e-5) << "Nothing across is left at a third of the cross limit distance.";
}

} // namespace stretch
// NOLINTEND(*-magic-numbers)
