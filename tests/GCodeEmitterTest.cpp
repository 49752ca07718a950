// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "GCodeEmitter.h" //The class under test.

#include "gcode/GCodeLine.h"

#include <gtest/gtest.h>

#include <sstream>

// NOLINTBEGIN(*-magic-numbers)
namespace stretch
{

/*
 * Fixture that writes to a string, with 3 decimals for coordinates and 1 for
 * feed rates.
 */
class GCodeEmitterTest : public testing::Test
{
public:
    std::ostringstream output;
    GCodeEmitter emitter{ output, 3, 1, 959.0 };
};

TEST_F(GCodeEmitterTest, WriteLineUnchanged)
{
    emitter.writeLine("M104 S210 ; heat up");
    emitter.writeLine("");

    EXPECT_EQ(output.str(), "M104 S210 ; heat up\n\n");
    EXPECT_EQ(emitter.getLineCount(), 2u);
}

TEST_F(GCodeEmitterTest, WriteLinearMoveWithDefaultFeedRate)
{
    const GCodeLine source = GCodeLine::parse("G1 X1 Y0 Z0.4", Point3D());
    emitter.writeLinearMove(Point2D(1.0256, -0.0256), 0.4, source);

    EXPECT_EQ(output.str(), "G1 X1.026 Y-0.026 Z0.4 F959\n") << "Without any feed rate seen, the default is written.";
    EXPECT_EQ(emitter.getLineCount(), 1u);
}

TEST_F(GCodeEmitterTest, TrackFeedRate)
{
    emitter.trackFeedRate(GCodeLine::parse("G1 X0 Y0 F1500.26", Point3D()));
    EXPECT_DOUBLE_EQ(emitter.getCurrentFeedRate(), 1500.26);

    emitter.trackFeedRate(GCodeLine::parse("G1 X1 Y0", Point3D()));
    EXPECT_DOUBLE_EQ(emitter.getCurrentFeedRate(), 1500.26) << "Lines without a feed rate keep the last one.";

    emitter.writeLinearMove(Point2D(2.0, 3.0), 0.2, GCodeLine::parse("G1 X2 Y3", Point3D()));
    EXPECT_EQ(output.str(), "G1 X2 Y3 Z0.2 F1500.3\n");
}

TEST_F(GCodeEmitterTest, KeepExtrusionAndComment)
{
    const GCodeLine source = GCodeLine::parse("G1 X1 Y1 Z0.4 E0.123456 ; wall", Point3D());
    emitter.writeLinearMove(Point2D(1.01, 1.01), 0.4, source);

    EXPECT_EQ(output.str(), "G1 X1.01 Y1.01 Z0.4 F959 E0.12346 ; wall\n");
}

} // namespace stretch
// NOLINTEND(*-magic-numbers)
