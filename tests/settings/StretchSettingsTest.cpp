// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#include "settings/StretchSettings.h" //The class under test.

#include "exceptions.h"
#include "settings/Settings.h"

#include <gtest/gtest.h>

// NOLINTBEGIN(*-magic-numbers)
namespace stretch
{

TEST(StretchSettingsTest, Defaults)
{
    const StretchSettings defaults = StretchSettings::fromSettings(Settings());

    EXPECT_TRUE(defaults.activate_stretch);
    EXPECT_DOUBLE_EQ(defaults.cross_limit_distance_ratio, 5.0);
    EXPECT_DOUBLE_EQ(defaults.loop_stretch_ratio, 0.11);
    EXPECT_DOUBLE_EQ(defaults.path_stretch_ratio, 0.0);
    EXPECT_DOUBLE_EQ(defaults.edge_inside_stretch_ratio, 0.32);
    EXPECT_DOUBLE_EQ(defaults.edge_outside_stretch_ratio, 0.1);
    EXPECT_DOUBLE_EQ(defaults.stretch_lookahead_ratio, 2.0);
    EXPECT_DOUBLE_EQ(defaults.default_edge_width, 0.4);
    EXPECT_DOUBLE_EQ(defaults.default_feed_rate, 959.0);
    EXPECT_FALSE(defaults.min_z_change.has_value()) << "The height check is off unless asked for.";
}

TEST(StretchSettingsTest, ReadGivenSettings)
{
    Settings settings;
    settings.add("activate_stretch", "false");
    settings.add("path_stretch_ratio", "0.05");
    settings.add("default_edge_width", "0.5");
    settings.add("output_coordinate_precision", "4");
    settings.add("min_z_change", "0.3");

    const StretchSettings result = StretchSettings::fromSettings(settings);

    EXPECT_FALSE(result.activate_stretch);
    EXPECT_DOUBLE_EQ(result.path_stretch_ratio, 0.05);
    EXPECT_DOUBLE_EQ(result.default_edge_width, 0.5);
    EXPECT_EQ(result.output_coordinate_precision, 4u);
    ASSERT_TRUE(result.min_z_change.has_value());
    EXPECT_DOUBLE_EQ(*result.min_z_change, 0.3);
    EXPECT_DOUBLE_EQ(result.loop_stretch_ratio, 0.11) << "Settings that are not given keep their default.";
}

TEST(StretchSettingsTest, RejectNegativeRatio)
{
    Settings settings;
    settings.add("edge_inside_stretch_ratio", "-0.1");
    EXPECT_THROW(StretchSettings::fromSettings(settings), exceptions::InvalidSettingException);
}

TEST(StretchSettingsTest, RejectNonPositiveDistance)
{
    Settings settings;
    settings.add("default_edge_width", "0");
    EXPECT_THROW(StretchSettings::fromSettings(settings), exceptions::InvalidSettingException);
}

TEST(StretchSettingsTest, RejectUnparsableValue)
{
    Settings settings;
    settings.add("loop_stretch_ratio", "lots");
    EXPECT_THROW(StretchSettings::fromSettings(settings), exceptions::InvalidSettingException);
}

} // namespace stretch
// NOLINTEND(*-magic-numbers)
