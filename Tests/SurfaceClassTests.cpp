#include <gtest/gtest.h>

#include <string_view>

#include "ScanSettings.hpp"
#include "StaticMesh.hpp"
#include "SurfaceClass.hpp"
#include "TriMeshUtils.hpp"

TEST(SurfaceClass, KeywordsAreCaseInsensitive)
{
    EXPECT_EQ(classifySurface("Ground_01"), SurfaceClass::Ground);
    EXPECT_EQ(classifySurface("OFFICE_FLOOR"), SurfaceClass::Ground);
    EXPECT_EQ(classifySurface("Wall.North"), SurfaceClass::Wall);
    EXPECT_EQ(classifySurface("ceiling"), SurfaceClass::Wall);
    EXPECT_EQ(classifySurface("furniture_chair"), SurfaceClass::Object);
    EXPECT_EQ(classifySurface("PalmTree"), SurfaceClass::Vegetation);
    EXPECT_EQ(classifySurface("river_bed"), SurfaceClass::Water);
    EXPECT_EQ(classifySurface("SteelBeam"), SurfaceClass::Metal);
    EXPECT_EQ(classifySurface("timber_frame"), SurfaceClass::Wood);
}

TEST(SurfaceClass, FirstMatchingRuleWins)
{
    // "ground" is checked before "wood"
    EXPECT_EQ(classifySurface("wood_floor"), SurfaceClass::Ground);
    // "wall" is checked before "metal"
    EXPECT_EQ(classifySurface("metal_wall"), SurfaceClass::Wall);
}

TEST(SurfaceClass, UnknownNamesAreDefault)
{
    EXPECT_EQ(classifySurface(""), SurfaceClass::Default);
    EXPECT_EQ(classifySurface("crate"), SurfaceClass::Default);
    EXPECT_STREQ(surfaceClassName(SurfaceClass::Default), "default");
}

TEST(SurfaceClass, StaticMeshClassifiesFromName)
{
    const StaticMesh mesh("Lake_Surface", tmu::make_plane(glm::vec3(0.0f), 2.0f, 2.0f));
    EXPECT_EQ(mesh.surfaceClass(), SurfaceClass::Water);
}

TEST(SurfaceClass, DefaultPaletteMatchesHexColors)
{
    const ScanSettings settings;

    const glm::vec3 ground = settings.surfaceColors[static_cast<size_t>(SurfaceClass::Ground)];
    EXPECT_FLOAT_EQ(ground.r, 0x8b / 255.0f);
    EXPECT_FLOAT_EQ(ground.g, 0x45 / 255.0f);
    EXPECT_FLOAT_EQ(ground.b, 0x13 / 255.0f);

    const glm::vec3 def = settings.surfaceColors[static_cast<size_t>(SurfaceClass::Default)];
    EXPECT_FLOAT_EQ(def.r, 0.0f);
    EXPECT_FLOAT_EQ(def.g, 1.0f);
    EXPECT_FLOAT_EQ(def.b, 0x88 / 255.0f);
}
