/**
 * @file test_coordinate_system.cpp
 * @brief 坐标系测试
 */

#include <gtest/gtest.h>
#include "coordmap/reference/coordinate_system.hpp"
#include "coordmap/common/exceptions.hpp"

using namespace coordmap;
using namespace coordmap::reference;

TEST(CoordinateSystemTest, FromLetters) {
    auto cs = CoordinateSystem::FromLetters("ijk", "voxel");
    EXPECT_EQ(cs.ndim(), 3);
    EXPECT_EQ(cs.coordNames(), (std::vector<std::string>{"i", "j", "k"}));
    EXPECT_EQ(cs.name(), "voxel");
    EXPECT_EQ(cs.coordDtype(), CoordDtype::Float64);
}

TEST(CoordinateSystemTest, RejectsDuplicateAndEmptyNames) {
    EXPECT_THROW(CoordinateSystem({"x", "y", "x"}), ConstructionError);
    EXPECT_THROW(CoordinateSystem({"x", ""}), ConstructionError);
    EXPECT_THROW(CoordinateSystem::FromLetters("xx"), ConstructionError);
}

TEST(CoordinateSystemTest, AxisLookup) {
    CoordinateSystem cs({"x", "y", "z"}, "world");
    EXPECT_EQ(cs.index("x"), 0);
    EXPECT_EQ(cs.index("z"), 2);
    EXPECT_TRUE(cs.hasCoord("y"));
    EXPECT_FALSE(cs.hasCoord("t"));

    try {
        cs.index("t");
        FAIL() << "Expected ConstructionError";
    } catch (const ConstructionError& e) {
        EXPECT_NE(std::string(e.what()).find("No coordinate named t"), std::string::npos);
    }
}

TEST(CoordinateSystemTest, Equality) {
    auto a = CoordinateSystem::FromLetters("ijk");
    EXPECT_EQ(a, CoordinateSystem::FromLetters("ijk"));
    EXPECT_NE(a, CoordinateSystem::FromLetters("ikj"));
    EXPECT_NE(a, CoordinateSystem::FromLetters("ijk", "voxel"));
    EXPECT_NE(a, CoordinateSystem::FromLetters("ijk", "", CoordDtype::Float32));
    EXPECT_EQ(a.withDtype(CoordDtype::Int32).coordDtype(), CoordDtype::Int32);
    EXPECT_EQ(a.withDtype(CoordDtype::Int32).coordNames(), a.coordNames());
}

TEST(CoordinateSystemTest, ToString) {
    auto cs = CoordinateSystem::FromLetters("ijk", "voxel");
    EXPECT_EQ(cs.toString(), "CoordinateSystem(coord_names=('i', 'j', 'k'), name='voxel', coord_dtype=float64)");

    CoordinateSystem single({"t"}, "", CoordDtype::Int16);
    EXPECT_EQ(single.toString(), "CoordinateSystem(coord_names=('t',), name='', coord_dtype=int16)");
}

// ==================== 数值校验 ====================

TEST(CoordinateSystemTest, CheckedValuesShape) {
    auto cs = CoordinateSystem::FromLetters("xyz");
    EXPECT_THROW(cs.checkedValues(Coordinates::Zero(4, 2)), ValidationError);
    EXPECT_NO_THROW(cs.checkedValues(Coordinates::Zero(4, 3)));
    EXPECT_NO_THROW(cs.checkedValues(Coordinates::Zero(0, 3)));
}

TEST(CoordinateSystemTest, CheckedValuesCoerces) {
    CoordinateSystem cs({"i", "j"}, "grid", CoordDtype::Int32);
    Coordinates values(1, 2);
    values << 2.9, -3.2;
    Coordinates checked = cs.checkedValues(values);
    EXPECT_EQ(checked(0, 0), 2.0);
    EXPECT_EQ(checked(0, 1), -3.0);
}

// ==================== 坐标系的积 ====================

TEST(CoordinateSystemTest, Product) {
    CoordinateSystem a({"i", "j"}, "a", CoordDtype::Int16);
    CoordinateSystem b({"k"}, "b", CoordDtype::UInt16);
    auto p = Product({a, b});
    EXPECT_EQ(p.coordNames(), (std::vector<std::string>{"i", "j", "k"}));
    EXPECT_EQ(p.name(), "product");
    EXPECT_EQ(p.coordDtype(), CoordDtype::Int32);

    EXPECT_THROW(Product({a, a}), ConstructionError);
}
