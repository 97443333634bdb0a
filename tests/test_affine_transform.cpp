/**
 * @file test_affine_transform.cpp
 * @brief 仿射变换测试
 *
 * 覆盖：构造与形状校验、矩阵求逆、静态工厂方法、深拷贝、精度提升。
 */

#include <gtest/gtest.h>
#include "coordmap/reference/coordinate_map.hpp"
#include "coordmap/common/exceptions.hpp"
#include "coordmap/utility/config_manager.hpp"

using namespace coordmap;
using namespace coordmap::reference;

// 测试辅助函数
bool isApproxEqual(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, double tolerance = constants::EPSILON) {
    return a.rows() == b.rows() && a.cols() == b.cols() && (a - b).norm() < tolerance;
}

#define EXPECT_APPROX_EQ(a, b) EXPECT_TRUE(isApproxEqual(a, b))
#define EXPECT_APPROX_EQ_TOL(a, b, tol) EXPECT_TRUE(isApproxEqual(a, b, tol))

namespace {

AffineMatrix diag(std::initializer_list<double> values) {
    Eigen::VectorXd d(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) {
        d(i++) = v;
    }
    return d.asDiagonal();
}

Coordinates row(std::initializer_list<double> values) {
    Coordinates r(1, static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double v : values) {
        r(0, i++) = v;
    }
    return r;
}

} // namespace

// ==================== 构造与求值 ====================

TEST(AffineTransformTest, DiagonalScenario) {
    AffineTransform cm(diag({1, 2, 3, 1}), CoordinateSystem::FromLetters("ijk"), CoordinateSystem::FromLetters("xyz"));
    EXPECT_TRUE(cm.isAffine());
    EXPECT_APPROX_EQ(cm.evaluatePoint(Eigen::Vector3d(1, 1, 1)), row({1, 2, 3}));

    auto inv = cm.inverse();
    ASSERT_TRUE(inv.has_value());
    EXPECT_APPROX_EQ(inv->evaluatePoint(Eigen::Vector3d(1, 2, 3)), row({1, 1, 1}));
    EXPECT_EQ(inv->inputCoords().coordNames(), (std::vector<std::string>{"x", "y", "z"}));
}

TEST(AffineTransformTest, WrongShapeFails) {
    EXPECT_THROW(AffineTransform(Eigen::MatrixXd::Identity(4, 4), CoordinateSystem::FromLetters("ij"),
                                 CoordinateSystem::FromLetters("xyz")),
                 ConstructionError);
    EXPECT_THROW(AffineTransform(Eigen::MatrixXd::Identity(3, 4), CoordinateSystem::FromLetters("ijk"),
                                 CoordinateSystem::FromLetters("xyz")),
                 ConstructionError);
}

TEST(AffineTransformTest, HomogeneousRowRequired) {
    AffineMatrix m = Eigen::MatrixXd::Identity(3, 3);
    m(2, 0) = 0.5;
    EXPECT_THROW(AffineTransform(m, CoordinateSystem::FromLetters("ij"), CoordinateSystem::FromLetters("xy")),
                 ConstructionError);

    m = Eigen::MatrixXd::Identity(3, 3);
    m(2, 2) = 2.0;
    EXPECT_THROW(AffineTransform(m, CoordinateSystem::FromLetters("ij"), CoordinateSystem::FromLetters("xy")),
                 ConstructionError);
}

TEST(AffineTransformTest, EvaluatesLinearPlusTranslation) {
    AffineMatrix m(3, 4);
    m << 1, 2, 0, 10,
         0, 1, 3, -5,
         0, 0, 0, 1;
    AffineTransform cm(m, CoordinateSystem::FromLetters("ijk"), CoordinateSystem::FromLetters("xy"));

    Coordinates x(2, 3);
    x << 1, 1, 1,
         0, 2, -1;
    Coordinates expected(2, 2);
    expected << 13, -1,
                14, -6;
    EXPECT_APPROX_EQ(cm(x), expected);
    EXPECT_APPROX_EQ(cm.function()(x), expected);
}

// ==================== 逆变换 ====================

TEST(AffineTransformTest, InverseRoundTrip) {
    AffineMatrix m(4, 4);
    m << 2.0, 0.3, 0.0, 1.0,
         0.1, 1.5, 0.2, -2.0,
         0.0, 0.4, 3.0, 0.5,
         0.0, 0.0, 0.0, 1.0;
    AffineTransform cm(m, CoordinateSystem::FromLetters("ijk"), CoordinateSystem::FromLetters("xyz"));
    auto inv = cm.inverse();
    ASSERT_TRUE(inv.has_value());

    Coordinates x = Coordinates::Random(20, 3);
    EXPECT_APPROX_EQ((*inv)(cm(x)), x);

    // 逆矩阵的最后一行是精确的齐次行
    EXPECT_EQ(inv->affine()(3, 0), 0.0);
    EXPECT_EQ(inv->affine()(3, 3), 1.0);
}

TEST(AffineTransformTest, SingularHasNoInverse) {
    AffineTransform cm(diag({1, 0, 3, 1}), CoordinateSystem::FromLetters("ijk"), CoordinateSystem::FromLetters("xyz"));
    EXPECT_FALSE(cm.inverse().has_value());
    EXPECT_FALSE(static_cast<bool>(cm.inverseFunction()));

    // 通过基类访问
    const CoordinateMap& base = cm;
    EXPECT_FALSE(base.inverse().has_value());
}

TEST(AffineTransformTest, NonSquareHasNoInverse) {
    AffineMatrix m(2, 3);
    m << 1, 1, 0,
         0, 0, 1;
    AffineTransform cm(m, CoordinateSystem::FromLetters("ij"), CoordinateSystem::FromLetters("x"));
    EXPECT_FALSE(cm.inverse().has_value());
}

TEST(AffineTransformTest, InverseThroughBaseClass) {
    const CoordinateMap base = AffineTransform(diag({2, 4, 1}), CoordinateSystem::FromLetters("ij"),
                                               CoordinateSystem::FromLetters("xy"));
    ASSERT_TRUE(base.isAffine());
    auto inv = base.inverse();
    ASSERT_TRUE(inv.has_value());
    EXPECT_TRUE(inv->isAffine());
    EXPECT_APPROX_EQ(inv->asAffine()->affine(), diag({0.5, 0.25, 1}));
    EXPECT_APPROX_EQ(base.asAffine()->affine(), diag({2, 4, 1}));
}

TEST(AffineTransformTest, SingularThresholdFromConfig) {
    auto& config = utility::ConfigManager::getInstance();
    AffineTransform cm(diag({1, 1e-3, 1}), CoordinateSystem::FromLetters("ij"), CoordinateSystem::FromLetters("xy"));
    EXPECT_TRUE(cm.inverse().has_value());

    config.setConfigValue(utility::ConfigFileType::REFERENCE, "reference.affine.singular_threshold", 0.5);
    EXPECT_FALSE(cm.inverse().has_value());

    config.reset();
    EXPECT_TRUE(cm.inverse().has_value());
}

// ==================== 静态工厂方法 ====================

TEST(AffineTransformTest, FromParamsMatrix) {
    auto cm = AffineTransform::FromParams({"i"}, {"x"}, diag({2, 1}));
    EXPECT_EQ(cm.inputCoords(), CoordinateSystem({"i"}, "input"));
    EXPECT_EQ(cm.outputCoords(), CoordinateSystem({"x"}, "output"));
    EXPECT_APPROX_EQ(cm.affine(), diag({2, 1}));

    EXPECT_THROW(AffineTransform::FromParams({"i", "j"}, {"x"}, diag({2, 1})), ConstructionError);
}

TEST(AffineTransformTest, FromParamsMatrixVector) {
    Eigen::MatrixXd A(2, 2);
    A << 1, 2,
         3, 4;
    Eigen::VectorXd b(2);
    b << 5, 6;
    auto cm = AffineTransform::FromParams({"i", "j"}, {"x", "y"}, A, b);

    AffineMatrix expected(3, 3);
    expected << 1, 2, 5,
                3, 4, 6,
                0, 0, 1;
    EXPECT_APPROX_EQ(cm.affine(), expected);

    EXPECT_THROW(AffineTransform::FromParams({"i", "j"}, {"x", "y"}, A, Eigen::VectorXd::Zero(3)),
                 ConstructionError);
}

TEST(AffineTransformTest, FromStartStep) {
    auto cm = AffineTransform::FromStartStep({"i", "j", "k"}, {"x", "y", "z"},
                                             Eigen::Vector3d(1, 2, 3), Eigen::Vector3d(4, 5, 6));
    AffineMatrix expected(4, 4);
    expected << 4, 0, 0, 1,
                0, 5, 0, 2,
                0, 0, 6, 3,
                0, 0, 0, 1;
    EXPECT_APPROX_EQ(cm.affine(), expected);

    EXPECT_THROW(AffineTransform::FromStartStep({"i", "j"}, {"x"}, Eigen::Vector2d(0, 0), Eigen::Vector2d(1, 1)),
                 ConstructionError);
}

TEST(AffineTransformTest, Identity) {
    auto cm = AffineTransform::Identity({"i", "j", "k"});
    EXPECT_APPROX_EQ(cm.affine(), Eigen::MatrixXd::Identity(4, 4));
    EXPECT_EQ(cm.inputCoords().coordNames(), cm.outputCoords().coordNames());
    EXPECT_EQ(cm.inputCoords().name(), "input");
    EXPECT_EQ(cm.outputCoords().name(), "output");
}

// ==================== 复制与精度 ====================

TEST(AffineTransformTest, CopyIsDeep) {
    AffineTransform cm(Eigen::MatrixXd::Identity(4, 4), CoordinateSystem::FromLetters("ijk"),
                       CoordinateSystem::FromLetters("xyz"));
    auto copy = cm.copy();
    EXPECT_NE(copy.affine().data(), cm.affine().data());
    EXPECT_APPROX_EQ(copy.affine(), cm.affine());
    EXPECT_EQ(copy.inputCoords(), cm.inputCoords());
}

TEST(AffineTransformTest, PrecisionPromotion) {
    CoordinateSystem in({"i", "j"}, "voxel", CoordDtype::Int32);
    CoordinateSystem out({"x", "y"}, "world", CoordDtype::Float32);

    AffineTransform promoted(diag({2, 3, 1}), in, out);
    EXPECT_EQ(promoted.inputCoords().coordDtype(), CoordDtype::Float64);
    EXPECT_EQ(promoted.outputCoords().coordDtype(), CoordDtype::Float64);
    EXPECT_EQ(promoted.inputCoords().coordNames(), in.coordNames());
    EXPECT_EQ(promoted.inputCoords().name(), "voxel");

    CoordinateSystem in32({"i", "j"}, "", CoordDtype::Float32);
    AffineTransform single(diag({0.1, 3, 1}), in32, out, CoordDtype::Float32);
    EXPECT_EQ(single.inputCoords().coordDtype(), CoordDtype::Float32);
    EXPECT_EQ(single.affine()(0, 0), static_cast<double>(0.1f));

    EXPECT_THROW(AffineTransform(diag({1, 1, 1}), CoordinateSystem({"i", "j"}, "", CoordDtype::UInt64),
                                 CoordinateSystem({"x", "y"}, "", CoordDtype::Int8), CoordDtype::Int8),
                 PrecisionError);
}

TEST(AffineTransformTest, IntegerTransformInverseIsFloating) {
    CoordinateSystem in({"i", "j"}, "", CoordDtype::Int32);
    CoordinateSystem out({"x", "y"}, "", CoordDtype::Int32);
    AffineTransform cm(diag({2, 4, 1}), in, out, CoordDtype::Int32);
    EXPECT_EQ(cm.inputCoords().coordDtype(), CoordDtype::Int32);

    auto inv = cm.inverse();
    ASSERT_TRUE(inv.has_value());
    EXPECT_EQ(inv->inputCoords().coordDtype(), CoordDtype::Float64);
    EXPECT_APPROX_EQ(inv->evaluatePoint(Eigen::Vector2d(3, 6)), row({1.5, 1.5}));
}

TEST(AffineTransformTest, ToString) {
    AffineTransform cm(diag({1, 2, 1}), CoordinateSystem::FromLetters("ij"), CoordinateSystem::FromLetters("xy"));
    const std::string text = cm.toString();
    EXPECT_EQ(text.rfind("AffineTransform(\n   affine=[[", 0), 0u);
    EXPECT_NE(text.find("output_coords=CoordinateSystem(coord_names=('x', 'y'), name='', coord_dtype=float64)"),
              std::string::npos);

    const CoordinateMap& base = cm;
    EXPECT_EQ(base.toString(), text);
}
