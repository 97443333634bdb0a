/**
 * @file mapping_functions.cpp
 * @brief 值语义映射函数实现
 */

#include "coordmap/reference/mapping_functions.hpp"
#include "coordmap/common/exceptions.hpp"
#include <string>

namespace coordmap {
namespace reference {

AffineFunction AffineFunction::FromHomogeneous(const AffineMatrix& affine) {
    const Eigen::Index ndim_out = affine.rows() - 1;
    const Eigen::Index ndim_in = affine.cols() - 1;

    AffineFunction function;
    function.linear = affine.topLeftCorner(ndim_out, ndim_in);
    function.translation = affine.topRightCorner(ndim_out, 1).transpose();
    return function;
}

Coordinates AffineFunction::operator()(const Coordinates& x) const {
    if (x.cols() != linear.cols()) {
        throw ValidationError("AffineFunction",
            "Expected " + std::to_string(linear.cols()) + " input columns, got " +
            std::to_string(x.cols()));
    }
    Coordinates value = x * linear.transpose();
    value.rowwise() += translation;
    return value;
}

AffineMatrix FromMatrixVector(const Eigen::MatrixXd& linear, const Eigen::VectorXd& translation) {
    if (translation.size() != linear.rows()) {
        throw ConstructionError("AffineTransform",
            "Translation length " + std::to_string(translation.size()) +
            " does not match matrix rows " + std::to_string(linear.rows()));
    }

    AffineMatrix affine = AffineMatrix::Zero(linear.rows() + 1, linear.cols() + 1);
    affine.topLeftCorner(linear.rows(), linear.cols()) = linear;
    affine.topRightCorner(linear.rows(), 1) = translation;
    affine(linear.rows(), linear.cols()) = 1.0;
    return affine;
}

} // namespace reference
} // namespace coordmap
