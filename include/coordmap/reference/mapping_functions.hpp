/**
 * @file mapping_functions.hpp
 * @brief 值语义的映射函数对象
 *
 * 组合、仿射等运算生成的函数不捕获外部引用，而是按值持有所需的操作数，
 * 再包装成MappingFunction。所有函数对象都是无状态的，可以在多个映射间共享。
 */
#pragma once

#include "../common/types.hpp"
#include <vector>

namespace coordmap {
namespace reference {

/**
 * @brief 仿射函数 y = x * A^T + b
 */
struct AffineFunction {
    Eigen::MatrixXd linear;         ///< 线性部分 A（ndim_out x ndim_in）
    Eigen::RowVectorXd translation; ///< 平移部分 b

    /**
     * @brief 从齐次矩阵 [[A, b], [0, 1]] 中拆分线性部分和平移部分
     */
    static AffineFunction FromHomogeneous(const AffineMatrix& affine);

    /**
     * @throw ValidationError 输入列数与线性部分不符
     */
    Coordinates operator()(const Coordinates& x) const;
};

/**
 * @brief 按顺序依次调用的函数链
 *
 * steps[0]最先作用于输入，steps.back()最后作用。
 */
struct ComposedFunction {
    std::vector<MappingFunction> steps;

    Coordinates operator()(const Coordinates& x) const {
        Coordinates value = x;
        for (const auto& step : steps) {
            value = step(value);
        }
        return value;
    }
};

/**
 * @brief 由矩阵和平移向量构造齐次矩阵
 */
AffineMatrix FromMatrixVector(const Eigen::MatrixXd& linear, const Eigen::VectorXd& translation);

} // namespace reference
} // namespace coordmap
