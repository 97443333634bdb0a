/**
 * @file types.hpp
 * @brief 坐标映射库的基础类型定义
 * @details 坐标数据统一使用Eigen动态矩阵存储：每一行是一个点，
 * 每一列对应坐标系中的一个轴。单个点在求值时被提升为一行的批量。
 */
#pragma once

#include <Eigen/Dense>
#include <functional>

namespace coordmap {

/**
 * @brief 坐标批量（N x ndim）
 */
using Coordinates = Eigen::MatrixXd;

/**
 * @brief 单个点的坐标
 */
using Point = Eigen::VectorXd;

/**
 * @brief 齐次仿射矩阵（(ndim_out+1) x (ndim_in+1)）
 */
using AffineMatrix = Eigen::MatrixXd;

/**
 * @brief 坐标映射函数：输入坐标批量 -> 输出坐标批量
 * @details 空的std::function表示"没有函数"（例如不存在逆映射）
 */
using MappingFunction = std::function<Coordinates(const Coordinates&)>;

namespace constants {
    constexpr double EPSILON = 1e-9;
    constexpr double AFFINE_TOLERANCE = 1e-12; ///< 齐次行校验容差
    constexpr Eigen::Index PROBE_ROWS = 10;    ///< 构造时自检使用的零向量批量行数
}

} // namespace coordmap
