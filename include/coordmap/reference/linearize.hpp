/**
 * @file linearize.hpp
 * @brief 用前向差分求函数的局部仿射近似
 *
 * 在 origin 处求值得到平移部分 b = f(origin)，
 * 线性部分第 i 列为 (f(origin + step * e_i) - f(origin)) / step。
 * 对仿射函数结果是精确的（仅有舍入误差），与 step 和 origin 无关。
 */
#pragma once

#include "coordinate_map.hpp"
#include <optional>

namespace coordmap {
namespace reference {

/**
 * @brief 线性化任意映射函数
 * @param function 待线性化的函数，接受 N x ndim_in 的批量
 * @param ndim_in 输入维数
 * @param step 差分步长，先转换到 dtype 精度
 * @param origin 线性化的位置，默认为零向量
 * @param dtype 计算精度
 * @return (ndim_out+1) x (ndim_in+1) 的齐次矩阵
 * @throw ValidationError origin长度不等于ndim_in、step转换后为零或函数返回的形状不对
 */
AffineMatrix Linearize(const MappingFunction& function,
                       Eigen::Index ndim_in,
                       double step = 1.0,
                       const std::optional<Point>& origin = std::nullopt,
                       CoordDtype dtype = CoordDtype::Float64);

/**
 * @brief 在坐标映射自身的坐标系之间求仿射近似
 *
 * 通过带校验的求值调用映射，结果的输入输出坐标系与原映射相同（精度可能被提升）。
 * step和origin先转换到输入坐标系的精度。
 * @throw ValidationError origin长度不符，或step在输入精度下为零
 */
AffineTransform Linearize(const CoordinateMap& cmap,
                          double step = 1.0,
                          const std::optional<Point>& origin = std::nullopt);

} // namespace reference
} // namespace coordmap
