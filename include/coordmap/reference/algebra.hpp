/**
 * @file algebra.hpp
 * @brief 坐标映射代数：组合、积与拼接
 *
 * 所有运算都不修改操作数，返回新的CoordinateMap。
 * 当全部操作数都是仿射变换时，结果由矩阵运算精确得到，仍为仿射形式
 * （可通过 CoordinateMap::asAffine() 取得 AffineTransform）；
 * 否则结果是通用的函数组合。
 *
 * 使用示例：
 * @code
 * auto scale = AffineTransform::FromParams({"i"}, {"x"}, Eigen::Vector2d(2, 1).asDiagonal());
 * auto identity = Compose({scale, *scale.inverse()});   // x -> x
 *
 * auto block = Product({scale_i, scale_k, scale_j});    // (i, k, j) -> (x, z, y)
 * auto with_time = Concat(block, "t");                  // (t, i, k, j) -> (t, x, z, y)
 * @endcode
 */
#pragma once

#include "coordinate_map.hpp"
#include <string>
#include <vector>

namespace coordmap {
namespace reference {

/**
 * @brief 从右向左组合坐标映射
 *
 * 结果的输入坐标系为 cmaps.back() 的输入，输出坐标系为 cmaps.front() 的输出。
 * 非仿射结果只有在每一步都有逆函数时才有逆函数。
 *
 * @param cmaps 待组合的映射，cmaps.back() 最先作用
 * @throw CompositionError 列表为空或相邻映射的坐标系不匹配
 */
CoordinateMap Compose(const std::vector<CoordinateMap>& cmaps);

/**
 * @brief 坐标映射的积（分块对角）
 *
 * 输入、输出坐标系分别按顺序拼接各映射的坐标系（标签为"product"，精度取公共上界），
 * 求值时每个映射作用于输入批量中属于自己的列，结果按列拼接。
 *
 * @throw CompositionError 列表为空
 * @throw ConstructionError 拼接后的轴名称重复
 */
CoordinateMap Product(const std::vector<CoordinateMap>& cmaps);

/**
 * @brief 在输入和输出两侧增加一个恒等的标量轴
 * @param cmap 原映射
 * @param axis_name 新轴名称
 * @param append true时追加在末尾，否则插入在最前
 */
CoordinateMap Concat(const CoordinateMap& cmap,
                     const std::string& axis_name = "concat",
                     bool append = false);

} // namespace reference
} // namespace coordmap
