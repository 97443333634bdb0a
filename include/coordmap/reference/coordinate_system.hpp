/**
 * @file coordinate_system.hpp
 * @brief 坐标系定义
 *
 * 坐标系由有序且唯一的轴名称、一个标签（name）和数值精度组成。
 * 坐标系是不可变的值对象，相等比较同时考虑轴名称、标签和精度。
 *
 * 使用示例：
 * @code
 * auto voxel = CoordinateSystem::FromLetters("ijk", "voxel");
 * auto world = CoordinateSystem({"x", "y", "z"}, "world", CoordDtype::Float32);
 *
 * world.index("y");                       // 1
 * auto checked = world.checkedValues(xyz); // 形状校验 + 精度转换
 * @endcode
 */
#pragma once

#include "coord_dtype.hpp"
#include <string>
#include <vector>

namespace coordmap {
namespace reference {

class CoordinateSystem {
public:
    /**
     * @brief 构造坐标系
     * @param coord_names 轴名称（非空且互不相同）
     * @param name 坐标系标签
     * @param coord_dtype 数值精度
     * @throw ConstructionError 轴名称为空或重复
     */
    CoordinateSystem(std::vector<std::string> coord_names,
                     std::string name = "",
                     CoordDtype coord_dtype = CoordDtype::Float64);

    /**
     * @brief 每个字符作为一个轴名称，例如 "ijk" -> (i, j, k)
     */
    static CoordinateSystem FromLetters(const std::string& letters,
                                        const std::string& name = "",
                                        CoordDtype coord_dtype = CoordDtype::Float64);

    const std::vector<std::string>& coordNames() const { return coord_names_; }
    const std::string& name() const { return name_; }
    CoordDtype coordDtype() const { return coord_dtype_; }
    Eigen::Index ndim() const { return static_cast<Eigen::Index>(coord_names_.size()); }

    /**
     * @brief 轴名称对应的位置
     * @throw ConstructionError 不存在该轴
     */
    Eigen::Index index(const std::string& coord_name) const;

    bool hasCoord(const std::string& coord_name) const;

    /**
     * @brief 校验并转换坐标值
     *
     * 列数必须等于ndim，数值被转换到本坐标系的精度。
     *
     * @throw ValidationError 形状不匹配或数值无法用该精度表示
     */
    Coordinates checkedValues(const Coordinates& values) const;

    /**
     * @brief 仅改变精度的副本
     */
    CoordinateSystem withDtype(CoordDtype coord_dtype) const;

    bool operator==(const CoordinateSystem& other) const;
    bool operator!=(const CoordinateSystem& other) const { return !(*this == other); }

    /**
     * @brief 形如 CoordinateSystem(coord_names=('i', 'j'), name='', coord_dtype=float64)
     */
    std::string toString() const;

private:
    std::vector<std::string> coord_names_;
    std::string name_;
    CoordDtype coord_dtype_;
};

/**
 * @brief 坐标系的积：按顺序拼接各坐标系的轴，标签为"product"，精度取公共上界
 * @throw ConstructionError 拼接后轴名称重复
 * @throw PrecisionError 精度不兼容
 */
CoordinateSystem Product(const std::vector<CoordinateSystem>& coord_systems);

} // namespace reference
} // namespace coordmap
