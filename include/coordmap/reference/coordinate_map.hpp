/**
 * @file coordinate_map.hpp
 * @brief 坐标映射与仿射变换
 *
 * CoordinateMap由输入坐标系、输出坐标系、正向函数和可选的逆函数组成，
 * 例如把体素网格坐标(i, j, k)映射到物理空间坐标(x, y, z)。
 * AffineTransform是可以用齐次矩阵表示的特例，其逆由矩阵求逆得到。
 *
 * 设计要点：
 * - 值对象：构造后不可变，所有代数运算都返回新的实例
 * - 带标签的表示：内部是 Affine{矩阵} 或 General{函数, 逆函数} 之一，
 *   组合运算据此选择精确的矩阵代数或通用的函数组合
 * - 构造即自检：用一批零向量调用正向函数，维度错误在构造时暴露
 * - 没有逆映射是正常结果（std::nullopt），不是异常
 *
 * 使用示例：
 * @code
 * auto voxel = CoordinateSystem::FromLetters("ijk");
 * auto world = CoordinateSystem::FromLetters("xyz");
 *
 * AffineMatrix m = Eigen::Vector4d(1, 2, 3, 1).asDiagonal();
 * AffineTransform scale(m, voxel, world);
 *
 * Coordinates y = scale.evaluatePoint(Eigen::Vector3d(1, 1, 1)); // [[1, 2, 3]]
 * if (auto inv = scale.inverse()) {
 *     Coordinates x = (*inv)(y);                                  // [[1, 1, 1]]
 * }
 *
 * auto renamed = scale.renamedInput({{"i", "phase"}});
 * auto reversed = scale.reorderedInput();                         // (k, j, i)
 * @endcode
 */
#pragma once

#include "coordinate_system.hpp"
#include "mapping_functions.hpp"
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace coordmap {
namespace reference {

class AffineTransform;

/**
 * @brief 轴的重排顺序
 *
 * 可以为空（表示逆序）、轴名称序列或轴位置序列。
 * 轴位置可以为负数，-1表示最后一个轴。
 */
class AxisOrder {
public:
    AxisOrder() = default;
    AxisOrder(std::initializer_list<std::string> names) : names_(names) {}
    AxisOrder(std::initializer_list<int> positions) : positions_(positions) {}
    AxisOrder(std::vector<std::string> names) : names_(std::move(names)) {}
    AxisOrder(std::vector<int> positions) : positions_(std::move(positions)) {}

    /**
     * @brief 解析为新顺序中每个位置对应的原轴位置
     * @throw ConstructionError 不是原坐标系轴的一个排列
     */
    std::vector<Eigen::Index> resolve(const CoordinateSystem& coords) const;

private:
    std::vector<std::string> names_;
    std::vector<int> positions_;
};

/**
 * @brief 轴重命名表：旧名称 -> 新名称
 */
using AxisRenaming = std::map<std::string, std::string>;

/**
 * @brief 坐标映射
 */
class CoordinateMap {
public:
    /**
     * @brief 由函数构造坐标映射
     * @param function 正向函数
     * @param input_coords 输入坐标系
     * @param output_coords 输出坐标系
     * @param inverse_function 逆函数（可为空）
     * @throw ConstructionError 正向函数为空
     * @note 构造时用零向量批量调用一次正向函数，函数抛出的异常原样传播
     */
    CoordinateMap(MappingFunction function,
                  CoordinateSystem input_coords,
                  CoordinateSystem output_coords,
                  MappingFunction inverse_function = nullptr);

    const CoordinateSystem& inputCoords() const { return input_coords_; }
    const CoordinateSystem& outputCoords() const { return output_coords_; }

    /**
     * @brief (输入维数, 输出维数)
     */
    std::pair<Eigen::Index, Eigen::Index> ndims() const {
        return {input_coords_.ndim(), output_coords_.ndim()};
    }

    /**
     * @brief 正向函数（不做坐标系校验）
     */
    MappingFunction function() const;

    /**
     * @brief 逆函数，不存在时为空
     */
    MappingFunction inverseFunction() const;

    /**
     * @brief 逆映射：输入输出坐标系互换、正逆函数互换
     * @return 没有逆函数（或仿射矩阵奇异）时为std::nullopt
     */
    std::optional<CoordinateMap> inverse() const;

    bool isAffine() const { return std::holds_alternative<AffineForm>(form_); }

    /**
     * @brief 以AffineTransform形式访问
     * @return 非仿射映射时为std::nullopt
     */
    std::optional<AffineTransform> asAffine() const;

    /**
     * @brief 对坐标批量求值
     *
     * 输入按输入坐标系校验，结果按输出坐标系校验并转换到输出精度。
     *
     * @param x N x ndim_in 的坐标批量
     * @return N x ndim_out 的坐标批量
     * @throw ValidationError 形状或精度不匹配
     */
    Coordinates operator()(const Coordinates& x) const;

    Coordinates evaluate(const Coordinates& x) const { return (*this)(x); }

    /**
     * @brief 对单个点求值，结果为一行的批量
     */
    Coordinates evaluatePoint(const Point& point) const;

    /**
     * @brief 复制：共享函数对象，坐标系等元数据独立
     */
    CoordinateMap copy() const { return *this; }

    /**
     * @brief 重排输入轴
     * @param order 新顺序，默认逆序
     * @param name 新输入坐标系的标签，默认沿用原标签
     */
    CoordinateMap reorderedInput(const AxisOrder& order = {}, const std::string& name = "") const;

    /**
     * @brief 重排输出轴
     */
    CoordinateMap reorderedOutput(const AxisOrder& order = {}, const std::string& name = "") const;

    /**
     * @brief 重命名部分输入轴，轴的顺序不变
     * @throw ConstructionError 键不是当前的输入轴名称
     */
    CoordinateMap renamedInput(const AxisRenaming& newnames, const std::string& name = "") const;

    /**
     * @brief 重命名部分输出轴
     * @throw ConstructionError 键不是当前的输出轴名称
     */
    CoordinateMap renamedOutput(const AxisRenaming& newnames, const std::string& name = "") const;

    std::string toString() const;

protected:
    struct AffineForm {
        AffineMatrix matrix;
        AffineFunction function;
    };

    struct FunctionForm {
        MappingFunction function;
        MappingFunction inverse_function;
    };

    using Form = std::variant<AffineForm, FunctionForm>;

    CoordinateMap(CoordinateSystem input_coords, CoordinateSystem output_coords, Form form);

    /**
     * @brief 用零向量批量验证正向函数的输入输出维度
     */
    void checkFunction() const;

    Form form_;
    CoordinateSystem input_coords_;
    CoordinateSystem output_coords_;
};

/**
 * @brief 仿射变换
 *
 * 齐次矩阵形如 [[A, b], [0, 1]]，正向函数为 y = x * A^T + b。
 * 矩阵与两个坐标系的精度在构造时统一提升为公共精度，
 * 内部保存的坐标系仅精度可能与传入的不同。
 */
class AffineTransform : public CoordinateMap {
public:
    /**
     * @brief 由齐次矩阵构造
     * @param affine (ndim_out+1) x (ndim_in+1) 的齐次矩阵
     * @param input_coords 输入坐标系
     * @param output_coords 输出坐标系
     * @param affine_dtype 矩阵本身的精度
     * @throw ConstructionError 矩阵形状不符或最后一行不是 [0, ..., 0, 1]
     * @throw PrecisionError 精度无法统一
     */
    AffineTransform(const AffineMatrix& affine,
                    const CoordinateSystem& input_coords,
                    const CoordinateSystem& output_coords,
                    CoordDtype affine_dtype = CoordDtype::Float64);

    // ==================== 静态工厂方法 ====================

    /**
     * @brief 由轴名称和齐次矩阵创建，坐标系标签为"input"/"output"
     * @throw ConstructionError 轴数与矩阵形状不符
     */
    static AffineTransform FromParams(const std::vector<std::string>& innames,
                                      const std::vector<std::string>& outnames,
                                      const AffineMatrix& params);

    /**
     * @brief 由轴名称和 (A, b) 创建
     */
    static AffineTransform FromParams(const std::vector<std::string>& innames,
                                      const std::vector<std::string>& outnames,
                                      const Eigen::MatrixXd& linear,
                                      const Eigen::VectorXd& translation);

    /**
     * @brief 网格间距变换：线性部分为diag(step)，平移为start
     * @throw ConstructionError 输入输出轴数不同
     */
    static AffineTransform FromStartStep(const std::vector<std::string>& innames,
                                         const std::vector<std::string>& outnames,
                                         const Eigen::VectorXd& start,
                                         const Eigen::VectorXd& step);

    /**
     * @brief 恒等变换，输入输出轴名称相同
     */
    static AffineTransform Identity(const std::vector<std::string>& names);

    // ==================== 基本操作 ====================

    const AffineMatrix& affine() const { return std::get<AffineForm>(form_).matrix; }

    /**
     * @brief 矩阵求逆得到的逆变换
     * @return 矩阵奇异或非方阵时为std::nullopt
     */
    std::optional<AffineTransform> inverse() const;

    /**
     * @brief 深拷贝
     */
    AffineTransform copy() const { return *this; }

    std::string toString() const;

private:
    friend class CoordinateMap;

    struct PromotedTag {};

    AffineTransform(const AffineMatrix& affine,
                    const CoordinateSystem& input_coords,
                    const CoordinateSystem& output_coords,
                    CoordDtype dtype,
                    PromotedTag);

    explicit AffineTransform(const CoordinateMap& validated) : CoordinateMap(validated) {}
};

} // namespace reference
} // namespace coordmap
