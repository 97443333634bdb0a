/**
 * @file coord_dtype.hpp
 * @brief 坐标数值精度（dtype）与精度提升规则
 *
 * 坐标值在内存中统一以double存储，CoordDtype记录坐标系声明的数值精度，
 * 在求值时把数据强制转换到该精度可表示的值。
 *
 * 提升规则（SafeDtype）：
 * - 浮点与浮点：取较宽的浮点
 * - Float32与宽于16位的整数：Float64
 * - 有符号与无符号整数：能同时容纳两者的最窄有符号整数
 * - UInt64与任何有符号整数：没有公共整数精度，抛出PrecisionError
 *
 * 使用示例：
 * @code
 * auto dtype = SafeDtype({CoordDtype::Int16, CoordDtype::UInt16}); // Int32
 * auto f = SafeDtype({CoordDtype::Int32, CoordDtype::Float32});    // Float64
 * @endcode
 */
#pragma once

#include "../common/types.hpp"
#include <string>
#include <vector>
#include <initializer_list>

namespace coordmap {
namespace reference {

/**
 * @brief 坐标数值精度
 */
enum class CoordDtype {
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64
};

/**
 * @brief 精度类别
 */
enum class DtypeKind {
    SignedInteger,
    UnsignedInteger,
    Floating
};

DtypeKind kindOf(CoordDtype dtype);

/**
 * @brief 精度位宽
 */
int bitsOf(CoordDtype dtype);

bool isInteger(CoordDtype dtype);

/**
 * @brief 精度名称（"float64"、"int32"等）
 */
std::string toString(CoordDtype dtype);

/**
 * @brief 由名称解析精度
 * @throw PrecisionError 名称未知
 */
CoordDtype dtypeFromString(const std::string& name);

/**
 * @brief 计算一组精度的最小公共上界
 * @throw PrecisionError 集合为空或精度不兼容
 */
CoordDtype SafeDtype(const std::vector<CoordDtype>& dtypes);

inline CoordDtype SafeDtype(std::initializer_list<CoordDtype> dtypes) {
    return SafeDtype(std::vector<CoordDtype>(dtypes));
}

/**
 * @brief 把坐标值转换为指定精度可表示的值
 *
 * Float32按单精度舍入，超出单精度范围的有限值抛出ValidationError，inf与NaN保留；
 * 整数精度向零截断，非有限值或超出范围的值抛出ValidationError。
 */
Coordinates CoerceToDtype(const Coordinates& values, CoordDtype dtype);

} // namespace reference
} // namespace coordmap
