/**
 * @file pca.hpp
 * @brief 主成分分析
 *
 * 对二维数据沿观测轴做PCA：先把数据投影到 design_keep 的列空间，
 * 再投影到 design_resid 列空间的正交补上，对投影后（可选标准化、加权）
 * 数据的协方差矩阵做特征分解。
 *
 * 使用示例：
 * @code
 * // 每一行是一个时间点，每一列是一个体素
 * Eigen::MatrixXd data = ...;
 * auto options = PcaOptions::FromConfig();
 * options.ncomp = 3;
 * auto result = Pca(data, 0, options);
 * // result.basis_vectors:     时间点数 x 秩
 * // result.basis_projections: 3 x 体素数
 * @endcode
 */
#pragma once

#include "../common/types.hpp"
#include <optional>

namespace coordmap {
namespace stats {

/**
 * @brief 残差投影方式
 */
enum class DesignResid {
    Mean,    ///< 去除均值（全1列向量）
    None,    ///< 不做第二次投影
    Matrix   ///< 使用 PcaOptions::design_resid_matrix
};

/**
 * @brief PCA参数
 */
struct PcaOptions {
    std::optional<Eigen::Index> ncomp;              ///< 返回的投影分量数，默认等于有效秩
    bool standardize = true;                        ///< 是否按残差平方和标准化每一列
    std::optional<Eigen::MatrixXd> design_keep;     ///< 保留的列空间，默认为单位阵
    DesignResid design_resid = DesignResid::Mean;   ///< 残差投影方式
    Eigen::MatrixXd design_resid_matrix;            ///< design_resid为Matrix时使用
    double tol_ratio = 0.01;                        ///< 有效秩判定阈值 s / s.max > tol_ratio
    std::optional<Eigen::VectorXd> mask;            ///< 每个非观测索引的权重，NaN按0处理

    /**
     * @brief 从配置（stats.pca）读取 tol_ratio 与 standardize
     */
    static PcaOptions FromConfig();
};

/**
 * @brief PCA结果
 */
struct PcaResult {
    Eigen::MatrixXd basis_vectors;      ///< 观测数 x 秩，按方差降序
    Eigen::VectorXd pcnt_var;           ///< 每个分量解释的方差百分比，和为100
    Eigen::MatrixXd basis_projections;  ///< 分量沿axis排列：axis为0时 ncomp x 列数，为1时 行数 x ncomp
    int axis = 0;                       ///< 非负的观测轴
};

/**
 * @brief 计算二维数据的主成分
 * @param data 二维数据
 * @param axis 观测轴（0或1，允许负数索引）
 * @param options 参数
 * @throw ValidationError axis越界、ncomp超过秩、设计矩阵或mask形状不符、投影的秩为零
 */
PcaResult Pca(const Eigen::MatrixXd& data, int axis = 0, const PcaOptions& options = PcaOptions());

} // namespace stats
} // namespace coordmap
