/**
 * @file pca.cpp
 * @brief 主成分分析实现
 */

#include "coordmap/stats/pca.hpp"
#include "coordmap/common/exceptions.hpp"
#include "coordmap/utility/config_manager.hpp"
#include "coordmap/utility/simple_logger.hpp"
#include <Eigen/Eigenvalues>
#include <Eigen/QR>
#include <Eigen/SVD>
#include <cmath>

namespace coordmap {
namespace stats {

namespace {

const char* const LOGGER_NAME = "stats.pca";

Eigen::MatrixXd pseudoInverse(const Eigen::MatrixXd& matrix) {
    return Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd>(matrix).pseudoInverse();
}

/**
 * @brief 非正数的倒数记为0
 */
double positiveReciprocal(double value) {
    return value > 0.0 ? 1.0 / value : 0.0;
}

} // namespace

PcaOptions PcaOptions::FromConfig() {
    auto& config = utility::ConfigManager::getInstance();
    PcaOptions options;
    options.tol_ratio = config.getConfigValue<double>(
        utility::ConfigFileType::STATS, "stats.pca.tol_ratio", options.tol_ratio);
    options.standardize = config.getConfigValue<bool>(
        utility::ConfigFileType::STATS, "stats.pca.standardize", options.standardize);
    return options;
}

PcaResult Pca(const Eigen::MatrixXd& data, int axis, const PcaOptions& options) {
    const int normalized_axis = axis < 0 ? axis + 2 : axis;
    if (normalized_axis < 0 || normalized_axis > 1) {
        throw ValidationError("pca", "axis " + std::to_string(axis) + " out of range for 2-D data");
    }

    // 观测放在行上
    const Eigen::MatrixXd Y = normalized_axis == 0 ? data : Eigen::MatrixXd(data.transpose());
    const Eigen::Index nobs = Y.rows();
    const Eigen::Index nvar = Y.cols();
    if (nobs == 0 || nvar == 0) {
        throw ValidationError("pca", "data must not be empty");
    }

    // ==================== 投影矩阵 ====================

    Eigen::MatrixXd resid_projector = Eigen::MatrixXd::Identity(nobs, nobs);
    if (options.design_resid != DesignResid::None) {
        Eigen::MatrixXd Z = Eigen::MatrixXd::Ones(nobs, 1);
        if (options.design_resid == DesignResid::Matrix) {
            Z = options.design_resid_matrix;
            if (Z.rows() != nobs) {
                throw ValidationError("pca",
                    "design_resid must have " + std::to_string(nobs) + " rows, got " + std::to_string(Z.rows()));
            }
        }
        resid_projector -= Z * pseudoInverse(Z);
    }

    Eigen::MatrixXd keep_projector = Eigen::MatrixXd::Identity(nobs, nobs);
    if (options.design_keep) {
        const Eigen::MatrixXd& keep = *options.design_keep;
        if (keep.rows() != nobs) {
            throw ValidationError("pca",
                "design_keep must have " + std::to_string(nobs) + " rows, got " + std::to_string(keep.rows()));
        }
        keep_projector = keep * pseudoInverse(keep);
    }

    const Eigen::MatrixXd XZ = resid_projector * keep_projector;
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(XZ, Eigen::ComputeThinU);
    const Eigen::VectorXd& singular_values = svd.singularValues();
    const double smax = singular_values.size() > 0 ? singular_values.maxCoeff() : 0.0;
    if (smax <= 0.0) {
        throw ValidationError("pca", "projection of the design has rank zero");
    }

    Eigen::Index rank = 0;
    for (Eigen::Index i = 0; i < singular_values.size(); ++i) {
        if (singular_values(i) / smax > options.tol_ratio) {
            ++rank;
        }
    }

    // UX: rank x nobs，行是投影后列空间的正交基
    const Eigen::MatrixXd UX = svd.matrixU().leftCols(rank).transpose();

    // ==================== 协方差与特征分解 ====================

    Eigen::VectorXd scale = Eigen::VectorXd::Ones(nvar);
    if (options.standardize) {
        const Eigen::RowVectorXd S2 = (resid_projector * Y).colwise().squaredNorm();
        for (Eigen::Index i = 0; i < nvar; ++i) {
            scale(i) = positiveReciprocal(std::sqrt(S2(i)));
        }
    }

    Eigen::VectorXd weights = scale;
    if (options.mask) {
        const Eigen::VectorXd& mask = *options.mask;
        if (mask.size() != nvar) {
            throw ValidationError("pca",
                "mask must have " + std::to_string(nvar) + " entries, got " + std::to_string(mask.size()));
        }
        for (Eigen::Index i = 0; i < nvar; ++i) {
            weights(i) *= std::isnan(mask(i)) ? 0.0 : mask(i);
        }
    }

    const Eigen::MatrixXd YX = (UX * Y) * weights.asDiagonal();
    const Eigen::MatrixXd C = YX * YX.transpose();

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen_solver(C);
    if (eigen_solver.info() != Eigen::Success) {
        throw ValidationError("pca", "eigen-decomposition of the covariance did not converge");
    }

    // 特征值升序排列，翻转为降序
    const Eigen::VectorXd D = eigen_solver.eigenvalues().reverse();
    const Eigen::MatrixXd Vs = eigen_solver.eigenvectors().rowwise().reverse();

    if (D.sum() <= 0.0) {
        throw ValidationError("pca", "data has no variance in the projected space");
    }

    PcaResult result;
    result.axis = normalized_axis;
    result.pcnt_var = D * 100.0 / D.sum();
    result.basis_vectors = UX.transpose() * Vs;

    const Eigen::Index ncomp = options.ncomp.value_or(rank);
    if (ncomp < 0 || ncomp > rank) {
        throw ValidationError("pca",
            "ncomp " + std::to_string(ncomp) + " must be between 0 and rank " + std::to_string(rank));
    }

    // ==================== 分量投影 ====================

    Eigen::MatrixXd projections = result.basis_vectors.leftCols(ncomp).transpose() * Y;
    if (options.standardize) {
        projections = projections * scale.asDiagonal();
    }
    result.basis_projections = normalized_axis == 0 ? projections : Eigen::MatrixXd(projections.transpose());

    LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "pca: {} observations, {} variables, rank {}, ncomp {}",
                              nobs, nvar, rank, ncomp);
    return result;
}

} // namespace stats
} // namespace coordmap
