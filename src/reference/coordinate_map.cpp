/**
 * @file coordinate_map.cpp
 * @brief 坐标映射与仿射变换实现
 */

#include "coordmap/reference/coordinate_map.hpp"
#include "coordmap/reference/algebra.hpp"
#include "coordmap/common/exceptions.hpp"
#include "coordmap/utility/config_manager.hpp"
#include "coordmap/utility/simple_logger.hpp"
#include <Eigen/LU>
#include <algorithm>
#include <sstream>

namespace coordmap {
namespace reference {

namespace {

const char* const LOGGER_NAME = "reference.map";

std::string formatMatrix(const Eigen::MatrixXd& matrix) {
    static const Eigen::IOFormat fmt(Eigen::StreamPrecision, 0, ", ", ",\n          ", "[", "]", "[", "]");
    std::ostringstream oss;
    oss << matrix.format(fmt);
    return oss.str();
}

std::vector<std::string> renamedAxes(const CoordinateSystem& coords,
                                     const AxisRenaming& newnames,
                                     const std::string& side) {
    for (const auto& [old_name, new_name] : newnames) {
        if (!coords.hasCoord(old_name)) {
            throw ConstructionError("CoordinateMap", "no " + side + " coordinate named " + old_name);
        }
    }

    std::vector<std::string> result;
    result.reserve(coords.coordNames().size());
    for (const auto& coord_name : coords.coordNames()) {
        auto it = newnames.find(coord_name);
        result.push_back(it != newnames.end() ? it->second : coord_name);
    }
    return result;
}

} // namespace

// ============================================================================
// AxisOrder
// ============================================================================

std::vector<Eigen::Index> AxisOrder::resolve(const CoordinateSystem& coords) const {
    const Eigen::Index ndim = coords.ndim();
    std::vector<Eigen::Index> order;

    if (!names_.empty()) {
        for (const auto& name : names_) {
            order.push_back(coords.index(name));
        }
    } else if (!positions_.empty()) {
        for (int position : positions_) {
            // 负数从末尾计数
            const Eigen::Index resolved = position < 0 ? position + ndim : position;
            if (resolved < 0 || resolved >= ndim) {
                throw ConstructionError("AxisOrder",
                    "Axis position " + std::to_string(position) + " out of range for " + coords.toString());
            }
            order.push_back(resolved);
        }
    } else {
        for (Eigen::Index i = ndim - 1; i >= 0; --i) {
            order.push_back(i);
        }
    }

    std::vector<Eigen::Index> sorted = order;
    std::sort(sorted.begin(), sorted.end());
    bool is_permutation = static_cast<Eigen::Index>(sorted.size()) == ndim;
    for (size_t i = 0; is_permutation && i < sorted.size(); ++i) {
        is_permutation = sorted[i] == static_cast<Eigen::Index>(i);
    }
    if (!is_permutation) {
        throw ConstructionError("AxisOrder",
            "Order must be a permutation of the axes of " + coords.toString());
    }

    return order;
}

// ============================================================================
// CoordinateMap
// ============================================================================

CoordinateMap::CoordinateMap(MappingFunction function,
                             CoordinateSystem input_coords,
                             CoordinateSystem output_coords,
                             MappingFunction inverse_function)
    : form_(FunctionForm{std::move(function), std::move(inverse_function)}),
      input_coords_(std::move(input_coords)),
      output_coords_(std::move(output_coords)) {
    if (!std::get<FunctionForm>(form_).function) {
        throw ConstructionError("CoordinateMap", "The function must be callable.");
    }
    checkFunction();
}

CoordinateMap::CoordinateMap(CoordinateSystem input_coords, CoordinateSystem output_coords, Form form)
    : form_(std::move(form)),
      input_coords_(std::move(input_coords)),
      output_coords_(std::move(output_coords)) {
}

void CoordinateMap::checkFunction() const {
    Coordinates probe = Coordinates::Zero(constants::PROBE_ROWS, input_coords_.ndim());
    try {
        (*this)(probe);
    } catch (const std::exception& e) {
        LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "Construction probe failed for {} -> {}: {}",
                                  input_coords_.toString(), output_coords_.toString(), e.what());
        throw;
    }
}

MappingFunction CoordinateMap::function() const {
    if (const auto* affine = std::get_if<AffineForm>(&form_)) {
        return affine->function;
    }
    return std::get<FunctionForm>(form_).function;
}

MappingFunction CoordinateMap::inverseFunction() const {
    if (isAffine()) {
        auto inv = asAffine()->inverse();
        if (!inv) {
            return nullptr;
        }
        return inv->function();
    }
    return std::get<FunctionForm>(form_).inverse_function;
}

std::optional<CoordinateMap> CoordinateMap::inverse() const {
    if (isAffine()) {
        auto inv = asAffine()->inverse();
        if (!inv) {
            return std::nullopt;
        }
        return CoordinateMap(*inv);
    }

    const auto& form = std::get<FunctionForm>(form_);
    if (!form.inverse_function) {
        return std::nullopt;
    }
    return CoordinateMap(form.inverse_function, output_coords_, input_coords_, form.function);
}

std::optional<AffineTransform> CoordinateMap::asAffine() const {
    if (!isAffine()) {
        return std::nullopt;
    }
    return AffineTransform(*this);
}

Coordinates CoordinateMap::operator()(const Coordinates& x) const {
    Coordinates in_vals = input_coords_.checkedValues(x);
    Coordinates out_vals;
    if (const auto* affine = std::get_if<AffineForm>(&form_)) {
        out_vals = affine->function(in_vals);
    } else {
        out_vals = std::get<FunctionForm>(form_).function(in_vals);
    }
    return output_coords_.checkedValues(out_vals);
}

Coordinates CoordinateMap::evaluatePoint(const Point& point) const {
    Coordinates row = point.transpose();
    return (*this)(row);
}

CoordinateMap CoordinateMap::reorderedInput(const AxisOrder& order, const std::string& name) const {
    const auto perm = order.resolve(input_coords_);
    const Eigen::Index ndim = input_coords_.ndim();

    std::vector<std::string> newaxes;
    for (auto j : perm) {
        newaxes.push_back(input_coords_.coordNames()[j]);
    }
    CoordinateSystem new_input(newaxes, name.empty() ? input_coords_.name() : name,
                               input_coords_.coordDtype());

    // 新输入的第i个轴对应原输入的第perm[i]个轴
    AffineMatrix matrix = AffineMatrix::Zero(ndim + 1, ndim + 1);
    matrix(ndim, ndim) = 1.0;
    for (Eigen::Index i = 0; i < ndim; ++i) {
        matrix(perm[i], i) = 1.0;
    }

    AffineTransform permutation(matrix, new_input, input_coords_, input_coords_.coordDtype());
    return Compose({*this, permutation});
}

CoordinateMap CoordinateMap::reorderedOutput(const AxisOrder& order, const std::string& name) const {
    const auto perm = order.resolve(output_coords_);
    const Eigen::Index ndim = output_coords_.ndim();

    std::vector<std::string> newaxes;
    for (auto j : perm) {
        newaxes.push_back(output_coords_.coordNames()[j]);
    }
    CoordinateSystem new_output(newaxes, name.empty() ? output_coords_.name() : name,
                                output_coords_.coordDtype());

    AffineMatrix matrix = AffineMatrix::Zero(ndim + 1, ndim + 1);
    matrix(ndim, ndim) = 1.0;
    for (Eigen::Index i = 0; i < ndim; ++i) {
        matrix(i, perm[i]) = 1.0;
    }

    AffineTransform permutation(matrix, output_coords_, new_output, output_coords_.coordDtype());
    return Compose({permutation, *this});
}

CoordinateMap CoordinateMap::renamedInput(const AxisRenaming& newnames, const std::string& name) const {
    CoordinateSystem new_input(renamedAxes(input_coords_, newnames, "input"),
                               name.empty() ? input_coords_.name() : name,
                               input_coords_.coordDtype());

    const Eigen::Index ndim = input_coords_.ndim();
    AffineTransform identity(AffineMatrix::Identity(ndim + 1, ndim + 1), new_input, input_coords_,
                             input_coords_.coordDtype());
    return Compose({*this, identity});
}

CoordinateMap CoordinateMap::renamedOutput(const AxisRenaming& newnames, const std::string& name) const {
    CoordinateSystem new_output(renamedAxes(output_coords_, newnames, "output"),
                                name.empty() ? output_coords_.name() : name,
                                output_coords_.coordDtype());

    const Eigen::Index ndim = output_coords_.ndim();
    AffineTransform identity(AffineMatrix::Identity(ndim + 1, ndim + 1), output_coords_, new_output,
                             output_coords_.coordDtype());
    return Compose({identity, *this});
}

std::string CoordinateMap::toString() const {
    if (isAffine()) {
        return asAffine()->toString();
    }

    std::ostringstream oss;
    oss << "CoordinateMap(\n   function,\n   input_coords=" << input_coords_.toString()
        << ",\n   output_coords=" << output_coords_.toString() << "\n  )";
    return oss.str();
}

// ============================================================================
// AffineTransform
// ============================================================================

AffineTransform::AffineTransform(const AffineMatrix& affine,
                                 const CoordinateSystem& input_coords,
                                 const CoordinateSystem& output_coords,
                                 CoordDtype affine_dtype)
    : AffineTransform(affine, input_coords, output_coords,
                      SafeDtype({affine_dtype, input_coords.coordDtype(), output_coords.coordDtype()}),
                      PromotedTag{}) {
}

AffineTransform::AffineTransform(const AffineMatrix& affine,
                                 const CoordinateSystem& input_coords,
                                 const CoordinateSystem& output_coords,
                                 CoordDtype dtype,
                                 PromotedTag)
    : CoordinateMap(input_coords.withDtype(dtype), output_coords.withDtype(dtype), Form{}) {
    const Eigen::Index ndim_in = input_coords_.ndim();
    const Eigen::Index ndim_out = output_coords_.ndim();

    if (affine.rows() != ndim_out + 1 || affine.cols() != ndim_in + 1) {
        throw ConstructionError("AffineTransform", "coordinate lengths do not match affine matrix shape");
    }

    AffineMatrix matrix = CoerceToDtype(affine, dtype);

    Eigen::RowVectorXd homogeneous = Eigen::RowVectorXd::Zero(ndim_in + 1);
    homogeneous(ndim_in) = 1.0;
    if ((matrix.row(ndim_out) - homogeneous).cwiseAbs().maxCoeff() > constants::AFFINE_TOLERANCE) {
        throw ConstructionError("AffineTransform", "last row of affine matrix must be [0, ..., 0, 1]");
    }

    AffineFunction function = AffineFunction::FromHomogeneous(matrix);
    form_ = AffineForm{std::move(matrix), std::move(function)};
    checkFunction();
}

AffineTransform AffineTransform::FromParams(const std::vector<std::string>& innames,
                                            const std::vector<std::string>& outnames,
                                            const AffineMatrix& params) {
    if (params.rows() != static_cast<Eigen::Index>(outnames.size()) + 1 ||
        params.cols() != static_cast<Eigen::Index>(innames.size()) + 1) {
        throw ConstructionError("AffineTransform", "shape and number of axis names do not agree");
    }

    CoordinateSystem input_coords(innames, "input");
    CoordinateSystem output_coords(outnames, "output");
    return AffineTransform(params, input_coords, output_coords);
}

AffineTransform AffineTransform::FromParams(const std::vector<std::string>& innames,
                                            const std::vector<std::string>& outnames,
                                            const Eigen::MatrixXd& linear,
                                            const Eigen::VectorXd& translation) {
    return FromParams(innames, outnames, FromMatrixVector(linear, translation));
}

AffineTransform AffineTransform::FromStartStep(const std::vector<std::string>& innames,
                                               const std::vector<std::string>& outnames,
                                               const Eigen::VectorXd& start,
                                               const Eigen::VectorXd& step) {
    if (innames.size() != outnames.size()) {
        throw ConstructionError("AffineTransform", "len(innames) != len(outnames)");
    }
    Eigen::MatrixXd linear = step.asDiagonal();
    return FromParams(innames, outnames, linear, start);
}

AffineTransform AffineTransform::Identity(const std::vector<std::string>& names) {
    const auto n = static_cast<Eigen::Index>(names.size());
    return FromStartStep(names, names, Eigen::VectorXd::Zero(n), Eigen::VectorXd::Ones(n));
}

std::optional<AffineTransform> AffineTransform::inverse() const {
    const AffineMatrix& matrix = affine();
    if (matrix.rows() != matrix.cols()) {
        LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "No inverse for non-square affine ({}x{})",
                                  matrix.rows(), matrix.cols());
        return std::nullopt;
    }

    const double threshold = utility::ConfigManager::getInstance().getConfigValue<double>(
        utility::ConfigFileType::REFERENCE, "reference.affine.singular_threshold", 0.0);

    Eigen::FullPivLU<Eigen::MatrixXd> lu(matrix);
    if (threshold > 0.0) {
        lu.setThreshold(threshold);
    }
    if (!lu.isInvertible()) {
        LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "No inverse for singular affine, rank {}", lu.rank());
        return std::nullopt;
    }

    AffineMatrix inv = lu.inverse();
    const Eigen::Index last = inv.rows() - 1;
    inv.row(last).setZero();
    inv(last, last) = 1.0;

    const CoordDtype dtype = isInteger(input_coords_.coordDtype()) ? CoordDtype::Float64
                                                                   : input_coords_.coordDtype();
    return AffineTransform(inv, output_coords_, input_coords_, dtype);
}

std::string AffineTransform::toString() const {
    std::ostringstream oss;
    oss << "AffineTransform(\n   affine=" << formatMatrix(affine())
        << ",\n   input_coords=" << input_coords_.toString()
        << ",\n   output_coords=" << output_coords_.toString() << "\n)";
    return oss.str();
}

} // namespace reference
} // namespace coordmap
