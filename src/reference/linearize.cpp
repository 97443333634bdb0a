/**
 * @file linearize.cpp
 * @brief 前向差分线性化实现
 */

#include "coordmap/reference/linearize.hpp"
#include "coordmap/common/exceptions.hpp"
#include "coordmap/utility/simple_logger.hpp"

namespace coordmap {
namespace reference {

AffineMatrix Linearize(const MappingFunction& function,
                       Eigen::Index ndim_in,
                       double step,
                       const std::optional<Point>& origin,
                       CoordDtype dtype) {
    if (!function) {
        throw ValidationError("linearize", "The function must be callable.");
    }
    if (ndim_in <= 0) {
        throw ValidationError("linearize", "ndim_in must be positive, got " + std::to_string(ndim_in));
    }

    const double h = CoerceToDtype(Coordinates::Constant(1, 1, step), dtype)(0, 0);
    if (h == 0.0) {
        throw ValidationError("linearize", "step is zero in " + toString(dtype));
    }

    Coordinates base = Coordinates::Zero(1, ndim_in);
    if (origin) {
        if (origin->size() != ndim_in) {
            throw ValidationError("linearize", "origin.shape != (" + std::to_string(ndim_in) + ",)");
        }
        base = CoerceToDtype(origin->transpose(), dtype);
    }

    const Coordinates b = function(base);
    if (b.rows() != 1) {
        throw ValidationError("linearize",
            "function returned " + std::to_string(b.rows()) + " rows for a single point");
    }
    const Eigen::Index ndim_out = b.cols();

    // 第i行为 origin + step * e_i
    Coordinates shifted = base.replicate(ndim_in, 1);
    shifted.diagonal().array() += h;
    const Coordinates y1 = function(shifted);
    if (y1.rows() != ndim_in || y1.cols() != ndim_out) {
        throw ValidationError("linearize", "function output shape changed between evaluations");
    }

    AffineMatrix C = AffineMatrix::Zero(ndim_out + 1, ndim_in + 1);
    C(ndim_out, ndim_in) = 1.0;
    C.topRightCorner(ndim_out, 1) = b.transpose();
    C.topLeftCorner(ndim_out, ndim_in) = (y1 - b.replicate(ndim_in, 1)).transpose() / h;

    LOG_COMPONENT_NAMED_TRACE("reference.linearize", "linearize: {} -> {} dims, step {}",
                              ndim_in, ndim_out, h);
    return C;
}

AffineTransform Linearize(const CoordinateMap& cmap,
                          double step,
                          const std::optional<Point>& origin) {
    MappingFunction checked = [cmap](const Coordinates& x) { return cmap(x); };
    // step和origin按映射输入的精度转换，与求值时看到的值一致
    AffineMatrix matrix = Linearize(checked, cmap.inputCoords().ndim(), step, origin,
                                    cmap.inputCoords().coordDtype());
    return AffineTransform(matrix, cmap.inputCoords(), cmap.outputCoords());
}

} // namespace reference
} // namespace coordmap
