/**
 * @file algebra.cpp
 * @brief 坐标映射代数实现
 */

#include "coordmap/reference/algebra.hpp"
#include "coordmap/common/exceptions.hpp"
#include "coordmap/utility/simple_logger.hpp"
#include <algorithm>

namespace coordmap {
namespace reference {

namespace {

const char* const LOGGER_NAME = "reference.algebra";

/**
 * @brief 积映射的函数对象，按列切分输入并逐个调用各映射
 */
struct ProductFunction {
    std::vector<CoordinateMap> factors;

    Coordinates operator()(const Coordinates& x) const {
        Eigen::Index ndim_in = 0;
        for (const auto& factor : factors) {
            ndim_in += factor.inputCoords().ndim();
        }
        if (x.cols() != ndim_in) {
            throw ValidationError("Product",
                "Expected " + std::to_string(ndim_in) + " input columns, got " + std::to_string(x.cols()));
        }

        std::vector<Coordinates> parts;
        parts.reserve(factors.size());
        Eigen::Index in_offset = 0;
        Eigen::Index ndim_out = 0;
        for (const auto& factor : factors) {
            const Eigen::Index n = factor.inputCoords().ndim();
            parts.push_back(factor(x.middleCols(in_offset, n)));
            in_offset += n;
            ndim_out += parts.back().cols();
        }

        Coordinates y(x.rows(), ndim_out);
        Eigen::Index out_offset = 0;
        for (const auto& part : parts) {
            y.middleCols(out_offset, part.cols()) = part;
            out_offset += part.cols();
        }
        return y;
    }
};

bool allAffine(const std::vector<CoordinateMap>& cmaps) {
    return std::all_of(cmaps.begin(), cmaps.end(),
                       [](const CoordinateMap& cmap) { return cmap.isAffine(); });
}

} // namespace

CoordinateMap Compose(const std::vector<CoordinateMap>& cmaps) {
    if (cmaps.empty()) {
        throw CompositionError("compose", "At least one coordinate map is required");
    }

    // 相邻映射在接缝处的坐标系必须一致
    for (size_t i = cmaps.size() - 1; i > 0; --i) {
        const auto& m = cmaps[i - 1];
        const auto& cmap = cmaps[i];
        if (m.inputCoords() != cmap.outputCoords()) {
            throw CompositionError("compose",
                "input and output coordinates do not match: input=" + m.inputCoords().toString() +
                ", output=" + cmap.outputCoords().toString());
        }
    }

    const CoordinateSystem& input_coords = cmaps.back().inputCoords();
    const CoordinateSystem& output_coords = cmaps.front().outputCoords();

    if (allAffine(cmaps)) {
        AffineMatrix matrix = cmaps.front().asAffine()->affine();
        for (size_t i = 1; i < cmaps.size(); ++i) {
            matrix = matrix * cmaps[i].asAffine()->affine();
        }
        LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "compose: {} affine maps, result {}x{}",
                                  cmaps.size(), matrix.rows(), matrix.cols());
        return AffineTransform(matrix, input_coords, output_coords, input_coords.coordDtype());
    }

    ComposedFunction forward;
    for (auto it = cmaps.rbegin(); it != cmaps.rend(); ++it) {
        forward.steps.push_back(it->function());
    }

    ComposedFunction backward;
    for (const auto& cmap : cmaps) {
        MappingFunction inverse_function = cmap.inverseFunction();
        if (!inverse_function) {
            backward.steps.clear();
            break;
        }
        backward.steps.push_back(std::move(inverse_function));
    }

    LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "compose: {} maps, generic function, invertible={}",
                              cmaps.size(), !backward.steps.empty());

    MappingFunction inverse = nullptr;
    if (!backward.steps.empty()) {
        inverse = backward;
    }
    return CoordinateMap(forward, input_coords, output_coords, inverse);
}

CoordinateMap Product(const std::vector<CoordinateMap>& cmaps) {
    if (cmaps.empty()) {
        throw CompositionError("product", "At least one coordinate map is required");
    }

    std::vector<CoordinateSystem> inputs;
    std::vector<CoordinateSystem> outputs;
    for (const auto& cmap : cmaps) {
        inputs.push_back(cmap.inputCoords());
        outputs.push_back(cmap.outputCoords());
    }
    CoordinateSystem input_coords = Product(inputs);
    CoordinateSystem output_coords = Product(outputs);

    const Eigen::Index ndim_in = input_coords.ndim();
    const Eigen::Index ndim_out = output_coords.ndim();

    if (allAffine(cmaps)) {
        // 分块对角的齐次矩阵，平移部分放在最后一列
        AffineMatrix matrix = AffineMatrix::Zero(ndim_out + 1, ndim_in + 1);
        matrix(ndim_out, ndim_in) = 1.0;

        Eigen::Index row = 0;
        Eigen::Index col = 0;
        for (const auto& cmap : cmaps) {
            const AffineMatrix block = cmap.asAffine()->affine();
            const Eigen::Index n_out = block.rows() - 1;
            const Eigen::Index n_in = block.cols() - 1;
            matrix.block(row, col, n_out, n_in) = block.topLeftCorner(n_out, n_in);
            matrix.block(row, ndim_in, n_out, 1) = block.topRightCorner(n_out, 1);
            row += n_out;
            col += n_in;
        }

        LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "product: {} affine maps, result {}x{}",
                                  cmaps.size(), matrix.rows(), matrix.cols());
        return AffineTransform(matrix, input_coords, output_coords, input_coords.coordDtype());
    }

    MappingFunction inverse = nullptr;
    std::vector<CoordinateMap> inverse_factors;
    for (const auto& cmap : cmaps) {
        auto inv = cmap.inverse();
        if (!inv) {
            inverse_factors.clear();
            break;
        }
        inverse_factors.push_back(*inv);
    }
    if (!inverse_factors.empty()) {
        inverse = ProductFunction{inverse_factors};
    }

    LOG_COMPONENT_NAMED_DEBUG(LOGGER_NAME, "product: {} maps, generic function, invertible={}",
                              cmaps.size(), static_cast<bool>(inverse));
    return CoordinateMap(ProductFunction{cmaps}, input_coords, output_coords, inverse);
}

CoordinateMap Concat(const CoordinateMap& cmap, const std::string& axis_name, bool append) {
    CoordinateSystem coords({axis_name});
    AffineTransform identity(AffineMatrix::Identity(2, 2), coords, coords);
    if (append) {
        return Product({cmap, identity});
    }
    return Product({identity, cmap});
}

} // namespace reference
} // namespace coordmap
