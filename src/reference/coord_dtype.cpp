/**
 * @file coord_dtype.cpp
 * @brief 坐标数值精度实现
 */

#include "coordmap/reference/coord_dtype.hpp"
#include "coordmap/common/exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace coordmap {
namespace reference {

namespace {

CoordDtype signedOfBits(int bits) {
    switch (bits) {
        case 8:  return CoordDtype::Int8;
        case 16: return CoordDtype::Int16;
        case 32: return CoordDtype::Int32;
        default: return CoordDtype::Int64;
    }
}

CoordDtype unsignedOfBits(int bits) {
    switch (bits) {
        case 8:  return CoordDtype::UInt8;
        case 16: return CoordDtype::UInt16;
        case 32: return CoordDtype::UInt32;
        default: return CoordDtype::UInt64;
    }
}

} // namespace

DtypeKind kindOf(CoordDtype dtype) {
    switch (dtype) {
        case CoordDtype::Int8:
        case CoordDtype::Int16:
        case CoordDtype::Int32:
        case CoordDtype::Int64:
            return DtypeKind::SignedInteger;
        case CoordDtype::UInt8:
        case CoordDtype::UInt16:
        case CoordDtype::UInt32:
        case CoordDtype::UInt64:
            return DtypeKind::UnsignedInteger;
        default:
            return DtypeKind::Floating;
    }
}

int bitsOf(CoordDtype dtype) {
    switch (dtype) {
        case CoordDtype::Int8:
        case CoordDtype::UInt8:   return 8;
        case CoordDtype::Int16:
        case CoordDtype::UInt16:  return 16;
        case CoordDtype::Int32:
        case CoordDtype::UInt32:
        case CoordDtype::Float32: return 32;
        default:                  return 64;
    }
}

bool isInteger(CoordDtype dtype) {
    return kindOf(dtype) != DtypeKind::Floating;
}

std::string toString(CoordDtype dtype) {
    switch (dtype) {
        case CoordDtype::Int8:    return "int8";
        case CoordDtype::Int16:   return "int16";
        case CoordDtype::Int32:   return "int32";
        case CoordDtype::Int64:   return "int64";
        case CoordDtype::UInt8:   return "uint8";
        case CoordDtype::UInt16:  return "uint16";
        case CoordDtype::UInt32:  return "uint32";
        case CoordDtype::UInt64:  return "uint64";
        case CoordDtype::Float32: return "float32";
        case CoordDtype::Float64: return "float64";
        default:                  return "unknown";
    }
}

CoordDtype dtypeFromString(const std::string& name) {
    if (name == "int8") return CoordDtype::Int8;
    if (name == "int16") return CoordDtype::Int16;
    if (name == "int32") return CoordDtype::Int32;
    if (name == "int64") return CoordDtype::Int64;
    if (name == "uint8") return CoordDtype::UInt8;
    if (name == "uint16") return CoordDtype::UInt16;
    if (name == "uint32") return CoordDtype::UInt32;
    if (name == "uint64") return CoordDtype::UInt64;
    if (name == "float32") return CoordDtype::Float32;
    if (name == "float64" || name == "float") return CoordDtype::Float64;

    throw PrecisionError("dtype", "Unknown dtype name: " + name);
}

CoordDtype SafeDtype(const std::vector<CoordDtype>& dtypes) {
    if (dtypes.empty()) {
        throw PrecisionError("dtype", "Cannot promote an empty set of dtypes");
    }

    int signed_bits = 0;
    int unsigned_bits = 0;
    int float_bits = 0;
    for (auto dtype : dtypes) {
        switch (kindOf(dtype)) {
            case DtypeKind::SignedInteger:
                signed_bits = std::max(signed_bits, bitsOf(dtype));
                break;
            case DtypeKind::UnsignedInteger:
                unsigned_bits = std::max(unsigned_bits, bitsOf(dtype));
                break;
            case DtypeKind::Floating:
                float_bits = std::max(float_bits, bitsOf(dtype));
                break;
        }
    }

    if (float_bits > 0) {
        if (float_bits == 64) {
            return CoordDtype::Float64;
        }
        // 单精度只能精确容纳16位以内的整数
        return std::max(signed_bits, unsigned_bits) <= 16 ? CoordDtype::Float32
                                                          : CoordDtype::Float64;
    }

    if (signed_bits == 0) {
        return unsignedOfBits(unsigned_bits);
    }
    if (unsigned_bits == 0 || unsigned_bits < signed_bits) {
        return signedOfBits(signed_bits);
    }
    if (unsigned_bits == 64) {
        throw PrecisionError("dtype",
            "No integer dtype holds both uint64 and " + toString(signedOfBits(signed_bits)));
    }
    return signedOfBits(std::max(signed_bits, 2 * unsigned_bits));
}

Coordinates CoerceToDtype(const Coordinates& values, CoordDtype dtype) {
    if (dtype == CoordDtype::Float64) {
        return values;
    }
    if (dtype == CoordDtype::Float32) {
        // 有限值超出单精度范围时报错，inf与NaN原样保留
        const double max_float = static_cast<double>(std::numeric_limits<float>::max());
        for (Eigen::Index r = 0; r < values.rows(); ++r) {
            for (Eigen::Index c = 0; c < values.cols(); ++c) {
                const double v = values(r, c);
                if (std::isfinite(v) && std::abs(v) > max_float) {
                    throw ValidationError("dtype",
                        "Value " + std::to_string(v) + " out of range for float32");
                }
            }
        }
        return values.cast<float>().cast<double>();
    }

    const int bits = bitsOf(dtype);
    double lower = 0.0;
    double upper = std::ldexp(1.0, bits);  // 上界（不含）
    if (kindOf(dtype) == DtypeKind::SignedInteger) {
        lower = -std::ldexp(1.0, bits - 1);
        upper = std::ldexp(1.0, bits - 1);
    }

    Coordinates result(values.rows(), values.cols());
    for (Eigen::Index r = 0; r < values.rows(); ++r) {
        for (Eigen::Index c = 0; c < values.cols(); ++c) {
            const double v = values(r, c);
            if (!std::isfinite(v)) {
                throw ValidationError("dtype",
                    "Non-finite value cannot be stored as " + toString(dtype));
            }
            const double t = std::trunc(v);
            if (t < lower || t >= upper) {
                throw ValidationError("dtype",
                    "Value " + std::to_string(v) + " out of range for " + toString(dtype));
            }
            result(r, c) = t;
        }
    }
    return result;
}

} // namespace reference
} // namespace coordmap
