/**
 * @file coordinate_system.cpp
 * @brief 坐标系实现
 */

#include "coordmap/reference/coordinate_system.hpp"
#include "coordmap/common/exceptions.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace coordmap {
namespace reference {

CoordinateSystem::CoordinateSystem(std::vector<std::string> coord_names,
                                   std::string name,
                                   CoordDtype coord_dtype)
    : coord_names_(std::move(coord_names)),
      name_(std::move(name)),
      coord_dtype_(coord_dtype) {
    std::unordered_set<std::string> seen;
    for (const auto& coord_name : coord_names_) {
        if (coord_name.empty()) {
            throw ConstructionError("CoordinateSystem", "Axis names must not be empty");
        }
        if (!seen.insert(coord_name).second) {
            throw ConstructionError("CoordinateSystem",
                "Axis names must be unique, '" + coord_name + "' is repeated");
        }
    }
}

CoordinateSystem CoordinateSystem::FromLetters(const std::string& letters,
                                               const std::string& name,
                                               CoordDtype coord_dtype) {
    std::vector<std::string> coord_names;
    coord_names.reserve(letters.size());
    for (char c : letters) {
        coord_names.emplace_back(1, c);
    }
    return CoordinateSystem(std::move(coord_names), name, coord_dtype);
}

Eigen::Index CoordinateSystem::index(const std::string& coord_name) const {
    auto it = std::find(coord_names_.begin(), coord_names_.end(), coord_name);
    if (it == coord_names_.end()) {
        throw ConstructionError("CoordinateSystem",
            "No coordinate named " + coord_name + " in " + toString());
    }
    return static_cast<Eigen::Index>(it - coord_names_.begin());
}

bool CoordinateSystem::hasCoord(const std::string& coord_name) const {
    return std::find(coord_names_.begin(), coord_names_.end(), coord_name) != coord_names_.end();
}

Coordinates CoordinateSystem::checkedValues(const Coordinates& values) const {
    if (values.cols() != ndim()) {
        std::ostringstream oss;
        oss << "Array shape[-1] (" << values.cols()
            << ") must match CoordinateSystem ndim (" << ndim() << ").\n  " << toString();
        throw ValidationError("CoordinateSystem", oss.str());
    }
    return CoerceToDtype(values, coord_dtype_);
}

CoordinateSystem CoordinateSystem::withDtype(CoordDtype coord_dtype) const {
    return CoordinateSystem(coord_names_, name_, coord_dtype);
}

bool CoordinateSystem::operator==(const CoordinateSystem& other) const {
    return coord_names_ == other.coord_names_ &&
           name_ == other.name_ &&
           coord_dtype_ == other.coord_dtype_;
}

std::string CoordinateSystem::toString() const {
    std::ostringstream oss;
    oss << "CoordinateSystem(coord_names=(";
    for (size_t i = 0; i < coord_names_.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "'" << coord_names_[i] << "'";
    }
    if (coord_names_.size() == 1) {
        oss << ",";
    }
    oss << "), name='" << name_ << "', coord_dtype=" << reference::toString(coord_dtype_) << ")";
    return oss.str();
}

CoordinateSystem Product(const std::vector<CoordinateSystem>& coord_systems) {
    std::vector<std::string> coord_names;
    std::vector<CoordDtype> dtypes;
    for (const auto& cs : coord_systems) {
        coord_names.insert(coord_names.end(), cs.coordNames().begin(), cs.coordNames().end());
        dtypes.push_back(cs.coordDtype());
    }
    return CoordinateSystem(std::move(coord_names), "product", SafeDtype(dtypes));
}

} // namespace reference
} // namespace coordmap
