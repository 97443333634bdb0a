#pragma once
#include <stdexcept>
#include <string>

namespace coordmap {

class CoordmapException : public std::runtime_error {
public:
    CoordmapException(const std::string& component, const std::string& message)
        : std::runtime_error("[" + component + "] " + message) {}
};

/// 构造失败：函数不可调用、仿射矩阵形状错误、未知坐标轴等
class ConstructionError : public CoordmapException {
public:
    using CoordmapException::CoordmapException;
};

/// 求值时坐标数组的形状或精度与坐标系不符
class ValidationError : public CoordmapException {
public:
    using CoordmapException::CoordmapException;
};

/// 组合时相邻映射的坐标系不匹配
class CompositionError : public CoordmapException {
public:
    using CoordmapException::CoordmapException;
};

/// 数值精度无法安全提升
class PrecisionError : public CoordmapException {
public:
    using CoordmapException::CoordmapException;
};

class ConfigurationError : public CoordmapException {
public:
    using CoordmapException::CoordmapException;
};

} // namespace coordmap
