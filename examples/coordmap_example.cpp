#include "coordmap/coordmap.hpp"
#include "coordmap/utility/config_manager.hpp"
#include <cmath>
#include <iostream>
#include <iomanip>

using namespace coordmap;
using namespace coordmap::reference;

int main() {
    std::cout << std::fixed << std::setprecision(4);

    // 可选：从 config/ 加载配置（不存在时写出默认配置）
    utility::ConfigManager::getInstance().loadConfigs("config");

    std::cout << "=== 坐标映射库使用示例 ===\n\n";

    // 1. 仿射变换创建
    std::cout << "1. 仿射变换创建:\n";

    // 体素坐标到世界坐标：各向异性体素，原点平移
    AffineMatrix voxel_to_world(4, 4);
    voxel_to_world << 2, 0, 0, -90,
                      0, 2, 0, -126,
                      0, 0, 3, -72,
                      0, 0, 0, 1;
    auto voxel_space = CoordinateSystem::FromLetters("ijk", "voxel");
    auto world_space = CoordinateSystem({"x", "y", "z"}, "world");
    AffineTransform voxel_map(voxel_to_world, voxel_space, world_space);
    std::cout << voxel_map.toString() << "\n";

    // 网格间距变换
    auto grid = AffineTransform::FromStartStep({"i"}, {"t"}, Eigen::VectorXd::Constant(1, 0.5),
                                               Eigen::VectorXd::Constant(1, 2.5));
    std::cout << "网格 i=4 -> t = " << grid.evaluatePoint(Eigen::VectorXd::Constant(1, 4.0)) << "\n\n";

    // 2. 求值与逆变换
    std::cout << "2. 求值与逆变换:\n";

    Coordinates voxels(2, 3);
    voxels << 0, 0, 0,
              45, 63, 24;
    Coordinates world = voxel_map(voxels);
    std::cout << "体素坐标:\n" << voxels << "\n";
    std::cout << "世界坐标:\n" << world << "\n";

    if (auto inverse = voxel_map.inverse()) {
        std::cout << "逆变换恢复:\n" << (*inverse)(world) << "\n\n";
    }

    // 3. 非线性映射
    std::cout << "3. 非线性映射:\n";

    MappingFunction to_polar = [](const Coordinates& xy) -> Coordinates {
        Coordinates result(xy.rows(), 2);
        for (Eigen::Index r = 0; r < xy.rows(); ++r) {
            result(r, 0) = std::hypot(xy(r, 0), xy(r, 1));
            result(r, 1) = std::atan2(xy(r, 1), xy(r, 0));
        }
        return result;
    };
    MappingFunction from_polar = [](const Coordinates& rt) -> Coordinates {
        Coordinates result(rt.rows(), 2);
        result.col(0) = (rt.col(0).array() * rt.col(1).array().cos()).matrix();
        result.col(1) = (rt.col(0).array() * rt.col(1).array().sin()).matrix();
        return result;
    };
    CoordinateMap polar(to_polar, CoordinateSystem({"x", "y"}, "cartesian"),
                        CoordinateSystem({"r", "theta"}, "polar"), from_polar);

    Point p(2);
    p << 1.0, 1.0;
    std::cout << "极坐标 (1, 1): " << polar.evaluatePoint(p) << "\n";
    std::cout << "是否仿射: " << std::boolalpha << polar.isAffine() << "\n\n";

    // 4. 组合、乘积与拼接
    std::cout << "4. 组合、乘积与拼接:\n";

    auto shift = AffineTransform::FromParams({"i", "j"}, {"x", "y"},
                                             Eigen::Matrix2d::Identity(), Eigen::Vector2d(1, -1));
    auto cartesian = shift.renamedOutput({{"x", "x"}, {"y", "y"}}, "cartesian");
    CoordinateMap shifted_polar = Compose({polar, cartesian});
    std::cout << "组合后输入轴: " << shifted_polar.inputCoords().toString() << "\n";
    std::cout << "组合后 (0, 2): " << shifted_polar.evaluatePoint(Eigen::Vector2d(0, 2)) << "\n";

    CoordinateMap with_time = Concat(voxel_map, "t");
    std::cout << "拼接时间轴: " << with_time.inputCoords().toString() << "\n";
    std::cout << with_time.toString() << "\n";

    CoordinateMap block = Product({grid, shift});
    std::cout << "乘积维数: " << block.ndims().first << " -> " << block.ndims().second << "\n\n";

    // 5. 轴重排与重命名
    std::cout << "5. 轴重排与重命名:\n";

    CoordinateMap kji = voxel_map.reorderedInput({"k", "j", "i"});
    std::cout << "重排后输入轴: " << kji.inputCoords().toString() << "\n";
    CoordinateMap renamed = voxel_map.renamedOutput({{"x", "left_right"}});
    std::cout << "重命名后输出轴: " << renamed.outputCoords().toString() << "\n\n";

    // 6. 线性化
    std::cout << "6. 线性化:\n";

    AffineTransform tangent = Linearize(polar, 1e-6, Point(Eigen::Vector2d(1, 1)));
    std::cout << "极坐标在 (1, 1) 处的仿射近似:\n" << tangent.affine() << "\n\n";

    // 7. 主成分分析
    std::cout << "7. 主成分分析:\n";

    Eigen::MatrixXd series(20, 4);
    for (int t = 0; t < 20; ++t) {
        const double signal = std::sin(0.5 * t);
        series.row(t) << signal, 2.0 * signal + 0.1 * std::cos(3.0 * t), -signal, 0.05 * t;
    }
    auto options = stats::PcaOptions::FromConfig();
    options.ncomp = 2;
    auto pca = stats::Pca(series, 0, options);
    std::cout << "方差百分比: " << pca.pcnt_var.transpose() << "\n";
    std::cout << "前两个分量的投影:\n" << pca.basis_projections << "\n";

    return 0;
}
