/**
 * @file coordmap.hpp
 * @brief coordmap 库的统一头文件
 *
 * 包含坐标系、坐标映射、映射代数、线性化和PCA。
 */
#pragma once

#include "common/types.hpp"
#include "common/exceptions.hpp"
#include "reference/coord_dtype.hpp"
#include "reference/coordinate_system.hpp"
#include "reference/mapping_functions.hpp"
#include "reference/coordinate_map.hpp"
#include "reference/algebra.hpp"
#include "reference/linearize.hpp"
#include "stats/pca.hpp"
