/**
 * @file cube_geometry.hpp
 * @brief 立方体顶点/索引静态表
 *
 * 两种立方体均位于物体空间 (-1,-1,-1) 到 (1,1,1)：
 * - 平面立方体：8 顶点（仅位置，3 float/顶点），14 索引，三角带 + 退化三角形一次遍历 6 个面。
 * - 着色立方体：24 顶点（每面 4 个，位置 + 外法线，6 float/顶点），36 索引，三角形列表。
 *   每面使用独立顶点，法线不跨面插值。
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace blaze::scene {

constexpr std::size_t kFlatCubeVertexCount = 8;
constexpr std::size_t kFlatCubeIndexCount = 14;
constexpr std::size_t kFlatCubeFloatsPerVertex = 3;

constexpr std::size_t kCubeVertexCount = 24;
constexpr std::size_t kCubeIndexCount = 36;
constexpr std::size_t kCubeFloatsPerVertex = 6;

// clang-format off
inline constexpr std::array<float, kFlatCubeVertexCount * kFlatCubeFloatsPerVertex> kFlatCubeVertices = {
     1.f,  1.f, -1.f,  // 右上后 [0]
    -1.f,  1.f, -1.f,  // 左上后 [1]
     1.f,  1.f,  1.f,  // 右上前 [2]
    -1.f,  1.f,  1.f,  // 左上前 [3]
     1.f, -1.f, -1.f,  // 右下后 [4]
    -1.f, -1.f, -1.f,  // 左下后 [5]
    -1.f, -1.f,  1.f,  // 左下前 [6]
     1.f, -1.f,  1.f,  // 右下前 [7]
};

inline constexpr std::array<std::uint8_t, kFlatCubeIndexCount> kFlatCubeIndices = {
    0, 1, 4, 5, 6, 1, 3, 0, 2, 4, 7, 6, 2, 3
};

inline constexpr std::array<float, kCubeVertexCount * kCubeFloatsPerVertex> kCubeVertices = {
    // 后 (z = -1)
    -1.f, -1.f, -1.f,   0.f,  0.f, -1.f,  // [00]
    -1.f,  1.f, -1.f,   0.f,  0.f, -1.f,  // [01]
     1.f, -1.f, -1.f,   0.f,  0.f, -1.f,  // [02]
     1.f,  1.f, -1.f,   0.f,  0.f, -1.f,  // [03]

    // 前 (z = 1)
    -1.f, -1.f,  1.f,   0.f,  0.f,  1.f,  // [04]
    -1.f,  1.f,  1.f,   0.f,  0.f,  1.f,  // [05]
     1.f, -1.f,  1.f,   0.f,  0.f,  1.f,  // [06]
     1.f,  1.f,  1.f,   0.f,  0.f,  1.f,  // [07]

    // 左 (x = -1)
    -1.f, -1.f,  1.f,  -1.f,  0.f,  0.f,  // [08]
    -1.f,  1.f,  1.f,  -1.f,  0.f,  0.f,  // [09]
    -1.f, -1.f, -1.f,  -1.f,  0.f,  0.f,  // [10]
    -1.f,  1.f, -1.f,  -1.f,  0.f,  0.f,  // [11]

    // 右 (x = 1)
     1.f, -1.f,  1.f,   1.f,  0.f,  0.f,  // [12]
     1.f,  1.f,  1.f,   1.f,  0.f,  0.f,  // [13]
     1.f, -1.f, -1.f,   1.f,  0.f,  0.f,  // [14]
     1.f,  1.f, -1.f,   1.f,  0.f,  0.f,  // [15]

    // 上 (y = 1)
    -1.f,  1.f, -1.f,   0.f,  1.f,  0.f,  // [16]
    -1.f,  1.f,  1.f,   0.f,  1.f,  0.f,  // [17]
     1.f,  1.f, -1.f,   0.f,  1.f,  0.f,  // [18]
     1.f,  1.f,  1.f,   0.f,  1.f,  0.f,  // [19]

    // 下 (y = -1)
    -1.f, -1.f, -1.f,   0.f, -1.f,  0.f,  // [20]
    -1.f, -1.f,  1.f,   0.f, -1.f,  0.f,  // [21]
     1.f, -1.f, -1.f,   0.f, -1.f,  0.f,  // [22]
     1.f, -1.f,  1.f,   0.f, -1.f,  0.f,  // [23]
};

inline constexpr std::array<std::uint8_t, kCubeIndexCount> kCubeIndices = {
     0,  3,  2,    1,  3,  0,  // 后
     6,  7,  4,    4,  7,  5,  // 前
     8, 11, 10,    9, 11,  8,  // 左
    14, 15, 12,   12, 15, 13,  // 右
    16, 19, 18,   17, 19, 16,  // 上
    22, 23, 20,   20, 23, 21,  // 下
};
// clang-format on

}  // namespace blaze::scene
