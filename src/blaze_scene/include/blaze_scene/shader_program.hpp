/**
 * @file shader_program.hpp
 * @brief 着色程序引用：不透明管线句柄 + 风格标签
 *
 * 风格仅用于选择库存几何：Simple 对应平面立方体，Normal 对应带法线的着色立方体。
 * 程序本身由调用方创建与销毁，RenderObject 只持有引用。
 */

#pragma once

#include <blaze_device/rdi_types.hpp>

namespace blaze::scene {

enum class ProgramStyle {
    Simple,
    Normal,
};

struct ShaderProgram {
    blaze_device::PipelineHandle pipeline{};
    ProgramStyle style = ProgramStyle::Simple;

    bool IsValid() const { return pipeline.IsValid(); }
};

}  // namespace blaze::scene
