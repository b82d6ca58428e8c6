/**
 * @file object_data.hpp
 * @brief 场景对象数据：标识、着色颜色、按类型区分的变换负载与派生模型矩阵
 *
 * 负载为封闭的 Player/Basic 和类型（std::variant），GetKind() 由负载当前备选项推导，
 * 因此类型与负载不会分离。模型矩阵是位置（Basic 另含尺寸）的纯函数，
 * 修改位置或尺寸后须调用 UpdateModel() 再读取。
 */

#pragma once

#include <blaze_scene/object_id.hpp>

#include <variant>

#include <glm/glm.hpp>

namespace blaze::scene {

/** 对象类型，决定负载备选项与默认几何 */
enum class ObjectKind {
    Player,
    Basic,
};

/** Player 负载：仅位置 */
struct PlayerData {
    glm::vec3 position{0.f};

    PlayerData() = default;
    explicit PlayerData(const glm::vec3& pos) : position(pos) {}
};

/** Basic 负载：位置与盒体尺寸（完整边长） */
struct BasicData {
    glm::vec3 position{0.f};
    glm::vec3 dimension{1.f};

    BasicData() = default;
    BasicData(const glm::vec3& pos, const glm::vec3& dim) : position(pos), dimension(dim) {}
};

using ObjectPayload = std::variant<PlayerData, BasicData>;

/** 按 kind 构造负载；Player 忽略 dim */
ObjectPayload MakePayload(ObjectKind kind, const glm::vec3& pos, const glm::vec3& dim);

class ObjectData {
public:
    ObjectData(ObjectId id, const glm::vec4& color, ObjectPayload payload);

    ObjectId GetId() const { return id_; }
    const glm::vec4& GetColor() const { return color_; }
    void SetColor(const glm::vec4& color) { color_ = color; }

    ObjectKind GetKind() const;

    /** Basic 且标识带光源标记时为 true */
    bool IsLight() const;

    const ObjectPayload& GetPayload() const { return payload_; }

    glm::vec3 GetPosition() const;
    void SetPosition(const glm::vec3& position);

    /** Basic 返回尺寸；Player 返回未缩放立方体的边长 (2, 2, 2) */
    glm::vec3 GetDimension() const;

    /** 仅 Basic 生效；Player 返回 false 且不修改 */
    bool SetDimension(const glm::vec3& dimension);

    /** 由负载重新计算模型矩阵；无中间修改时重复调用结果逐位相同 */
    void UpdateModel();

    const glm::mat4& GetModel() const { return model_; }

private:
    ObjectId id_;
    glm::vec4 color_;
    ObjectPayload payload_;
    glm::mat4 model_{1.f};
};

}  // namespace blaze::scene
