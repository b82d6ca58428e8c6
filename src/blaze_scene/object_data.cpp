/**
 * @file object_data.cpp
 * @brief ObjectData 实现：类型推导、负载访问与模型矩阵计算
 */

#include <blaze_scene/object_data.hpp>

#include <type_traits>
#include <utility>

#include <glm/gtc/matrix_transform.hpp>

namespace blaze::scene {

namespace {

// 立方体几何跨度为 [-1, 1]
constexpr float kUnitCubeExtent = 2.f;

}  // namespace

ObjectPayload MakePayload(ObjectKind kind, const glm::vec3& pos, const glm::vec3& dim) {
    switch (kind) {
        case ObjectKind::Player:
            return PlayerData(pos);
        case ObjectKind::Basic:
            return BasicData(pos, dim);
    }
    return PlayerData(pos);
}

ObjectData::ObjectData(ObjectId id, const glm::vec4& color, ObjectPayload payload)
    : id_(id), color_(color), payload_(std::move(payload)) {}

ObjectKind ObjectData::GetKind() const {
    return std::holds_alternative<BasicData>(payload_) ? ObjectKind::Basic : ObjectKind::Player;
}

bool ObjectData::IsLight() const {
    return GetKind() == ObjectKind::Basic && id_.IsLightMarker();
}

glm::vec3 ObjectData::GetPosition() const {
    return std::visit([](const auto& p) { return p.position; }, payload_);
}

void ObjectData::SetPosition(const glm::vec3& position) {
    std::visit([&position](auto& p) { p.position = position; }, payload_);
}

glm::vec3 ObjectData::GetDimension() const {
    if (const auto* basic = std::get_if<BasicData>(&payload_))
        return basic->dimension;
    return glm::vec3(kUnitCubeExtent);
}

bool ObjectData::SetDimension(const glm::vec3& dimension) {
    auto* basic = std::get_if<BasicData>(&payload_);
    if (!basic) return false;
    basic->dimension = dimension;
    return true;
}

void ObjectData::UpdateModel() {
    model_ = std::visit([](const auto& p) -> glm::mat4 {
        using T = std::decay_t<decltype(p)>;
        glm::mat4 m = glm::translate(glm::mat4(1.f), p.position);
        if constexpr (std::is_same_v<T, BasicData>)
            m = glm::scale(m, p.dimension / kUnitCubeExtent);
        return m;
    }, payload_);
}

}  // namespace blaze::scene
