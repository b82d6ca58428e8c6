/**
 * @file object_id.hpp
 * @brief 场景对象标识
 *
 * ObjectId 在同一 ObjectRegistry 内唯一命名一个对象；唯一性由注册表保证。
 * 最高位为光源标记约定：ObjectId::Light(n) 产生的标识用于光源标记对象。
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace blaze::scene {

struct ObjectId {
    static constexpr std::uint32_t kLightMarkerBit = 0x80000000u;

    std::uint32_t value = 0;

    /** 带光源标记位的标识（index 的最高位被忽略） */
    static constexpr ObjectId Light(std::uint32_t index) {
        return ObjectId{(index & ~kLightMarkerBit) | kLightMarkerBit};
    }

    bool IsLightMarker() const { return (value & kLightMarkerBit) != 0; }

    /** 去掉标记位后的序号 */
    std::uint32_t Index() const { return value & ~kLightMarkerBit; }

    bool operator==(const ObjectId& other) const { return value == other.value; }
    bool operator!=(const ObjectId& other) const { return value != other.value; }
};

}  // namespace blaze::scene

namespace std {

template <>
struct hash<blaze::scene::ObjectId> {
    std::size_t operator()(const blaze::scene::ObjectId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.value);
    }
};

}  // namespace std
