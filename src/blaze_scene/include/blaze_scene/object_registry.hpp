/**
 * @file object_registry.hpp
 * @brief 场景对象注册表：按 ObjectId 持有全部 RenderObject
 *
 * 注册表独占其中对象的几何缓冲。缓冲离开注册表只有三条路径：
 * - Remove：所有权转交调用方，调用方须自行 ReleaseBuffers；
 * - DestroyKind / Clear：注册表逐个释放后移除；
 * - 以同一标识覆盖插入：被替换对象的缓冲先释放。
 * 注册表析构不会释放 GPU 资源（无设备可用），销毁前须调用 Clear。
 * 单线程使用，与 GPU 上下文位于同一线程。
 */

#pragma once

#include <blaze_device/render_device.hpp>
#include <blaze_scene/object_data.hpp>
#include <blaze_scene/object_id.hpp>
#include <blaze_scene/render_object.hpp>
#include <blaze_scene/shader_program.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_map>

#include <glm/glm.hpp>

namespace blaze::scene {

/**
 * 注册表当前内容的只读惰性视图（无序）。
 * 不持有对象；begin() 每次从头遍历，可重复使用。注册表被修改后视图与其迭代器失效。
 */
class ObjectRange {
public:
    using Map = std::unordered_map<ObjectId, RenderObject>;

    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = RenderObject;
        using difference_type = std::ptrdiff_t;
        using pointer = const RenderObject*;
        using reference = const RenderObject&;

        Iterator() = default;
        Iterator(Map::const_iterator it, Map::const_iterator end, bool lightsOnly)
            : it_(it), end_(end), lightsOnly_(lightsOnly) {
            SkipFiltered();
        }

        reference operator*() const { return it_->second; }
        pointer operator->() const { return &it_->second; }

        Iterator& operator++() {
            ++it_;
            SkipFiltered();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const Iterator& other) const { return it_ == other.it_; }
        bool operator!=(const Iterator& other) const { return it_ != other.it_; }

    private:
        void SkipFiltered() {
            while (lightsOnly_ && it_ != end_ && !it_->second.IsLight())
                ++it_;
        }

        Map::const_iterator it_{};
        Map::const_iterator end_{};
        bool lightsOnly_ = false;
    };

    ObjectRange(const Map& objects, bool lightsOnly) : objects_(&objects), lightsOnly_(lightsOnly) {}

    Iterator begin() const { return Iterator(objects_->begin(), objects_->end(), lightsOnly_); }
    Iterator end() const { return Iterator(objects_->end(), objects_->end(), lightsOnly_); }

    bool empty() const { return begin() == end(); }
    std::size_t size() const { return static_cast<std::size_t>(std::distance(begin(), end())); }

private:
    const Map* objects_ = nullptr;
    bool lightsOnly_ = false;
};

class ObjectRegistry {
public:
    ObjectRegistry() = default;
    ~ObjectRegistry() = default;

    ObjectRegistry(const ObjectRegistry&) = delete;
    ObjectRegistry& operator=(const ObjectRegistry&) = delete;

    /**
     * 按 kind 构造负载并创建着色立方体，以 id 为键插入。
     * @return 失败时 false，注册表不变，GetLastError() 给出原因
     */
    bool CreateCube(blaze_device::IRenderDevice& device, ObjectId id, const ShaderProgram& program,
                    const glm::vec3& pos, const glm::vec3& dim, const glm::vec4& color,
                    ObjectKind kind);

    /** 同 CreateCube，但由调用方提供 ObjectData（如修改后重新插入） */
    bool CreateCubeWith(blaze_device::IRenderDevice& device, const ShaderProgram& program,
                        ObjectData data);

    /**
     * 创建 Basic 类型的平面立方体，用作光源标记。
     * 只有 id 带光源标记位（ObjectId::Light）时对象才会出现在 Lights() 中。
     */
    bool CreateLight(blaze_device::IRenderDevice& device, ObjectId id, const ShaderProgram& program,
                     const glm::vec3& pos, const glm::vec3& dim, const glm::vec4& color);

    /** 以对象自身标识插入；同标识的旧对象先释放缓冲再被替换 */
    void Insert(blaze_device::IRenderDevice& device, RenderObject object);

    /** 修改位置/尺寸后须调用 UpdateModel()；不存在时返回 nullptr */
    ObjectData* GetMutData(ObjectId id);

    const RenderObject* Get(ObjectId id) const;
    bool Contains(ObjectId id) const { return objects_.count(id) != 0; }
    std::size_t Size() const { return objects_.size(); }
    bool Empty() const { return objects_.empty(); }

    /** 取出对象并转交所有权；调用方负责 ReleaseBuffers。不存在时返回 std::nullopt 且不做修改 */
    std::optional<RenderObject> Remove(ObjectId id);

    /**
     * 移除 kind 相同的全部对象并逐个释放其缓冲，其他类型不受影响。
     * @return 移除的对象数
     */
    std::size_t DestroyKind(blaze_device::IRenderDevice& device, ObjectKind kind);

    /** 释放并移除全部对象 */
    void Clear(blaze_device::IRenderDevice& device);

    /** IsLight() 为 true 的对象 */
    ObjectRange Lights() const { return ObjectRange(objects_, true); }

    /** 全部对象，无序 */
    ObjectRange Objects() const { return ObjectRange(objects_, false); }

    ObjectRange::Iterator begin() const { return Objects().begin(); }
    ObjectRange::Iterator end() const { return Objects().end(); }

    const std::string& GetLastError() const { return lastError_; }

private:
    bool Store(blaze_device::IRenderDevice& device, std::optional<RenderObject> object,
               ObjectId id, const char* operation);

    ObjectRange::Map objects_;
    std::string lastError_;
};

}  // namespace blaze::scene
