/**
 * @file object_registry.cpp
 * @brief ObjectRegistry 实现：创建/插入/移除与按类型批量释放
 */

#include <blaze_scene/object_registry.hpp>

#include <utility>

namespace blaze::scene {

using blaze_device::IRenderDevice;

bool ObjectRegistry::CreateCube(IRenderDevice& device, ObjectId id, const ShaderProgram& program,
                                const glm::vec3& pos, const glm::vec3& dim, const glm::vec4& color,
                                ObjectKind kind) {
    return CreateCubeWith(device, program, ObjectData(id, color, MakePayload(kind, pos, dim)));
}

bool ObjectRegistry::CreateCubeWith(IRenderDevice& device, const ShaderProgram& program,
                                    ObjectData data) {
    const ObjectId id = data.GetId();
    return Store(device, RenderObject::CreateCubeWith(device, program, std::move(data)), id,
                 "CreateCube");
}

bool ObjectRegistry::CreateLight(IRenderDevice& device, ObjectId id, const ShaderProgram& program,
                                 const glm::vec3& pos, const glm::vec3& dim,
                                 const glm::vec4& color) {
    return Store(device,
                 RenderObject::CreateFlatCube(device, program, pos, dim, color, id, ObjectKind::Basic),
                 id, "CreateLight");
}

bool ObjectRegistry::Store(IRenderDevice& device, std::optional<RenderObject> object, ObjectId id,
                           const char* operation) {
    if (!object) {
        lastError_ = std::string(operation) + " failed for " +
                     (id.IsLightMarker() ? "light " : "object ") + std::to_string(id.Index());
        if (!device.GetLastError().empty())
            lastError_ += ": " + device.GetLastError();
        return false;
    }
    Insert(device, std::move(*object));
    return true;
}

void ObjectRegistry::Insert(IRenderDevice& device, RenderObject object) {
    const ObjectId id = object.GetId();
    auto it = objects_.find(id);
    if (it != objects_.end()) {
        it->second.ReleaseBuffers(device);
        objects_.erase(it);
    }
    objects_.emplace(id, std::move(object));
}

ObjectData* ObjectRegistry::GetMutData(ObjectId id) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return nullptr;
    return &it->second.GetMutData();
}

const RenderObject* ObjectRegistry::Get(ObjectId id) const {
    auto it = objects_.find(id);
    if (it == objects_.end()) return nullptr;
    return &it->second;
}

std::optional<RenderObject> ObjectRegistry::Remove(ObjectId id) {
    auto it = objects_.find(id);
    if (it == objects_.end()) return std::nullopt;
    std::optional<RenderObject> out;
    out.emplace(std::move(it->second));
    objects_.erase(it);
    return out;
}

std::size_t ObjectRegistry::DestroyKind(IRenderDevice& device, ObjectKind kind) {
    std::size_t removed = 0;
    for (auto it = objects_.begin(); it != objects_.end();) {
        if (it->second.GetKind() == kind) {
            it->second.ReleaseBuffers(device);
            it = objects_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ObjectRegistry::Clear(IRenderDevice& device) {
    for (auto& [id, object] : objects_)
        object.ReleaseBuffers(device);
    objects_.clear();
}

}  // namespace blaze::scene
