#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace acoustics::core {

using Vec3 = glm::vec3;
using Quat = glm::quat;

// Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    // Box given by its center and full size (a unit cube scaled by `size`)
    static AABB from_center_size(const Vec3& center, const Vec3& size) {
        Vec3 half = glm::abs(size) * 0.5f;
        return AABB{center - half, center + half};
    }

    Vec3 center() const { return (min + max) * 0.5f; }
    Vec3 size() const { return max - min; }
    Vec3 extents() const { return size() * 0.5f; }
    float volume() const {
        Vec3 s = size();
        return s.x * s.y * s.z;
    }

    bool contains(const Vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }
};

} // namespace acoustics::core
