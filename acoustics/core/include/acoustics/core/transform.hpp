#pragma once

#include <acoustics/core/math.hpp>

namespace acoustics::core {

// Rigid transform of a scene object as reported by the host.
// Right-handed, -Z forward, +Y up.
struct Transform {
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};  // Identity quaternion

    Transform() = default;
    explicit Transform(const Vec3& pos) : position(pos) {}
    Transform(const Vec3& pos, const Quat& rot) : position(pos), rotation(rot) {}

    Vec3 forward() const { return rotation * Vec3{0.0f, 0.0f, -1.0f}; }
    Vec3 right() const { return rotation * Vec3{1.0f, 0.0f, 0.0f}; }
    Vec3 up() const { return rotation * Vec3{0.0f, 1.0f, 0.0f}; }

    void look_at(const Vec3& target, const Vec3& up_vec = Vec3{0.0f, 1.0f, 0.0f}) {
        Vec3 delta = target - position;
        if (glm::dot(delta, delta) < 1e-12f) return;
        rotation = glm::quatLookAt(glm::normalize(delta), up_vec);
    }
};

} // namespace acoustics::core
