// Ticket: 0010_shape_variants

#ifndef RBD_SIM_PHYSICS_COLLISION_SHAPE_HPP
#define RBD_SIM_PHYSICS_COLLISION_SHAPE_HPP

#include <optional>
#include <string>
#include <unordered_set>
#include <variant>

#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/DataTypes/Vector3D.hpp"
#include "rbd-sim/src/Physics/Collision/ShapeHandle.hpp"
#include "rbd-sim/src/Physics/Material/PhysicsMaterial.hpp"

namespace rbd_sim
{

class PhysicsSystem;
class RigidBody;

struct SphereGeometry
{
  double radius{0.5};
};

/**
 * @brief Infinite plane through the shape's world position
 *
 * Collision treats it as a slab of thickness 2r around each sphere it is
 * tested against; `up` is its local normal.
 */
struct PlaneGeometry
{
  Vector3D up{0.0, 1.0, 0.0};
};

using ShapeGeometry = std::variant<SphereGeometry, PlaneGeometry>;

/**
 * @brief Collision shape that may be attached to a RigidBody.
 *
 * A shape is static when it has no attached body or the body is disabled;
 * static shapes are never moved by collision response and are never tested
 * against each other.
 *
 * The material is either set directly or named by an identifier that the
 * owning PhysicsSystem resolves through its MaterialProvider at registration.
 * An absent material combines as a neutral default.
 *
 * The touching set holds handles of the shapes this shape was in contact
 * with at the end of the last collision pass. It is kept mutual by the
 * collision response.
 *
 * Registries and bodies hold the shape's address, so it is neither copyable
 * nor movable. Destruction detaches the shape and deregisters it.
 *
 * @ticket 0010_shape_variants
 */
class Shape
{
public:
  /**
   * @throws std::invalid_argument if the radius is negative or not finite
   */
  explicit Shape(const SphereGeometry& sphere,
                 const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  /**
   * @throws std::invalid_argument if the up axis is not finite or has zero
   *         length
   */
  explicit Shape(const PlaneGeometry& plane,
                 const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  ~Shape();

  Shape(const Shape&) = delete;
  Shape& operator=(const Shape&) = delete;
  Shape(Shape&&) = delete;
  Shape& operator=(Shape&&) = delete;

  static Shape sphere(double radius,
                      const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  static Shape plane(const Vector3D& up,
                     const Coordinate& center = Coordinate{0.0, 0.0, 0.0});

  // ========== Geometry ==========

  [[nodiscard]] ShapeKind getKind() const;

  [[nodiscard]] const ShapeGeometry& getGeometry() const
  {
    return geometry_;
  }

  /// nullptr unless this is a sphere
  [[nodiscard]] const SphereGeometry* asSphere() const
  {
    return std::get_if<SphereGeometry>(&geometry_);
  }

  /// nullptr unless this is a plane
  [[nodiscard]] const PlaneGeometry* asPlane() const
  {
    return std::get_if<PlaneGeometry>(&geometry_);
  }

  /// Local center offset [m]
  [[nodiscard]] const Coordinate& getCenter() const
  {
    return center_;
  }

  void setCenter(const Coordinate& center);

  /**
   * @brief World position: body position + body rotation * center, or the
   *        center itself when unattached
   */
  [[nodiscard]] Coordinate getWorldPosition() const;

  /**
   * @brief World-space plane normal
   *
   * @throws std::logic_error if this is not a plane
   */
  [[nodiscard]] Vector3D getWorldUp() const;

  /**
   * @brief Diagonal inertia tensor of this shape as a solid of the given mass
   *
   * Sphere: (2/5) m r² on every axis. Plane: infinite on every axis.
   */
  [[nodiscard]] Vector3D computeInertia(double mass) const;

  // ========== Material ==========

  /// nullptr when no material is set or resolved
  [[nodiscard]] const PhysicsMaterial* getMaterial() const
  {
    return material_ ? &*material_ : nullptr;
  }

  void setMaterial(const PhysicsMaterial& material)
  {
    material_ = material;
  }

  void clearMaterial()
  {
    material_.reset();
  }

  [[nodiscard]] const std::string& getMaterialId() const
  {
    return materialId_;
  }

  /**
   * @brief Name a material to resolve at registration
   *
   * Ignored when a material has already been set.
   */
  void setMaterialId(const std::string& identifier)
  {
    materialId_ = identifier;
  }

  // ========== Body attachment ==========

  [[nodiscard]] RigidBody* getRigidBody() const
  {
    return body_;
  }

  [[nodiscard]] bool isStatic() const;

  [[nodiscard]] Mobility getMobility() const
  {
    return isStatic() ? Mobility::Static : Mobility::Dynamic;
  }

  /// Attach to a body, detaching from any previous one first
  void attachTo(RigidBody& body);

  void detach();

  // ========== Touching set ==========

  [[nodiscard]] bool isTouching(const ShapeHandle& other) const
  {
    return touching_.contains(other);
  }

  void startTouching(const ShapeHandle& other)
  {
    touching_.insert(other);
  }

  void stopTouching(const ShapeHandle& other)
  {
    touching_.erase(other);
  }

  [[nodiscard]] const std::unordered_set<ShapeHandle, ShapeHandleHash>&
  getTouching() const
  {
    return touching_;
  }

  // ========== Registration ==========

  [[nodiscard]] const std::optional<ShapeHandle>& getHandle() const
  {
    return handle_;
  }

  [[nodiscard]] bool isRegistered() const
  {
    return system_ != nullptr;
  }

private:
  friend class PhysicsSystem;
  friend class RigidBody;

  /// Re-bucket in the owning system after a mobility change
  void refreshRegistration();

  ShapeGeometry geometry_;
  Coordinate center_;
  std::optional<PhysicsMaterial> material_;
  std::string materialId_;
  RigidBody* body_{nullptr};
  std::unordered_set<ShapeHandle, ShapeHandleHash> touching_;

  // Set by PhysicsSystem while registered
  PhysicsSystem* system_{nullptr};
  std::optional<ShapeHandle> handle_;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_SHAPE_HPP
