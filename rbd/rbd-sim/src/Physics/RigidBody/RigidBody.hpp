// Ticket: 0008_rigid_body_force_accumulation
// Ticket: 0009_rigid_body_inertia

#ifndef RBD_SIM_PHYSICS_RIGID_BODY_RIGID_BODY_HPP
#define RBD_SIM_PHYSICS_RIGID_BODY_RIGID_BODY_HPP

#include <Eigen/Geometry>
#include <optional>
#include <vector>

#include "rbd-sim/src/Container/SlotMap.hpp"
#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/DataTypes/Vector3D.hpp"
#include "rbd-sim/src/Physics/RigidBody/ForceMode.hpp"

namespace rbd_sim
{

class PhysicsSystem;
class Shape;

/**
 * @brief Rigid body state with force and torque accumulators.
 *
 * The body stores linear and angular momentum; velocity and angular velocity
 * are derived from them (angular velocity component-wise over the diagonal
 * inertia tensor, zero on axes with zero or infinite inertia).
 *
 * Four accumulators collect external influences between integration steps:
 * - force and torque, scaled by mass when integrated
 * - acceleration and angular acceleration, mass-independent
 *
 * Impulses are converted into forces by dividing by the fixed simulation
 * time step, so they are consumed by exactly one integration step. The
 * owning PhysicsSystem clears all accumulators once per step, after the
 * integrator has consumed them.
 *
 * The inertia tensor and center of mass are derived from the first attached
 * Shape (sphere approximation from the world scale when none is attached) and
 * are recomputed whenever a shape is attached or detached or the mass changes.
 *
 * Registries and shapes hold the body's address, so it is neither copyable
 * nor movable. Destruction detaches every shape and deregisters the body.
 *
 * @ticket 0008_rigid_body_force_accumulation
 * @ticket 0009_rigid_body_inertia
 */
class RigidBody
{
public:
  /// Smallest mass a body can hold [kg]
  static constexpr double kMinimumMass = 1e-5;
  static constexpr double kDefaultSleepThreshold = 0.001;
  /// Time step used for impulse conversion until a PhysicsSystem supplies one [s]
  static constexpr double kDefaultFixedTimeStep = 0.02;

  /**
   * @param mass Body mass [kg]
   * @param position Initial world position [m]
   * @throws std::invalid_argument if mass <= 0
   */
  explicit RigidBody(double mass = 1.0,
                     const Coordinate& position = Coordinate{0.0, 0.0, 0.0});

  ~RigidBody();

  RigidBody(const RigidBody&) = delete;
  RigidBody& operator=(const RigidBody&) = delete;
  RigidBody(RigidBody&&) = delete;
  RigidBody& operator=(RigidBody&&) = delete;

  // ========== Mass properties ==========

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  [[nodiscard]] double getInverseMass() const
  {
    return inverseMass_;
  }

  /**
   * @brief Set the mass and recompute the inertia tensor
   *
   * Positive values below kMinimumMass are clamped to kMinimumMass.
   *
   * @throws std::invalid_argument if mass <= 0 or not finite
   */
  void setMass(double mass);

  /// Diagonal inertia tensor [kg·m²]; components may be infinite
  [[nodiscard]] const Vector3D& getInertiaTensor() const
  {
    return inertiaTensor_;
  }

  /// Center of mass offset in body-local coordinates [m]
  [[nodiscard]] const Coordinate& getCenterOfMass() const
  {
    return centerOfMass_;
  }

  [[nodiscard]] Coordinate getWorldCenterOfMass() const;

  [[nodiscard]] const Vector3D& getScale() const
  {
    return scale_;
  }

  /**
   * @brief World scale used by the shapeless inertia approximation
   *
   * @throws std::invalid_argument if any component is negative
   */
  void setScale(const Vector3D& scale);

  /**
   * @brief Recompute the diagonal inertia tensor
   *
   * Uses the first attached shape; with no shapes attached the body is
   * approximated as a solid sphere of radius (sx + sy + sz) / 3.
   */
  void resetInertiaTensor();

  /**
   * @brief Set the center of mass to the mean local center of all attached shapes
   *
   * Zero when no shape is attached.
   */
  void resetCenterOfMass();

  // ========== Resistance and flags ==========

  [[nodiscard]] double getDrag() const
  {
    return drag_;
  }

  /// @throws std::invalid_argument if drag < 0
  void setDrag(double drag);

  [[nodiscard]] double getAngularDrag() const
  {
    return angularDrag_;
  }

  /// @throws std::invalid_argument if drag < 0
  void setAngularDrag(double drag);

  [[nodiscard]] double getSleepThreshold() const
  {
    return sleepThreshold_;
  }

  /// @throws std::invalid_argument if threshold < 0
  void setSleepThreshold(double threshold);

  [[nodiscard]] bool getSimulateGravity() const
  {
    return simulateGravity_;
  }

  void setSimulateGravity(bool simulate)
  {
    simulateGravity_ = simulate;
  }

  [[nodiscard]] bool isEnabled() const
  {
    return enabled_;
  }

  /**
   * @brief Enable or disable the body
   *
   * A disabled body is skipped by integration and its shapes are treated as
   * static.
   */
  void setEnabled(bool enabled);

  [[nodiscard]] double getFixedTimeStep() const
  {
    return fixedTimeStep_;
  }

  /// @throws std::invalid_argument if dt <= 0 or not finite
  void setFixedTimeStep(double dt);

  // ========== Kinematic state ==========

  [[nodiscard]] const Coordinate& getPosition() const
  {
    return position_;
  }

  void setPosition(const Coordinate& position)
  {
    position_ = position;
  }

  [[nodiscard]] const Eigen::Quaterniond& getRotation() const
  {
    return rotation_;
  }

  /// Stored normalized
  void setRotation(const Eigen::Quaterniond& rotation);

  [[nodiscard]] const Vector3D& getMomentum() const
  {
    return momentum_;
  }

  void setMomentum(const Vector3D& momentum)
  {
    momentum_ = momentum;
  }

  [[nodiscard]] const Vector3D& getAngularMomentum() const
  {
    return angularMomentum_;
  }

  void setAngularMomentum(const Vector3D& angularMomentum)
  {
    angularMomentum_ = angularMomentum;
  }

  /// Linear velocity p / m [m/s]
  [[nodiscard]] Vector3D getVelocity() const;

  /// Sets momentum to v * m
  void setVelocity(const Vector3D& velocity);

  /// Angular velocity L ⊘ I [rad/s]
  [[nodiscard]] Vector3D getAngularVelocity() const;

  /// Sets angular momentum to ω ⊙ I
  void setAngularVelocity(const Vector3D& angularVelocity);

  /// Quaternion derivative of the current orientation
  [[nodiscard]] Eigen::Quaterniond getSpin() const;

  /// ½ p·v + ½ L·ω [J]
  [[nodiscard]] double getKineticEnergy() const;

  // ========== Force accumulation ==========

  /// Mass-scaled continuous force [N]
  void addForce(const Vector3D& force);

  /// Mass-independent continuous acceleration [m/s²]
  void addAcceleration(const Vector3D& acceleration);

  /// Continuous torque [N·m]
  void addTorque(const Vector3D& torque);

  void addAngularAcceleration(const Vector3D& angularAcceleration);

  /// Impulse [N·s], consumed as impulse / fixedTimeStep by the next step
  void addImpulse(const Vector3D& impulse);

  /// Angular impulse [N·m·s], consumed as impulse / fixedTimeStep by the next step
  void addAngularImpulse(const Vector3D& angularImpulse);

  /**
   * @brief Apply a force at a world-space point
   *
   * The linear part enters the accumulator selected by the mode; the torque
   * cross(force, worldCenterOfMass - point) enters its angular counterpart.
   *
   * @throws std::logic_error for an unrecognized mode value
   */
  void addForceAtPoint(const Vector3D& force,
                       const Coordinate& point,
                       ForceMode mode = ForceMode::Force);

  /// Zero all four accumulators
  void resetAccumulatedForces();

  [[nodiscard]] const Vector3D& getAccumulatedForce() const
  {
    return force_;
  }
  [[nodiscard]] const Vector3D& getAccumulatedAcceleration() const
  {
    return acceleration_;
  }
  [[nodiscard]] const Vector3D& getAccumulatedTorque() const
  {
    return torque_;
  }
  [[nodiscard]] const Vector3D& getAccumulatedAngularAcceleration() const
  {
    return angularAcceleration_;
  }

  // ========== Attachments ==========

  [[nodiscard]] const std::vector<Shape*>& getShapes() const
  {
    return shapes_;
  }

  [[nodiscard]] bool isRegistered() const
  {
    return system_ != nullptr;
  }

private:
  friend class Shape;
  friend class PhysicsSystem;

  void attachShape(Shape& shape);
  void detachShape(Shape& shape);

  double mass_;
  double inverseMass_;
  double drag_{0.0};
  double angularDrag_{0.0};
  double sleepThreshold_{kDefaultSleepThreshold};
  double fixedTimeStep_{kDefaultFixedTimeStep};
  bool simulateGravity_{true};
  bool enabled_{true};

  Coordinate centerOfMass_{0.0, 0.0, 0.0};
  Vector3D inertiaTensor_{0.0, 0.0, 0.0};
  Vector3D scale_{1.0, 1.0, 1.0};

  Coordinate position_;
  Eigen::Quaterniond rotation_{Eigen::Quaterniond::Identity()};
  Vector3D momentum_{0.0, 0.0, 0.0};
  Vector3D angularMomentum_{0.0, 0.0, 0.0};

  Vector3D force_{0.0, 0.0, 0.0};
  Vector3D acceleration_{0.0, 0.0, 0.0};
  Vector3D torque_{0.0, 0.0, 0.0};
  Vector3D angularAcceleration_{0.0, 0.0, 0.0};

  std::vector<Shape*> shapes_;

  // Set by PhysicsSystem while registered
  PhysicsSystem* system_{nullptr};
  std::optional<SlotHandle> handle_;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_RIGID_BODY_RIGID_BODY_HPP
