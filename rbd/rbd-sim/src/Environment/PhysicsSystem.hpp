// Ticket: 0018_simulation_loop
// Ticket: 0015_contact_events

#ifndef RBD_SIM_ENVIRONMENT_PHYSICS_SYSTEM_HPP
#define RBD_SIM_ENVIRONMENT_PHYSICS_SYSTEM_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "rbd-sim/src/Container/SlotMap.hpp"
#include "rbd-sim/src/Environment/PhysicsConfig.hpp"
#include "rbd-sim/src/Physics/Collision/ContactEvent.hpp"
#include "rbd-sim/src/Physics/Collision/ShapeRegistry.hpp"
#include "rbd-sim/src/Physics/Integration/Integrator.hpp"

namespace rbd_sim
{

class MaterialProvider;
class RigidBody;
class Shape;

/**
 * @brief Owner of one simulation: registered bodies and shapes plus the
 *        per-step pipeline.
 *
 * The host constructs a system and hands it to every body and shape that
 * should take part; there is no process-wide default system. Registration
 * stores non-owning pointers, and bodies and shapes deregister themselves on
 * destruction.
 *
 * A step is three phases, run in this order by the host (or by step()):
 *
 * 1. preUpdate: narrow-phase test and collision response for every candidate
 *    pair. For each dynamic shape in registry order: every later dynamic
 *    shape, then every static shape. Pairs sharing a body are skipped.
 * 2. mainUpdate: add gravity to bodies that simulate it, integrate every
 *    enabled body, then clear every body's accumulators.
 * 3. postUpdate: dispatch the contact events queued during preUpdate.
 *
 * Registration changes must happen between steps.
 *
 * Thread safety: Not thread-safe (single-threaded host loop assumed).
 *
 * @ticket 0018_simulation_loop
 */
class PhysicsSystem
{
public:
  using ContactCallback = std::function<void(const ContactEvent&)>;

  /**
   * @param config Gravity, fixed time step and integrator selection
   * @param materials Resolves shape material identifiers; may be null when no
   *        registered shape names one. Must outlive the system.
   * @throws std::invalid_argument if the fixed time step is not positive or
   *         the gravity vector is not finite
   */
  explicit PhysicsSystem(PhysicsConfig config = PhysicsConfig{},
                         const MaterialProvider* materials = nullptr);

  ~PhysicsSystem();

  PhysicsSystem(const PhysicsSystem&) = delete;
  PhysicsSystem& operator=(const PhysicsSystem&) = delete;
  PhysicsSystem(PhysicsSystem&&) = delete;
  PhysicsSystem& operator=(PhysicsSystem&&) = delete;

  // ========== Registration ==========

  /**
   * @brief Add a body to the integration set
   *
   * Registering a body twice with the same system is a no-op. The body's
   * fixed time step is set from the configuration.
   *
   * @throws std::logic_error if the body is registered with another system
   */
  void registerBody(RigidBody& body);

  /**
   * @brief Remove a body from the integration set
   *
   * Shapes attached to the body keep their own registration and stay in the
   * dynamic bucket, so collision response still corrects and reflects the
   * body even though mainUpdate no longer integrates it. Disable the body or
   * deregister its shapes to take it out of collision handling as well.
   *
   * @return false if the body was not registered with this system
   */
  bool deregisterBody(RigidBody& body);

  /**
   * @brief Add a shape to the broad phase
   *
   * A shape that names a material identifier and has no material yet gets
   * it resolved through the material provider; an unknown identifier leaves
   * the material absent.
   *
   * @throws std::logic_error if the shape is registered with another system
   * @throws std::runtime_error if the shape names a material and the system
   *         has no material provider
   */
  void registerShape(Shape& shape);

  /**
   * @brief Remove a shape, ending every contact it takes part in
   *
   * @return false if the shape was not registered with this system
   */
  bool deregisterShape(Shape& shape);

  /**
   * @brief Move a registered shape to the bucket matching its current mobility
   *
   * Called when a shape is attached or detached or its body is enabled or
   * disabled. Touching sets of its contacts are updated to the new handle.
   */
  void refreshShape(Shape& shape);

  // ========== Step phases ==========

  /// Collision detection and response
  void preUpdate(double deltaTime);

  /// Gravity, integration and accumulator reset
  void mainUpdate(double deltaTime);

  /// Contact event dispatch
  void postUpdate(double deltaTime);

  /// preUpdate, mainUpdate and postUpdate in order
  void step(double deltaTime);

  // ========== Configuration ==========

  [[nodiscard]] const PhysicsConfig& getConfig() const
  {
    return config_;
  }

  [[nodiscard]] const Coordinate& getGravity() const
  {
    return config_.gravity;
  }

  /// @throws std::invalid_argument if any component is not finite
  void setGravity(const Coordinate& gravity);

  [[nodiscard]] const Integrator& getIntegrator() const
  {
    return *integrator_;
  }

  void setContactCallback(ContactCallback callback)
  {
    contactCallback_ = std::move(callback);
  }

  // ========== Queries ==========

  [[nodiscard]] const ShapeRegistry& getShapeRegistry() const
  {
    return shapes_;
  }

  /// nullptr for a stale handle
  [[nodiscard]] Shape* findShape(const ShapeHandle& handle) const
  {
    return shapes_.find(handle);
  }

  [[nodiscard]] size_t getBodyCount() const
  {
    return bodies_.size();
  }

  /// Events queued since the last postUpdate
  [[nodiscard]] const std::vector<ContactEvent>& getPendingEvents() const
  {
    return events_;
  }

private:
  struct Entry
  {
    ShapeHandle handle;
    Shape* shape;
  };

  static void validateTimeStep(double deltaTime);
  static void validateGravity(const Coordinate& gravity);

  void testPair(const Entry& a, const Entry& b);

  PhysicsConfig config_;
  const MaterialProvider* materials_;
  std::unique_ptr<Integrator> integrator_;

  SlotMap<RigidBody*> bodies_;
  ShapeRegistry shapes_;

  std::vector<ContactEvent> events_;
  ContactCallback contactCallback_;

  // Reused across steps to avoid per-step allocation
  std::vector<Entry> dynamicEntries_;
  std::vector<Entry> staticEntries_;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_ENVIRONMENT_PHYSICS_SYSTEM_HPP
