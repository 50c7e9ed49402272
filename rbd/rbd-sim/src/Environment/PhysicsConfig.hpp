// Ticket: 0018_simulation_loop

#ifndef RBD_SIM_ENVIRONMENT_PHYSICS_CONFIG_HPP
#define RBD_SIM_ENVIRONMENT_PHYSICS_CONFIG_HPP

#include <cstdint>

#include "rbd-sim/src/DataTypes/Coordinate.hpp"

namespace rbd_sim
{

enum class IntegratorKind : uint8_t
{
  RK4,
  SemiImplicitEuler
};

/**
 * @brief Construction-time settings of a PhysicsSystem
 *
 * @code
 * PhysicsSystem system{PhysicsConfig{.fixedTimeStep = 1.0 / 60.0}};
 * @endcode
 */
struct PhysicsConfig
{
  static constexpr double kStandardGravity = 9.80665;  // [m/s²]
  static constexpr double kDefaultFixedTimeStep = 0.02;  // [s]

  /// Acceleration applied to bodies that simulate gravity [m/s²]
  Coordinate gravity{0.0, -kStandardGravity, 0.0};

  /// Step used to convert impulses into forces and by the friction model [s]
  double fixedTimeStep{kDefaultFixedTimeStep};

  IntegratorKind integrator{IntegratorKind::RK4};
};

}  // namespace rbd_sim

#endif  // RBD_SIM_ENVIRONMENT_PHYSICS_CONFIG_HPP
