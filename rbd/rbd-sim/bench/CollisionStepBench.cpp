// Ticket: 0019_step_performance
//
// Benchmarks for a full simulation step (broad phase, narrow phase, response,
// RK4 integration) and for the sphere-sphere test in isolation.

#include <benchmark/benchmark.h>

#include <memory>
#include <vector>

#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/Environment/PhysicsSystem.hpp"
#include "rbd-sim/src/Physics/Collision/NarrowPhase.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

using namespace rbd_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kDt = 1.0 / 60.0;       // 60 FPS timestep
constexpr double kRadius = 0.5;          // Sphere radius [m]
constexpr double kPenetration = 0.01;    // 1cm overlap ensures contact
constexpr double kSpacing = 1.5;         // Spacing between spheres on the floor
constexpr double kMass = 10.0;           // [kg]

// Owns a system, a floor plane and a row of spheres resting on it.
// Bodies and shapes are not movable, so they are held by pointer.
struct BenchSetup
{
  PhysicsSystem system;
  Shape floor{PlaneGeometry{Vector3D{0.0, 1.0, 0.0}}};
  std::vector<std::unique_ptr<RigidBody>> bodies;
  std::vector<std::unique_ptr<Shape>> shapes;

  explicit BenchSetup(int numBodies)
    : system{PhysicsConfig{.fixedTimeStep = kDt}}
  {
    system.registerShape(floor);

    for (int i = 0; i < numBodies; ++i)
    {
      auto body = std::make_unique<RigidBody>(
        kMass, Coordinate{i * kSpacing, kRadius - kPenetration, 0.0});
      auto shape = std::make_unique<Shape>(SphereGeometry{kRadius});
      shape->attachTo(*body);

      system.registerBody(*body);
      system.registerShape(*shape);

      bodies.push_back(std::move(body));
      shapes.push_back(std::move(shape));
    }
  }
};

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Full step for N spheres resting on a floor plane.
 *
 * Dynamic pairs grow as N², so this tracks the cost of the exhaustive pair
 * loop as well as per-body integration.
 */
static void BM_PhysicsSystem_Step(benchmark::State& state)
{
  BenchSetup setup{static_cast<int>(state.range(0))};

  for (auto _ : state)
  {
    setup.system.step(kDt);
    benchmark::DoNotOptimize(setup.bodies.front()->getPosition());
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_PhysicsSystem_Step)->RangeMultiplier(2)->Range(2, 64)->Complexity();

/**
 * @brief Overlapping sphere-sphere narrow-phase test.
 */
static void BM_NarrowPhase_SphereOnSphere(benchmark::State& state)
{
  const Shape a{SphereGeometry{kRadius}, Coordinate{0.0, 0.0, 0.0}};
  const Shape b{SphereGeometry{kRadius}, Coordinate{0.9, 0.0, 0.0}};

  for (auto _ : state)
  {
    benchmark::DoNotOptimize(NarrowPhase::sphereOnSphere(a, b));
  }
}
BENCHMARK(BM_NarrowPhase_SphereOnSphere);
