// Ticket: 0018_simulation_loop
// Ticket: 0015_contact_events

#include "rbd-sim/src/Environment/PhysicsSystem.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "rbd-sim/src/Physics/Collision/CollisionResponse.hpp"
#include "rbd-sim/src/Physics/Collision/NarrowPhase.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/Integration/RK4Integrator.hpp"
#include "rbd-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"
#include "rbd-sim/src/Physics/Material/MaterialProvider.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

namespace rbd_sim
{

namespace
{

std::unique_ptr<Integrator> makeIntegrator(IntegratorKind kind)
{
  switch (kind)
  {
    case IntegratorKind::RK4:
      return std::make_unique<RK4Integrator>();
    case IntegratorKind::SemiImplicitEuler:
      return std::make_unique<SemiImplicitEulerIntegrator>();
  }
  throw std::logic_error("Unrecognized integrator kind: " +
                         std::to_string(static_cast<int>(kind)));
}

}  // namespace

PhysicsSystem::PhysicsSystem(PhysicsConfig config,
                             const MaterialProvider* materials)
  : config_{std::move(config)},
    materials_{materials},
    integrator_{makeIntegrator(config_.integrator)}
{
  validateTimeStep(config_.fixedTimeStep);
  validateGravity(config_.gravity);
}

PhysicsSystem::~PhysicsSystem()
{
  for (RigidBody* body : bodies_)
  {
    body->system_ = nullptr;
    body->handle_.reset();
  }

  const auto release = [](const ShapeHandle& /* handle */, Shape& shape)
  {
    shape.system_ = nullptr;
    shape.handle_.reset();
    shape.touching_.clear();
  };
  shapes_.forEach(Mobility::Dynamic, release);
  shapes_.forEach(Mobility::Static, release);
}

// ========== Registration ==========

void PhysicsSystem::registerBody(RigidBody& body)
{
  if (body.system_ == this)
  {
    return;
  }
  if (body.system_ != nullptr)
  {
    throw std::logic_error("RigidBody is already registered with another system");
  }

  body.handle_ = bodies_.insert(&body);
  body.system_ = this;
  body.setFixedTimeStep(config_.fixedTimeStep);

  spdlog::debug("PhysicsSystem: registered body at ({}, {}, {}), {} bodies",
                body.getPosition().x(),
                body.getPosition().y(),
                body.getPosition().z(),
                bodies_.size());
}

bool PhysicsSystem::deregisterBody(RigidBody& body)
{
  if (body.system_ != this || !body.handle_)
  {
    return false;
  }

  bodies_.erase(*body.handle_);
  body.handle_.reset();
  body.system_ = nullptr;

  spdlog::debug("PhysicsSystem: deregistered body, {} bodies", bodies_.size());
  return true;
}

void PhysicsSystem::registerShape(Shape& shape)
{
  if (shape.system_ == this)
  {
    return;
  }
  if (shape.system_ != nullptr)
  {
    throw std::logic_error("Shape is already registered with another system");
  }

  if (!shape.material_ && !shape.materialId_.empty())
  {
    if (materials_ == nullptr)
    {
      throw std::runtime_error("Shape names material '" + shape.materialId_ +
                               "' but the system has no material provider");
    }

    shape.material_ = materials_->lookup(shape.materialId_);
    if (!shape.material_)
    {
      spdlog::warn("PhysicsSystem: material '{}' not found, using defaults",
                   shape.materialId_);
    }
  }

  shape.handle_ = shapes_.insert(shape);
  shape.system_ = this;

  spdlog::debug("PhysicsSystem: registered {} {} shape, {} shapes",
                shape.isStatic() ? "static" : "dynamic",
                shape.getKind() == ShapeKind::Sphere ? "sphere" : "plane",
                shapes_.size());
}

bool PhysicsSystem::deregisterShape(Shape& shape)
{
  if (shape.system_ != this || !shape.handle_)
  {
    return false;
  }

  const ShapeHandle handle = *shape.handle_;
  for (const ShapeHandle& other : shape.touching_)
  {
    if (Shape* touching = shapes_.find(other))
    {
      touching->stopTouching(handle);
    }
    events_.push_back(
      ContactEvent{.type = ContactEvent::Type::End, .a = handle, .b = other});
  }
  shape.touching_.clear();

  shapes_.erase(handle);
  shape.handle_.reset();
  shape.system_ = nullptr;

  spdlog::debug("PhysicsSystem: deregistered shape, {} shapes", shapes_.size());
  return true;
}

void PhysicsSystem::refreshShape(Shape& shape)
{
  if (shape.system_ != this || !shape.handle_)
  {
    return;
  }

  const ShapeHandle previous = *shape.handle_;
  if (previous.mobility == shape.getMobility())
  {
    return;
  }

  shapes_.erase(previous);
  const ShapeHandle current = shapes_.insert(shape);
  shape.handle_ = current;

  // Static pairs are never tested again, so those contacts end here
  const auto touching = shape.touching_;
  for (const ShapeHandle& other : touching)
  {
    shape.stopTouching(other);

    Shape* partner = shapes_.find(other);
    if (partner == nullptr)
    {
      continue;
    }
    partner->stopTouching(previous);

    if (shape.isStatic() && partner->isStatic())
    {
      events_.push_back(ContactEvent{
        .type = ContactEvent::Type::End, .a = current, .b = other});
      continue;
    }

    shape.startTouching(other);
    partner->startTouching(current);
  }

  spdlog::debug("PhysicsSystem: shape moved to {} bucket",
                shape.isStatic() ? "static" : "dynamic");
}

// ========== Configuration ==========

void PhysicsSystem::setGravity(const Coordinate& gravity)
{
  validateGravity(gravity);
  config_.gravity = gravity;
}

void PhysicsSystem::validateGravity(const Coordinate& gravity)
{
  if (!gravity.isFinite())
  {
    throw std::invalid_argument("Gravity must be finite");
  }
}

// ========== Step phases ==========

void PhysicsSystem::validateTimeStep(double deltaTime)
{
  if (!(deltaTime > 0.0) || !std::isfinite(deltaTime))
  {
    throw std::invalid_argument("Time step must be positive, got: " +
                                std::to_string(deltaTime));
  }
}

void PhysicsSystem::testPair(const Entry& a, const Entry& b)
{
  RigidBody* bodyA = a.shape->getRigidBody();
  if (bodyA != nullptr && bodyA == b.shape->getRigidBody())
  {
    return;
  }

  const ResponseContext context{.gravity = config_.gravity,
                                .fixedTimeStep = config_.fixedTimeStep,
                                .events = &events_};

  CollisionResponse::resolve(
    ShapePair{*a.shape, a.handle, *b.shape, b.handle},
    NarrowPhase::test(*a.shape, *b.shape),
    context);
}

void PhysicsSystem::preUpdate(double deltaTime)
{
  validateTimeStep(deltaTime);

  dynamicEntries_.clear();
  staticEntries_.clear();
  shapes_.forEach(Mobility::Dynamic,
                  [this](const ShapeHandle& handle, Shape& shape)
                  { dynamicEntries_.push_back(Entry{handle, &shape}); });
  shapes_.forEach(Mobility::Static,
                  [this](const ShapeHandle& handle, Shape& shape)
                  { staticEntries_.push_back(Entry{handle, &shape}); });

  for (size_t i = 0; i < dynamicEntries_.size(); ++i)
  {
    for (size_t j = i + 1; j < dynamicEntries_.size(); ++j)
    {
      testPair(dynamicEntries_[i], dynamicEntries_[j]);
    }
    for (const Entry& stationary : staticEntries_)
    {
      testPair(dynamicEntries_[i], stationary);
    }
  }

  spdlog::trace("PhysicsSystem: preUpdate dt={} dynamic={} static={}",
                deltaTime,
                dynamicEntries_.size(),
                staticEntries_.size());
}

void PhysicsSystem::mainUpdate(double deltaTime)
{
  validateTimeStep(deltaTime);

  for (RigidBody* body : bodies_)
  {
    if (body->isEnabled())
    {
      if (body->getSimulateGravity())
      {
        body->addAcceleration(config_.gravity);
      }
      integrator_->step(*body, deltaTime);
    }
    body->resetAccumulatedForces();
  }
}

void PhysicsSystem::postUpdate(double deltaTime)
{
  validateTimeStep(deltaTime);

  // Listeners may deregister shapes, which queues further events
  std::vector<ContactEvent> dispatched;
  dispatched.swap(events_);

  if (contactCallback_)
  {
    for (const ContactEvent& event : dispatched)
    {
      contactCallback_(event);
    }
  }
}

void PhysicsSystem::step(double deltaTime)
{
  preUpdate(deltaTime);
  mainUpdate(deltaTime);
  postUpdate(deltaTime);
}

}  // namespace rbd_sim
