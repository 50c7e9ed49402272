// Ticket: 0005_generational_arena

#ifndef RBD_SIM_CONTAINER_SLOT_MAP_HPP
#define RBD_SIM_CONTAINER_SLOT_MAP_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <utility>
#include <vector>

namespace rbd_sim
{

/**
 * @brief Stable handle into a SlotMap.
 *
 * A handle stays valid until the value it names is erased. After that the
 * slot's generation is bumped and the handle resolves to nothing, even if the
 * slot has been reused for a new value.
 */
struct SlotHandle
{
  uint32_t index{std::numeric_limits<uint32_t>::max()};
  uint32_t generation{0};

  [[nodiscard]] bool isNull() const
  {
    return index == std::numeric_limits<uint32_t>::max();
  }

  bool operator==(const SlotHandle&) const = default;
};

struct SlotHandleHash
{
  size_t operator()(const SlotHandle& handle) const noexcept
  {
    const uint64_t key =
      (static_cast<uint64_t>(handle.generation) << 32U) | handle.index;
    return std::hash<uint64_t>{}(key);
  }
};

/**
 * @brief Generational arena with dense value storage.
 *
 * Values live contiguously in insertion order. A slot table maps each
 * handle index to the value's dense position and carries the generation
 * used to reject stale handles; freed slots are chained into a free list.
 *
 * - insert: O(1) amortized
 * - erase: O(1), swap-and-pop on the dense array (the last value fills the hole)
 * - find: O(1)
 *
 * Iteration visits values in dense order: registration order until the first
 * erase. The order never changes unless the map is modified, so it is stable
 * across a simulation step.
 *
 * T needs neither hashing nor equality.
 *
 * Thread safety: Not thread-safe (single-threaded physics loop assumed).
 *
 * @tparam T Stored value type
 */
template <typename T>
class SlotMap
{
public:
  using iterator = typename std::vector<T>::iterator;
  using const_iterator = typename std::vector<T>::const_iterator;

  SlotMap() = default;

  /**
   * @brief Insert a value and return its handle
   */
  SlotHandle insert(T value)
  {
    uint32_t slotIndex;
    if (freeHead_ != kNoSlot)
    {
      slotIndex = freeHead_;
      freeHead_ = slots_[slotIndex].position;
    }
    else
    {
      slotIndex = static_cast<uint32_t>(slots_.size());
      slots_.push_back(Slot{});
    }

    Slot& slot = slots_[slotIndex];
    slot.position = static_cast<uint32_t>(values_.size());
    slot.occupied = true;

    values_.push_back(std::move(value));
    owners_.push_back(slotIndex);

    return SlotHandle{slotIndex, slot.generation};
  }

  /**
   * @brief Remove the value named by the handle
   *
   * @return false when the handle is stale or null (nothing removed)
   */
  bool erase(const SlotHandle& handle)
  {
    if (!contains(handle))
    {
      return false;
    }

    Slot& slot = slots_[handle.index];
    const uint32_t hole = slot.position;
    const uint32_t last = static_cast<uint32_t>(values_.size() - 1);

    if (hole != last)
    {
      values_[hole] = std::move(values_[last]);
      owners_[hole] = owners_[last];
      slots_[owners_[hole]].position = hole;
    }
    values_.pop_back();
    owners_.pop_back();

    ++slot.generation;
    slot.occupied = false;
    slot.position = freeHead_;
    freeHead_ = handle.index;
    return true;
  }

  /**
   * @brief Resolve a handle
   *
   * @return Pointer to the value, or nullptr when the handle is stale.
   *         Valid until the next insert or erase.
   */
  [[nodiscard]] T* find(const SlotHandle& handle)
  {
    return contains(handle) ? &values_[slots_[handle.index].position] : nullptr;
  }

  [[nodiscard]] const T* find(const SlotHandle& handle) const
  {
    return contains(handle) ? &values_[slots_[handle.index].position] : nullptr;
  }

  [[nodiscard]] bool contains(const SlotHandle& handle) const
  {
    return handle.index < slots_.size() && slots_[handle.index].occupied &&
           slots_[handle.index].generation == handle.generation;
  }

  /**
   * @brief Handle of the value at a dense position (0 <= position < size())
   */
  [[nodiscard]] SlotHandle handleAt(size_t position) const
  {
    const uint32_t slotIndex = owners_[position];
    return SlotHandle{slotIndex, slots_[slotIndex].generation};
  }

  void clear()
  {
    for (uint32_t position = 0; position < owners_.size(); ++position)
    {
      Slot& slot = slots_[owners_[position]];
      ++slot.generation;
      slot.occupied = false;
      slot.position = freeHead_;
      freeHead_ = owners_[position];
    }
    values_.clear();
    owners_.clear();
  }

  [[nodiscard]] size_t size() const
  {
    return values_.size();
  }

  [[nodiscard]] bool empty() const
  {
    return values_.empty();
  }

  iterator begin()
  {
    return values_.begin();
  }
  iterator end()
  {
    return values_.end();
  }
  const_iterator begin() const
  {
    return values_.begin();
  }
  const_iterator end() const
  {
    return values_.end();
  }

  [[nodiscard]] T& operator[](size_t position)
  {
    return values_[position];
  }
  [[nodiscard]] const T& operator[](size_t position) const
  {
    return values_[position];
  }

private:
  static constexpr uint32_t kNoSlot = std::numeric_limits<uint32_t>::max();

  struct Slot
  {
    // Dense position while occupied; next free slot while vacant
    uint32_t position{kNoSlot};
    uint32_t generation{0};
    bool occupied{false};
  };

  std::vector<T> values_;
  std::vector<uint32_t> owners_;  // dense position -> slot index
  std::vector<Slot> slots_;
  uint32_t freeHead_{kNoSlot};
};

}  // namespace rbd_sim

#endif  // RBD_SIM_CONTAINER_SLOT_MAP_HPP
