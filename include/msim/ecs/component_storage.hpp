#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set component pool.

#include "msim/ecs/entity.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace msim::ecs {

/// Type-erased view of a pool so EntityManager can drop a destroyed
/// entity's components without knowing their types.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;
};

/// Dense component array indexed through a sparse entity-id table.
///
/// @code
///   sparse_  [entity.id] -> dense index (or kInvalidIndex)
///   dense_   [index]     -> component
///   owners_  [index]     -> owning entity
/// @endcode
///
/// Removal swaps the last element into the hole, so dense order is not
/// stable across removals.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    /// Construct a component for @p entity, replacing any existing one.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        if (Has(entity)) {
            auto idx = sparse_[entity.id()];
            dense_[idx] = T(std::forward<Args>(args)...);
            return dense_[idx];
        }

        const auto idx = static_cast<uint32_t>(dense_.size());
        if (entity.id() >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entity.id()) + 1, kInvalidIndex);
        }
        sparse_[entity.id()] = idx;

        dense_.emplace_back(std::forward<Args>(args)...);
        owners_.push_back(entity);
        return dense_.back();
    }

    /// Component of @p entity, or nullptr when absent.
    [[nodiscard]] T* Find(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* Find(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    /// Component of @p entity. Requires Has(entity).
    [[nodiscard]] T& Get(Entity entity) { return dense_[sparse_[entity.id()]]; }
    [[nodiscard]] const T& Get(Entity entity) const { return dense_[sparse_[entity.id()]]; }

    /// Has() also checks the stored owner, so a stale handle to a recycled
    /// slot does not see the new owner's component.
    [[nodiscard]] bool Has(Entity entity) const override {
        auto eid = entity.id();
        return entity.isValid() && eid < sparse_.size() &&
               sparse_[eid] != kInvalidIndex && owners_[sparse_[eid]] == entity;
    }

    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);
        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            owners_[idx] = owners_[lastIdx];
            sparse_[owners_[idx].id()] = idx;
        }

        dense_.pop_back();
        owners_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    void Clear() override {
        dense_.clear();
        owners_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    /// Owner of the component at dense @p index.
    [[nodiscard]] Entity EntityAt(std::size_t index) const { return owners_[index]; }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    std::vector<T> dense_;
    std::vector<Entity> owners_;
    std::vector<uint32_t> sparse_;
};

}  // namespace msim::ecs
