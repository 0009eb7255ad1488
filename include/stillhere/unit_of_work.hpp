#pragma once

/**
 * @file unit_of_work.hpp
 * @brief Transactional scope over the device store
 *
 * A unit of work serializes access to a shared store, snapshots it on entry,
 * restores the snapshot on rollback, and harvests the domain events raised by
 * every device the scope touched.
 */

#include "stillhere/store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace stillhere {

/**
 * @brief Per-scope view over a store that remembers every device it handed out
 *
 * Forwards each call to the store. Devices returned or touched are recorded
 * once, in the order they were first seen.
 */
class DeviceRepository {
  public:
    explicit DeviceRepository(DeviceStoreInterface& store) : store_(store) {}

    DevicePtr get(const std::string& uuid);
    DeviceMap get_all();
    std::vector<DevicePtr> get_fire_at_between(UnixSeconds start, UnixSeconds end);
    std::vector<DevicePtr> claim_fire_at_between(UnixSeconds start, UnixSeconds end);

    void add(const DevicePtr& device);
    void update(const std::string& uuid, const DeviceUpdate& changes);
    void remove(const std::string& uuid);
    void remove_all();

    /// Devices seen by this scope, in first-seen order
    [[nodiscard]] const std::vector<DevicePtr>& seen() const noexcept { return seen_; }

  private:
    void track(const DevicePtr& device);

    DeviceStoreInterface& store_;
    std::vector<DevicePtr> seen_;
    std::unordered_set<std::string> seen_ids_;
};

/**
 * @brief Transaction boundary used by command handlers and the poller
 */
class UnitOfWork {
  public:
    /**
     * @brief RAII guard for one scope
     *
     * Begins on construction and rolls back on destruction unless commit()
     * or rollback() already ended the scope.
     */
    class Scope {
      public:
        explicit Scope(UnitOfWork& uow);
        ~Scope();

        Scope(Scope&& other) noexcept;
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope& operator=(Scope&&) = delete;

        void commit();
        void rollback();

        [[nodiscard]] bool active() const noexcept { return uow_ != nullptr; }

      private:
        UnitOfWork* uow_;
    };

    virtual ~UnitOfWork() = default;

    /// Enter a scope: lock, snapshot, fresh repository
    virtual void begin() = 0;

    /// Finalize the scope and release the lock
    virtual void commit() = 0;

    /// Restore the entry snapshot and release the lock
    virtual void rollback() = 0;

    /// Repository for the active scope (throws InitializationError outside a scope)
    virtual DeviceRepository& devices() = 0;

    /// Whether a scope is currently open
    [[nodiscard]] virtual bool in_scope() const noexcept = 0;

    /**
     * @brief Drain pending events of every device seen by the latest scope
     *
     * Each call returns only events queued since the previous call. Valid
     * after the scope has ended.
     */
    virtual std::vector<std::shared_ptr<const Event>> collect_new_events();

    /// Open a scope guarded by RAII
    [[nodiscard]] Scope start() { return Scope(*this); }

  protected:
    /// Devices tracked by the most recent scope (empty before the first one)
    [[nodiscard]] virtual std::vector<DevicePtr> seen_devices() const = 0;
};

/**
 * @brief Unit of work over an in-memory store
 *
 * The snapshot is a deep copy of every device, so rollback also undoes
 * in-place mutations of device instances.
 */
class MemoryUnitOfWork : public UnitOfWork {
  public:
    explicit MemoryUnitOfWork(DeviceStoreInterface& store) : store_(store) {}
    ~MemoryUnitOfWork() override;

    MemoryUnitOfWork(const MemoryUnitOfWork&) = delete;
    MemoryUnitOfWork& operator=(const MemoryUnitOfWork&) = delete;

    void begin() override;
    void commit() override;
    void rollback() override;
    DeviceRepository& devices() override;
    [[nodiscard]] bool in_scope() const noexcept override { return lock_.owns_lock(); }

    /// Drains under the store's transaction lock when called outside a scope
    std::vector<std::shared_ptr<const Event>> collect_new_events() override;

  protected:
    [[nodiscard]] std::vector<DevicePtr> seen_devices() const override;

  private:
    DeviceStoreInterface& store_;
    std::unique_lock<std::mutex> lock_;
    StoreSnapshot snapshot_;
    std::unique_ptr<DeviceRepository> repository_;
};

}  // namespace stillhere
