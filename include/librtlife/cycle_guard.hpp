#pragma once

#include "export.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <typeindex>
#include <vector>

namespace librtlife {

/// Reentrancy detector for one registration.
///
/// Every construction call passes through enter()/exit() with the identity
/// of the calling chain (the calling thread).  A chain that enters while it
/// is already inside this guard depends on itself and gets a
/// cyclic_dependency.  Distinct chains may be inside the guard at the same
/// time.  The lock only protects the bookkeeping; the wrapped factory runs
/// outside of it.
class LIBRTLIFE_EXPORT cycle_guard {
public:
    explicit cycle_guard(std::type_index type) noexcept;

    cycle_guard(const cycle_guard&) = delete;
    cycle_guard& operator=(const cycle_guard&) = delete;

    /// Record the chain as in flight.  Throws cyclic_dependency if the chain
    /// is already in flight for this guard.
    void enter(std::thread::id chain);
    void enter() { enter(std::this_thread::get_id()); }

    /// Remove the chain.  Releases the tracking storage once no chain is left.
    void exit(std::thread::id chain) noexcept;
    void exit() noexcept { exit(std::this_thread::get_id()); }

    /// RAII pairing of enter()/exit() for the calling thread.
    class entry {
    public:
        explicit entry(cycle_guard& guard)
            : guard_(guard), chain_(std::this_thread::get_id())
        {
            guard_.enter(chain_);
        }
        ~entry() { guard_.exit(chain_); }

        entry(const entry&) = delete;
        entry& operator=(const entry&) = delete;

    private:
        cycle_guard& guard_;
        std::thread::id chain_;
    };

    /// Wrap a factory so that every call runs inside an entry of this guard.
    /// The guard must outlive the returned factory.
    instance_factory wrap(instance_factory raw);

    std::type_index component_type() const noexcept { return type_; }

    /// Number of chains currently inside the guard.
    std::size_t in_flight() const;

    /// True while tracking storage is allocated.
    bool holds_storage() const;

private:
    std::type_index type_;
    mutable std::mutex mutex_;
    std::unique_ptr<std::vector<std::thread::id>> chains_;
};

} // namespace librtlife
