#ifndef LEVER_TRANSIENT_HPP
#define LEVER_TRANSIENT_HPP

#include <map>
#include <optional>
#include <utility>

#include "error.hpp"

namespace lever {

// =============================================================================
// TransientSlot<T> - per-operation state with transaction-scoped lifetime
//
// A Scope installs a value for the duration of one top-level operation. The
// value lives in thread-local storage keyed by slot, so an operation running
// on another thread never observes it, and it is erased when the Scope ends
// whether the operation returned or threw. take() reads and clears the value
// but the slot stays occupied until the Scope ends: a second Scope on the
// same slot while one is open is a reentrant call.
// =============================================================================

template <typename T>
class TransientSlot {
public:
    class Scope {
    public:
        Scope(TransientSlot& slot, T value) : slot_(slot) {
            auto& entries = TransientSlot::entries();
            if (entries.count(&slot_) != 0) {
                throw ContractError(ErrorCode::Reentrancy);
            }
            entries.emplace(&slot_, std::optional<T>(std::move(value)));
        }

        ~Scope() { TransientSlot::entries().erase(&slot_); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        TransientSlot& slot_;
    };

    TransientSlot() = default;
    TransientSlot(const TransientSlot&) = delete;
    TransientSlot& operator=(const TransientSlot&) = delete;

    // A value is installed and not yet taken
    bool active() const {
        auto it = entries().find(this);
        return it != entries().end() && it->second.has_value();
    }

    // A Scope is open on this thread (value may already be taken)
    bool occupied() const { return entries().count(this) != 0; }

    const T* peek() const {
        auto it = entries().find(this);
        if (it == entries().end() || !it->second) return nullptr;
        return &*it->second;
    }

    std::optional<T> take() {
        auto it = entries().find(this);
        if (it == entries().end() || !it->second) return std::nullopt;
        std::optional<T> out = std::move(it->second);
        it->second.reset();
        return out;
    }

private:
    static std::map<const TransientSlot*, std::optional<T>>& entries() {
        static thread_local std::map<const TransientSlot*, std::optional<T>> slots;
        return slots;
    }
};

} // namespace lever

#endif // LEVER_TRANSIENT_HPP
