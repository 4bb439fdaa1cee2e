#ifndef LEVER_CHAIN_HPP
#define LEVER_CHAIN_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace lever {

// =============================================================================
// Journaled State
// Every call frame checkpoints all journaled state; a frame that throws is
// rolled back, a frame that returns is committed into its parent.
// =============================================================================

class Journaled {
public:
    virtual ~Journaled() = default;
    virtual void checkpoint() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// =============================================================================
// Event Log
// =============================================================================

struct Event {
    Address emitter;
    std::string name;
    nlohmann::json args;
};

class EventLog : public Journaled {
public:
    void emit(const Address& emitter, std::string name, nlohmann::json args);

    const std::vector<Event>& all() const { return events_; }
    std::vector<Event> find(std::string_view name) const;
    std::vector<Event> find(const Address& emitter, std::string_view name) const;
    size_t count(std::string_view name) const;
    size_t size() const { return events_.size(); }

    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    std::vector<Event> events_;
    std::vector<size_t> marks_;
};

// =============================================================================
// Chain - transactional execution substrate
// =============================================================================

class Chain {
public:
    Chain();
    ~Chain() = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // Run fn as a call frame. Top-level frames are serialized across threads;
    // nested frames (same thread) revert independently.
    template <typename Fn>
    auto transact(Fn&& fn) -> decltype(fn());

    // Run fn under the chain lock without opening a frame (views)
    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn());

    // Journaled state must be attached outside any frame
    void attach(Journaled* journal);
    void detach(Journaled* journal);

    uint32_t depth() const;

    // =========================================================================
    // Block Time
    // =========================================================================

    uint64_t now() const;
    void set_time(uint64_t timestamp);
    void advance_time(uint64_t seconds);

    // =========================================================================
    // Address Allocation & Labels
    // =========================================================================

    Address create_address(std::string_view label);
    std::optional<Address> lookup(std::string_view label) const;
    std::string label_of(const Address& addr) const;

    // Hex address or registered label; throws std::invalid_argument
    Address resolve(std::string_view label_or_hex) const;

    // =========================================================================
    // Events
    // =========================================================================

    void emit(const Address& emitter, std::string name, nlohmann::json args);
    std::vector<Event> events(std::string_view name) const;
    std::vector<Event> events(const Address& emitter, std::string_view name) const;
    size_t event_count() const;

private:
    class Frame {
    public:
        explicit Frame(Chain& chain);
        ~Frame();
        void commit() { committed_ = true; }

    private:
        Chain& chain_;
        bool committed_ = false;
    };

    mutable std::recursive_mutex mutex_;
    std::vector<Journaled*> journals_;
    uint32_t depth_ = 0;
    uint64_t timestamp_;
    uint64_t next_address_id_ = 1;
    std::map<std::string, Address, std::less<>> labels_;
    std::map<Address, std::string> names_;
    EventLog events_;
};

template <typename Fn>
auto Chain::transact(Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Frame frame(*this);
    if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        frame.commit();
    } else {
        auto result = fn();
        frame.commit();
        return result;
    }
}

template <typename Fn>
auto Chain::read(Fn&& fn) const -> decltype(fn()) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return fn();
}

// =============================================================================
// Storage<S> - journaled component state (copy-on-first-write per frame)
// =============================================================================

template <typename S>
class Storage : public Journaled {
public:
    explicit Storage(Chain& chain) : chain_(chain) { chain_.attach(this); }
    ~Storage() override { chain_.detach(this); }

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    const S& get() const { return value_; }

    S& mut() {
        if (!frames_.empty() && !frames_.back()) frames_.back() = value_;
        return value_;
    }

    const S* operator->() const { return &value_; }
    S* operator->() { return &mut(); }

    void checkpoint() override { frames_.emplace_back(); }

    void commit() override {
        std::optional<S> saved = std::move(frames_.back());
        frames_.pop_back();
        // Parent frame had not touched the state yet: its pre-image is ours
        if (saved && !frames_.empty() && !frames_.back()) {
            frames_.back() = std::move(saved);
        }
    }

    void rollback() override {
        if (frames_.back()) value_ = std::move(*frames_.back());
        frames_.pop_back();
    }

private:
    Chain& chain_;
    S value_{};
    std::vector<std::optional<S>> frames_;
};

} // namespace lever

#endif // LEVER_CHAIN_HPP
