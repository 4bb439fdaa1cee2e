// =============================================================================
// chain.cpp - Transactional Execution Substrate
// =============================================================================

#include "lever/chain.hpp"
#include "lever/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace lever {

// =============================================================================
// Event Log
// =============================================================================

void EventLog::emit(const Address& emitter, std::string name, nlohmann::json args) {
    events_.push_back(Event{emitter, std::move(name), std::move(args)});
}

std::vector<Event> EventLog::find(std::string_view name) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.name == name) out.push_back(e);
    }
    return out;
}

std::vector<Event> EventLog::find(const Address& emitter, std::string_view name) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.emitter == emitter && e.name == name) out.push_back(e);
    }
    return out;
}

size_t EventLog::count(std::string_view name) const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                             [&](const Event& e) { return e.name == name; }));
}

void EventLog::checkpoint() {
    marks_.push_back(events_.size());
}

void EventLog::commit() {
    marks_.pop_back();
}

void EventLog::rollback() {
    events_.resize(marks_.back());
    marks_.pop_back();
}

// =============================================================================
// Frame
// =============================================================================

Chain::Frame::Frame(Chain& chain) : chain_(chain) {
    ++chain_.depth_;
    for (Journaled* j : chain_.journals_) j->checkpoint();
    chain_.events_.checkpoint();
}

Chain::Frame::~Frame() {
    if (committed_) {
        for (Journaled* j : chain_.journals_) j->commit();
        chain_.events_.commit();
    } else {
        for (Journaled* j : chain_.journals_) j->rollback();
        chain_.events_.rollback();
        if (chain_.depth_ == 1) {
            Logger::debug("transaction reverted");
        }
    }
    --chain_.depth_;
}

// =============================================================================
// Chain
// =============================================================================

Chain::Chain() : timestamp_(1700000000) {}

void Chain::attach(Journaled* journal) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (depth_ != 0) {
        throw std::logic_error("Chain: state cannot be attached inside a transaction");
    }
    journals_.push_back(journal);
}

void Chain::detach(Journaled* journal) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    journals_.erase(std::remove(journals_.begin(), journals_.end(), journal), journals_.end());
}

uint32_t Chain::depth() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return depth_;
}

uint64_t Chain::now() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return timestamp_;
}

void Chain::set_time(uint64_t timestamp) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    timestamp_ = timestamp;
}

void Chain::advance_time(uint64_t seconds) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    timestamp_ += seconds;
}

Address Chain::create_address(std::string_view label) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Address addr = address_from_id(next_address_id_++);
    if (!label.empty()) {
        labels_[std::string(label)] = addr;
        names_[addr] = std::string(label);
    }
    return addr;
}

std::optional<Address> Chain::lookup(std::string_view label) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = labels_.find(label);
    if (it == labels_.end()) return std::nullopt;
    return it->second;
}

std::string Chain::label_of(const Address& addr) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = names_.find(addr);
    if (it == names_.end()) return to_hex(addr);
    return it->second;
}

Address Chain::resolve(std::string_view label_or_hex) const {
    if (label_or_hex.size() == 42 && label_or_hex[0] == '0' && label_or_hex[1] == 'x') {
        return address_from_hex(label_or_hex);
    }
    auto addr = lookup(label_or_hex);
    if (!addr) {
        throw std::invalid_argument("unknown address label: " + std::string(label_or_hex));
    }
    return *addr;
}

void Chain::emit(const Address& emitter, std::string name, nlohmann::json args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Logger::debug("event {}.{} {}", label_of(emitter), name, args.dump());
    events_.emit(emitter, std::move(name), std::move(args));
}

std::vector<Event> Chain::events(std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.find(name);
}

std::vector<Event> Chain::events(const Address& emitter, std::string_view name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.find(emitter, name);
}

size_t Chain::event_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.size();
}

} // namespace lever
