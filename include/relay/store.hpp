#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>

namespace relay {

// ============================================================================
// Store Interface
//
// Abstract key-value store for credential and session records.
// Implementations may keep records in memory or in an external database;
// callers only see this interface.
//
// Thread safety: Implementations should document their thread safety.
// ============================================================================

template <class K, class V>
class Store {
public:
    using Visitor = std::function<void(const K&, const V&)>;
    using Predicate = std::function<bool(const K&, const V&)>;

    virtual ~Store() = default;

    // Copy of the record, or std::nullopt if absent
    [[nodiscard]] virtual std::optional<V> get(const K& key) const = 0;

    // Insert or replace
    virtual void set(const K& key, V value) = 0;

    // Returns true if a record was removed
    virtual bool erase(const K& key) = 0;

    [[nodiscard]] virtual bool contains(const K& key) const = 0;

    [[nodiscard]] virtual std::size_t size() const noexcept = 0;

    // Visit every record in unspecified order.
    // fn must not modify the store.
    virtual void for_each(const Visitor& fn) const = 0;

    // Remove every record matching pred. Returns the number removed.
    virtual std::size_t erase_if(const Predicate& pred) = 0;
};

// ============================================================================
// InMemoryStore: unordered_map backed store (single process)
//
// Thread safety: NOT thread-safe. External synchronization required.
// ============================================================================

template <class K, class V>
class InMemoryStore final : public Store<K, V> {
public:
    using typename Store<K, V>::Visitor;
    using typename Store<K, V>::Predicate;

    [[nodiscard]] std::optional<V> get(const K& key) const override {
        auto it = records_.find(key);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const K& key, V value) override {
        records_.insert_or_assign(key, std::move(value));
    }

    bool erase(const K& key) override {
        return records_.erase(key) > 0;
    }

    [[nodiscard]] bool contains(const K& key) const override {
        return records_.find(key) != records_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept override {
        return records_.size();
    }

    void for_each(const Visitor& fn) const override {
        for (const auto& [key, value] : records_) {
            fn(key, value);
        }
    }

    std::size_t erase_if(const Predicate& pred) override {
        return std::erase_if(records_, [&pred](const auto& entry) {
            return pred(entry.first, entry.second);
        });
    }

private:
    std::unordered_map<K, V> records_;
};

}  // namespace relay
