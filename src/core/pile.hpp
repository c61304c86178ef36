#pragma once
#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"
#include "core/errors.hpp"
#include "core/progression.hpp"

namespace agentflow {

// Ordered, keyed collection of Elements.
//
// Items live in an id -> item map; their order lives in a Progression. Every
// operation takes the Pile's mutex, so both structures always agree. When a
// set of item types is declared, every inserted item's runtime type must be in
// it (exact match) or the insertion throws TypeConstraintError.
//
// The async_* forms run the same operation on another thread and take the same
// mutex. The Pile must outlive the returned futures.
template <typename T>
class Pile : public Element {
    static_assert(std::is_base_of<Element, T>::value, "Pile items must derive from Element");

public:
    using value_type = std::shared_ptr<T>;
    using TypeSet = std::set<std::type_index>;
    using Guard = std::unique_lock<std::recursive_mutex>;

    Pile() = default;

    explicit Pile(TypeSet item_types)
        : item_types_(std::move(item_types)) {}

    explicit Pile(const std::vector<value_type>& items, TypeSet item_types = {})
        : item_types_(std::move(item_types)) {
        include(items);
    }

    Pile(const Pile& other)
        : Element(other) {
        Guard guard(other.mutex_);
        item_types_ = other.item_types_;
        items_ = other.items_;
        order_ = other.order_;
    }

    Pile(Pile&& other)
        : Element(other) {
        Guard guard(other.mutex_);
        item_types_ = std::move(other.item_types_);
        items_ = std::move(other.items_);
        order_ = std::move(other.order_);
        other.items_.clear();
        other.order_.clear();
    }

    Pile& operator=(const Pile& other) {
        if (this != &other) {
            std::scoped_lock lock(mutex_, other.mutex_);
            item_types_ = other.item_types_;
            items_ = other.items_;
            order_ = other.order_;
        }
        return *this;
    }

    Pile& operator=(Pile&& other) {
        if (this != &other) {
            std::scoped_lock lock(mutex_, other.mutex_);
            item_types_ = std::move(other.item_types_);
            items_ = std::move(other.items_);
            order_ = std::move(other.order_);
            other.items_.clear();
            other.order_.clear();
        }
        return *this;
    }

    const TypeSet& item_types() const { return item_types_; }

    // Hold the Pile's mutex across several operations
    Guard lock() const { return Guard(mutex_); }

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    value_type get(const ElementId& id) const {
        Guard guard(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) {
            throw ItemNotFoundError("item " + id + " not found in pile");
        }
        return it->second;
    }

    value_type get(const ElementId& id, value_type default_value) const {
        Guard guard(mutex_);
        auto it = items_.find(id);
        return it == items_.end() ? default_value : it->second;
    }

    // Positional access through the order; negative indexes count from the end
    value_type at(std::ptrdiff_t index) const {
        Guard guard(mutex_);
        return items_.at(order_.get(index));
    }

    value_type front() const { return at(0); }
    value_type back() const { return at(-1); }

    // New Pile holding [start, stop) with the same type constraint
    Pile slice(std::ptrdiff_t start, std::ptrdiff_t stop) const {
        Guard guard(mutex_);
        std::vector<value_type> result;
        for (const auto& id : order_.slice(start, stop)) {
            result.push_back(items_.at(id));
        }
        return Pile(result, item_types_);
    }

    bool contains(const ElementId& id) const {
        Guard guard(mutex_);
        return items_.count(id) > 0;
    }

    bool contains(const value_type& item) const {
        return item && contains(item->id());
    }

    size_t size() const {
        Guard guard(mutex_);
        return order_.size();
    }

    bool empty() const { return size() == 0; }

    std::vector<ElementId> keys() const {
        Guard guard(mutex_);
        return order_.order();
    }

    // Snapshot of the items in order
    std::vector<value_type> values() const {
        Guard guard(mutex_);
        std::vector<value_type> result;
        result.reserve(order_.size());
        for (const auto& id : order_) {
            result.push_back(items_.at(id));
        }
        return result;
    }

    Progression order() const {
        Guard guard(mutex_);
        return order_;
    }

    // Visit a snapshot taken at the start; mutation during the walk does not
    // affect which items are visited. Yields between steps.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& item : values()) {
            fn(item);
            std::this_thread::yield();
        }
    }

    // ------------------------------------------------------------------
    // Mutation
    // ------------------------------------------------------------------

    // Idempotent: an id already present is left where it is
    bool include(const value_type& item) {
        check_item(item);
        Guard guard(mutex_);
        if (items_.count(item->id()) == 0) {
            order_.append(item->id());
            items_.emplace(item->id(), item);
        }
        return true;
    }

    // All items are checked before any is inserted
    bool include(const std::vector<value_type>& items) {
        for (const auto& item : items) {
            check_item(item);
        }
        Guard guard(mutex_);
        for (const auto& item : items) {
            if (items_.count(item->id()) == 0) {
                order_.append(item->id());
                items_.emplace(item->id(), item);
            }
        }
        return true;
    }

    void append(const value_type& item) { include(item); }

    void update(const std::vector<value_type>& items) { include(items); }

    void update(const Pile& other) {
        if (&other == this) {
            return;
        }
        include(other.values());
    }

    // Throws ItemExistsError if the id is already present
    void insert(std::ptrdiff_t index, const value_type& item) {
        check_item(item);
        Guard guard(mutex_);
        if (items_.count(item->id()) > 0) {
            throw ItemExistsError("item " + item->id() + " already exists in pile");
        }
        order_.insert(index, item->id());
        items_.emplace(item->id(), item);
    }

    // Replace the item at a position
    void set(std::ptrdiff_t index, const value_type& item) {
        check_item(item);
        Guard guard(mutex_);
        const ElementId old_id = order_.get(index);
        if (old_id != item->id() && items_.count(item->id()) > 0) {
            throw ItemExistsError("item " + item->id() + " already exists in pile");
        }
        order_.set(index, item->id());
        items_.erase(old_id);
        items_.emplace(item->id(), item);
    }

    value_type pop(const ElementId& id) {
        Guard guard(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) {
            throw ItemNotFoundError("item " + id + " not found in pile");
        }
        value_type item = it->second;
        items_.erase(it);
        order_.remove(id);
        return item;
    }

    value_type pop(const ElementId& id, value_type default_value) {
        Guard guard(mutex_);
        if (items_.count(id) == 0) {
            return default_value;
        }
        return pop(id);
    }

    value_type pop_at(std::ptrdiff_t index) {
        Guard guard(mutex_);
        return pop(order_.get(index));
    }

    // Throws ItemNotFoundError if absent
    void remove(const ElementId& id) { pop(id); }

    // False if absent; never throws
    bool exclude(const ElementId& id) {
        Guard guard(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) {
            return false;
        }
        items_.erase(it);
        order_.exclude(id);
        return true;
    }

    bool exclude(const value_type& item) {
        return item && exclude(item->id());
    }

    void clear() {
        Guard guard(mutex_);
        items_.clear();
        order_.clear();
    }

    // ------------------------------------------------------------------
    // Composition; results keep this Pile's type constraint
    // ------------------------------------------------------------------

    Pile operator|(const Pile& other) const {
        Pile result(values(), item_types_);
        result.include(other.values());
        return result;
    }

    Pile operator&(const Pile& other) const {
        std::vector<value_type> common;
        for (const auto& item : values()) {
            if (other.contains(item->id())) {
                common.push_back(item);
            }
        }
        return Pile(common, item_types_);
    }

    Pile operator^(const Pile& other) const {
        std::vector<value_type> diff;
        for (const auto& item : values()) {
            if (!other.contains(item->id())) {
                diff.push_back(item);
            }
        }
        for (const auto& item : other.values()) {
            if (!contains(item->id())) {
                diff.push_back(item);
            }
        }
        return Pile(diff, item_types_);
    }

    // ------------------------------------------------------------------
    // Asynchronous forms
    // ------------------------------------------------------------------

    std::future<value_type> async_get(ElementId id) const {
        return std::async(std::launch::async, [this, id]() { return get(id); });
    }

    std::future<void> async_set(std::ptrdiff_t index, value_type item) {
        return std::async(std::launch::async, [this, index, item]() { set(index, item); });
    }

    std::future<value_type> async_pop(ElementId id) {
        return std::async(std::launch::async, [this, id]() { return pop(id); });
    }

    std::future<bool> async_include(value_type item) {
        return std::async(std::launch::async, [this, item]() { return include(item); });
    }

    std::future<bool> async_exclude(ElementId id) {
        return std::async(std::launch::async, [this, id]() { return exclude(id); });
    }

    std::future<void> async_update(std::vector<value_type> items) {
        return std::async(std::launch::async, [this, items]() { update(items); });
    }

    std::future<void> async_clear() {
        return std::async(std::launch::async, [this]() { clear(); });
    }

    nlohmann::json to_json() const override {
        auto j = Element::to_json();
        j["items"] = nlohmann::json::array();
        for (const auto& item : values()) {
            j["items"].push_back(item->to_json());
        }
        return j;
    }

private:
    mutable std::recursive_mutex mutex_;
    TypeSet item_types_;
    std::unordered_map<ElementId, value_type> items_;
    Progression order_;

    void check_item(const value_type& item) const {
        if (!item) {
            throw TypeConstraintError("null item cannot be added to a pile");
        }
        if (item_types_.empty()) {
            return;
        }
        std::type_index actual(typeid(*item));
        if (item_types_.count(actual) == 0) {
            throw TypeConstraintError(std::string("item type ") + actual.name() +
                " is not allowed in this pile");
        }
    }
};

} // namespace agentflow
