#include "core/progression.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace agentflow {

Progression::Progression(std::vector<ElementId> order, std::string name)
    : name_(std::move(name))
    , order_(std::move(order)) {}

size_t Progression::normalize(std::ptrdiff_t index) const {
    auto n = static_cast<std::ptrdiff_t>(order_.size());
    if (index < 0) {
        index += n;
    }
    if (index < 0 || index >= n) {
        throw ItemNotFoundError("index " + std::to_string(index) + " out of range");
    }
    return static_cast<size_t>(index);
}

std::pair<size_t, size_t> Progression::normalize_range(std::ptrdiff_t start, std::ptrdiff_t stop) const {
    auto n = static_cast<std::ptrdiff_t>(order_.size());
    auto clamp = [n](std::ptrdiff_t i) {
        if (i < 0) {
            i += n;
        }
        return std::min(std::max<std::ptrdiff_t>(i, 0), n);
    };
    auto s = clamp(start);
    auto e = clamp(stop);
    if (e < s) {
        e = s;
    }
    return {static_cast<size_t>(s), static_cast<size_t>(e)};
}

const ElementId& Progression::get(std::ptrdiff_t index) const {
    return order_[normalize(index)];
}

Progression Progression::slice(std::ptrdiff_t start, std::ptrdiff_t stop) const {
    auto [s, e] = normalize_range(start, stop);
    if (s == e) {
        throw ItemNotFoundError("slice [" + std::to_string(start) + ", " +
            std::to_string(stop) + ") is empty");
    }
    return Progression(std::vector<ElementId>(order_.begin() + s, order_.begin() + e));
}

void Progression::set(std::ptrdiff_t index, const ElementId& id) {
    order_[normalize(index)] = id;
}

void Progression::set_slice(std::ptrdiff_t start, std::ptrdiff_t stop, const std::vector<ElementId>& ids) {
    auto [s, e] = normalize_range(start, stop);
    order_.erase(order_.begin() + s, order_.begin() + e);
    order_.insert(order_.begin() + s, ids.begin(), ids.end());
}

void Progression::erase(std::ptrdiff_t index) {
    order_.erase(order_.begin() + normalize(index));
}

void Progression::erase_slice(std::ptrdiff_t start, std::ptrdiff_t stop) {
    auto [s, e] = normalize_range(start, stop);
    order_.erase(order_.begin() + s, order_.begin() + e);
}

void Progression::append(const ElementId& id) {
    order_.push_back(id);
}

void Progression::extend(const Progression& other) {
    // copy first: other may be *this
    std::vector<ElementId> tail = other.order_;
    order_.insert(order_.end(), tail.begin(), tail.end());
}

void Progression::include(const ElementId& id) {
    if (!contains(id)) {
        order_.push_back(id);
    }
}

void Progression::include(const std::vector<ElementId>& ids) {
    for (const auto& id : ids) {
        include(id);
    }
}

bool Progression::exclude(const ElementId& id) {
    auto it = std::remove(order_.begin(), order_.end(), id);
    if (it == order_.end()) {
        return false;
    }
    order_.erase(it, order_.end());
    return true;
}

void Progression::remove(const ElementId& id) {
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) {
        throw ItemNotFoundError("id " + id + " not in progression");
    }
    order_.erase(it);
}

void Progression::insert(std::ptrdiff_t index, const ElementId& id) {
    auto n = static_cast<std::ptrdiff_t>(order_.size());
    if (index < 0) {
        index = std::max<std::ptrdiff_t>(index + n, 0);
    }
    index = std::min(index, n);
    order_.insert(order_.begin() + index, id);
}

ElementId Progression::pop() {
    if (order_.empty()) {
        throw ItemNotFoundError("pop from empty progression");
    }
    ElementId id = std::move(order_.back());
    order_.pop_back();
    return id;
}

ElementId Progression::pop(std::ptrdiff_t index) {
    auto i = normalize(index);
    ElementId id = std::move(order_[i]);
    order_.erase(order_.begin() + i);
    return id;
}

ElementId Progression::popleft() {
    if (order_.empty()) {
        throw ItemNotFoundError("popleft from empty progression");
    }
    ElementId id = std::move(order_.front());
    order_.erase(order_.begin());
    return id;
}

bool Progression::contains(const ElementId& id) const {
    return std::find(order_.begin(), order_.end(), id) != order_.end();
}

bool Progression::contains(const std::vector<ElementId>& ids) const {
    if (ids.empty() || order_.empty()) {
        return false;
    }
    return std::all_of(ids.begin(), ids.end(),
        [this](const ElementId& id) { return contains(id); });
}

size_t Progression::index(const ElementId& id) const {
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) {
        throw ItemNotFoundError("id " + id + " not in progression");
    }
    return static_cast<size_t>(it - order_.begin());
}

size_t Progression::count(const ElementId& id) const {
    return static_cast<size_t>(std::count(order_.begin(), order_.end(), id));
}

Progression Progression::reversed() const {
    return Progression(std::vector<ElementId>(order_.rbegin(), order_.rend()), name_);
}

Progression Progression::operator+(const ElementId& id) const {
    Progression result(order_);
    result.append(id);
    return result;
}

Progression Progression::operator+(const Progression& other) const {
    Progression result(order_);
    result.extend(other);
    return result;
}

Progression& Progression::operator+=(const ElementId& id) {
    append(id);
    return *this;
}

Progression& Progression::operator+=(const Progression& other) {
    extend(other);
    return *this;
}

Progression Progression::operator-(const ElementId& id) const {
    Progression result(order_);
    result.exclude(id);
    return result;
}

Progression Progression::operator-(const Progression& other) const {
    Progression result(order_);
    for (const auto& id : other.order_) {
        result.exclude(id);
    }
    return result;
}

Progression& Progression::operator-=(const ElementId& id) {
    exclude(id);
    return *this;
}

Progression& Progression::operator-=(const Progression& other) {
    std::vector<ElementId> ids = other.order_;
    for (const auto& id : ids) {
        exclude(id);
    }
    return *this;
}

bool Progression::operator==(const Progression& other) const {
    return order_ == other.order_ && name_ == other.name_;
}

nlohmann::json Progression::to_json() const {
    auto j = Element::to_json();
    if (!name_.empty()) {
        j["name"] = name_;
    }
    j["order"] = order_;
    return j;
}

} // namespace agentflow
