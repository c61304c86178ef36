#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include "util/id.hpp"

namespace agentflow {

// Identity + creation time; base of every addressable entity.
// Equality and hashing go by id only.
class Element {
public:
    using Clock = std::chrono::system_clock;

    Element();

    // Adopt an existing id; throws InvalidValueError if it is not a UUID4
    explicit Element(ElementId id);

    virtual ~Element() = default;

    Element(const Element&) = default;
    Element& operator=(const Element&) = default;

    const ElementId& id() const { return id_; }
    Clock::time_point created_at() const { return created_at_; }
    int64_t created_at_ms() const;

    virtual nlohmann::json to_json() const;

    bool operator==(const Element& other) const { return id_ == other.id_; }
    bool operator!=(const Element& other) const { return id_ != other.id_; }

private:
    ElementId id_;
    Clock::time_point created_at_;
};

} // namespace agentflow

namespace std {

template <>
struct hash<agentflow::Element> {
    size_t operator()(const agentflow::Element& element) const {
        return hash<agentflow::ElementId>()(element.id());
    }
};

} // namespace std
