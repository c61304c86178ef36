#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"

namespace agentflow {

// Ordered list of element ids. Duplicates are allowed; include() is the
// de-duplicating insert. Negative indexes count from the end.
class Progression : public Element {
public:
    using const_iterator = std::vector<ElementId>::const_iterator;

    Progression() = default;
    explicit Progression(std::vector<ElementId> order, std::string name = {});

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    void clear() { order_.clear(); }

    const std::vector<ElementId>& order() const { return order_; }

    // Element access; throws ItemNotFoundError when out of range
    const ElementId& get(std::ptrdiff_t index) const;
    const ElementId& operator[](std::ptrdiff_t index) const { return get(index); }

    // Half-open slice [start, stop); both clamp to the bounds like a sequence
    Progression slice(std::ptrdiff_t start, std::ptrdiff_t stop) const;
    void set(std::ptrdiff_t index, const ElementId& id);
    void set_slice(std::ptrdiff_t start, std::ptrdiff_t stop, const std::vector<ElementId>& ids);
    void erase(std::ptrdiff_t index);
    void erase_slice(std::ptrdiff_t start, std::ptrdiff_t stop);

    void append(const ElementId& id);
    void append(const Element& element) { append(element.id()); }

    // Only another Progression can be spliced in; raw ids go through include()
    void extend(const Progression& other);

    // Adds ids not already present, keeping their relative order
    void include(const ElementId& id);
    void include(const std::vector<ElementId>& ids);

    // Removes every occurrence; false if the id was absent
    bool exclude(const ElementId& id);

    // Removes the first occurrence; throws ItemNotFoundError if absent
    void remove(const ElementId& id);

    void insert(std::ptrdiff_t index, const ElementId& id);

    // Throw ItemNotFoundError on an empty progression / bad index
    ElementId pop();
    ElementId pop(std::ptrdiff_t index);
    ElementId popleft();

    bool contains(const ElementId& id) const;
    // True only if every id is present
    bool contains(const std::vector<ElementId>& ids) const;

    size_t index(const ElementId& id) const;
    size_t count(const ElementId& id) const;

    Progression reversed() const;

    const_iterator begin() const { return order_.begin(); }
    const_iterator end() const { return order_.end(); }

    Progression operator+(const ElementId& id) const;
    Progression operator+(const Progression& other) const;
    Progression& operator+=(const ElementId& id);
    Progression& operator+=(const Progression& other);
    Progression operator-(const ElementId& id) const;
    Progression operator-(const Progression& other) const;
    Progression& operator-=(const ElementId& id);
    Progression& operator-=(const Progression& other);

    // Same order and name; ids of the progressions themselves are ignored
    bool operator==(const Progression& other) const;
    bool operator!=(const Progression& other) const { return !(*this == other); }

    nlohmann::json to_json() const override;

private:
    std::string name_;
    std::vector<ElementId> order_;

    size_t normalize(std::ptrdiff_t index) const;
    std::pair<size_t, size_t> normalize_range(std::ptrdiff_t start, std::ptrdiff_t stop) const;
};

} // namespace agentflow
