#include "core/element.hpp"
#include "core/errors.hpp"

namespace agentflow {

Element::Element()
    : id_(util::generate_id())
    , created_at_(Clock::now()) {}

Element::Element(ElementId id)
    : id_(std::move(id))
    , created_at_(Clock::now()) {
    if (!util::is_valid_id(id_)) {
        throw InvalidValueError("invalid element id: '" + id_ + "'");
    }
}

int64_t Element::created_at_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        created_at_.time_since_epoch()).count();
}

nlohmann::json Element::to_json() const {
    nlohmann::json j;
    j["id"] = id_;
    j["created_at"] = created_at_ms();
    return j;
}

} // namespace agentflow
