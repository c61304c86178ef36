#pragma once
#include <stdexcept>
#include <string>

namespace agentflow {

// Kinds of failure raised by the runtime
enum class ErrorCode {
    ITEM_NOT_FOUND,
    ITEM_EXISTS,
    TYPE_CONSTRAINT,
    INVALID_VALUE,
    RELATION,
    TRAVERSAL,
    CONDITION_TIMEOUT,
    INVALID_STATE
};

const char* error_code_to_string(ErrorCode code);

// Base of every exception thrown by agentflow
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Lookup by id or index failed and no default was given
class ItemNotFoundError : public Error {
public:
    explicit ItemNotFoundError(const std::string& message)
        : Error(ErrorCode::ITEM_NOT_FOUND, message) {}
};

class ItemExistsError : public Error {
public:
    explicit ItemExistsError(const std::string& message)
        : Error(ErrorCode::ITEM_EXISTS, message) {}
};

// Item rejected by a typed Pile
class TypeConstraintError : public Error {
public:
    explicit TypeConstraintError(const std::string& message)
        : Error(ErrorCode::TYPE_CONSTRAINT, message) {}
};

class InvalidValueError : public Error {
public:
    explicit InvalidValueError(const std::string& message)
        : Error(ErrorCode::INVALID_VALUE, message) {}
};

// Structural violation: edge endpoints missing, cyclic graph, unknown node/edge
class RelationError : public Error {
public:
    explicit RelationError(const std::string& message)
        : Error(ErrorCode::RELATION, message) {}
};

class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const std::string& message)
        : Error(ErrorCode::INVALID_STATE, message) {}
};

// Failure while interpreting a mail; names the mail and node involved
class TraversalError : public Error {
public:
    TraversalError(const std::string& message,
                   std::string mail_id = {},
                   std::string category = {},
                   std::string node_id = {})
        : Error(ErrorCode::TRAVERSAL, message)
        , mail_id_(std::move(mail_id))
        , category_(std::move(category))
        , node_id_(std::move(node_id)) {}

    const std::string& mail_id() const noexcept { return mail_id_; }
    const std::string& category() const noexcept { return category_; }
    const std::string& node_id() const noexcept { return node_id_; }

private:
    std::string mail_id_;
    std::string category_;
    std::string node_id_;
};

// An executable condition got no reply within the configured timeout
class ConditionTimeoutError : public Error {
public:
    ConditionTimeoutError(const std::string& message, std::string edge_id)
        : Error(ErrorCode::CONDITION_TIMEOUT, message)
        , edge_id_(std::move(edge_id)) {}

    const std::string& edge_id() const noexcept { return edge_id_; }

private:
    std::string edge_id_;
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ITEM_NOT_FOUND: return "item_not_found";
        case ErrorCode::ITEM_EXISTS: return "item_exists";
        case ErrorCode::TYPE_CONSTRAINT: return "type_constraint";
        case ErrorCode::INVALID_VALUE: return "invalid_value";
        case ErrorCode::RELATION: return "relation";
        case ErrorCode::TRAVERSAL: return "traversal";
        case ErrorCode::CONDITION_TIMEOUT: return "condition_timeout";
        case ErrorCode::INVALID_STATE: return "invalid_state";
    }
    return "unknown";
}

} // namespace agentflow
