#pragma once

#include <stdexcept>
#include <string>

namespace tribe {

// A request referenced a user or tribe the profile store does not know.
// Fails that single request only.
class NotFoundError : public std::runtime_error
{
public:
    NotFoundError(std::string kind, std::string id)
        : std::runtime_error(kind + " not found: " + id)
        , kind_(std::move(kind))
        , id_(std::move(id))
    {}

    const std::string& kind() const noexcept { return kind_; }
    const std::string& id() const noexcept { return id_; }

private:
    std::string kind_;
    std::string id_;
};

// Group size, capacity or membership invariant broken. Programming error.
class InvariantViolation : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace tribe
