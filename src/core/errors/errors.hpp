#pragma once
#include <stdexcept>
#include <string>

namespace Umbra {
namespace Core {

// Raised by document stores when chunks cannot be persisted.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {
    }
};

// Systemic failure that ends the run early (e.g. control channel unreachable).
class FatalRunError : public std::runtime_error {
public:
    explicit FatalRunError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Umbra
