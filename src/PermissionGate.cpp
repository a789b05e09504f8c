// src/PermissionGate.cpp
#include <Neo4jCtl/PermissionGate.hpp>
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/Utils/OS.hpp>

namespace Neo4jCtl {

std::string toString(AdminOperation operation) {
    switch (operation) {
        case AdminOperation::Stop: return "stop";
        case AdminOperation::Restart: return "restart";
        case AdminOperation::Info: return "info";
        case AdminOperation::Reset: return "reset";
    }
    return "unknown";
}

PermissionGate::PermissionGate() : m_predicate([](AdminOperation) { return true; }) {}

PermissionGate::PermissionGate(Predicate predicate) : m_predicate(std::move(predicate)) {}

PermissionGate PermissionGate::allowAll() {
    return PermissionGate();
}

PermissionGate PermissionGate::requireSuperuser() {
    return PermissionGate([](AdminOperation) { return Utils::isElevatedUser(); });
}

bool PermissionGate::isAllowed(AdminOperation operation) const {
    return !m_predicate || m_predicate(operation);
}

void PermissionGate::require(AdminOperation operation) const {
    if (!isAllowed(operation)) {
        throw PermissionDenied("Permission denied: '" + toString(operation) + "' requires elevated privileges");
    }
}

} // namespace Neo4jCtl
