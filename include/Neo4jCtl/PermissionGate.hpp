// include/Neo4jCtl/PermissionGate.hpp
#ifndef NEO4JCTL_PERMISSION_GATE_HPP
#define NEO4JCTL_PERMISSION_GATE_HPP

#include <functional>
#include <string>

namespace Neo4jCtl {

    enum class AdminOperation {
        Stop,
        Restart,
        Info,
        Reset
    };

    std::string toString(AdminOperation operation);

    // Checked before administrative lifecycle operations. The default admits
    // everything; deployments plug in their own predicate.
    class PermissionGate {
    public:
        using Predicate = std::function<bool(AdminOperation)>;

        PermissionGate();
        explicit PermissionGate(Predicate predicate);

        static PermissionGate allowAll();
        // Only an elevated user (uid 0 / Administrator) passes
        static PermissionGate requireSuperuser();

        bool isAllowed(AdminOperation operation) const;

        // Throws PermissionDenied
        void require(AdminOperation operation) const;

    private:
        Predicate m_predicate;
    };

} // namespace Neo4jCtl

#endif // NEO4JCTL_PERMISSION_GATE_HPP
