// tests/PermissionGateTest.cpp
#include <Neo4jCtl/Errors.hpp>
#include <Neo4jCtl/PermissionGate.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace Neo4jCtl;

TEST(PermissionGateTest, DefaultAdmitsEverything) {
    PermissionGate gate;
    for (auto op : {AdminOperation::Stop, AdminOperation::Restart, AdminOperation::Info, AdminOperation::Reset}) {
        EXPECT_TRUE(gate.isAllowed(op));
        EXPECT_NO_THROW(gate.require(op));
    }
}

TEST(PermissionGateTest, PredicateSeesOperation) {
    std::vector<AdminOperation> seen;
    PermissionGate gate([&seen](AdminOperation op) {
        seen.push_back(op);
        return op == AdminOperation::Info;
    });

    EXPECT_NO_THROW(gate.require(AdminOperation::Info));
    EXPECT_THROW(gate.require(AdminOperation::Reset), PermissionDenied);
    EXPECT_EQ(seen, (std::vector<AdminOperation>{AdminOperation::Info, AdminOperation::Reset}));
}

TEST(PermissionGateTest, DenialNamesOperation) {
    PermissionGate gate([](AdminOperation) { return false; });
    try {
        gate.require(AdminOperation::Restart);
        FAIL() << "expected PermissionDenied";
    } catch (const PermissionDenied& e) {
        EXPECT_NE(std::string(e.what()).find("restart"), std::string::npos);
    }
}
