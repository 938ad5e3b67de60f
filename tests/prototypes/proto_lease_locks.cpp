#include "test_harness/TestHarness.h"
#include "app/coordination/LeaseLockTable.h"

using namespace agentcad::app::coordination;
using agentcad::core::model::ErrorKind;
using agentcad::core::model::Timestamp;

namespace {

struct ManualClock {
    Timestamp now = std::chrono::system_clock::time_point(std::chrono::seconds(1760000000));

    void advance(int seconds) { now += std::chrono::seconds(seconds); }
};

const ResourceKey kSketch{"entity", "main:sketch_00000001"};

} // namespace

TEST_CASE(SecondHolderBlockedUntilExpiry) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });

    auto a = table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(30));
    EXPECT_OK(a);
    EXPECT_FALSE(a.renewed);
    EXPECT_TRUE(a.lock && a.lock->expiresAt == clock.now + std::chrono::seconds(30));

    auto b = table.acquire(kSketch, "agent-b", "s2", std::chrono::seconds(30));
    EXPECT_ERROR(b, ErrorKind::AlreadyLocked);
    EXPECT_TRUE(b.lock && b.lock->holder == "agent-a");

    clock.advance(31);
    auto later = table.acquire(kSketch, "agent-b", "s2", std::chrono::seconds(30));
    EXPECT_OK(later);
    EXPECT_TRUE(later.lock && later.lock->holder == "agent-b");
}

TEST_CASE(LeaseExpiresExactlyAtDeadline) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });
    EXPECT_OK(table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(10)));

    clock.advance(9);
    EXPECT_TRUE(table.status(kSketch).has_value());
    clock.advance(1);
    EXPECT_FALSE(table.status(kSketch).has_value());
    EXPECT_TRUE(table.active().empty());
}

TEST_CASE(SameHolderRenews) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });
    EXPECT_OK(table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(10)));

    clock.advance(8);
    auto renewed = table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(10));
    EXPECT_OK(renewed);
    EXPECT_TRUE(renewed.renewed);

    clock.advance(8);
    EXPECT_TRUE(table.status(kSketch).has_value());
    EXPECT_ERROR(table.acquire(kSketch, "agent-b", "s2", std::chrono::seconds(10)), ErrorKind::AlreadyLocked);
}

TEST_CASE(ReleaseOnlyByHolder) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });
    EXPECT_OK(table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(30)));

    EXPECT_FALSE(table.release(kSketch, "agent-b"));
    EXPECT_TRUE(table.status(kSketch).has_value());
    EXPECT_TRUE(table.release(kSketch, "agent-a"));
    EXPECT_FALSE(table.release(kSketch, "agent-a"));
    EXPECT_OK(table.acquire(kSketch, "agent-b", "s2", std::chrono::seconds(30)));
}

TEST_CASE(ResourcesAreIndependent) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });
    EXPECT_OK(table.acquire({"workspace", "main"}, "agent-a", "s1", std::chrono::seconds(30)));
    EXPECT_OK(table.acquire({"workspace", "W1"}, "agent-b", "s2", std::chrono::seconds(30)));
    EXPECT_OK(table.acquire({"entity", "main"}, "agent-b", "s2", std::chrono::seconds(30)));
    EXPECT_EQ(table.active().size(), static_cast<std::size_t>(3));
}

TEST_CASE(InvalidRequestsRejected) {
    LeaseLockTable table;
    EXPECT_ERROR(table.acquire({"", "x"}, "agent-a", "s1", std::chrono::seconds(30)), ErrorKind::InvalidRequest);
    EXPECT_ERROR(table.acquire(kSketch, "", "s1", std::chrono::seconds(30)), ErrorKind::InvalidRequest);
    EXPECT_ERROR(table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(0)), ErrorKind::InvalidRequest);
    EXPECT_ERROR(table.acquire(kSketch, "agent-a", "s1", agentcad::app::coordination::kMaxLeaseTtl + std::chrono::seconds(1)),
                 ErrorKind::InvalidRequest);
    EXPECT_TRUE(table.active().empty());
}

TEST_CASE(ScopedLease_ReleasesOnlyWhatItTook) {
    ManualClock clock;
    LeaseLockTable table([&clock] { return clock.now; });
    {
        ScopedLease lease(table, kSketch, "agent-a", "s1", std::chrono::seconds(30));
        EXPECT_TRUE(lease.held());
        ScopedLease blocked(table, kSketch, "agent-b", "s2", std::chrono::seconds(30));
        EXPECT_FALSE(blocked.held());
        EXPECT_TRUE(blocked.result().error == ErrorKind::AlreadyLocked);
    }
    EXPECT_FALSE(table.status(kSketch).has_value());

    EXPECT_OK(table.acquire(kSketch, "agent-a", "s1", std::chrono::seconds(30)));
    {
        ScopedLease nested(table, kSketch, "agent-a", "s1", std::chrono::seconds(30));
        EXPECT_TRUE(nested.held());
        EXPECT_TRUE(nested.result().renewed);
    }
    EXPECT_TRUE(table.status(kSketch).has_value());
}

int main() {
    return agentcad::test::runAllTests();
}
