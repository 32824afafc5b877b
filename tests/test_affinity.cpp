#include <gtest/gtest.h>

#include <cstring>
#include <thread>

#if defined(__linux__)
#include <sched.h>
#endif

#include <shardrt/support/affinity.hpp>

namespace {

using shardrt::support::bind_status;
using shardrt::support::core_set;
using shardrt::support::os_affinity_binder;

TEST(OsAffinityBinder, BindsToSingleAllowedCore)
{
#if defined(__linux__)
    const auto allowed = shardrt::support::allowed_cores();
    const auto target = allowed.back();

    bind_status status = bind_status::failed;
    int observed = -1;
    core_set after;

    // Bind a scratch thread so the test runner keeps its own mask.
    std::thread worker([&] {
        os_affinity_binder binder;
        status = binder.bind_to_cores({target});
        observed = ::sched_getcpu();
        after = shardrt::support::allowed_cores();
    });
    worker.join();

    ASSERT_EQ(status, bind_status::ok);
    EXPECT_EQ(observed, static_cast<int>(target));
    EXPECT_EQ(after, (core_set{target}));
#else
    GTEST_SKIP() << "affinity is linux only";
#endif
}

TEST(OsAffinityBinder, RejectsEmptyAndOutOfRangeCoreSets)
{
    os_affinity_binder binder;
    bind_status empty = bind_status::ok;
    bind_status huge = bind_status::ok;

    std::thread worker([&] {
        empty = binder.bind_to_cores({});
        huge = binder.bind_to_cores({1u << 20});
    });
    worker.join();

#if defined(__linux__)
    EXPECT_EQ(empty, bind_status::invalid_core);
    EXPECT_EQ(huge, bind_status::invalid_core);
#else
    EXPECT_EQ(empty, bind_status::unsupported);
    EXPECT_EQ(huge, bind_status::unsupported);
#endif
}

TEST(OsAffinityBinder, RejectsUnknownNumaNode)
{
    os_affinity_binder binder;
    bind_status status = bind_status::ok;

    std::thread worker([&] { status = binder.bind_to_numa_node(1u << 20); });
    worker.join();

    if (shardrt::support::numa_supported()) {
        EXPECT_EQ(status, bind_status::invalid_node);
    } else {
        EXPECT_EQ(status, bind_status::unsupported);
    }
}

TEST(BindStatus, HasReadableNames)
{
    EXPECT_STREQ(shardrt::support::to_string(bind_status::ok), "ok");
    EXPECT_STREQ(shardrt::support::to_string(bind_status::permission_denied), "permission denied");
    EXPECT_NE(std::strlen(shardrt::support::to_string(bind_status::failed)), 0u);
}

} // namespace
