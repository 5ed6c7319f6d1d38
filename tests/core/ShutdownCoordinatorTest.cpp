#include "sockjs/runtime/ShutdownCoordinator.hpp"
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace sockjs::rt;

TEST(ShutdownCoordinatorTest, RunsStepsInOrder) {
    ShutdownCoordinator sc;
    std::vector<std::string> ran;
    sc.registerStep("late",  60, [&] { ran.push_back("late"); });
    sc.registerStep("early",  5, [&] { ran.push_back("early"); });
    sc.registerStep("mid",   40, [&] { ran.push_back("mid"); });
    sc.stop();

    const std::vector<std::string> expected{ "early", "mid", "late" };
    EXPECT_EQ(ran, expected);
}

TEST(ShutdownCoordinatorTest, TiesKeepRegistrationOrder) {
    ShutdownCoordinator sc;
    std::vector<int> ran;
    for (int i = 0; i < 5; ++i) sc.registerStep("s", 10, [&ran, i] { ran.push_back(i); });
    sc.stop();
    const std::vector<int> expected{ 0, 1, 2, 3, 4 };
    EXPECT_EQ(ran, expected);
}

TEST(ShutdownCoordinatorTest, StopIsIdempotent) {
    ShutdownCoordinator sc;
    int calls = 0;
    sc.registerStep("once", 1, [&] { ++calls; });
    sc.stop();
    sc.stop();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sc.stopping());
}

TEST(ShutdownCoordinatorTest, FailingStepDoesNotStopTheSequence) {
    ShutdownCoordinator sc;
    bool after = false;
    sc.registerStep("boom", 1, [] { throw std::runtime_error("step failed"); });
    sc.registerStep("after", 2, [&] { after = true; });
    sc.stop();
    EXPECT_TRUE(after);
}
