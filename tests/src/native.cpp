#include "unit-tests.hpp"

#include <algorithm>
#include <future>
#include <sstream>
#include <thread>
#include <vector>

#include "native.h"

using namespace txgate;
using namespace txgate::tests;

namespace
{
    // descriptors open in the spawned shell itself
    std::vector<std::string> childDescriptors()
    {
        const auto [exit_code, output] = native::runProcess("sh", {"-c", "ls /proc/$$/fd"});
        EXPECT_EQ(exit_code, 0) << output;

        std::vector<std::string> fds;
        std::istringstream input(output);
        for(std::string fd; input >> fd;)
        {
            fds.push_back(fd);
        }
        std::ranges::sort(fds);
        return fds;
    }
}

TEST_F(UnitTest, Native_RunProcessCapturesOutputAndExitCode)
{
    const auto [exit_code, output] = native::runProcess("sh", {"-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQ(exit_code, 3);
    EXPECT_NE(output.find("out"), std::string::npos);
    EXPECT_NE(output.find("err"), std::string::npos);

    const auto [missing_code, missing_output] = native::runProcess("txgate-no-such-binary");
    EXPECT_EQ(missing_code, 127);
}

TEST_F(UnitTest, Native_ConcurrentSpawnsDoNotInheritPipes)
{
    const auto baseline = childDescriptors();
    ASSERT_FALSE(baseline.empty());

    // keeps its pipe open in this process while the second spawn forks
    auto in_flight = std::async(std::launch::async, []
    {
        return native::runProcess("sleep", {"1"});
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto during = childDescriptors();
    EXPECT_EQ(during, baseline);

    const auto [sleep_code, sleep_output] = in_flight.get();
    EXPECT_EQ(sleep_code, 0) << sleep_output;
}
