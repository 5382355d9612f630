#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/test/processes.hpp"

namespace {

// Folder with the helper programs from sandbox/test.
const char* test_bindir = CODEBOX_TEST_BINARY_DIR;
const std::string test_tmpdir = "/tmp/codebox_testdir";

using ::testing::SizeIs;
using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

using sandbox::test::NoChildrenLeft;
using sandbox::test::UnixSandbox;

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options("foo", "bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
  EXPECT_TRUE(NoChildrenLeft());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "foo");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
  EXPECT_TRUE(NoChildrenLeft());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoStdinFile) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "return_arg1");
  options.stdin_file = "/no/such/file";
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("open:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestReturnArg1) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "return_arg1");
  options.args.push_back("15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_EQ(info.message, "Non-zero return code");
  EXPECT_TRUE(NoChildrenLeft());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignalArg1) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "signal_arg1");
  options.args.push_back("6");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 6);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "wait_arg1");
  options.args.push_back("0.1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 300);
  EXPECT_LE(info.cpu_time_millis, 50);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestBusyWaitArg1) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "busywait_arg1");
  options.args.push_back("0.2");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 180);
  EXPECT_GE(info.wall_time_millis, 180);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMallocArg1) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "malloc_arg1");
  options.args.push_back("64");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.memory_usage_kb, 64 * 1024);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "malloc_arg1");
  options.args.push_back("16");
  options.memory_limit_kb = 256 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestMemoryLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "malloc_arg1");
  options.args.push_back("512");
  options.memory_limit_kb = 64 * 1024;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 1);
  EXPECT_LT(info.memory_usage_kb, 64 * 1024);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "wait_arg1");
  options.args.push_back("0.1");
  options.wall_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_GE(info.wall_time_millis, 90);
  EXPECT_LE(info.wall_time_millis, 500);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "wait_arg1");
  options.args.push_back("10");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_TRUE(info.killed);
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 200);
  EXPECT_LE(info.wall_time_millis, 1000);
  EXPECT_TRUE(NoChildrenLeft());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimitOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "busywait_arg1");
  options.args.push_back("0.1");
  options.cpu_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimitNotOk) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "busywait_arg1");
  options.args.push_back("10");
  options.cpu_limit_millis = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGXCPU);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 990);
  EXPECT_LE(info.cpu_time_millis + info.sys_time_millis, 1500);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestOutputCaptured) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "print_arg1");
  options.args = {"100", "20"};
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.stdout_data, std::string(100, 'x'));
  EXPECT_EQ(info.stderr_data, std::string(20, 'e'));
  EXPECT_FALSE(info.stdout_truncated);
  EXPECT_FALSE(info.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestOutputTruncated) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "print_arg1");
  options.args = {"10000000", "10000"};
  options.max_output_bytes = 1000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_THAT(info.stdout_data, SizeIs(1000));
  EXPECT_THAT(info.stderr_data, SizeIs(1000));
  EXPECT_TRUE(info.stdout_truncated);
  EXPECT_TRUE(info.stderr_truncated);
  EXPECT_THAT(info.stderr_tail, SizeIs(4096));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestStdinFile) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  std::string stdin_file = test_tmpdir + "_stdin";
  {
    std::ofstream os(stdin_file);
    os << "some input\nlines\n";
  }
  ExecutionOptions options(test_bindir, "copy_stdin");
  options.stdin_file = stdin_file;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.stdout_data, "some input\nlines\n");
  remove(stdin_file.c_str());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoStdin) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "copy_stdin");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.stdout_data, "");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestProcessGroupKilled) {
  std::unique_ptr<Sandbox> sandbox = UnixSandbox();
  ASSERT_TRUE(sandbox);
  ExecutionOptions options(test_bindir, "fork_arg1");
  options.args.push_back("10");
  options.wall_limit_millis = 5000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(sandbox->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
  EXPECT_LE(info.wall_time_millis, 2000);
  EXPECT_TRUE(NoChildrenLeft());
}

// NOLINTNEXTLINE
TEST(UnixTest, TestFiniteStackHardLimit) {
  // The limit cannot be raised again, so it is lowered in a copy of the test.
  pid_t pid = fork();
  ASSERT_NE(pid, -1);
  if (pid == 0) {
    struct rlimit rlim {};
    if (getrlimit(RLIMIT_STACK, &rlim) == -1) _exit(2);
    if (rlim.rlim_cur == RLIM_INFINITY) rlim.rlim_cur = 8 * 1024 * 1024;
    rlim.rlim_max = rlim.rlim_cur;
    if (setrlimit(RLIMIT_STACK, &rlim) == -1) _exit(2);
    std::unique_ptr<Sandbox> sandbox(Unix::Create());
    ExecutionOptions options(test_bindir, "return_arg1");
    options.args.push_back("0");
    ExecutionInfo info;
    std::string error_msg;
    if (!sandbox->Execute(options, &info, &error_msg)) _exit(1);
    _exit(info.status_code == 0 ? 0 : 3);
  }
  int status = 0;
  ASSERT_EQ(waitpid(pid, &status, 0), pid);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

}  // namespace
