#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

namespace
{

std::string temp_sock(const char *tag)
{
    return "/tmp/qrxfer-ipc-ut-" + std::string(tag) + "-" + std::to_string(getpid()) + ".sock";
}

bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 200; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

}  // namespace

TEST(IPC, TestExpandUser)
{
    const char       *path      = std::getenv("HOME");
    const std::string saved     = path ? path : "";
    const char       *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");
    EXPECT_EQ(ipc::expand_user("~other/x"), "~other/x");

    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char       *path  = std::getenv("HOME");
    const std::string saved = path ? path : "";
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    std::string sock = temp_sock("quit");

    // run server (blocks until QUIT)
    std::thread th([&] { EXPECT_TRUE(ipc::start_server(sock, nullptr)); });
    ASSERT_TRUE(wait_for_socket(sock));
    // a trailing terminator is tolerated
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, ManyLinesOneConnection)
{
    std::string              sock = temp_sock("lines");
    std::mutex               mu;
    std::vector<std::string> seen;

    std::thread th([&] {
        EXPECT_TRUE(ipc::start_server(sock, [&](const std::string &l) {
            std::lock_guard<std::mutex> lk(mu);
            seen.push_back(l);
        }));
    });
    ASSERT_TRUE(wait_for_socket(sock));

    ASSERT_TRUE(ipc::send_lines(sock, {"SCAN -----BEGIN XFER MESSAGE-----", "SCAN LEN:3", "STATUS"}));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT"));
    th.join();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], "SCAN -----BEGIN XFER MESSAGE-----");
    EXPECT_EQ(seen[1], "SCAN LEN:3");
    EXPECT_EQ(seen[2], "STATUS");
    EXPECT_EQ(seen[3], "QUIT");
}

TEST(IPC, RejectsBadInput)
{
    EXPECT_FALSE(ipc::send_line(temp_sock("none"), ""));
    EXPECT_FALSE(ipc::send_lines(temp_sock("none"), {}));
    EXPECT_FALSE(ipc::send_lines(temp_sock("none"), {"a\nb"}));
    // nobody listening
    EXPECT_FALSE(ipc::send_line(temp_sock("none"), "STATUS"));
    // longer than sun_path
    EXPECT_FALSE(ipc::send_line("/tmp/" + std::string(200, 'x'), "STATUS"));
}
