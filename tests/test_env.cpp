// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("QRXFER_CTL_SOCK");
    const std::string want = "/tmp/qrxfer-test.sock";
    g.set(want);

    qrxfer::set_log_level(qrxfer::Level::Debug);
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();
    qrxfer::set_log_level(qrxfer::Level::Info);

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("default control socket") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("QRXFER_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "qrxfer-home";
    g_home.set(tmp.string());

    qrxfer::set_log_level(qrxfer::Level::Debug);
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();
    qrxfer::set_log_level(qrxfer::Level::Info);

    std::string want = (tmp / ".cache/qrxfer/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Using default control socket " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace qrxfer;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // operator lines ignore the threshold
    testing::internal::CaptureStderr();
    LOG_SYSTEM("[RECV] 1/2 chunks");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("[SYSTEM]"), std::string::npos);
    EXPECT_NE(out3.find("[RECV] 1/2 chunks"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("debug");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, NamesFromEnv)
{
    using namespace qrxfer;
    EXPECT_EQ(level_from_name("Warning"), Level::Warning);
    EXPECT_EQ(level_from_name("err"), Level::Error);
    EXPECT_EQ(level_from_name("bogus"), Level::Info);

    EnvGuard g("QRXFER_LOG_LEVEL");
    g.set("warn");
    init_log_from_env();
    EXPECT_EQ(global_level(), Level::Warning);
    set_log_level(Level::Info);
}

TEST(Config, ParseUlong)
{
    EXPECT_EQ(config::parse_ulong("30", 1, 2048).value_or(0), 30ul);
    EXPECT_EQ(config::parse_ulong("0", 0, 10).value_or(1), 0ul);
    EXPECT_FALSE(config::parse_ulong("0", 1, 10).has_value());
    EXPECT_FALSE(config::parse_ulong("2049", 1, 2048).has_value());
    EXPECT_FALSE(config::parse_ulong("-1", 0, 10).has_value());
    EXPECT_FALSE(config::parse_ulong("+1", 0, 10).has_value());
    EXPECT_FALSE(config::parse_ulong("12abc", 0, 100).has_value());
    EXPECT_FALSE(config::parse_ulong("", 0, 10).has_value());
    EXPECT_FALSE(config::parse_ulong(nullptr, 0, 10).has_value());
    EXPECT_FALSE(config::parse_ulong("99999999999999999999999", 0, ~0ul).has_value());
}

TEST(Config, SenderFromEnv)
{
    EnvGuard g_chunk("QRXFER_CHUNK_SIZE");
    EnvGuard g_delay("QRXFER_DELAY_MS");

    g_chunk.unset();
    g_delay.unset();
    auto d = config::sender_from_env();
    EXPECT_EQ(d.chunk_size, constants::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(d.delay_ms, constants::DEFAULT_DELAY_MS);

    g_chunk.set("100");
    g_delay.set("50");
    auto c = config::sender_from_env();
    EXPECT_EQ(c.chunk_size, 100u);
    EXPECT_EQ(c.delay_ms, 50u);

    // invalid values fall back to defaults, with a warning
    g_chunk.set("0");
    g_delay.set("fast");
    testing::internal::CaptureStderr();
    auto bad        = config::sender_from_env();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(bad.chunk_size, constants::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(bad.delay_ms, constants::DEFAULT_DELAY_MS);
    EXPECT_NE(err.find("QRXFER_CHUNK_SIZE"), std::string::npos);
    EXPECT_NE(err.find("QRXFER_DELAY_MS"), std::string::npos);
}

TEST(Config, ReceiverFromEnv)
{
    EnvGuard g_out("QRXFER_OUTPUT");
    EnvGuard g_auto("QRXFER_AUTOSAVE");

    g_out.unset();
    g_auto.unset();
    auto d = config::receiver_from_env();
    EXPECT_EQ(d.output_name, "received_file");
    EXPECT_TRUE(d.auto_save);

    g_out.set("/tmp/out.bin");
    g_auto.set("0");
    auto c = config::receiver_from_env();
    EXPECT_EQ(c.output_name, "/tmp/out.bin");
    EXPECT_FALSE(c.auto_save);

    g_auto.set("maybe");
    EXPECT_TRUE(config::receiver_from_env().auto_save);
}
