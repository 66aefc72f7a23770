#include <gtest/gtest.h>

#include <stdexcept>

#include "utils.hpp"

using namespace NetcapSetup;

TEST(UtilsTest, JoinCommandLineQuotesOnlyWhenNeeded)
{
    EXPECT_EQ(joinCommandLine({"apt-get", "update", "-qq"}), "apt-get update -qq");
    EXPECT_EQ(joinCommandLine({"sh", "-c", "exit 3"}), "sh -c 'exit 3'");
    EXPECT_EQ(joinCommandLine({"echo", "it's"}), "echo 'it'\\''s'");
    EXPECT_EQ(joinCommandLine({"echo", ""}), "echo ''");
    EXPECT_EQ(joinCommandLine({}), "");
    EXPECT_EQ(joinCommandLine({"--break-system-packages", "-q"}), "--break-system-packages -q");
}

TEST(UtilsTest, JoinCommandLineQuotesShellMetacharacters)
{
    EXPECT_EQ(joinCommandLine({"echo", "a;b"}), "echo 'a;b'");
    EXPECT_EQ(joinCommandLine({"echo", "a|b", "x&y"}), "echo 'a|b' 'x&y'");
    EXPECT_EQ(joinCommandLine({"ls", "*.pcap"}), "ls '*.pcap'");
    EXPECT_EQ(joinCommandLine({"cat", "<in", ">out"}), "cat '<in' '>out'");
    EXPECT_EQ(joinCommandLine({"echo", "`id`", "(x)", "#c", "~"}), "echo '`id`' '(x)' '#c' '~'");
}

TEST(UtilsTest, RemoteSourceDetection)
{
    EXPECT_TRUE(isRemoteSource("http://example.org/plan.yaml"));
    EXPECT_TRUE(isRemoteSource("https://example.org/plan.yaml"));
    EXPECT_FALSE(isRemoteSource("/etc/netcap-setup.yaml"));
    EXPECT_FALSE(isRemoteSource("plans/https://odd.yaml"));
    EXPECT_FALSE(isRemoteSource("ftp://example.org/plan.yaml"));
}

TEST(UtilsTest, DisplayWidthCountsCodePoints)
{
    EXPECT_EQ(displayWidth(""), 0u);
    EXPECT_EQ(displayWidth("abc"), 3u);
    EXPECT_EQ(displayWidth("NetCapture Pro \xE2\x80\x94 Installer"), 26u);
    EXPECT_EQ(displayWidth("✓"), 1u);
}

TEST(UtilsTest, FetchRemoteTextReportsTransportErrors)
{
    // Nothing listens on port 1, so the connection is refused locally
    EXPECT_THROW(fetchRemoteText("http://127.0.0.1:1/plan.yaml"), std::runtime_error);

    try {
        fetchRemoteText("http://127.0.0.1:1/plan.yaml");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to fetch http://127.0.0.1:1/plan.yaml"),
                  std::string::npos);
    }
}
