#include <gtest/gtest.h>

#include "streamdl/url.hpp"

#include <stdexcept>

using streamdl::hostOf;
using streamdl::resolveUrl;

TEST(UrlTest, AbsoluteTargetReplacesBase) {
    EXPECT_EQ(resolveUrl("https://example.com/a/b", "https://objects.example.net/x?sig=1"),
              "https://objects.example.net/x?sig=1");
}

TEST(UrlTest, RelativeTargetsResolveAgainstBase) {
    EXPECT_EQ(resolveUrl("https://example.com/a/b", "/root.bin"), "https://example.com/root.bin");
    EXPECT_EQ(resolveUrl("https://example.com/a/b", "c.bin"), "https://example.com/a/c.bin");
}

TEST(UrlTest, MalformedBaseThrows) {
    EXPECT_THROW((void)resolveUrl("not a url", "/x"), std::invalid_argument);
}

TEST(UrlTest, HostOfExtractsHostname) {
    EXPECT_EQ(hostOf("https://github.com/owner/repo/releases"), "github.com");
    EXPECT_EQ(hostOf("http://127.0.0.1:8080/x"), "127.0.0.1");
    EXPECT_EQ(hostOf("garbage"), "garbage");
}
