#include <gtest/gtest.h>

#include "manifest/uri.hpp"

namespace hlsget::manifest {
namespace {

constexpr const char *kPlaylist = "http://cdn.example.com/live/v1/index.m3u8";

TEST(UriTest, RelativeReferenceResolvesAgainstPlaylist) {
	auto res = absolute_uri(kPlaylist, "seg-001.ts");
	ASSERT_TRUE(res.has_value());
	EXPECT_EQ(res.value(), "http://cdn.example.com/live/v1/seg-001.ts");
}

TEST(UriTest, DotSegmentsAndRootReferences) {
	auto up = absolute_uri(kPlaylist, "../v2/index.m3u8");
	ASSERT_TRUE(up.has_value());
	EXPECT_EQ(up.value(), "http://cdn.example.com/live/v2/index.m3u8");

	auto root = absolute_uri(kPlaylist, "/media/a.ts?token=1");
	ASSERT_TRUE(root.has_value());
	EXPECT_EQ(root.value(), "http://cdn.example.com/media/a.ts?token=1");
}

TEST(UriTest, AbsoluteReferenceIsKept) {
	auto res = absolute_uri(kPlaylist, "https://other.example.com/x/y.ts");
	ASSERT_TRUE(res.has_value());
	EXPECT_EQ(res.value(), "https://other.example.com/x/y.ts");
}

TEST(UriTest, PercentDecodedExactlyOnce) {
	auto res = absolute_uri(kPlaylist, "a%20b%2520c.ts");
	ASSERT_TRUE(res.has_value());
	EXPECT_EQ(res.value(), "http://cdn.example.com/live/v1/a b%20c.ts");
}

TEST(UriTest, MalformedEscapeIsInvalid) {
	auto res = absolute_uri(kPlaylist, "http://cdn.example.com/bad%zz.ts");
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::invalid_url);
}

TEST(UriTest, UnparsableBaseIsInvalid) {
	auto res = absolute_uri("not a url", "seg.ts");
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::invalid_url);
}

TEST(UriTest, NameAndDirectory) {
	EXPECT_EQ(segment_name("http://h/a/b/c.ts"), "c.ts");
	EXPECT_EQ(directory_prefix("http://h/a/b/c.ts"), "http://h/a/b/");
	EXPECT_EQ(segment_name("plain.ts"), "plain.ts");
	EXPECT_EQ(directory_prefix("plain.ts"), "");
}

}  // namespace
}  // namespace hlsget::manifest
