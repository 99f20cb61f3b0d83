#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli.hpp"
#include "support/temp_dir.hpp"

namespace hlsget::cli {
namespace {

using testing::TempDir;
using testing::write_file;

Result<CliOptions> parse(std::vector<const char *> args) {
	args.insert(args.begin(), "hlsget");
	return parse_command_line(static_cast<int>(args.size()), args.data());
}

TEST(CliTest, RequiredOptionsAndDefaults) {
	auto res = parse({"-u", "https://cdn.test/live/index.m3u8", "-o", "movie"});
	ASSERT_TRUE(res.has_value());

	const auto &dl = res.value().download;
	EXPECT_EQ(dl.manifest_url, "https://cdn.test/live/index.m3u8");
	EXPECT_EQ(dl.output_dir, "movie");
	EXPECT_EQ(dl.concurrency, 10u);
	EXPECT_EQ(dl.container_extension, "ts");
	EXPECT_EQ(dl.user_agent, kDefaultUserAgent);
	EXPECT_FALSE(res.value().verbose);
}

TEST(CliTest, ConcurrencyWithinRange) {
	auto res = parse({"-u", "http://cdn.test/a.m3u8", "-o", "out", "-n", "32"});
	ASSERT_TRUE(res.has_value());
	EXPECT_EQ(res.value().download.concurrency, 32u);

	auto top = parse({"-u", "http://cdn.test/a.m3u8", "-o", "out", "--num=256"});
	ASSERT_TRUE(top.has_value());
	EXPECT_EQ(top.value().download.concurrency, 256u);
}

TEST(CliTest, ConcurrencyOutOfRangeIsRejected) {
	for (const char *num : {"--num=-1", "--num=0", "--num=257",
							"--num=100000000", "--num=abc"}) {
		auto res = parse({"-u", "http://cdn.test/a.m3u8", "-o", "out", num});
		ASSERT_TRUE(res.has_error()) << num;
		EXPECT_EQ(res.error(), errc::invalid_options) << num;
	}
}

TEST(CliTest, MissingUrlOrOutIsRejected) {
	auto no_out = parse({"-u", "http://cdn.test/a.m3u8"});
	ASSERT_TRUE(no_out.has_error());
	EXPECT_EQ(no_out.error(), errc::invalid_options);

	auto no_url = parse({"-o", "out"});
	ASSERT_TRUE(no_url.has_error());
	EXPECT_EQ(no_url.error(), errc::invalid_options);
}

TEST(CliTest, NonHttpUrlIsRejected) {
	auto res = parse({"-u", "ftp://cdn.test/a.m3u8", "-o", "out"});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::invalid_options);
}

TEST(CliTest, HelpSkipsValidation) {
	auto res = parse({"--help"});
	ASSERT_TRUE(res.has_value());
	EXPECT_TRUE(res.value().help);
	EXPECT_NE(res.value().usage.find("--url"), std::string::npos);
}

TEST(CliTest, ConfigFileFillsGapsCommandLineWins) {
	TempDir dir;
	auto config = dir.path() / "hlsget.ini";
	write_file(config,
			   "url = http://cdn.test/show/index.m3u8\n"
			   "num = 4\n"
			   "ext = mp4\n");
	auto config_path = config.string();

	auto res = parse({"-c", config_path.c_str(), "-o", "show", "--num=6"});
	ASSERT_TRUE(res.has_value());

	const auto &dl = res.value().download;
	EXPECT_EQ(dl.manifest_url, "http://cdn.test/show/index.m3u8");
	EXPECT_EQ(dl.container_extension, "mp4");
	EXPECT_EQ(dl.concurrency, 6u);
}

TEST(CliTest, MissingConfigFileIsRejected) {
	TempDir dir;
	auto config_path = (dir.path() / "absent.ini").string();
	auto res = parse({"-c", config_path.c_str(), "-u", "http://cdn.test/a.m3u8",
					  "-o", "out"});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::invalid_options);
}

}  // namespace
}  // namespace hlsget::cli
