//
// Copyright (c) 2024-2025 JLGxy
//

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "arena_cli.h"
#include "gtest/gtest.h"
#include "prog_option.h"

namespace fs = std::filesystem;
namespace po = arena::po;

namespace {

void make_parser(po::Parser &p) {
    p.add("config", 'c', "config file", false, 1, 1);
    p.add("workers", 'w', "worker count", true, 1, 1);
    p.add("base64", 0, "payload is base64", true, 0, 0);
}

}  // namespace

TEST(options, longAndShortForms) {
    po::Parser p;
    make_parser(p);
    p.parse_check({"-c", "a.yaml", "--workers=3", "--base64"});
    EXPECT_EQ(p.get<std::string>("config"), "a.yaml");
    EXPECT_EQ(p.get<int>("workers"), 3);
    EXPECT_TRUE(p.get<bool>("base64"));

    p.parse_check({"-cb.yaml"});
    EXPECT_EQ(p.get<std::string>("config"), "b.yaml");
    EXPECT_EQ(p.get<int>("workers", 4), 4);
    EXPECT_FALSE(p.get<bool>("base64"));
}

TEST(options, errors) {
    po::Parser p;
    make_parser(p);
    EXPECT_THROW(p.parse_check({}), po::ArgNotFound);
    EXPECT_THROW(p.parse_check({"-c", "a", "--nope"}), po::NotExist);
    EXPECT_THROW(p.parse_check({"-c", "a", "stray"}), po::InvalidArg);
    EXPECT_THROW(p.parse_check({"-c", "a", "-c", "b"}), po::InvalidArg);
    p.parse_check({"-c", "a", "-w", "many"});
    EXPECT_THROW(p.get<int>("workers"), po::InvalidArg);
    EXPECT_THROW(p.get<std::string>("missing"), po::ArgNotFound);
}

TEST(options, usageListsEveryOption) {
    po::Parser p;
    make_parser(p);
    auto text = p.usage("arena run");
    EXPECT_NE(text.find("--config"), std::string::npos);
    EXPECT_NE(text.find("(required)"), std::string::npos);
    EXPECT_NE(text.find("payload is base64"), std::string::npos);
}

TEST(batch, findsCompleteSubmissionDirs) {
    auto root = fs::temp_directory_path() / ("arena_batch_" + std::to_string(getpid()));
    fs::create_directories(root / "bob" / "text");
    fs::create_directories(root / "alice" / "text");
    fs::create_directories(root / "alice" / "image");
    fs::create_directories(root / "carol" / "text");
    for (const auto *dir : {"bob/text", "alice/text", "alice/image"}) {
        std::ofstream(root / dir / "payload.bin") << "x";
        std::ofstream(root / dir / "decompress.py") << "def decompress(d):\n    return d\n";
    }
    std::ofstream(root / "carol" / "text" / "payload.bin") << "x";  // no decompressor
    std::ofstream(root / "README") << "not a directory";

    auto jobs = arena::cli::find_batch_jobs(root);
    fs::remove_all(root);

    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].agent_id, "alice");
    EXPECT_EQ(jobs[0].challenge_id, "image");
    EXPECT_EQ(jobs[1].agent_id, "alice");
    EXPECT_EQ(jobs[1].challenge_id, "text");
    EXPECT_EQ(jobs[2].agent_id, "bob");
    EXPECT_EQ(jobs[2].payload.filename(), "payload.bin");
    EXPECT_EQ(jobs[2].source.filename(), "decompress.py");

    EXPECT_THROW(arena::cli::find_batch_jobs(root), arena::ArenaError);
}
