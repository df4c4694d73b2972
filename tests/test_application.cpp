/**
 * @file test_application.cpp
 * @brief End-to-end tests of the treetool commands
 *
 * Each test builds a small tree, runs one command with file output and
 * checks the text written.
 *
 * @see Application
 */

#include <gtest/gtest.h>
#include "application.hpp"
#include "indexerror.hpp"
#include "logger.hpp"
#include "sha256.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <unistd.h>

namespace {

const std::string HELLO_SHA256 =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
const std::string WORLD_SHA256 =
    "486ea46224d1bb4fb680f34f7c9ad96a8f24ec88be73ea8e5a6c65260e9cb8a7";
const std::string EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

class ApplicationTest : public ::testing::Test {
protected:
    std::filesystem::path work_dir;
    std::filesystem::path tree;
    Application app;

    void SetUp() override {
        Logger::init(true, 0);
        work_dir = std::filesystem::temp_directory_path() /
                   ("application_test_" + std::to_string(::getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        tree = work_dir / "tree";
        std::filesystem::create_directories(tree);
    }

    void TearDown() override {
        std::filesystem::remove_all(work_dir);
    }

    void createFile(const std::string& name, const std::string& content) {
        auto path = tree / name;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    void writeText(const std::filesystem::path& path, const std::string& text) {
        std::ofstream file(path, std::ios::binary);
        file << text;
    }

    std::string readText(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>());
    }

    CliOptions optionsFor(Command command) {
        CliOptions options;
        options.command = command;
        options.root = tree;
        options.output = work_dir / "out.txt";
        return options;
    }
};

TEST_F(ApplicationTest, ListWritesListing) {
    createFile("a.txt", "hello");
    createFile("sub/b.txt", "world");

    EXPECT_EQ(app.run(optionsFor(Command::List)), 0);

    EXPECT_EQ(readText(work_dir / "out.txt"),
              HELLO_SHA256 + " 5 a.txt\n" + WORLD_SHA256 + " 5 sub/b.txt\n");
}

TEST_F(ApplicationTest, DupesWritesGroups) {
    createFile("a.txt", "hello");
    createFile("copy/a.txt", "hello");
    createFile("b.txt", "world");

    app.run(optionsFor(Command::Dupes));

    EXPECT_EQ(readText(work_dir / "out.txt"),
              HELLO_SHA256 + " 5\n  a.txt\n  copy/a.txt\n");
}

TEST_F(ApplicationTest, SizeWritesReclaimableSpace) {
    std::string kilobytes(3000, 'k');
    createFile("one.bin", kilobytes);
    createFile("two.bin", kilobytes);
    createFile("three.bin", kilobytes);

    app.run(optionsFor(Command::Size));

    EXPECT_EQ(readText(work_dir / "out.txt"), "Total saved 5 KB\n");
}

TEST_F(ApplicationTest, MatchFindsListedContent) {
    createFile("greeting.txt", "hello");
    createFile("nested/again.txt", "hello");
    createFile("other.txt", "world!");
    writeText(work_dir / "listing.txt", HELLO_SHA256 + " 5 listed/hello.txt\n");

    CliOptions options = optionsFor(Command::Match);
    options.input = work_dir / "listing.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"),
              "listed/hello.txt greeting.txt\n"
              "listed/hello.txt nested/again.txt\n");
}

TEST_F(ApplicationTest, MatchWithEmptyListingWritesNothing) {
    createFile("greeting.txt", "hello");
    writeText(work_dir / "listing.txt", "");

    CliOptions options = optionsFor(Command::Match);
    options.input = work_dir / "listing.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"), "");
}

TEST_F(ApplicationTest, EchoCopiesInput) {
    writeText(work_dir / "in.txt", std::string("binary\0data\n", 12));

    CliOptions options;
    options.command = Command::Echo;
    options.input = work_dir / "in.txt";
    options.output = work_dir / "out.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"), std::string("binary\0data\n", 12));
}

TEST_F(ApplicationTest, MissingRootPropagatesNotFound) {
    CliOptions options = optionsFor(Command::List);
    options.root = work_dir / "absent";

    try {
        app.run(options);
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.kind(), IndexError::Kind::NotFound);
    }
}

TEST_F(ApplicationTest, MatchFailureLeavesNoOutput) {
    writeText(work_dir / "listing.txt", HELLO_SHA256 + " 5 listed/hello.txt\n");

    CliOptions options = optionsFor(Command::Match);
    options.root = work_dir / "absent";
    options.input = work_dir / "listing.txt";

    EXPECT_THROW(app.run(options), IndexError);
    EXPECT_FALSE(std::filesystem::exists(work_dir / "out.txt"));
}

TEST_F(ApplicationTest, MatchReadsDupeLines) {
    createFile("greeting.txt", "hello");
    writeText(work_dir / "listing.txt",
              HELLO_SHA256 + " 5 listed/hello.txt\n- listed/copy.txt\n");

    CliOptions options = optionsFor(Command::Match);
    options.input = work_dir / "listing.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"),
              "listed/hello.txt greeting.txt\n"
              "listed/copy.txt greeting.txt\n");
}

TEST_F(ApplicationTest, FastDupesKeepDifferentSizesApart) {
    createFile("a.bin", std::string(3 * Sha256::CHUNK_SIZE, 'x'));
    createFile("b.bin", std::string(5 * Sha256::CHUNK_SIZE, 'x'));

    CliOptions options = optionsFor(Command::Dupes);
    options.fast = true;
    app.run(options);
    EXPECT_EQ(readText(work_dir / "out.txt"), "");

    options.command = Command::Size;
    app.run(options);
    EXPECT_EQ(readText(work_dir / "out.txt"), "Total saved 0 Bytes\n");
}

TEST_F(ApplicationTest, IndexWritesDupeLines) {
    createFile("a.txt", "hello");
    createFile("copy/a.txt", "hello");
    createFile("b.txt", "world");

    CliOptions options = optionsFor(Command::Index);
    options.withDupes = true;
    app.run(options);
    EXPECT_EQ(readText(work_dir / "out.txt"),
              HELLO_SHA256 + " 5 a.txt\n- copy/a.txt\n" + WORLD_SHA256 + " 5 b.txt\n");

    options.withDupes = false;
    app.run(options);
    EXPECT_EQ(readText(work_dir / "out.txt"),
              HELLO_SHA256 + " 5 a.txt\n" + WORLD_SHA256 + " 5 b.txt\n");
}

TEST_F(ApplicationTest, SizeReadsIndex) {
    writeText(work_dir / "index.txt",
              HELLO_SHA256 + " 5 a.txt\n- b.txt\n- c.txt\n" + WORLD_SHA256 + " 5 d.txt\n");

    CliOptions options;
    options.command = Command::Size;
    options.fromIndex = true;
    options.input = work_dir / "index.txt";
    options.output = work_dir / "out.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"), "Total saved 10 Bytes\n");
}

TEST_F(ApplicationTest, ConfirmRejectsFastFalsePositives) {
    const std::uint64_t chunk = Sha256::CHUNK_SIZE;
    std::string content(3 * chunk, 'x');
    std::string middle_differs = content;
    middle_differs[chunk + 7] = 'y';
    createFile("a.bin", content);
    createFile("b.bin", content);
    createFile("c.bin", middle_differs);

    CliOptions index = optionsFor(Command::Index);
    index.fast = true;
    index.withDupes = true;
    index.output = work_dir / "candidates.txt";
    app.run(index);
    ASSERT_NE(readText(work_dir / "candidates.txt").find("- c.bin"), std::string::npos);

    CliOptions confirm = optionsFor(Command::Confirm);
    confirm.input = work_dir / "candidates.txt";
    app.run(confirm);

    EXPECT_EQ(readText(work_dir / "out.txt"),
              Sha256::hashBytes(content).toHex() + " 3145728 a.bin\n- b.bin\n");
}

TEST_F(ApplicationTest, ZeroesDropsEmptyRecords) {
    writeText(work_dir / "index.txt",
              EMPTY_SHA256 + " 0 e1\n- e2\n" + HELLO_SHA256 + " 5 a.txt\n");

    CliOptions options;
    options.command = Command::Zeroes;
    options.input = work_dir / "index.txt";
    options.output = work_dir / "out.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"), HELLO_SHA256 + " 5 a.txt\n");
}

TEST_F(ApplicationTest, FindLooksUpNeedleInHaystack) {
    writeText(work_dir / "needle.txt", HELLO_SHA256 + " 5 mine/a.txt\n" +
                                           WORLD_SHA256 + " 5 mine/b.txt\n");
    writeText(work_dir / "haystack.txt",
              HELLO_SHA256 + " 5 backup/a.txt\n- mine/a.txt\n");

    CliOptions options;
    options.command = Command::Find;
    options.input = work_dir / "needle.txt";
    options.haystack = work_dir / "haystack.txt";
    options.output = work_dir / "out.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"),
              HELLO_SHA256 + " 5 mine/a.txt\n- backup/a.txt\n");
}

TEST_F(ApplicationTest, ListDirsWritesDupeDirectories) {
    writeText(work_dir / "index.txt",
              HELLO_SHA256 + " 5 a.txt\n- x/y/b.txt\n- c.txt\n- x/y/d.txt\n");

    CliOptions options;
    options.command = Command::ListDirs;
    options.input = work_dir / "index.txt";
    options.output = work_dir / "out.txt";
    app.run(options);

    EXPECT_EQ(readText(work_dir / "out.txt"), ".\nx/y\n");
}

TEST_F(ApplicationTest, VanishedWorkingDirectoryIsNotFound) {
    auto previous_dir = std::filesystem::current_path();
    auto doomed = work_dir / "doomed";
    std::filesystem::create_directories(doomed);
    std::filesystem::current_path(doomed);
    std::filesystem::remove(doomed);

    CliOptions options = optionsFor(Command::List);
    options.root.reset();
    bool thrown = false;
    IndexError::Kind kind = IndexError::Kind::Io;
    try {
        app.run(options);
    } catch (const IndexError& e) {
        thrown = true;
        kind = e.kind();
    }
    std::filesystem::current_path(previous_dir);

    ASSERT_TRUE(thrown);
    EXPECT_EQ(kind, IndexError::Kind::NotFound);
}

TEST_F(ApplicationTest, ExecuteLogsFailureAtErrorSeverity) {
    std::ostringstream captured;
    std::streambuf* saved = std::clog.rdbuf(captured.rdbuf());
    Logger::init(false, 0);

    CliOptions options = optionsFor(Command::List);
    options.root = work_dir / "absent";
    int status = app.execute(options);

    std::clog.rdbuf(saved);
    Logger::init(true, 0);

    EXPECT_EQ(status, EXIT_FAILURE);
    EXPECT_EQ(captured.str().rfind("[error] Not found: ", 0), 0u) << captured.str();
    EXPECT_NE(captured.str().find("absent"), std::string::npos);
}

TEST(LoggerTest, VerbosityLowersThreshold) {
    EXPECT_EQ(Logger::thresholdFor(0), boost::log::trivial::warning);
    EXPECT_EQ(Logger::thresholdFor(1), boost::log::trivial::info);
    EXPECT_EQ(Logger::thresholdFor(2), boost::log::trivial::debug);
    EXPECT_EQ(Logger::thresholdFor(3), boost::log::trivial::trace);
    EXPECT_EQ(Logger::thresholdFor(7), boost::log::trivial::trace);
}
