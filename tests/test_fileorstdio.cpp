#include <gtest/gtest.h>
#include "fileorstdio.hpp"
#include "indexerror.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <unistd.h>

class FileOrStdioTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("fileorstdio_test_" + std::to_string(::getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    static std::string readAll(std::istream& in) {
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }
};

TEST_F(FileOrStdioTest, AbsentOrDashSelectsStandardStreams) {
    EXPECT_TRUE(isStdioPath(std::nullopt));
    EXPECT_TRUE(isStdioPath(std::filesystem::path("-")));
    EXPECT_FALSE(isStdioPath(std::filesystem::path("-file")));
    EXPECT_FALSE(isStdioPath(std::filesystem::path("data.txt")));

    auto in = InputSource::open(std::nullopt);
    auto out = OutputSink::open(std::filesystem::path("-"));
    EXPECT_TRUE(in.isStandardStream());
    EXPECT_TRUE(out.isStandardStream());
    EXPECT_EQ(in.name(), "stdin");
    EXPECT_EQ(out.name(), "stdout");
    EXPECT_EQ(&in.stream(), &std::cin);
    EXPECT_EQ(&out.stream(), &std::cout);
}

TEST_F(FileOrStdioTest, ReadsNamedFile) {
    auto path = test_dir / "input.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "line one\nline two\n";
    }

    auto in = InputSource::open(path);
    EXPECT_FALSE(in.isStandardStream());
    EXPECT_EQ(in.name(), path.string());
    EXPECT_EQ(readAll(in.stream()), "line one\nline two\n");
}

TEST_F(FileOrStdioTest, WritesNamedFile) {
    auto path = test_dir / "output.txt";
    {
        std::ofstream file(path);
        file << "old content that must disappear";
    }

    {
        auto out = OutputSink::open(path);
        EXPECT_EQ(out.name(), path.string());
        out.stream() << "fresh";
        out.finish();
    }

    std::ifstream file(path, std::ios::binary);
    EXPECT_EQ(readAll(file), "fresh");
}

TEST_F(FileOrStdioTest, MissingInputThrowsIo) {
    try {
        InputSource::open(test_dir / "missing.txt");
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.kind(), IndexError::Kind::Io);
        EXPECT_EQ(e.path().filename().string(), "missing.txt");
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
}

TEST_F(FileOrStdioTest, UncreatableOutputThrowsIo) {
    try {
        OutputSink::open(test_dir / "no_such_dir" / "out.txt");
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.kind(), IndexError::Kind::Io);
    }
}
