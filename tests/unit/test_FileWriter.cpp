#include <gtest/gtest.h>
#include "diag/ConsoleWriter.hpp"
#include "diag/FileWriter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using namespace ad::diag;

class FileWriterTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "agentdiag_filewriter" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(test_dir);
    }

    void TearDown() override { fs::remove_all(test_dir); }

    static std::string readFile(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }
};

TEST_F(FileWriterTest, CreatesFolderAndAppends) {
    {
        FileWriter w(Level::Info, test_dir / "logs", "agent.log");
        w.write("hello\n");
        w.writeError("oops\n");
        w.end();
    }
    {
        FileWriter w(Level::Info, test_dir / "logs", "agent.log");
        w.write("again\n");
    }

    EXPECT_EQ(readFile(test_dir / "logs" / "agent.log"), "hello\noops\nagain\n");
}

TEST_F(FileWriterTest, DividerWritesDashesWithoutNewline) {
    FileWriter w(Level::Info, test_dir, "agent.log");
    w.divider();
    w.end();
    EXPECT_EQ(readFile(w.path()), std::string(40, '-'));
}

TEST_F(FileWriterTest, OpenFailureThrowsAtConstruction) {
    fs::create_directories(test_dir / "agent.log");
    EXPECT_THROW(FileWriter(Level::Info, test_dir, "agent.log"), std::system_error);
}

TEST_F(FileWriterTest, WriteAfterEndIsALogicError) {
    FileWriter w(Level::Info, test_dir, "agent.log");
    w.end();
    EXPECT_NO_THROW(w.end());
    EXPECT_THROW(w.write("late"), std::logic_error);
}

TEST(ConsoleWriterTest, RoutesErrorsToErrorStream) {
    std::ostringstream out, err;
    ConsoleWriter w(Level::Verbose, out, err);
    w.write("normal");
    w.writeError("bad");
    w.end();

    EXPECT_EQ(out.str(), "normal");
    EXPECT_EQ(err.str(), "bad");
}
