// =============================================================================
// ziso - Atomic Output File Tests
// =============================================================================
// Tests for commit-by-rename and cleanup of the temporary file.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "ziso/common/error.h"
#include "ziso/io/atomic_file.h"

namespace ziso::io::test {

namespace fs = std::filesystem;

class AtomicOutputFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ziso_atomic_" + std::string(::testing::UnitTest::GetInstance()
                                                  ->current_test_info()
                                                  ->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    fs::path dir_;
};

TEST_F(AtomicOutputFileTest, CommitRenamesTemporaryFile) {
    const fs::path target = dir_ / "image.zso";
    {
        AtomicOutputFile file(target);
        EXPECT_EQ(file.tempPath(), fs::path(target.string() + ".tmp"));
        file.stream() << "payload";
        EXPECT_FALSE(fs::exists(target));

        file.commit();
        EXPECT_TRUE(file.isCommitted());
    }

    EXPECT_EQ(readAll(target), "payload");
    EXPECT_FALSE(fs::exists(target.string() + ".tmp"));
}

TEST_F(AtomicOutputFileTest, UncommittedFileIsRemoved) {
    const fs::path target = dir_ / "image.iso";
    fs::path temp;
    {
        AtomicOutputFile file(target);
        temp = file.tempPath();
        file.stream() << "partial";
        file.stream().flush();
        EXPECT_TRUE(fs::exists(temp));
    }

    EXPECT_FALSE(fs::exists(temp));
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(AtomicOutputFileTest, AbortDiscardsOutput) {
    const fs::path target = dir_ / "image.zso";
    AtomicOutputFile file(target);
    file.stream() << "partial";

    file.abort();

    EXPECT_TRUE(file.isAborted());
    EXPECT_FALSE(fs::exists(file.tempPath()));
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(AtomicOutputFileTest, ExistingTargetRequiresOverwrite) {
    const fs::path target = dir_ / "image.zso";
    std::ofstream(target) << "old";

    try {
        AtomicOutputFile file(target);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileExists);
    }

    {
        AtomicOutputFile file(target, true);
        file.stream() << "new";
        file.commit();
    }
    EXPECT_EQ(readAll(target), "new");
}

TEST_F(AtomicOutputFileTest, StreamIsSeekable) {
    const fs::path target = dir_ / "image.zso";
    {
        AtomicOutputFile file(target);
        file.stream() << "0000abcd";
        file.stream().seekp(0);
        file.stream() << "ZISO";
        file.stream().seekp(0, std::ios::end);
        file.stream() << "!";
        file.commit();
    }

    EXPECT_EQ(readAll(target), "ZISOabcd!");
}

TEST_F(AtomicOutputFileTest, InterruptCleanupUnlinksOpenTempFiles) {
    AtomicOutputFile first(dir_ / "first.zso");
    AtomicOutputFile second(dir_ / "second.iso");
    first.stream() << "partial";
    first.stream().flush();
    ASSERT_TRUE(fs::exists(first.tempPath()));
    ASSERT_TRUE(fs::exists(second.tempPath()));

    removeRegisteredTempFiles();

    EXPECT_FALSE(fs::exists(first.tempPath()));
    EXPECT_FALSE(fs::exists(second.tempPath()));

    // Files created afterwards are still tracked
    const fs::path target = dir_ / "third.zso";
    {
        AtomicOutputFile third(target);
        third.stream() << "kept";
        third.commit();
    }
    removeRegisteredTempFiles();
    EXPECT_EQ(readAll(target), "kept");
}

TEST_F(AtomicOutputFileTest, MissingDirectoryFailsToOpen) {
    EXPECT_THROW(AtomicOutputFile(dir_ / "missing" / "image.zso"), IOError);
}

}  // namespace ziso::io::test
