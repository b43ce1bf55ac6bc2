#include "gtest/gtest.h"
#include <FilePermissions.hpp>
#include "TempDir.hpp"

using namespace scsv;
namespace fs = std::filesystem;

TEST(FilePermissionsTest, ParseMode) {
    auto m = FilePermissions::parseMode("0644");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(FilePermissions::toOctal(*m), "0644");
    EXPECT_EQ(FilePermissions::toOctal(*FilePermissions::parseMode("600")), "0600");
    EXPECT_EQ(FilePermissions::toOctal(FilePermissions::kDefaultMode), "0644");
}

TEST(FilePermissionsTest, ParseModeRejectsGarbage) {
    EXPECT_FALSE(FilePermissions::parseMode("").has_value());
    EXPECT_FALSE(FilePermissions::parseMode("0844").has_value());
    EXPECT_FALSE(FilePermissions::parseMode("rw-r--r--").has_value());
    EXPECT_FALSE(FilePermissions::parseMode("1644").has_value());
    EXPECT_FALSE(FilePermissions::parseMode("00644").has_value());
}

class FilePermissionsFsTest : public scsv::test::TempDirTest {};

TEST_F(FilePermissionsFsTest, ApplyReplacesBits) {
    if (!FilePermissions::supportsPosixPermissions()) GTEST_SKIP() << "no POSIX permission bits";
    auto file = pathFor("p.csv");
    writeRaw(file, "x\n");
    std::string err;
    ASSERT_TRUE(FilePermissions::apply(file, *FilePermissions::parseMode("0600"), err)) << err;
    EXPECT_EQ(FilePermissions::toOctal(fs::status(file).permissions()), "0600");
    ASSERT_TRUE(FilePermissions::apply(file, FilePermissions::kDefaultMode, err)) << err;
    EXPECT_EQ(FilePermissions::toOctal(fs::status(file).permissions()), "0644");
}

TEST_F(FilePermissionsFsTest, ApplyOnMissingFileReportsError) {
    if (!FilePermissions::supportsPosixPermissions()) GTEST_SKIP() << "no POSIX permission bits";
    std::string err;
    EXPECT_FALSE(FilePermissions::apply(dir() / "missing.csv", FilePermissions::kDefaultMode, err));
    EXPECT_FALSE(err.empty());
}
