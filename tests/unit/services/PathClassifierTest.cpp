/**
 * @file PathClassifierTest.cpp
 * @brief Unit tests for PathClassifier
 */

#include "services/PathClassifier.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class PosixPathClassifierTest : public ::testing::Test {
protected:
    TempTestDir dir;
    fs::path home;
    std::unique_ptr<PathClassifier> classifier;

    void SetUp() override {
        ASSERT_TRUE(dir.valid());
        home = dir.path() / "home";
        fs::create_directories(home);
        classifier = std::make_unique<PathClassifier>(PathClassifier::Options{
            .style = PathStyle::Posix,
            .home_directory = home,
            .extra_denied_prefixes = {},
            .check_mount_points = false,
        });
    }
};

TEST_F(PosixPathClassifierTest, FilesystemRoot_IsSensitive) {
    EXPECT_TRUE(classifier->is_sensitive("/"));
}

TEST_F(PosixPathClassifierTest, DenylistedRoots_AreSensitive) {
    for (const char* path : {"/etc", "/usr", "/bin", "/boot", "/dev", "/proc", "/sys", "/var"}) {
        EXPECT_TRUE(classifier->is_sensitive(path)) << path;
    }
}

TEST_F(PosixPathClassifierTest, PathsUnderDenylistedTrees_AreSensitive) {
    EXPECT_TRUE(classifier->is_sensitive("/etc/passwd"));
    EXPECT_TRUE(classifier->is_sensitive("/usr/bin/env"));
    EXPECT_TRUE(classifier->is_sensitive("/boot/does-not-exist.img"));
}

TEST_F(PosixPathClassifierTest, Matching_IsCaseInsensitive) {
    EXPECT_TRUE(classifier->is_sensitive("/ETC/Passwd"));
}

TEST_F(PosixPathClassifierTest, EmptyPath_FailsClosed) {
    EXPECT_TRUE(classifier->is_sensitive(fs::path{}));
}

TEST_F(PosixPathClassifierTest, FileUnderHome_IsAllowed) {
    auto file = dir.WriteFile("home/Documents/report.txt", "data");
    EXPECT_FALSE(classifier->is_sensitive(file));
}

TEST_F(PosixPathClassifierTest, HomeDirectoryItself_IsSensitive) {
    EXPECT_TRUE(classifier->is_sensitive(home));
}

TEST_F(PosixPathClassifierTest, AdminExtension_AllowedInsideHome) {
    auto file = dir.WriteFile("home/build/module.ko", "x");
    EXPECT_FALSE(classifier->is_sensitive(file));
}

TEST_F(PosixPathClassifierTest, AdminExtension_RefusedOutsideHome) {
    auto file = dir.WriteFile("elsewhere/driver.sys", "x");
    EXPECT_TRUE(classifier->is_sensitive(file));
}

TEST_F(PosixPathClassifierTest, DotDotEscapeFromHome_IsResolved) {
    EXPECT_TRUE(classifier->is_sensitive(home / ".." / ".." / ".." / ".." / ".." / "etc" / "passwd"));
}

TEST_F(PosixPathClassifierTest, ExtraDeniedPrefix_AppliesInsideHome) {
    auto protected_dir = home / "vault";
    PathClassifier strict(PathClassifier::Options{
        .style = PathStyle::Posix,
        .home_directory = home,
        .extra_denied_prefixes = {protected_dir.string()},
        .check_mount_points = false,
    });

    auto inside = dir.WriteFile("home/vault/key.pem", "secret");
    auto outside = dir.WriteFile("home/notes.txt", "hello");

    EXPECT_TRUE(strict.is_sensitive(protected_dir));
    EXPECT_TRUE(strict.is_sensitive(inside));
    EXPECT_FALSE(strict.is_sensitive(outside));
}

TEST(PathClassifierHomeTest, HomeAtFilesystemRoot_IsIgnored) {
    PathClassifier classifier(PathClassifier::Options{
        .style = PathStyle::Posix,
        .home_directory = fs::path("/"),
        .extra_denied_prefixes = {},
        .check_mount_points = false,
    });

    EXPECT_TRUE(classifier.home_key().empty());
    EXPECT_TRUE(classifier.is_sensitive("/etc/hosts"));
    EXPECT_TRUE(classifier.is_sensitive("/"));
}

TEST(PathClassifierHomeTest, DetectHomeDirectory_FindsSomething) {
    EXPECT_TRUE(PathClassifier::detect_home_directory().has_value());
}

// Validation

TEST_F(PosixPathClassifierTest, Validate_MissingPath_NotFound) {
    auto result = classifier->validate(home / "missing.txt", TargetKind::File);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotFound);
}

TEST_F(PosixPathClassifierTest, Validate_Symlink_Unsupported) {
    auto target = dir.WriteFile("home/real.txt", "data");
    auto link = home / "link.txt";
    fs::create_symlink(target, link);

    auto result = classifier->validate(link, TargetKind::File);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::SymlinkUnsupported);
}

TEST_F(PosixPathClassifierTest, Validate_SystemPath_Refused) {
    auto result = classifier->validate("/etc", TargetKind::Directory);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::SystemPathRefused);
}

TEST_F(PosixPathClassifierTest, Validate_DirectoryAsFile_NotAFile) {
    fs::create_directories(home / "folder");
    auto result = classifier->validate(home / "folder", TargetKind::File);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotAFile);
}

TEST_F(PosixPathClassifierTest, Validate_FileAsDirectory_NotADirectory) {
    auto file = dir.WriteFile("home/file.txt", "data");
    auto result = classifier->validate(file, TargetKind::Directory);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::NotADirectory);
}

TEST_F(PosixPathClassifierTest, Validate_RegularFile_ReturnsAbsolutePathAndSize) {
    auto file = dir.WriteFile("home/file.txt", std::string(1234, 'a'));
    auto result = classifier->validate(file, TargetKind::File);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->path.is_absolute());
    EXPECT_EQ(result->kind, TargetKind::File);
    EXPECT_EQ(result->size, 1234u);
}

// Windows table, evaluated lexically so it runs on any host

class WindowsPathClassifierTest : public ::testing::Test {
protected:
    PathClassifier classifier{PathClassifier::Options{
        .style = PathStyle::Windows,
        .home_directory = fs::path("C:\\Users\\alice"),
        .extra_denied_prefixes = {},
        .check_mount_points = false,
    }};
};

TEST_F(WindowsPathClassifierTest, VolumeRoots_AreSensitive) {
    EXPECT_TRUE(classifier.is_sensitive("C:\\"));
    EXPECT_TRUE(classifier.is_sensitive("d:/"));
}

TEST_F(WindowsPathClassifierTest, SystemDirectories_AreSensitive) {
    EXPECT_TRUE(classifier.is_sensitive("C:\\Windows"));
    EXPECT_TRUE(classifier.is_sensitive("C:\\Windows\\System32\\kernel32.dll"));
    EXPECT_TRUE(classifier.is_sensitive("C:\\Program Files (x86)\\App\\app.exe"));
    EXPECT_TRUE(classifier.is_sensitive("c:/programdata/vendor/settings.ini"));
    EXPECT_TRUE(classifier.is_sensitive("C:\\pagefile.sys"));
}

TEST_F(WindowsPathClassifierTest, UserFiles_AreAllowed) {
    EXPECT_FALSE(classifier.is_sensitive("C:\\Users\\alice\\Documents\\report.docx"));
    EXPECT_FALSE(classifier.is_sensitive("C:\\Users\\Alice\\Desktop\\notes.txt"));
    EXPECT_FALSE(classifier.is_sensitive("D:\\data\\notes.txt"));
}

TEST_F(WindowsPathClassifierTest, HomeDirectoryItself_IsSensitive) {
    EXPECT_TRUE(classifier.is_sensitive("C:\\Users\\alice"));
}

TEST_F(WindowsPathClassifierTest, DotDotEscape_IsFolded) {
    EXPECT_TRUE(classifier.is_sensitive("C:\\Users\\alice\\..\\..\\Windows\\win.ini"));
}

TEST_F(WindowsPathClassifierTest, AdminExtensionOutsideHome_IsSensitive) {
    EXPECT_TRUE(classifier.is_sensitive("D:\\drivers\\netcard.sys"));
    EXPECT_TRUE(classifier.is_sensitive("E:\\EFI\\boot\\bootx64.efi"));
}

TEST_F(WindowsPathClassifierTest, UncAndRelativePaths_FailClosed) {
    EXPECT_TRUE(classifier.is_sensitive("\\\\server\\share\\file.txt"));
    EXPECT_TRUE(classifier.is_sensitive("\\\\?\\C:\\temp\\file.txt"));
    EXPECT_TRUE(classifier.is_sensitive("notes.txt"));
}
