/**
 * @file DirectoryShredOperationTest.cpp
 * @brief Unit tests for recursive directory shredding
 */

#include "services/DirectoryShredOperation.hpp"

#include "algorithms/GutmannMethod.hpp"
#include "fixtures/TestFixtures.hpp"
#include "mocks/MockLogger.hpp"
#include "mocks/MockPathClassifier.hpp"
#include "mocks/MockTimestampObfuscator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>

namespace fs = std::filesystem;

namespace {

// Every file name found anywhere under root
std::vector<std::string> AllFileNames(const fs::path& root) {
    std::vector<std::string> names;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && !entry.is_symlink()) {
            names.push_back(entry.path().filename().string());
        }
    }
    return names;
}

}  // namespace

class DirectoryShredOperationTest : public ShredTestFixture {
protected:
    std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
    std::shared_ptr<MockTimestampObfuscator> timestamps;
    fs::path tree;

    void SetUp() override {
        ShredTestFixture::SetUp();
        timestamps = MockTimestampObfuscator::CreateNiceMock();
        tree = temp_dir->path() / "tree";
    }

    DirectoryShredOperation MakeOperation(std::shared_ptr<PathClassifier> with = nullptr) {
        return DirectoryShredOperation(with ? with : classifier, timestamps,
                                       std::make_shared<GutmannMethod>(), logger);
    }

    void PopulateTree() {
        temp_dir->WriteFile("tree/a.txt", 300, 0x41);
        temp_dir->WriteFile("tree/sub/b.txt", 200, 0x42);
        temp_dir->WriteFile("tree/sub/deeper/c.txt", 100, 0x43);
    }
};

TEST_F(DirectoryShredOperationTest, Destroy_RemovesEveryFileAndTheTree) {
    PopulateTree();
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, CreateCapturingCallback(), cancel);

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "DIRECTORY DESTROYED: 3 FILES - IRRECOVERABLE");
    EXPECT_EQ(operation.candidates().size(), 3u);
    EXPECT_FALSE(fs::exists(tree));
}

TEST_F(DirectoryShredOperationTest, Keep_OverwritesButLeavesScrambledFiles) {
    PopulateTree();
    auto operation = MakeOperation();

    auto result = operation.run(tree, ShredOptions{.keep_file = true, .preserve_directory = {}},
                                nullptr, cancel);

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "DIRECTORY OVERWRITTEN: 3 FILES (PRESERVED)");
    ASSERT_TRUE(fs::exists(tree));

    auto names = AllFileNames(tree);
    EXPECT_EQ(names.size(), 3u);
    for (const auto& name : names) {
        EXPECT_TRUE(name.starts_with("shred_")) << name;
    }
}

TEST_F(DirectoryShredOperationTest, ProtectedDescendants_AreSkippedAndKept) {
    PopulateTree();
    auto keep_one = temp_dir->WriteFile("tree/protected/one.key", "one");
    auto keep_two = temp_dir->WriteFile("tree/protected/two.key", "two");
    auto guarded = MakeClassifier({(tree / "protected").string()});
    auto operation = MakeOperation(guarded);

    auto result = operation.run(tree, {}, nullptr, cancel);

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "DIRECTORY DESTROYED: 3 FILES - IRRECOVERABLE");
    EXPECT_EQ(operation.skipped_count(), 2u);

    // Protected entries survive byte for byte, so the tree stays
    auto one = TempTestDir::ReadFile(keep_one);
    auto two = TempTestDir::ReadFile(keep_two);
    EXPECT_EQ(std::string(one.begin(), one.end()), "one");
    EXPECT_EQ(std::string(two.begin(), two.end()), "two");

    auto names = AllFileNames(tree);
    std::ranges::sort(names);
    EXPECT_EQ(names, (std::vector<std::string>{"one.key", "two.key"}));
    EXPECT_TRUE(logger->Contains(util::LogLevel::WARNING, "protected entries skipped"));
}

TEST_F(DirectoryShredOperationTest, Symlinks_AreNotFollowed) {
    temp_dir->WriteFile("tree/real.txt", "shred me");
    auto outside = temp_dir->WriteFile("outside/keep.txt", "do not touch");
    fs::create_directories(tree);
    fs::create_symlink(outside, tree / "link.txt");
    fs::create_directory_symlink(outside.parent_path(), tree / "linkdir");
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, nullptr, cancel);

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "DIRECTORY DESTROYED: 1 FILES - IRRECOVERABLE");
    auto content = TempTestDir::ReadFile(outside);
    EXPECT_EQ(std::string(content.begin(), content.end()), "do not touch");
}

TEST_F(DirectoryShredOperationTest, EmptyTree_NoFilesFound) {
    fs::create_directories(tree / "only" / "dirs");
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, nullptr, cancel);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.kind, util::ErrorKind::NoFilesFound);
    EXPECT_EQ(result.message, "No files found in directory");
    EXPECT_TRUE(fs::exists(tree / "only" / "dirs"));
}

TEST_F(DirectoryShredOperationTest, RegularFileTarget_NotADirectory) {
    auto file = temp_dir->WriteFile("single.txt", "s");
    auto operation = MakeOperation();

    auto result = operation.run(file, {}, nullptr, cancel);

    EXPECT_EQ(result.kind, util::ErrorKind::NotADirectory);
    EXPECT_TRUE(fs::exists(file));
}

TEST_F(DirectoryShredOperationTest, ProgressReportsFileIndex) {
    temp_dir->WriteFile("tree/one.txt", 10, 0x01);
    temp_dir->WriteFile("tree/two.txt", 20, 0x02);
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, CreateCapturingCallback(), cancel);

    ASSERT_TRUE(result.success);
    std::lock_guard lock(progress_mutex);
    ASSERT_GT(captured_progress.size(), 2u);
    EXPECT_EQ(captured_progress.front(),
              (ShredProgress{.current_step = 0, .total_steps = 2, .status = "Found 2 files",
                             .bytes_processed = 30}));
    EXPECT_EQ(captured_progress[1].current_step, 1);
    EXPECT_TRUE(captured_progress[1].status.starts_with("FILE 1/2: Initiating shred"));
    EXPECT_EQ(captured_progress.back().current_step, 2);
    EXPECT_EQ(captured_progress.back().total_steps, 2);
}

TEST_F(DirectoryShredOperationTest, FailingFile_IsLoggedAndTheRestAreShredded) {
    PopulateTree();
    temp_dir->WriteFile("tree/sub/bad.txt", 50, 0x44);

    // Real classifier for everything except one file that is refused
    auto mock = std::make_shared<testing::NiceMock<MockPathClassifier>>();
    auto real = classifier;
    ON_CALL(*mock, is_sensitive(testing::_)).WillByDefault([real](const fs::path& path) {
        return real->is_sensitive(path);
    });
    ON_CALL(*mock, validate(testing::_, testing::_))
        .WillByDefault([real](const fs::path& path, TargetKind kind) -> util::Result<ShredTarget> {
            if (path.filename() == "bad.txt") {
                return std::unexpected(
                    util::Error{util::ErrorKind::PermissionDenied, "Permission denied", EACCES});
            }
            return real->validate(path, kind);
        });
    DirectoryShredOperation operation(mock, timestamps, std::make_shared<GutmannMethod>(),
                                      logger);

    auto result = operation.run(tree, {}, nullptr, cancel);

    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "DIRECTORY DESTROYED: 4 FILES - IRRECOVERABLE");
    ASSERT_EQ(operation.failed_files().size(), 1u);
    EXPECT_EQ(operation.failed_files().front().filename(), "bad.txt");
    EXPECT_TRUE(logger->Contains(util::LogLevel::ERROR, "bad.txt"));
    EXPECT_TRUE(logger->Contains(util::LogLevel::ERROR, "1 of 4 files failed"));
    // The unwiped file keeps the tree alive; the others are gone
    ASSERT_TRUE(fs::exists(tree));
    EXPECT_EQ(AllFileNames(tree), std::vector<std::string>{"bad.txt"});
}

TEST_F(DirectoryShredOperationTest, Cancel_StopsAndReportsCancelled) {
    PopulateTree();
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, CreateCancellingCallback(4), cancel);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.is_cancelled());
    EXPECT_TRUE(fs::exists(tree));
    // The file in flight is discarded, the others keep their names
    EXPECT_EQ(AllFileNames(tree).size(), 2u);
}

TEST_F(DirectoryShredOperationTest, PreCancelled_StopsDuringDiscovery) {
    PopulateTree();
    cancel.cancel();
    auto operation = MakeOperation();

    auto result = operation.run(tree, {}, nullptr, cancel);

    EXPECT_TRUE(result.is_cancelled());
    EXPECT_EQ(result.message, "Operation cancelled during file discovery");
    EXPECT_EQ(AllFileNames(tree).size(), 3u);
}
