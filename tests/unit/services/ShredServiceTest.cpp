/**
 * @file ShredServiceTest.cpp
 * @brief Unit tests for ShredService
 */

#include "services/ShredService.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockLogger.hpp"
#include "mocks/MockTimestampObfuscator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <optional>

namespace fs = std::filesystem;

class ShredServiceTest : public ShredTestFixture {
protected:
    std::shared_ptr<RecordingLogger> logger;
    std::unique_ptr<ShredService> service;

    std::mutex completion_mutex;
    std::optional<OperationResult> completed;

    void SetUp() override {
        ShredTestFixture::SetUp();
        logger = std::make_shared<RecordingLogger>();
        service = std::make_unique<ShredService>(
            classifier, MockTimestampObfuscator::CreateNiceMock(), logger);
    }

    void TearDown() override {
        service.reset();
        ShredTestFixture::TearDown();
    }

    CompletionCallback CreateCompletion() {
        return [this](const OperationResult& result) {
            std::lock_guard lock(completion_mutex);
            completed = result;
        };
    }

    bool HasCompleted() {
        std::lock_guard lock(completion_mutex);
        return completed.has_value();
    }
};

TEST_F(ShredServiceTest, AvailableMethods_ContainsGutmann) {
    auto methods = service->get_available_methods();

    ASSERT_EQ(methods.size(), 1u);
    ASSERT_TRUE(methods.contains("gutmann_35_pass"));
    EXPECT_EQ(methods.at("gutmann_35_pass"),
              (MethodInfo{.name = "GUTMANN 35-PASS - MAXIMUM SECURITY",
                          .passes = 35,
                          .security = "MAXIMUM"}));
}

TEST_F(ShredServiceTest, Validate_AcceptsFileAndDirectory) {
    auto file = temp_dir->WriteFile("docs/note.txt", "n");

    auto file_result = service->validate_shredding_path(file);
    auto dir_result = service->validate_shredding_path(file.parent_path());

    EXPECT_TRUE(file_result.success) << file_result.message;
    EXPECT_EQ(file_result.message, "Path validated - ready to shred");
    EXPECT_TRUE(dir_result.success) << dir_result.message;
}

TEST_F(ShredServiceTest, Validate_ReportsRefusals) {
    EXPECT_EQ(service->validate_shredding_path(temp_dir->path() / "missing").kind,
              util::ErrorKind::NotFound);
    EXPECT_EQ(service->validate_shredding_path("/etc").kind, util::ErrorKind::SystemPathRefused);
    EXPECT_EQ(service->validate_shredding_path(temp_dir->path()).kind,
              util::ErrorKind::SystemPathRefused);
}

TEST_F(ShredServiceTest, Validate_DoesNotModifyTarget) {
    auto file = temp_dir->WriteFile("untouched.txt", "same");

    ASSERT_TRUE(service->validate_shredding_path(file).success);

    auto content = TempTestDir::ReadFile(file);
    EXPECT_EQ(std::string(content.begin(), content.end()), "same");
}

TEST_F(ShredServiceTest, Shred_DispatchesOnTargetKind) {
    auto file = temp_dir->WriteFile("single.txt", "s");
    temp_dir->WriteFile("folder/inner.txt", "i");

    auto file_result = service->shred(file, {}, nullptr, cancel);
    auto dir_result = service->shred(temp_dir->path() / "folder", {}, nullptr, cancel);

    EXPECT_EQ(file_result.message, "FILE DESTROYED: single.txt -> IRRECOVERABLE");
    EXPECT_EQ(dir_result.message, "DIRECTORY DESTROYED: 1 FILES - IRRECOVERABLE");
    EXPECT_TRUE(TempTestDir::ListNames(temp_dir->path()).empty());
}

TEST_F(ShredServiceTest, ShredFile_OnDirectory_NotAFile) {
    fs::create_directories(temp_dir->path() / "folder");

    auto result = service->shred_file(temp_dir->path() / "folder", {}, nullptr, cancel);

    EXPECT_EQ(result.kind, util::ErrorKind::NotAFile);
}

TEST_F(ShredServiceTest, Start_RunsInBackgroundAndCompletes) {
    auto file = temp_dir->WriteFile("async.txt", 512, 0x11);

    ASSERT_TRUE(service->start(file, {}, nullptr, CreateCompletion()));

    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return HasCompleted(); },
                                               std::chrono::milliseconds{30000}));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return !service->is_busy(); }));

    std::lock_guard lock(completion_mutex);
    EXPECT_TRUE(completed->success) << completed->message;
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ShredServiceTest, Start_RejectsSecondOperationAndCancels) {
    auto first = temp_dir->WriteFile("first.txt", 512, 0x11);
    auto second = temp_dir->WriteFile("second.txt", 512, 0x22);
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};

    auto blocking = [&](const ShredProgress&) {
        entered = true;
        ThreadingTestHelper::WaitUntil([&] { return release.load(); });
        return true;
    };

    ASSERT_TRUE(service->start(first, {}, blocking, CreateCompletion()));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([&] { return entered.load(); }));

    EXPECT_TRUE(service->is_busy());
    EXPECT_FALSE(service->start(second, {}, nullptr, nullptr));
    EXPECT_TRUE(service->cancel_current_operation());
    release = true;

    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return HasCompleted(); }));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return !service->is_busy(); }));

    {
        std::lock_guard lock(completion_mutex);
        EXPECT_TRUE(completed->is_cancelled());
    }
    EXPECT_TRUE(fs::exists(second));
    EXPECT_TRUE(logger->Contains(util::LogLevel::INFO, "Cancellation requested"));
}

TEST_F(ShredServiceTest, CancelWhenIdle_ReturnsFalse) {
    EXPECT_FALSE(service->is_busy());
    EXPECT_FALSE(service->cancel_current_operation());
}

TEST_F(ShredServiceTest, Start_CanRunAgainAfterCompletion) {
    auto first = temp_dir->WriteFile("one.txt", "1");
    auto second = temp_dir->WriteFile("two.txt", "2");

    ASSERT_TRUE(service->start(first, {}, nullptr, CreateCompletion()));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return !service->is_busy(); },
                                               std::chrono::milliseconds{30000}));

    ASSERT_TRUE(service->start(second, {}, nullptr, nullptr));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([this] { return !service->is_busy(); },
                                               std::chrono::milliseconds{30000}));

    EXPECT_FALSE(fs::exists(first));
    EXPECT_FALSE(fs::exists(second));
}

TEST_F(ShredServiceTest, Destructor_CancelsRunningOperation) {
    auto file = temp_dir->WriteFile("teardown.txt", 512, 0x33);
    std::atomic<bool> entered{false};

    auto slow = [&](const ShredProgress&) {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        return true;
    };

    ASSERT_TRUE(service->start(file, {}, slow, CreateCompletion()));
    ASSERT_TRUE(ThreadingTestHelper::WaitUntil([&] { return entered.load(); }));

    service.reset();

    std::lock_guard lock(completion_mutex);
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed->is_cancelled());
}
