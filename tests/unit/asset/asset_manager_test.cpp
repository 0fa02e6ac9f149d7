#include <gtest/gtest.h>

#include <any>
#include <stdexcept>
#include <string>
#include <vector>

#include "ark/asset/asset_manager.hpp"
#include "ark/foundation/task_queue.hpp"
#include "support/mock_logger.hpp"

using namespace ark::asset;
using ark::foundation::ErrorCode;
using ark::foundation::KernelError;
using ark::foundation::KernelResult;
using ark::foundation::TaskQueue;

class AssetManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_.registry().registerLoader(
            "text", {".txt"}, [this](const Asset& asset, AssetLoaderContext&, const std::any&) {
                loaded_.push_back(asset.key());
                return KernelResult<std::any>::ok(std::any("text:" + asset.key()));
            });
        manager_.registry().registerLoader(
            "broken", {".bad"}, [this](const Asset& asset, AssetLoaderContext&, const std::any&) {
                loaded_.push_back(asset.key());
                return KernelResult<std::any>::err(
                    KernelError(ErrorCode::AssetLoadFailed, "corrupt file"));
            });
    }

    ark::testing::ScopedMockLogger logger_;
    TaskQueue tasks_;
    AssetManager manager_{tasks_};
    std::vector<std::string> loaded_;
};

// ── Requests ─────────────────────────────────────────────────────────

TEST_F(AssetManagerTest, RequestQueuesWithoutLoading) {
    auto lazy = manager_.request<std::string>("a.txt");

    EXPECT_EQ(manager_.pendingCount(), 1u);
    EXPECT_TRUE(loaded_.empty());
    EXPECT_FALSE(lazy.isReady());
    EXPECT_EQ(lazy.asset().type(), "text");
}

TEST_F(AssetManagerTest, RequestsForSameKeyShareOneAsset) {
    auto first = manager_.request<std::string>("dir/a.txt");
    auto second = manager_.request<std::string>("dir\\a.txt");

    EXPECT_EQ(first.assetPtr(), second.assetPtr());
    EXPECT_EQ(manager_.pendingCount(), 1u);
    EXPECT_EQ(manager_.assetFor("dir/a.txt"), first.assetPtr());
}

TEST_F(AssetManagerTest, GetBeforeFlushIsNotReady) {
    auto lazy = manager_.request<std::string>("a.txt");

    auto value = lazy.get();
    ASSERT_TRUE(value.hasError());
    EXPECT_EQ(value.error().code(), ErrorCode::AssetNotReady);
    EXPECT_EQ(lazy.tryGet(), nullptr);
}

// ── Flush ────────────────────────────────────────────────────────────

TEST_F(AssetManagerTest, FlushLoadsInRequestOrder) {
    auto a = manager_.request<std::string>("a.txt");
    auto b = manager_.request<std::string>("b.txt");

    auto result = manager_.flush();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 2u);
    EXPECT_EQ(loaded_, (std::vector<std::string>{"a.txt", "b.txt"}));

    ASSERT_TRUE(a.get().hasValue());
    EXPECT_EQ(a.get().value(), "text:a.txt");
    ASSERT_NE(b.tryGet(), nullptr);
    EXPECT_EQ(*b.tryGet(), "text:b.txt");
    EXPECT_TRUE(manager_.isLoaded("a.txt"));
    EXPECT_EQ(manager_.loadedCount(), 2u);
    EXPECT_EQ(manager_.pendingCount(), 0u);
}

TEST_F(AssetManagerTest, LoadedAssetIsNotLoadedAgain) {
    (void)manager_.request<std::string>("a.txt");
    ASSERT_TRUE(manager_.flush().hasValue());

    auto again = manager_.request<std::string>("a.txt");
    EXPECT_EQ(manager_.pendingCount(), 0u);
    EXPECT_TRUE(again.isReady());

    auto result = manager_.flush();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(loaded_.size(), 1u);
}

TEST_F(AssetManagerTest, EmptyFlushSucceeds) {
    auto result = manager_.flush();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 0u);
}

TEST_F(AssetManagerTest, WrongTypeIsReportedByGet) {
    auto lazy = manager_.request<int>("a.txt");
    ASSERT_TRUE(manager_.flush().hasValue());

    auto value = lazy.get();
    ASSERT_TRUE(value.hasError());
    EXPECT_EQ(value.error().code(), ErrorCode::AssetTypeMismatch);
    EXPECT_EQ(lazy.tryGet(), nullptr);
}

TEST_F(AssetManagerTest, FlushOptionsReportStartAndProgress) {
    (void)manager_.request<std::string>("a.txt");
    (void)manager_.request<std::string>("b.txt");

    std::vector<std::string> started;
    std::vector<std::pair<std::size_t, std::size_t>> progress;
    FlushOptions options;
    options.onStart = [&](const Asset& asset) { started.push_back(asset.key()); };
    options.onProgress = [&](std::size_t done, std::size_t total) {
        progress.emplace_back(done, total);
    };

    ASSERT_TRUE(manager_.flush(options).hasValue());
    EXPECT_EQ(started, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(progress, (std::vector<std::pair<std::size_t, std::size_t>>{{1, 2}, {2, 2}}));
}

TEST_F(AssetManagerTest, FlushPassesContextToLoaders) {
    manager_.registry().registerLoader(
        "path", {".cfg"}, [](const Asset& asset, AssetLoaderContext& context, const std::any&) {
            return KernelResult<std::any>::ok(
                std::any((context.rootDirectory / asset.key()).generic_string()));
        });
    auto lazy = manager_.request<std::string>("game.cfg");

    AssetLoaderContext context;
    context.rootDirectory = "assets";
    ASSERT_TRUE(manager_.flush(context).hasValue());
    EXPECT_EQ(lazy.get().value(), "assets/game.cfg");
}

// ── Failures ─────────────────────────────────────────────────────────

TEST_F(AssetManagerTest, UnregisteredTypeFailsWithoutTouchingResults) {
    auto unknown = manager_.request<std::string>("a.png");
    EXPECT_EQ(unknown.asset().type(), kUnknownAssetType);

    auto result = manager_.flush();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::LoaderNotRegistered);
    ASSERT_NE(result.error().context<std::string>(), nullptr);
    EXPECT_EQ(*result.error().context<std::string>(), "a.png");
    EXPECT_EQ(manager_.loadedCount(), 0u);
    EXPECT_TRUE(loaded_.empty());
}

TEST_F(AssetManagerTest, FailureKeepsEarlierResultsAndDropsTheRest) {
    auto a = manager_.request<std::string>("a.txt");
    auto bad = manager_.request<std::string>("b.bad");
    auto c = manager_.request<std::string>("c.txt");

    auto result = manager_.flush();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AssetLoadFailed);
    EXPECT_NE(std::string(result.error().message()).find("corrupt file"), std::string::npos);

    EXPECT_TRUE(a.isReady());
    EXPECT_FALSE(bad.isReady());
    EXPECT_FALSE(c.isReady());
    EXPECT_EQ(loaded_, (std::vector<std::string>{"a.txt", "b.bad"}));
    EXPECT_EQ(manager_.pendingCount(), 0u);
    EXPECT_GE(logger_->countContaining("failed to load asset"), 1u);
}

TEST_F(AssetManagerTest, DroppedAssetsCanBeRequestedAgain) {
    (void)manager_.request<std::string>("b.bad");
    auto c = manager_.request<std::string>("c.txt");
    ASSERT_TRUE(manager_.flush().hasError());

    auto retry = manager_.request<std::string>("c.txt");
    EXPECT_EQ(retry.assetPtr(), c.assetPtr());
    EXPECT_EQ(manager_.pendingCount(), 1u);

    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_TRUE(c.isReady());
}

TEST_F(AssetManagerTest, FlushFailedSignalCarriesError) {
    std::vector<ErrorCode> failures;
    manager_.flushFailed().connect(
        [&](const KernelError& error) { failures.push_back(error.code()); });

    (void)manager_.request<std::string>("a.png");
    (void)manager_.flush();
    (void)manager_.request<std::string>("b.bad");
    (void)manager_.flush();

    EXPECT_EQ(failures, (std::vector<ErrorCode>{ErrorCode::LoaderNotRegistered,
                                                ErrorCode::AssetLoadFailed}));
}

TEST_F(AssetManagerTest, ThrowingLoaderLeavesAssetRequestable) {
    int calls = 0;
    manager_.registry().registerLoader(
        "flaky", {".dat"}, [&calls](const Asset&, AssetLoaderContext&, const std::any&) {
            if (++calls == 1) {
                throw std::runtime_error("disk unplugged");
            }
            return KernelResult<std::any>::ok(std::any(std::string("payload")));
        });
    auto first = manager_.request<std::string>("a.dat");
    auto second = manager_.request<std::string>("b.dat");

    EXPECT_THROW((void)manager_.flush(), std::runtime_error);
    EXPECT_EQ(manager_.pendingCount(), 0u);

    auto retryFirst = manager_.request<std::string>("a.dat");
    auto retrySecond = manager_.request<std::string>("b.dat");
    EXPECT_EQ(manager_.pendingCount(), 2u);

    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_TRUE(first.isReady());
    EXPECT_TRUE(second.isReady());
    EXPECT_EQ(retryFirst.get().value(), "payload");
    EXPECT_EQ(calls, 3);
}

// ── Loader options ───────────────────────────────────────────────────

class AssetOptionsTest : public AssetManagerTest {
protected:
    void SetUp() override {
        AssetManagerTest::SetUp();
        manager_.registry().registerLoader(
            "scaled", {".img"},
            [this](const Asset& asset, AssetLoaderContext&, const std::any& options) {
                const auto* scale = std::any_cast<int>(&options);
                scales_.push_back(scale != nullptr ? *scale : 0);
                return KernelResult<std::any>::ok(std::any(asset.key()));
            });
    }

    std::vector<int> scales_;
};

TEST_F(AssetOptionsTest, FirstOptionsForKeyReachLoader) {
    (void)manager_.request<std::string>("hero.img", 2);
    (void)manager_.request<std::string>("hero.img", 4);

    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_EQ(scales_, (std::vector<int>{2}));
}

TEST_F(AssetOptionsTest, OptionsGivenByLaterRequestAreUsed) {
    (void)manager_.request<std::string>("hero.img");
    (void)manager_.request<std::string>("hero.img", 3);

    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_EQ(scales_, (std::vector<int>{3}));
}

TEST_F(AssetOptionsTest, LoaderWithoutOptionsReceivesEmptyAny) {
    (void)manager_.request<std::string>("hero.img");
    (void)manager_.request<std::string>("villain.img", 5);

    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_EQ(scales_, (std::vector<int>{0, 5}));
}

TEST_F(AssetOptionsTest, OptionsForLoadedAssetAreIgnored) {
    (void)manager_.request<std::string>("hero.img", 2);
    ASSERT_TRUE(manager_.flush().hasValue());

    (void)manager_.request<std::string>("hero.img", 7);
    EXPECT_EQ(manager_.pendingCount(), 0u);
    ASSERT_TRUE(manager_.flush().hasValue());
    EXPECT_EQ(scales_, (std::vector<int>{2}));
}

// ── Autoload ─────────────────────────────────────────────────────────

TEST_F(AssetManagerTest, AutoloadCoalescesRequestsIntoOneFlush) {
    manager_.setAutoload(true);

    auto a = manager_.request<std::string>("a.txt");
    auto b = manager_.request<std::string>("b.txt");
    EXPECT_FALSE(a.isReady());

    EXPECT_EQ(tasks_.drain(), 1u);
    EXPECT_TRUE(a.isReady());
    EXPECT_TRUE(b.isReady());
    EXPECT_EQ(logger_->countContaining("loading 2 asset(s)"), 1u);
}

TEST_F(AssetManagerTest, AutoloadSchedulesAgainAfterFlush) {
    manager_.setAutoload(true);

    (void)manager_.request<std::string>("a.txt");
    tasks_.drain();
    auto b = manager_.request<std::string>("b.txt");
    EXPECT_FALSE(b.isReady());

    EXPECT_EQ(tasks_.drain(), 1u);
    EXPECT_TRUE(b.isReady());
}

TEST_F(AssetManagerTest, AutoloadOffPostsNothing) {
    (void)manager_.request<std::string>("a.txt");
    EXPECT_EQ(tasks_.drain(), 0u);
    EXPECT_EQ(manager_.pendingCount(), 1u);
}
