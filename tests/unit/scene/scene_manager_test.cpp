#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "ark/scene/actor.hpp"
#include "ark/scene/scene_manager.hpp"

using namespace ark::scene;

namespace {

class Recorder : public Component {
public:
    Recorder(Actor& actor, std::string label, std::vector<std::string>& log,
             Capability caps = Capability::All)
        : Component(actor, "Recorder", caps), label_(std::move(label)), log_(log) {}

    void OnAttach() override { log_.push_back(label_ + ":attach"); }
    void OnStart() override {
        log_.push_back(label_ + ":start");
        if (onStart) {
            onStart(*this);
        }
    }
    void OnUpdate(double) override { log_.push_back(label_ + ":update"); }
    void OnFixedUpdate(double) override { log_.push_back(label_ + ":fixed"); }
    void OnDestroy() override { log_.push_back(label_ + ":destroy"); }

    std::function<void(Recorder&)> onStart;

private:
    std::string label_;
    std::vector<std::string>& log_;
};

} // namespace

class SceneManagerTest : public ::testing::Test {
protected:
    Actor& make(const std::string& name, Actor* parent = nullptr) {
        auto result = scenes_.CreateActor(name, parent);
        EXPECT_TRUE(result.hasValue());
        return *result.value();
    }

    SceneManager scenes_;
    std::vector<std::string> log_;
};

// ── Start flush ──────────────────────────────────────────────────────

TEST_F(SceneManagerTest, FlushStartsAttachesBatchBeforeStarting) {
    auto& a = make("a");
    auto& b = make("b");
    a.AddComponent<Recorder>("a", log_);
    b.AddComponent<Recorder>("b", log_);

    EXPECT_EQ(scenes_.FlushStarts(), 2u);
    EXPECT_EQ(log_, (std::vector<std::string>{"a:attach", "b:attach", "a:start", "b:start"}));
    EXPECT_EQ(scenes_.PendingStartCount(), 0u);
}

TEST_F(SceneManagerTest, FlushStartsIsIdempotentOnceDrained) {
    make("a").AddComponent<Recorder>("a", log_);
    scenes_.FlushStarts();
    log_.clear();

    EXPECT_EQ(scenes_.FlushStarts(), 0u);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SceneManagerTest, ComponentsAddedDuringStartRunInSameFlush) {
    auto& a = make("a");
    a.AddComponentWith<Recorder>(
        [this](Recorder& r) {
            r.onStart = [this](Recorder& self) {
                self.GetActor().AddComponent<Recorder>("late", log_);
            };
        },
        "first", log_);

    EXPECT_EQ(scenes_.FlushStarts(), 2u);
    EXPECT_EQ(log_, (std::vector<std::string>{"first:attach", "first:start", "late:attach",
                                              "late:start"}));
}

TEST_F(SceneManagerTest, ComponentsOfPendingActorsNeverStart) {
    auto& a = make("a");
    auto& rec = a.AddComponent<Recorder>("a", log_);
    a.MarkDestructionPending();

    EXPECT_EQ(scenes_.FlushStarts(), 0u);
    EXPECT_FALSE(rec.IsStarted());
    EXPECT_TRUE(log_.empty());
}

TEST_F(SceneManagerTest, HooksRequireCapabilities) {
    auto& rec = make("a").AddComponent<Recorder>("quiet", log_, Capability::Update);

    EXPECT_EQ(scenes_.FlushStarts(), 1u);
    EXPECT_TRUE(rec.IsStarted());
    EXPECT_TRUE(log_.empty());
}

// ── Per-frame dispatch ───────────────────────────────────────────────

TEST_F(SceneManagerTest, UpdateReachesActorsInDepthFirstOrder) {
    auto& root = make("root");
    auto& child = make("child", &root);
    auto& other = make("other");
    root.AddComponent<Recorder>("root", log_, Capability::Update | Capability::FixedUpdate);
    child.AddComponent<Recorder>("child", log_, Capability::Update | Capability::FixedUpdate);
    other.AddComponent<Recorder>("other", log_, Capability::Update | Capability::FixedUpdate);
    scenes_.FlushStarts();

    scenes_.FixedUpdate(16.0);
    scenes_.Update(16.0);

    EXPECT_EQ(log_, (std::vector<std::string>{"root:fixed", "child:fixed", "other:fixed",
                                              "root:update", "child:update", "other:update"}));
}

TEST_F(SceneManagerTest, ActorsCreatedAfterFlushWaitForNextFlush) {
    scenes_.FlushStarts();
    make("late").AddComponent<Recorder>("late", log_, Capability::Update);

    scenes_.Update(16.0);
    EXPECT_TRUE(log_.empty());

    scenes_.FlushStarts();
    scenes_.Update(16.0);
    EXPECT_EQ(log_, (std::vector<std::string>{"late:update"}));
}

// ── Component destruction ────────────────────────────────────────────

TEST_F(SceneManagerTest, DestroyComponentIsDeferredToReap) {
    auto& a = make("a");
    auto& rec = a.AddComponent<Recorder>("a", log_);
    scenes_.FlushStarts();
    log_.clear();

    rec.Destroy();
    EXPECT_TRUE(rec.IsPendingForDestruction());
    EXPECT_EQ(a.GetComponent<Recorder>(), nullptr);
    EXPECT_TRUE(log_.empty());

    a.Update(16.0);
    EXPECT_TRUE(log_.empty());

    const auto stats = scenes_.Reap();
    EXPECT_EQ(stats.components, 1u);
    EXPECT_EQ(stats.actors, 0u);
    EXPECT_EQ(log_, (std::vector<std::string>{"a:destroy"}));
    EXPECT_EQ(a.ComponentCount(), 0u);
    EXPECT_EQ(scenes_.ComponentCount(), 0u);
}

TEST_F(SceneManagerTest, DestroyComponentTwiceIsNoOp) {
    auto& rec = make("a").AddComponent<Recorder>("a", log_, Capability::Destroy);

    scenes_.DestroyComponent(rec);
    scenes_.DestroyComponent(rec);

    EXPECT_EQ(scenes_.Reap().components, 1u);
    EXPECT_EQ(log_, (std::vector<std::string>{"a:destroy"}));
}

TEST_F(SceneManagerTest, DestroyedComponentIsDroppedFromStartQueue) {
    auto& rec = make("a").AddComponent<Recorder>("a", log_);
    rec.Destroy();

    EXPECT_EQ(scenes_.PendingStartCount(), 0u);
    EXPECT_EQ(scenes_.FlushStarts(), 0u);
    EXPECT_TRUE(log_.empty());
}

// ── Reap ─────────────────────────────────────────────────────────────

TEST_F(SceneManagerTest, ReapDestroysPendingSubtreeParentFirst) {
    auto& root = make("root");
    auto& child = make("child", &root);
    auto& grandchild = make("grandchild", &child);
    root.AddComponent<Recorder>("root", log_, Capability::Destroy);
    child.AddComponent<Recorder>("child", log_, Capability::Destroy);
    grandchild.AddComponent<Recorder>("grandchild", log_, Capability::Destroy);
    auto& keep = make("keep");

    scenes_.Tree().DestroyActor(root);
    EXPECT_TRUE(log_.empty());

    const auto stats = scenes_.Reap();
    EXPECT_EQ(stats.actors, 3u);
    EXPECT_EQ(log_, (std::vector<std::string>{"root:destroy", "child:destroy",
                                              "grandchild:destroy"}));
    EXPECT_EQ(scenes_.ActorCount(), 1u);
    EXPECT_EQ(scenes_.ComponentCount(), 0u);
    EXPECT_EQ(scenes_.Tree().GetRootActors(), (std::vector<Actor*>{&keep}));
}

TEST_F(SceneManagerTest, ReapDetachesChildFromLiveParent) {
    auto& root = make("root");
    auto& child = make("child", &root);
    const auto handle = child.GetHandle();

    child.MarkDestructionPending();
    scenes_.Reap();

    EXPECT_EQ(root.ChildCount(), 0u);
    EXPECT_EQ(scenes_.Resolve(handle), nullptr);
    EXPECT_EQ(scenes_.ActorCount(), 1u);
}

TEST_F(SceneManagerTest, ReapReleasesRemovedComponents) {
    auto& a = make("a");
    auto& rec = a.AddComponent<Recorder>("a", log_);
    const auto handle = rec.GetHandle();

    ASSERT_TRUE(a.RemoveComponent(rec));
    EXPECT_NE(scenes_.Resolve(handle), nullptr);

    scenes_.Reap();
    EXPECT_EQ(scenes_.Resolve(handle), nullptr);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SceneManagerTest, ReapWithNothingPendingReportsZero) {
    make("a");
    const auto stats = scenes_.Reap();
    EXPECT_EQ(stats.actors, 0u);
    EXPECT_EQ(stats.components, 0u);
}

TEST_F(SceneManagerTest, ComponentAttachedToReapedActorIsFreedWithoutStarting) {
    auto& first = make("first");
    auto& second = make("second");

    class AttachOnDestroy : public Component {
    public:
        AttachOnDestroy(Actor& actor, Actor& target, std::vector<std::string>& log)
            : Component(actor, "AttachOnDestroy", Capability::Destroy),
              target_(target),
              log_(log) {}
        void OnDestroy() override { target_.AddComponent<Recorder>("late", log_); }

    private:
        Actor& target_;
        std::vector<std::string>& log_;
    };
    second.AddComponent<AttachOnDestroy>(first, log_);
    scenes_.FlushStarts();

    first.MarkDestructionPending();
    second.MarkDestructionPending();
    const auto stats = scenes_.Reap();

    EXPECT_EQ(stats.actors, 2u);
    EXPECT_EQ(scenes_.ActorCount(), 0u);
    EXPECT_EQ(scenes_.ComponentCount(), 0u);
    EXPECT_EQ(scenes_.PendingStartCount(), 0u);
    EXPECT_EQ(scenes_.FlushStarts(), 0u);
    EXPECT_TRUE(log_.empty());
}

TEST_F(SceneManagerTest, ComponentsAttachedWhileTearingDownAreDestroyedToo) {
    auto& actor = make("actor");

    class Spawner : public Component {
    public:
        Spawner(Actor& actor, std::size_t count, std::vector<std::string>& log)
            : Component(actor, "Spawner", Capability::Destroy), count_(count), log_(log) {}
        void OnDestroy() override {
            log_.push_back("spawner:" + std::to_string(count_));
            if (count_ == 1) {
                GetActor().AddComponent<Spawner>(64, log_);
                return;
            }
            for (std::size_t i = 0; i < count_; ++i) {
                GetActor().AddComponent<Recorder>("plain", log_, Capability::Destroy);
            }
        }

    private:
        std::size_t count_;
        std::vector<std::string>& log_;
    };
    actor.AddComponent<Spawner>(1, log_);
    scenes_.FlushStarts();

    actor.MarkDestructionPending();
    scenes_.Reap();

    EXPECT_EQ(scenes_.ComponentCount(), 0u);
    EXPECT_EQ(scenes_.PendingStartCount(), 0u);
    ASSERT_EQ(log_.size(), 2u + 64u);
    EXPECT_EQ(log_[0], "spawner:1");
    EXPECT_EQ(log_[1], "spawner:64");
    EXPECT_EQ(log_.back(), "plain:destroy");
}
