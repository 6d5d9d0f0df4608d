#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include "session_store.hpp"
#include "test_helpers.hpp"

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("gaitkeeper_store_" + std::string(::testing::UnitTest::GetInstance()
                                                          ->current_test_info()
                                                          ->name()));
        std::filesystem::remove_all(test_dir);
        store = std::make_unique<JsonSessionStore>(test_dir);

        session.id = "session-1";
        session.profile = make_profile(168);
    }

    void TearDown() override {
        store.reset();
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::filesystem::path test_dir;
    std::unique_ptr<JsonSessionStore> store;
    SessionRecord session;
};

TEST_F(SessionStoreTest, CreateAndFetch) {
    store->create_session(session, make_running_session());

    auto fetched = store->get_session("session-1");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->id, "session-1");
    EXPECT_EQ(fetched->profile.height_cm, 168);
    EXPECT_EQ(fetched->status, ProcessingStatus::PENDING);

    EXPECT_TRUE(std::filesystem::exists(test_dir / "session-1" / "session.json"));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "session-1" / "poses.json"));
    EXPECT_EQ(store->get_poses("session-1").size(), 300u);
}

TEST_F(SessionStoreTest, UnknownSession) {
    EXPECT_FALSE(store->get_session("missing").has_value());
    EXPECT_TRUE(store->get_poses("missing").empty());
    EXPECT_FALSE(store->get_metrics("missing").has_value());

    SessionRecord ghost;
    ghost.id = "missing";
    EXPECT_THROW(store->update_session(ghost), StoreError);
    EXPECT_THROW(store->create_metrics("missing", RunningMetrics{}), StoreError);
}

TEST_F(SessionStoreTest, UpdateStatus) {
    store->create_session(session, {});
    session.status = ProcessingStatus::FAILED;
    session.error_message = "bad input";
    store->update_session(session);

    auto fetched = store->get_session("session-1");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->status, ProcessingStatus::FAILED);
    EXPECT_EQ(fetched->error_message, std::optional<std::string>("bad input"));
}

TEST_F(SessionStoreTest, PosesOrderedByFrameNumber) {
    PoseSequence frames = make_running_session();
    std::reverse(frames.begin(), frames.end());
    std::swap(frames[10], frames[200]);
    store->create_session(session, frames);

    PoseSequence fetched = store->get_poses("session-1");
    ASSERT_EQ(fetched.size(), frames.size());
    for (size_t i = 0; i < fetched.size(); ++i) {
        EXPECT_EQ(fetched[i].frame_number, static_cast<int64_t>(i));
    }
    EXPECT_DOUBLE_EQ(fetched[27].at(Landmark::LEFT_ANKLE).y,
                     make_running_frame(27, SyntheticRun{}).at(Landmark::LEFT_ANKLE).y);
}

TEST_F(SessionStoreTest, EachComputationAddsRecord) {
    store->create_session(session, {});
    EXPECT_FALSE(store->get_metrics("session-1").has_value());
    EXPECT_TRUE(store->metrics_history("session-1").empty());

    RunningMetrics m;
    m.cadence = 178.0;
    m.joint_angles["left_knee"] = 150.0;
    EXPECT_EQ(store->create_metrics("session-1", m), 1u);

    auto stored = store->get_metrics("session-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_DOUBLE_EQ(stored->cadence, 178.0);
    EXPECT_DOUBLE_EQ(stored->joint_angles.at("left_knee"), 150.0);

    RunningMetrics other;
    other.cadence = 181.0;
    EXPECT_EQ(store->create_metrics("session-1", other), 2u);
    EXPECT_DOUBLE_EQ(store->get_metrics("session-1")->cadence, 181.0);

    // Earlier records are never rewritten
    auto history = store->metrics_history("session-1");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_DOUBLE_EQ(history[0].cadence, 178.0);
    EXPECT_DOUBLE_EQ(history[1].cadence, 181.0);
    EXPECT_TRUE(std::filesystem::exists(test_dir / "session-1" / "metrics" / "1.json"));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "session-1" / "metrics" / "2.json"));
}

TEST_F(SessionStoreTest, LatestRecordOrderedNumerically) {
    store->create_session(session, {});
    RunningMetrics m;
    for (int i = 1; i <= 10; ++i) {
        m.cadence = 170.0 + i;
        store->create_metrics("session-1", m);
    }
    // "10.json" sorts before "2.json" as text
    EXPECT_DOUBLE_EQ(store->get_metrics("session-1")->cadence, 180.0);
    EXPECT_EQ(store->metrics_history("session-1").size(), 10u);
}

TEST_F(SessionStoreTest, RejectsInvalidProfile) {
    session.profile.height_cm = 0;
    EXPECT_THROW(store->create_session(session, {}), std::invalid_argument);
    session.profile.height_cm = -170;
    EXPECT_THROW(store->create_session(session, {}), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "session-1"));
}

TEST_F(SessionStoreTest, StoredInvalidProfileReportsStoreError) {
    store->create_session(session, {});
    {
        std::ofstream out(test_dir / "session-1" / "session.json");
        out << R"({"id": "session-1", "status": "pending",
                   "runner_profile": {"gender": "male", "height_cm": -170, "age": 30}})";
    }
    EXPECT_THROW(store->get_session("session-1"), StoreError);
}

TEST_F(SessionStoreTest, InvalidSessionIds) {
    EXPECT_THROW(store->get_session("../escape"), StoreError);
    EXPECT_THROW(store->get_session(""), StoreError);
    EXPECT_THROW(store->get_poses(".."), StoreError);

    SessionRecord bad;
    bad.id = "a/b";
    EXPECT_THROW(store->create_session(bad, {}), StoreError);
}

TEST_F(SessionStoreTest, MalformedFilesReportStoreError) {
    store->create_session(session, {});
    {
        std::ofstream out(test_dir / "session-1" / "poses.json");
        out << "[{\"frame_number\": ";
    }
    EXPECT_THROW(store->get_poses("session-1"), StoreError);

    {
        std::ofstream out(test_dir / "session-1" / "session.json");
        out << "{\"id\": \"session-1\"}";
    }
    EXPECT_THROW(store->get_session("session-1"), StoreError);
}
