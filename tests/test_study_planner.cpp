#include <gtest/gtest.h>
#include <study_planner/study_planner.h>
#include <study_planner/topic_factory.h>
#include <thread>

using namespace study_planner;

class StudyPlannerTest : public ::testing::Test {
protected:
    LoadedDocument PhysicsBook() {
        LoadedDocument doc("physics.pdf", {});
        for (int i = 0; i < 30; ++i) {
            doc.add_page("Page " + std::to_string(i + 1) + " text about motion.");
        }
        doc.add_outline_entry({1, "Table of Contents", 1});
        doc.add_outline_entry({1, "Kinematics", 2});
        doc.add_outline_entry({1, "Dynamics", 11});
        doc.add_outline_entry({1, "Energy", 21});
        return doc;
    }

    LoadedDocument HistoryNotes() {
        return LoadedDocument("history.pdf", {
            "Chapter 1 The Early Republic\nSenate and consuls.",
            "Consuls were elected annually.",
            "Chapter 2 The Late Republic\nCivil wars.",
        });
    }

    StudyPlanner planner_;
    PlannerSession session_;
};

TEST_F(StudyPlannerTest, SegmentAndWeight) {
    auto result = planner_.segment_and_weight(session_, PhysicsBook(), "Physics");

    ASSERT_EQ(result["status"], "success");
    EXPECT_EQ(result["topics_created"], 3);
    EXPECT_EQ(result["pages"], 30);
    EXPECT_EQ(result["structure"], "outline");
    EXPECT_EQ(result["topics"].size(), 3u);
    ASSERT_EQ(session_.topics.size(), 3u);
    ASSERT_EQ(session_.documents.size(), 1u);
    EXPECT_EQ(session_.documents[0].topic_ids.size(), 3u);
    EXPECT_EQ(session_.documents[0].id, TopicFactory::document_fingerprint("physics.pdf", 30));
    EXPECT_EQ(session_.topics[0].title, "Kinematics");
    EXPECT_EQ(session_.topics[2].end_page, 30);
}

TEST_F(StudyPlannerTest, TopicsAccumulateInDocumentOrder) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    auto result = planner_.segment_and_weight(session_, HistoryNotes(), "History");

    ASSERT_EQ(result["status"], "success");
    EXPECT_EQ(result["structure"], "heading-scan");
    ASSERT_EQ(session_.topics.size(), 5u);
    EXPECT_EQ(session_.topics[2].subject, "Physics");
    EXPECT_EQ(session_.topics[3].subject, "History");
    EXPECT_EQ(session_.documents.size(), 2u);
}

TEST_F(StudyPlannerTest, ReprocessingWithoutResetDuplicatesTopics) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");

    EXPECT_EQ(session_.topics.size(), 6u);
    EXPECT_EQ(session_.documents.size(), 1u);
    EXPECT_EQ(session_.topics[0].id, session_.topics[3].id);
}

TEST_F(StudyPlannerTest, UnsupportedFileLeavesSessionIntact) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    LoadedDocument notes("notes.txt", {"Chapter 1 Something"});

    auto result = planner_.segment_and_weight(session_, notes, "Physics");

    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "UnsupportedFileError");
    EXPECT_EQ(session_.topics.size(), 3u);
}

TEST_F(StudyPlannerTest, MissingFileIsLoadError) {
    auto result = planner_.segment_and_weight(session_, "does/not/exist.pdf", "Physics");

    EXPECT_EQ(result["status"], "error");
    EXPECT_EQ(result["error"], "DocumentLoadError");
    EXPECT_TRUE(session_.topics.empty());
}

TEST_F(StudyPlannerTest, UploadFile) {
    auto ok = planner_.upload_file(session_, "/tmp/physics.pdf", {'%', 'P', 'D', 'F'});
    EXPECT_EQ(ok["status"], "success");
    EXPECT_EQ(ok["filename"], "physics.pdf");
    EXPECT_EQ(session_.uploaded_files.count("physics.pdf"), 1u);

    auto bad = planner_.upload_file(session_, "notes.txt", {'x'});
    EXPECT_EQ(bad["error"], "UnsupportedFileError");
}

TEST_F(StudyPlannerTest, ListTopicsIsIdempotent) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    planner_.segment_and_weight(session_, HistoryNotes(), "History");

    auto first = planner_.list_topics(session_);
    auto second = planner_.list_topics(session_);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first["total_topics"], 5);
    ASSERT_TRUE(first["by_subject"].contains("Physics"));
    EXPECT_EQ(first["by_subject"]["Physics"]["topics"].size(), 3u);
    EXPECT_EQ(first["by_subject"]["History"]["topics"].size(), 2u);

    ASSERT_EQ(first["documents"].size(), 2u);
    EXPECT_EQ(first["documents"][0]["filename"], "physics.pdf");
    EXPECT_EQ(first["documents"][0]["topics"].size(), 3u);
    EXPECT_EQ(first["documents"][1]["subject"], "History");
}

TEST_F(StudyPlannerTest, ResetClearsTopicsAndDocuments) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    planner_.add_or_update_exam(session_, "Physics", "2024-06-01");

    auto result = planner_.reset_topics(session_);

    EXPECT_EQ(result["status"], "success");
    EXPECT_TRUE(session_.topics.empty());
    EXPECT_TRUE(session_.documents.empty());
    EXPECT_EQ(session_.exams.size(), 1u);
    EXPECT_EQ(planner_.list_topics(session_)["total_topics"], 0);
}

TEST_F(StudyPlannerTest, AllocateAndExport) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");

    auto allocation = planner_.allocate(session_, "2024-01-01", "2024-01-07");
    ASSERT_EQ(allocation["status"], "success");
    ASSERT_TRUE(session_.current_schedule.has_value());
    EXPECT_GT(allocation["days"].get<int>(), 0);
    EXPECT_EQ(allocation["total_topics"], 3);

    auto csv = planner_.export_schedule(session_, "csv");
    ASSERT_EQ(csv["status"], "success");
    EXPECT_EQ(csv["rows"], ScheduleExporter::row_count(*session_.current_schedule));
    EXPECT_EQ(csv["summary"]["period"], "2024-01-01 to 2024-01-07");
    EXPECT_EQ(csv["summary"]["topics_scheduled"], "3/3");

    auto markdown = planner_.export_schedule(session_, "markdown");
    ASSERT_EQ(markdown["status"], "success");
    EXPECT_EQ(markdown["content"].get<std::string>().rfind("# Study Schedule", 0), 0u);
}

TEST_F(StudyPlannerTest, AllocateReplacesSchedule) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");

    auto first = planner_.allocate(session_, "2024-01-01", "2024-01-07");
    auto second = planner_.allocate(session_, "2024-02-01", "2024-02-03");

    EXPECT_NE(first["schedule_id"], second["schedule_id"]);
    EXPECT_EQ(session_.current_schedule->start_date, "2024-02-01");
}

TEST_F(StudyPlannerTest, NewDocumentKeepsExistingSchedule) {
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    ASSERT_EQ(planner_.allocate(session_, "2024-01-01", "2024-01-07")["status"], "success");

    planner_.segment_and_weight(session_, HistoryNotes(), "History");

    ASSERT_TRUE(session_.current_schedule.has_value());
    auto csv = planner_.export_schedule(session_, "csv");
    ASSERT_EQ(csv["status"], "success");
    EXPECT_EQ(csv["summary"]["topics_scheduled"], "3/3");
}

TEST_F(StudyPlannerTest, AllocateErrors) {
    auto empty = planner_.allocate(session_, "2024-01-01", "2024-01-07");
    EXPECT_EQ(empty["status"], "error");
    EXPECT_EQ(empty["error"], "NoTopicsError");

    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    auto bad_date = planner_.allocate(session_, "01/01/2024", "2024-01-07");
    EXPECT_EQ(bad_date["error"], "InvalidDateError");

    auto reversed = planner_.allocate(session_, "2024-01-07", "2024-01-01");
    EXPECT_EQ(reversed["error"], "InvalidDateError");
    EXPECT_FALSE(session_.current_schedule.has_value());
}

TEST_F(StudyPlannerTest, TooManyTopics) {
    PlannerOptions options;
    options.allocator.max_topics = 2;
    StudyPlanner planner(options);
    planner.segment_and_weight(session_, PhysicsBook(), "Physics");

    auto result = planner.allocate(session_, "2024-01-01", "2024-01-07");
    EXPECT_EQ(result["error"], "TooManyTopicsError");
}

TEST_F(StudyPlannerTest, ExportErrors) {
    auto missing = planner_.export_schedule(session_, "csv");
    EXPECT_EQ(missing["status"], "error");
    EXPECT_EQ(missing["error"], "NoScheduleError");

    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");
    planner_.allocate(session_, "2024-01-01", "2024-01-07");
    auto bad_format = planner_.export_schedule(session_, "pdf");
    EXPECT_EQ(bad_format["status"], "error");
    EXPECT_EQ(bad_format["error"], "InvalidArgument");
}

TEST_F(StudyPlannerTest, ExamUpsert) {
    auto added = planner_.add_or_update_exam(session_, "Physics", "2024-06-01");
    EXPECT_EQ(added["status"], "success");
    auto updated = planner_.add_or_update_exam(session_, "Physics", "2024-06-15");
    EXPECT_EQ(updated["status"], "success");
    planner_.add_or_update_exam(session_, "History", "2024-06-20");

    ASSERT_EQ(session_.exams.size(), 2u);
    EXPECT_EQ(session_.exams[0].exam_date, "2024-06-15");
    ASSERT_EQ(updated["exams"].size(), 1u);
    EXPECT_EQ(updated["exams"][0]["exam_date"], "2024-06-15");

    auto invalid = planner_.add_or_update_exam(session_, "Physics", "June 1st");
    EXPECT_EQ(invalid["error"], "InvalidDateError");
    EXPECT_EQ(session_.exams[0].exam_date, "2024-06-15");
}

TEST_F(StudyPlannerTest, ProfileOperations) {
    auto initial = planner_.get_profile(session_);
    EXPECT_TRUE(initial["is_default"].get<bool>());
    EXPECT_DOUBLE_EQ(initial["profile"]["session_profile"]["max_daily_deep_hours"].get<double>(), 6.0);

    LearnerProfile profile;
    profile.max_daily_deep_hours = 3.0;
    EXPECT_EQ(planner_.set_profile(session_, profile)["status"], "success");
    EXPECT_FALSE(planner_.get_profile(session_)["is_default"].get<bool>());

    planner_.update_subject_confidence(session_, "Physics", 1.4);
    EXPECT_DOUBLE_EQ(session_.learner_profile->subject_confidence["Physics"], 1.0);
    EXPECT_DOUBLE_EQ(session_.learner_profile->max_daily_deep_hours, 3.0);

    LearnerProfile broken;
    broken.max_session_time = 0.0;
    EXPECT_EQ(planner_.set_profile(session_, broken)["status"], "error");
}

TEST_F(StudyPlannerTest, ProfileLimitsDailyHours) {
    LearnerProfile profile;
    profile.max_daily_deep_hours = 2.0;
    profile.max_session_time = 1.0;
    planner_.set_profile(session_, profile);
    planner_.segment_and_weight(session_, PhysicsBook(), "Physics");

    planner_.allocate(session_, "2024-01-01", "2024-01-14");

    ASSERT_TRUE(session_.current_schedule.has_value());
    for (const auto& day : session_.current_schedule->days) {
        EXPECT_LE(day.total_hours, 2.0);
        for (const auto& s : day.sessions) {
            EXPECT_LE(s.duration_hours, 1.0);
        }
    }
}

TEST(SessionRegistryTest, IsolatesSessions) {
    SessionRegistry registry;
    StudyPlanner planner;

    registry.with_session("alice", [&](PlannerSession& s) {
        return planner.add_or_update_exam(s, "Physics", "2024-06-01");
    });
    size_t bob_exams = registry.with_session("bob", [](PlannerSession& s) { return s.exams.size(); });

    EXPECT_EQ(bob_exams, 0u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("alice"));
    EXPECT_TRUE(registry.erase("alice"));
    EXPECT_FALSE(registry.contains("alice"));
    EXPECT_FALSE(registry.erase("alice"));
}

TEST(SessionRegistryTest, SerializesSameSession) {
    SessionRegistry registry;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t]() {
            for (int i = 0; i < 100; ++i) {
                registry.with_session("shared", [t, i](PlannerSession& s) {
                    s.exams.push_back({"S" + std::to_string(t), "2024-01-01"});
                    return i;
                });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    size_t count = registry.with_session("shared", [](PlannerSession& s) { return s.exams.size(); });
    EXPECT_EQ(count, 400u);
}
