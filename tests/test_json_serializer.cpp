#include <gtest/gtest.h>
#include <study_planner/json_serializer.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

class JsonSerializerTest : public ::testing::Test {
protected:
    study_planner::Topic CreateTopic(const std::string& title, double hours) {
        return {"1a2b3c4d_00", "Physics", title, 3, 9, hours, 0.65};
    }
};

TEST_F(JsonSerializerTest, TopicToJson) {
    auto json = study_planner::JsonSerializer::topic_to_json(CreateTopic("Kinematics", 2.5));

    EXPECT_EQ(json["topic_id"], "1a2b3c4d_00");
    EXPECT_EQ(json["subject"], "Physics");
    EXPECT_EQ(json["page_range"], nlohmann::json::array({3, 9}));
    EXPECT_DOUBLE_EQ(json["estimated_hours"].get<double>(), 2.5);
    EXPECT_DOUBLE_EQ(json["complexity"].get<double>(), 0.65);
}

TEST_F(JsonSerializerTest, DocumentAndExamToJson) {
    study_planner::Document document;
    document.id = "1a2b3c4d";
    document.filename = "physics.pdf";
    document.subject = "Physics";
    document.total_pages = 42;
    document.topic_ids = {"1a2b3c4d_00", "1a2b3c4d_01"};

    auto json = study_planner::JsonSerializer::document_to_json(document);
    EXPECT_EQ(json["doc_id"], "1a2b3c4d");
    EXPECT_EQ(json["filename"], "physics.pdf");
    EXPECT_EQ(json["total_pages"], 42);
    EXPECT_EQ(json["topics"], nlohmann::json::array({"1a2b3c4d_00", "1a2b3c4d_01"}));

    auto exam = study_planner::JsonSerializer::exam_to_json({"Physics", "2024-06-01"});
    EXPECT_EQ(exam["subject"], "Physics");
    EXPECT_EQ(exam["exam_date"], "2024-06-01");
}

TEST_F(JsonSerializerTest, ScheduleToJson) {
    study_planner::Schedule schedule;
    schedule.id = "deadbeef";
    schedule.start_date = "2024-01-01";
    schedule.end_date = "2024-01-02";
    study_planner::Day day;
    day.date = "2024-01-01";
    day.weekday = "Monday";
    day.sessions.push_back({"t", "Physics", "Waves", 13 * 60, 1.5, 0.6});
    day.total_hours = 1.5;
    schedule.days.push_back(day);
    schedule.summary.total_study_hours = 1.5;
    schedule.summary.study_days = 1;
    schedule.summary.hours_per_subject["Physics"] = 1.5;

    auto json = study_planner::JsonSerializer::schedule_to_json(schedule);

    EXPECT_EQ(json["schedule_id"], "deadbeef");
    ASSERT_EQ(json["days"].size(), 1u);
    EXPECT_EQ(json["days"][0]["day_of_week"], "Monday");
    EXPECT_EQ(json["days"][0]["sessions"][0]["start_time"], "13:00");
    EXPECT_DOUBLE_EQ(json["summary"]["hours_per_subject"]["Physics"].get<double>(), 1.5);
}

TEST_F(JsonSerializerTest, ProfileFromNestedJson) {
    nlohmann::json json = {
        {"session_profile", {{"max_daily_deep_hours", 4.0}, {"max_session_time", 1.0}}},
        {"chronotype", {{"peak_windows", {"09:00", "20:00"}}}},
        {"subject_confidence", {{"Physics", 0.8}, {"History", 1.7}, {"Math", -0.2}}}
    };

    auto profile = study_planner::JsonSerializer::profile_from_json(json);

    EXPECT_DOUBLE_EQ(profile.max_daily_deep_hours, 4.0);
    EXPECT_DOUBLE_EQ(profile.max_session_time, 1.0);
    EXPECT_EQ(profile.peak_windows, (std::vector<std::string>{"09:00", "20:00"}));
    EXPECT_DOUBLE_EQ(profile.subject_confidence["Physics"], 0.8);
    EXPECT_DOUBLE_EQ(profile.subject_confidence["History"], 1.0);
    EXPECT_DOUBLE_EQ(profile.subject_confidence["Math"], 0.0);
}

TEST_F(JsonSerializerTest, ProfileFromFlatJsonKeepsDefaults) {
    auto profile = study_planner::JsonSerializer::profile_from_json({{"max_session_time", 2.0}});

    EXPECT_DOUBLE_EQ(profile.max_daily_deep_hours, 6.0);
    EXPECT_DOUBLE_EQ(profile.max_session_time, 2.0);
    EXPECT_EQ(profile.peak_windows, (std::vector<std::string>{"17:00"}));
}

TEST_F(JsonSerializerTest, ProfileRoundTrip) {
    study_planner::LearnerProfile profile;
    profile.max_daily_deep_hours = 5.0;
    profile.subject_confidence["Chemistry"] = 0.3;

    auto json = study_planner::JsonSerializer::profile_to_json(profile);
    auto restored = study_planner::JsonSerializer::profile_from_json(json);

    EXPECT_DOUBLE_EQ(restored.max_daily_deep_hours, 5.0);
    EXPECT_DOUBLE_EQ(restored.subject_confidence["Chemistry"], 0.3);
}

TEST_F(JsonSerializerTest, LoadProfile) {
    const std::string path = (std::filesystem::temp_directory_path() / "study_planner_profile.json").string();
    {
        std::ofstream out(path);
        out << R"({"session_profile": {"max_daily_deep_hours": 3.5}})";
    }

    auto profile = study_planner::JsonSerializer::load_profile(path);
    EXPECT_DOUBLE_EQ(profile.max_daily_deep_hours, 3.5);
    std::remove(path.c_str());

    EXPECT_THROW(study_planner::JsonSerializer::load_profile("missing_profile.json"), std::runtime_error);
}

TEST_F(JsonSerializerTest, TopicPreview) {
    std::vector<study_planner::Topic> topics;
    for (int i = 0; i < 20; ++i) {
        topics.push_back(CreateTopic("Topic " + std::to_string(i), 1.5));
    }

    auto preview = study_planner::JsonSerializer::topic_preview(topics);

    ASSERT_EQ(preview.size(), 15u);
    EXPECT_EQ(preview[0], "Topic 0 (1.5h)");
    EXPECT_EQ(study_planner::JsonSerializer::topic_preview(topics, 3).size(), 3u);
}
