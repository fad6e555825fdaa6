#include "study_planner/schedule_exporter.h"
#include "study_planner/json_types.h"
#include "study_planner/text_utils.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace study_planner {

namespace {

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string csv_field(const std::string& text) {
    std::string field = text;
    std::replace(field.begin(), field.end(), ',', ';');
    std::replace(field.begin(), field.end(), '\n', ' ');
    return field;
}

std::string markdown_cell(const std::string& text) {
    return replace_all(text, "|", "\\|");
}

std::string format_hours(double hours) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << hours;
    return out.str();
}

std::string format_duration(const Session& session) {
    if (session.duration_hours >= 1.0) {
        return format_hours(session.duration_hours) + "h";
    }
    return std::to_string(session.duration_minutes()) + "m";
}

} // namespace

std::string ScheduleExporter::to_csv(const Schedule& schedule) {
    std::ostringstream out;
    out << "Date,Day,Start,End,Subject,Topic,Minutes\n";

    for (const auto& day : schedule.days) {
        for (const auto& session : day.sessions) {
            out << day.date << ','
                << day.weekday << ','
                << session.start_time() << ','
                << session.end_time() << ','
                << csv_field(session.subject) << ','
                << csv_field(utf8_prefix(session.title, 50)) << ','
                << session.duration_minutes() << '\n';
        }
    }

    return out.str();
}

std::string ScheduleExporter::to_markdown(const Schedule& schedule) {
    const auto& summary = schedule.summary;
    std::ostringstream out;

    out << "# Study Schedule\n\n";
    out << "**Period:** " << schedule.start_date << " to " << schedule.end_date << "\n";
    out << "**Total Time:** " << format_hours(summary.total_study_hours) << " hours across "
        << summary.study_days << " days\n";
    out << "**Topics:** " << summary.topics_scheduled << "/" << summary.total_topics << "\n\n";

    // hours_per_subject is an ordered map, so rows come out sorted by subject
    out << "## Hours by Subject\n\n";
    out << "| Subject | Hours | Minutes |\n";
    out << "|---------|------:|--------:|\n";
    for (const auto& [subject, hours] : summary.hours_per_subject) {
        out << "| " << markdown_cell(subject) << " | " << format_hours(hours) << " | "
            << std::lround(hours * 60.0) << " |\n";
    }

    out << "\n## Daily Plan\n\n";

    for (const auto& day : schedule.days) {
        out << "### " << day.weekday << ", " << day.date << " (" << format_hours(day.total_hours) << "h)\n\n";
        out << "| Time | Subject | Topic | Duration |\n";
        out << "|------|---------|-------|----------|\n";

        for (const auto& session : day.sessions) {
            std::string title = utf8_length(session.title) > 40
                ? utf8_prefix(session.title, 40) + "..."
                : session.title;
            out << "| " << session.start_time() << " | " << markdown_cell(session.subject)
                << " | " << markdown_cell(title) << " | " << format_duration(session) << " |\n";
        }

        out << "\n";
    }

    return out.str();
}

std::string ScheduleExporter::to_json(const Schedule& schedule, bool pretty) {
    JsonBuilder builder;
    JsonDocument& doc = *builder.document();

    builder.add_string(doc, "schedule_id", schedule.id);
    builder.add_string(doc, "start_date", schedule.start_date);
    builder.add_string(doc, "end_date", schedule.end_date);

    JsonValue days(rapidjson::kArrayType);
    for (const auto& day : schedule.days) {
        JsonValue day_json(rapidjson::kObjectType);
        builder.add_string(day_json, "date", day.date);
        builder.add_string(day_json, "day_of_week", day.weekday);
        builder.add_number(day_json, "total_hours", day.total_hours);

        JsonValue sessions(rapidjson::kArrayType);
        for (const auto& session : day.sessions) {
            JsonValue session_json(rapidjson::kObjectType);
            builder.add_string(session_json, "topic_id", session.topic_id);
            builder.add_string(session_json, "subject", session.subject);
            builder.add_string(session_json, "title", session.title);
            builder.add_string(session_json, "start_time", session.start_time());
            builder.add_string(session_json, "end_time", session.end_time());
            builder.add_number(session_json, "duration_hours", session.duration_hours);
            builder.add_int(session_json, "duration_minutes", session.duration_minutes());
            builder.add_number(session_json, "complexity", session.complexity);
            sessions.PushBack(session_json, builder.allocator());
        }
        builder.add_member(day_json, "sessions", std::move(sessions));
        days.PushBack(day_json, builder.allocator());
    }
    builder.add_member(doc, "days", std::move(days));

    const auto& summary = schedule.summary;
    JsonValue summary_json(rapidjson::kObjectType);
    builder.add_number(summary_json, "total_study_hours", summary.total_study_hours);
    builder.add_int(summary_json, "study_days", summary.study_days);
    JsonValue per_subject(rapidjson::kObjectType);
    for (const auto& [subject, hours] : summary.hours_per_subject) {
        builder.add_number(per_subject, subject, hours);
    }
    builder.add_member(summary_json, "hours_per_subject", std::move(per_subject));
    builder.add_int(summary_json, "topics_scheduled", summary.topics_scheduled);
    builder.add_int(summary_json, "total_topics", summary.total_topics);
    builder.add_number(summary_json, "scale_factor", summary.scale_factor);
    builder.add_number(summary_json, "total_demand_hours", summary.total_demand_hours);
    builder.add_number(summary_json, "total_capacity_hours", summary.total_capacity_hours);
    builder.add_number(summary_json, "total_working_hours", summary.total_working_hours);
    builder.add_string(summary_json, "policy", summary.policy);
    builder.add_member(doc, "summary", std::move(summary_json));

    return builder.serialize(pretty);
}

std::string ScheduleExporter::render(const Schedule& schedule, ExportFormat format) {
    switch (format) {
        case ExportFormat::CSV: return to_csv(schedule);
        case ExportFormat::MARKDOWN: return to_markdown(schedule);
        case ExportFormat::JSON: return to_json(schedule, true);
    }
    throw std::invalid_argument("Unknown export format");
}

ExportFormat ScheduleExporter::parse_format(const std::string& name) {
    std::string lowered = to_lower(name);
    if (lowered == "csv") return ExportFormat::CSV;
    if (lowered == "markdown" || lowered == "md") return ExportFormat::MARKDOWN;
    if (lowered == "json") return ExportFormat::JSON;
    throw std::invalid_argument("Unknown export format: " + name + " (use csv, markdown or json)");
}

const char* ScheduleExporter::format_name(ExportFormat format) {
    switch (format) {
        case ExportFormat::CSV: return "csv";
        case ExportFormat::MARKDOWN: return "markdown";
        case ExportFormat::JSON: return "json";
    }
    return "unknown";
}

const char* ScheduleExporter::file_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::CSV: return ".csv";
        case ExportFormat::MARKDOWN: return ".md";
        case ExportFormat::JSON: return ".json";
    }
    return "";
}

size_t ScheduleExporter::row_count(const Schedule& schedule) {
    size_t rows = 0;
    for (const auto& day : schedule.days) {
        rows += day.sessions.size();
    }
    return rows;
}

} // namespace study_planner
