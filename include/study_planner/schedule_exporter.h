#pragma once

#include "study_planner/types.h"
#include <string>

namespace study_planner {

enum class ExportFormat {
    CSV,
    MARKDOWN,
    JSON
};

class ScheduleExporter {
public:
    static std::string to_csv(const Schedule& schedule);
    static std::string to_markdown(const Schedule& schedule);
    static std::string to_json(const Schedule& schedule, bool pretty = false);

    static std::string render(const Schedule& schedule, ExportFormat format);

    // "csv", "markdown"/"md", "json"; throws std::invalid_argument
    static ExportFormat parse_format(const std::string& name);
    static const char* format_name(ExportFormat format);
    static const char* file_extension(ExportFormat format);

    static size_t row_count(const Schedule& schedule);
};

} // namespace study_planner
