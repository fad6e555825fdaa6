#pragma once

#include "study_planner/structure_extractor.h"
#include "study_planner/types.h"
#include <string>
#include <vector>

namespace study_planner {

class TopicFactory {
public:
    static constexpr double kHoursPerPage = 0.4;   // 25 minutes per page
    static constexpr double kMinHours = 0.5;
    static constexpr double kMaxHours = 8.0;

    explicit TopicFactory(const SegmenterOptions& options = SegmenterOptions{});

    // One Topic per section; samples are parallel to sections
    std::vector<Topic> create_topics(const std::vector<Section>& sections,
                                     const std::vector<std::string>& samples,
                                     const std::string& subject,
                                     const std::string& filename,
                                     int total_pages) const;

    static double estimate_hours(int pages, double complexity);

    // 8 hex characters derived from filename and page count
    static std::string document_fingerprint(const std::string& filename, int total_pages);
    static std::string topic_id(const std::string& fingerprint, size_t index);

private:
    SegmenterOptions options_;
};

} // namespace study_planner
