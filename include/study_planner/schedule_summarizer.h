#pragma once

#include "study_planner/types.h"
#include <vector>

namespace study_planner {

class ScheduleSummarizer {
public:
    // Topics count as scheduled once they lost more than 0.1h of working time
    static ScheduleSummary summarize(const std::vector<Day>& days,
                                     const std::vector<WorkingTopic>& working,
                                     size_t total_topics);

    // Per-subject and total hours only, for a schedule without working state
    static ScheduleSummary summarize(const std::vector<Day>& days);
};

} // namespace study_planner
