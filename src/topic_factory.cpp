#include "study_planner/topic_factory.h"
#include "study_planner/complexity_estimator.h"
#include "study_planner/text_utils.h"
#include <algorithm>
#include <cstdio>

namespace study_planner {

TopicFactory::TopicFactory(const SegmenterOptions& options) : options_(options) {}

std::string TopicFactory::document_fingerprint(const std::string& filename, int total_pages) {
    return short_hash(filename + "_" + std::to_string(total_pages));
}

std::string TopicFactory::topic_id(const std::string& fingerprint, size_t index) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "_%02zu", index);
    return fingerprint + buffer;
}

double TopicFactory::estimate_hours(int pages, double complexity) {
    // complexity factor spans 0.8 .. 1.4
    double hours = round_to(pages * kHoursPerPage * (0.5 + complexity), 1);
    return std::max(kMinHours, std::min(hours, kMaxHours));
}

std::vector<Topic> TopicFactory::create_topics(const std::vector<Section>& sections,
                                               const std::vector<std::string>& samples,
                                               const std::string& subject,
                                               const std::string& filename,
                                               int total_pages) const {
    std::vector<Topic> topics;
    topics.reserve(sections.size());
    const std::string fingerprint = document_fingerprint(filename, total_pages);

    for (size_t i = 0; i < sections.size(); ++i) {
        int start_page = sections[i].page;
        int end_page = i + 1 < sections.size() ? sections[i + 1].page - 1 : total_pages;
        end_page = std::max(start_page, end_page);
        int pages = std::max(1, end_page - start_page + 1);

        const std::string& sample = i < samples.size() ? samples[i] : std::string();
        double complexity = ComplexityEstimator::estimate(sample, subject);

        Topic topic;
        topic.id = topic_id(fingerprint, i);
        topic.subject = subject;
        topic.title = utf8_prefix(sections[i].title, options_.max_title_length);
        topic.start_page = start_page;
        topic.end_page = end_page;
        topic.estimated_hours = estimate_hours(pages, complexity);
        topic.complexity = round_to(complexity, 2);
        topics.push_back(std::move(topic));
    }

    return topics;
}

} // namespace study_planner
