#include "study_planner/allocator.h"
#include "study_planner/errors.h"
#include "study_planner/schedule_summarizer.h"
#include "study_planner/text_utils.h"
#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace study_planner {

namespace {

int min_session_minutes(double min_session_hours) {
    return static_cast<int>(std::ceil(min_session_hours * 60.0 - 1e-9));
}

// Loop bound per day for either policy. Never binding for sane inputs; it
// only guarantees termination.
size_t iteration_cap(int factor, size_t queue_length, int day_minutes, int min_minutes) {
    size_t sessions_per_day = min_minutes > 0 ? static_cast<size_t>((day_minutes + min_minutes - 1) / min_minutes) : 0;
    return static_cast<size_t>(std::max(factor, 1)) * std::max<size_t>({queue_length, sessions_per_day, 1});
}

} // namespace

DayClock::DayClock(const AllocatorOptions& options)
    : minute_(options.day_start_minute),
      lunch_start_(options.lunch_start_minute),
      lunch_end_(options.lunch_end_minute),
      buffer_(options.buffer_minutes) {}

int DayClock::place(int duration_minutes) {
    int start = minute_;
    if (start < lunch_end_ && start + duration_minutes > lunch_start_) {
        start = lunch_end_;
    }
    minute_ = start + duration_minutes + buffer_;
    return start;
}

Allocator::Allocator(const AllocatorOptions& options) : options_(options) {}

double Allocator::compute_scale(double demand_hours, double capacity_hours, double max_scale) {
    if (demand_hours <= 0.0) {
        return 1.0;
    }
    return std::min(max_scale, capacity_hours / demand_hours);
}

int Allocator::to_minutes(double hours) {
    if (hours <= 0.0) {
        return 0;
    }
    return static_cast<int>(std::lround(hours * 60.0));
}

std::vector<WorkingTopic> Allocator::make_working_topics(const std::vector<Topic>& topics, double scale) {
    std::vector<WorkingTopic> working;
    working.reserve(topics.size());

    for (const auto& topic : topics) {
        // working hours are rounded to one decimal, i.e. a multiple of 6 minutes
        int minutes = static_cast<int>(std::lround(topic.estimated_hours * scale * 10.0)) * 6;
        working.push_back({&topic, minutes, minutes});
    }

    return working;
}

std::string Allocator::schedule_id(const std::string& start_date, const std::string& end_date) {
    return short_hash(start_date + "_" + end_date);
}

Session Allocator::make_session(const WorkingTopic& item, int start_minute, int minutes) const {
    Session session;
    session.topic_id = item.topic->id;
    session.subject = item.topic->subject;
    session.title = item.topic->title;
    session.start_minute = start_minute;
    session.duration_hours = minutes / 60.0;
    session.complexity = item.topic->complexity;
    return session;
}

Day Allocator::make_day(const Date& date, std::vector<Session> sessions, int day_minutes) {
    Day day;
    day.date = date.to_string();
    day.weekday = date.weekday_name();
    day.sessions = std::move(sessions);
    day.total_hours = day_minutes / 60.0;
    return day;
}

Schedule Allocator::allocate(const std::vector<Topic>& topics,
                             const LearnerProfile& profile,
                             const std::string& start_date,
                             const std::string& end_date) const {
    Date start = Date::parse(start_date);
    Date end = Date::parse(end_date);
    if (end < start) {
        throw InvalidDateError("End date " + end_date + " is before start date " + start_date);
    }
    if (topics.empty()) {
        throw NoTopicsError();
    }
    if (topics.size() > options_.max_topics) {
        throw TooManyTopicsError(topics.size(), options_.max_topics);
    }

    long total_days = start.days_until(end) + 1;
    double capacity = total_days * profile.max_daily_deep_hours;
    double demand = std::accumulate(topics.begin(), topics.end(), 0.0,
                                    [](double sum, const Topic& t) { return sum + t.estimated_hours; });
    double scale = compute_scale(demand, capacity, options_.max_scale);

    std::vector<WorkingTopic> working = make_working_topics(topics, scale);

    DayLimits limits;
    limits.day_minutes = to_minutes(profile.max_daily_deep_hours);
    limits.session_minutes = to_minutes(profile.max_session_time);
    limits.min_minutes = min_session_minutes(options_.min_session_hours);

    if (options_.verbose) {
        std::cout << "[Allocator::allocate] " << name() << ": " << topics.size() << " topics, "
                  << total_days << " days, demand " << demand << "h, capacity " << capacity
                  << "h, scale " << scale << std::endl;
    }

    Schedule schedule;
    schedule.id = schedule_id(start_date, end_date);
    schedule.start_date = start.to_string();
    schedule.end_date = end.to_string();
    schedule.days = pack_days(working, limits, start, end);

    schedule.summary = ScheduleSummarizer::summarize(schedule.days, working, topics.size());
    schedule.summary.scale_factor = scale;
    schedule.summary.total_demand_hours = round_to(demand, 1);
    schedule.summary.total_capacity_hours = round_to(capacity, 2);
    schedule.summary.policy = name();

    if (options_.verbose) {
        std::cout << "[Allocator::allocate] " << schedule.summary.study_days << " study days, "
                  << schedule.summary.total_study_hours << "h scheduled, "
                  << schedule.summary.topics_scheduled << "/" << schedule.summary.total_topics
                  << " topics" << std::endl;
    }

    return schedule;
}

ProportionalBudgetAllocator::ProportionalBudgetAllocator(const AllocatorOptions& options)
    : Allocator(options) {}

std::vector<double> ProportionalBudgetAllocator::daily_budgets(const std::vector<double>& outstanding,
                                                               double day_hours) {
    double total = std::accumulate(outstanding.begin(), outstanding.end(), 0.0);
    std::vector<double> budgets;
    budgets.reserve(outstanding.size());

    for (double hours : outstanding) {
        budgets.push_back(total > 0.0 ? round_to(hours / total * day_hours, 2) : 0.0);
    }

    return budgets;
}

std::vector<Day> ProportionalBudgetAllocator::pack_days(std::vector<WorkingTopic>& working,
                                                        const DayLimits& limits,
                                                        const Date& start,
                                                        const Date& end) const {
    // Subjects in first-appearance order, topics in document/section order
    std::vector<std::string> subjects;
    std::vector<std::vector<WorkingTopic*>> groups;
    for (auto& item : working) {
        auto it = std::find(subjects.begin(), subjects.end(), item.topic->subject);
        if (it == subjects.end()) {
            subjects.push_back(item.topic->subject);
            groups.emplace_back();
            groups.back().push_back(&item);
        } else {
            groups[it - subjects.begin()].push_back(&item);
        }
    }
    std::vector<size_t> cursor(subjects.size(), 0);

    const size_t max_sweeps = iteration_cap(options_.iteration_cap_factor, working.size(),
                                            limits.day_minutes, limits.min_minutes);
    std::vector<Day> days;

    const long total_days = start.days_until(end) + 1;
    for (long offset = 0; offset < total_days; ++offset) {
        const Date date = start.add_days(offset);
        std::vector<size_t> active;
        std::vector<int> outstanding(subjects.size(), 0);
        for (size_t s = 0; s < subjects.size(); ++s) {
            for (const WorkingTopic* item : groups[s]) {
                outstanding[s] += item->remaining_minutes;
            }
            if (outstanding[s] >= limits.min_minutes) {
                active.push_back(s);
            }
        }
        if (active.empty()) {
            break;
        }

        std::vector<double> active_hours;
        for (size_t s : active) {
            active_hours.push_back(outstanding[s] / 60.0);
        }
        std::vector<double> budget_hours = daily_budgets(active_hours, limits.day_minutes / 60.0);
        std::vector<int> budget(subjects.size(), 0);
        for (size_t i = 0; i < active.size(); ++i) {
            budget[active[i]] = to_minutes(budget_hours[i]);
        }

        std::stable_sort(active.begin(), active.end(),
                         [&outstanding](size_t a, size_t b) { return outstanding[a] > outstanding[b]; });

        std::vector<int> used(subjects.size(), 0);
        std::vector<Session> sessions;
        DayClock clock(options_);
        int day_used = 0;
        size_t sweeps = 0;
        bool progress = true;

        while (progress && day_used < limits.day_minutes && sweeps < max_sweeps) {
            progress = false;
            sweeps++;

            for (size_t s : active) {
                int day_left = limits.day_minutes - day_used;
                if (day_left < limits.min_minutes) {
                    break;
                }

                int budget_left = budget[s] - used[s];
                if (budget_left < limits.min_minutes) {
                    continue;
                }

                auto& group = groups[s];
                while (cursor[s] < group.size() && group[cursor[s]]->remaining_minutes < limits.min_minutes) {
                    cursor[s]++;
                }
                if (cursor[s] == group.size()) {
                    continue;
                }

                WorkingTopic& item = *group[cursor[s]];
                int length = std::min({limits.session_minutes, item.remaining_minutes, budget_left, day_left});
                if (length < limits.min_minutes) {
                    continue;
                }

                int start_minute = clock.place(length);
                sessions.push_back(make_session(item, start_minute, length));

                item.remaining_minutes -= length;
                day_used += length;
                used[s] += length;
                if (item.remaining_minutes < limits.min_minutes) {
                    cursor[s]++;
                }
                progress = true;
            }
        }

        if (sweeps >= max_sweeps && options_.verbose) {
            std::cout << "[ProportionalBudgetAllocator::pack_days] Iteration cap reached on "
                      << date.to_string() << std::endl;
        }

        if (!sessions.empty()) {
            days.push_back(make_day(date, std::move(sessions), day_used));
        }
    }

    return days;
}

RoundRobinQueueAllocator::RoundRobinQueueAllocator(const AllocatorOptions& options)
    : Allocator(options) {}

std::vector<Day> RoundRobinQueueAllocator::pack_days(std::vector<WorkingTopic>& working,
                                                     const DayLimits& limits,
                                                     const Date& start,
                                                     const Date& end) const {
    // Interleave subjects: first topic of each subject, then the second, ...
    std::vector<std::string> subjects;
    std::vector<std::vector<WorkingTopic*>> groups;
    for (auto& item : working) {
        auto it = std::find(subjects.begin(), subjects.end(), item.topic->subject);
        if (it == subjects.end()) {
            subjects.push_back(item.topic->subject);
            groups.push_back({&item});
        } else {
            groups[it - subjects.begin()].push_back(&item);
        }
    }

    std::deque<WorkingTopic*> queue;
    for (size_t round = 0; queue.size() < working.size(); ++round) {
        for (const auto& group : groups) {
            if (round < group.size()) {
                queue.push_back(group[round]);
            }
        }
    }

    std::vector<Day> days;

    const long total_days = start.days_until(end) + 1;
    for (long offset = 0; offset < total_days; ++offset) {
        const Date date = start.add_days(offset);
        while (!queue.empty() && queue.front()->remaining_minutes < limits.min_minutes) {
            queue.pop_front();
        }
        if (queue.empty()) {
            break;
        }

        const size_t max_passes = iteration_cap(options_.iteration_cap_factor, queue.size(),
                                                limits.day_minutes, limits.min_minutes);
        std::vector<Session> sessions;
        DayClock clock(options_);
        int day_used = 0;
        size_t passes = 0;

        while (!queue.empty() && limits.day_minutes - day_used >= limits.min_minutes && passes < max_passes) {
            passes++;
            WorkingTopic* item = queue.front();
            queue.pop_front();

            if (item->remaining_minutes < limits.min_minutes) {
                continue;
            }

            int length = std::min({limits.session_minutes, item->remaining_minutes, limits.day_minutes - day_used});
            if (length < limits.min_minutes) {
                queue.push_back(item);
                continue;
            }

            int start_minute = clock.place(length);
            sessions.push_back(make_session(*item, start_minute, length));
            item->remaining_minutes -= length;
            day_used += length;

            if (item->remaining_minutes >= limits.min_minutes) {
                queue.push_back(item);
            }
        }

        if (!sessions.empty()) {
            days.push_back(make_day(date, std::move(sessions), day_used));
        }
    }

    return days;
}

std::unique_ptr<Allocator> make_allocator(const AllocatorOptions& options) {
    switch (options.policy) {
        case AllocationPolicy::ROUND_ROBIN_QUEUE:
            return std::make_unique<RoundRobinQueueAllocator>(options);
        case AllocationPolicy::PROPORTIONAL_BUDGET:
            break;
    }
    return std::make_unique<ProportionalBudgetAllocator>(options);
}

AllocationPolicy parse_policy(const std::string& name) {
    std::string lowered = to_lower(name);
    if (lowered == "proportional" || lowered == "proportional-budget") {
        return AllocationPolicy::PROPORTIONAL_BUDGET;
    }
    if (lowered == "round-robin" || lowered == "round-robin-queue") {
        return AllocationPolicy::ROUND_ROBIN_QUEUE;
    }
    throw std::invalid_argument("Unknown allocation policy: " + name);
}

} // namespace study_planner
