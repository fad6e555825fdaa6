#pragma once

#include "study_planner/date.h"
#include "study_planner/types.h"
#include <memory>
#include <string>
#include <vector>

namespace study_planner {

enum class AllocationPolicy {
    PROPORTIONAL_BUDGET,
    ROUND_ROBIN_QUEUE
};

struct AllocatorOptions {
    AllocationPolicy policy = AllocationPolicy::PROPORTIONAL_BUDGET;
    size_t max_topics = 1000;
    int iteration_cap_factor = 3;
    int day_start_minute = 8 * 60;
    int lunch_start_minute = 12 * 60;
    int lunch_end_minute = 13 * 60;
    int buffer_minutes = 15;
    double min_session_hours = 0.25;
    double max_scale = 1.5;
    bool verbose = false;
};

// Wall clock for one study day. Sessions never start inside or run into the
// lunch window; each session is followed by a fixed buffer.
class DayClock {
public:
    explicit DayClock(const AllocatorOptions& options);

    // Returns the session start and advances past duration + buffer
    int place(int duration_minutes);
    int now() const { return minute_; }

private:
    int minute_;
    int lunch_start_;
    int lunch_end_;
    int buffer_;
};

// Distributes topics across a date range. Subclasses supply the per-day
// packing policy; validation, demand scaling and summary are shared.
class Allocator {
public:
    explicit Allocator(const AllocatorOptions& options = AllocatorOptions{});
    virtual ~Allocator() = default;

    // Throws NoTopicsError, InvalidDateError, TooManyTopicsError
    Schedule allocate(const std::vector<Topic>& topics,
                      const LearnerProfile& profile,
                      const std::string& start_date,
                      const std::string& end_date) const;

    virtual const char* name() const = 0;

    const AllocatorOptions& options() const { return options_; }

    // min(max_scale, capacity / demand), 1 when there is no demand
    static double compute_scale(double demand_hours, double capacity_hours, double max_scale);
    static std::vector<WorkingTopic> make_working_topics(const std::vector<Topic>& topics, double scale);

    // Whole minutes, rounded to nearest; 0 for non-positive hours
    static int to_minutes(double hours);
    static std::string schedule_id(const std::string& start_date, const std::string& end_date);

protected:
    struct DayLimits {
        int day_minutes;
        int session_minutes;
        int min_minutes;
    };

    virtual std::vector<Day> pack_days(std::vector<WorkingTopic>& working,
                                       const DayLimits& limits,
                                       const Date& start,
                                       const Date& end) const = 0;

    Session make_session(const WorkingTopic& item, int start_minute, int minutes) const;
    static Day make_day(const Date& date, std::vector<Session> sessions, int day_minutes);

    AllocatorOptions options_;
};

// Canonical policy: each day's capacity is split between subjects in
// proportion to their outstanding hours and packed by repeated sweeps.
class ProportionalBudgetAllocator : public Allocator {
public:
    explicit ProportionalBudgetAllocator(const AllocatorOptions& options = AllocatorOptions{});

    const char* name() const override { return "proportional"; }

    // round(outstanding / total * day_hours, 2) per subject
    static std::vector<double> daily_budgets(const std::vector<double>& outstanding, double day_hours);

protected:
    std::vector<Day> pack_days(std::vector<WorkingTopic>& working,
                               const DayLimits& limits,
                               const Date& start,
                               const Date& end) const override;
};

// Alternate policy: one queue interleaving subjects, topics re-queued at the
// back after each session.
class RoundRobinQueueAllocator : public Allocator {
public:
    explicit RoundRobinQueueAllocator(const AllocatorOptions& options = AllocatorOptions{});

    const char* name() const override { return "round-robin"; }

protected:
    std::vector<Day> pack_days(std::vector<WorkingTopic>& working,
                               const DayLimits& limits,
                               const Date& start,
                               const Date& end) const override;
};

std::unique_ptr<Allocator> make_allocator(const AllocatorOptions& options);

AllocationPolicy parse_policy(const std::string& name);

} // namespace study_planner
