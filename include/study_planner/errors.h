#pragma once

#include <stdexcept>
#include <string>

namespace study_planner {

// Base for every recoverable planner failure. kind() is the stable name
// reported to collaborators in error results.
class PlannerError : public std::runtime_error {
public:
    PlannerError(const std::string& kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

class InvalidDateError : public PlannerError {
public:
    explicit InvalidDateError(const std::string& message)
        : PlannerError("InvalidDateError", message) {}
};

class NoTopicsError : public PlannerError {
public:
    NoTopicsError()
        : PlannerError("NoTopicsError", "No topics found. Process documents first.") {}
};

class NoScheduleError : public PlannerError {
public:
    NoScheduleError()
        : PlannerError("NoScheduleError", "No schedule found. Generate a schedule first.") {}
};

class TooManyTopicsError : public PlannerError {
public:
    TooManyTopicsError(size_t count, size_t limit)
        : PlannerError("TooManyTopicsError",
                       "Topic collection has " + std::to_string(count) +
                       " topics, limit is " + std::to_string(limit)) {}
};

class UnsupportedFileError : public PlannerError {
public:
    explicit UnsupportedFileError(const std::string& filename)
        : PlannerError("UnsupportedFileError", "Not a PDF: " + filename) {}
};

class DocumentLoadError : public PlannerError {
public:
    explicit DocumentLoadError(const std::string& message)
        : PlannerError("DocumentLoadError", message) {}
};

} // namespace study_planner
