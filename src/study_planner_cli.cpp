#include <study_planner/date.h>
#include <study_planner/json_serializer.h>
#include <study_planner/study_planner.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>
#include <getopt.h>
#include <fstream>

namespace fs = std::filesystem;
using namespace study_planner;

struct CLIOptions {
    std::vector<std::pair<std::string, std::string>> documents;  // subject, path
    std::vector<std::pair<std::string, std::string>> exams;      // subject, date
    std::string start_date;
    std::string end_date;
    int days = 0;
    std::string profile_file;
    double max_daily = 0.0;    // 0 = profile value
    double max_session = 0.0;  // 0 = profile value
    std::string policy = "proportional";
    std::string format = "markdown";
    std::string output_file;
    bool list_topics = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -d, --doc SUBJECT=FILE     Study material for a subject (repeatable)\n";
    std::cout << "  -e, --end DATE             Last study day (YYYY-MM-DD), or use --days\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -s, --start DATE           First study day (default: today)\n";
    std::cout << "  --days N                   Plan N days starting at --start\n";
    std::cout << "  -p, --profile FILE         Learner profile JSON\n";
    std::cout << "  --max-daily HOURS          Daily study budget (default: 6.0)\n";
    std::cout << "  --max-session HOURS        Longest single session (default: 1.5)\n";
    std::cout << "  --exam SUBJECT=DATE        Record an exam date (repeatable)\n";
    std::cout << "  --policy NAME              proportional | round-robin (default: proportional)\n";
    std::cout << "  -f, --format NAME          markdown | csv | json (default: markdown)\n";
    std::cout << "  -o, --output FILE          Output file (default: study_schedule.<ext>)\n";
    std::cout << "  --list-topics              Print extracted topics and stop\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -d Physics=physics.pdf -e 2024-12-20\n";
    std::cout << "  " << program_name << " -d Physics=phys.pdf -d Math=calc.pdf --days 14 -f csv\n";
    std::cout << "  " << program_name << " --doc Chemistry=notes.pdf --list-topics\n";
}

void print_version() {
    std::cout << "study-planner version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, and nlohmann/json\n";
}

std::pair<std::string, std::string> split_assignment(const std::string& value, const char* flag) {
    size_t pos = value.find('=');
    if (pos == std::string::npos || pos == 0 || pos + 1 == value.size()) {
        throw std::invalid_argument(std::string(flag) + " expects SUBJECT=VALUE, got '" + value + "'");
    }
    return {value.substr(0, pos), value.substr(pos + 1)};
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "d:s:e:p:f:o:vqh";
    const struct option long_opts[] = {
        {"doc", required_argument, nullptr, 'd'},
        {"start", required_argument, nullptr, 's'},
        {"end", required_argument, nullptr, 'e'},
        {"days", required_argument, nullptr, 1001},
        {"profile", required_argument, nullptr, 'p'},
        {"max-daily", required_argument, nullptr, 1002},
        {"max-session", required_argument, nullptr, 1003},
        {"exam", required_argument, nullptr, 1004},
        {"policy", required_argument, nullptr, 1005},
        {"format", required_argument, nullptr, 'f'},
        {"output", required_argument, nullptr, 'o'},
        {"list-topics", no_argument, nullptr, 1006},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1007},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'd':
                options.documents.push_back(split_assignment(optarg, "--doc"));
                break;
            case 's':
                options.start_date = optarg;
                break;
            case 'e':
                options.end_date = optarg;
                break;
            case 1001:  // days
                options.days = std::stoi(optarg);
                if (options.days <= 0) {
                    throw std::invalid_argument("days must be positive");
                }
                break;
            case 'p':
                options.profile_file = optarg;
                break;
            case 1002:  // max-daily
                options.max_daily = std::stod(optarg);
                if (options.max_daily <= 0.0) {
                    throw std::invalid_argument("max-daily must be positive");
                }
                break;
            case 1003:  // max-session
                options.max_session = std::stod(optarg);
                if (options.max_session <= 0.0) {
                    throw std::invalid_argument("max-session must be positive");
                }
                break;
            case 1004:  // exam
                options.exams.push_back(split_assignment(optarg, "--exam"));
                break;
            case 1005:  // policy
                options.policy = optarg;
                break;
            case 'f':
                options.format = optarg;
                break;
            case 'o':
                options.output_file = optarg;
                break;
            case 1006:  // list-topics
                options.list_topics = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1007:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.documents.empty()) {
        throw std::invalid_argument("At least one --doc SUBJECT=FILE is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.start_date.empty()) {
        options.start_date = Date::today().to_string();
    }

    if (!options.list_topics) {
        if (options.end_date.empty() && options.days == 0) {
            throw std::invalid_argument("Either --end or --days is required");
        }
        if (!options.end_date.empty() && options.days > 0) {
            throw std::invalid_argument("Cannot use both --end and --days");
        }
        if (options.days > 0) {
            options.end_date = Date::parse(options.start_date).add_days(options.days - 1).to_string();
        }
    }

    // Default output next to the first document
    if (options.output_file.empty()) {
        fs::path input_path(options.documents.front().second);
        fs::path output_dir = input_path.parent_path();
        if (output_dir.empty()) {
            output_dir = ".";
        }
        ExportFormat format = ScheduleExporter::parse_format(options.format);
        options.output_file = (output_dir / (std::string("study_schedule") +
                                             ScheduleExporter::file_extension(format))).string();
    }

    return options;
}

void check_result(const nlohmann::json& result, const std::string& step) {
    if (result.value("status", "") != "success") {
        throw std::runtime_error(step + " failed: " + result.value("error", "") +
                                 " - " + result.value("message", ""));
    }
}

void print_topics(const nlohmann::json& listing) {
    std::cout << "\n=== Topics ===\n";
    for (const auto& [subject, entry] : listing["by_subject"].items()) {
        std::cout << subject << " (" << entry["total_hours"].get<double>() << "h)\n";
        for (const auto& topic : entry["topics"]) {
            std::cout << "  " << std::setw(14) << std::left << topic["topic_id"].get<std::string>()
                      << std::right << std::setw(5) << topic["hours"].get<double>() << "h  "
                      << topic["title"].get<std::string>() << "\n";
        }
    }
    std::cout << "Total: " << listing["total_topics"].get<size_t>() << " topics, "
              << listing["total_hours"].get<double>() << " hours\n";
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        PlannerOptions planner_opts;
        planner_opts.load.verbose = options.verbose;
        planner_opts.segmenter.verbose = options.verbose;
        planner_opts.allocator.verbose = options.verbose;
        planner_opts.allocator.policy = parse_policy(options.policy);

        StudyPlanner planner(planner_opts);
        PlannerSession session;

        if (!options.profile_file.empty()) {
            LearnerProfile profile = JsonSerializer::load_profile(options.profile_file);
            check_result(planner.set_profile(session, profile), "Loading profile");
        }
        if (options.max_daily > 0.0 || options.max_session > 0.0) {
            LearnerProfile profile = session.profile_or_default();
            if (options.max_daily > 0.0) profile.max_daily_deep_hours = options.max_daily;
            if (options.max_session > 0.0) profile.max_session_time = options.max_session;
            check_result(planner.set_profile(session, profile), "Setting profile");
        }

        for (const auto& [subject, date] : options.exams) {
            check_result(planner.add_or_update_exam(session, subject, date), "Recording exam");
        }

        auto start = std::chrono::high_resolution_clock::now();

        for (const auto& [subject, path] : options.documents) {
            if (options.verbose) {
                std::cout << "Processing " << subject << ": " << path << "\n";
            }
            nlohmann::json result = planner.segment_and_weight(session, path, subject);
            check_result(result, "Processing " + path);
            if (!options.quiet) {
                std::cout << subject << ": " << result["message"].get<std::string>()
                          << " (" << result["pages"].get<int>() << " pages, "
                          << result["structure"].get<std::string>() << ")\n";
            }
        }

        if (options.list_topics) {
            print_topics(planner.list_topics(session));
            return 0;
        }

        nlohmann::json allocation = planner.allocate(session, options.start_date, options.end_date);
        check_result(allocation, "Scheduling");

        nlohmann::json exported = planner.export_schedule(session, options.format);
        check_result(exported, "Export");

        fs::path output_path(options.output_file);
        fs::path output_dir = output_path.parent_path();
        if (!output_dir.empty() && !fs::exists(output_dir)) {
            if (options.verbose) {
                std::cout << "Creating output directory: " << output_dir << "\n";
            }
            fs::create_directories(output_dir);
        }

        std::ofstream out(options.output_file);
        if (!out) {
            throw std::runtime_error("Cannot write output file: " + options.output_file);
        }
        out << exported["content"].get<std::string>();
        out.close();

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        const auto& summary = exported["summary"];
        if (!options.quiet) {
            std::cout << "\n=== Schedule Complete ===\n";
            std::cout << "Period: " << summary["period"].get<std::string>() << "\n";
            std::cout << "Study days: " << summary["study_days"].get<int>() << "\n";
            std::cout << "Total hours: " << summary["total_hours"].get<double>() << "\n";
            std::cout << "Topics scheduled: " << summary["topics_scheduled"].get<std::string>() << "\n";
            for (const auto& [subject, hours] : summary["hours_per_subject"].items()) {
                std::cout << "  " << std::setw(20) << std::left << subject << std::right
                          << std::fixed << std::setprecision(1) << hours.get<double>() << "h\n";
            }
            if (allocation["scale_factor"].get<double>() < 1.0) {
                std::cout << "Note: estimates scaled by " << std::setprecision(2)
                          << allocation["scale_factor"].get<double>() << " to fit the period\n";
            }
            std::cout << "Time: " << total_duration.count() << "ms\n";
            std::cout << "Output saved to: " << options.output_file << "\n";
        } else {
            std::cout << "SUCCESS|" << options.output_file << "|"
                      << summary["study_days"].get<int>() << "|"
                      << summary["total_hours"].get<double>() << "|"
                      << total_duration.count() << "\n";
        }

        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
