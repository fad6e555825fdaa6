#include <benchmark/benchmark.h>
#include <study_planner/allocator.h>
#include <study_planner/document_loader.h>
#include <study_planner/schedule_exporter.h>
#include <study_planner/structure_extractor.h>
#include <study_planner/topic_factory.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace study_planner;

// Real textbook for the load benchmark - provide your own
const std::string TEST_PDF_MEDIUM = "test_data/medium.pdf"; // ~100 pages

static LoadedDocument make_book(int pages, bool with_outline) {
    LoadedDocument doc("synthetic.pdf", {});
    for (int i = 1; i <= pages; ++i) {
        std::string text;
        if (i % 12 == 1) {
            text += "Chapter " + std::to_string(i / 12 + 1) + " Generated Material\n";
        }
        for (int line = 0; line < 40; ++line) {
            text += "Line " + std::to_string(line) + ": velocity v = d / t is defined per unit time.\n";
        }
        doc.add_page(text);
        if (with_outline && i % 12 == 1) {
            doc.add_outline_entry({1, "Chapter " + std::to_string(i / 12 + 1), i});
        }
    }
    return doc;
}

static std::vector<Topic> make_topics(int count, int subjects) {
    std::vector<Topic> topics;
    for (int i = 0; i < count; ++i) {
        topics.push_back({"t" + std::to_string(i), "Subject " + std::to_string(i % subjects),
                          "Topic " + std::to_string(i), 1, 10, 0.5 + (i % 9) * 0.45, 0.6});
    }
    return topics;
}

static void BM_StructureExtraction(benchmark::State& state) {
    LoadedDocument doc = make_book(static_cast<int>(state.range(0)), state.range(1) != 0);
    DocumentStructureExtractor extractor;

    for (auto _ : state) {
        auto structure = extractor.extract(doc);
        benchmark::DoNotOptimize(structure);
    }

    state.counters["pages"] = doc.page_count();
}
BENCHMARK(BM_StructureExtraction)->Ranges({{50, 800}, {0, 1}});

static void BM_TopicCreation(benchmark::State& state) {
    LoadedDocument doc = make_book(static_cast<int>(state.range(0)), true);
    DocumentStructureExtractor extractor;
    TopicFactory factory;
    auto structure = extractor.extract(doc);
    auto samples = extractor.sample_sections(doc, structure.sections);

    for (auto _ : state) {
        auto topics = factory.create_topics(structure.sections, samples, "Physics", doc.filename(), doc.page_count());
        benchmark::DoNotOptimize(topics);
    }
}
BENCHMARK(BM_TopicCreation)->Range(50, 800);

static void BM_Allocation(benchmark::State& state) {
    auto topics = make_topics(static_cast<int>(state.range(0)), 5);
    AllocatorOptions options;
    options.policy = state.range(1) == 0 ? AllocationPolicy::PROPORTIONAL_BUDGET
                                         : AllocationPolicy::ROUND_ROBIN_QUEUE;
    auto allocator = make_allocator(options);
    LearnerProfile profile;

    for (auto _ : state) {
        auto schedule = allocator->allocate(topics, profile, "2024-01-01", "2024-06-30");
        benchmark::DoNotOptimize(schedule);
    }

    state.counters["topics"] = topics.size();
}
BENCHMARK(BM_Allocation)->Ranges({{10, 1000}, {0, 1}});

static void BM_Export(benchmark::State& state) {
    auto topics = make_topics(200, 4);
    ProportionalBudgetAllocator allocator;
    Schedule schedule = allocator.allocate(topics, LearnerProfile{}, "2024-01-01", "2024-03-31");
    ExportFormat format = static_cast<ExportFormat>(state.range(0));

    for (auto _ : state) {
        auto content = ScheduleExporter::render(schedule, format);
        benchmark::DoNotOptimize(content);
    }

    state.counters["rows"] = ScheduleExporter::row_count(schedule);
}
BENCHMARK(BM_Export)->DenseRange(0, 2);

static void BM_DocumentLoad(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_MEDIUM)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    DocumentLoader loader;

    for (auto _ : state) {
        auto document = loader.load(TEST_PDF_MEDIUM);
        benchmark::DoNotOptimize(document);
    }

    auto stats = loader.get_stats();
    if (stats.contains("pages_per_second")) {
        state.counters["pages_per_second"] = stats["pages_per_second"].get<double>();
    }
}
BENCHMARK(BM_DocumentLoad);

BENCHMARK_MAIN();
