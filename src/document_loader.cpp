#include "study_planner/document_loader.h"
#include "study_planner/errors.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace study_planner {

DocumentLoader::DocumentLoader(const LoadOptions& options) : options_(options) {
    stats_["documents_loaded"] = 0;
    stats_["pages_loaded"] = 0;
    stats_["failed_pages"] = 0;
    stats_["total_processing_time_ms"] = 0;
}

std::string DocumentLoader::bare_filename(const std::string& file_path) {
    auto pos = file_path.find_last_of('/');
    return pos == std::string::npos ? file_path : file_path.substr(pos + 1);
}

bool DocumentLoader::is_supported(const std::string& filename) {
    if (filename.size() < 4) {
        return false;
    }
    std::string ext = filename.substr(filename.size() - 4);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".pdf";
}

LoadedDocument DocumentLoader::load(const std::string& file_path, const UploadedFiles& uploads) {
    auto start_time = std::chrono::high_resolution_clock::now();

    std::string filename = bare_filename(file_path);
    if (!is_supported(filename)) {
        throw UnsupportedFileError(filename);
    }

    TextExtractor extractor;
    ExtractedDocument extracted;

    try {
        auto upload = uploads.find(filename);
        if (upload != uploads.end()) {
            if (options_.verbose) {
                std::cout << "[DocumentLoader::load] Using uploaded " << filename
                          << " (" << upload->second.size() << " bytes)" << std::endl;
            }
            extracted = extractor.extract_document(filename, upload->second);
        } else {
            if (!std::filesystem::exists(file_path)) {
                throw DocumentLoadError("PDF file not found: " + file_path);
            }
            if (options_.verbose) {
                std::cout << "[DocumentLoader::load] Opening " << file_path << std::endl;
            }
            extracted = extractor.extract_document(file_path);
        }
    } catch (const PlannerError&) {
        throw;
    } catch (const std::exception& e) {
        throw DocumentLoadError(e.what());
    }

    LoadedDocument document = to_loaded(filename, extracted);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    stats_["documents_loaded"] = stats_["documents_loaded"].get<int>() + 1;
    stats_["pages_loaded"] = stats_["pages_loaded"].get<int>() + extracted.page_count;
    stats_["total_processing_time_ms"] = stats_["total_processing_time_ms"].get<int>() + static_cast<int>(duration.count());

    if (options_.verbose) {
        std::cout << "[DocumentLoader::load] " << filename << ": " << extracted.page_count
                  << " pages, " << document.outline().size() << " outline entries in "
                  << duration.count() << "ms" << std::endl;
    }

    return document;
}

LoadedDocument DocumentLoader::to_loaded(const std::string& filename, const ExtractedDocument& extracted) {
    std::vector<std::string> pages;
    pages.reserve(extracted.pages.size());

    for (const auto& page : extracted.pages) {
        if (!page.error.empty()) {
            stats_["failed_pages"] = stats_["failed_pages"].get<int>() + 1;
            std::cerr << "[DocumentLoader::load] Page " << page.page_number + 1 << " of "
                      << filename << " unreadable: " << page.error << std::endl;
        }
        pages.push_back(page.text);
    }

    return LoadedDocument(filename, std::move(pages), extracted.outline);
}

nlohmann::json DocumentLoader::get_stats() const {
    nlohmann::json stats = stats_;

    if (stats["documents_loaded"] > 0 && stats["total_processing_time_ms"] > 0) {
        double pages_per_second = static_cast<double>(stats["pages_loaded"]) /
                                  (static_cast<double>(stats["total_processing_time_ms"]) / 1000.0);
        stats["pages_per_second"] = pages_per_second;
    }

    return stats;
}

} // namespace study_planner
