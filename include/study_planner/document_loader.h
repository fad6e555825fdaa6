#pragma once

#include "study_planner/page_source.h"
#include "study_planner/text_extractor.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace study_planner {

struct LoadOptions {
    bool verbose = false;
};

// Uploaded file blobs keyed by bare filename
using UploadedFiles = std::map<std::string, std::vector<unsigned char>>;

// Turns a file identifier into a LoadedDocument. A blob uploaded under the
// same bare filename wins over the filesystem path.
class DocumentLoader {
public:
    explicit DocumentLoader(const LoadOptions& options = LoadOptions{});

    LoadedDocument load(const std::string& file_path,
                        const UploadedFiles& uploads = UploadedFiles{});

    // Loader statistics
    nlohmann::json get_stats() const;

    static std::string bare_filename(const std::string& file_path);
    static bool is_supported(const std::string& filename);

private:
    LoadedDocument to_loaded(const std::string& filename, const ExtractedDocument& extracted);

    LoadOptions options_;
    nlohmann::json stats_;
};

} // namespace study_planner
