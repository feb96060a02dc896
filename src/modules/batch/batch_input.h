// modules/batch/batch_input.h
#ifndef CANVASFLOW_MODULES_BATCH_BATCH_INPUT_H
#define CANVASFLOW_MODULES_BATCH_BATCH_INPUT_H

#include "core/types/execution.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace canvasflow {

// One unit of batch data; each item drives one full run of the graph
struct BatchItem {
    std::string data;   // text content, or the file path for images
    size_t index = 0;   // 0-based
    size_t total = 1;
    std::string source; // originating file name
};

struct BatchInputLimits {
    std::vector<std::string> text_extensions = {".txt", ".md", ".csv"};
    std::vector<std::string> image_extensions = {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp"};
    uintmax_t max_file_size = 50ull * 1024 * 1024;
};

class BatchInputLoader {
public:
    explicit BatchInputLoader(BatchInputLimits limits = {});

    // Items in file-name order, then in order of appearance inside each file.
    // Throws std::runtime_error for a missing folder, an oversized or
    // unreadable file, or a source that yields no items.
    std::vector<BatchItem> load(const BatchInputSource& source) const;

    // Splits on `delimiter`; falls back to one item per non-empty line when
    // the delimiter does not occur. Items are trimmed and empty ones dropped.
    static std::vector<std::string> split_text(const std::string& content, const std::string& delimiter);

    bool is_supported(const std::string& file_name) const;
    std::optional<BatchFileType> classify(const std::string& file_name) const;

private:
    std::vector<FileInput> scan_folder(const std::string& path) const;
    std::string read_file(const std::string& path) const;

    BatchInputLimits limits_;
};

// Replaces {data} {input} {batch} {content} {index} {number} {total} {count}
// {progress} {date} {time} {datetime}. When no placeholder is present and
// `append_if_unused` is set, the item is appended on a new paragraph.
std::string apply_batch_placeholders(
    const std::string& prompt,
    const BatchItem& item,
    bool append_if_unused,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_BATCH_BATCH_INPUT_H
