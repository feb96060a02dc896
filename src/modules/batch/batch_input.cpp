// modules/batch/batch_input.cpp
#include "modules/batch/batch_input.h"
#include "common/utils/logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace canvasflow {

namespace fs = std::filesystem;

namespace {

std::string lower_extension(const std::string& file_name) {
    std::string ext = fs::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}


std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

} // namespace

BatchInputLoader::BatchInputLoader(BatchInputLimits limits)
    : limits_(std::move(limits)) {}

std::optional<BatchFileType> BatchInputLoader::classify(const std::string& file_name) const {
    auto ext = lower_extension(file_name);
    auto matches = [&ext](const std::vector<std::string>& list) {
        return std::find(list.begin(), list.end(), ext) != list.end();
    };
    if (matches(limits_.text_extensions)) return BatchFileType::TEXT;
    if (matches(limits_.image_extensions)) return BatchFileType::IMAGE;
    return std::nullopt;
}

bool BatchInputLoader::is_supported(const std::string& file_name) const {
    return classify(file_name).has_value();
}

std::vector<std::string> BatchInputLoader::split_text(const std::string& content, const std::string& delimiter) {
    std::vector<std::string> items;
    if (!delimiter.empty() && content.find(delimiter) != std::string::npos) {
        size_t start = 0;
        while (true) {
            size_t pos = content.find(delimiter, start);
            auto piece = trim(content.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
            if (!piece.empty()) {
                items.push_back(std::move(piece));
            }
            if (pos == std::string::npos) break;
            start = pos + delimiter.size();
        }
        return items;
    }

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        auto piece = trim(line);
        if (!piece.empty()) {
            items.push_back(std::move(piece));
        }
    }
    return items;
}

std::vector<FileInput> BatchInputLoader::scan_folder(const std::string& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        throw std::runtime_error("Batch folder not found: " + path);
    }

    std::vector<FileInput> files;
    for (const auto& entry : fs::directory_iterator(path)) {
        if (!entry.is_regular_file()) continue;
        auto name = entry.path().filename().string();
        auto type = classify(name);
        if (!type) {
            Logger::debug("BatchInputLoader", "Skipping unsupported file " + name);
            continue;
        }
        FileInput input;
        input.name = name;
        input.path = entry.path().string();
        input.type = *type;
        input.size = static_cast<size_t>(entry.file_size());
        files.push_back(std::move(input));
    }
    std::sort(files.begin(), files.end(),
              [](const FileInput& a, const FileInput& b) { return a.name < b.name; });
    return files;
}

std::string BatchInputLoader::read_file(const std::string& path) const {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot read batch file: " + path);
    }
    if (size > limits_.max_file_size) {
        throw std::runtime_error("Batch file exceeds size limit: " + path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open batch file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::vector<BatchItem> BatchInputLoader::load(const BatchInputSource& source) const {
    std::vector<FileInput> files = source.type == BatchSourceType::FOLDER
        ? scan_folder(source.path)
        : source.files;

    std::vector<BatchItem> items;
    for (const auto& file : files) {
        if (file.type == BatchFileType::IMAGE) {
            BatchItem item;
            item.data = file.path.empty() ? file.content : file.path;
            item.source = file.name;
            items.push_back(std::move(item));
            continue;
        }

        if (file.content.size() > limits_.max_file_size) {
            throw std::runtime_error("Batch file exceeds size limit: " + file.name);
        }
        const std::string content = file.content.empty() ? read_file(file.path) : file.content;
        for (auto& piece : split_text(content, source.delimiter)) {
            BatchItem item;
            item.data = std::move(piece);
            item.source = file.name;
            items.push_back(std::move(item));
        }
    }

    if (items.empty()) {
        throw std::runtime_error("Batch input produced no items");
    }
    for (size_t i = 0; i < items.size(); ++i) {
        items[i].index = i;
        items[i].total = items.size();
    }
    log_fmt(LogLevel::INFO, "BatchInputLoader", "Loaded ", items.size(), " items from ", files.size(), " files");
    return items;
}

std::string apply_batch_placeholders(
    const std::string& prompt,
    const BatchItem& item,
    bool append_if_unused,
    std::chrono::system_clock::time_point now) {

    const std::string number = std::to_string(item.index + 1);
    const std::string total = std::to_string(item.total);
    const std::unordered_map<std::string, std::string> values = {
        {"data", item.data},
        {"input", item.data},
        {"batch", item.data},
        {"content", item.data},
        {"index", number},
        {"number", number},
        {"total", total},
        {"count", total},
        {"progress", std::to_string(item.total == 0 ? 0 : (item.index + 1) * 100 / item.total) + "%"},
        {"datetime", format_time(now, "%Y-%m-%d %H:%M:%S")},
        {"date", format_time(now, "%Y-%m-%d")},
        {"time", format_time(now, "%H:%M:%S")},
    };

    // Single pass: substituted text is never scanned again.
    std::string result;
    result.reserve(prompt.size());
    size_t replaced = 0;
    size_t pos = 0;
    while (pos < prompt.size()) {
        const size_t open = prompt.find('{', pos);
        if (open == std::string::npos) {
            result.append(prompt, pos, std::string::npos);
            break;
        }
        result.append(prompt, pos, open - pos);
        const size_t close = prompt.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(prompt, open, std::string::npos);
            break;
        }
        auto it = values.find(prompt.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            result += '{';
            pos = open + 1;
            continue;
        }
        result += it->second;
        pos = close + 1;
        ++replaced;
    }

    if (replaced == 0 && append_if_unused) {
        result += "\n\n" + item.data;
    }
    return result;
}

} // namespace canvasflow
