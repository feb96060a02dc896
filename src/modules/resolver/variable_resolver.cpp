// modules/resolver/variable_resolver.cpp
#include "modules/resolver/variable_resolver.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace canvasflow {

PatternVariableResolver::PatternVariableResolver()
    : PatternVariableResolver(DEFAULT_PATTERN) {}

PatternVariableResolver::PatternVariableResolver(const std::string& pattern) {
    try {
        pattern_ = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::runtime_error("Invalid variable pattern '" + pattern + "': " + e.what());
    }
    if (pattern_.mark_count() == 0) {
        throw std::runtime_error("Variable pattern needs a capture group for the block number: " + pattern);
    }
}

BlockNumber PatternVariableResolver::captured_number(const std::smatch& match) {
    for (size_t i = 1; i < match.size(); ++i) {
        if (match[i].matched) {
            return match[i].str();
        }
    }
    return {};
}

std::vector<VariableReference> PatternVariableResolver::parse_variables(const std::string& prompt_template) const {
    std::vector<VariableReference> references;
    auto begin = std::sregex_iterator(prompt_template.begin(), prompt_template.end(), pattern_);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        VariableReference ref;
        ref.variable = match.str(0);
        ref.block_number = captured_number(match);
        ref.begin = static_cast<size_t>(match.position(0));
        ref.end = ref.begin + static_cast<size_t>(match.length(0));
        references.push_back(std::move(ref));
    }
    return references;
}

std::string PatternVariableResolver::resolve(const std::string& prompt_template, const UpstreamData& upstream) const {
    std::string resolved;
    resolved.reserve(prompt_template.size());

    size_t cursor = 0;
    for (const auto& ref : parse_variables(prompt_template)) {
        resolved.append(prompt_template, cursor, ref.begin - cursor);
        auto it = upstream.find(ref.block_number);
        resolved += (it != upstream.end()) ? it->second : ref.variable;
        cursor = ref.end;
    }
    resolved.append(prompt_template, cursor, std::string::npos);
    return resolved;
}

std::vector<ValidationError> PatternVariableResolver::validate(
    const std::string& prompt_template,
    const std::vector<BlockNumber>& available_numbers) const {

    std::unordered_set<BlockNumber> available(available_numbers.begin(), available_numbers.end());
    std::vector<ValidationError> errors;
    for (const auto& ref : parse_variables(prompt_template)) {
        if (available.count(ref.block_number) == 0) {
            errors.push_back({
                ValidationErrorType::INVALID_VARIABLE,
                "Variable " + ref.variable + " references unavailable block " + ref.block_number,
                std::nullopt,
                std::nullopt
            });
        }
    }
    return errors;
}

bool PatternVariableResolver::has_variables(const std::string& prompt_template) const {
    return std::regex_search(prompt_template, pattern_);
}

std::vector<BlockNumber> PatternVariableResolver::unique_variables(const std::string& prompt_template) const {
    std::vector<BlockNumber> numbers;
    for (auto& ref : parse_variables(prompt_template)) {
        numbers.push_back(std::move(ref.block_number));
    }
    std::sort(numbers.begin(), numbers.end());
    numbers.erase(std::unique(numbers.begin(), numbers.end()), numbers.end());
    return numbers;
}

} // namespace canvasflow
