// modules/resolver/variable_resolver.h
#ifndef CANVASFLOW_MODULES_RESOLVER_VARIABLE_RESOLVER_H
#define CANVASFLOW_MODULES_RESOLVER_VARIABLE_RESOLVER_H

#include "core/types/graph.h"
#include "core/types/validation.h"
#include <regex>
#include <string>
#include <vector>

namespace canvasflow {

// Substitutes block-number references in prompt templates
class VariableResolver {
public:
    virtual ~VariableResolver() = default;

    // Must not throw for well-formed templates
    virtual std::string resolve(const std::string& prompt_template, const UpstreamData& upstream) const = 0;

    // One INVALID_VARIABLE error per reference outside `available_numbers`
    virtual std::vector<ValidationError> validate(const std::string& prompt_template,
                                                  const std::vector<BlockNumber>& available_numbers) const = 0;
};

struct VariableReference {
    std::string variable;     // full match, e.g. "[A01]"
    BlockNumber block_number; // e.g. "A01"
    size_t begin = 0;
    size_t end = 0;
};

// Regex-driven resolver. The default pattern accepts "[A01]" and "{A01}";
// a custom pattern takes its block number from the first matching capture group.
// Unresolved references are kept literally.
class PatternVariableResolver : public VariableResolver {
public:
    static constexpr const char* DEFAULT_PATTERN = R"(\[([A-Z][0-9]+)\]|\{([A-Z][0-9]+)\})";

    PatternVariableResolver();
    explicit PatternVariableResolver(const std::string& pattern);

    std::string resolve(const std::string& prompt_template, const UpstreamData& upstream) const override;
    std::vector<ValidationError> validate(const std::string& prompt_template,
                                          const std::vector<BlockNumber>& available_numbers) const override;

    std::vector<VariableReference> parse_variables(const std::string& prompt_template) const;
    bool has_variables(const std::string& prompt_template) const;
    // Sorted, without duplicates
    std::vector<BlockNumber> unique_variables(const std::string& prompt_template) const;

private:
    std::regex pattern_;

    static BlockNumber captured_number(const std::smatch& match);
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_RESOLVER_VARIABLE_RESOLVER_H
