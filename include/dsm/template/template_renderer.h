#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <dsm/core/types.h>

namespace dsm::templating {

// Variable name -> value used to resolve ***NAME*** placeholders.
using SubstitutionContext = std::map<std::string, std::string>;

struct Template {
    std::string name; // e.g. "mysql/start"
    std::string text;
};

/**
 * Replace every ***NAME*** placeholder (NAME matching [A-Z_][A-Z0-9_]*) with
 * its value from the context.
 *
 * Pure literal substitution: values are inserted verbatim and never rescanned.
 * Fails with MissingVariable on the first placeholder that has no binding.
 */
Result<std::string> render(const Template& tmpl, const SubstitutionContext& context);

// Distinct placeholder names referenced by the template, in order of first use.
std::vector<std::string> placeholders(const Template& tmpl);

/**
 * Read-only template store.
 *
 * A template named "stack/file" is read from <overrideDir>/stack/file.template
 * when that file exists, otherwise from the built-in set. Each template is
 * loaded at most once per library instance.
 */
class TemplateLibrary {
public:
    TemplateLibrary() = default;
    explicit TemplateLibrary(std::filesystem::path overrideDir)
        : overrideDir_(std::move(overrideDir)) {}

    Result<Template> get(const std::string& name) const;

    const std::filesystem::path& overrideDir() const { return overrideDir_; }

private:
    std::filesystem::path overrideDir_;
    mutable std::map<std::string, Template> cache_;
};

} // namespace dsm::templating
