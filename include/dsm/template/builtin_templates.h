#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsm::templating {

// Template text compiled into the library, keyed "stack/file".
std::optional<std::string_view> findBuiltinTemplate(const std::string& name);

// Names of all built-in templates, sorted.
std::vector<std::string> builtinTemplateNames();

} // namespace dsm::templating
