#include <dsm/template/template_renderer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>

#include <dsm/template/builtin_templates.h>

namespace dsm::templating {

namespace {

constexpr std::string_view kDelimiter = "***";

bool isNameStart(char c) {
    return (c >= 'A' && c <= 'Z') || c == '_';
}

bool isNameChar(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

struct Placeholder {
    size_t begin;  // position of the opening delimiter
    size_t end;    // one past the closing delimiter
    std::string name;
};

// Next placeholder at or after pos. Stray "***" sequences are not placeholders.
std::optional<Placeholder> nextPlaceholder(const std::string& text, size_t pos) {
    while ((pos = text.find(kDelimiter, pos)) != std::string::npos) {
        size_t nameBegin = pos + kDelimiter.size();
        size_t nameEnd = nameBegin;
        if (nameEnd < text.size() && isNameStart(text[nameEnd])) {
            while (nameEnd < text.size() && isNameChar(text[nameEnd])) {
                ++nameEnd;
            }
            if (text.compare(nameEnd, kDelimiter.size(), kDelimiter) == 0) {
                return Placeholder{pos, nameEnd + kDelimiter.size(),
                                   text.substr(nameBegin, nameEnd - nameBegin)};
            }
        }
        ++pos;
    }
    return std::nullopt;
}

} // namespace

Result<std::string> render(const Template& tmpl, const SubstitutionContext& context) {
    std::string out;
    out.reserve(tmpl.text.size());

    size_t pos = 0;
    while (auto ph = nextPlaceholder(tmpl.text, pos)) {
        auto it = context.find(ph->name);
        if (it == context.end()) {
            return Error{ErrorCode::MissingVariable,
                         "Template '" + tmpl.name + "' uses undefined variable '" + ph->name + "'"};
        }
        out.append(tmpl.text, pos, ph->begin - pos);
        out += it->second;
        pos = ph->end;
    }
    out.append(tmpl.text, pos, std::string::npos);
    return out;
}

std::vector<std::string> placeholders(const Template& tmpl) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (auto ph = nextPlaceholder(tmpl.text, pos)) {
        if (std::find(names.begin(), names.end(), ph->name) == names.end()) {
            names.push_back(ph->name);
        }
        pos = ph->end;
    }
    return names;
}

Result<Template> TemplateLibrary::get(const std::string& name) const {
    if (auto it = cache_.find(name); it != cache_.end()) {
        return it->second;
    }

    Template tmpl{name, {}};
    bool loaded = false;

    if (!overrideDir_.empty()) {
        auto path = overrideDir_ / (name + ".template");
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::IOError, "Cannot read template " + path.string()};
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            tmpl.text = buffer.str();
            loaded = true;
            spdlog::debug("Loaded template {} from {}", name, path.string());
        }
    }

    if (!loaded) {
        auto builtin = findBuiltinTemplate(name);
        if (!builtin) {
            return Error{ErrorCode::NotFound, "Unknown template '" + name + "'"};
        }
        tmpl.text = std::string(*builtin);
    }

    cache_.emplace(name, tmpl);
    return tmpl;
}

} // namespace dsm::templating
