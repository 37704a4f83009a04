#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <dsm/core/types.h>
#include <dsm/site/site.h>

namespace dsm::site {

// A web application archive that can be unpacked into a site's document root.
struct Application {
    std::string name;      // file name without the archive extension
    std::string humanName; // "my-blog_engine" -> "My Blog Engine"
    std::filesystem::path archive;
};

// Recognised extensions: .tar.gz, .tgz, .tar.bz2, .zip. nullopt for anything else.
std::optional<std::string> applicationName(const std::filesystem::path& archive);

std::string humanApplicationName(const std::string& name);

// Archives in `dir`, sorted by human name. A missing directory yields an empty list.
std::vector<Application> listApplications(const std::filesystem::path& dir);

/**
 * Resolve what the user passed to --application: an existing archive path,
 * or the name of an archive in `dir` (with or without extension).
 */
Result<std::filesystem::path> resolveApplication(const std::filesystem::path& dir,
                                                 const std::string& nameOrPath);

// Member paths of an archive, with "./" prefixes removed.
Result<std::vector<std::string>> listArchiveEntries(const std::filesystem::path& archive);

// Root directory shared by every entry, if the archive has exactly one.
std::optional<std::string> singleRootDirectory(const std::vector<std::string>& entries);

/**
 * Unpack an archive into the site's www/doc. An archive wrapped in a single
 * top-level directory is unpacked beside doc and that directory becomes doc.
 */
Result<void> installApplication(const Site& site, const std::filesystem::path& archive);

} // namespace dsm::site
