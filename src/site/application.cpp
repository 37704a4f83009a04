#include <dsm/site/application.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace dsm::site {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 4> kExtensions = {".tar.gz", ".tgz", ".tar.bz2", ".zip"};

using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

bool endsWith(const std::string& s, std::string_view suffix) {
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isSupportedArchive(const fs::path& archive) {
    const auto file = archive.filename().string();
    return std::any_of(kExtensions.begin(), kExtensions.end(),
                       [&file](std::string_view ext) { return endsWith(file, ext); });
}

std::string errorString(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

// Members are always relative to the extraction root: "./" and "/" prefixes are dropped.
std::string normalizeEntry(std::string entry) {
    for (;;) {
        if (entry.rfind("./", 0) == 0) {
            entry.erase(0, 2);
        } else if (entry.rfind('/', 0) == 0) {
            entry.erase(0, 1);
        } else {
            return entry;
        }
    }
}

// tar (gzip, bzip2) and zip; the format is sniffed from the content.
Result<ArchiveReader> openArchive(const fs::path& archive) {
    ArchiveReader reader(archive_read_new(), &archive_read_free);
    archive_read_support_format_tar(reader.get());
    archive_read_support_format_gnutar(reader.get());
    archive_read_support_format_zip(reader.get());
    archive_read_support_filter_gzip(reader.get());
    archive_read_support_filter_bzip2(reader.get());

    if (archive_read_open_filename(reader.get(), archive.string().c_str(), 10240) != ARCHIVE_OK) {
        return Error{ErrorCode::IOError, "Cannot open " + archive.string() + ": " +
                                             errorString(reader.get())};
    }
    return Result<ArchiveReader>(std::move(reader));
}

Result<void> extract(const fs::path& archive, const fs::path& dest) {
    auto reader = openArchive(archive);
    if (!reader) {
        return reader.error();
    }
    struct archive* in = reader.value().get();

    ArchiveWriter writer(archive_write_disk_new(), &archive_write_free);
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in, &entry)) == ARCHIVE_OK) {
        const char* path = archive_entry_pathname(entry);
        const auto name = normalizeEntry(path ? path : "");
        if (name.empty() || name == ".") {
            archive_read_data_skip(in);
            continue;
        }
        const fs::path target = dest / name;
        archive_entry_set_pathname(entry, target.string().c_str());

        if (archive_write_header(writer.get(), entry) != ARCHIVE_OK) {
            return Error{ErrorCode::IOError, "Extracting " + archive.string() + " failed: " +
                                                 errorString(writer.get())};
        }
        if (archive_entry_size(entry) > 0) {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            int block = ARCHIVE_OK;
            while ((block = archive_read_data_block(in, &buff, &size, &offset)) == ARCHIVE_OK) {
                if (archive_write_data_block(writer.get(), buff, size, offset) != ARCHIVE_OK) {
                    return Error{ErrorCode::IOError, "Writing " + target.string() + " failed: " +
                                                         errorString(writer.get())};
                }
            }
            if (block != ARCHIVE_EOF) {
                return Error{ErrorCode::IOError, "Reading " + archive.string() + " failed: " +
                                                     errorString(in)};
            }
        }
        archive_write_finish_entry(writer.get());
    }
    if (r != ARCHIVE_EOF) {
        return Error{ErrorCode::IOError,
                     "Reading " + archive.string() + " failed: " + errorString(in)};
    }
    return Result<void>();
}

} // namespace

std::optional<std::string> applicationName(const fs::path& archive) {
    const auto file = archive.filename().string();
    for (auto ext : kExtensions) {
        if (endsWith(file, ext)) {
            return file.substr(0, file.size() - ext.size());
        }
    }
    return std::nullopt;
}

std::string humanApplicationName(const std::string& name) {
    std::string human;
    human.reserve(name.size());
    bool wordStart = true;
    for (char c : name) {
        if (c == '-' || c == '_') {
            human.push_back(' ');
            wordStart = true;
            continue;
        }
        human.push_back(wordStart ? static_cast<char>(std::toupper(static_cast<unsigned char>(c)))
                                  : c);
        wordStart = false;
    }
    return human;
}

std::vector<Application> listApplications(const fs::path& dir) {
    std::vector<Application> apps;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return apps;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) {
            continue;
        }
        auto name = applicationName(it->path());
        if (!name || name->empty()) {
            continue;
        }
        apps.push_back(Application{*name, humanApplicationName(*name), it->path()});
    }
    std::sort(apps.begin(), apps.end(), [](const Application& a, const Application& b) {
        return a.humanName != b.humanName ? a.humanName < b.humanName : a.name < b.name;
    });
    return apps;
}

Result<fs::path> resolveApplication(const fs::path& dir, const std::string& nameOrPath) {
    std::error_code ec;
    fs::path direct = nameOrPath;
    if (fs::is_regular_file(direct, ec)) {
        if (!isSupportedArchive(direct)) {
            return Error{ErrorCode::InvalidArgument,
                         "Unsupported archive type: " + direct.string()};
        }
        return fs::absolute(direct, ec);
    }
    for (const auto& app : listApplications(dir)) {
        if (app.name == nameOrPath || app.archive.filename() == nameOrPath) {
            return app.archive;
        }
    }
    return Error{ErrorCode::NotFound, "No application '" + nameOrPath + "' in " + dir.string()};
}

Result<std::vector<std::string>> listArchiveEntries(const fs::path& archive) {
    if (!isSupportedArchive(archive)) {
        return Error{ErrorCode::InvalidArgument, "Unsupported archive type: " + archive.string()};
    }
    auto reader = openArchive(archive);
    if (!reader) {
        return reader.error();
    }
    struct archive* in = reader.value().get();

    std::vector<std::string> entries;
    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in, &entry)) == ARCHIVE_OK) {
        const char* path = archive_entry_pathname(entry);
        auto name = normalizeEntry(path ? path : "");
        if (!name.empty() && name != ".") {
            entries.push_back(std::move(name));
        }
        archive_read_data_skip(in);
    }
    if (r != ARCHIVE_EOF) {
        return Error{ErrorCode::IOError,
                     "Cannot list " + archive.string() + ": " + errorString(in)};
    }
    return entries;
}

std::optional<std::string> singleRootDirectory(const std::vector<std::string>& entries) {
    std::optional<std::string> root;
    bool nested = false;
    for (const auto& entry : entries) {
        auto slash = entry.find('/');
        std::string first = entry.substr(0, slash);
        if (root && *root != first) {
            return std::nullopt;
        }
        root = first;
        // "root/" alone is the directory itself, anything after it is a member.
        if (slash != std::string::npos) {
            nested = true;
        }
    }
    if (!nested) {
        return std::nullopt;
    }
    return root;
}

Result<void> installApplication(const Site& site, const fs::path& archive) {
    auto entries = listArchiveEntries(archive);
    if (!entries) {
        return entries.error();
    }

    std::error_code ec;
    const fs::path doc = site.docDir();
    auto root = singleRootDirectory(entries.value());
    if (!root) {
        fs::create_directories(doc, ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot create " + doc.string() + ": " + ec.message()};
        }
        spdlog::info("Unpacking {} into {}", archive.filename().string(), doc.string());
        return extract(archive, doc);
    }

    const fs::path staging = site.serviceDir(ServiceKind::Web) / ".import";
    fs::remove_all(staging, ec);
    fs::create_directories(staging, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot create " + staging.string() + ": " + ec.message()};
    }
    spdlog::info("Unpacking {} ({}/) into {}", archive.filename().string(), *root, doc.string());
    if (auto r = extract(archive, staging); !r) {
        fs::remove_all(staging, ec);
        return r;
    }

    fs::remove_all(doc, ec);
    fs::rename(staging / *root, doc, ec);
    if (ec) {
        auto msg = "Cannot move " + (staging / *root).string() + " to " + doc.string() + ": " +
                   ec.message();
        std::error_code cleanupEc;
        fs::remove_all(staging, cleanupEc);
        return Error{ErrorCode::IOError, msg};
    }
    fs::remove_all(staging, ec);
    return Result<void>();
}

} // namespace dsm::site
