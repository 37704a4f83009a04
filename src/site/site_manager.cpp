#include <dsm/site/site_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

#include <dsm/site/application.h>
#include <dsm/site/directory_lock.h>
#include <dsm/site/port_allocator.h>
#include <dsm/site/service_scripts.h>

namespace dsm::site {

namespace {

namespace fs = std::filesystem;

constexpr const char* kLockFileName = ".dsm.lock";

Result<void> validateId(const std::string& id) {
    if (!isValidSiteId(id)) {
        return Error{ErrorCode::InvalidIdentifier,
                     "Invalid site id '" + id +
                         "': start with a letter, then up to 23 letters, digits or '_'"};
    }
    return Result<void>();
}

// Generated files are read-only and data directories may be too; removal needs u+w.
void makeWritable(const fs::path& root) {
    std::error_code ec;
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entryEc;
        if (it->is_symlink(entryEc)) {
            continue;
        }
        auto add = it->is_directory(entryEc) ? fs::perms::owner_all
                                             : fs::perms::owner_read | fs::perms::owner_write;
        fs::permissions(it->path(), add, fs::perm_options::add, entryEc);
    }
}

Result<void> deleteTree(const fs::path& root) {
    makeWritable(root);
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot delete " + root.string() + ": " + ec.message()};
    }
    return Result<void>();
}

std::vector<ServiceKind> servicesFor(std::optional<ServiceKind> service, bool starting) {
    if (service) {
        return {*service};
    }
    if (starting) {
        return {ServiceKind::Database, ServiceKind::Web};
    }
    return {ServiceKind::Web, ServiceKind::Database};
}

} // namespace

Result<Site> SiteManager::lookup(const std::string& id) const {
    if (auto valid = validateId(id); !valid) {
        return valid.error();
    }
    auto site = registry_.findSite(id);
    if (!site) {
        return Error{ErrorCode::NotFound, "No site named '" + id + "'"};
    }
    return *site;
}

Result<Site> SiteManager::reserveSite(const InstallRequest& request) const {
    std::error_code ec;
    fs::create_directories(settings_.baseDir, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Cannot create " + settings_.baseDir.string() + ": " + ec.message()};
    }

    PortAllocator allocator(settings_.portMin, settings_.portMax, settings_.portStride);
    for (int attempt = 0; attempt < kMaxReserveAttempts; ++attempt) {
        auto lock = DirectoryLock::acquire(settings_.baseDir / kLockFileName);
        if (!lock) {
            return lock.error();
        }

        if (registry_.findSite(request.id)) {
            return Error{ErrorCode::DuplicateSite,
                         "A site named '" + request.id + "' already exists"};
        }

        auto used = registry_.usedPorts();
        int port = 0;
        if (request.port) {
            if (auto ok = allocator.validate(*request.port, used); !ok) {
                return ok.error();
            }
            port = *request.port;
        } else {
            auto allocated = allocator.allocate(used);
            if (!allocated) {
                return allocated.error();
            }
            port = allocated.value();
        }

        Site site = makeSite(settings_.baseDir, request.id, port);
        // create_directory is the atomic claim: it fails if another process got there first.
        if (fs::create_directory(site.directory, ec)) {
            return site;
        }
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Cannot create " + site.directory.string() + ": " + ec.message()};
        }
        spdlog::debug("{} appeared concurrently, retrying ({}/{})", site.directory.string(),
                      attempt + 1, kMaxReserveAttempts);
    }
    return Error{ErrorCode::InternalError,
                 "Could not reserve a directory for site '" + request.id + "'"};
}

Result<void> SiteManager::writeServiceFiles(const Site& site, const IServiceStack& stack) const {
    auto context = stack.context(site);
    if (!context) {
        return context.error();
    }

    for (const auto& file : stack.files()) {
        auto tmpl = templates_.get(file.templateName);
        if (!tmpl) {
            return tmpl.error();
        }
        auto text = templating::render(tmpl.value(), context.value());
        if (!text) {
            return text.error();
        }

        const fs::path dest = site.directory / file.destination;
        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        {
            std::ofstream out(dest, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IOError, "Cannot write " + dest.string()};
            }
            out << text.value();
            if (!out.flush()) {
                return Error{ErrorCode::IOError, "Cannot write " + dest.string()};
            }
        }
        fs::permissions(dest, file.mode, fs::perm_options::replace, ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Cannot set permissions on " + dest.string() + ": " + ec.message()};
        }
        spdlog::debug("Wrote {} from {}", dest.string(), file.templateName);
    }
    return Result<void>();
}

Result<void> SiteManager::provision(const Site& site, const InstallRequest& request) const {
    const std::vector<const IServiceStack*> stacks = {request.web, request.database};

    for (const auto* stack : stacks) {
        for (const auto& dir : stack->directories(site)) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                return Error{ErrorCode::IOError,
                             "Cannot create " + dir.string() + ": " + ec.message()};
            }
        }
    }

    for (const auto* stack : stacks) {
        if (auto prepared = stack->prepare(site); !prepared) {
            return prepared;
        }
        if (auto written = writeServiceFiles(site, *stack); !written) {
            return written;
        }
    }

    for (const auto* stack : stacks) {
        spdlog::info("Bootstrapping {} for site {}", stack->name(), site.id);
        if (auto booted = stack->bootstrap(site); !booted) {
            return booted;
        }
    }

    if (request.application) {
        if (auto unpacked = installApplication(site, *request.application); !unpacked) {
            return unpacked;
        }
    }
    return Result<void>();
}

void SiteManager::rollback(const Site& site) const {
    spdlog::warn("Rolling back site {}", site.id);
    stopServicesBestEffort(site);
    if (auto removed = deleteTree(site.directory); !removed) {
        spdlog::error("Rollback left {} behind: {}", site.directory.string(),
                      removed.error().message);
    }
}

Result<Site> SiteManager::install(const InstallRequest& request) const {
    if (auto valid = validateId(request.id); !valid) {
        return valid.error();
    }
    if (!request.web || !request.database) {
        return Error{ErrorCode::InvalidArgument, "A web and a database stack are required"};
    }

    auto reserved = reserveSite(request);
    if (!reserved) {
        return reserved.error();
    }
    const Site& site = reserved.value();
    spdlog::info("Installing site {} on ports {}-{}", site.id, site.httpPort(),
                 site.databasePort());

    if (auto provisioned = provision(site, request); !provisioned) {
        rollback(site);
        return provisioned.error();
    }
    return site;
}

Result<void> SiteManager::remove(const std::string& id) const {
    auto site = lookup(id);
    if (!site) {
        return site.error();
    }
    spdlog::info("Removing site {}", id);
    stopServicesBestEffort(site.value());
    return deleteTree(site.value().directory);
}

Result<void> SiteManager::start(const std::string& id, std::optional<ServiceKind> service) const {
    auto site = lookup(id);
    if (!site) {
        return site.error();
    }
    for (auto kind : servicesFor(service, true)) {
        if (auto r = runServiceScript(site.value(), kind, ServiceAction::Start); !r) {
            return r;
        }
    }
    return Result<void>();
}

Result<void> SiteManager::stop(const std::string& id, std::optional<ServiceKind> service) const {
    auto site = lookup(id);
    if (!site) {
        return site.error();
    }
    // Keep going so one stuck service does not leave the other running.
    Result<void> outcome;
    for (auto kind : servicesFor(service, false)) {
        if (auto r = runServiceScript(site.value(), kind, ServiceAction::Stop); !r) {
            spdlog::warn("Stopping {} of {} failed: {}", serviceName(kind), id, r.error().message);
            if (outcome) {
                outcome = r;
            }
        }
    }
    return outcome;
}

Result<std::vector<fs::path>> SiteManager::logFiles(const std::string& id) const {
    auto site = lookup(id);
    if (!site) {
        return site.error();
    }
    std::vector<fs::path> files;
    for (auto kind : {ServiceKind::Web, ServiceKind::Database}) {
        std::error_code ec;
        fs::directory_iterator it(site.value().logDir(kind), ec);
        if (ec) {
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            std::error_code typeEc;
            if (it->is_regular_file(typeEc)) {
                files.push_back(it->path());
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace dsm::site
