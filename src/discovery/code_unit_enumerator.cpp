#include "tabula/discovery/code_unit_enumerator.hpp"

#include "tabula/discovery/archive_index.hpp"
#include "tabula/foundation/logger.hpp"

#include <iterator>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

using tabula::foundation::ErrorCode;
using tabula::foundation::LogCategory;
using tabula::foundation::LogContext;
using tabula::foundation::LogLevel;
using tabula::foundation::Logger;
using tabula::foundation::TabulaError;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

namespace {

using Candidates = std::vector<Candidate>;

constexpr std::string_view kExtractedContainerExt = ".zip";
constexpr std::string_view kCompanionSuffix = ".tmp";

constexpr std::string_view kBinMarker = "bin";
constexpr std::string_view kClassesMarker = "classes";

Candidates toCandidates(std::vector<std::string> names) {
    Candidates candidates;
    candidates.reserve(names.size());
    for (auto& name : names) {
        candidates.push_back(Candidate{std::move(name), CandidateKind::TypeName});
    }
    return candidates;
}

} // namespace

// ── ContainerEnumerator ────────────────────────────────────────────────────

TabulaResult<Candidates> ContainerEnumerator::enumerate(const fs::path& location) const {
    if (location.extension().string() != kExtractedContainerExt) {
        auto names = listArchiveEntries(location);
        if (names.hasError()) {
            return TabulaResult<Candidates>::err(names.error());
        }
        return TabulaResult<Candidates>::ok(toCandidates(std::move(names).value()));
    }

    fs::path companion = location;
    companion += kCompanionSuffix;

    std::error_code ec;
    fs::copy_file(location, companion, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return TabulaResult<Candidates>::err(
            TabulaError(ErrorCode::ArtifactOpenFailed,
                        "Cannot stage '" + location.string() + "': " + ec.message(),
                        location));
    }

    auto names = listArchiveEntries(companion);

    fs::remove(companion, ec);
    if (ec) {
        LogContext ctx;
        ctx.location = companion.string();
        ctx.extra["reason"] = ec.message();
        Logger::instance().logWithContext(LogLevel::Warning, LogCategory::Discovery,
                                          "Couldn't remove companion copy", ctx);
    }

    if (names.hasError()) {
        return TabulaResult<Candidates>::err(names.error());
    }
    return TabulaResult<Candidates>::ok(toCandidates(std::move(names).value()));
}

// ── DirectoryTreeEnumerator ────────────────────────────────────────────────

DirectoryTreeEnumerator::DirectoryTreeEnumerator(const DeploymentContext& context)
    : context_(context) {}

bool isResourceRoot(const fs::path& root) {
    const std::string text = root.generic_string();
    return text.find(kBinMarker) != std::string::npos ||
           text.find(kClassesMarker) != std::string::npos;
}

TabulaResult<Candidates> DirectoryTreeEnumerator::enumerate(const fs::path& location) const {
    std::vector<fs::path> roots = context_.resourceRoots;
    if (roots.empty()) {
        roots.push_back(location);
    }

    Candidates candidates;
    for (const auto& root : roots) {
        if (!isResourceRoot(root)) {
            TABULA_LOG_DEBUG(LogCategory::Discovery,
                             "Not a build output root: " + root.string());
            continue;
        }

        std::error_code ec;
        fs::recursive_directory_iterator it(root, ec);
        Candidates found;
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code typeError;
            if (it->is_regular_file(typeError)) {
                found.push_back(Candidate{it->path().string(), CandidateKind::FilePath});
            }
        }

        if (ec) {
            LogContext ctx;
            ctx.location = root.string();
            ctx.extra["reason"] = ec.message();
            Logger::instance().logWithContext(LogLevel::Warning, LogCategory::Discovery,
                                              "Couldn't walk resource root", ctx);
            continue;
        }

        candidates.insert(candidates.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }

    return TabulaResult<Candidates>::ok(std::move(candidates));
}

// ── Selection ──────────────────────────────────────────────────────────────

std::unique_ptr<CodeUnitEnumerator> makeEnumerator(const fs::path& location,
                                                   const DeploymentContext& context) {
    switch (context.mode) {
        case EnumerationMode::Container:
            return std::make_unique<ContainerEnumerator>();
        case EnumerationMode::Directory:
            return std::make_unique<DirectoryTreeEnumerator>(context);
        case EnumerationMode::Auto:
            break;
    }

    std::error_code ec;
    if (fs::is_directory(location, ec)) {
        return std::make_unique<DirectoryTreeEnumerator>(context);
    }
    return std::make_unique<ContainerEnumerator>();
}

} // namespace tabula::discovery
