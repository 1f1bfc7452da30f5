#pragma once

/// @file code_unit_enumerator.hpp
/// @brief Lists the code-unit names contained in one artifact location.
///
/// Two strategies share one interface:
///   - ContainerEnumerator reads a packed container's entry names, which are
///     already qualified type names.
///   - DirectoryTreeEnumerator walks unpacked build output and yields file
///     paths that still need name reconstruction.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "tabula/discovery/deployment_context.hpp"
#include "tabula/foundation/tabula_result.hpp"

namespace tabula::discovery {

/// What the candidate text holds.
enum class CandidateKind : uint8_t {
    TypeName,  ///< Qualified type name, usable as-is.
    FilePath   ///< Filesystem path of a compiled unit.
};

/// One enumerated code unit.
struct Candidate {
    std::string text;
    CandidateKind kind = CandidateKind::TypeName;
};

/// Enumeration strategy for a single location.
class CodeUnitEnumerator {
public:
    virtual ~CodeUnitEnumerator() = default;

    /// List the candidates of @p location.
    ///
    /// @return The candidates, or the error that made the location
    ///         unreadable. Callers skip the location on error.
    virtual foundation::TabulaResult<std::vector<Candidate>> enumerate(
        const std::filesystem::path& location) const = 0;
};

/// Reads entry names from a packed (ZIP) container.
///
/// Extracted secondary units (".zip") are opened through a temporary
/// companion copy `<location>.tmp`, removed once the entries are read.
class ContainerEnumerator final : public CodeUnitEnumerator {
public:
    foundation::TabulaResult<std::vector<Candidate>> enumerate(
        const std::filesystem::path& location) const override;
};

/// Walks the resource roots of an unpacked deployment.
///
/// Roots whose path text contains "bin" or "classes" are walked
/// recursively; every regular file below them becomes a FilePath candidate.
/// A root that cannot be walked is logged and skipped.
class DirectoryTreeEnumerator final : public CodeUnitEnumerator {
public:
    explicit DirectoryTreeEnumerator(const DeploymentContext& context);

    foundation::TabulaResult<std::vector<Candidate>> enumerate(
        const std::filesystem::path& location) const override;

private:
    const DeploymentContext& context_;
};

/// True when @p root names a build-output directory ("bin" or "classes").
[[nodiscard]] bool isResourceRoot(const std::filesystem::path& root);

/// Pick the enumerator for @p location.
///
/// Container and Directory modes force a strategy; Auto walks directories
/// and reads everything else as a container.
std::unique_ptr<CodeUnitEnumerator> makeEnumerator(const std::filesystem::path& location,
                                                   const DeploymentContext& context);

} // namespace tabula::discovery
