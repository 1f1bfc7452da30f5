#pragma once

/// @file discovery_scanner.hpp
/// @brief One discovery pass: locate -> enumerate -> classify.

#include "tabula/discovery/deployment_context.hpp"
#include "tabula/discovery/discovery_report.hpp"
#include "tabula/foundation/tabula_result.hpp"
#include "tabula/registry/registry_builder.hpp"

namespace tabula::discovery {

/// Scans every artifact location of a deployment into a RegistryBuilder.
///
/// Only artifact location can fail the pass. A location that cannot be
/// enumerated is logged and recorded as skipped; the remaining locations
/// are still processed.
///
/// @code
///   registry::RegistryBuilder builder;
///   auto report = DiscoveryScanner(context).scan(builder);
///   if (report.hasError()) {
///       // MissingSecondaryArtifact or PreferenceReadFailed
///   }
/// @endcode
class DiscoveryScanner {
public:
    explicit DiscoveryScanner(const DeploymentContext& context);

    foundation::TabulaResult<DiscoveryReport> scan(registry::RegistryBuilder& builder) const;

private:
    const DeploymentContext& context_;
};

} // namespace tabula::discovery
