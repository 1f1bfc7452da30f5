#pragma once

/// @file type_classifier.hpp
/// @brief Turns enumerated candidates into registry entries.

#include <optional>
#include <string>
#include <string_view>

#include "tabula/discovery/code_unit_enumerator.hpp"
#include "tabula/discovery/deployment_context.hpp"
#include "tabula/discovery/discovery_report.hpp"
#include "tabula/registry/registry_builder.hpp"

namespace tabula::discovery {

/// True when @p path ends in the compiled-unit suffix.
[[nodiscard]] bool hasUnitSuffix(std::string_view path, std::string_view unitSuffix);

/// Rebuild a qualified type name from a compiled-unit path.
///
/// The suffix is stripped, path separators become "::", and the result is
/// cut at the leftmost occurrence of @p packageName.
///
/// @code
///   reconstructTypeName("/srv/build/bin/shop/model/Order.o", "shop", ".o");
///   // -> "shop::model::Order"
/// @endcode
///
/// @return The name, or std::nullopt when the suffix is missing or the
///         package name does not occur in the path.
[[nodiscard]] std::optional<std::string> reconstructTypeName(std::string_view path,
                                                             std::string_view packageName,
                                                             std::string_view unitSuffix);

/// Loads each candidate through the deployment's TypeCatalog and registers
/// concrete entities and serializers.
///
/// Nothing here stops a pass: every failure is logged and recorded in the
/// DiscoveryReport, and the next candidate is processed.
class TypeClassifier {
public:
    explicit TypeClassifier(const DeploymentContext& context);

    void classify(const Candidate& candidate, registry::RegistryBuilder& builder,
                  DiscoveryReport& report) const;

private:
    std::optional<std::string> resolveName(const Candidate& candidate,
                                           DiscoveryReport& report) const;

    const DeploymentContext& context_;
};

} // namespace tabula::discovery
