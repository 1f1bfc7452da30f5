#pragma once

/// @file configuration_loader.hpp
/// @brief Populates the registries straight from a declared Configuration.

#include "tabula/discovery/configuration.hpp"
#include "tabula/foundation/tabula_result.hpp"
#include "tabula/registry/registry_builder.hpp"

namespace tabula::discovery {

/// Loads declared entity and serializer types into a RegistryBuilder.
class ConfigurationLoader {
public:
    explicit ConfigurationLoader(registry::RegistryBuilder& builder);

    /// Register the declared model of @p configuration.
    ///
    /// A declared entity whose descriptor cannot be built fails the load
    /// with that error. A declared serializer that cannot be instantiated
    /// is logged and skipped.
    ///
    /// @return true when the configuration was valid and has been applied,
    ///         false when it is not valid (nothing registered).
    foundation::TabulaResult<bool> load(const Configuration& configuration);

private:
    registry::RegistryBuilder& builder_;
};

} // namespace tabula::discovery
