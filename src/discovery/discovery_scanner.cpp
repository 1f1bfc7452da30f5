#include "tabula/discovery/discovery_scanner.hpp"

#include "tabula/discovery/artifact_locator.hpp"
#include "tabula/discovery/code_unit_enumerator.hpp"
#include "tabula/discovery/type_classifier.hpp"
#include "tabula/foundation/logger.hpp"

#include <string>

using tabula::foundation::LogCategory;
using tabula::foundation::LogContext;
using tabula::foundation::LogLevel;
using tabula::foundation::Logger;
using tabula::foundation::TabulaResult;

namespace tabula::discovery {

DiscoveryScanner::DiscoveryScanner(const DeploymentContext& context)
    : context_(context) {}

TabulaResult<DiscoveryReport> DiscoveryScanner::scan(registry::RegistryBuilder& builder) const {
    auto located = ArtifactLocator(context_).locate();
    if (located.hasError()) {
        LogContext ctx;
        ctx.extra["subsystem"] = std::string(located.error().subsystem());
        Logger::instance().logWithContext(LogLevel::Error, LogCategory::Discovery,
                                          located.error().message(), ctx);
        return TabulaResult<DiscoveryReport>::err(located.error());
    }

    DiscoveryReport report;
    const TypeClassifier classifier(context_);

    for (const auto& location : located.value()) {
        if (location.empty()) {
            continue;
        }
        report.locations.push_back(location);

        auto candidates = makeEnumerator(location, context_)->enumerate(location);
        if (candidates.hasError()) {
            LogContext ctx;
            ctx.location = location.string();
            ctx.extra["reason"] = std::string(candidates.error().message());
            Logger::instance().logWithContext(LogLevel::Warning, LogCategory::Discovery,
                                              "Skipping unreadable location", ctx);
            report.skippedLocations.push_back(
                SkippedItem{location.string(), std::string(candidates.error().message())});
            continue;
        }

        for (const auto& candidate : candidates.value()) {
            classifier.classify(candidate, builder, report);
        }
    }

    TABULA_LOG_INFO(LogCategory::Discovery,
                    "Discovery finished: " + std::to_string(report.candidateCount) +
                        " candidates, " + std::to_string(report.registeredEntities) +
                        " entities, " + std::to_string(report.registeredSerializers) +
                        " serializers, " + std::to_string(report.skippedCandidates.size()) +
                        " skipped");
    return TabulaResult<DiscoveryReport>::ok(std::move(report));
}

} // namespace tabula::discovery
