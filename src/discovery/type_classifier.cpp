#include "tabula/discovery/type_classifier.hpp"

#include "tabula/foundation/logger.hpp"
#include "tabula/types/type_record.hpp"

#include <filesystem>

using tabula::foundation::LogCategory;
using tabula::foundation::LogContext;
using tabula::foundation::LogLevel;
using tabula::foundation::Logger;

namespace tabula::discovery {

namespace {

void reportFailure(std::string_view message, const std::string& name,
                   const foundation::TabulaError& error, DiscoveryReport& report) {
    LogContext ctx;
    ctx.candidate = name;
    ctx.extra["reason"] = std::string(error.message());
    Logger::instance().logWithContext(LogLevel::Error, LogCategory::Discovery, message, ctx);
    report.skippedCandidates.push_back(SkippedItem{name, std::string(error.message())});
}

} // namespace

bool hasUnitSuffix(std::string_view path, std::string_view unitSuffix) {
    return path.size() >= unitSuffix.size() &&
           path.substr(path.size() - unitSuffix.size()) == unitSuffix;
}

std::optional<std::string> reconstructTypeName(std::string_view path,
                                                std::string_view packageName,
                                                std::string_view unitSuffix) {
    if (!hasUnitSuffix(path, unitSuffix)) {
        return std::nullopt;
    }
    path.remove_suffix(unitSuffix.size());

    constexpr auto kNativeSeparator =
        static_cast<char>(std::filesystem::path::preferred_separator);

    std::string name;
    name.reserve(path.size() * 2);
    for (char c : path) {
        if (c == '/' || c == kNativeSeparator) {
            name += types::kNamespaceSeparator;
        } else {
            name += c;
        }
    }

    auto start = name.find(packageName);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    return name.substr(start);
}

TypeClassifier::TypeClassifier(const DeploymentContext& context)
    : context_(context) {}

std::optional<std::string> TypeClassifier::resolveName(const Candidate& candidate,
                                                       DiscoveryReport& report) const {
    if (candidate.kind == CandidateKind::TypeName) {
        return candidate.text;
    }

    if (!hasUnitSuffix(candidate.text, context_.unitSuffix)) {
        ++report.ignoredCandidates;
        return std::nullopt;
    }

    auto name = reconstructTypeName(candidate.text, context_.packageName, context_.unitSuffix);
    if (!name) {
        ++report.unmatchedPaths;
        TABULA_LOG_DEBUG(LogCategory::Discovery,
                         "Package '" + context_.packageName + "' not found in " + candidate.text);
    }
    return name;
}

void TypeClassifier::classify(const Candidate& candidate, registry::RegistryBuilder& builder,
                              DiscoveryReport& report) const {
    ++report.candidateCount;

    auto name = resolveName(candidate, report);
    if (!name) {
        return;
    }

    auto loaded = context_.typeCatalog().Load(*name);
    if (loaded.hasError()) {
        reportFailure("Couldn't load type", *name, loaded.error(), report);
        return;
    }
    const types::TypeRecord& record = *loaded.value();

    if (record.isEntity() && !record.isAbstract) {
        auto added = builder.registerEntity(record);
        if (added.hasError()) {
            reportFailure("Couldn't describe entity", *name, added.error(), report);
        } else if (added.value()) {
            ++report.registeredEntities;
        }
        return;
    }

    if (record.isSerializer()) {
        auto added = builder.registerSerializer(record);
        if (added.hasError()) {
            reportFailure("Couldn't instantiate TypeSerializer", *name, added.error(), report);
        } else {
            ++report.registeredSerializers;
        }
        return;
    }

    ++report.ignoredCandidates;
}

} // namespace tabula::discovery
