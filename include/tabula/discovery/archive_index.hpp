#pragma once

/// @file archive_index.hpp
/// @brief Reads the entry names of a packed (ZIP) artifact container.

#include <filesystem>
#include <string>
#include <vector>

#include "tabula/foundation/tabula_result.hpp"

namespace tabula::discovery {

/// List the entry names recorded in the central directory of @p path.
///
/// Only the central directory is read; entry data is never decompressed.
/// Directory entries (names ending in '/') are left out. Entries are
/// returned in central-directory order.
///
/// @return The names; ArtifactOpenFailed when the file cannot be read,
///         ArtifactCorrupt when no end-of-central-directory record is found
///         or a record is truncated or carries a bad signature,
///         ArtifactUnsupported for ZIP64 and multi-disk archives. Every
///         error carries @p path as context.
foundation::TabulaResult<std::vector<std::string>> listArchiveEntries(
    const std::filesystem::path& path);

} // namespace tabula::discovery
