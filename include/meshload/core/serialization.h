#ifndef MESHLOAD_CORE_SERIALIZATION_H
#define MESHLOAD_CORE_SERIALIZATION_H

#include "meshload/core/types.h"
#include <nlohmann/json.hpp>

namespace meshload {

// JSON mapping used by manifest files and resume snapshots.
// from_json throws nlohmann::json::exception (or MeshLoadError for bad enum names).
void to_json(nlohmann::json& j, const CandidatePeer& peer);
void from_json(const nlohmann::json& j, CandidatePeer& peer);

void to_json(nlohmann::json& j, const IntegrityManifest& manifest);
void from_json(const nlohmann::json& j, IntegrityManifest& manifest);

void to_json(nlohmann::json& j, const FileDescriptor& descriptor);
void from_json(const nlohmann::json& j, FileDescriptor& descriptor);

int64_t to_unix_millis(WallTime time);
WallTime from_unix_millis(int64_t millis);

} // namespace meshload

#endif // MESHLOAD_CORE_SERIALIZATION_H
