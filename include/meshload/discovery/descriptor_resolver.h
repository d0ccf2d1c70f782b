#ifndef MESHLOAD_DISCOVERY_DESCRIPTOR_RESOLVER_H
#define MESHLOAD_DISCOVERY_DESCRIPTOR_RESOLVER_H

#include "meshload/base/error_code.h"
#include "meshload/core/types.h"
#include <chrono>
#include <optional>
#include <string>
#include <elio/elio.hpp>

namespace meshload {

struct ResolveResult {
    std::optional<FileDescriptor> descriptor;
    ErrorCode error = ErrorCode::Success;
    std::string message;

    bool ok() const { return descriptor.has_value(); }
};

// Looks a file hash up and returns its descriptor with candidate peers
class DescriptorResolver {
public:
    virtual ~DescriptorResolver() = default;

    virtual elio::coro::task<ResolveResult> resolve(std::string file_hash,
                                                    std::chrono::milliseconds timeout) = 0;
};

// Reads "<dir>/<file_hash>.json", polling until it appears or the timeout passes
class ManifestDirectoryResolver : public DescriptorResolver {
public:
    explicit ManifestDirectoryResolver(std::string directory,
                                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    elio::coro::task<ResolveResult> resolve(std::string file_hash,
                                            std::chrono::milliseconds timeout) override;

    // One immediate lookup without waiting
    ResolveResult lookup(const std::string& file_hash) const;

    std::string path_for(const std::string& file_hash) const;

private:
    std::string directory_;
    std::chrono::milliseconds poll_interval_;
};

// Consistency checks of a descriptor; returns Success or InvalidDescriptor with a reason
ErrorCode validate_descriptor(const FileDescriptor& descriptor, std::string* reason = nullptr);

// Builds a descriptor for a local file (the seeding side of a manifest)
std::optional<FileDescriptor> describe_file(const std::string& path, uint32_t chunk_size,
                                            IntegrityScheme scheme);

} // namespace meshload

#endif // MESHLOAD_DISCOVERY_DESCRIPTOR_RESOLVER_H
