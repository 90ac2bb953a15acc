#pragma once

#include "timestamp.hpp"
#include "types.hpp"
#include <string>

namespace anchor
{

    /** Read and decode a detached proof (.ots) file */
    Result<DetachedTimestampFile> read_proof_file(const std::string &path);

    /** Write a proof to a new file; fails if `path` already exists */
    Result<void> write_new_proof_file(const std::string &path, const DetachedTimestampFile &proof);

    /**
     * Replace an existing proof: the old file is renamed to `<path>.bak`
     * (refusing if that exists) and the new proof written to `path`.
     */
    Result<void> replace_proof_file(const std::string &path, const DetachedTimestampFile &proof);

} // namespace anchor
