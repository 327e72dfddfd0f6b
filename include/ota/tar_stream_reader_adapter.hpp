#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <atomic>
#include <string>

namespace fwfleet {

// Feeds an IReader into libarchive. Reads fail with EINTR once |cancel| or
// the process-wide cancel flag is raised.
int OpenArchiveFromReader(struct archive* ar, IReader& reader, const std::atomic_bool* cancel = nullptr);

std::string ArchiveErr(struct archive* ar);

} // namespace fwfleet
