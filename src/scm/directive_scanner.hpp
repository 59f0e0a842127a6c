#pragma once

#include <string>
#include <vector>
#include "core/errors/popper_errors.hpp"
#include "scm/scm_provider.hpp"

namespace popper::scm {

inline constexpr const char* kDirectiveMarker = "popper:run[";

// Outcome of scanning one commit message. `marker_found == false` means the
// marker text never occurs, which is not the same as a marker whose payload
// could not be extracted.
struct DirectiveScan {
    bool marker_found = false;
    std::vector<std::string> directives;
};

// Extracts every `popper:run[...]` payload, left to right.
DirectiveScan scan_message(const std::string& message);

class DirectiveScanner {
public:
    explicit DirectiveScanner(const ScmProvider& scm);

    // Reads the head commit (the merged-in side for merge commits) and scans it.
    core::errors::Result<DirectiveScan> scan() const;

private:
    const ScmProvider& scm_;
};

}  // namespace popper::scm
