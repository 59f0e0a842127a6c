#include "scm/directive_scanner.hpp"

#include <regex>
#include "core/logging/logger.hpp"

namespace popper::scm {

DirectiveScan scan_message(const std::string& message) {
    DirectiveScan scan;
    if (message.find(kDirectiveMarker) == std::string::npos) {
        return scan;
    }
    scan.marker_found = true;

    // Shortest non-empty payload on a single line.
    static const std::regex pattern(R"(popper:run\[(.+?)\])");
    for (auto it = std::sregex_iterator(message.begin(), message.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        scan.directives.push_back((*it)[1].str());
    }
    return scan;
}

DirectiveScanner::DirectiveScanner(const ScmProvider& scm) : scm_(scm) {}

core::errors::Result<DirectiveScan> DirectiveScanner::scan() const {
    auto head = scm_.head_commit();
    if (core::errors::is_error(head)) {
        return core::errors::get_error(head);
    }
    const auto& commit = core::errors::get_value(head);
    if (!commit.has_value()) {
        LOG_DEBUG("DirectiveScanner: repository has no head commit");
        return DirectiveScan{};
    }

    const std::string* message = &commit->message;
    if (message->find("Merge") != std::string::npos) {
        LOG_INFO("Merge detected. Reading message from merged commit.");
        if (commit->parents.size() == 2) {
            message = &commit->parents[1].message;
        }
    }

    DirectiveScan scan = scan_message(*message);
    LOG_DEBUG("DirectiveScanner: " + std::to_string(scan.directives.size()) +
              " directive(s) in commit " + commit->sha);
    return scan;
}

}  // namespace popper::scm
