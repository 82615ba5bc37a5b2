#include "core/ConflictResolver.hpp"
#include "util/Logger.hpp"

namespace tagmv::core {

ConflictResolver::ConflictResolver(std::filesystem::path root, util::FileOps& file_ops)
    : root_(std::move(root)), file_ops_(file_ops) {}

std::string ConflictResolver::with_suffix(const std::string& relative_path, unsigned counter) {
    const size_t slash = relative_path.rfind('/');
    const size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = relative_path.rfind('.');

    // A leading dot names a hidden file, not an extension
    if (dot == std::string::npos || dot <= name_start) {
        dot = relative_path.size();
    }
    return relative_path.substr(0, dot) + " (" + std::to_string(counter) + ")" + relative_path.substr(dot);
}

std::string ConflictResolver::current_relative_path(const model::SourceFile& file) const {
    return file.path.lexically_relative(root_).generic_string();
}

bool ConflictResolver::occupied_on_disk(const std::string& relative_path, std::error_code& ec) {
    return file_ops_.exists(root_ / relative_path, ec);
}

std::vector<model::ResolvedMove> ConflictResolver::resolve(const std::vector<model::PlannedMove>& plans) {
    claimed_.clear();

    std::vector<model::ResolvedMove> resolved;
    resolved.reserve(plans.size());

    for (const auto& plan : plans) {
        model::ResolvedMove entry;
        entry.plan = plan;

        const std::string own_path = current_relative_path(plan.source);
        std::string candidate = plan.relative_destination;
        std::string reject_reason = TOO_MANY_CONFLICTS;
        bool found = false;

        for (unsigned counter = 0; counter <= MAX_CONFLICT_ATTEMPTS; ++counter) {
            if (counter > 0) {
                candidate = with_suffix(plan.relative_destination, counter);
            }
            if (claimed_.count(candidate)) continue;

            if (candidate == own_path) {
                entry.action = model::MoveAction::Skip;
                found = true;
                break;
            }

            std::error_code ec;
            bool occupied = occupied_on_disk(candidate, ec);
            if (ec) {
                // A suffix does not change why the check failed; stop here
                reject_reason = "cannot check destination " + candidate + ": " + ec.message();
                break;
            }
            if (!occupied) {
                entry.action = model::MoveAction::Move;
                found = true;
                break;
            }
        }

        if (!found) {
            entry.action = model::MoveAction::Reject;
            entry.reject_reason = std::move(reject_reason);
            util::Logger::error("ConflictResolver: Rejected " + plan.source.path.string() + ": " +
                                entry.reject_reason);
            resolved.push_back(std::move(entry));
            continue;
        }

        if (candidate != plan.relative_destination) {
            util::Logger::info("ConflictResolver: " + plan.relative_destination + " is taken, using " + candidate);
        }
        if (entry.action == model::MoveAction::Skip) {
            util::Logger::debug("ConflictResolver: " + candidate + " already in place");
        }

        entry.final_destination = candidate;
        claimed_[candidate]++;
        resolved.push_back(std::move(entry));
    }

    return resolved;
}

}  // namespace tagmv::core
