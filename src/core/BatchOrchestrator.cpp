#include "core/BatchOrchestrator.hpp"
#include "core/ConflictResolver.hpp"
#include "core/DestinationPlanner.hpp"
#include "core/MoveExecutor.hpp"
#include "util/Logger.hpp"
#include <unordered_set>

namespace tagmv::core {

BatchOrchestrator::BatchOrchestrator(std::filesystem::path root, util::FileOps& file_ops)
    : root_(std::move(root)), file_ops_(file_ops) {}

std::size_t BatchOrchestrator::count_folders(const std::vector<model::ResolvedMove>& resolved) {
    std::unordered_set<std::string> folders;
    for (const auto& move : resolved) {
        if (move.plan.is_unsorted || move.action == model::MoveAction::Reject) continue;
        const size_t slash = move.final_destination.rfind('/');
        if (slash == std::string::npos) continue;
        folders.insert(move.final_destination.substr(0, slash));
    }
    return folders.size();
}

model::Report BatchOrchestrator::run(const std::vector<model::SourceFile>& files, bool dry_run) {
    util::Logger::info("BatchOrchestrator: " + std::to_string(files.size()) + " files under " + root_.string() +
                       (dry_run ? " (dry run)" : " (execute)"));

    std::vector<model::PlannedMove> plans;
    plans.reserve(files.size());
    for (const auto& file : files) {
        plans.push_back(DestinationPlanner::plan(file));
    }

    ConflictResolver resolver(root_, file_ops_);
    const std::vector<model::ResolvedMove> resolved = resolver.resolve(plans);

    model::Report report;
    report.total_files = files.size();
    report.folder_count = count_folders(resolved);
    for (const auto& move : resolved) {
        if (move.plan.is_unsorted) report.unsorted_count++;
    }

    MoveExecutor executor(root_, file_ops_);
    report.outcomes.reserve(resolved.size());
    for (const auto& move : resolved) {
        report.outcomes.push_back(executor.execute(move, dry_run));
    }

    util::Logger::info("BatchOrchestrator: " + std::to_string(report.moved_count()) + " moved, " +
                       std::to_string(report.skipped_count()) + " in place, " +
                       std::to_string(report.failed_count()) + " failed");
    return report;
}

}  // namespace tagmv::core
