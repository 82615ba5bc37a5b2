#pragma once

#include "model/Move.hpp"
#include "util/FileOps.hpp"
#include <filesystem>
#include <vector>

namespace tagmv::core {

// Plans, resolves and executes one batch, strictly in scan order.
class BatchOrchestrator {
public:
    BatchOrchestrator(std::filesystem::path root, util::FileOps& file_ops);

    model::Report run(const std::vector<model::SourceFile>& files, bool dry_run);

    // Distinct album folders among non-unsorted Move/Skip destinations.
    static std::size_t count_folders(const std::vector<model::ResolvedMove>& resolved);

private:
    std::filesystem::path root_;
    util::FileOps& file_ops_;
};

}  // namespace tagmv::core
