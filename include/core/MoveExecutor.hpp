#pragma once

#include "model/Move.hpp"
#include "util/FileOps.hpp"
#include <filesystem>

namespace tagmv::core {

/**
 * MoveExecutor: carries out one resolved move.
 *
 * Rename is attempted first. Only when it fails with EXDEV (source and
 * destination on different volumes) does it fall back to
 * copy -> verify size -> delete source. Any failure is returned as a
 * Failed outcome and leaves the source file where it was; the caller's
 * batch keeps going.
 */
class MoveExecutor {
public:
    MoveExecutor(std::filesystem::path root, util::FileOps& file_ops);

    // Dry runs and Skips succeed without touching the filesystem.
    [[nodiscard]] model::MoveOutcome execute(const model::ResolvedMove& move, bool dry_run);

private:
    model::MoveOutcome move_across_devices(model::MoveOutcome outcome,
                                           const std::filesystem::path& source,
                                           const std::filesystem::path& destination);

    static model::MoveOutcome failed(model::MoveOutcome outcome, std::string reason);

    std::filesystem::path root_;
    util::FileOps& file_ops_;
};

}  // namespace tagmv::core
