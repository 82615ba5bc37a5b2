#include "core/MoveExecutor.hpp"
#include "util/Logger.hpp"

namespace tagmv::core {

namespace fs = std::filesystem;

MoveExecutor::MoveExecutor(fs::path root, util::FileOps& file_ops)
    : root_(std::move(root)), file_ops_(file_ops) {}

model::MoveOutcome MoveExecutor::failed(model::MoveOutcome outcome, std::string reason) {
    util::Logger::error("MoveExecutor: " + outcome.move.plan.source.path.string() + ": " + reason);
    outcome.result = model::MoveResult::Failed;
    outcome.reason = std::move(reason);
    return outcome;
}

model::MoveOutcome MoveExecutor::execute(const model::ResolvedMove& move, bool dry_run) {
    model::MoveOutcome outcome;
    outcome.move = move;

    if (move.action == model::MoveAction::Reject) {
        return failed(std::move(outcome), move.reject_reason);
    }
    if (dry_run || move.action == model::MoveAction::Skip) {
        outcome.result = model::MoveResult::Success;
        return outcome;
    }

    const fs::path& source = move.plan.source.path;
    const fs::path destination = root_ / move.final_destination;

    std::error_code ec;
    file_ops_.create_directories(destination.parent_path(), ec);
    if (ec) {
        return failed(std::move(outcome), "cannot create directory " + destination.parent_path().string() +
                                              ": " + ec.message());
    }

    // Planning looked at the disk earlier; never overwrite something that appeared since
    bool exists = file_ops_.exists(destination, ec);
    if (ec) {
        return failed(std::move(outcome), "cannot check destination " + destination.string() + ": " + ec.message());
    }
    if (exists) {
        return failed(std::move(outcome), "destination already exists: " + destination.string());
    }

    file_ops_.rename(source, destination, ec);
    if (!ec) {
        util::Logger::info("MoveExecutor: Moved " + source.string() + " -> " + destination.string());
        outcome.result = model::MoveResult::Success;
        return outcome;
    }

    if (ec == std::errc::cross_device_link) {
        util::Logger::info("MoveExecutor: " + source.string() + " is on another device, copying instead");
        return move_across_devices(std::move(outcome), source, destination);
    }

    return failed(std::move(outcome), "rename failed: " + ec.message());
}

model::MoveOutcome MoveExecutor::move_across_devices(model::MoveOutcome outcome,
                                                     const fs::path& source,
                                                     const fs::path& destination) {
    std::error_code ec;
    const std::uintmax_t source_size = file_ops_.file_size(source, ec);
    if (ec) {
        return failed(std::move(outcome), "cannot read source size: " + ec.message());
    }

    file_ops_.copy_file(source, destination, ec);
    if (ec) {
        std::string reason = "copy failed: " + ec.message();
        if (ec != std::errc::file_exists) {
            std::error_code cleanup_ec;
            file_ops_.remove(destination, cleanup_ec);
            if (cleanup_ec) {
                reason += " (partial copy left at " + destination.string() + ")";
            }
        }
        return failed(std::move(outcome), reason);
    }

    const std::uintmax_t copied_size = file_ops_.file_size(destination, ec);
    if (ec || copied_size != source_size) {
        std::string reason = ec
            ? "cannot verify copy: " + ec.message()
            : "copy verification failed: expected " + std::to_string(source_size) + " bytes, found " +
                  std::to_string(copied_size);
        std::error_code cleanup_ec;
        file_ops_.remove(destination, cleanup_ec);
        if (cleanup_ec) {
            reason += " (partial copy left at " + destination.string() + ")";
        }
        return failed(std::move(outcome), reason);
    }

    // From here on both copies exist until the source is gone
    file_ops_.remove(source, ec);
    if (ec) {
        return failed(std::move(outcome), "copied to " + destination.string() +
                                              " but could not remove source: " + ec.message());
    }

    util::Logger::info("MoveExecutor: Copied " + source.string() + " -> " + destination.string() + " (cross-device move)");
    outcome.result = model::MoveResult::Success;
    return outcome;
}

}  // namespace tagmv::core
