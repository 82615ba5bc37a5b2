#pragma once

#include "model/Move.hpp"
#include "util/FileOps.hpp"
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace tagmv::core {

/**
 * ConflictResolver: turns the batch of planned destinations into a set of
 * pairwise distinct final destinations.
 *
 * Plans are processed in input (scan) order, which is also the tie-break:
 * the first file to ask for a name gets it, later ones are suffixed
 * " (1)", " (2)", ... before the extension. A destination that is the
 * file's own current location becomes a Skip.
 *
 * A name counts as taken when an earlier file in the batch claimed it or
 * when something other than the file itself already exists there on disk.
 * If the disk cannot be checked for a name, the file is rejected with the
 * underlying error instead of trying further suffixes.
 */
class ConflictResolver {
public:
    static constexpr unsigned MAX_CONFLICT_ATTEMPTS = 10000;
    static constexpr const char* TOO_MANY_CONFLICTS = "too many naming conflicts";

    ConflictResolver(std::filesystem::path root, util::FileOps& file_ops);

    [[nodiscard]] std::vector<model::ResolvedMove> resolve(const std::vector<model::PlannedMove>& plans);

    // "A/01 - T.mp3" + 2 -> "A/01 - T (2).mp3"
    static std::string with_suffix(const std::string& relative_path, unsigned counter);

    // Source location relative to the root, '/'-separated.
    std::string current_relative_path(const model::SourceFile& file) const;

private:
    bool occupied_on_disk(const std::string& relative_path, std::error_code& ec);

    std::filesystem::path root_;
    util::FileOps& file_ops_;

    // Destination -> number of times it was handed out in the current batch
    std::unordered_map<std::string, unsigned> claimed_;
};

}  // namespace tagmv::core
