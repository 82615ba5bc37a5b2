#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tagmv::model {

// Tags as extracted from the file; empty strings mean "missing".
struct TagRecord {
    std::string artist;
    std::string album;
    std::string title;
    std::optional<unsigned> track_number;

    bool operator==(const TagRecord&) const = default;
};

struct SourceFile {
    std::filesystem::path path;  // absolute, under the scan root
    std::optional<TagRecord> tags;
};

struct PlannedMove {
    SourceFile source;
    std::string relative_destination;  // '/'-separated, relative to the scan root
    bool is_unsorted = false;
};

enum class MoveAction {
    Move,
    Skip,    // already at its final destination
    Reject,  // no free destination could be found
};

struct ResolvedMove {
    PlannedMove plan;
    std::string final_destination;  // empty for Reject
    MoveAction action = MoveAction::Move;
    std::string reject_reason;
};

enum class MoveResult {
    Success,
    Failed,
};

struct MoveOutcome {
    ResolvedMove move;
    MoveResult result = MoveResult::Success;
    std::string reason;  // set when result == Failed
};

struct Report {
    std::size_t total_files = 0;
    std::size_t folder_count = 0;
    std::size_t unsorted_count = 0;
    std::vector<MoveOutcome> outcomes;

    std::size_t moved_count() const;
    std::size_t skipped_count() const;
    std::size_t failed_count() const;
    bool has_failures() const { return failed_count() > 0; }
};

}  // namespace tagmv::model
