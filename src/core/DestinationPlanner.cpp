#include "core/DestinationPlanner.hpp"
#include "util/Logger.hpp"
#include "util/Sanitizer.hpp"
#include <format>

namespace tagmv::core {

bool DestinationPlanner::is_sortable(const model::SourceFile& file) {
    return file.tags
        && !util::trim(file.tags->artist).empty()
        && !util::trim(file.tags->album).empty();
}

std::string DestinationPlanner::track_prefix(const std::optional<unsigned>& track_number) {
    if (!track_number) return "";
    return std::format("{:02} - ", *track_number);
}

model::PlannedMove DestinationPlanner::plan(const model::SourceFile& file) {
    model::PlannedMove planned;
    planned.source = file;

    // Extension is kept byte-for-byte, case included
    const std::string stem = file.path.stem().string();
    const std::string extension = file.path.extension().string();

    if (!is_sortable(file)) {
        planned.relative_destination = std::string(UNSORTED_FOLDER) + "/" + util::sanitize(stem) + extension;
        planned.is_unsorted = true;
        util::Logger::debug("Planner: " + file.path.string() + " -> " + planned.relative_destination + " (no usable tags)");
        return planned;
    }

    const model::TagRecord& tags = *file.tags;
    const std::string folder = util::sanitize(tags.artist) + " - " + util::sanitize(tags.album);
    const std::string title_source = util::trim(tags.title).empty() ? stem : tags.title;

    planned.relative_destination = folder + "/" + track_prefix(tags.track_number) + util::sanitize(title_source) + extension;
    planned.is_unsorted = false;
    util::Logger::debug("Planner: " + file.path.string() + " -> " + planned.relative_destination);
    return planned;
}

}  // namespace tagmv::core
