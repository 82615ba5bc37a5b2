#pragma once

#include "model/Move.hpp"
#include <string>

namespace tagmv::core {

class DestinationPlanner {
public:
    // Folder that collects files without usable artist/album tags.
    static constexpr const char* UNSORTED_FOLDER = "_Unsorted";

    // Map one file to "<Artist> - <Album>/<NN - ><Title><ext>" or to
    // "_Unsorted/<stem><ext>". Pure; never fails.
    static model::PlannedMove plan(const model::SourceFile& file);

    // A file is sortable when it has tags with non-blank artist and album.
    static bool is_sortable(const model::SourceFile& file);

    // "01 - " for 1, "100 - " for 100, "" when absent.
    static std::string track_prefix(const std::optional<unsigned>& track_number);
};

}  // namespace tagmv::core
