#include "model/Move.hpp"
#include <algorithm>

namespace tagmv::model {

std::size_t Report::moved_count() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const MoveOutcome& o) {
        return o.move.action == MoveAction::Move && o.result == MoveResult::Success;
    }));
}

std::size_t Report::skipped_count() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const MoveOutcome& o) {
        return o.move.action == MoveAction::Skip;
    }));
}

std::size_t Report::failed_count() const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const MoveOutcome& o) {
        return o.result == MoveResult::Failed;
    }));
}

}  // namespace tagmv::model
