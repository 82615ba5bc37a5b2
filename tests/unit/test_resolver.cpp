#include "../framework/SimpleTest.hpp"
#include "../framework/FakeFileOps.hpp"
#include "core/ConflictResolver.hpp"
#include "core/DestinationPlanner.hpp"
#include <set>

using namespace tagmv::core;
using namespace tagmv::model;

static PlannedMove plan_at(const std::string& source, const std::string& destination, bool unsorted = false) {
    return PlannedMove{SourceFile{source, std::nullopt}, destination, unsorted};
}

TEST_CASE(test_with_suffix_inserts_before_extension) {
    ASSERT_EQ(ConflictResolver::with_suffix("Artist - Album/01 - Title.mp3", 1), "Artist - Album/01 - Title (1).mp3");
    ASSERT_EQ(ConflictResolver::with_suffix("_Unsorted/a.b.flac", 12), "_Unsorted/a.b (12).flac");
    ASSERT_EQ(ConflictResolver::with_suffix("Dir.v2/noext", 2), "Dir.v2/noext (2)");
}

TEST_CASE(test_resolve_intra_batch_collision_first_wins) {
    tagmv::test::FakeDiskOps disk;
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/file1.mp3", "Artist - Album/01 - Title.mp3"),
        plan_at("/music/file2.mp3", "Artist - Album/01 - Title.mp3"),
        plan_at("/music/file3.mp3", "Artist - Album/01 - Title.mp3"),
    });

    ASSERT_EQ(resolved.size(), 3u);
    ASSERT_EQ(resolved[0].final_destination, "Artist - Album/01 - Title.mp3");
    ASSERT_EQ(resolved[1].final_destination, "Artist - Album/01 - Title (1).mp3");
    ASSERT_EQ(resolved[2].final_destination, "Artist - Album/01 - Title (2).mp3");
    ASSERT_EQ(resolved[0].plan.source.path, std::filesystem::path("/music/file1.mp3"));
    for (const auto& r : resolved) {
        ASSERT_TRUE(r.action == MoveAction::Move);
    }
    ASSERT_EQ(disk.mutations, 0);
}

TEST_CASE(test_resolve_existing_file_on_disk_is_avoided) {
    tagmv::test::FakeDiskOps disk;
    disk.existing.insert("/music/A - B/01 - T.mp3");
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({plan_at("/music/new.mp3", "A - B/01 - T.mp3")});

    ASSERT_EQ(resolved[0].final_destination, "A - B/01 - T (1).mp3");
    ASSERT_TRUE(resolved[0].action == MoveAction::Move);
}

TEST_CASE(test_resolve_file_in_place_is_skipped) {
    tagmv::test::FakeDiskOps disk;
    disk.existing.insert("/music/A - B/01 - T.mp3");
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({plan_at("/music/A - B/01 - T.mp3", "A - B/01 - T.mp3")});

    ASSERT_TRUE(resolved[0].action == MoveAction::Skip);
    ASSERT_EQ(resolved[0].final_destination, "A - B/01 - T.mp3");
}

TEST_CASE(test_resolve_skip_still_reserves_its_name) {
    tagmv::test::FakeDiskOps disk;
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/A - B/01 - T.mp3", "A - B/01 - T.mp3"),
        plan_at("/music/other.mp3", "A - B/01 - T.mp3"),
    });

    ASSERT_TRUE(resolved[0].action == MoveAction::Skip);
    ASSERT_EQ(resolved[1].final_destination, "A - B/01 - T (1).mp3");
}

TEST_CASE(test_resolve_previously_suffixed_files_stay_put) {
    // "T (1).mp3" sorts before "T.mp3", so it is resolved first
    tagmv::test::FakeDiskOps disk;
    disk.existing.insert("/music/A - B/T.mp3");
    disk.existing.insert("/music/A - B/T (1).mp3");
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/A - B/T (1).mp3", "A - B/T.mp3"),
        plan_at("/music/A - B/T.mp3", "A - B/T.mp3"),
    });

    ASSERT_TRUE(resolved[0].action == MoveAction::Skip);
    ASSERT_EQ(resolved[0].final_destination, "A - B/T (1).mp3");
    ASSERT_TRUE(resolved[1].action == MoveAction::Skip);
    ASSERT_EQ(resolved[1].final_destination, "A - B/T.mp3");
}

TEST_CASE(test_resolve_is_case_sensitive) {
    tagmv::test::FakeDiskOps disk;
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/1.mp3", "A - B/Song.mp3"),
        plan_at("/music/2.mp3", "A - B/song.mp3"),
    });

    ASSERT_EQ(resolved[0].final_destination, "A - B/Song.mp3");
    ASSERT_EQ(resolved[1].final_destination, "A - B/song.mp3");
}

TEST_CASE(test_resolve_sanitized_duplicates_are_disambiguated) {
    // "What?" and "What*" sanitize to the same name
    tagmv::test::FakeDiskOps disk;
    ConflictResolver resolver("/music", disk);
    auto first = DestinationPlanner::plan(SourceFile{"/music/What?.mp3", std::nullopt});
    auto second = DestinationPlanner::plan(SourceFile{"/music/What*.mp3", std::nullopt});
    auto resolved = resolver.resolve({first, second});

    ASSERT_EQ(resolved[0].final_destination, "_Unsorted/What.mp3");
    ASSERT_EQ(resolved[1].final_destination, "_Unsorted/What (1).mp3");
}

TEST_CASE(test_resolve_unreadable_destination_is_rejected_with_error) {
    tagmv::test::FakeDiskOps disk;
    disk.unreadable.insert("/music/A - B/T.mp3");
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/x.mp3", "A - B/T.mp3"),
        plan_at("/music/y.mp3", "A - B/U.mp3"),
    });

    ASSERT_EQ(resolved.size(), 2u);
    ASSERT_TRUE(resolved[0].action == MoveAction::Reject);
    ASSERT_TRUE(resolved[0].final_destination.empty());
    ASSERT_TRUE(resolved[0].reject_reason.find("cannot check destination A - B/T.mp3") == 0);
    ASSERT_TRUE(resolved[0].reject_reason.find(std::make_error_code(std::errc::permission_denied).message()) !=
                std::string::npos);
    ASSERT_NE(resolved[0].reject_reason, std::string(ConflictResolver::TOO_MANY_CONFLICTS));

    // No suffixed names were tried for the rejected file
    ASSERT_EQ(disk.lookups, 2);
    ASSERT_TRUE(resolved[1].action == MoveAction::Move);
    ASSERT_EQ(resolved[1].final_destination, "A - B/U.mp3");
}

TEST_CASE(test_resolve_gives_up_after_too_many_conflicts) {
    tagmv::test::FakeDiskOps disk;
    disk.existing.insert("/music/A - B/T.mp3");
    for (unsigned i = 1; i <= ConflictResolver::MAX_CONFLICT_ATTEMPTS; ++i) {
        disk.existing.insert("/music/" + ConflictResolver::with_suffix("A - B/T.mp3", i));
    }
    ConflictResolver resolver("/music", disk);
    auto resolved = resolver.resolve({
        plan_at("/music/x.mp3", "A - B/T.mp3"),
        plan_at("/music/y.mp3", "A - B/U.mp3"),
    });

    ASSERT_TRUE(resolved[0].action == MoveAction::Reject);
    ASSERT_EQ(resolved[0].reject_reason, "too many naming conflicts");
    ASSERT_TRUE(resolved[0].final_destination.empty());
    ASSERT_TRUE(resolved[1].action == MoveAction::Move);
    ASSERT_EQ(resolved[1].final_destination, "A - B/U.mp3");
}

TEST_CASE(test_resolve_destinations_pairwise_distinct) {
    tagmv::test::FakeDiskOps disk;
    disk.existing.insert("/music/A - B/T (2).mp3");
    ConflictResolver resolver("/music", disk);
    std::vector<PlannedMove> plans;
    for (int i = 0; i < 20; ++i) {
        plans.push_back(plan_at("/music/f" + std::to_string(i) + ".mp3", i % 2 ? "A - B/T.mp3" : "A - B/T (1).mp3"));
    }
    auto resolved = resolver.resolve(plans);

    std::set<std::string> seen;
    for (const auto& r : resolved) {
        ASSERT_TRUE(seen.insert(r.final_destination).second);
        ASSERT_NE(r.final_destination, "A - B/T (2).mp3");
    }
    ASSERT_EQ(seen.size(), plans.size());
}

int main() {
    return tagmv::test::TestRunner::instance().run_all();
}
