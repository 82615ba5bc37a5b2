#include "../framework/SimpleTest.hpp"
#include "../framework/TempDir.hpp"
#include "backend/TagReader.hpp"

using namespace tagmv::backend;

TEST_CASE(test_track_number_parsing) {
    ASSERT_EQ(TagReader::parse_track_number("1"), std::optional<unsigned>(1));
    ASSERT_EQ(TagReader::parse_track_number("01/12"), std::optional<unsigned>(1));
    ASSERT_EQ(TagReader::parse_track_number(" 3 of 10 "), std::optional<unsigned>(3));
    ASSERT_EQ(TagReader::parse_track_number("120"), std::optional<unsigned>(120));
    ASSERT_FALSE(TagReader::parse_track_number("0").has_value());
    ASSERT_FALSE(TagReader::parse_track_number("").has_value());
    ASSERT_FALSE(TagReader::parse_track_number("A1").has_value());
}

TEST_CASE(test_tag_reader_nonexistent_file) {
    ASSERT_FALSE(TagReader::read("/nonexistent/dir/track.mp3").has_value());
    ASSERT_FALSE(TagReader::read("/nonexistent/dir/track.flac").has_value());
    ASSERT_FALSE(TagReader::read("/nonexistent/dir/track.m4a").has_value());
}

TEST_CASE(test_tag_reader_garbage_means_no_tags) {
    tagmv::test::TempDir tmp("tagmv_tags");
    auto flac = tmp.write("garbage.flac", "dummy content");
    auto m4a = tmp.write("garbage.m4a", "dummy content");

    ASSERT_FALSE(TagReader::read(flac.string()).has_value());
    ASSERT_FALSE(TagReader::read(m4a.string()).has_value());
}

int main() {
    return tagmv::test::TestRunner::instance().run_all();
}
