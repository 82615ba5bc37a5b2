#pragma once

#include "model/Move.hpp"
#include <optional>
#include <string>

namespace tagmv::backend {

class TagReader {
public:
    // Read artist/album/title/track from the file's embedded tags.
    // Returns nullopt when the file can't be opened or has none of them;
    // callers treat that the same as "no tags".
    static std::optional<model::TagRecord> read(const std::string& path);

    // "01/12" -> 1, "3 of 10" -> 3; nullopt for 0 or anything unparsable.
    static std::optional<unsigned> parse_track_number(const std::string& text);

private:
    // Helper parsers using native libraries
    static bool read_mp3(const std::string& path, model::TagRecord& tags);
    static bool read_sndfile(const std::string& path, model::TagRecord& tags);
    static bool read_libav(const std::string& path, model::TagRecord& tags);
};

}  // namespace tagmv::backend
