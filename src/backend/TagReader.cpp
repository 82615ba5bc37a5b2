#include "backend/TagReader.hpp"
#include "util/Logger.hpp"
#include "util/Sanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

/*
 * Tag extraction reuses the decoding libraries rather than a dedicated tag
 * library:
 *  - MP3: libmpg123 ID3v2 text frames, ID3v1/1.1 as fallback
 *  - FLAC, OGG/Vorbis, WAV: libsndfile's sf_get_string
 *  - M4A, AAC, WMA: FFmpeg libavformat's container metadata dictionary
 */

namespace tagmv::backend {

using util::trim;

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

namespace {
    std::string lower_extension(const std::string& path) {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return ext;
    }

    bool has_any_field(const model::TagRecord& tags) {
        return !tags.artist.empty() || !tags.album.empty() || !tags.title.empty() || tags.track_number;
    }
}

std::optional<unsigned> TagReader::parse_track_number(const std::string& text) {
    std::string value = trim(text);
    size_t end_pos = std::min(value.find('/'), value.find(' '));
    if (end_pos != std::string::npos) {
        value = value.substr(0, end_pos);
    }

    unsigned number = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
    if (ec != std::errc() || ptr == value.data() || number == 0) {
        return std::nullopt;
    }
    return number;
}

std::optional<model::TagRecord> TagReader::read(const std::string& path) {
    model::TagRecord tags;
    const std::string ext = lower_extension(path);

    bool opened = false;
    if (ext == ".mp3") {
        opened = read_mp3(path, tags);
    } else if (ext == ".flac" || ext == ".ogg" || ext == ".wav") {
        opened = read_sndfile(path, tags);
    } else {
        opened = read_libav(path, tags);
    }

    if (!opened) {
        util::Logger::debug("TagReader: Could not read tags from " + path);
        return std::nullopt;
    }
    if (!has_any_field(tags)) {
        util::Logger::debug("TagReader: No tags in " + path);
        return std::nullopt;
    }
    return tags;
}

bool TagReader::read_mp3(const std::string& path, model::TagRecord& tags) {
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return false;

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        mpg123_delete(mh);
        return false;
    }

    // Scan parses the whole stream, including the ID3 tags
    mpg123_scan(mh);

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (v2->title && v2->title->p) tags.title = trim(v2->title->p);
            if (v2->artist && v2->artist->p) tags.artist = trim(v2->artist->p);
            if (v2->album && v2->album->p) tags.album = trim(v2->album->p);

            for (size_t i = 0; i < v2->texts; ++i) {
                if (std::strncmp(v2->text[i].id, "TRCK", 4) == 0) {
                    if (v2->text[i].text.p) {
                        tags.track_number = parse_track_number(v2->text[i].text.p);
                    }
                    break;
                }
            }
        } else if (v1) {
            // Fixed-width fields, not necessarily NUL-terminated
            tags.title = trim(std::string(v1->title, strnlen(v1->title, sizeof(v1->title))));
            tags.artist = trim(std::string(v1->artist, strnlen(v1->artist, sizeof(v1->artist))));
            tags.album = trim(std::string(v1->album, strnlen(v1->album, sizeof(v1->album))));

            // ID3v1.1: track number is in comment[29] if comment[28] is null
            if (v1->comment[28] == 0 && v1->comment[29] != 0) {
                tags.track_number = static_cast<unsigned char>(v1->comment[29]);
            }
        }
    }
    mpg123_close(mh);
    mpg123_delete(mh);
    return true;
}

bool TagReader::read_sndfile(const std::string& path, model::TagRecord& tags) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) return false;

    auto get_tag = [&](int tag_id) -> std::string {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? trim(val) : "";
    };

    tags.title = get_tag(SF_STR_TITLE);
    tags.artist = get_tag(SF_STR_ARTIST);
    tags.album = get_tag(SF_STR_ALBUM);
    tags.track_number = parse_track_number(get_tag(SF_STR_TRACKNUMBER));

    sf_close(sndfile);
    return true;
}

bool TagReader::read_libav(const std::string& path, model::TagRecord& tags) {
    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[256];
        av_strerror(ret, errbuf, sizeof(errbuf));
        util::Logger::debug("TagReader: libavformat could not open " + path + " (" + errbuf + ")");
        return false;
    }

    auto get_tag = [&](const char* key) -> std::string {
        const AVDictionaryEntry* entry = av_dict_get(format_ctx->metadata, key, nullptr, 0);
        return (entry && entry->value) ? trim(entry->value) : "";
    };

    tags.title = get_tag("title");
    tags.artist = get_tag("artist");
    tags.album = get_tag("album");
    tags.track_number = parse_track_number(get_tag("track"));

    avformat_close_input(&format_ctx);
    return true;
}

}  // namespace tagmv::backend
