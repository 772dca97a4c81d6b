#include "codecstore/role_map.hpp"
#include <strings.h>

namespace codecstore {

namespace {

struct MimeToRole {
    const char* mime;
    const char* decoder_role;
    const char* encoder_role;
};

constexpr MimeToRole kMimeToRole[] = {
    { "audio/mpeg",               "audio_decoder.mp3",          "audio_encoder.mp3" },
    { "audio/mpeg-L1",            "audio_decoder.mp1",          "audio_encoder.mp1" },
    { "audio/mpeg-L2",            "audio_decoder.mp2",          "audio_encoder.mp2" },
    { "audio/3gpp",               "audio_decoder.amrnb",        "audio_encoder.amrnb" },
    { "audio/amr-wb",             "audio_decoder.amrwb",        "audio_encoder.amrwb" },
    { "audio/mp4a-latm",          "audio_decoder.aac",          "audio_encoder.aac" },
    { "audio/vorbis",             "audio_decoder.vorbis",       "audio_encoder.vorbis" },
    { "audio/opus",               "audio_decoder.opus",         "audio_encoder.opus" },
    { "audio/g711-mlaw",          "audio_decoder.g711mlaw",     "audio_encoder.g711mlaw" },
    { "audio/g711-alaw",          "audio_decoder.g711alaw",     "audio_encoder.g711alaw" },
    { "video/avc",                "video_decoder.avc",          "video_encoder.avc" },
    { "video/hevc",               "video_decoder.hevc",         "video_encoder.hevc" },
    { "video/mp4v-es",            "video_decoder.mpeg4",        "video_encoder.mpeg4" },
    { "video/3gpp",               "video_decoder.h263",         "video_encoder.h263" },
    { "video/x-vnd.on2.vp8",      "video_decoder.vp8",          "video_encoder.vp8" },
    { "video/x-vnd.on2.vp9",      "video_decoder.vp9",          "video_encoder.vp9" },
    { "video/av01",               "video_decoder.av1",          "video_encoder.av1" },
    { "audio/raw",                "audio_decoder.raw",          "audio_encoder.raw" },
    { "video/dolby-vision",       "video_decoder.dolby-vision", "video_encoder.dolby-vision" },
    { "audio/flac",               "audio_decoder.flac",         "audio_encoder.flac" },
    { "audio/gsm",                "audio_decoder.gsm",          "audio_encoder.gsm" },
    { "video/mpeg2",              "video_decoder.mpeg2",        "video_encoder.mpeg2" },
    { "audio/ac3",                "audio_decoder.ac3",          "audio_encoder.ac3" },
    { "audio/eac3",               "audio_decoder.eac3",         "audio_encoder.eac3" },
    { "image/vnd.android.heic",   "image_decoder.heic",         "image_encoder.heic" },
};

} // namespace

const char* component_role(bool is_encoder, const char* mime) {
    if (!mime) return nullptr;
    for (const auto& entry : kMimeToRole) {
        if (strcasecmp(mime, entry.mime) == 0) {
            return is_encoder ? entry.encoder_role : entry.decoder_role;
        }
    }
    return nullptr;
}

} // namespace codecstore
