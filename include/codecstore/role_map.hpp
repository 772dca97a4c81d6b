#pragma once

namespace codecstore {

// Standard component role for a media type, e.g. (false, "video/avc") ->
// "video_decoder.avc". Case-insensitive; nullptr for unknown types.
const char* component_role(bool is_encoder, const char* mime);

} // namespace codecstore
