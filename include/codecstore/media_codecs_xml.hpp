#pragma once
#include "codec_store.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace codecstore {

struct LoaderOptions {
    std::vector<std::string> search_dirs{"/odm/etc", "/vendor/etc", "/etc"};
    std::string main_xml = "media_codecs.xml";
    std::string performance_xml = "media_codecs_performance.xml";  // optional, skipped if absent
    std::vector<std::string> extra_files;                          // parsed after the above
    std::string default_owner = "default";                         // owner of codecs without owner=
    std::optional<std::string> prefix;                             // else common prefix of codec names
};

// Parses the media codecs XML files and registers their settings (service
// attributes) and roles into the builder. Providers are not touched.
Status load_media_codecs(const LoaderOptions& opts, CodecStore::Builder& builder);

} // namespace codecstore
