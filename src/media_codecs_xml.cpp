#include "codecstore/media_codecs_xml.hpp"
#include "codecstore/prefix_policy.hpp"
#include "codecstore/reporting.hpp"
#include "codecstore/role_map.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <expat.h>
#include <strings.h>

namespace codecstore {

namespace {

constexpr const char kTag[] = "media-codecs-xml";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool has_prefix(const char* s, const char* prefix) {
    return std::strncmp(s, prefix, std::strlen(prefix)) == 0;
}

// Accepts the boolean spellings used by codec configuration files.
std::optional<bool> parse_boolean(const char* s) {
    if (!s) return std::nullopt;
    if (!strcasecmp(s, "1") || !strcasecmp(s, "true") || !strcasecmp(s, "yes") || !strcasecmp(s, "y"))
        return true;
    if (!strcasecmp(s, "0") || !strcasecmp(s, "false") || !strcasecmp(s, "no") || !strcasecmp(s, "n"))
        return false;
    return std::nullopt;
}

bool is_range_limit(const char* name) {
    static const char* const kRangeLimits[] = {
        "aspect-ratio", "bitrate", "block-count", "blocks", "blocks-per-second", "complexity",
        "frame-rate", "quality", "size", "measured-blocks-per-second",
    };
    for (const char* n : kRangeLimits) {
        if (str_eq(name, n)) return true;
    }
    return has_prefix(name, "measured-frame-rate-");
}

std::optional<std::string> find_in_dirs(const std::vector<std::string>& dirs, const std::string& name) {
    for (const auto& dir : dirs) {
        std::filesystem::path p = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(p, ec)) return p.string();
    }
    return std::nullopt;
}

struct TypeEntry {
    std::string name;
    AttributeList attrs;

    void set(const std::string& key, const std::string& value) {
        for (auto& a : attrs) {
            if (a.key == key) {
                a.value = value;
                return;
            }
        }
        attrs.push_back({key, value});
    }
};

struct CodecEntry {
    std::string name;
    std::string owner;
    bool is_encoder{false};
    std::vector<TypeEntry> types;

    size_t find_type(const std::string& type) const {
        for (size_t i = 0; i < types.size(); ++i) if (types[i].name == type) return i;
        return types.size();
    }
};

enum class Section {
    TopLevel,
    Settings,
    Decoders,
    Decoder,
    DecoderType,
    Encoders,
    Encoder,
    EncoderType,
    Include,
};

class MediaCodecsParser {
public:
    MediaCodecsParser(CodecStore::Builder& builder, std::string default_owner)
        : builder_(builder), default_owner_(std::move(default_owner)) {}

    Status parse_file(const std::string& path);

    const std::vector<CodecEntry>& codecs() const { return codecs_; }

private:
    static void XMLCALL start_element_wrapper(void* me, const char* name, const char** attrs) {
        static_cast<MediaCodecsParser*>(me)->start_element(name, attrs);
    }
    static void XMLCALL end_element_wrapper(void* me, const char* name) {
        static_cast<MediaCodecsParser*>(me)->end_element(name);
    }

    void start_element(const char* name, const char** attrs);
    void end_element(const char* name);

    Status include_file(const char** attrs);
    Status add_setting(const char** attrs);
    Status add_codec(bool is_encoder, const char** attrs);
    Status add_type(const char** attrs);
    Status add_limit(const char** attrs);
    Status add_feature(const char** attrs);

    Status limit_error(const char* name, const std::string& msg) {
        reporting::error(kTag, std::string("limit '") + name + "' " + msg);
        return Status::BadValue;
    }

    CodecStore::Builder& builder_;
    std::string default_owner_;
    Status status_{Status::Ok};

    Section section_{Section::TopLevel};
    std::vector<Section> section_stack_;
    std::vector<std::string> file_stack_;

    CodecEntry* codec() { return current_codec_ == kNone ? nullptr : &codecs_[current_codec_]; }
    TypeEntry* type() {
        CodecEntry* c = codec();
        return c && current_type_ != kNone ? &c->types[current_type_] : nullptr;
    }

    static constexpr size_t kNone = static_cast<size_t>(-1);

    std::vector<CodecEntry> codecs_;
    std::unordered_map<std::string, size_t> codec_index_;
    size_t current_codec_{kNone};
    size_t current_type_{kNone};
};

Status MediaCodecsParser::parse_file(const std::string& path) {
    if (status_ != Status::Ok) return status_;
    if (std::find(file_stack_.begin(), file_stack_.end(), path) != file_stack_.end()) {
        reporting::error(kTag, "include cycle through " + path);
        return status_ = Status::BadValue;
    }

    std::unique_ptr<FILE, int (*)(FILE*)> file(std::fopen(path.c_str(), "r"), &std::fclose);
    if (!file) {
        int err = errno;
        reporting::error(kTag, "unable to open " + path + ": " + std::strerror(err));
        return status_ = (err == ENOENT ? Status::NameNotFound : Status::IoError);
    }

    std::unique_ptr<XML_ParserStruct, void (*)(XML_Parser)> parser(::XML_ParserCreate(nullptr),
                                                                    &::XML_ParserFree);
    if (!parser) {
        reporting::error(kTag, "XML_ParserCreate() failed");
        return status_ = Status::NoInit;
    }
    ::XML_SetUserData(parser.get(), this);
    ::XML_SetElementHandler(parser.get(), start_element_wrapper, end_element_wrapper);

    reporting::debug(kTag, "parsing " + path);
    file_stack_.push_back(path);

    static constexpr int kBuffSize = 512;
    while (status_ == Status::Ok) {
        void* buff = ::XML_GetBuffer(parser.get(), kBuffSize);
        if (!buff) {
            reporting::error(kTag, "XML_GetBuffer() failed");
            status_ = Status::NoInit;
            break;
        }
        size_t bytes_read = std::fread(buff, 1, kBuffSize, file.get());
        if (bytes_read == 0 && std::ferror(file.get())) {
            reporting::error(kTag, "read error on " + path);
            status_ = Status::IoError;
            break;
        }
        XML_Status st = ::XML_ParseBuffer(parser.get(), static_cast<int>(bytes_read), bytes_read == 0);
        if (st != XML_STATUS_OK) {
            if (status_ == Status::Ok) {
                reporting::error(kTag, path + ":" + std::to_string(::XML_GetCurrentLineNumber(parser.get())) +
                                 ": malformed (" + ::XML_ErrorString(::XML_GetErrorCode(parser.get())) + ")");
                status_ = Status::Malformed;
            }
            break;
        }
        if (bytes_read == 0) break;
    }

    file_stack_.pop_back();
    return status_;
}

void MediaCodecsParser::start_element(const char* name, const char** attrs) {
    if (status_ != Status::Ok) return;

    if (str_eq(name, "Include")) {
        status_ = include_file(attrs);
        if (status_ == Status::Ok) {
            section_stack_.push_back(section_);
            section_ = Section::Include;
        }
        return;
    }

    bool in_type = true;
    switch (section_) {
        case Section::TopLevel:
            if (str_eq(name, "Decoders")) {
                section_ = Section::Decoders;
            } else if (str_eq(name, "Encoders")) {
                section_ = Section::Encoders;
            } else if (str_eq(name, "Settings")) {
                section_ = Section::Settings;
            }
            break;

        case Section::Settings:
            if (str_eq(name, "Setting")) status_ = add_setting(attrs);
            break;

        case Section::Decoders:
        case Section::Encoders:
            if (str_eq(name, "MediaCodec")) {
                bool encoder = section_ == Section::Encoders;
                status_ = add_codec(encoder, attrs);
                section_ = encoder ? Section::Encoder : Section::Decoder;
            }
            break;

        case Section::Decoder:
        case Section::Encoder:
            if (str_eq(name, "Quirk")) {
                reporting::debug(kTag, "ignoring quirk on " + codec()->name);
            } else if (str_eq(name, "Type")) {
                status_ = add_type(attrs);
                section_ = section_ == Section::Decoder ? Section::DecoderType : Section::EncoderType;
            }
            in_type = false;
            // fall through
        case Section::DecoderType:
        case Section::EncoderType: {
            bool outside = !in_type && type() == nullptr;
            if (outside && (str_eq(name, "Limit") || str_eq(name, "Feature"))) {
                reporting::warn(kTag, std::string("ignoring ") + name + " specified outside of a Type");
            } else if (str_eq(name, "Limit")) {
                status_ = add_limit(attrs);
            } else if (str_eq(name, "Feature")) {
                status_ = add_feature(attrs);
            }
            break;
        }

        default:
            break;
    }
}

void MediaCodecsParser::end_element(const char* name) {
    if (status_ != Status::Ok) return;

    switch (section_) {
        case Section::Settings:
            if (str_eq(name, "Settings")) section_ = Section::TopLevel;
            break;
        case Section::Decoders:
            if (str_eq(name, "Decoders")) section_ = Section::TopLevel;
            break;
        case Section::Encoders:
            if (str_eq(name, "Encoders")) section_ = Section::TopLevel;
            break;
        case Section::DecoderType:
        case Section::EncoderType:
            if (str_eq(name, "Type")) {
                section_ = section_ == Section::DecoderType ? Section::Decoder : Section::Encoder;
                current_type_ = kNone;
            }
            break;
        case Section::Decoder:
            if (str_eq(name, "MediaCodec")) {
                section_ = Section::Decoders;
                current_codec_ = kNone;
                current_type_ = kNone;
            }
            break;
        case Section::Encoder:
            if (str_eq(name, "MediaCodec")) {
                section_ = Section::Encoders;
                current_codec_ = kNone;
                current_type_ = kNone;
            }
            break;
        case Section::Include:
            if (str_eq(name, "Include") && !section_stack_.empty()) {
                section_ = section_stack_.back();
                section_stack_.pop_back();
            }
            break;
        default:
            break;
    }
}

Status MediaCodecsParser::include_file(const char** attrs) {
    const char* href = nullptr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (str_eq(attrs[i], "href")) {
            href = attrs[i + 1];
        } else {
            reporting::error(kTag, std::string("Include: unrecognized attribute ") + attrs[i]);
            return Status::BadValue;
        }
    }
    if (!href) {
        reporting::error(kTag, "Include without href");
        return Status::BadValue;
    }

    // Only plain media_codecs_*.xml siblings of the including file.
    std::string name(href);
    const std::string head = "media_codecs_";
    const std::string tail = ".xml";
    if (name.find('/') != std::string::npos || name.size() < head.size() + tail.size() ||
        name.compare(0, head.size(), head) != 0 ||
        name.compare(name.size() - tail.size(), tail.size(), tail) != 0) {
        reporting::error(kTag, "invalid include file name: " + name);
        return Status::BadValue;
    }

    std::filesystem::path dir = std::filesystem::path(file_stack_.back()).parent_path();
    std::string path = (dir / name).string();

    // Nested parse shares the section state; restore it afterwards.
    Section saved = section_;
    auto saved_stack = section_stack_;
    section_ = Section::TopLevel;
    section_stack_.clear();
    size_t saved_codec = current_codec_;
    size_t saved_type = current_type_;
    Status st = parse_file(path);
    section_ = saved;
    section_stack_ = std::move(saved_stack);
    current_codec_ = saved_codec;
    current_type_ = saved_type;
    return st;
}

Status MediaCodecsParser::add_setting(const char** attrs) {
    const char* name = nullptr;
    const char* value = nullptr;
    const char* update = nullptr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (str_eq(attrs[i], "name")) {
            name = attrs[i + 1];
        } else if (str_eq(attrs[i], "value")) {
            value = attrs[i + 1];
        } else if (str_eq(attrs[i], "update")) {
            update = attrs[i + 1];
        } else {
            reporting::error(kTag, std::string("Setting: unrecognized attribute ") + attrs[i]);
            return Status::BadValue;
        }
    }
    if (!name || !value) {
        reporting::error(kTag, "Setting requires name and value");
        return Status::BadValue;
    }
    bool is_update = false;
    if (update) {
        auto b = parse_boolean(update);
        if (!b) {
            reporting::error(kTag, std::string("Setting ") + name + ": bad update value " + update);
            return Status::BadValue;
        }
        is_update = *b;
    }
    Attribute attr{name, value};
    return is_update ? builder_.update_service_attribute(attr) : builder_.add_service_attribute(attr);
}

Status MediaCodecsParser::add_codec(bool is_encoder, const char** attrs) {
    const char* name = nullptr;
    const char* type = nullptr;
    const char* update = nullptr;
    const char* owner = nullptr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (str_eq(attrs[i], "name")) {
            name = attrs[i + 1];
        } else if (str_eq(attrs[i], "type")) {
            type = attrs[i + 1];
        } else if (str_eq(attrs[i], "update")) {
            update = attrs[i + 1];
        } else if (str_eq(attrs[i], "owner")) {
            owner = attrs[i + 1];
        } else {
            reporting::error(kTag, std::string("MediaCodec: unrecognized attribute ") + attrs[i]);
            return Status::BadValue;
        }
    }
    if (!name) {
        reporting::error(kTag, "MediaCodec without name");
        return Status::BadValue;
    }
    bool is_update = false;
    if (update) {
        auto b = parse_boolean(update);
        if (!b) {
            reporting::error(kTag, std::string("MediaCodec ") + name + ": bad update value " + update);
            return Status::BadValue;
        }
        is_update = *b;
    }

    current_type_ = kNone;
    auto it = codec_index_.find(name);
    if (it == codec_index_.end()) {
        if (is_update) {
            reporting::error(kTag, std::string("MediaCodec ") + name + " updated before it was declared");
            return Status::NameNotFound;
        }
        CodecEntry entry;
        entry.name = name;
        entry.owner = owner ? owner : default_owner_;
        entry.is_encoder = is_encoder;
        if (type) entry.types.push_back(TypeEntry{type, {}});
        current_codec_ = codecs_.size();
        if (type) current_type_ = 0;
        codec_index_.emplace(entry.name, current_codec_);
        codecs_.push_back(std::move(entry));
        return Status::Ok;
    }

    if (!is_update) {
        reporting::error(kTag, std::string("MediaCodec ") + name + " declared twice");
        return Status::AlreadyExists;
    }
    current_codec_ = it->second;
    CodecEntry& entry = codecs_[current_codec_];
    if (owner) entry.owner = owner;
    if (type) {
        size_t idx = entry.find_type(type);
        if (idx < entry.types.size()) current_type_ = idx;
        if (current_type_ == kNone) {
            reporting::error(kTag, std::string("MediaCodec ") + name + " has no type " + type + " to update");
            return Status::NameNotFound;
        }
    }
    return Status::Ok;
}

Status MediaCodecsParser::add_type(const char** attrs) {
    const char* name = nullptr;
    const char* update = nullptr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (str_eq(attrs[i], "name")) {
            name = attrs[i + 1];
        } else if (str_eq(attrs[i], "update")) {
            update = attrs[i + 1];
        } else {
            reporting::error(kTag, std::string("Type: unrecognized attribute ") + attrs[i]);
            return Status::BadValue;
        }
    }
    if (!name) {
        reporting::error(kTag, "Type without name");
        return Status::BadValue;
    }
    bool is_update = false;
    if (update) {
        auto b = parse_boolean(update);
        if (!b) return Status::BadValue;
        is_update = *b;
    }

    CodecEntry& entry = *codec();
    size_t idx = entry.find_type(name);
    bool exists = idx < entry.types.size();
    if (exists && !is_update) {
        reporting::error(kTag, entry.name + ": type " + name + " declared twice");
        return Status::AlreadyExists;
    }
    if (!exists && is_update) {
        reporting::error(kTag, entry.name + ": type " + name + " updated before it was declared");
        return Status::NameNotFound;
    }
    if (!exists) entry.types.push_back(TypeEntry{name, {}});
    current_type_ = idx;
    return Status::Ok;
}

Status MediaCodecsParser::add_limit(const char** attrs) {
    const char* a_name = nullptr;
    const char* a_default = nullptr;
    const char* a_in = nullptr;
    const char* a_max = nullptr;
    const char* a_min = nullptr;
    const char* a_range = nullptr;
    const char* a_ranges = nullptr;
    const char* a_scale = nullptr;
    const char* a_value = nullptr;

    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        const char* key = attrs[i];
        const char* val = attrs[i + 1];
        if (str_eq(key, "name")) a_name = val;
        else if (str_eq(key, "default")) a_default = val;
        else if (str_eq(key, "in")) a_in = val;
        else if (str_eq(key, "max")) a_max = val;
        else if (str_eq(key, "min")) a_min = val;
        else if (str_eq(key, "range")) a_range = val;
        else if (str_eq(key, "ranges")) a_ranges = val;
        else if (str_eq(key, "scale")) a_scale = val;
        else if (str_eq(key, "value")) a_value = val;
        else {
            reporting::error(kTag, std::string("Limit: unrecognized attribute ") + key);
            return Status::BadValue;
        }
    }
    if (!a_name) {
        reporting::error(kTag, "Limit without name");
        return Status::BadValue;
    }

    if (is_range_limit(a_name)) {
        std::string range;
        if (a_min && a_max) {
            if (a_range || a_value) return limit_error(a_name, "has min/max as well as range or value");
            range = std::string(a_min) + "-" + a_max;
        } else if (a_min || a_max) {
            return limit_error(a_name, a_min ? "is missing 'max'" : "is missing 'min'");
        } else if (a_value) {
            if (a_range) return limit_error(a_name, "has both range and value");
            range = std::string(a_value) + "-" + a_value;
        } else if (a_range) {
            range = a_range;
        } else {
            return limit_error(a_name, "is missing a range");
        }

        if (str_eq(a_name, "aspect-ratio")) {
            if (!a_in) return limit_error(a_name, "is missing 'in'");
            if (str_eq(a_in, "pixels")) {
                type()->set("pixel-aspect-ratio-range", range);
            } else if (str_eq(a_in, "blocks")) {
                type()->set("block-aspect-ratio-range", range);
            } else {
                return limit_error(a_name, std::string("has bad 'in' value ") + a_in);
            }
        } else {
            type()->set(std::string(a_name) + "-range", range);
        }
    } else if (str_eq(a_name, "alignment") || str_eq(a_name, "block-size")) {
        if (!a_value) return limit_error(a_name, "is missing 'value'");
        type()->set(a_name, a_value);
    } else if (str_eq(a_name, "channel-count") || str_eq(a_name, "concurrent-instances")) {
        if (!a_max) return limit_error(a_name, "is missing 'max'");
        type()->set(std::string("max-") + a_name, a_max);
    } else if (str_eq(a_name, "sample-rate")) {
        if (!a_ranges) return limit_error(a_name, "is missing 'ranges'");
        type()->set("sample-rate-ranges", a_ranges);
    } else {
        reporting::warn(kTag, std::string("ignoring unrecognized limit ") + a_name);
    }

    if (a_default) {
        if (!str_eq(a_name, "complexity") && !str_eq(a_name, "quality"))
            return limit_error(a_name, "does not take a default");
        type()->set(std::string(a_name) + "-default", a_default);
    }
    if (a_scale) {
        if (!str_eq(a_name, "quality")) return limit_error(a_name, "does not take a scale");
        type()->set("quality-scale", a_scale);
    }
    return Status::Ok;
}

Status MediaCodecsParser::add_feature(const char** attrs) {
    const char* name = nullptr;
    const char* optional = nullptr;
    const char* required = nullptr;
    const char* value = nullptr;
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
        if (str_eq(attrs[i], "name")) {
            name = attrs[i + 1];
        } else if (str_eq(attrs[i], "optional")) {
            optional = attrs[i + 1];
        } else if (str_eq(attrs[i], "required")) {
            required = attrs[i + 1];
        } else if (str_eq(attrs[i], "value")) {
            value = attrs[i + 1];
        } else {
            reporting::error(kTag, std::string("Feature: unrecognized attribute ") + attrs[i]);
            return Status::BadValue;
        }
    }
    if (!name) {
        reporting::error(kTag, "Feature without name");
        return Status::BadValue;
    }

    bool is_required = false;
    bool is_optional = false;
    if (required) {
        auto b = parse_boolean(required);
        if (!b) return Status::BadValue;
        is_required = *b;
    }
    if (optional) {
        auto b = parse_boolean(optional);
        if (!b) return Status::BadValue;
        is_optional = *b;
    }
    if (is_required && is_optional) {
        reporting::error(kTag, std::string("feature ") + name + " cannot be both required and optional");
        return Status::BadValue;
    }

    std::string key = std::string("feature-") + name;
    if (value) {
        type()->set(key, value);
    } else {
        type()->set(key, is_required ? "1" : "0");
    }
    return Status::Ok;
}

} // namespace

Status load_media_codecs(const LoaderOptions& opts, CodecStore::Builder& builder) {
    MediaCodecsParser parser(builder, opts.default_owner);

    auto main_path = find_in_dirs(opts.search_dirs, opts.main_xml);
    if (!main_path) {
        reporting::error(kTag, "cannot find " + opts.main_xml);
        builder.fail(Status::NameNotFound);
        return Status::NameNotFound;
    }
    Status st = parser.parse_file(*main_path);
    if (st == Status::Ok && !opts.performance_xml.empty()) {
        if (auto perf = find_in_dirs(opts.search_dirs, opts.performance_xml)) {
            st = parser.parse_file(*perf);
        }
    }
    for (const auto& extra : opts.extra_files) {
        if (st != Status::Ok) break;
        st = parser.parse_file(extra);
    }
    if (st != Status::Ok) {
        builder.fail(st);
        return st;
    }

    // Roles in order of first appearance, nodes in codec declaration order.
    RoleList roles;
    std::unordered_map<std::string, size_t> role_index;
    std::vector<std::string> names;
    for (const auto& codec : parser.codecs()) {
        names.push_back(codec.name);
        for (const auto& type : codec.types) {
            const char* role_name = component_role(codec.is_encoder, type.name.c_str());
            if (!role_name) {
                reporting::error(kTag, std::string("cannot find the role for ") +
                                 (codec.is_encoder ? "an encoder" : "a decoder") + " of type " + type.name);
                continue;
            }
            auto it = role_index.find(role_name);
            if (it == role_index.end()) {
                RoleInfo role;
                role.role = role_name;
                role.type = type.name;
                role.is_encoder = codec.is_encoder;
                role.prefer_platform_nodes = role.role.compare(0, 5, "audio") == 0;
                it = role_index.emplace(role.role, roles.size()).first;
                roles.push_back(std::move(role));
            } else {
                const RoleInfo& role = roles[it->second];
                // Role names carry the direction, so only the media type can disagree.
                if (role.type != type.name) {
                    reporting::error(kTag, "role " + role.role + " has mismatching types: " + role.type +
                                     " and " + type.name);
                    continue;
                }
            }
            roles[it->second].nodes.push_back(NodeInfo{codec.name, codec.owner, type.attrs});
        }
    }

    st = builder.set_prefix(opts.prefix ? *opts.prefix : PrefixPolicy::common_prefix(names));
    for (auto& role : roles) {
        if (st != Status::Ok) break;
        st = builder.add_role(std::move(role));
    }
    return st;
}

} // namespace codecstore
