#pragma once
#include <string>
#include <vector>

namespace codecstore {

enum class Status { Ok, NoInit, NameNotFound, AlreadyExists, BadValue, Malformed, IoError };

const char* to_string(Status s);

struct Attribute {
    std::string key;
    std::string value;
};

using AttributeList = std::vector<Attribute>;

struct NodeInfo {
    std::string name;   // passed verbatim to the owner to instantiate the node
    std::string owner;  // provider name, resolvable through ProviderDirectory
    AttributeList attributes;
};

struct RoleInfo {
    std::string role;   // e.g. "video_decoder.avc"
    std::string type;   // media type, e.g. "video/avc"
    bool is_encoder{false};
    bool prefer_platform_nodes{false};
    std::vector<NodeInfo> nodes;  // preference order, first is preferred
};

using RoleList = std::vector<RoleInfo>;

inline bool operator==(const Attribute& a, const Attribute& b) {
    return a.key == b.key && a.value == b.value;
}

} // namespace codecstore
