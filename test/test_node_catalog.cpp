/*
 * test_node_catalog.cpp - Tests for role/node registration and the prefix rule.
 */

#include <gtest/gtest.h>
#include "codecstore/node_catalog.hpp"
#include "codecstore/prefix_policy.hpp"

using namespace codecstore;

namespace {

RoleInfo avc_decoder_role() {
    RoleInfo role;
    role.role = "video_decoder.avc";
    role.type = "video/avc";
    role.is_encoder = false;
    role.prefer_platform_nodes = true;
    role.nodes.push_back({"OMX.plat.avc.decoder", "platform-omx", {{"size-range", "64x64-1920x1088"}}});
    role.nodes.push_back({"OMX.vendor.avc.decoder", "vendor-omx", {}});
    return role;
}

} // anonymous namespace

TEST(PrefixPolicyTest, Matches) {
    PrefixPolicy policy("OMX.");
    EXPECT_TRUE(policy.matches("OMX.google.aac.decoder"));
    EXPECT_FALSE(policy.matches("c2.android.aac.decoder"));
    EXPECT_FALSE(policy.matches("OMX"));
    EXPECT_TRUE(PrefixPolicy().matches("anything"));
}

TEST(PrefixPolicyTest, CommonPrefix) {
    EXPECT_EQ(PrefixPolicy::common_prefix({}), "");
    EXPECT_EQ(PrefixPolicy::common_prefix({"OMX.a.decoder"}), "OMX.a.decoder");
    EXPECT_EQ(PrefixPolicy::common_prefix({"OMX.plat.avc", "OMX.vendor.avc", "OMX.plat.aac"}), "OMX.");
    EXPECT_EQ(PrefixPolicy::common_prefix({"OMX.google", "OMX.goo"}), "OMX.goo");
    EXPECT_EQ(PrefixPolicy::common_prefix({"OMX.x", "c2.x"}), "");
}

TEST(NodeCatalogTest, KeepsRoleAndNodeOrder) {
    NodeCatalog catalog(PrefixPolicy("OMX."));
    RoleInfo aac;
    aac.role = "audio_decoder.aac";
    aac.type = "audio/mp4a-latm";
    aac.nodes.push_back({"OMX.z.aac.decoder", "p", {}});
    aac.nodes.push_back({"OMX.a.aac.decoder", "p", {}});

    ASSERT_EQ(catalog.add_role(avc_decoder_role()), Status::Ok);
    ASSERT_EQ(catalog.add_role(aac), Status::Ok);

    const auto& roles = catalog.roles();
    ASSERT_EQ(roles.size(), 2u);
    EXPECT_EQ(roles[0].role, "video_decoder.avc");
    EXPECT_EQ(roles[1].role, "audio_decoder.aac");
    EXPECT_EQ(roles[1].nodes[0].name, "OMX.z.aac.decoder");
    EXPECT_EQ(roles[1].nodes[1].name, "OMX.a.aac.decoder");
    EXPECT_EQ(catalog.node_count(), 4u);
}

TEST(NodeCatalogTest, RejectsNodeOutsidePrefix) {
    NodeCatalog catalog(PrefixPolicy("OMX.plat."));
    EXPECT_EQ(catalog.add_role(avc_decoder_role()), Status::BadValue);
    EXPECT_TRUE(catalog.roles().empty());
    EXPECT_EQ(catalog.node_count(), 0u);
}

TEST(NodeCatalogTest, RejectsDuplicateRole) {
    NodeCatalog catalog(PrefixPolicy("OMX."));
    ASSERT_EQ(catalog.add_role(avc_decoder_role()), Status::Ok);
    EXPECT_EQ(catalog.add_role(avc_decoder_role()), Status::AlreadyExists);
    EXPECT_EQ(catalog.roles().size(), 1u);
}

TEST(NodeCatalogTest, RejectsDuplicateNodeWithinRole) {
    NodeCatalog catalog(PrefixPolicy("OMX."));
    RoleInfo role = avc_decoder_role();
    role.nodes.push_back(role.nodes.front());
    EXPECT_EQ(catalog.add_role(role), Status::AlreadyExists);
}

TEST(NodeCatalogTest, RejectsNodeWithoutOwner) {
    NodeCatalog catalog(PrefixPolicy("OMX."));
    RoleInfo role = avc_decoder_role();
    role.nodes[1].owner.clear();
    EXPECT_EQ(catalog.add_role(role), Status::BadValue);
}

TEST(NodeCatalogTest, EmptyRoleIsValid) {
    NodeCatalog catalog(PrefixPolicy("OMX."));
    RoleInfo role;
    role.role = "video_encoder.vp9";
    role.type = "video/x-vnd.on2.vp9";
    role.is_encoder = true;
    ASSERT_EQ(catalog.add_role(role), Status::Ok);
    const RoleInfo* found = catalog.find_role("video_encoder.vp9");
    ASSERT_NE(found, nullptr);
    EXPECT_TRUE(found->nodes.empty());
    EXPECT_EQ(catalog.find_role("video_encoder.avc"), nullptr);
}
