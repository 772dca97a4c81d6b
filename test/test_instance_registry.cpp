/*
 * test_instance_registry.cpp - Tests for side-by-side platform and vendor stores.
 */

#include <gtest/gtest.h>
#include "codecstore/instance_registry.hpp"
#include "omx/provider.hpp"

#include <memory>

using namespace codecstore;

namespace {

std::shared_ptr<const CodecStore> make_store(const char* instance, const char* prefix, const char* node,
                                             const char* owner) {
    CodecStore::Builder builder(instance);
    EXPECT_EQ(builder.set_prefix(prefix), Status::Ok);
    EXPECT_EQ(builder.add_provider(omx::make_listed_provider(owner, {node})), Status::Ok);
    RoleInfo role;
    role.role = "video_decoder.avc";
    role.type = "video/avc";
    role.nodes.push_back({node, owner, {}});
    EXPECT_EQ(builder.add_role(role), Status::Ok);
    return builder.build();
}

} // anonymous namespace

TEST(InstanceRegistryTest, PlatformAndVendorSideBySide) {
    InstanceRegistry registry;
    ASSERT_EQ(registry.publish(kPlatformInstance,
                               make_store(kPlatformInstance, "OMX.google.", "OMX.google.avc.decoder", "default")),
              Status::Ok);
    ASSERT_EQ(registry.publish(kVendorInstance,
                               make_store(kVendorInstance, "OMX.vendor.", "OMX.vendor.avc.decoder", "vendor")),
              Status::Ok);

    auto platform = registry.lookup("platform");
    auto vendor = registry.lookup("vendor");
    ASSERT_NE(platform, nullptr);
    ASSERT_NE(vendor, nullptr);
    EXPECT_EQ(platform->get_node_prefix(), "OMX.google.");
    EXPECT_EQ(vendor->get_node_prefix(), "OMX.vendor.");
    EXPECT_NE(platform->get_omx("default"), nullptr);
    EXPECT_EQ(platform->get_omx("vendor"), nullptr);
    EXPECT_NE(vendor->get_omx("vendor"), nullptr);
}

TEST(InstanceRegistryTest, UnknownInstanceIsNull) {
    InstanceRegistry registry;
    EXPECT_EQ(registry.lookup("platform"), nullptr);
}

TEST(InstanceRegistryTest, DuplicatePublishIsRejected) {
    InstanceRegistry registry;
    auto first = make_store(kPlatformInstance, "OMX.", "OMX.a.avc.decoder", "default");
    ASSERT_EQ(registry.publish(kPlatformInstance, first), Status::Ok);
    EXPECT_EQ(registry.publish(kPlatformInstance, make_store(kPlatformInstance, "OMX.", "OMX.b.avc.decoder",
                                                             "default")),
              Status::AlreadyExists);
    EXPECT_EQ(registry.lookup(kPlatformInstance).get(), first.get());
}

TEST(InstanceRegistryTest, NullStoreIsRejected) {
    InstanceRegistry registry;
    EXPECT_EQ(registry.publish(kVendorInstance, nullptr), Status::BadValue);
    EXPECT_EQ(registry.lookup(kVendorInstance), nullptr);
}
