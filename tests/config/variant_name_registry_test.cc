// =============================================================================
// Run Config Search - Variant Name Registry Tests
// =============================================================================

#include "run_config_search/config/variant_name_registry.h"

#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace rcs {
namespace config {
namespace {

nlohmann::json payload(int batch) {
    return nlohmann::json{{"max_batch_size", batch}, {"input", nlohmann::json::array()}};
}

TEST(VariantNameRegistryTest, SequentialNamesPerEntity) {
    VariantNameRegistry registry;
    EXPECT_EQ(*registry.nameFor("model", payload(1)), "model_config_0");
    EXPECT_EQ(*registry.nameFor("model", payload(2)), "model_config_1");
    EXPECT_EQ(*registry.nameFor("other", payload(1)), "other_config_0");
    EXPECT_EQ(registry.numVariants("model"), 2u);
    EXPECT_EQ(registry.numVariants("other"), 1u);
    EXPECT_EQ(registry.numVariants("missing"), 0u);
}

TEST(VariantNameRegistryTest, EquivalentPayloadReusesName) {
    VariantNameRegistry registry;
    auto first = registry.nameFor("model", payload(4));
    ASSERT_TRUE(first);

    nlohmann::json renamed = payload(4);
    renamed["name"] = "something_else";
    auto second = registry.nameFor("model", renamed);
    ASSERT_TRUE(second);

    EXPECT_EQ(*first, *second);
    EXPECT_EQ(registry.numVariants("model"), 1u);
}

TEST(VariantNameRegistryTest, DefaultNameIsReserved) {
    VariantNameRegistry registry;
    EXPECT_EQ(*registry.nameFor("model", payload(8), true), "model_config_default");
    // The default does not consume an index
    EXPECT_EQ(*registry.nameFor("model", payload(16)), "model_config_0");
    EXPECT_EQ(registry.numVariants("model"), 1u);
}

TEST(VariantNameRegistryTest, AdoptedNamesAdvanceTheIndex) {
    VariantNameRegistry registry;
    ASSERT_TRUE(registry.adoptName("model", "model_config_4", payload(1)));

    EXPECT_EQ(*registry.nameFor("model", payload(1)), "model_config_4");
    EXPECT_EQ(*registry.nameFor("model", payload(2)), "model_config_5");
    EXPECT_EQ(registry.numVariants("model"), 2u);
}

TEST(VariantNameRegistryTest, ConflictingAdoptionIsCollision) {
    VariantNameRegistry registry;
    ASSERT_TRUE(registry.nameFor("model", payload(1)));

    auto same_name = registry.adoptName("model", "model_config_0", payload(2));
    ASSERT_FALSE(same_name);
    EXPECT_EQ(same_name.error().code(), ErrorCode::kNamingCollision);

    auto same_payload = registry.adoptName("model", "model_config_9", payload(1));
    ASSERT_FALSE(same_payload);
    EXPECT_EQ(same_payload.error().code(), ErrorCode::kNamingCollision);

    // Re-adopting an identical binding is fine
    EXPECT_TRUE(registry.adoptName("model", "model_config_0", payload(1)));
}

TEST(VariantNameRegistryTest, DefaultNameIgnoresPayload) {
    VariantNameRegistry registry;
    auto first = registry.nameFor("model", payload(1), true);
    ASSERT_TRUE(first) << first.error().toString();
    auto second = registry.nameFor("model", payload(2), true);
    ASSERT_TRUE(second) << second.error().toString();
    EXPECT_EQ(*first, "model_config_default");
    EXPECT_EQ(*second, "model_config_default");
    EXPECT_EQ(registry.numVariants("model"), 0u);
}

TEST(VariantNameRegistryTest, DefaultNameAfterSteppingVariantWithSamePayload) {
    VariantNameRegistry registry;
    EXPECT_EQ(*registry.nameFor("model", payload(1)), "model_config_0");

    auto name = registry.nameFor("model", payload(1), true);
    ASSERT_TRUE(name) << name.error().toString();
    EXPECT_EQ(*name, "model_config_default");

    // The stepping binding is untouched
    EXPECT_EQ(*registry.nameFor("model", payload(1)), "model_config_0");
    EXPECT_EQ(registry.numVariants("model"), 1u);
}

TEST(VariantNameRegistryTest, DefaultPayloadStillGetsIndexedName) {
    VariantNameRegistry registry;
    ASSERT_TRUE(registry.nameFor("model", payload(1), true));
    EXPECT_EQ(*registry.nameFor("model", payload(1)), "model_config_0");
}

TEST(VariantNameRegistryTest, ClearForgetsEverything) {
    VariantNameRegistry registry;
    ASSERT_TRUE(registry.nameFor("model", payload(1)));
    ASSERT_TRUE(registry.nameFor("model", payload(2)));
    registry.clear();
    EXPECT_EQ(registry.numVariants("model"), 0u);
    EXPECT_EQ(*registry.nameFor("model", payload(2)), "model_config_0");
}

TEST(VariantNameRegistryTest, CanonicalizeDropsOnlyName) {
    nlohmann::json p = payload(3);
    p["name"] = "x";
    nlohmann::json canonical = VariantNameRegistry::canonicalize(p);
    EXPECT_FALSE(canonical.contains("name"));
    EXPECT_EQ(canonical["max_batch_size"], 3);
}

TEST(VariantNameRegistryTest, ConcurrentCallersGetConsistentNames) {
    VariantNameRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kPayloads = 50;

    std::vector<std::vector<std::string>> names(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &names, t] {
            for (int i = 0; i < kPayloads; ++i) {
                auto name = registry.nameFor("model", payload(i));
                names[t].push_back(name ? *name : std::string());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Every thread saw the same name for the same payload
    for (int t = 1; t < kThreads; ++t) {
        EXPECT_EQ(names[t], names[0]);
    }
    std::set<std::string> distinct(names[0].begin(), names[0].end());
    EXPECT_EQ(distinct.size(), static_cast<size_t>(kPayloads));
    EXPECT_EQ(registry.numVariants("model"), static_cast<size_t>(kPayloads));
    EXPECT_EQ(distinct.count(""), 0u);
}

}  // namespace
}  // namespace config
}  // namespace rcs
