/**
 * @file test_parameter_catalog.cpp
 * @brief Tests for keyed parameter access and advisory ranges
 */

#include <gtest/gtest.h>
#include <bioslurry/model/ParameterCatalog.hpp>

#include <set>

using namespace bioslurry;

TEST(ParameterCatalog, CoversEveryField) {
    const auto &all = ParameterCatalog::All();
    EXPECT_EQ(all.size(), 16u);

    std::set<std::string> keys;
    for (const auto &entry : all) {
        EXPECT_TRUE(keys.insert(entry.key).second) << "duplicate key " << entry.key;
        EXPECT_TRUE(entry.field != nullptr);
        EXPECT_LT(entry.min, entry.max);
        EXPECT_GT(entry.step, 0.0);
    }
}

TEST(ParameterCatalog, GroupsFollowPanelOrder) {
    const auto &all = ParameterCatalog::All();
    EXPECT_EQ(all.front().key, "C_G_aq_0");
    EXPECT_EQ(all.front().group, ParameterGroup::InitialConditions);
    EXPECT_EQ(all.back().group, ParameterGroup::Simulation);

    auto sorption = ParameterCatalog::InGroup(ParameterGroup::Sorption);
    ASSERT_EQ(sorption.size(), 3u);
    EXPECT_EQ(sorption[0]->key, "K_d");
    EXPECT_EQ(sorption[1]->key, "k_sorp");
    EXPECT_EQ(sorption[2]->key, "theta");
}

TEST(ParameterCatalog, FindKnownAndUnknown) {
    const auto *k_max = ParameterCatalog::Find("k_max");
    ASSERT_NE(k_max, nullptr);
    EXPECT_EQ(k_max->unit, "1/h");
    EXPECT_DOUBLE_EQ(k_max->min, 0.001);
    EXPECT_DOUBLE_EQ(k_max->max, 1.0);

    EXPECT_EQ(ParameterCatalog::Find("k_maximum"), nullptr);
    EXPECT_THROW((void)ParameterCatalog::Require("k_maximum"), ConfigError);
}

TEST(ParameterCatalog, GetAndSetByKey) {
    auto p = ParameterSet::Default();
    EXPECT_DOUBLE_EQ(ParameterCatalog::Get(p, "K_d"), 50.0);

    ParameterCatalog::Set(p, "K_d", 120.0);
    EXPECT_DOUBLE_EQ(p.K_d, 120.0);

    ParameterCatalog::Set(p, "t_final", 48.0);
    EXPECT_DOUBLE_EQ(p.t_final, 48.0);
}

TEST(ParameterCatalog, SetUnknownKeyThrows) {
    auto p = ParameterSet::Default();
    EXPECT_THROW(ParameterCatalog::Set(p, "bogus", 1.0), ConfigError);
    EXPECT_THROW((void)ParameterCatalog::Get(p, "bogus"), ConfigError);
}

TEST(ParameterCatalog, DefaultsInRange) {
    auto warnings = ParameterCatalog::OutOfRange(ParameterSet::Default());
    EXPECT_TRUE(warnings.empty());
}

TEST(ParameterCatalog, OutOfRangeIsAdvisory) {
    auto p = ParameterSet::Default();
    p.k_max = 5.0;
    p.t_final = 1000.0;

    auto warnings = ParameterCatalog::OutOfRange(p);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].find("k_max"), std::string::npos);
    EXPECT_NE(warnings[1].find("t_final"), std::string::npos);
    EXPECT_TRUE(p.IsValid());
}
