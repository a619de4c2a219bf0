/**
 * @file test_merge.cpp
 * @brief Tests for the three-way merge using Google Test
 */

#include <gtest/gtest.h>
#include "ontodiff/Errors.hpp"
#include "ontodiff/Merge.hpp"
#include "test_models.hpp"

using namespace ontodiff;
using namespace ontodiff::fixtures;

namespace {

std::vector<std::string> entity_names(const Model& m) {
    std::vector<std::string> out;
    for (const auto& e : m.entities) out.push_back(e.name);
    return out;
}

/// base: Customer{Id, Name}; ours and theirs start as copies
struct MergeFixture : public ::testing::Test {
    Model base = model("Shop", {entity("Customer", {prop("Id", "Integer", true), prop("Name")})});
    Model ours = base;
    Model theirs = base;
};

} // anonymous namespace

// ============================================================================
// Version handling
// ============================================================================

TEST(IncrementVersion, BumpsLastNumericComponent) {
    EXPECT_EQ(increment_version("1.0"), "1.1");
    EXPECT_EQ(increment_version("1.2.9"), "1.2.10");
    EXPECT_EQ(increment_version("2"), "3");
}

TEST(IncrementVersion, AppendsComponentWhenNotNumeric) {
    EXPECT_EQ(increment_version("1.0-beta"), "1.0-beta.1");
    EXPECT_EQ(increment_version(""), ".1");
}

TEST(ParseMergeStrategy, KnownNames) {
    EXPECT_EQ(parse_merge_strategy("ours"), MergeStrategy::Ours);
    EXPECT_EQ(parse_merge_strategy(" Theirs "), MergeStrategy::Theirs);
    EXPECT_EQ(parse_merge_strategy("UNION"), MergeStrategy::Union);
    EXPECT_THROW(parse_merge_strategy("mine"), Error);
}

// ============================================================================
// Non-conflicting merges
// ============================================================================

TEST_F(MergeFixture, IdenticalInputsReproduceBase) {
    base.metadata["owner"] = "sales";
    MergeResult result = merge_models(base, base, base);

    EXPECT_FALSE(result.has_conflicts());
    EXPECT_EQ(result.model.version, "1.1");
    EXPECT_EQ(result.model.metadata.at("merged_from"), "Shop, Shop");

    Model expected = base;
    expected.version = result.model.version;
    expected.metadata["merged_from"] = "Shop, Shop";
    EXPECT_EQ(result.model, expected);
}

TEST_F(MergeFixture, IndependentEntityAdditionsBothLand) {
    ours.entities.push_back(entity("Product"));
    theirs.entities.push_back(entity("Order"));

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Union);

    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(entity_names(result.model), (std::vector<std::string>{"Customer", "Product", "Order"}));
}

TEST_F(MergeFixture, TheirsAddedPropertyLandsInEntity) {
    ours.entities[0].description = "Buyers";
    theirs.entities[0].properties.push_back(prop("Email"));

    MergeResult result = merge_models(base, ours, theirs);

    EXPECT_FALSE(result.has_conflicts());
    const Entity* customer = find_entity(result.model, "Customer");
    ASSERT_NE(customer, nullptr);
    EXPECT_EQ(customer->description, "Buyers");
    EXPECT_NE(find_property(*customer, "Email"), nullptr);
}

TEST_F(MergeFixture, TheirsAddedRelationshipAndRule) {
    theirs.relationships.push_back(relationship("Order", "Customer", "many-to-one"));
    theirs.business_rules.push_back(rule("HighValueOrder", "Amount > 10000"));

    MergeResult result = merge_models(base, ours, theirs);

    EXPECT_FALSE(result.has_conflicts());
    EXPECT_NE(find_relationship(result.model, "Order→Customer"), nullptr);
    EXPECT_NE(find_rule(result.model, "HighValueOrder"), nullptr);
}

TEST_F(MergeFixture, MetadataLayering) {
    base.metadata = {{"owner", "base"}, {"region", "EU"}};
    ours.metadata = {{"owner", "ours"}, {"region", "EU"}};
    theirs.metadata = {{"owner", "base"}, {"region", "EU"}, {"tier", "gold"}};

    MergeResult result = merge_models(base, ours, theirs);

    EXPECT_EQ(result.model.metadata.at("owner"), "ours");
    EXPECT_EQ(result.model.metadata.at("region"), "EU");
    EXPECT_EQ(result.model.metadata.at("tier"), "gold");
}

TEST_F(MergeFixture, NameAndSourceComeFromOurs) {
    ours.name = "ShopOurs";
    ours.source = "ours.json";
    ours.version = "2.4";
    theirs.name = "ShopTheirs";

    MergeResult result = merge_models(base, ours, theirs);

    EXPECT_EQ(result.model.name, "ShopOurs");
    EXPECT_EQ(result.model.source, "ours.json");
    EXPECT_EQ(result.model.version, "2.5");
    EXPECT_EQ(result.model.metadata.at("merged_from"), "ShopOurs, ShopTheirs");
}

// ============================================================================
// Conflicts and strategies
// ============================================================================

TEST_F(MergeFixture, BothChangeDescriptionIsOneConflict) {
    ours.entities[0].description = "Buyers";
    theirs.entities[0].description = "Clients";

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Ours);

    ASSERT_EQ(result.conflicts.size(), 1u);
    const MergeConflict& c = result.conflicts[0];
    EXPECT_EQ(c.path, "Customer.description");
    EXPECT_EQ(c.element_type, ElementType::Entity);
    EXPECT_EQ(c.resolution, MergeStrategy::Ours);
    EXPECT_EQ(c.ours_value, "Buyers");
    EXPECT_EQ(c.theirs_value, "Clients");
    EXPECT_EQ(find_entity(result.model, "Customer")->description, "Buyers");
}

TEST_F(MergeFixture, TheirsStrategyTakesTheirField) {
    ours.entities[0].description = "Buyers";
    theirs.entities[0].description = "Clients";
    ours.entities[0].properties[0].data_type = "String";
    theirs.entities[0].properties[0].data_type = "Guid";

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Theirs);

    ASSERT_EQ(result.conflicts.size(), 2u);
    const Entity* customer = find_entity(result.model, "Customer");
    ASSERT_NE(customer, nullptr);
    EXPECT_EQ(customer->description, "Clients");
    EXPECT_EQ(find_property(*customer, "Id")->data_type, "Guid");
    for (const auto& c : result.conflicts) {
        EXPECT_EQ(c.resolution, MergeStrategy::Theirs);
    }
}

TEST_F(MergeFixture, BothSidesRemovingIsAConflict) {
    ours.entities[0].properties.pop_back();    // drop Name
    theirs.entities[0].properties.pop_back();

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Theirs);

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].path, "Customer.Name");
    EXPECT_TRUE(result.conflicts[0].ours_value.empty());
    EXPECT_TRUE(result.conflicts[0].theirs_value.empty());
    EXPECT_EQ(find_property(*find_entity(result.model, "Customer"), "Name"), nullptr);
}

TEST_F(MergeFixture, TheirsRemovalWithoutConflictIsNotApplied) {
    theirs.entities[0].properties.pop_back();

    MergeResult result = merge_models(base, ours, theirs);

    EXPECT_FALSE(result.has_conflicts());
    EXPECT_NE(find_property(*find_entity(result.model, "Customer"), "Name"), nullptr);
}

TEST_F(MergeFixture, PropertyNamedLikeEntityFieldIsNotAConflict) {
    ours.entities[0].description = "Catalog item";
    theirs.entities[0].properties.push_back(prop("description"));
    theirs.entities[0].properties.push_back(prop("entity_type"));

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Ours);

    EXPECT_FALSE(result.has_conflicts());
    const Entity* customer = find_entity(result.model, "Customer");
    ASSERT_NE(customer, nullptr);
    EXPECT_EQ(customer->description, "Catalog item");
    EXPECT_NE(find_property(*customer, "description"), nullptr);
    EXPECT_NE(find_property(*customer, "entity_type"), nullptr);
}

TEST_F(MergeFixture, EntityAddedOnBothSidesUnionsProperties) {
    ours.entities.push_back(entity("Product", {prop("Sku"), prop("Price", "Decimal")}));
    theirs.entities.push_back(entity("Product", {prop("Sku", "Integer"), prop("Weight", "Decimal")}));

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Union);

    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].path, "Product");
    EXPECT_EQ(result.conflicts[0].resolution, MergeStrategy::Union);

    const Entity* product = find_entity(result.model, "Product");
    ASSERT_NE(product, nullptr);
    ASSERT_EQ(product->properties.size(), 3u);
    EXPECT_EQ(find_property(*product, "Sku")->data_type, "String");  // ours wins
    EXPECT_NE(find_property(*product, "Price"), nullptr);
    EXPECT_NE(find_property(*product, "Weight"), nullptr);
}

TEST_F(MergeFixture, EntityAddedOnBothSidesOursKeepsOurs) {
    ours.entities.push_back(entity("Product", {prop("Sku")}));
    theirs.entities.push_back(entity("Product", {prop("Weight")}));

    MergeResult result = merge_models(base, ours, theirs, MergeStrategy::Ours);

    ASSERT_EQ(result.conflicts.size(), 1u);
    const Entity* product = find_entity(result.model, "Product");
    ASSERT_NE(product, nullptr);
    ASSERT_EQ(product->properties.size(), 1u);
    EXPECT_EQ(product->properties[0].name, "Sku");
}

TEST_F(MergeFixture, RuleConditionConflict) {
    base.business_rules.push_back(rule("HighValueOrder", "Amount > 10000"));
    ours = base;
    theirs = base;
    ours.business_rules[0].condition = "Amount > 20000";
    theirs.business_rules[0].condition = "Amount > 50000";

    MergeResult keep = merge_models(base, ours, theirs, MergeStrategy::Union);
    ASSERT_EQ(keep.conflicts.size(), 1u);
    EXPECT_EQ(keep.conflicts[0].path, "rule:HighValueOrder.condition");
    EXPECT_EQ(find_rule(keep.model, "HighValueOrder")->condition, "Amount > 20000");

    MergeResult take = merge_models(base, ours, theirs, MergeStrategy::Theirs);
    EXPECT_EQ(find_rule(take.model, "HighValueOrder")->condition, "Amount > 50000");
}

TEST_F(MergeFixture, InputsAreNotModified) {
    ours.entities.push_back(entity("Product"));
    theirs.entities.push_back(entity("Order"));
    const Model base_copy = base, ours_copy = ours, theirs_copy = theirs;

    MergeEngine engine(MergeStrategy::Theirs);
    EXPECT_EQ(engine.strategy(), MergeStrategy::Theirs);
    engine.merge(base, ours, theirs);

    EXPECT_EQ(base, base_copy);
    EXPECT_EQ(ours, ours_copy);
    EXPECT_EQ(theirs, theirs_copy);
}
