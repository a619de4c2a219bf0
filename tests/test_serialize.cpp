/**
 * @file test_serialize.cpp
 * @brief Tests for model decoding and report encoding
 */

#include <gtest/gtest.h>
#include "ontodiff/Errors.hpp"
#include "ontodiff/Serialize.hpp"
#include "test_models.hpp"

using namespace ontodiff;
using namespace ontodiff::fixtures;

namespace {

std::string failure_location(const Value& data) {
    try {
        model_from_value(data);
    } catch (const ModelValidationError& e) {
        return e.location();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Decoding
// ============================================================================

TEST(ModelFromValue, DefaultsForOptionalFields) {
    const Value data = R"({
        "entities": [{"name": "Customer", "properties": [{"name": "Id"}]}],
        "relationships": [{"from_entity": "Order", "to_entity": "Customer"}],
        "business_rules": [{"name": "R"}]
    })"_json;

    Model m = model_from_value(data);
    EXPECT_EQ(m.name, "Unnamed");
    EXPECT_EQ(m.version, "1.0");
    ASSERT_EQ(m.entities.size(), 1u);
    EXPECT_EQ(m.entities[0].entity_type, "standard");
    EXPECT_EQ(m.entities[0].properties[0].data_type, "String");
    EXPECT_FALSE(m.entities[0].properties[0].required);
    EXPECT_EQ(m.relationships[0].relationship_type, "related_to");
    EXPECT_EQ(m.relationships[0].cardinality, "one-to-many");
    EXPECT_EQ(m.business_rules[0].priority, 1);
}

TEST(ModelFromValue, ReadsEveryField) {
    const Value data = R"({
        "name": "Sales", "version": "2.1", "source": "sales.pbix",
        "entities": [{
            "name": "Customer", "description": "Buyers", "entity_type": "dimension",
            "properties": [{"name": "Email", "data_type": "String", "required": true,
                            "unique": true,
                            "constraints": [{"type": "regex", "value": ".+@.+", "message": "bad"}]}],
            "constraints": [{"type": "range", "value": [1, 10]}]
        }],
        "business_rules": [{"name": "Vip", "entity": "Customer", "condition": "Spend > 1000",
                            "action": "flag", "classification": "loyalty", "priority": 3}],
        "metadata": {"owner": "sales", "revision": 7}
    })"_json;

    Model m = model_from_value(data);
    EXPECT_EQ(m.source, "sales.pbix");
    const Property& email = m.entities[0].properties[0];
    EXPECT_TRUE(email.required);
    EXPECT_TRUE(email.unique);
    EXPECT_EQ(email.constraints[0].value, ".+@.+");
    EXPECT_EQ(m.entities[0].constraints[0].value, "[1,10]");
    EXPECT_EQ(m.business_rules[0].priority, 3);
    EXPECT_EQ(m.business_rules[0].classification, "loyalty");
    EXPECT_EQ(m.metadata.at("owner"), "sales");
    EXPECT_EQ(m.metadata.at("revision"), "7");
}

TEST(ModelFromValue, MissingIdentityReportsLocation) {
    EXPECT_EQ(failure_location(R"({"entities": [{"description": "x"}]})"_json), "entities.0");
    EXPECT_EQ(failure_location(R"({"entities": [{"name": "C", "properties": [{}]}]})"_json),
              "entities.C.properties.0");
    EXPECT_EQ(failure_location(R"({"relationships": [{"from_entity": "A"}]})"_json),
              "relationships.0");
    EXPECT_EQ(failure_location(R"({"business_rules": [{"name": ""}]})"_json), "business_rules.0");
}

TEST(ModelFromValue, WrongShapesAreRejected) {
    EXPECT_EQ(failure_location(Value::array()), "<root>");
    EXPECT_EQ(failure_location(R"({"entities": {}})"_json), "entities");
    EXPECT_EQ(failure_location(
                  R"({"entities": [{"name": "C", "properties": [{"name": "P", "required": "yes"}]}]})"_json),
              "entities.C.properties.0.required");
    EXPECT_EQ(failure_location(R"({"business_rules": [{"name": "R", "priority": "high"}]})"_json),
              "business_rules.0.priority");
}

TEST(ModelToValue, DecodesBackToSameModel) {
    Model m = sales_model();
    m.entities[0].properties[0].constraints.push_back({"range", "1..100", "out of range"});

    const Value encoded = model_to_value(m);
    EXPECT_EQ(encoded["entities"][1]["properties"][1]["data_type"], "Decimal");
    EXPECT_EQ(encoded["relationships"][0]["cardinality"], "many-to-one");
    EXPECT_EQ(model_from_value(encoded), m);
}

// ============================================================================
// Report encoding
// ============================================================================

TEST(ReportEncoding, DiffReport) {
    Model a = model("A", {entity("Customer", {prop("Id")})});
    Model b = model("B", {entity("Customer", {prop("Id"), prop("Email")})});
    b.version = "1.1";

    const Value v = to_value(diff_models(a, b));
    EXPECT_EQ(v["source"]["name"], "A");
    EXPECT_EQ(v["target"]["version"], "1.1");
    EXPECT_EQ(v["summary"]["total_changes"], 1);
    EXPECT_EQ(v["summary"]["by_element"]["property"], 1);

    const Value& change = v["changes"][0];
    EXPECT_EQ(change["change_type"], "added");
    EXPECT_EQ(change["element_type"], "property");
    EXPECT_EQ(change["path"], "Customer.Email");
    EXPECT_TRUE(change["old_value"].is_null());
    EXPECT_EQ(change["new_value"], "type=String, required=false");
}

TEST(ReportEncoding, MergeResult) {
    MergeResult result;
    result.model = sales_model();
    result.conflicts.push_back({"Customer.Name", ElementType::Property, MergeStrategy::Union, "", "x"});

    const Value v = to_value(result);
    EXPECT_EQ(v["model"]["name"], "Sales");
    EXPECT_EQ(v["conflicts"][0]["element_type"], "property");
    EXPECT_EQ(v["conflicts"][0]["resolution"], "union");
    EXPECT_TRUE(v["conflicts"][0]["ours_value"].is_null());
    EXPECT_EQ(v["conflicts"][0]["theirs_value"], "x");
}

TEST(ReportEncoding, SemanticDebtReport) {
    Model sales = model("Sales", {entity("Customer", {prop("CustomerId", "Integer")})});
    Model finance = model("Finance", {entity("Customer", {prop("CustomerId", "String")})});

    const Value v = to_value(analyze_models({{"Sales", sales}, {"Finance", finance}}));
    EXPECT_EQ(v["models_analyzed"], Value::array({"Finance", "Sales"}));
    EXPECT_EQ(v["summary"]["total_conflicts"], 1);
    EXPECT_EQ(v["summary"]["critical"], 1);
    EXPECT_EQ(v["summary"]["by_type"]["type_conflict"], 1);

    const Value& conflict = v["conflicts"][0];
    EXPECT_EQ(conflict["conflict_type"], "type_conflict");
    EXPECT_EQ(conflict["severity"], "critical");
    EXPECT_EQ(conflict["name"], "Customer.CustomerId");
    EXPECT_EQ(conflict["details"]["Sales"], "Type: Integer");
    EXPECT_TRUE(v["recommendations"].is_array());
}
