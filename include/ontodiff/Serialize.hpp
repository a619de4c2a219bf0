/**
 * @file Serialize.hpp
 * @brief Conversion between Value trees and models / reports
 *
 * Model document layout (JSON shown, TOML maps onto the same tree):
 *
 * ```json
 * {
 *   "name": "Sales", "version": "1.0", "source": "sales.pbix",
 *   "entities": [
 *     { "name": "Customer", "entity_type": "dimension", "description": "...",
 *       "properties": [
 *         { "name": "Id", "data_type": "Integer", "required": true, "unique": true,
 *           "constraints": [ { "type": "range", "value": "0..", "message": "" } ] }
 *       ] }
 *   ],
 *   "relationships": [
 *     { "from_entity": "Order", "to_entity": "Customer",
 *       "from_property": "CustomerId", "to_property": "Id",
 *       "relationship_type": "belongs_to", "cardinality": "many-to-one" }
 *   ],
 *   "business_rules": [
 *     { "name": "HighValueOrder", "entity": "Order",
 *       "condition": "Amount > 1000", "action": "flag", "priority": 1 }
 *   ],
 *   "metadata": { "owner": "finance" }
 * }
 * ```
 *
 * Missing optional fields take the Model.hpp defaults; a missing model name
 * becomes "Unnamed".
 */

#ifndef ONTODIFF_SERIALIZE_HPP
#define ONTODIFF_SERIALIZE_HPP

#include "ontodiff/Diff.hpp"
#include "ontodiff/Merge.hpp"
#include "ontodiff/Model.hpp"
#include "ontodiff/SemanticDebt.hpp"
#include "ontodiff/Value.hpp"

namespace ontodiff {

/**
 * @brief Build a Model from its document tree
 *
 * Non-string scalars in text fields (constraint values, metadata) are
 * stored as their JSON text.
 *
 * @throws ModelValidationError if the root is not an object, a collection
 *         is not an array, or a record lacks its identity field
 */
Model model_from_value(const Value& data);

/**
 * @brief Document tree of a Model (inverse of model_from_value)
 */
Value model_to_value(const Model& model);

Value to_value(const Change& change);

/**
 * @brief {"source": {name, version}, "target": {...}, "summary": {...}, "changes": [...]}
 */
Value to_value(const DiffReport& report);

/**
 * @brief {"model": {...}, "conflicts": [{path, element_type, resolution, ours_value, theirs_value}]}
 */
Value to_value(const MergeResult& result);

Value to_value(const SemanticConflict& conflict);

/**
 * @brief {"models_analyzed": [...], "summary": {...}, "conflicts": [...], "recommendations": [...]}
 */
Value to_value(const SemanticDebtReport& report);

} // namespace ontodiff

#endif // ONTODIFF_SERIALIZE_HPP
