#include <cassert>
#include <iostream>
#include <variant>
#include "swagger_fixture.hpp"
#include "swagcheck/exceptions.hpp"
#include "swagcheck/schema/loader.hpp"
#include "swagcheck/schema/schema.hpp"

using namespace swagcheck;
using namespace swagcheck::schema;

void test_reference_keeps_sibling_keys() {
  std::cout << "test_reference_keeps_sibling_keys...\n";
  auto spec = parse_property(
      Json{{"$ref", "#/definitions/BrandDef"}, {"type", "string"}, {"enum", Json::array({"A"})}});
  assert(std::holds_alternative<ReferenceProperty>(spec));
  assert(*reference(spec) == "#/definitions/BrandDef");
  assert(declared_type(spec) == PrimitiveType::String);
  assert(inline_enum(spec) != nullptr);
  assert(inline_enum(spec)->size() == 1);
  assert(array_items(spec) == nullptr);

  // A pure reference declares nothing else
  auto pure = parse_property(Json{{"$ref", "#/definitions/BrandDef"}});
  assert(!declared_type(pure));
  assert(inline_enum(pure) == nullptr);

  auto listed = parse_property(Json{{"$ref", "#/definitions/BrandDef"},
                                    {"type", "array"},
                                    {"items", Json{{"$ref", "#/definitions/X"}}}});
  assert(declared_type(listed) == PrimitiveType::Array);
  assert(array_items(listed)->ref == std::optional<std::string>("#/definitions/X"));
  std::cout << "  [PASS]\n";
}

void test_inline_enum_keeps_type() {
  std::cout << "test_inline_enum_keeps_type...\n";
  auto spec = parse_property(Json{{"type", "string"}, {"enum", Json::array({"A", "B"})}});
  assert(std::holds_alternative<EnumProperty>(spec));
  assert(declared_type(spec) == PrimitiveType::String);
  assert(inline_enum(spec)->size() == 2);
  assert(array_items(spec) == nullptr);

  // An empty enum is no enum at all
  auto plain = parse_property(Json{{"type", "integer"}, {"enum", Json::array()}});
  assert(std::holds_alternative<PrimitiveProperty>(plain));
  assert(declared_type(plain) == PrimitiveType::Integer);
  std::cout << "  [PASS]\n";
}

void test_enumerated_array_keeps_items() {
  std::cout << "test_enumerated_array_keeps_items...\n";
  auto spec = parse_property(Json{{"type", "array"},
                                  {"enum", Json::array({Json::array({"A"})})},
                                  {"items", Json{{"$ref", "#/definitions/X"}}}});
  assert(std::holds_alternative<EnumProperty>(spec));
  assert(declared_type(spec) == PrimitiveType::Array);
  assert(inline_enum(spec)->size() == 1);
  assert(array_items(spec) != nullptr);
  assert(array_items(spec)->ref == std::optional<std::string>("#/definitions/X"));
  std::cout << "  [PASS]\n";
}

void test_array_items() {
  std::cout << "test_array_items...\n";
  auto by_ref = parse_property(Json{{"type", "array"}, {"items", Json{{"$ref", "#/definitions/X"}}}});
  assert(std::holds_alternative<ArrayProperty>(by_ref));
  assert(declared_type(by_ref) == PrimitiveType::Array);
  assert(array_items(by_ref)->ref == std::optional<std::string>("#/definitions/X"));
  assert(!array_items(by_ref)->type);

  auto by_type = parse_property(Json{{"type", "array"}, {"items", Json{{"type", "number"}}}});
  assert(!array_items(by_type)->ref);
  assert(array_items(by_type)->type == PrimitiveType::Number);

  auto bare = parse_property(Json{{"type", "array"}});
  assert(array_items(bare) != nullptr);
  assert(!array_items(bare)->ref && !array_items(bare)->type);
  std::cout << "  [PASS]\n";
}

void test_untyped_properties() {
  std::cout << "test_untyped_properties...\n";
  assert(std::holds_alternative<UntypedProperty>(parse_property(Json::object())));
  assert(std::holds_alternative<UntypedProperty>(parse_property(Json{{"type", "file"}})));
  assert(std::holds_alternative<UntypedProperty>(parse_property(Json{{"description", "x"}})));
  assert(std::holds_alternative<UntypedProperty>(parse_property(Json("string"))));
  assert(!declared_type(parse_property(Json{{"type", "file"}})));
  std::cout << "  [PASS]\n";
}

void test_definitions() {
  std::cout << "test_definitions...\n";
  auto schema = testing::catalogue_schema();
  assert(schema.size() == 7);
  assert(schema.title() == std::optional<std::string>("Catalogue Item API"));

  const auto* item = schema.find(testing::TRADE_ITEM);
  assert(item != nullptr);
  assert(item->short_name() == "TradeItem");
  assert(item->properties().size() == 14);
  assert(!item->is_enum());
  assert(item->find_property("GTIN") != nullptr);
  assert(item->find_property("Unknown") == nullptr);
  assert(item->raw().contains("properties"));

  const auto* country = schema.find("GS1.Standard.CountryCode");
  assert(country->is_enum());
  assert(country->enum_values().size() == 7);
  assert(country->properties().empty());

  assert(schema.find("MeasurementUnit") == nullptr);
  assert(!schema.contains("TradeItem"));
  std::cout << "  [PASS]\n";
}

void test_schema_requires_definitions() {
  std::cout << "test_schema_requires_definitions...\n";
  bool threw = false;
  try { Schema::from_json(Json{{"swagger", "2.0"}}); } catch (const SchemaError&) { threw = true; }
  assert(threw);

  threw = false;
  try { Schema::from_json(Json::array()); } catch (const SchemaError&) { threw = true; }
  assert(threw);

  auto empty = Schema::from_json(Json{{"definitions", Json::object()}});
  assert(empty.empty());
  assert(!empty.title());
  std::cout << "  [PASS]\n";
}

void test_load_schema_file() {
  std::cout << "test_load_schema_file...\n";
  testing::TempDir dir("swagcheck_schema_model");
  auto good = dir.write("catalogue.json", testing::catalogue_swagger().dump());
  auto schema = load_schema_file(good.string());
  assert(schema.size() == 7);

  auto bad = dir.write("broken.json", "{\"definitions\": ");
  bool threw = false;
  try { load_schema_file(bad.string()); } catch (const SchemaError&) { threw = true; }
  assert(threw);

  threw = false;
  try { load_schema_file((dir.path() / "missing.json").string()); } catch (const NotFoundError&) { threw = true; }
  assert(threw);
  std::cout << "  [PASS]\n";
}

int main() {
  test_reference_keeps_sibling_keys();
  test_inline_enum_keeps_type();
  test_enumerated_array_keeps_items();
  test_array_items();
  test_untyped_properties();
  test_definitions();
  test_schema_requires_definitions();
  test_load_schema_file();
  std::cout << "All schema model tests passed\n";
  return 0;
}
