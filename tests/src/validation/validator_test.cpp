#include <gtest/gtest.h>
#include <tessera/testing/common.hpp>
#include <tessera/validation/schema_checker.hpp>
#include <tessera/validation/validator.hpp>

using namespace tessera::schema;
using namespace tessera::validation;
using tessera::testing::make_field;
using tessera::testing::make_heat_stack_schema;
using tessera::testing::make_schema;

TEST(validator, applies_stack_defaults) {
  auto schema = make_heat_stack_schema();
  auto raw = make_map({{"template", make_map({{"resources", map_t{}}})},
                       {"parameters", make_map({{"size", 2}})}});

  auto result = validate(schema, raw);
  ASSERT_TRUE(result.ok()) << result.status.log;

  const auto& spec = *result.value;
  EXPECT_EQ(spec.type_name, "os.heat.stack");
  EXPECT_EQ(spec.version, "1.0");
  EXPECT_EQ(spec.properties.at("context"), value_t{map_t{}});
  EXPECT_EQ(spec.properties.at("template_url"), value_t{""});
  EXPECT_EQ(spec.properties.at("disable_rollback"), value_t{true});
  EXPECT_EQ(spec.properties.at("parameters"),
            value_t{make_map({{"size", 2}})});
  EXPECT_EQ(spec.properties.count("timeout"), 0u);
  EXPECT_EQ(spec.properties.size(), 7u);
}

TEST(validator, template_url_scenario) {
  auto schema = make_heat_stack_schema();
  auto result = validate(schema, make_map({{"template_url", "http://x/y.yaml"}}));
  ASSERT_TRUE(result.ok()) << result.status.log;

  auto expected = make_map({{"context", map_t{}},
                            {"disable_rollback", true},
                            {"environment", map_t{}},
                            {"files", map_t{}},
                            {"parameters", map_t{}},
                            {"template", map_t{}},
                            {"template_url", "http://x/y.yaml"}});
  EXPECT_EQ(result.value->properties, expected);
}

TEST(validator, empty_spec_yields_exactly_the_defaults) {
  auto schema = make_heat_stack_schema();
  auto result = validate(schema, map_t{});
  ASSERT_TRUE(result.ok()) << result.status.log;

  auto defaults = map_t{};
  for (const auto& field : schema.fields) {
    if (field.default_value) {
      defaults.insert_or_assign(field.name, *field.default_value);
    }
  }
  EXPECT_EQ(result.value->properties, defaults);
}

TEST(validator, rejects_undeclared_keys) {
  auto schema = make_heat_stack_schema();
  auto result = validate(schema, make_map({{"bogus_field", 1}}));

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::unknown_field);
  EXPECT_EQ(result.status.field, "bogus_field");
  EXPECT_EQ(result.status.codespace, "tessera.validate");
  EXPECT_FALSE(result.value.has_value());
}

TEST(validator, unknown_keys_win_over_type_errors) {
  auto schema = make_heat_stack_schema();
  auto result =
      validate(schema, make_map({{"timeout", "soon"}, {"zzz", true}}));

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::unknown_field);
}

TEST(validator, coerces_numeric_strings) {
  auto schema = make_schema(
      "test.numbers", "1.0",
      {make_field("count", field_type_t::integer),
       make_field("ratio", field_type_t::floating)});

  auto result = validate(schema, make_map({{"count", "42"}, {"ratio", "1.5"}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(result.value->properties.at("count"), value_t{42});
  EXPECT_EQ(result.value->properties.at("ratio"), value_t{1.5});

  result = validate(schema, make_map({{"count", "+7"}, {"ratio", "-2"}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(result.value->properties.at("count"), value_t{7});
  EXPECT_EQ(result.value->properties.at("ratio"), value_t{-2.0});
}

TEST(validator, rejects_values_that_do_not_coerce) {
  auto schema = make_schema(
      "test.numbers", "1.0",
      {make_field("count", field_type_t::integer),
       make_field("ratio", field_type_t::floating),
       make_field("flag", field_type_t::boolean),
       make_field("name", field_type_t::string),
       make_field("tags", field_type_t::list)});

  auto cases = std::vector<std::pair<std::string, value_t>>{
      {"count", value_t{"4x"}},      {"count", value_t{1.5}},
      {"count", value_t{"1.5"}},     {"count", value_t{""}},
      {"ratio", value_t{1}},         {"ratio", value_t{"nan"}},
      {"flag", value_t{"true"}},     {"flag", value_t{1}},
      {"name", value_t{5}},          {"name", value_t{}},
      {"tags", value_t{map_t{}}},    {"tags", value_t{"a,b"}}};

  for (const auto& [key, value] : cases) {
    auto raw = map_t{};
    raw.insert_or_assign(key, value);
    auto result = validate(schema, raw);
    ASSERT_FALSE(result.ok()) << key << " = " << render(value);
    EXPECT_EQ(result.status.code, error_code::type_mismatch);
    EXPECT_EQ(result.status.field, key);
    EXPECT_EQ(result.status.received, describe(value));
  }
}

TEST(validator, mismatch_message_names_the_expected_type) {
  auto schema = make_heat_stack_schema();
  auto result = validate(schema, make_map({{"timeout", "4x"}}));

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.expected, "Integer");
  EXPECT_NE(result.status.log.find("is not a valid Integer"),
            std::string::npos);
}

TEST(validator, reports_missing_required_field) {
  auto schema = make_schema(
      "test.required", "1.0",
      {make_field("name", field_type_t::string, std::nullopt, false, true),
       make_field("size", field_type_t::integer, value_t{1})});

  auto result = validate(schema, make_map({{"size", 3}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::missing_required_field);
  EXPECT_EQ(result.status.field, "name");

  result = validate(schema, make_map({{"name", "n1"}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(result.value->properties.at("size"), value_t{1});
}

TEST(validator, normalization_is_idempotent) {
  auto schema = make_heat_stack_schema();
  auto first = validate(
      schema, make_map({{"timeout", "60"}, {"files", make_map({{"a", "b"}})}}));
  ASSERT_TRUE(first.ok()) << first.status.log;

  auto second = validate(schema, first.value->properties);
  ASSERT_TRUE(second.ok()) << second.status.log;
  EXPECT_EQ(*second.value, *first.value);
  EXPECT_EQ(second.value->properties.at("timeout"), value_t{60});
}

TEST(validator, output_keys_are_declared_fields) {
  auto schema = make_heat_stack_schema();
  auto result = validate(schema, map_t{});
  ASSERT_TRUE(result.ok());

  for (const auto& [key, value] : result.value->properties) {
    EXPECT_NE(schema.find_field(key), nullptr) << key;
  }
}

TEST(validator, defaults_are_not_shared) {
  auto schema = make_heat_stack_schema();
  auto first = validate(schema, map_t{});
  auto second = validate(schema, map_t{});
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());

  auto& context =
      std::get<map_t>(first.value->properties.at("context").data);
  context.insert_or_assign(std::string{"user"}, value_t{"mutated"});

  EXPECT_EQ(second.value->properties.at("context"), value_t{map_t{}});
  EXPECT_EQ(*schema.find_field("context")->default_value, value_t{map_t{}});
}

TEST(validator, descends_into_nested_map_fields) {
  auto server = make_field("server", field_type_t::map, value_t{map_t{}});
  server.nested = {make_field("port", field_type_t::integer, value_t{80}),
                   make_field("host", field_type_t::string, std::nullopt,
                              false, true)};
  auto schema = make_schema("test.nested", "1.0", {server});

  auto result =
      validate(schema, make_map({{"server", make_map({{"host", "h"}})}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(result.value->properties.at("server"),
            value_t{make_map({{"host", "h"}, {"port", 80}})});

  result = validate(
      schema,
      make_map({{"server", make_map({{"host", "h"}, {"port", "eighty"}})}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::type_mismatch);
  EXPECT_EQ(result.status.field, "server.port");

  result = validate(schema, make_map({{"server", make_map({{"port", 1}})}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::missing_required_field);
  EXPECT_EQ(result.status.field, "server.host");

  result = validate(
      schema,
      make_map({{"server", make_map({{"host", "h"}, {"proto", "tcp"}})}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::unknown_field);
  EXPECT_EQ(result.status.field, "server.proto");
}

TEST(validator, checks_every_list_element) {
  auto ports = make_field("ports", field_type_t::list, value_t{list_t{}});
  ports.nested = {make_field("*", field_type_t::integer)};
  auto schema = make_schema("test.list", "1.0", {ports});

  auto result =
      validate(schema, make_map({{"ports", make_list({80, "443"})}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(result.value->properties.at("ports"),
            value_t{make_list({80, 443})});

  result = validate(schema, make_map({{"ports", make_list({80, 443, "x"})}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::type_mismatch);
  EXPECT_EQ(result.status.field, "ports[2]");
}

TEST(validator, enforces_allowed_values) {
  auto mode = make_field("mode", field_type_t::string, value_t{"fast"});
  mode.allowed_values = {value_t{"fast"}, value_t{"safe"}};
  auto schema = make_schema("test.allowed", "1.0", {mode});

  EXPECT_TRUE(validate(schema, make_map({{"mode", "safe"}})).ok());

  auto result = validate(schema, make_map({{"mode", "reckless"}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::constraint_violated);
  EXPECT_EQ(result.status.field, "mode");
}

TEST(validator, enforces_field_version_windows) {
  auto added = make_field("added", field_type_t::string);
  added.min_version = "1.1";
  auto removed = make_field("removed", field_type_t::string);
  removed.max_version = "1.0";

  auto older = make_schema("test.window", "1.0", {added, removed});
  auto result = validate(older, make_map({{"added", "x"}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::field_version_unsupported);
  EXPECT_EQ(result.status.log,
            "added (min_version=1.1) is not supported by spec version 1.0.");
  EXPECT_TRUE(validate(older, make_map({{"removed", "x"}})).ok());

  auto newer = make_schema("test.window", "1.2", {added, removed});
  EXPECT_TRUE(validate(newer, make_map({{"added", "x"}})).ok());
  result = validate(newer, make_map({{"removed", "x"}}));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.status.code, error_code::field_version_unsupported);
  EXPECT_EQ(result.status.field, "removed");
}

TEST(validator, validate_patch_checks_only_supplied_keys) {
  auto schema = make_schema(
      "test.patch", "1.0",
      {make_field("name", field_type_t::string, std::nullopt, false, true),
       make_field("size", field_type_t::integer, value_t{1}, true)});

  auto result = validate_patch(schema, make_map({{"size", "5"}}));
  ASSERT_TRUE(result.ok()) << result.status.log;
  EXPECT_EQ(*result.value, make_map({{"size", 5}}));

  auto empty = validate_patch(schema, map_t{});
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty.value->empty());

  auto bad = validate_patch(schema, make_map({{"size", true}}));
  ASSERT_FALSE(bad.ok());
  EXPECT_EQ(bad.status.code, error_code::type_mismatch);
}

TEST(validator, map_default_receives_nested_defaults) {
  auto opts = make_field("opts", field_type_t::map, value_t{map_t{}});
  opts.nested = {make_field("size", field_type_t::integer, value_t{1}),
                 make_field("label", field_type_t::string)};
  auto schema = make_schema("test.opts", "1.0", {opts});

  auto checked = check_schema(schema);
  ASSERT_TRUE(checked.ok()) << checked.log;

  auto omitted = validate(schema, map_t{});
  ASSERT_TRUE(omitted.ok()) << omitted.status.log;
  EXPECT_EQ(omitted.value->properties.at("opts"),
            value_t{make_map({{"size", 1}})});

  auto supplied = validate(schema, make_map({{"opts", map_t{}}}));
  ASSERT_TRUE(supplied.ok()) << supplied.status.log;
  EXPECT_EQ(supplied.value->properties, omitted.value->properties);

  auto again = validate(schema, omitted.value->properties);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(*again.value, *omitted.value);
}
