#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "../src/core/SchemaValidate.hpp"

using nlohmann::json;

namespace {

json levelsSchema() {
  return json{{"type", "object"},
              {"properties",
               {{"level_type", {{"type", "integer"}, {"minimum", 0}, {"maximum", 3}}},
                {"channels", {{"type", "array"}, {"items", {{"type", "integer"}, {"minimum", 0}}}}}}},
              {"required", {"level_type"}}};
}

} // namespace

TEST(ArgumentValidatorTest, AcceptsValidDocument) {
  ArgumentValidator v(levelsSchema());
  std::string diag;
  EXPECT_TRUE(v.validate(json{{"level_type", 2}, {"channels", {0, 1}}}, diag));
  EXPECT_TRUE(diag.empty());
}

TEST(ArgumentValidatorTest, CollectsEveryViolation) {
  ArgumentValidator v(levelsSchema());
  std::string diag;
  EXPECT_FALSE(v.validate(json{{"level_type", 7}, {"channels", {0, -1}}}, diag));
  EXPECT_NE(diag.find("/level_type"), std::string::npos) << diag;
  EXPECT_NE(diag.find("/channels/1"), std::string::npos) << diag;
}

TEST(ArgumentValidatorTest, MissingRequiredProperty) {
  ArgumentValidator v(levelsSchema());
  std::string diag;
  EXPECT_FALSE(v.validate(json::object(), diag));
  EXPECT_NE(diag.find("level_type"), std::string::npos) << diag;
  diag.clear();
  EXPECT_TRUE(v.validate(json{{"level_type", 0}}, diag));
}

TEST(ArgumentValidatorTest, BrokenSchemaThrowsOnConstruction) {
  const json broken{{"$ref", "#/definitions/missing"}};
  EXPECT_THROW({ ArgumentValidator v(broken); }, std::exception);
}

TEST(ArgumentValidatorTest, ValidatorIsMovable) {
  ArgumentValidator a(levelsSchema());
  ArgumentValidator b(std::move(a));
  std::string diag;
  EXPECT_FALSE(b.validate(json{{"level_type", "x"}}, diag));
}
