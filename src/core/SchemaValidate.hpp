#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace nlohmann { namespace json_schema { class json_validator; } }

// Schema compiled once, reused for every call of one tool.
class ArgumentValidator {
public:
  explicit ArgumentValidator(const nlohmann::json& schema);
  ~ArgumentValidator();
  ArgumentValidator(ArgumentValidator&&) noexcept;
  ArgumentValidator& operator=(ArgumentValidator&&) noexcept;
  ArgumentValidator(const ArgumentValidator&) = delete;
  ArgumentValidator& operator=(const ArgumentValidator&) = delete;

  // Collects every violation into outDiagnostics ("/path: message; ...").
  bool validate(const nlohmann::json& doc, std::string& outDiagnostics) const;

private:
  std::unique_ptr<nlohmann::json_schema::json_validator> validator_;
};
