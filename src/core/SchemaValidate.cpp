#include "SchemaValidate.hpp"
#include <nlohmann/json-schema.hpp>

namespace {

class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
public:
  void error(const nlohmann::json::json_pointer& ptr, const nlohmann::json& instance,
             const std::string& message) override {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    const std::string where = ptr.to_string();
    if (!text_.empty()) text_ += "; ";
    text_ += (where.empty() ? std::string("arguments") : where) + ": " + message;
  }
  const std::string& text() const { return text_; }

private:
  std::string text_;
};

} // namespace

ArgumentValidator::ArgumentValidator(const nlohmann::json& schema)
    : validator_(new nlohmann::json_schema::json_validator()) {
  // Throws std::invalid_argument when the schema itself is malformed.
  validator_->set_root_schema(schema);
}

ArgumentValidator::~ArgumentValidator() = default;
ArgumentValidator::ArgumentValidator(ArgumentValidator&&) noexcept = default;
ArgumentValidator& ArgumentValidator::operator=(ArgumentValidator&&) noexcept = default;

bool ArgumentValidator::validate(const nlohmann::json& doc, std::string& outDiagnostics) const {
  CollectingErrorHandler handler;
  validator_->validate(doc, handler);
  if (handler) {
    outDiagnostics = handler.text();
    return false;
  }
  return true;
}
