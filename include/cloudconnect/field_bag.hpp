#pragma once

#include "cloudconnect/types.hpp"
#include <cstdint>
#include <string>

namespace cloudconnect {

// Typed accessors over a FieldBag. Each throws ValidationError naming the
// field when it is missing or holds a value of the wrong type.
const std::string& require_string(const FieldBag& fields, const std::string& field);
std::int64_t require_int(const FieldBag& fields, const std::string& field);
bool require_bool(const FieldBag& fields, const std::string& field);

// require_int() that additionally rejects values <= 0
std::int64_t require_positive(const FieldBag& fields, const std::string& field);

// Renders a value for display ("true", "42", "LRU")
std::string to_string(const FieldValue& value);

} // namespace cloudconnect
