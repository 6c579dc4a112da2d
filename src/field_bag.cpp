#include "cloudconnect/field_bag.hpp"
#include "cloudconnect/exceptions.hpp"

namespace cloudconnect {

namespace {

const FieldValue& require_field(const FieldBag& fields, const std::string& field) {
    auto it = fields.find(field);
    if (it == fields.end()) {
        throw ValidationError(field, "field is required");
    }
    return it->second;
}

} // anonymous namespace

const std::string& require_string(const FieldBag& fields, const std::string& field) {
    const auto* value = std::get_if<std::string>(&require_field(fields, field));
    if (!value) {
        throw ValidationError(field, "expected a string");
    }
    return *value;
}

std::int64_t require_int(const FieldBag& fields, const std::string& field) {
    const auto* value = std::get_if<std::int64_t>(&require_field(fields, field));
    if (!value) {
        throw ValidationError(field, "expected an integer");
    }
    return *value;
}

bool require_bool(const FieldBag& fields, const std::string& field) {
    const auto* value = std::get_if<bool>(&require_field(fields, field));
    if (!value) {
        throw ValidationError(field, "expected a boolean");
    }
    return *value;
}

std::int64_t require_positive(const FieldBag& fields, const std::string& field) {
    std::int64_t value = require_int(fields, field);
    if (value <= 0) {
        throw ValidationError(field, "must be a positive integer, got " +
                                     std::to_string(value));
    }
    return value;
}

std::string to_string(const FieldValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    return std::get<std::string>(value);
}

} // namespace cloudconnect
