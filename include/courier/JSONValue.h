//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON document model plus strict parser and deterministic serializer
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace courier {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }
};

// Structural equality; object member order is irrelevant and int64_t never equals double.
bool operator==(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// JSONError
// Purpose: Raised by ParseJSON on malformed input and by SerializeJSON on values JSON cannot carry
//          (NaN and infinities). The message names the offending position or value.
//==========================================================================================================
class JSONError : public std::runtime_error {
public:
    explicit JSONError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document (RFC 8259). Leading/trailing whitespace is allowed; any other
//          trailing content is an error. Integers that do not fit int64_t are kept as double.
// Throws: JSONError
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact serialization with object keys written in ascending byte order so equal documents
//          always produce identical bytes.
// Throws: JSONError for non-finite doubles.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

// Short name of the JSON type held ("null", "bool", "number", "string", "array", "object").
const char* JSONTypeName(const JSONValue& value);

} // namespace courier
