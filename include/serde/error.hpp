#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace serde {

// =============================================================================
// Error hierarchy
// =============================================================================
//
// Every failure raised by the library derives from error_t, which is a
// std::runtime_error. The first error aborts the document being processed.

class error_t : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Malformed input ---

class syntax_error_t : public error_t {
public:
    syntax_error_t(const std::string& message, std::size_t line, std::size_t column)
        : error_t(message + " at line " + std::to_string(line) + ", column " + std::to_string(column))
        , line_(line)
        , column_(column) {}

    auto line() const -> std::size_t { return line_; }
    auto column() const -> std::size_t { return column_; }

private:
    std::size_t line_;
    std::size_t column_;
};

class unexpected_end_t : public syntax_error_t {
public:
    unexpected_end_t(std::size_t line, std::size_t column)
        : syntax_error_t("unexpected end of input", line, column) {}
};

// --- Wrong kind of value for the requested read ---

class type_error_t : public error_t {
public:
    using error_t::error_t;
};

// --- Record schema violations ---

class schema_error_t : public error_t {
public:
    schema_error_t(const std::string& message, std::string type_name, std::string field_name)
        : error_t(message)
        , type_name_(std::move(type_name))
        , field_name_(std::move(field_name)) {}

    auto type_name() const -> const std::string& { return type_name_; }
    auto field_name() const -> const std::string& { return field_name_; }

private:
    std::string type_name_;
    std::string field_name_;
};

class missing_field_error_t : public schema_error_t {
public:
    missing_field_error_t(const std::string& type_name, const std::string& field_name)
        : schema_error_t("missing field '" + field_name + "' of type '" + type_name + "'", type_name, field_name) {}
};

class duplicate_field_error_t : public schema_error_t {
public:
    duplicate_field_error_t(const std::string& type_name, const std::string& field_name)
        : schema_error_t("duplicate field '" + field_name + "' for type '" + type_name + "'", type_name, field_name) {}
};

class unknown_field_error_t : public schema_error_t {
public:
    unknown_field_error_t(const std::string& type_name, const std::string& field_name)
        : schema_error_t("unknown field '" + field_name + "' for type '" + type_name + "'", type_name, field_name) {}
};

// --- Polymorphic dispatch ---

class typetag_error_t : public error_t {
public:
    using error_t::error_t;
};

class unknown_tag_error_t : public typetag_error_t {
public:
    unknown_tag_error_t(const std::string& tag, const std::string& base_type)
        : typetag_error_t("could not find type '" + tag + "' for " + base_type)
        , tag_(tag)
        , base_type_(base_type) {}

    auto tag() const -> const std::string& { return tag_; }
    auto base_type() const -> const std::string& { return base_type_; }

private:
    std::string tag_;
    std::string base_type_;
};

class missing_tag_error_t : public typetag_error_t {
public:
    missing_tag_error_t(const std::string& tag_key, const std::string& base_type)
        : typetag_error_t("missing tag key '" + tag_key + "' for " + base_type) {}
};

} // namespace serde
