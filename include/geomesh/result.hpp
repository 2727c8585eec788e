/**
 * GeoMesh Converter - Result Type
 *
 * Result<T> carries either a value or an Error. Every pipeline stage returns
 * one, so a failure in any stage reaches the caller with its code intact.
 */

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace geomesh {

/**
 * Error information with code and message
 */
struct Error {
    enum class Code {
        None = 0,
        UnsupportedSchemaVersion,
        IndexOutOfRange,
        AttributeLengthMismatch,
        UnsupportedGeometryType,
        TableNotFound,
        InvalidFormat,
        CompressionError,
        DatabaseError,
        IoError,
        InvalidArgument
    };

    Code code = Code::None;
    std::string message;
    std::string context;  // Object, element or table the error refers to

    Error() = default;
    Error(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool ok() const { return code == Code::None; }

    std::string full_message() const {
        if (context.empty()) {
            return message;
        }
        return message + " [" + context + "]";
    }

    Error with_context(std::string ctx) const {
        Error copy = *this;
        copy.context = context.empty() ? std::move(ctx) : std::move(ctx) + ": " + context;
        return copy;
    }

    static Error unsupported_schema_version(const std::string& schema, const std::string& ctx = "") {
        return Error(Code::UnsupportedSchemaVersion, "Unsupported schema: " + schema, ctx);
    }

    static Error index_out_of_range(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::IndexOutOfRange, msg, ctx);
    }

    static Error attribute_length_mismatch(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::AttributeLengthMismatch, msg, ctx);
    }

    static Error unsupported_geometry_type(const std::string& type, const std::string& ctx = "") {
        return Error(Code::UnsupportedGeometryType, "Unsupported geometry type: " + type, ctx);
    }

    static Error table_not_found(const std::string& ref) {
        return Error(Code::TableNotFound, "Table not found", ref);
    }

    static Error invalid_format(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidFormat, msg, ctx);
    }

    static Error compression_error(const std::string& msg) {
        return Error(Code::CompressionError, msg);
    }

    static Error database_error(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::DatabaseError, msg, ctx);
    }

    static Error io_error(const std::string& msg, const std::string& path = "") {
        return Error(Code::IoError, msg, path);
    }

    static Error invalid_argument(const std::string& msg, const std::string& ctx = "") {
        return Error(Code::InvalidArgument, msg, ctx);
    }
};

/**
 * Stable identifier for an error code (used in reports and CLI output)
 */
constexpr const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::None:                     return "None";
        case Error::Code::UnsupportedSchemaVersion: return "UnsupportedSchemaVersion";
        case Error::Code::IndexOutOfRange:          return "IndexOutOfRange";
        case Error::Code::AttributeLengthMismatch:  return "AttributeLengthMismatch";
        case Error::Code::UnsupportedGeometryType:  return "UnsupportedGeometryType";
        case Error::Code::TableNotFound:            return "TableNotFound";
        case Error::Code::InvalidFormat:            return "InvalidFormat";
        case Error::Code::CompressionError:         return "CompressionError";
        case Error::Code::DatabaseError:            return "DatabaseError";
        case Error::Code::IoError:                  return "IoError";
        case Error::Code::InvalidArgument:          return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * Per-item failure recorded by operations that continue past it
 * (multi-object export, multi-element import).
 */
struct FailedItem {
    std::string name;
    Error error;
};

/**
 * Holds either a value T or an Error
 *
 * Usage:
 *   Result<Table> load(const TableRef& ref);
 *
 *   auto table = store.load(ref);
 *   if (!table) {
 *       LOG_ERROR("Tag", table.error().full_message());
 *   }
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool has_value() const { return ok(); }
    explicit operator bool() const { return ok(); }

    // Throws if the result holds an error
    T& value() {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().full_message());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (!ok()) {
            throw std::runtime_error("Result contains error: " + error().full_message());
        }
        return std::get<T>(data_);
    }

    const Error& error() const {
        if (ok()) {
            static const Error no_error;
            return no_error;
        }
        return std::get<Error>(data_);
    }

    Error::Code code() const { return error().code; }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

private:
    std::variant<T, Error> data_;
};

/**
 * Specialization for operations with no value (just success/failure)
 */
template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        static const Error no_error;
        return error_ ? *error_ : no_error;
    }

    Error::Code code() const { return error().code; }

    static Result success() { return Result(); }

private:
    std::optional<Error> error_;
};

// Early return on error
#define TRY(expr) \
    do { \
        auto _result = (expr); \
        if (!_result.ok()) { \
            return _result.error(); \
        } \
    } while(0)

#define TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (!_result_##var.ok()) { \
        return _result_##var.error(); \
    } \
    auto var = std::move(_result_##var.value())

} // namespace geomesh
