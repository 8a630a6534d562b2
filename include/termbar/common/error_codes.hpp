#pragma once

#include "error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace termbar {
namespace common {

enum class ErrorCode {
    IO_WRITE_FAILED = 100,
    INPUT_READ_FAILED = 101,

    INVALID_COLOUR = 200,
    INVALID_CHARSET = 201,
    INVALID_ARGUMENT = 202,

    CONFIG_PARSE_FAILED = 300,
    CONFIG_INVALID_VALUE = 301
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

class TermbarError : public std::runtime_error {
public:
    explicit TermbarError(ErrorCode code);
    TermbarError(ErrorCode code, const std::string& message);
    TermbarError(ErrorCode code, const std::string& message, const ErrorContext& context);

    ErrorCode code() const { return code_; }
    const ErrorContext& context() const { return context_; }

private:
    ErrorCode code_;
    ErrorContext context_;
};

template<>
inline const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>>&
ErrorRegistry<ErrorCode>::getInfoMap() {
    static const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>> map = {
        {ErrorCode::IO_WRITE_FAILED, {
            ErrorCode::IO_WRITE_FAILED,
            "IO_WRITE_FAILED",
            "Failed to write to output stream"
        }},
        {ErrorCode::INPUT_READ_FAILED, {
            ErrorCode::INPUT_READ_FAILED,
            "INPUT_READ_FAILED",
            "Failed to read from input stream"
        }},
        {ErrorCode::INVALID_COLOUR, {
            ErrorCode::INVALID_COLOUR,
            "INVALID_COLOUR",
            "Unrecognised colour"
        }},
        {ErrorCode::INVALID_CHARSET, {
            ErrorCode::INVALID_CHARSET,
            "INVALID_CHARSET",
            "Charset needs at least two glyphs"
        }},
        {ErrorCode::INVALID_ARGUMENT, {
            ErrorCode::INVALID_ARGUMENT,
            "INVALID_ARGUMENT",
            "Invalid argument"
        }},
        {ErrorCode::CONFIG_PARSE_FAILED, {
            ErrorCode::CONFIG_PARSE_FAILED,
            "CONFIG_PARSE_FAILED",
            "Configuration file could not be parsed"
        }},
        {ErrorCode::CONFIG_INVALID_VALUE, {
            ErrorCode::CONFIG_INVALID_VALUE,
            "CONFIG_INVALID_VALUE",
            "Configuration value is invalid"
        }}
    };
    return map;
}

}}
