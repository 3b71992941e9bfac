#ifndef REQUEST_ERRORS_HPP
#define REQUEST_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every error raised while turning parameters into a request.
// None of these are retryable: the input has to be fixed first.
class RequestBuildError : public std::runtime_error {
public:
    explicit RequestBuildError(const std::string& what) : std::runtime_error(what) {}
};

class MissingRequiredField : public RequestBuildError {
public:
    explicit MissingRequiredField(const std::string& field)
        : RequestBuildError("Missing parameter \"" + field + "\" for CompleteMultipartUpload. The value cannot be null."),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class InvalidEnumValue : public RequestBuildError {
public:
    InvalidEnumValue(const std::string& field, const std::string& value)
        : RequestBuildError("Invalid parameter \"" + field + "\" for CompleteMultipartUpload. The value \"" + value +
                            "\" is not a valid \"" + field + "\"."),
          field_(field), value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

class SerializationError : public RequestBuildError {
public:
    explicit SerializationError(const std::string& what) : RequestBuildError("XML serialization failed: " + what) {}
};

// Caller input with the wrong shape (e.g. a number where a string is expected)
class InvalidInput : public RequestBuildError {
public:
    InvalidInput(const std::string& field, const std::string& reason)
        : RequestBuildError("Invalid input for \"" + field + "\": " + reason), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

#endif // REQUEST_ERRORS_HPP
