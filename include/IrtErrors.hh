#ifndef IRTERRORS_HH
#define IRTERRORS_HH

#include <stdexcept>
#include <string>

enum class ErrorKind {
    SCHEMA,             // malformed or non-binary input
    INSUFFICIENT_DATA,  // fewer than the minimum number of usable rows
    ESTIMATION,         // the estimation engine failed
    CURVE_COMPUTATION,  // a derived curve could not be evaluated
    REQUEST             // bad request (unknown item, unreadable file)
};

const char * ErrorKindName(ErrorKind kind);

class IrtError : public std::runtime_error {
private:
    ErrorKind kind;

public:
    IrtError(ErrorKind k, const std::string & msg) : std::runtime_error(msg), kind(k) {}
    ErrorKind GetKind() const { return kind; }
};

class SchemaError : public IrtError {
public:
    explicit SchemaError(const std::string & msg) : IrtError(ErrorKind::SCHEMA, msg) {}
};

class InsufficientDataError : public IrtError {
public:
    explicit InsufficientDataError(const std::string & msg) : IrtError(ErrorKind::INSUFFICIENT_DATA, msg) {}
};

class EstimationError : public IrtError {
public:
    explicit EstimationError(const std::string & msg) : IrtError(ErrorKind::ESTIMATION, msg) {}
};

class CurveComputationError : public IrtError {
public:
    explicit CurveComputationError(const std::string & msg) : IrtError(ErrorKind::CURVE_COMPUTATION, msg) {}
};

class RequestError : public IrtError {
public:
    explicit RequestError(const std::string & msg) : IrtError(ErrorKind::REQUEST, msg) {}
};

#endif // IRTERRORS_HH
