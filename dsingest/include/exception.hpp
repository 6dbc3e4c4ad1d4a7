#ifndef DSINGEST_EXCEPTION_HPP
#define DSINGEST_EXCEPTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dsingest {

enum class IngestErrorType : uint8_t {
	NotFound,    // file, sheet, remote table, row or column does not exist
	Validation,  // malformed parameters or rejected request
	Connection,  // remote database unreachable or credentials rejected
	Security,    // statement refused by the read-only guard
	Internal     // unexpected store failure
};

inline const char *ErrorTypeToString(IngestErrorType type) {
	switch (type) {
	case IngestErrorType::NotFound:
		return "NotFound";
	case IngestErrorType::Validation:
		return "ValidationError";
	case IngestErrorType::Connection:
		return "ConnectionError";
	case IngestErrorType::Security:
		return "SecurityError";
	default:
		return "InternalError";
	}
}

//! Base of every error raised by the ingestion engine. The message never contains a
//! connection string.
class IngestException : public std::runtime_error {
public:
	IngestException(IngestErrorType type, const std::string &message, std::string suggestion = std::string())
	    : std::runtime_error(message), type(type), suggestion(std::move(suggestion)) {
	}

	IngestErrorType Type() const {
		return type;
	}
	//! Corrective hint for the caller, may be empty
	const std::string &Suggestion() const {
		return suggestion;
	}

private:
	IngestErrorType type;
	std::string suggestion;
};

class NotFoundException : public IngestException {
public:
	explicit NotFoundException(const std::string &message, std::string suggestion = std::string())
	    : IngestException(IngestErrorType::NotFound, message, std::move(suggestion)) {
	}
};

class ValidationException : public IngestException {
public:
	ValidationException(const std::string &message, std::string suggestion)
	    : IngestException(IngestErrorType::Validation, message, std::move(suggestion)) {
	}
};

class ConnectionException : public IngestException {
public:
	explicit ConnectionException(const std::string &message)
	    : IngestException(IngestErrorType::Connection, message) {
	}
};

class SecurityException : public IngestException {
public:
	explicit SecurityException(const std::string &message)
	    : IngestException(IngestErrorType::Security, message,
	                      "Only a single read-only SELECT statement is allowed") {
	}
};

class StoreException : public IngestException {
public:
	explicit StoreException(const std::string &message) : IngestException(IngestErrorType::Internal, message) {
	}
};

} // namespace dsingest

#endif
