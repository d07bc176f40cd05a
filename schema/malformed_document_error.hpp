#ifndef INDOORGML_SCHEMA_MALFORMED_DOCUMENT_ERROR_HPP
#define INDOORGML_SCHEMA_MALFORMED_DOCUMENT_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace indoorgml {

// Raised when a required part of the IndoorGML JSON document is missing,
// has the wrong shape, or holds a non-numeric coordinate.
// path() names the failing location, e.g. "cellSpaceMember[3]/abstractFeature/value".
class MalformedDocumentError : public std::runtime_error {
public:
    MalformedDocumentError(std::string path, const std::string& reason)
        : std::runtime_error("Malformed IndoorGML document at '" + path + "': " + reason)
        , path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace indoorgml

#endif // INDOORGML_SCHEMA_MALFORMED_DOCUMENT_ERROR_HPP
