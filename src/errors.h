#ifndef IDCROP_ERRORS_H
#define IDCROP_ERRORS_H

#include <stdexcept>
#include <string>

namespace idcrop {

// Input bytes are not a decodable image
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// A crop could not be encoded to JPEG
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& what) : std::runtime_error(what) {}
};

// Detection backend missing, misconfigured or failing at inference time
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what) : std::runtime_error(what) {}
};

} // namespace idcrop

#endif // IDCROP_ERRORS_H
