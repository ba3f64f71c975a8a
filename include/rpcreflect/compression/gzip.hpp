#pragma once

/// @file rpcreflect/compression/gzip.hpp
/// @brief gzip (RFC 1952) compression of byte strings

#include <stdexcept>
#include <string>
#include <string_view>

RPCREFLECT_NAMESPACE_BEGIN

namespace compression {

/// @brief Thrown when the input is not a complete gzip stream
class DecompressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Inflates a gzip stream of one or more members
/// @throws DecompressionError on corrupt or truncated input, trailing garbage included
std::string Decompress(std::string_view compressed);

/// @brief Deflates data into a single gzip member at the best compression level
std::string Compress(std::string_view data);

}  // namespace compression

RPCREFLECT_NAMESPACE_END
