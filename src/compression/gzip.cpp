#include <rpcreflect/compression/gzip.hpp>

#include <array>
#include <climits>

#include <fmt/format.h>
#include <zlib.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace compression {

namespace {

constexpr std::size_t kChunkSize = 16 * 1024;
// windowBits offset selecting the gzip wrapper instead of the zlib one
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kDefaultMemLevel = 8;

const char* ErrorMessage(const z_stream& stream, int code) {
    return stream.msg != nullptr ? stream.msg : zError(code);
}

class InflateStream final {
public:
    InflateStream() {
        const int ret = inflateInit2(&stream_, kGzipWindowBits);
        if (ret != Z_OK) {
            throw DecompressionError(fmt::format("bad gzipped data: {}", ErrorMessage(stream_, ret)));
        }
    }

    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream& Get() { return stream_; }

private:
    z_stream stream_{};
};

class DeflateStream final {
public:
    DeflateStream() {
        const int ret = deflateInit2(
            &stream_, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kDefaultMemLevel, Z_DEFAULT_STRATEGY
        );
        if (ret != Z_OK) {
            throw std::runtime_error(fmt::format("failed to initialize gzip: {}", ErrorMessage(stream_, ret)));
        }
    }

    ~DeflateStream() { deflateEnd(&stream_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    z_stream& Get() { return stream_; }

private:
    z_stream stream_{};
};

}  // namespace

std::string Decompress(std::string_view compressed) {
    if (compressed.size() > UINT_MAX) {
        throw DecompressionError("bad gzipped data: input is too large");
    }

    InflateStream inflate_stream;
    auto& stream = inflate_stream.Get();
    // zlib does not modify the input buffer
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::string result;
    std::array<char, kChunkSize> buffer{};
    while (true) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        const int ret = inflate(&stream, Z_NO_FLUSH);
        result.append(buffer.data(), buffer.size() - stream.avail_out);

        if (ret == Z_STREAM_END) {
            if (stream.avail_in == 0) {
                return result;
            }
            // Concatenated gzip members decompress to the concatenation of their contents
            const int reset_ret = inflateReset(&stream);
            if (reset_ret != Z_OK) {
                throw DecompressionError(fmt::format("bad gzipped data: {}", ErrorMessage(stream, reset_ret)));
            }
            continue;
        }
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) {
            throw DecompressionError("bad gzipped data: unexpected EOF");
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw DecompressionError(fmt::format("bad gzipped data: {}", ErrorMessage(stream, ret)));
        }
    }
}

std::string Compress(std::string_view data) {
    if (data.size() > UINT_MAX) {
        throw std::runtime_error("failed to gzip data: input is too large");
    }

    DeflateStream deflate_stream;
    auto& stream = deflate_stream.Get();
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string result;
    result.reserve(deflateBound(&stream, stream.avail_in));
    std::array<char, kChunkSize> buffer{};
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());

        ret = deflate(&stream, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            throw std::runtime_error(fmt::format("failed to gzip data: {}", ErrorMessage(stream, ret)));
        }
        result.append(buffer.data(), buffer.size() - stream.avail_out);
    }
    return result;
}

}  // namespace compression

RPCREFLECT_NAMESPACE_END
