#pragma once

/// @file rpcreflect/server/stream.hpp
/// @brief Server side of a bidirectional RPC stream

RPCREFLECT_NAMESPACE_BEGIN

namespace server {

/// @brief Reads requests from and writes responses to a single client stream
///
/// Not thread-safe: a stream is driven by one handler at a time.
template <typename Request, typename Response>
class BidirectionalStream {
public:
    virtual ~BidirectionalStream() = default;

    /// @brief Await and read the next incoming message
    /// @returns true on success, false when the client has finished writing
    /// @throws RpcInterruptedError on a broken stream
    [[nodiscard]] virtual bool Read(Request& request) = 0;

    /// @brief Write the next outgoing message
    /// @throws RpcInterruptedError on a broken stream
    virtual void Write(const Response& response) = 0;
};

}  // namespace server

RPCREFLECT_NAMESPACE_END
