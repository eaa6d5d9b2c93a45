#pragma once

#include <string>

namespace notes::network {

// A transport or framing failure reported by one of the network clients
// (RESP, HTTP).  The connection it happened on is no longer usable.
struct ClientError {
    std::string message;
};

} // namespace notes::network
