/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REQUESTER_HPP
#define REQUESTER_HPP

#include "requests/Response.hpp"
#include "requests/Route.hpp"
#include <string>

namespace Chorus {

/**
 * @brief Transport seam between REST actions and the network
 *
 * The client ships no HTTP implementation; applications plug in their own
 * and tests plug in mocks. execute() performs exactly one round trip and may
 * block. It is called from ThreadSystem workers and from threads that call
 * RestAction::complete(), so implementations must tolerate concurrent calls.
 * Transport-level failures are reported by throwing a std::exception, which
 * the action turns into a RemoteFailureError.
 */
class Requester {
public:
    virtual ~Requester() = default;

    /**
     * @param route Compiled route; prefix with ClientConfig::getApiBase() for the URL
     * @param body JSON request body, empty for bodiless requests
     */
    virtual Response execute(const Route::CompiledRoute& route, const std::string& body) = 0;
};

} // namespace Chorus

#endif // REQUESTER_HPP
