#pragma once

#include "../Credentials.hpp"

namespace deebot::ports {

// Source of valid session credentials for components that authenticate
// their own connections.
class ISessionProvider {
public:
    virtual ~ISessionProvider() = default;
    
    virtual Credentials ensureValid() = 0;
    virtual void invalidate() = 0;
};

} // namespace deebot::ports
