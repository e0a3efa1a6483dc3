#ifndef SESSION_DEPENDENCIES_H
#define SESSION_DEPENDENCIES_H

#include "mesh_transport.h"
#include "local_identity.h"
#include <memory>
#include <string>

// Factory interface for the platform transport. Browsers and advertisers are
// not restartable after a stop, so the session layer asks for a fresh
// instance every time it starts one.
class IMeshTransportFactory {
public:
    virtual ~IMeshTransportFactory() = default;

    virtual std::unique_ptr<IMeshSession> createSession(const LocalIdentity& identity) = 0;
    virtual std::unique_ptr<IServiceBrowser> createBrowser(const LocalIdentity& identity,
                                                           const std::string& service_type) = 0;
    virtual std::unique_ptr<IServiceAdvertiser> createAdvertiser(const LocalIdentity& identity,
                                                                 const std::string& service_type,
                                                                 const DiscoveryInfo& info) = 0;
};

#endif // SESSION_DEPENDENCIES_H
