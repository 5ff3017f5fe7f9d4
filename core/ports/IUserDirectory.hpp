#pragma once

#include "../TrackingPoint.hpp"
#include <optional>
#include <string>

namespace triplog::ports {

struct OwnerProfile {
    OwnerId id = 0;
    std::string name;
    std::string email;
    Scope scope;
    std::string organizationName;
    std::string branchName;
};

class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    virtual std::optional<OwnerProfile> findOwner(OwnerId id) = 0;
};

} // namespace triplog::ports
