#pragma once

#include "../ports/IUserDirectory.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace triplog::adapters {

class InMemoryUserDirectory : public ports::IUserDirectory {
public:
    InMemoryUserDirectory() = default;
    ~InMemoryUserDirectory() override = default;

    std::optional<ports::OwnerProfile> findOwner(OwnerId id) override;

    void addOwner(const ports::OwnerProfile& profile);
    std::vector<ports::OwnerProfile> owners() const;

    // Reads a JSON array of {id, name, email, organizationId, branchId, ...}.
    // Throws std::runtime_error when the file is unreadable or malformed.
    static std::shared_ptr<InMemoryUserDirectory> loadFromFile(const std::string& path);

private:
    std::map<OwnerId, ports::OwnerProfile> owners_;
    mutable std::mutex mutex_;
};

} // namespace triplog::adapters
