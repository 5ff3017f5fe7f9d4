#include "InMemoryUserDirectory.hpp"
#include "../JsonCodec.hpp"
#include <fstream>
#include <stdexcept>

namespace triplog::adapters {

std::optional<ports::OwnerProfile> InMemoryUserDirectory::findOwner(OwnerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(id);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

void InMemoryUserDirectory::addOwner(const ports::OwnerProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    owners_[profile.id] = profile;
}

std::vector<ports::OwnerProfile> InMemoryUserDirectory::owners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ports::OwnerProfile> result;
    for (const auto& [id, profile] : owners_) {
        result.push_back(profile);
    }
    return result;
}

std::shared_ptr<InMemoryUserDirectory> InMemoryUserDirectory::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open user directory file: " + path);
    }

    auto directory = std::make_shared<InMemoryUserDirectory>();
    try {
        nlohmann::json document;
        file >> document;
        if (!document.is_array()) {
            throw std::runtime_error("User directory file must contain a JSON array: " + path);
        }
        for (const auto& entry : document) {
            directory->addOwner(JsonCodec::jsonToOwner(entry));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed user directory file " + path + ": " + e.what());
    }
    return directory;
}

} // namespace triplog::adapters
