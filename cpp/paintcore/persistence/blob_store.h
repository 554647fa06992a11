#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace paintcore {

// Storage collaborator for encoded canvas snapshots. The engine only hands
// over bytes; the medium is the implementation's business.
class BlobStore {
public:
    virtual ~BlobStore() = default;
    virtual bool put(const std::string& key, const std::vector<std::uint8_t>& bytes) = 0;
    virtual bool get(const std::string& key, std::vector<std::uint8_t>& out) const = 0;
    virtual bool remove(const std::string& key) = 0;
};

class MemoryBlobStore final : public BlobStore {
public:
    bool put(const std::string& key, const std::vector<std::uint8_t>& bytes) override;
    bool get(const std::string& key, std::vector<std::uint8_t>& out) const override;
    bool remove(const std::string& key) override;

    std::size_t size() const noexcept { return blobs_.size(); }

private:
    std::map<std::string, std::vector<std::uint8_t>> blobs_;
};

} // namespace paintcore
