#include "paintcore/persistence/blob_store.h"

namespace paintcore {

bool MemoryBlobStore::put(const std::string& key, const std::vector<std::uint8_t>& bytes) {
    if (key.empty()) return false;
    blobs_[key] = bytes;
    return true;
}

bool MemoryBlobStore::get(const std::string& key, std::vector<std::uint8_t>& out) const {
    auto it = blobs_.find(key);
    if (it == blobs_.end()) return false;
    out = it->second;
    return true;
}

bool MemoryBlobStore::remove(const std::string& key) {
    return blobs_.erase(key) > 0;
}

} // namespace paintcore
