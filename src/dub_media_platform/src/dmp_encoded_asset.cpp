#include <dub_media_platform/dmp_encoded_asset.h>
#include "impl/dmp_log.h"

#include <fstream>

namespace dmp {

// ============================================================================
// EncodedAudioAsset
// ============================================================================

EncodedAudioAsset::EncodedAudioAsset()
    : m_bytes(std::make_shared<const std::vector<uint8_t>>()) {
}

EncodedAudioAsset::EncodedAudioAsset(std::vector<uint8_t> bytes, std::string mime_type,
                                     std::string extension)
    : m_bytes(std::make_shared<const std::vector<uint8_t>>(std::move(bytes)))
    , m_mime_type(std::move(mime_type))
    , m_extension(std::move(extension)) {
}

std::string EncodedAudioAsset::suggested_filename() const {
    if (m_extension.empty()) {
        return DEFAULT_ASSET_BASENAME;
    }
    return std::string(DEFAULT_ASSET_BASENAME) + "." + m_extension;
}

Result<void> EncodedAudioAsset::WriteToFile(const std::string& path) const {
    if (path.empty()) {
        return Error::invalid_arg("WriteToFile: empty path");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error::file_not_found(path);
    }
    out.write(reinterpret_cast<const char*>(m_bytes->data()),
              static_cast<std::streamsize>(m_bytes->size()));
    out.close();
    if (!out) {
        return Error::internal("Failed writing " + std::to_string(m_bytes->size()) +
                               " bytes to " + path);
    }

    DMP_LOG_DEBUG("Wrote %zu bytes to %s", m_bytes->size(), path.c_str());
    return Result<void>();
}

// ============================================================================
// AssetHandle / AssetStore
// ============================================================================

std::string AssetHandle::url() const {
    return "dmp-asset:" + std::to_string(id);
}

AssetStore::~AssetStore() {
    size_t leaked = live_count();
    if (leaked > 0) {
        DMP_LOG_WARN("AssetStore destroyed with %zu unreleased handle(s)", leaked);
    }
}

AssetHandle AssetStore::Register(EncodedAudioAsset asset) {
    std::lock_guard<std::mutex> lock(m_mutex);
    AssetHandle handle{m_next_id++};
    m_assets.emplace(handle.id, std::move(asset));
    return handle;
}

Result<EncodedAudioAsset> AssetStore::Resolve(const AssetHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_assets.find(handle.id);
    if (it == m_assets.end()) {
        return Error::invalid_arg("Asset handle " + handle.url() + " is not live");
    }
    return it->second;
}

bool AssetStore::Release(const AssetHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_assets.erase(handle.id) > 0;
}

size_t AssetStore::ReleaseAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = m_assets.size();
    m_assets.clear();
    return count;
}

size_t AssetStore::live_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_assets.size();
}

} // namespace dmp
