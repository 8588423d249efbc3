#include "scrcpy_client.hpp"

#include <algorithm>
#include <fstream>

#include "mirador_log.hpp"

namespace mirador {

ServerFetcher fetchServerFromFile(std::string path, size_t chunk_size) {
    if (chunk_size == 0) chunk_size = 64 * 1024;

    return [path = std::move(path), chunk_size](const FetchProgressCallback& on_progress)
               -> Result<std::vector<uint8_t>, Error> {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            MLOG_ERROR("fetch", "Server binary not found: %s", path.c_str());
            return Error("Cannot open server binary: " + path);
        }

        std::streamoff size = file.tellg();
        if (size <= 0) {
            MLOG_ERROR("fetch", "Server binary is empty: %s", path.c_str());
            return Error("Server binary is empty: " + path);
        }
        file.seekg(0, std::ios::beg);

        const uint64_t total = static_cast<uint64_t>(size);
        std::vector<uint8_t> buffer(static_cast<size_t>(total));
        uint64_t downloaded = 0;
        if (on_progress) on_progress(0, total);

        while (downloaded < total) {
            size_t n = static_cast<size_t>(std::min<uint64_t>(chunk_size, total - downloaded));
            file.read(reinterpret_cast<char*>(buffer.data() + downloaded), static_cast<std::streamsize>(n));
            if (file.gcount() != static_cast<std::streamsize>(n)) {
                MLOG_ERROR("fetch", "Short read at %llu/%llu: %s",
                           (unsigned long long)downloaded, (unsigned long long)total, path.c_str());
                return Error("Failed to read server binary: " + path);
            }
            downloaded += n;
            if (on_progress) on_progress(downloaded, total);
        }

        MLOG_INFO("fetch", "Loaded server binary %s (%llu bytes)",
                  path.c_str(), (unsigned long long)total);
        return Ok(std::move(buffer));
    };
}

} // namespace mirador
