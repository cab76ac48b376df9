#include "Bios.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <vector>

bool Bios::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::fprintf(stderr, "[Bus] cannot open BIOS image %s\n", path.string().c_str());
        return false;
    }

    const auto file_size = static_cast<std::size_t>(file.tellg());
    if (file_size != SIZE) {
        std::fprintf(stderr, "[Bus] BIOS image %s is %zu bytes, expected %u\n",
                     path.string().c_str(), file_size, SIZE);
        return false;
    }

    std::vector<u8> image(SIZE);
    file.seekg(0);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file.read(reinterpret_cast<char*>(image.data()), SIZE);
    if (!file.good()) {
        std::fprintf(stderr, "[Bus] short read on BIOS image %s\n", path.string().c_str());
        return false;
    }
    return load(image);
}

bool Bios::load(std::span<const u8> image) noexcept {
    if (image.size() != SIZE) return false;
    std::copy(image.begin(), image.end(), rom_.view().begin());
    loaded_ = true;
    return true;
}
