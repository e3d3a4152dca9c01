/**
 * MirrorSync - Content hashing built on libsodium (BLAKE2b, hex encoded).
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace mirrorsync::crypto
{

    void ensure_sodium_init();

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

} // namespace mirrorsync::crypto
