// Content digests: hash implementations, file hashing and algorithm selection.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "Digest.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace treedupes
{

DigestAlgorithm parseDigestAlgorithm(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "xxh3")
    {
        return DigestAlgorithm::Xxh3;
    }
    if (lower == "sha256")
    {
        return DigestAlgorithm::Sha256;
    }
    if (lower == "md5")
    {
        return DigestAlgorithm::Md5;
    }
    throw std::invalid_argument("Invalid hashing algorithm '" + name + "'. Please use 'xxh3', 'sha256' or 'md5'.");
}

std::string getDigestAlgorithmName(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
        case DigestAlgorithm::Xxh3: return "xxh3";
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::Md5: return "md5";
    }
    return "unknown";
}

DigestFunction makeDigestFunction(DigestAlgorithm algorithm, size_t bufSize)
{
    if (bufSize == 0)
    {
        throw std::invalid_argument("Read buffer size must be greater than 0.");
    }
    switch (algorithm)
    {
        case DigestAlgorithm::Xxh3:
            return [bufSize](const std::filesystem::path& path) { return calcFileHash<HashXxh3>(path, bufSize); };
        case DigestAlgorithm::Sha256:
            return [bufSize](const std::filesystem::path& path) { return calcFileHash<HashSha256>(path, bufSize); };
        case DigestAlgorithm::Md5:
            return [bufSize](const std::filesystem::path& path) { return calcFileHash<HashMd5>(path, bufSize); };
    }
    throw std::invalid_argument("Unsupported hashing algorithm.");
}

std::string toHex(const Digest& digest)
{
    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (uint8_t byte : digest)
    {
        os << std::setw(2) << static_cast<unsigned>(byte);
    }
    return os.str();
}

} // namespace treedupes
