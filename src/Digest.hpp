// Content digests: hash implementations, file hashing and algorithm selection.
//
// Copyright (c) 2026 Johannes Overmann
//
// Distributed under the Boost Software License, Version 1.0.
// (See accompanying file LICENSE or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <openssl/evp.h>
#include <xxhash.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <stdint.h>

namespace treedupes
{

using Digest = std::vector<uint8_t>;

/// Compute the digest of a whole file.
/// Throws std::runtime_error if the file cannot be read. Must be safe to call concurrently for different paths.
using DigestFunction = std::function<Digest(const std::filesystem::path&)>;

enum class DigestAlgorithm
{
    Xxh3,   // XXH3-128, fast, non-cryptographic
    Sha256,
    Md5
};

static constexpr size_t kDefaultReadBufSize = 1024 * 1024;

/// XXH3 128-bit hash. Digest bytes are in canonical (big endian) order.
class HashXxh3
{
public:
    HashXxh3()
        : state(XXH3_createState())
    {
        if (state == nullptr)
        {
            throw std::runtime_error("XXH3_createState failed");
        }
        clear();
    }

    ~HashXxh3()
    {
        XXH3_freeState(state);
    }

    HashXxh3(const HashXxh3&) = delete;
    HashXxh3& operator=(const HashXxh3&) = delete;

    /// Initialize hasher.
    void clear()
    {
        if (XXH3_128bits_reset(state) == XXH_ERROR)
        {
            throw std::runtime_error("XXH3_128bits_reset failed");
        }
    }

    /// Add data.
    void update(const uint8_t *bytes, size_t n)
    {
        if (XXH3_128bits_update(state, bytes, n) == XXH_ERROR)
        {
            throw std::runtime_error("XXH3_128bits_update failed");
        }
    }

    /// Get hash.
    Digest finalize()
    {
        XXH128_canonical_t canonical;
        XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(state));
        return Digest(canonical.digest, canonical.digest + sizeof(canonical.digest));
    }

private:
    XXH3_state_t *state;
};

/// Message digest provided by OpenSSL EVP.
/// Please use class HashSha256 or HashMd5 instead (see below).
class HashEvp
{
public:
    explicit HashEvp(const EVP_MD *md_)
        : md(md_), ctx(EVP_MD_CTX_new())
    {
        if (ctx == nullptr)
        {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        clear();
    }

    ~HashEvp()
    {
        EVP_MD_CTX_free(ctx);
    }

    HashEvp(const HashEvp&) = delete;
    HashEvp& operator=(const HashEvp&) = delete;

    /// Initialize hasher.
    /// Call this after retrieving the hash and before calculating a new hash of new data.
    void clear()
    {
        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1)
        {
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    /// Add data.
    void update(const uint8_t *bytes, size_t n)
    {
        if (EVP_DigestUpdate(ctx, bytes, n) != 1)
        {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    /// Get hash.
    Digest finalize()
    {
        uint8_t out[EVP_MAX_MD_SIZE];
        unsigned len = 0;
        if (EVP_DigestFinal_ex(ctx, out, &len) != 1)
        {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return Digest(out, out + len);
    }

private:
    const EVP_MD *md;
    EVP_MD_CTX *ctx;
};

class HashSha256: public HashEvp { public: HashSha256(): HashEvp(EVP_sha256()) {} };
class HashMd5: public HashEvp { public: HashMd5(): HashEvp(EVP_md5()) {} };

/// Get hash of bytes.
template <class HASH>
Digest calcHash(const uint8_t *bytes, size_t n)
{
    HASH hasher;
    hasher.update(bytes, n);
    return hasher.finalize();
}

/// Get hash of string.
template <class HASH>
Digest calcHash(const std::string &s)
{
    return calcHash<HASH>(reinterpret_cast<const uint8_t *>(s.data()), s.length());
}

/// Get hash of the full content of a file, reading bufSize bytes at a time.
template <class HASH>
Digest calcFileHash(const std::filesystem::path& path, size_t bufSize)
{
    std::ifstream is(path, std::ios::binary);
    if (!is)
    {
        throw std::runtime_error("Error while opening file for hashing: " + path.string());
    }
    HASH hasher;
    std::vector<uint8_t> buffer(bufSize);
    while (is)
    {
        is.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = is.gcount();
        if (count > 0)
        {
            hasher.update(buffer.data(), static_cast<size_t>(count));
        }
    }
    if (is.bad())
    {
        throw std::runtime_error("Error while reading file for hashing: " + path.string());
    }
    return hasher.finalize();
}

/// Parse an algorithm name (xxh3, sha256, md5, case insensitive).
/// Throws std::invalid_argument for unknown names.
DigestAlgorithm parseDigestAlgorithm(const std::string& name);

/// Get the canonical name of an algorithm.
std::string getDigestAlgorithmName(DigestAlgorithm algorithm);

/// Get a file digest function for the given algorithm.
/// Every call creates a fresh hasher, so the returned function may be shared by all workers.
DigestFunction makeDigestFunction(DigestAlgorithm algorithm, size_t bufSize = kDefaultReadBufSize);

/// Format a digest as lowercase hex.
std::string toHex(const Digest& digest);

} // namespace treedupes
