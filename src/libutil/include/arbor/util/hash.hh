#pragma once
///@file

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

#include <compare>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace arbor {

MakeError(BadHash, Error);

enum struct HashAlgorithm : char { SHA256 = 1, SHA384 = 2, SHA512 = 3 };

/**
 * The hash algorithm encoded in a prefixed checksum such as
 * `sha256:<hex>`.
 */
HashAlgorithm parseHashAlgo(std::string_view s);

std::string_view printHashAlgo(HashAlgorithm ha);

/**
 * A cryptographic digest, used as the key of sources and as the
 * fingerprint of stages.
 */
struct Hash
{
    constexpr static size_t maxHashSize = 64;
    size_t hashSize = 0;
    uint8_t hash[maxHashSize] = {};

    HashAlgorithm algo;

    /**
     * Create a zero-filled hash object.
     */
    explicit Hash(HashAlgorithm algo);

    /**
     * Parse a checksum of the form `<algo>:<hex>`.
     */
    static Hash parsePrefixed(std::string_view s);

    /**
     * Parse a bare hexadecimal digest of the given algorithm.
     */
    static Hash parseHex(std::string_view s, HashAlgorithm algo);

    bool operator==(const Hash & h2) const noexcept;

    std::strong_ordering operator<=>(const Hash & h2) const noexcept;

    std::string to_string(bool includeAlgo = true) const;

    std::string gitRev() const
    {
        return to_string(false);
    }
};

/**
 * Compute the hash of the given string.
 */
Hash hashString(HashAlgorithm ha, std::string_view s);

/**
 * Compute the hash of the given file.
 */
Hash hashFile(HashAlgorithm ha, const Path & path);

/**
 * Incremental hashing of data that arrives in chunks, e.g. from a
 * download.
 */
class HashSink
{
public:
    struct Ctx;

private:
    HashAlgorithm ha;
    std::unique_ptr<Ctx> ctx;
    uint64_t bytes = 0;

public:
    HashSink(HashAlgorithm ha);
    HashSink(const HashSink & h) = delete;
    ~HashSink();
    void operator()(std::string_view data);
    Hash finish();
};

} // namespace arbor
