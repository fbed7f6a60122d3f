#include "arbor/util/hash.hh"
#include "arbor/util/file-descriptor.hh"
#include "arbor/util/signals.hh"

#include <cassert>
#include <cstring>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace arbor {

static size_t regularHashSize(HashAlgorithm type)
{
    switch (type) {
    case HashAlgorithm::SHA256:
        return 32;
    case HashAlgorithm::SHA384:
        return 48;
    case HashAlgorithm::SHA512:
        return 64;
    }
    unreachable();
}

HashAlgorithm parseHashAlgo(std::string_view s)
{
    if (s == "sha256")
        return HashAlgorithm::SHA256;
    if (s == "sha384")
        return HashAlgorithm::SHA384;
    if (s == "sha512")
        return HashAlgorithm::SHA512;
    throw BadHash("unknown hash algorithm '%s'", s);
}

std::string_view printHashAlgo(HashAlgorithm ha)
{
    switch (ha) {
    case HashAlgorithm::SHA256:
        return "sha256";
    case HashAlgorithm::SHA384:
        return "sha384";
    case HashAlgorithm::SHA512:
        return "sha512";
    }
    unreachable();
}

Hash::Hash(HashAlgorithm algo)
    : algo(algo)
{
    hashSize = regularHashSize(algo);
    assert(hashSize <= maxHashSize);
    memset(hash, 0, maxHashSize);
}

bool Hash::operator==(const Hash & h2) const noexcept
{
    if (hashSize != h2.hashSize)
        return false;
    for (unsigned int i = 0; i < hashSize; i++)
        if (hash[i] != h2.hash[i])
            return false;
    return true;
}

std::strong_ordering Hash::operator<=>(const Hash & h) const noexcept
{
    if (auto cmp = hashSize <=> h.hashSize; cmp != 0)
        return cmp;
    for (unsigned int i = 0; i < hashSize; i++) {
        if (auto cmp = hash[i] <=> h.hash[i]; cmp != 0)
            return cmp;
    }
    if (auto cmp = algo <=> h.algo; cmp != 0)
        return cmp;
    return std::strong_ordering::equivalent;
}

const std::string base16Chars = "0123456789abcdef";

std::string Hash::to_string(bool includeAlgo) const
{
    std::string s;
    if (includeAlgo) {
        s += printHashAlgo(algo);
        s += ':';
    }
    s.reserve(s.size() + hashSize * 2);
    for (unsigned int i = 0; i < hashSize; i++) {
        s.push_back(base16Chars[hash[i] >> 4]);
        s.push_back(base16Chars[hash[i] & 0x0f]);
    }
    return s;
}

Hash Hash::parseHex(std::string_view rest, HashAlgorithm algo)
{
    Hash res(algo);

    if (rest.size() != res.hashSize * 2)
        throw BadHash(
            "hash '%s' has wrong length for hash algorithm '%s'", rest, printHashAlgo(algo));

    auto parseHexDigit = [&](char c) {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        throw BadHash("invalid base-16 hash '%s'", rest);
    };

    for (unsigned int i = 0; i < res.hashSize; i++) {
        res.hash[i] = parseHexDigit(rest[i * 2]) << 4 | parseHexDigit(rest[i * 2 + 1]);
    }

    return res;
}

Hash Hash::parsePrefixed(std::string_view s)
{
    auto sep = s.find(':');
    if (sep == s.npos)
        throw BadHash("checksum '%s' does not include a type", s);
    return parseHex(s.substr(sep + 1), parseHashAlgo(s.substr(0, sep)));
}

struct HashSink::Ctx
{
    union {
        SHA256_CTX sha256;
        SHA512_CTX sha512;
    };
};

static void start(HashAlgorithm ha, HashSink::Ctx & ctx)
{
    if (ha == HashAlgorithm::SHA256)
        SHA256_Init(&ctx.sha256);
    else if (ha == HashAlgorithm::SHA384)
        SHA384_Init(&ctx.sha512);
    else if (ha == HashAlgorithm::SHA512)
        SHA512_Init(&ctx.sha512);
}

static void update(HashAlgorithm ha, HashSink::Ctx & ctx, std::string_view data)
{
    if (ha == HashAlgorithm::SHA256)
        SHA256_Update(&ctx.sha256, data.data(), data.size());
    else if (ha == HashAlgorithm::SHA384)
        SHA384_Update(&ctx.sha512, data.data(), data.size());
    else if (ha == HashAlgorithm::SHA512)
        SHA512_Update(&ctx.sha512, data.data(), data.size());
}

static void finish(HashAlgorithm ha, HashSink::Ctx & ctx, unsigned char * hash)
{
    if (ha == HashAlgorithm::SHA256)
        SHA256_Final(hash, &ctx.sha256);
    else if (ha == HashAlgorithm::SHA384)
        SHA384_Final(hash, &ctx.sha512);
    else if (ha == HashAlgorithm::SHA512)
        SHA512_Final(hash, &ctx.sha512);
}

Hash hashString(HashAlgorithm ha, std::string_view s)
{
    HashSink::Ctx ctx;
    Hash hash(ha);
    start(ha, ctx);
    update(ha, ctx, s);
    finish(ha, ctx, hash.hash);
    return hash;
}

Hash hashFile(HashAlgorithm ha, const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);

    HashSink sink(ha);
    std::vector<char> buf(64 * 1024);
    while (true) {
        checkInterrupt();
        ssize_t n = read(fd.get(), buf.data(), buf.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading file '%1%'", path);
        }
        if (n == 0)
            break;
        sink({buf.data(), (size_t) n});
    }
    return sink.finish();
}

HashSink::HashSink(HashAlgorithm ha)
    : ha(ha)
{
    ctx = std::make_unique<Ctx>();
    bytes = 0;
    start(ha, *ctx);
}

HashSink::~HashSink() = default;

void HashSink::operator()(std::string_view data)
{
    bytes += data.size();
    update(ha, *ctx, data);
}

Hash HashSink::finish()
{
    Hash hash(ha);
    arbor::finish(ha, *ctx, hash.hash);
    return hash;
}

} // namespace arbor
