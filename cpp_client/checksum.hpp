#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <cstddef>
#include <string>
#include <openssl/evp.h>

// Incremental SHA-512, reported as lowercase hex to match the server's checksum headers.
class Sha512 {
public:
    Sha512();
    ~Sha512();

    Sha512(const Sha512&) = delete;
    Sha512& operator=(const Sha512&) = delete;

    void Update(const char* data, size_t len);
    void Reset();

    // Digest of everything passed to Update since the last Reset.
    // Does not finalize the running state, so Update may continue afterwards.
    std::string HexDigest() const;

    static std::string Hex(const std::string& data);

private:
    EVP_MD_CTX* ctx_;
};

#endif // CHECKSUM_HPP
