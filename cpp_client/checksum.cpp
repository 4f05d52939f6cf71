#include "checksum.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string HexEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << (int)data[i];
    }
    return ss.str();
}

} // namespace

Sha512::Sha512() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("Failed to create digest context");
    if (EVP_DigestInit_ex(ctx_, EVP_sha512(), NULL) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("DigestInit failed");
    }
}

Sha512::~Sha512() {
    EVP_MD_CTX_free(ctx_);
}

void Sha512::Update(const char* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("DigestUpdate failed");
    }
}

void Sha512::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha512(), NULL) != 1) {
        throw std::runtime_error("DigestInit failed");
    }
}

std::string Sha512::HexDigest() const {
    EVP_MD_CTX* copy = EVP_MD_CTX_new();
    if (!copy) throw std::runtime_error("Failed to create digest context");
    if (EVP_MD_CTX_copy_ex(copy, ctx_) != 1) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("Digest copy failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(copy, md, &md_len) != 1) {
        EVP_MD_CTX_free(copy);
        throw std::runtime_error("DigestFinal failed");
    }
    EVP_MD_CTX_free(copy);
    return HexEncode(md, md_len);
}

std::string Sha512::Hex(const std::string& data) {
    Sha512 sha;
    sha.Update(data.data(), data.size());
    return sha.HexDigest();
}
