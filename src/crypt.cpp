#include <speechws/crypt.hpp>
#include <speechws/log.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <random>
#include <utility>

SPEECHWS_NS_BEGIN

namespace {
    auto digestOf(CryptoHash::Type type) -> const EVP_MD * {
        switch (type) {
            case CryptoHash::Sha1:   return ::EVP_sha1();
            case CryptoHash::Sha256: return ::EVP_sha256();
            case CryptoHash::Sha512: return ::EVP_sha512();
            case CryptoHash::Md5:    return ::EVP_md5();
            default: SPEECHWS_UNREACHABLE();
        }
    }
}

CryptoHash::CryptoHash(Type type) : mType(type) {
    auto ctxt = ::EVP_MD_CTX_new();
    SPEECHWS_ASSERT(ctxt);
    mCtxt = ctxt;
    reset();
}

CryptoHash::CryptoHash(CryptoHash &&other) noexcept :
    mCtxt(std::exchange(other.mCtxt, nullptr)),
    mType(other.mType)
{

}

CryptoHash::~CryptoHash() {
    if (mCtxt) {
        ::EVP_MD_CTX_free(static_cast<EVP_MD_CTX *>(mCtxt));
    }
}

auto CryptoHash::addData(Buffer data) -> void {
    auto ok = ::EVP_DigestUpdate(static_cast<EVP_MD_CTX *>(mCtxt), data.data(), data.size());
    SPEECHWS_ASSERT(ok == 1);
}

auto CryptoHash::reset() -> void {
    auto ok = ::EVP_DigestInit_ex(static_cast<EVP_MD_CTX *>(mCtxt), digestOf(mType), nullptr);
    SPEECHWS_ASSERT(ok == 1);
}

auto CryptoHash::result() -> ByteVector {
    ByteVector buf(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    auto ok = ::EVP_DigestFinal_ex(static_cast<EVP_MD_CTX *>(mCtxt), reinterpret_cast<unsigned char *>(buf.data()), &len);
    SPEECHWS_ASSERT(ok == 1);
    buf.resize(len);
    return buf;
}

auto CryptoHash::hash(Buffer data, Type type) -> ByteVector {
    CryptoHash hash(type);
    hash.addData(data);
    return hash.result();
}

auto CryptoHash::hashLength(Type type) -> size_t {
    switch (type) {
        case Sha1: return 20;
        case Sha256: return 32;
        case Sha512: return 64;
        case Md5: return 16;
        default: SPEECHWS_UNREACHABLE();
    }
}

auto randomBytes(MutableBuffer out) -> IoResult<void> {
    if (out.empty()) {
        return {};
    }
    if (::RAND_bytes(reinterpret_cast<unsigned char *>(out.data()), int(out.size())) != 1) {
        return Err(IoError::Tls);
    }
    return {};
}

auto randomBytes(size_t n) -> ByteVector {
    ByteVector buf(n);
    if (auto ret = randomBytes(MutableBuffer(buf)); !ret) {
        SPEECHWS_WARN("Auth", "RAND_bytes failed, fallback to std::random_device");
        std::random_device device;
        for (auto &byte : buf) {
            byte = std::byte(device() & 0xff);
        }
    }
    return buf;
}

SPEECHWS_NS_END
