// SPDX-License-Identifier: Apache-2.0

#ifndef __CHECKSUM_CALCULATOR_HH__
#define __CHECKSUM_CALCULATOR_HH__

#include <iterator> // std::back_inserter
#include <new>
#include <string>
#include <openssl/evp.h>
#include <openssl/objects.h>

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string.hpp>

#include "define.hh"

// alias new APIs for OpenSSL 1.1.0 below
#if OPENSSL_VERSION_NUMBER < 0x10100000L
#define EVP_MD_CTX_new         EVP_MD_CTX_create
#define EVP_MD_CTX_free        EVP_MD_CTX_destroy
#endif // OPENSSL_VERSION_NUMBER < 0x10100000

/**
 * Message digest of chunk bytes, computed incrementally
 *
 * Not thread-safe; the digest of one chunk or stream is computed by one caller.
 **/
class ChecksumCalculator {
public:
    ChecksumCalculator(const EVP_MD *md) {
        _md = md;
        _mdctx = EVP_MD_CTX_new();
        if (_mdctx == 0)
            throw std::bad_alloc();
        reset();
    }

    ~ChecksumCalculator() {
        EVP_MD_CTX_free(_mdctx);
    }

    // start over for another digest
    bool reset() {
        _finalized = false;
        return EVP_DigestInit_ex(_mdctx, _md, NULL) == 1;
    }

    bool append(const data_t *data, size_t length) {
        if (_finalized)
            return false;
        return EVP_DigestUpdate(_mdctx, data, length) == 1;
    }

    /**
     * Finish the digest
     *
     * @return digest in lowercase hex, or an empty string if the digest fails
     **/
    std::string finalizeInHex() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;

        if (_finalized || EVP_DigestFinal_ex(_mdctx, digest, &length) != 1)
            return std::string();
        _finalized = true;

        return toHex(digest, length);
    }

    std::string getType() const {
        return OBJ_nid2sn(EVP_MD_type(_md));
    }

    int getDigestSize() const {
        return EVP_MD_size(_md);
    }

    static std::string toHex(const unsigned char *s, unsigned int len) {
        std::string ret;
        boost::algorithm::hex(s, s + len, std::back_inserter(ret));
        boost::algorithm::to_lower(ret);
        return ret;
    }

protected:
    EVP_MD_CTX *_mdctx;
    const EVP_MD *_md;
    bool _finalized;

private:
    ChecksumCalculator(const ChecksumCalculator &); // Don't implement
    void operator=(const ChecksumCalculator &); // Don't implement
};

class MD5Calculator : public ChecksumCalculator {
public:
    MD5Calculator() : ChecksumCalculator(EVP_md5()) {}

    // MD5 of a buffer in lowercase hex
    static std::string digest(const data_t *data, size_t length) {
        MD5Calculator calc;
        if (!calc.append(data, length))
            return std::string();
        return calc.finalizeInHex();
    }
};

class SHA256Calculator : public ChecksumCalculator {
public:
    SHA256Calculator() : ChecksumCalculator(EVP_sha256()) {}
};

#endif //define __CHECKSUM_CALCULATOR_HH__
