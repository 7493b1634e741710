#pragma once

#include <QByteArray>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace qedl {

// SHA-256 over OpenSSL EVP, one-shot or streamed
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool update(const QByteArray& data);
    QByteArray finish();

    static QByteArray hash(const QByteArray& data);

    static constexpr int DIGEST_LENGTH = 32;

private:
    EVP_MD_CTX* m_ctx = nullptr;
    bool m_ok = false;
};

} // namespace qedl
