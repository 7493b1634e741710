#include "sha256.h"

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace qedl {

Sha256::Sha256()
    : m_ctx(EVP_MD_CTX_new())
{
    m_ok = m_ctx && EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) == 1;
}

Sha256::~Sha256()
{
    EVP_MD_CTX_free(m_ctx);
}

bool Sha256::update(const QByteArray& data)
{
    if (!m_ok)
        return false;
    m_ok = EVP_DigestUpdate(m_ctx, data.constData(), static_cast<size_t>(data.size())) == 1;
    return m_ok;
}

QByteArray Sha256::finish()
{
    QByteArray digest(DIGEST_LENGTH, 0);
    unsigned int len = 0;
    if (!m_ok || EVP_DigestFinal_ex(m_ctx, reinterpret_cast<unsigned char*>(digest.data()), &len) != 1)
        return {};
    m_ok = false;
    digest.resize(static_cast<int>(len));
    return digest;
}

QByteArray Sha256::hash(const QByteArray& data)
{
    QByteArray digest(SHA256_DIGEST_LENGTH, 0);
    SHA256(reinterpret_cast<const unsigned char*>(data.constData()),
           static_cast<size_t>(data.size()),
           reinterpret_cast<unsigned char*>(digest.data()));
    return digest;
}

} // namespace qedl
