// Copyright (c) 2026 The Callguard developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <callguard/fingerprint.h>
#include <callguard/errors.h>
#include <logging.h>

#include <cctype>
#include <memory>

#include <openssl/evp.h>

namespace callguard {

namespace {

struct EVPContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string HexStr(const unsigned char* data, size_t len)
{
    static const char hexmap[] = "0123456789abcdef";
    std::string str;
    str.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        str += hexmap[data[i] >> 4];
        str += hexmap[data[i] & 15];
    }
    return str;
}

/** Length-prefix each field so that adjacent fields cannot run together */
void AppendField(std::string& buffer, const std::string& field)
{
    buffer += strprintf("%u:", field.size());
    buffer += field;
    buffer += ';';
}

std::string Sha256Hex(const std::string& preimage)
{
    std::unique_ptr<EVP_MD_CTX, EVPContextDeleter> ctx(EVP_MD_CTX_new());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), preimage.data(), preimage.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw CallguardError("SHA-256 digest failed");
    }
    return HexStr(digest, digestLen);
}

} // namespace

std::string RequestContext::GetAttribute(const std::string& key) const
{
    auto it = attributes.find(key);
    if (it == attributes.end()) return "";
    return it->second;
}

std::string NormalizePrompt(const std::string& prompt)
{
    std::string normalized;
    normalized.reserve(prompt.size());
    bool pendingSpace = false;
    for (char c : prompt) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (isspace(uc)) {
            pendingSpace = !normalized.empty();
            continue;
        }
        if (pendingSpace) {
            normalized += ' ';
            pendingSpace = false;
        }
        normalized += static_cast<char>(tolower(uc));
    }
    return normalized;
}

std::string ComputeFingerprint(const std::string& prompt, const std::string& taskType,
                               const RequestContext& context)
{
    std::string preimage;
    AppendField(preimage, NormalizePrompt(prompt));
    AppendField(preimage, taskType);
    AppendField(preimage, context.businessProfileId);
    AppendField(preimage, context.frameworkId);
    return Sha256Hex(preimage);
}

std::string ComputeFallbackKey(const std::string& fingerprint, const std::string& tenantId,
                               const std::vector<std::string>& candidateKeys)
{
    std::string preimage;
    AppendField(preimage, fingerprint);
    AppendField(preimage, tenantId);
    for (const std::string& key : candidateKeys) {
        AppendField(preimage, key);
    }
    return Sha256Hex(preimage);
}

std::string FingerprintPrefix(const std::string& fingerprint)
{
    return fingerprint.substr(0, FINGERPRINT_PREFIX_LENGTH);
}

} // namespace callguard
