#include "kit/audit.hpp"
#include "kit/serialize.hpp"

#include <openssl/evp.h>

namespace kit {

namespace {

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[(data[i] >> 4) & 0x0F]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace

DigestResult compute_sha256(const std::string& data) {
    DigestResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(md, md_len);
    result.ok = true;
    return result;
}

DigestResult compute_record_hash(const AuditRecord& record) {
    return compute_sha256(record.prev_hash + "\n" + audit_record_canonical(record));
}

} // namespace kit
