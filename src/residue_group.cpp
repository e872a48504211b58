#include "pre/residue_group.h"

#include <openssl/crypto.h>

#include "pre/config.h"
#include "pre/errors.h"

namespace pre {

// 生成空 BIGNUM。
Big BNUtils::make() {
    Big bn(BN_new());
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

Ctx BNUtils::cmake() {
    Ctx ctx(BN_CTX_new());
    if (!ctx) throw std::runtime_error("BN_CTX_new failed");
    return ctx;
}

// 十六进制字符串转 BIGNUM。
Big BNUtils::from_hex(const std::string& hex) {
    BIGNUM* raw = nullptr;
    if (!BN_hex2bn(&raw, hex.c_str())) throw std::runtime_error("BN_hex2bn failed");
    return Big(raw);
}

// 64 位整数转 BIGNUM。
Big BNUtils::from_uint(uint64_t value) {
    Big bn = make();
    if (!BN_set_word(bn.get(), value)) throw std::runtime_error("BN_set_word failed");
    return bn;
}

// 拷贝 BIGNUM。
Big BNUtils::dup(const BIGNUM* src) {
    Big bn(BN_dup(src));
    if (!bn) throw std::runtime_error("BN_dup failed");
    return bn;
}

Big BNUtils::dup(const Big& src) { return dup(src.get()); }

// BIGNUM 转十六进制字符串。
std::string BNUtils::to_hex(const Big& bn) {
    char* hex = BN_bn2hex(bn.get());
    if (!hex) throw std::runtime_error("BN_bn2hex failed");
    std::string out(hex);
    OPENSSL_free(hex);
    return out;
}

// 模乘。
Big BNUtils::mod_mul(const Big& a, const Big& b, const Big& mod, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_mul(r.get(), a.get(), b.get(), mod.get(), ctx))
        throw std::runtime_error("BN_mod_mul failed");
    return r;
}

Big BNUtils::mod_mul(const Big& a, const Big& b, const Big& mod) {
    Ctx ctx = cmake();
    return mod_mul(a, b, mod, ctx.get());
}

// 模幂。
Big BNUtils::mod_exp(const Big& base, const Big& exp, const Big& mod, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_exp(r.get(), base.get(), exp.get(), mod.get(), ctx))
        throw std::runtime_error("BN_mod_exp failed");
    return r;
}

Big BNUtils::mod_exp(const Big& base, const Big& exp, const Big& mod) {
    Ctx ctx = cmake();
    return mod_exp(base, exp, mod, ctx.get());
}

// 模逆。
Big BNUtils::mod_inv(const Big& a, const Big& mod, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_inverse(r.get(), a.get(), mod.get(), ctx))
        throw std::runtime_error("BN_mod_inverse failed");
    return r;
}

Big BNUtils::mod_inv(const Big& a, const Big& mod) {
    Ctx ctx = cmake();
    return mod_inv(a, mod, ctx.get());
}

Big BNUtils::mod(const Big& a, const Big& mod, BN_CTX* ctx) {
    Big out = make();
    if (!BN_mod(out.get(), a.get(), mod.get(), ctx)) throw std::runtime_error("BN_mod failed");
    return out;
}

Big BNUtils::mod(const Big& a, const Big& mod) {
    Ctx ctx = cmake();
    return BNUtils::mod(a, mod, ctx.get());
}

// 生成区间 (0, upper_exclusive) 内随机数。
Big BNUtils::random_range(const BIGNUM* upper_exclusive) {
    Big r = make();
    do {
        if (!BN_priv_rand_range(r.get(), upper_exclusive))
            throw std::runtime_error("BN_priv_rand_range failed");
    } while (BN_is_zero(r.get()));
    return r;
}

Big BNUtils::random_range(const Big& upper_exclusive) {
    return random_range(upper_exclusive.get());
}

// 字节数组转 BIGNUM。空数组得到 0。
Big BNUtils::from_bytes(const std::vector<uint8_t>& data) {
    Big bn = make();
    if (!BN_bin2bn(data.data(), static_cast<int>(data.size()), bn.get()))
        throw std::runtime_error("BN_bin2bn failed");
    return bn;
}

// BIGNUM 定长导出到字节数组。
std::vector<uint8_t> BNUtils::to_bytes(const Big& bn, size_t out_len) {
    std::vector<uint8_t> buf(out_len);
    if (BN_bn2binpad(bn.get(), buf.data(), static_cast<int>(out_len)) < 0)
        throw std::runtime_error("BN_bn2binpad failed");
    return buf;
}

// BIGNUM 最短导出。
std::vector<uint8_t> BNUtils::to_bytes(const Big& bn) {
    std::vector<uint8_t> buf(static_cast<size_t>(BN_num_bytes(bn.get())));
    BN_bn2bin(bn.get(), buf.data());
    return buf;
}

void BNUtils::sub_word(Big& a, unsigned long w) {
    if (!BN_sub_word(a.get(), w)) throw std::runtime_error("BN_sub_word failed");
}

void BNUtils::rshift1(Big& a) {
    if (!BN_rshift1(a.get(), a.get())) throw std::runtime_error("BN_rshift1 failed");
}

int BNUtils::cmp(const Big& a, const Big& b) { return BN_cmp(a.get(), b.get()); }

bool BNUtils::is_zero(const Big& a) { return BN_is_zero(a.get()); }

ResidueGroup::ResidueGroup() : ResidueGroup(kResidueModulusHex, kResidueGenerator) {}

ResidueGroup::ResidueGroup(const std::string& modulus_hex, unsigned long generator) {
    p_ = BNUtils::from_hex(modulus_hex);
    if (!BN_is_odd(p_.get()) || BN_num_bits(p_.get()) < 3) {
        throw std::invalid_argument("residue modulus must be an odd prime");
    }

    // q = (p-1)/2
    q_ = BNUtils::dup(p_);
    BNUtils::sub_word(q_, 1);
    BNUtils::rshift1(q_);

    // p = 2q + 1，p 和 q 都必须是素数
    Ctx ctx = BNUtils::cmake();
    const int p_prime = BN_check_prime(p_.get(), ctx.get(), nullptr);
    const int q_prime = BN_check_prime(q_.get(), ctx.get(), nullptr);
    if (p_prime < 0 || q_prime < 0) {
        throw std::runtime_error("BN_check_prime failed");
    }
    if (p_prime == 0 || q_prime == 0) {
        throw std::invalid_argument("residue modulus must be a safe prime");
    }

    g_ = BNUtils::from_uint(generator);
    if (BNUtils::cmp(g_, p_) >= 0 || BN_is_one(g_.get()) || BN_is_zero(g_.get())) {
        throw std::invalid_argument("residue generator out of range");
    }
    if (!BN_is_one(BNUtils::mod_exp(g_, q_, p_, ctx.get()).get())) {
        throw std::invalid_argument("residue generator is not in the order-q subgroup");
    }
    element_size_ = static_cast<size_t>(BN_num_bytes(p_.get()));
}

// 在 [1, p-1] 中均匀采样。
Big ResidueGroup::random_element() const {
    return BNUtils::random_range(p_);
}

Big ResidueGroup::multiply(const Big& a, const Big& b) const {
    return BNUtils::mod_mul(a, b, p_);
}

Big ResidueGroup::exponentiate(const Big& base, const Big& exp) const {
    return BNUtils::mod_exp(base, exp, p_);
}

Big ResidueGroup::invert(const Big& a) const {
    return BNUtils::mod_inv(a, p_);
}

Big ResidueGroup::encode_message(const std::vector<uint8_t>& message) const {
    if (message.size() > max_message_size()) {
        throw PayloadTooLarge("message of " + std::to_string(message.size()) +
                              " bytes exceeds the " + std::to_string(max_message_size()) +
                              " byte payload limit");
    }
    std::vector<uint8_t> framed;
    framed.reserve(message.size() + 1);
    framed.push_back(kMessageMarker);
    framed.insert(framed.end(), message.begin(), message.end());

    Big m = BNUtils::from_bytes(framed);
    if (BNUtils::cmp(m, p_) >= 0) {
        throw PayloadTooLarge("message does not embed below the residue modulus");
    }
    return m;
}

std::vector<uint8_t> ResidueGroup::decode_message(const Big& element) const {
    std::vector<uint8_t> framed = BNUtils::to_bytes(element);
    if (framed.empty()) {
        return framed;
    }
    return std::vector<uint8_t>(framed.begin() + 1, framed.end());
}

std::vector<uint8_t> ResidueGroup::encode(const Big& element) const {
    return BNUtils::to_bytes(element, element_size_);
}

Big ResidueGroup::decode(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() != element_size_) {
        throw InvalidElement("residue element has wrong length");
    }
    Big out = BNUtils::from_bytes(bytes);
    if (!contains(out)) {
        throw InvalidElement("residue element out of range");
    }
    return out;
}

bool ResidueGroup::contains(const Big& element) const {
    return !BNUtils::is_zero(element) && BN_is_negative(element.get()) == 0 &&
           BNUtils::cmp(element, p_) < 0;
}

}  // namespace pre
