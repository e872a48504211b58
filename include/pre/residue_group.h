#pragma once

#include <openssl/bn.h>
#include <openssl/rand.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pre {

// BN/CTX 智能指针删除器，避免手动释放。
struct BNDeleter { void operator()(BIGNUM* bn) const { BN_free(bn); } };
struct CtxDeleter { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };

using Big = std::unique_ptr<BIGNUM, BNDeleter>;
using Ctx = std::unique_ptr<BN_CTX, CtxDeleter>;

// BNUtils: 聚合与方案无关的 BIGNUM 常用操作。不带 ctx 的重载每次新建 BN_CTX，可并发调用。
class BNUtils {
  public:
    static Big make();
    static Ctx cmake();
    static Big from_hex(const std::string& hex);
    static Big from_uint(uint64_t value);
    static Big dup(const BIGNUM* src);
    static Big dup(const Big& src);
    static std::string to_hex(const Big& bn);
    static Big mod_mul(const Big& a, const Big& b, const Big& mod, BN_CTX* ctx);
    static Big mod_mul(const Big& a, const Big& b, const Big& mod);
    static Big mod_exp(const Big& base, const Big& exp, const Big& mod, BN_CTX* ctx);
    static Big mod_exp(const Big& base, const Big& exp, const Big& mod);
    static Big mod_inv(const Big& a, const Big& mod, BN_CTX* ctx);
    static Big mod_inv(const Big& a, const Big& mod);
    static Big mod(const Big& a, const Big& mod, BN_CTX* ctx);
    static Big mod(const Big& a, const Big& mod);
    static Big random_range(const BIGNUM* upper_exclusive);
    static Big random_range(const Big& upper_exclusive);
    static Big from_bytes(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> to_bytes(const Big& bn, size_t out_len);
    static std::vector<uint8_t> to_bytes(const Big& bn);
    static void sub_word(Big& a, unsigned long w);
    static void rshift1(Big& a);
    static int cmp(const Big& a, const Big& b);
    static bool is_zero(const Big& a);
};

// 剩余类群 Z_p^*：承载被掩码的消息。构造后只读，可在线程间共享。
class ResidueGroup {
  public:
    // 默认使用 RFC 3526 Group 14 与生成元 4。
    ResidueGroup();
    // modulus_hex 必须是安全素数 p = 2q + 1，generator 生成 q 阶子群。
    ResidueGroup(const std::string& modulus_hex, unsigned long generator);

    ResidueGroup(const ResidueGroup&) = delete;
    ResidueGroup& operator=(const ResidueGroup&) = delete;

    const Big& modulus() const { return p_; }
    const Big& order() const { return q_; }
    const Big& generator() const { return g_; }

    // 元素的定长编码字节数。
    size_t element_size() const { return element_size_; }
    // 可嵌入的最大消息字节数（扣除前缀字节）。
    size_t max_message_size() const { return element_size_ - 1; }

    Big random_element() const;
    Big multiply(const Big& a, const Big& b) const;
    Big exponentiate(const Big& base, const Big& exp) const;
    Big invert(const Big& a) const;

    // 消息 -> 群元素：整数 0x01 || m，必须小于 p，否则抛出 PayloadTooLarge。
    Big encode_message(const std::vector<uint8_t>& message) const;
    // 群元素 -> 消息：去掉最高位的前缀字节。不做校验，错误密钥得到的是乱码而不是异常。
    std::vector<uint8_t> decode_message(const Big& element) const;

    // 定长大端编码。
    std::vector<uint8_t> encode(const Big& element) const;
    // 长度不符或不在 [1, p-1] 内时抛出 InvalidElement。
    Big decode(const std::vector<uint8_t>& bytes) const;
    bool contains(const Big& element) const;

  private:
    Big p_;
    Big q_;
    Big g_;
    size_t element_size_;
};

}  // namespace pre
