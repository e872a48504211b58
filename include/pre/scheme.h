#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "pre/pairing_group.h"
#include "pre/residue_group.h"

namespace pre {

// 单向单跳代理重加密
// Setup:   g ∈ G1 随机, Z = e(g, g)
// KeyGen:  sk = x ∈ Z_r^*, pk = g^x
// Enc:     c1 = pk^r ∈ G1, c3 = encode(m) * 4^{KDF(Z^r)} mod p
// ReKey:   rk = pk_j^{1/x_i} = g^{x_j / x_i}
// ReEnc:   c2 = e(c1, rk) = Z^{x_j r} ∈ GT, c3 不变
// Dec:     Z^r = c2^{1/x_j}, m = c3 / 4^{KDF(Z^r)}
// 没有完整性校验：密钥不匹配时解密得到乱码而不是错误。

// 系统公共参数，Setup 之后不再修改。
struct SystemParams {
    G1Element g;
    GTElement Z;  // e(g, g)
};

struct KeyPair {
    G1Element pk;  // g^x
    ZrElement sk;  // x
};

// 重加密密钥 g^{x_j / x_i}，只能把 i 的密文转换给 j。
struct ReKey {
    G1Element rk;
};

// 转换前（二级）密文：c1 = pk^r ∈ G1，c3 = m * mask ∈ Z_p^*。
struct OriginalCiphertext {
    G1Element c1;
    Big c3;
};

// 转换后（一级）密文：c2 = Z^{x_j r} ∈ GT，c3 与转换前相同。不能再次转换。
struct TransformedCiphertext {
    GTElement c2;
    Big c3;
};

enum class Level { Transformed = 1, Original = 2 };

using Ciphertext = std::variant<OriginalCiphertext, TransformedCiphertext>;

Level levelOf(const Ciphertext& ct);

class ProxyReEncryption {
  public:
    // 两个群对象由调用方持有，生命周期必须长于本对象。
    ProxyReEncryption(const PairingGroup& group, const ResidueGroup& residue)
        : group_(group), residue_(residue) {}

    const PairingGroup& group() const { return group_; }
    const ResidueGroup& residue() const { return residue_; }

    SystemParams setup() const;
    KeyPair keygen(const SystemParams& params) const;

    // 消息超出 residue().max_message_size() 时抛出 PayloadTooLarge。
    OriginalCiphertext encrypt(const SystemParams& params, const G1Element& pk,
                               const std::vector<uint8_t>& message) const;

    // sk_from 为零时抛出 InvalidElement。自己给自己授权也是合法的。
    ReKey rekeygen(const ZrElement& sk_from, const G1Element& pk_to) const;

    TransformedCiphertext reencrypt(const SystemParams& params, const ReKey& rk,
                                    const OriginalCiphertext& ct) const;
    // 一级密文抛出 WrongLevel。
    TransformedCiphertext reencrypt(const SystemParams& params, const ReKey& rk,
                                    const Ciphertext& ct) const;

    std::vector<uint8_t> decrypt(const SystemParams& params, const ZrElement& sk,
                                 const TransformedCiphertext& ct) const;
    // 二级密文抛出 WrongLevel，持有者须先用 rekeygen(sk, pk) 自转换。
    std::vector<uint8_t> decrypt(const SystemParams& params, const ZrElement& sk,
                                 const Ciphertext& ct) const;

    // 持有者解密自己的密文：二级密文先自转换，一级密文直接解密。
    std::vector<uint8_t> decryptOwned(const SystemParams& params, const ZrElement& sk,
                                      const G1Element& pk, const Ciphertext& ct) const;

  private:
    Big mask(const GTElement& shared) const;

    const PairingGroup& group_;
    const ResidueGroup& residue_;
};

}  // namespace pre
