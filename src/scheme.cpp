#include "pre/scheme.h"

#include <utility>

#include "pre/config.h"
#include "pre/errors.h"
#include "pre/kdf.h"

namespace pre {

Level levelOf(const Ciphertext& ct) {
    return std::holds_alternative<OriginalCiphertext>(ct) ? Level::Original : Level::Transformed;
}

SystemParams ProxyReEncryption::setup() const {
    G1Element g = group_.randomG1();
    GTElement Z = group_.pair(g, g);  // Z = e(g, g)
    return SystemParams{std::move(g), std::move(Z)};
}

KeyPair ProxyReEncryption::keygen(const SystemParams& params) const {
    ZrElement sk = group_.randomScalar();
    G1Element pk(group_.pairing());
    pk.setPowZn(params.g, sk);  // pk = g^x
    return KeyPair{std::move(pk), std::move(sk)};
}

// mask = 4^{KDF(Z^r) mod q} mod p
Big ProxyReEncryption::mask(const GTElement& shared) const {
    Big exponent = BNUtils::from_bytes(sharedSecretToKeystream(group_, shared, kMaskKeystreamBytes));
    exponent = BNUtils::mod(exponent, residue_.order());
    return residue_.exponentiate(residue_.generator(), exponent);
}

OriginalCiphertext ProxyReEncryption::encrypt(const SystemParams& params, const G1Element& pk,
                                              const std::vector<uint8_t>& message) const {
    // 先嵌入消息，超长时不消耗随机数
    Big m = residue_.encode_message(message);

    ZrElement r = group_.randomScalar();
    G1Element c1(group_.pairing());
    c1.setPowZn(pk, r);  // c1 = pk^r

    GTElement shared(group_.pairing());
    shared.setPowZn(params.Z, r);  // Z^r
    Big c3 = residue_.multiply(m, mask(shared));
    return OriginalCiphertext{std::move(c1), std::move(c3)};
}

ReKey ProxyReEncryption::rekeygen(const ZrElement& sk_from, const G1Element& pk_to) const {
    if (sk_from.isZero()) {
        throw InvalidElement("delegator secret key is zero");
    }
    ZrElement inv(group_.pairing());
    inv.setInvert(sk_from);
    G1Element rk(group_.pairing());
    rk.setPowZn(pk_to, inv);  // g^{x_j / x_i}
    return ReKey{std::move(rk)};
}

// c2 = e(pk_i^r, g^{x_j/x_i}) = Z^{x_j r}，只用到公开材料
TransformedCiphertext ProxyReEncryption::reencrypt(const SystemParams& /*params*/, const ReKey& rk,
                                                   const OriginalCiphertext& ct) const {
    GTElement c2 = group_.pair(ct.c1, rk.rk);
    return TransformedCiphertext{std::move(c2), BNUtils::dup(ct.c3)};
}

TransformedCiphertext ProxyReEncryption::reencrypt(const SystemParams& params, const ReKey& rk,
                                                   const Ciphertext& ct) const {
    const auto* original = std::get_if<OriginalCiphertext>(&ct);
    if (original == nullptr) {
        throw WrongLevel("ciphertext has already been re-encrypted");
    }
    return reencrypt(params, rk, *original);
}

std::vector<uint8_t> ProxyReEncryption::decrypt(const SystemParams& /*params*/, const ZrElement& sk,
                                                const TransformedCiphertext& ct) const {
    if (sk.isZero()) {
        throw InvalidElement("secret key is zero");
    }
    if (!residue_.contains(ct.c3)) {
        throw InvalidElement("payload is not a residue group element");
    }
    ZrElement inv(group_.pairing());
    inv.setInvert(sk);
    GTElement shared(group_.pairing());
    shared.setPowZn(ct.c2, inv);  // (Z^{x_j r})^{1/x_j} = Z^r

    Big m = residue_.multiply(ct.c3, residue_.invert(mask(shared)));
    return residue_.decode_message(m);
}

std::vector<uint8_t> ProxyReEncryption::decrypt(const SystemParams& params, const ZrElement& sk,
                                                const Ciphertext& ct) const {
    const auto* transformed = std::get_if<TransformedCiphertext>(&ct);
    if (transformed == nullptr) {
        throw WrongLevel("ciphertext must be re-encrypted before decryption");
    }
    return decrypt(params, sk, *transformed);
}

std::vector<uint8_t> ProxyReEncryption::decryptOwned(const SystemParams& params, const ZrElement& sk,
                                                     const G1Element& pk,
                                                     const Ciphertext& ct) const {
    if (const auto* original = std::get_if<OriginalCiphertext>(&ct)) {
        ReKey self = rekeygen(sk, pk);
        return decrypt(params, sk, reencrypt(params, self, *original));
    }
    return decrypt(params, sk, ct);
}

}  // namespace pre
