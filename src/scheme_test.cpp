#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pre/config.h"
#include "pre/errors.h"
#include "pre/kdf.h"
#include "pre/scheme.h"

using pre::Ciphertext;
using pre::KeyPair;
using pre::OriginalCiphertext;
using pre::ProxyReEncryption;
using pre::ReKey;
using pre::SystemParams;
using pre::TransformedCiphertext;

namespace {

std::vector<uint8_t> bytes(const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); }

bool same(const std::vector<uint8_t>& got, const std::vector<uint8_t>& want) {
    if (got != want) {
        std::cerr << "want " << pre::toHex(want) << "\n got " << pre::toHex(got) << "\n";
        return false;
    }
    return true;
}

}  // namespace

// 持有者自授权后解密：Decrypt(sk, ReEnc(ReKeyGen(sk, pk), Enc(pk, m))) == m
bool test_round_trip(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    std::vector<uint8_t> m = bytes("Test message for proxy re-encryption");

    OriginalCiphertext ct = pre.encrypt(params, alice.pk, m);
    ReKey self = pre.rekeygen(alice.sk, alice.pk);
    TransformedCiphertext ct1 = pre.reencrypt(params, self, ct);
    return same(pre.decrypt(params, alice.sk, ct1), m);
}

// Alice -> Bob 授权
bool test_delegation(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    std::vector<uint8_t> m = bytes("shared with bob");

    OriginalCiphertext ct_alice = pre.encrypt(params, alice.pk, m);
    ReKey rk = pre.rekeygen(alice.sk, bob.pk);
    TransformedCiphertext ct_bob = pre.reencrypt(params, rk, ct_alice);
    if (!same(pre.decrypt(params, bob.sk, ct_bob), m)) {
        return false;
    }
    // 重加密不改变载荷
    return BN_cmp(ct_bob.c3.get(), ct_alice.c3.get()) == 0;
}

// 单跳：对一级密文再次重加密必须失败
bool test_single_hop(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    KeyPair carol = pre.keygen(params);

    Ciphertext ct = pre.encrypt(params, alice.pk, bytes("once"));
    Ciphertext ct_bob = pre.reencrypt(params, pre.rekeygen(alice.sk, bob.pk), ct);
    if (pre::levelOf(ct) != pre::Level::Original || pre::levelOf(ct_bob) != pre::Level::Transformed) {
        return false;
    }
    try {
        pre.reencrypt(params, pre.rekeygen(bob.sk, carol.pk), ct_bob);
    } catch (const pre::WrongLevel&) {
        return true;
    }
    return false;
}

// 二级密文不能直接解密，持有者也不行
bool test_decrypt_requires_transform(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    Ciphertext ct = pre.encrypt(params, alice.pk, bytes("not yet"));
    try {
        pre.decrypt(params, alice.sk, ct);
    } catch (const pre::WrongLevel&) {
        return true;
    }
    return false;
}

bool test_decrypt_owned(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    std::vector<uint8_t> m = bytes("owner reads own file");

    Ciphertext ct = pre.encrypt(params, alice.pk, m);
    if (!same(pre.decryptOwned(params, alice.sk, alice.pk, ct), m)) {
        return false;
    }
    // 一级密文走普通解密
    Ciphertext ct_bob = pre.reencrypt(params, pre.rekeygen(alice.sk, bob.pk), ct);
    return same(pre.decryptOwned(params, bob.sk, bob.pk, ct_bob), m);
}

// 边界：恰好 255 字节成功，256 字节 PayloadTooLarge
bool test_payload_boundary(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    const size_t limit = pre.residue().max_message_size();
    std::vector<uint8_t> largest(limit, 0xAB);

    OriginalCiphertext ct = pre.encrypt(params, alice.pk, largest);
    TransformedCiphertext ct1 = pre.reencrypt(params, pre.rekeygen(alice.sk, alice.pk), ct);
    if (limit != 255 || !same(pre.decrypt(params, alice.sk, ct1), largest)) {
        return false;
    }
    try {
        pre.encrypt(params, alice.pk, std::vector<uint8_t>(limit + 1, 0xAB));
    } catch (const pre::PayloadTooLarge&) {
        return true;
    }
    return false;
}

// 空消息与前导零字节
bool test_edge_messages(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    ReKey rk = pre.rekeygen(alice.sk, bob.pk);
    const std::vector<std::vector<uint8_t>> messages = {
        {},
        {0x00},
        {0x00, 0x00, 0x01, 0xFF},
    };
    for (const auto& m : messages) {
        TransformedCiphertext ct = pre.reencrypt(params, rk, pre.encrypt(params, alice.pk, m));
        if (!same(pre.decrypt(params, bob.sk, ct), m)) {
            return false;
        }
    }
    return true;
}

// 密钥不匹配：返回字节串而不是异常，且与原文不同
bool test_mismatched_key(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    KeyPair eve = pre.keygen(params);
    std::vector<uint8_t> m = bytes("for bob only");

    TransformedCiphertext ct =
        pre.reencrypt(params, pre.rekeygen(alice.sk, bob.pk), pre.encrypt(params, alice.pk, m));
    std::vector<uint8_t> garbage = pre.decrypt(params, eve.sk, ct);
    return garbage != m;
}

// 单向：A->B 的重加密密钥不能转换 B 的密文
bool test_unidirectional(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    std::vector<uint8_t> m = bytes("bob's own data");

    ReKey rk_ab = pre.rekeygen(alice.sk, bob.pk);
    TransformedCiphertext wrong_way = pre.reencrypt(params, rk_ab, pre.encrypt(params, bob.pk, m));
    return pre.decrypt(params, alice.sk, wrong_way) != m && pre.decrypt(params, bob.sk, wrong_way) != m;
}

// 重加密密钥不直接暴露任一方私钥
bool test_rekey_hides_secrets(const ProxyReEncryption& pre, const SystemParams& params) {
    const pre::PairingGroup& group = pre.group();
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    ReKey rk_ab = pre.rekeygen(alice.sk, bob.pk);
    ReKey rk_ba = pre.rekeygen(bob.sk, alice.pk);

    const std::vector<uint8_t> rk_bytes = group.encode(rk_ab.rk);
    const std::vector<uint8_t> sk_a = group.encode(alice.sk);
    const std::vector<uint8_t> sk_b = group.encode(bob.sk);
    auto contains = [&](const std::vector<uint8_t>& needle) {
        return std::search(rk_bytes.begin(), rk_bytes.end(), needle.begin(), needle.end()) !=
               rk_bytes.end();
    };
    pre::ZrElement inv(group.pairing());
    inv.setInvert(alice.sk);
    if (contains(sk_a) || contains(sk_b) || contains(group.encode(inv))) {
        return false;
    }

    // g^{1/x_a}、g^{x_b} 与重加密密钥都不同
    pre::G1Element g_inv(group.pairing());
    g_inv.setPowZn(params.g, inv);
    return !rk_ab.rk.equals(g_inv) && !rk_ab.rk.equals(bob.pk) && !rk_ab.rk.equals(alice.pk) &&
           !rk_ab.rk.equals(rk_ba.rk);
}

bool test_setup_is_fresh(const ProxyReEncryption& pre) {
    SystemParams a = pre.setup();
    SystemParams b = pre.setup();
    return !a.g.equals(b.g) && !a.Z.equals(b.Z);
}

bool test_zero_secret_rejected(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair bob = pre.keygen(params);
    pre::ZrElement zero(pre.group().pairing());
    try {
        pre.rekeygen(zero, bob.pk);
    } catch (const pre::InvalidElement&) {
        return true;
    }
    return false;
}

// 多线程共享同一组参数与密钥
bool test_concurrent_use(const ProxyReEncryption& pre, const SystemParams& params) {
    KeyPair alice = pre.keygen(params);
    KeyPair bob = pre.keygen(params);
    ReKey rk = pre.rekeygen(alice.sk, bob.pk);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            try {
                for (int i = 0; i < 5; ++i) {
                    std::vector<uint8_t> m = bytes("thread " + std::to_string(t) + " #" + std::to_string(i));
                    TransformedCiphertext ct = pre.reencrypt(params, rk, pre.encrypt(params, alice.pk, m));
                    if (pre.decrypt(params, bob.sk, ct) != m) {
                        ++failures;
                    }
                }
            } catch (const std::exception& e) {
                std::cerr << "worker " << t << ": " << e.what() << "\n";
                ++failures;
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    return failures == 0;
}

// 新建的配对群上多个线程同时执行 setup，生成元都不是单位元且 Z = e(g, g)
bool test_concurrent_setup(const pre::ResidueGroup& residue) {
    pre::PairingGroup fresh(pre::kSS512Params);
    ProxyReEncryption scheme(fresh, residue);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            try {
                for (int i = 0; i < 4; ++i) {
                    SystemParams params = scheme.setup();
                    if (params.g.isIdentity() || !params.Z.equals(fresh.pair(params.g, params.g))) {
                        ++failures;
                    }
                }
            } catch (const std::exception& e) {
                std::cerr << "setup worker " << t << ": " << e.what() << "\n";
                ++failures;
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    return failures == 0;
}

// 两套互相独立的参数同时使用
bool test_independent_parameter_sets(const ProxyReEncryption& pre, const SystemParams& params) {
    pre::PairingGroup other_group(pre::kDefaultRbits, pre::kDefaultQbits);
    ProxyReEncryption other(other_group, pre.residue());
    SystemParams other_params = other.setup();

    KeyPair a = pre.keygen(params);
    KeyPair b = other.keygen(other_params);
    std::vector<uint8_t> m = bytes("two worlds");

    TransformedCiphertext ct_a =
        pre.reencrypt(params, pre.rekeygen(a.sk, a.pk), pre.encrypt(params, a.pk, m));
    TransformedCiphertext ct_b =
        other.reencrypt(other_params, other.rekeygen(b.sk, b.pk), other.encrypt(other_params, b.pk, m));
    return same(pre.decrypt(params, a.sk, ct_a), m) && same(other.decrypt(other_params, b.sk, ct_b), m);
}

int main() {
    try {
        pre::PairingGroup group(pre::kSS512Params);
        pre::ResidueGroup residue;
        ProxyReEncryption pre(group, residue);
        SystemParams params = pre.setup();

        struct Case {
            const char* name;
            bool passed;
        };
        const std::vector<Case> cases = {
            {"Round trip", test_round_trip(pre, params)},
            {"Delegation", test_delegation(pre, params)},
            {"Single hop", test_single_hop(pre, params)},
            {"Decrypt level", test_decrypt_requires_transform(pre, params)},
            {"Owned decrypt", test_decrypt_owned(pre, params)},
            {"Payload boundary", test_payload_boundary(pre, params)},
            {"Edge messages", test_edge_messages(pre, params)},
            {"Mismatched key", test_mismatched_key(pre, params)},
            {"Unidirectional", test_unidirectional(pre, params)},
            {"ReKey secrecy", test_rekey_hides_secrets(pre, params)},
            {"Fresh setup", test_setup_is_fresh(pre)},
            {"Zero secret key", test_zero_secret_rejected(pre, params)},
            {"Concurrent use", test_concurrent_use(pre, params)},
            {"Concurrent setup", test_concurrent_setup(residue)},
            {"Independent parameters", test_independent_parameter_sets(pre, params)},
        };

        bool all = true;
        for (const auto& c : cases) {
            std::cout << c.name << " test: " << (c.passed ? "PASS" : "FAIL") << "\n";
            all = all && c.passed;
        }
        return all ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "测试失败，异常: " << e.what() << std::endl;
        return 1;
    }
}
