/**
 * 双线性配对群实现文件
 */

#include "pre/pairing_group.h"

#include <openssl/rand.h>

#include "pre/config.h"
#include "pre/errors.h"
#include "pre/residue_group.h"

namespace pre {

namespace {

// mpz 转定长大端字节(不足左侧补零)
std::vector<uint8_t> mpzToBytes(const mpz_t value, size_t out_len) {
    const size_t needed = (mpz_sizeinbase(value, 2) + 7) / 8;
    if (needed > out_len) {
        throw std::runtime_error("mpz value does not fit output buffer");
    }
    std::vector<uint8_t> out(out_len, 0);
    if (mpz_sgn(value) != 0) {
        size_t written = 0;
        mpz_export(out.data() + (out_len - needed), &written, 1, 1, 1, 0, value);
    }
    return out;
}

}  // namespace

/**
 * 由参数文本构造
 * 解析失败时PBC不会初始化param_，直接抛出即可
 */
PairingGroup::PairingGroup(const std::string& param_text) {
    if (pbc_param_init_set_str(param_, param_text.c_str()) != 0) {
        throw std::invalid_argument("invalid PBC pairing parameters");
    }
    pairing_init_pbc_param(pairing_, param_);
    prepareField();
}

/**
 * 生成Type A曲线参数并初始化配对
 */
PairingGroup::PairingGroup(int rbits, int qbits) {
    // 检查安全参数
    if (rbits < kMinimumRbits || qbits < kMinimumQbits) {
        throw std::invalid_argument("security parameters below recommended threshold");
    }
    pbc_param_init_a_gen(param_, rbits, qbits);
    pairing_init_pbc_param(pairing_, param_);
    prepareField();
}

/**
 * 哈希到G1要在基域上开方，PBC第一次开方时才用自带随机源选取并缓存二次非剩余，
 * 且没有加锁。构造时先做一次哈希，之后的 randomG1 只读这份缓存，可多线程并发。
 */
void PairingGroup::prepareField() {
    const uint8_t seed[kHashSeedBytes] = {0};
    G1Element scratch(pairing());
    scratch.setFromHash(seed, sizeof(seed));
}

PairingGroup::~PairingGroup() {
    pairing_clear(pairing_);
    pbc_param_clear(param_);
}

pairing_t& PairingGroup::pairing() const { return const_cast<pairing_t&>(pairing_); }

G1Element PairingGroup::randomG1() const {
    G1Element out(pairing());
    std::vector<uint8_t> seed(kHashSeedBytes);
    do {
        if (RAND_priv_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
            throw std::runtime_error("RAND_priv_bytes failed");
        }
        out.setFromHash(seed.data(), seed.size());
    } while (out.isIdentity());
    return out;
}

/**
 * 随机标量
 * 用 BN_priv_rand_range 在 [1, r) 内取值，再写入Zr元素
 */
ZrElement PairingGroup::randomScalar() const {
    const size_t len = static_cast<size_t>(pairing_length_in_bytes_Zr(pairing()));
    Big order = BNUtils::from_bytes(mpzToBytes(pairing()[0].r, len));
    Big value = BNUtils::random_range(order);
    std::vector<uint8_t> bytes = BNUtils::to_bytes(value, len);

    mpz_t z;
    mpz_init(z);
    mpz_import(z, bytes.size(), 1, 1, 1, 0, bytes.data());
    ZrElement out(pairing());
    out.setMpz(z);
    mpz_clear(z);
    return out;
}

GTElement PairingGroup::pair(const G1Element& a, const G1Element& b) const {
    GTElement out(pairing());
    out.setPairing(a, b, pairing());
    return out;
}

std::vector<uint8_t> PairingGroup::encode(const ZrElement& element) const {
    std::vector<uint8_t> buffer(element_length_in_bytes(element.get()));
    element_to_bytes(buffer.data(), element.get());
    return buffer;
}

std::vector<uint8_t> PairingGroup::encode(const G1Element& element) const {
    std::vector<uint8_t> buffer(element_length_in_bytes(element.get()));
    element_to_bytes(buffer.data(), element.get());
    return buffer;
}

std::vector<uint8_t> PairingGroup::encode(const GTElement& element) const {
    std::vector<uint8_t> buffer(element_length_in_bytes(element.get()));
    element_to_bytes(buffer.data(), element.get());
    return buffer;
}

/**
 * 反序列化Zr元素
 * element_from_bytes 会静默地对r取模，这里先显式检查范围
 */
ZrElement PairingGroup::decodeZr(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() != static_cast<size_t>(pairing_length_in_bytes_Zr(pairing()))) {
        throw InvalidElement("Zr element has wrong length");
    }
    mpz_t z;
    mpz_init(z);
    mpz_import(z, bytes.size(), 1, 1, 1, 0, bytes.data());
    if (mpz_sgn(z) == 0 || mpz_cmp(z, pairing()[0].r) >= 0) {
        mpz_clear(z);
        throw InvalidElement("Zr element out of range");
    }
    ZrElement out(pairing());
    out.setMpz(z);
    mpz_clear(z);
    return out;
}

G1Element PairingGroup::decodeG1(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() != static_cast<size_t>(pairing_length_in_bytes_G1(pairing()))) {
        throw InvalidElement("G1 element has wrong length");
    }
    G1Element out(pairing());
    element_from_bytes(out.get(), const_cast<uint8_t*>(bytes.data()));
    // 不在曲线上的点会被PBC置为无穷远点，单位元在方案中也不会合法出现
    if (element_is1(out.get()) || !inPrimeOrderSubgroup(out.get())) {
        throw InvalidElement("G1 element is not in the prime order subgroup");
    }
    return out;
}

GTElement PairingGroup::decodeGT(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() != static_cast<size_t>(pairing_length_in_bytes_GT(pairing()))) {
        throw InvalidElement("GT element has wrong length");
    }
    GTElement out(pairing());
    element_from_bytes(out.get(), const_cast<uint8_t*>(bytes.data()));
    if (element_is1(out.get()) || !inPrimeOrderSubgroup(out.get())) {
        throw InvalidElement("GT element is not in the prime order subgroup");
    }
    return out;
}

// x^r == 1
bool PairingGroup::inPrimeOrderSubgroup(element_t& value) const {
    element_t tmp;
    element_init_same_as(tmp, value);
    element_pow_mpz(tmp, value, pairing()[0].r);
    const bool ok = element_is1(tmp) != 0;
    element_clear(tmp);
    return ok;
}

// ZrElement实现
ZrElement::ZrElement(pairing_t pairing) : pairing_(pairing) {
    element_init_Zr(value_, pairing_);
}

ZrElement::ZrElement(ZrElement&& other) noexcept : pairing_(other.pairing_) {
    element_init_Zr(value_, pairing_);
    element_set(value_, other.value_);
}

ZrElement& ZrElement::operator=(ZrElement&& other) noexcept {
    if (this != &other) {
        element_clear(value_);
        pairing_ = other.pairing_;
        element_init_Zr(value_, pairing_);
        element_set(value_, other.value_);
    }
    return *this;
}

ZrElement::~ZrElement() {
    element_clear(value_);
}

void ZrElement::setInvert(const ZrElement& src) {
    element_invert(value_, src.get());
}

void ZrElement::setMul(const ZrElement& a, const ZrElement& b) {
    element_mul(value_, a.get(), b.get());
}

void ZrElement::setMpz(mpz_t value) {
    element_set_mpz(value_, value);
}

bool ZrElement::isZero() const {
    return element_is0(const_cast<element_t&>(value_)) != 0;
}

bool ZrElement::equals(const ZrElement& other) const {
    return element_cmp(const_cast<element_t&>(value_), const_cast<element_t&>(other.value_)) == 0;
}

element_t& ZrElement::get() {
    return value_;
}

element_t& ZrElement::get() const {
    return const_cast<element_t&>(value_);
}

// G1Element实现
G1Element::G1Element(pairing_t pairing) : pairing_(pairing) {
    element_init_G1(value_, pairing_);
}

G1Element::G1Element(G1Element&& other) noexcept : pairing_(other.pairing_) {
    element_init_G1(value_, pairing_);
    element_set(value_, other.value_);
}

G1Element& G1Element::operator=(G1Element&& other) noexcept {
    if (this != &other) {
        element_clear(value_);
        pairing_ = other.pairing_;
        element_init_G1(value_, pairing_);
        element_set(value_, other.value_);
    }
    return *this;
}

G1Element::~G1Element() {
    element_clear(value_);
}

void G1Element::setFromHash(const void* data, size_t len) {
    element_from_hash(value_, const_cast<void*>(data), static_cast<int>(len));
}

void G1Element::setPowZn(const G1Element& base, const ZrElement& exponent) {
    element_pow_zn(value_, base.get(), exponent.get());
}

void G1Element::setMul(const G1Element& a, const G1Element& b) {
    element_mul(value_, a.get(), b.get());
}

bool G1Element::isIdentity() const {
    return element_is1(const_cast<element_t&>(value_)) != 0;
}

bool G1Element::equals(const G1Element& other) const {
    return element_cmp(const_cast<element_t&>(value_), const_cast<element_t&>(other.value_)) == 0;
}

element_t& G1Element::get() {
    return value_;
}

element_t& G1Element::get() const {
    return const_cast<element_t&>(value_);
}

// GTElement实现
GTElement::GTElement(pairing_t pairing) : pairing_(pairing) {
    element_init_GT(value_, pairing_);
}

GTElement::GTElement(GTElement&& other) noexcept : pairing_(other.pairing_) {
    element_init_GT(value_, pairing_);
    element_set(value_, other.value_);
}

GTElement& GTElement::operator=(GTElement&& other) noexcept {
    if (this != &other) {
        element_clear(value_);
        pairing_ = other.pairing_;
        element_init_GT(value_, pairing_);
        element_set(value_, other.value_);
    }
    return *this;
}

GTElement::~GTElement() {
    element_clear(value_);
}

void GTElement::setPowZn(const GTElement& base, const ZrElement& exponent) {
    element_pow_zn(value_, base.get(), exponent.get());
}

void GTElement::setMul(const GTElement& a, const GTElement& b) {
    element_mul(value_, a.get(), b.get());
}

void GTElement::setPairing(const G1Element& a, const G1Element& b, pairing_t pairing) {
    pairing_apply(value_, a.get(), b.get(), pairing);
}

bool GTElement::equals(const GTElement& other) const {
    return element_cmp(const_cast<element_t&>(value_), const_cast<element_t&>(other.value_)) == 0;
}

element_t& GTElement::get() {
    return value_;
}

element_t& GTElement::get() const {
    return const_cast<element_t&>(value_);
}

}  // namespace pre
