/**
 * 双线性配对群
 * 封装PBC库的配对对象以及Zr、G1、GT三类群元素
 * 使用Type A曲线(对称配对)，G1 x G1 -> GT
 */

#pragma once

#include <pbc/pbc.h>

#include <cstdint>
#include <string>
#include <vector>

namespace pre {

class ZrElement;
class G1Element;
class GTElement;

/**
 * 双线性配对群类
 * 管理PBC库的配对参数和配对对象的生命周期
 * 构造时预先完成PBC的惰性初始化，之后只读，可在多个线程间共享
 */
class PairingGroup {
   public:
    /**
     * 由PBC参数文本构造(如 kSS512Params)
     * @param param_text PBC参数文本
     * @throws std::invalid_argument 如果参数文本无法解析
     */
    explicit PairingGroup(const std::string& param_text);

    /**
     * 生成新的Type A曲线
     * @param rbits 群阶大小(比特)
     * @param qbits 基域大小(比特)
     * @throws std::invalid_argument 如果参数低于最小安全阈值
     */
    PairingGroup(int rbits, int qbits);

    // 禁止拷贝
    PairingGroup(const PairingGroup&) = delete;
    PairingGroup& operator=(const PairingGroup&) = delete;

    ~PairingGroup();

    pairing_t& pairing() const;

    /**
     * 随机G1元素(非单位元)
     * 对OpenSSL随机字节做哈希映射，不使用PBC内部随机源
     */
    G1Element randomG1() const;

    /**
     * 随机标量，均匀分布于 [1, r)
     */
    ZrElement randomScalar() const;

    /**
     * 配对运算 e(a, b)
     */
    GTElement pair(const G1Element& a, const G1Element& b) const;

    /**
     * 序列化群元素为定长字节数组
     */
    std::vector<uint8_t> encode(const ZrElement& element) const;
    std::vector<uint8_t> encode(const G1Element& element) const;
    std::vector<uint8_t> encode(const GTElement& element) const;

    /**
     * 反序列化
     * @throws InvalidElement 长度不符、标量为零或越界、元素不在r阶子群中
     */
    ZrElement decodeZr(const std::vector<uint8_t>& bytes) const;
    G1Element decodeG1(const std::vector<uint8_t>& bytes) const;
    GTElement decodeGT(const std::vector<uint8_t>& bytes) const;

   private:
    void prepareField();
    bool inPrimeOrderSubgroup(element_t& value) const;

    pbc_param_t param_;
    pairing_t pairing_;
};

/**
 * Zr元素的RAII封装类
 */
class ZrElement {
   public:
    explicit ZrElement(pairing_t pairing);
    ZrElement(const ZrElement&) = delete;
    ZrElement& operator=(const ZrElement&) = delete;
    ZrElement(ZrElement&& other) noexcept;
    ZrElement& operator=(ZrElement&& other) noexcept;
    ~ZrElement();
    void setInvert(const ZrElement& src);
    void setMul(const ZrElement& a, const ZrElement& b);
    void setMpz(mpz_t value);
    bool isZero() const;
    bool equals(const ZrElement& other) const;
    element_t& get();
    element_t& get() const;

   private:
    pairing_ptr pairing_;
    element_t value_;
};

/**
 * G1元素的RAII封装类
 */
class G1Element {
   public:
    explicit G1Element(pairing_t pairing);
    G1Element(const G1Element&) = delete;
    G1Element& operator=(const G1Element&) = delete;
    G1Element(G1Element&& other) noexcept;
    G1Element& operator=(G1Element&& other) noexcept;
    ~G1Element();
    void setFromHash(const void* data, size_t len);
    void setPowZn(const G1Element& base, const ZrElement& exponent);
    void setMul(const G1Element& a, const G1Element& b);
    bool isIdentity() const;
    bool equals(const G1Element& other) const;
    element_t& get();
    element_t& get() const;

   private:
    pairing_ptr pairing_;
    element_t value_;
};

/**
 * GT元素的RAII封装类
 */
class GTElement {
   public:
    explicit GTElement(pairing_t pairing);
    GTElement(const GTElement&) = delete;
    GTElement& operator=(const GTElement&) = delete;
    GTElement(GTElement&& other) noexcept;
    GTElement& operator=(GTElement&& other) noexcept;
    ~GTElement();
    void setPowZn(const GTElement& base, const ZrElement& exponent);
    void setMul(const GTElement& a, const GTElement& b);
    void setPairing(const G1Element& a, const G1Element& b, pairing_t pairing);
    bool equals(const GTElement& other) const;
    element_t& get();
    element_t& get() const;

   private:
    pairing_ptr pairing_;
    element_t value_;
};

}  // namespace pre
