/**
 * 序列化编解码器
 * 群元素 -> 规范字节 -> base64 文本；结构体 -> 以字段名为键的 JSON 对象
 * c3 字段走剩余类群编码，其余字段走配对群编码
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pre/pairing_group.h"
#include "pre/residue_group.h"
#include "pre/scheme.h"

namespace pre {

/**
 * base64 编码(标准字母表，带填充)
 */
std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * base64 解码
 * @throws MalformedInput 长度不是4的倍数、含非法字符或不是规范编码
 */
std::vector<uint8_t> base64Decode(const std::string& text);

class Codec {
   public:
    Codec(const PairingGroup& group, const ResidueGroup& residue)
        : group_(group), residue_(residue) {}

    // 单个元素：公钥、私钥、重加密密钥按裸 base64 字符串传输
    std::string encodeElement(const ZrElement& element) const;
    std::string encodeElement(const G1Element& element) const;
    std::string encodeElement(const GTElement& element) const;
    ZrElement decodeZr(const std::string& text) const;
    G1Element decodeG1(const std::string& text) const;
    GTElement decodeGT(const std::string& text) const;

    std::string encodeParams(const SystemParams& params) const;
    SystemParams decodeParams(const std::string& text) const;

    std::string encodeReKey(const ReKey& rk) const;
    ReKey decodeReKey(const std::string& text) const;

    /**
     * 密文编码
     * 二级: {"c1": G1, "c3": residue}  一级: {"c2": GT, "c3": residue}
     */
    std::string encodeCiphertext(const OriginalCiphertext& ct) const;
    std::string encodeCiphertext(const TransformedCiphertext& ct) const;
    std::string encodeCiphertext(const Ciphertext& ct) const;

    /**
     * 密文解码，层级由出现的封装字段决定
     * @throws MalformedInput c1/c2 同时出现或都不出现、缺少 c3
     */
    Ciphertext decodeCiphertext(const std::string& text) const;

   private:
    const PairingGroup& group_;
    const ResidueGroup& residue_;
};

}  // namespace pre
