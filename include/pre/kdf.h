/**
 * 密钥派生与调试工具
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pre/pairing_group.h"

namespace pre {

/**
 * 从共享密钥派生密钥流
 * 使用SHA256的计数器模式KDF
 * @param group 配对群(用于序列化)
 * @param secret 共享密钥(GT群元素)
 * @param length 需要的密钥流长度
 * @return 密钥流
 */
std::vector<uint8_t> sharedSecretToKeystream(const PairingGroup& group, const GTElement& secret,
                                             size_t length);

/**
 * 将字节数组转换为十六进制字符串
 */
std::string toHex(const std::vector<uint8_t>& data);

}  // namespace pre
