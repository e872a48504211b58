/**
 * 编译期配置常量
 * 配对曲线参数、剩余类群模数以及派生函数的长度都集中在这里
 */

#pragma once

#include <cstddef>

namespace pre {

// Type A 曲线安全参数(比特)
// 最小值用于内部验证，默认值供 PairingGroup(rbits, qbits) 使用
constexpr int kMinimumRbits = 160;   // 群阶最小大小（安全下限）
constexpr int kMinimumQbits = 512;   // 基域最小大小（安全下限）
constexpr int kDefaultRbits = 160;
constexpr int kDefaultQbits = 512;

/**
 * SS512: 固定的 Type A 超奇异曲线
 * r = 2^159 + 2^107 + 1, q = h*r - 1
 * 各进程共用同一条曲线，不需要把曲线本身放进系统参数
 */
constexpr const char* kSS512Params =
    "type a\n"
    "q 8780710799663312522437781984754049815806883199414208211028653399266475630880222957078625179422662221423155858769582317459277713367317481324925129998224791\n"
    "h 12016012264891146079388821366740534204802954401251311822919615131047207289359704531102844802183906537786776\n"
    "r 730750818665451621361119245571504901405976559617\n"
    "exp2 159\n"
    "exp1 107\n"
    "sign1 1\n"
    "sign0 1\n";

// 2048 位 MODP 群（RFC 3526 Group 14），安全素数 p = 2q + 1
constexpr const char* kResidueModulusHex =
    "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD1"
    "29024E088A67CC74020BBEA63B139B22514A08798E3404DD"
    "EF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245"
    "E485B576625E7EC6F44C42E9A637ED6B0BFF5CB6F406B7ED"
    "EE386BFB5A899FA5AE9F24117C4B1FE649286651ECE45B3D"
    "C2007CB8A163BF0598DA48361C55D39A69163FA8FD24CF5F"
    "83655D23DCA3AD961C62F356208552BB9ED529077096966D"
    "670C354E4ABC9804F1746C08CA18217C32905E462E36CE3B"
    "E39E772C180E86039B2783A2EC07A28FB5C55DF06F4C52C9"
    "DE2BCBF6955817183995497CEA956AE515D2261898FA0510"
    "15728E5A8AACAA68FFFFFFFFFFFFFFFF";

// q 阶子群生成元：2^((p-1)/q) = 2^2
constexpr unsigned long kResidueGenerator = 4;

// 消息嵌入时的前缀字节，保证空消息和前导零不丢失
constexpr unsigned char kMessageMarker = 0x01;

// 掩码指数的密钥流长度(字节)，取模 q 前保留足够余量
constexpr size_t kMaskKeystreamBytes = 64;

// 生成 G1 随机元素时哈希的随机字节数
constexpr size_t kHashSeedBytes = 32;

}  // namespace pre
