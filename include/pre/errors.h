/**
 * 错误类型
 * 方案核心、编解码器和命令行共用的异常层次
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pre {

class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// 编解码失败：JSON/base64 不合法、缺少字段
class MalformedInput : public Error {
   public:
    explicit MalformedInput(const std::string& what) : Error(what) {}
};

// 字节串不是合法的群元素
class InvalidElement : public MalformedInput {
   public:
    explicit InvalidElement(const std::string& what) : MalformedInput(what) {}
};

// 消息超出剩余类群的嵌入容量
class PayloadTooLarge : public Error {
   public:
    explicit PayloadTooLarge(const std::string& what) : Error(what) {}
};

// 重加密收到一级密文，或解密收到二级密文
class WrongLevel : public Error {
   public:
    explicit WrongLevel(const std::string& what) : Error(what) {}
};

// 命令行缺少必需参数
class MissingArgument : public Error {
   public:
    explicit MissingArgument(const std::string& what) : Error(what) {}
};

}  // namespace pre
