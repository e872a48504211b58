#include "pre/codec.h"

#include <openssl/evp.h>

#include <nlohmann/json.hpp>

#include <utility>

#include "pre/errors.h"

namespace pre {

using json = nlohmann::json;

namespace {

bool isBase64Char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

json parseEnvelope(const std::string& text) {
    json envelope;
    try {
        envelope = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedInput(std::string("envelope is not valid JSON: ") + e.what());
    }
    if (!envelope.is_object()) {
        throw MalformedInput("envelope is not a JSON object");
    }
    return envelope;
}

std::string requireField(const json& envelope, const char* name) {
    auto it = envelope.find(name);
    if (it == envelope.end()) {
        throw MalformedInput(std::string("missing field \"") + name + "\"");
    }
    if (!it->is_string()) {
        throw MalformedInput(std::string("field \"") + name + "\" is not a string");
    }
    return it->get<std::string>();
}

}  // namespace

std::string base64Encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    if (data.empty()) {
        return out;
    }
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                        static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * EVP_DecodeBlock 不处理填充，返回长度总是3的倍数，这里自己去掉填充字节
 * 只接受规范编码
 */
std::vector<uint8_t> base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw MalformedInput("base64 length is not a multiple of 4");
    }
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '=') {
            if (i + 2 < text.size()) {
                throw MalformedInput("misplaced base64 padding");
            }
            ++padding;
        } else if (padding > 0 || !isBase64Char(c)) {
            throw MalformedInput("invalid base64 character");
        }
    }
    if (text.empty()) {
        return {};
    }

    std::vector<uint8_t> out(3 * text.size() / 4);
    const int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        throw MalformedInput("invalid base64 input");
    }
    out.resize(static_cast<size_t>(written) - padding);
    // 填充前的多余比特必须为零，保证每个字节串只有一种文本形式
    if (base64Encode(out) != text) {
        throw MalformedInput("non-canonical base64 encoding");
    }
    return out;
}

std::string Codec::encodeElement(const ZrElement& element) const {
    return base64Encode(group_.encode(element));
}

std::string Codec::encodeElement(const G1Element& element) const {
    return base64Encode(group_.encode(element));
}

std::string Codec::encodeElement(const GTElement& element) const {
    return base64Encode(group_.encode(element));
}

ZrElement Codec::decodeZr(const std::string& text) const {
    return group_.decodeZr(base64Decode(text));
}

G1Element Codec::decodeG1(const std::string& text) const {
    return group_.decodeG1(base64Decode(text));
}

GTElement Codec::decodeGT(const std::string& text) const {
    return group_.decodeGT(base64Decode(text));
}

std::string Codec::encodeParams(const SystemParams& params) const {
    json envelope;
    envelope["g"] = encodeElement(params.g);
    envelope["Z"] = encodeElement(params.Z);
    return envelope.dump();
}

SystemParams Codec::decodeParams(const std::string& text) const {
    const json envelope = parseEnvelope(text);
    G1Element g = decodeG1(requireField(envelope, "g"));
    GTElement Z = decodeGT(requireField(envelope, "Z"));
    return SystemParams{std::move(g), std::move(Z)};
}

std::string Codec::encodeReKey(const ReKey& rk) const {
    return encodeElement(rk.rk);
}

ReKey Codec::decodeReKey(const std::string& text) const {
    return ReKey{decodeG1(text)};
}

std::string Codec::encodeCiphertext(const OriginalCiphertext& ct) const {
    json envelope;
    envelope["c1"] = encodeElement(ct.c1);
    envelope["c3"] = base64Encode(residue_.encode(ct.c3));
    return envelope.dump();
}

std::string Codec::encodeCiphertext(const TransformedCiphertext& ct) const {
    json envelope;
    envelope["c2"] = encodeElement(ct.c2);
    envelope["c3"] = base64Encode(residue_.encode(ct.c3));
    return envelope.dump();
}

std::string Codec::encodeCiphertext(const Ciphertext& ct) const {
    return std::visit([this](const auto& level) { return encodeCiphertext(level); }, ct);
}

Ciphertext Codec::decodeCiphertext(const std::string& text) const {
    const json envelope = parseEnvelope(text);
    const bool has_c1 = envelope.contains("c1");
    const bool has_c2 = envelope.contains("c2");
    if (has_c1 == has_c2) {
        throw MalformedInput("ciphertext must carry exactly one of \"c1\" or \"c2\"");
    }

    Big c3 = residue_.decode(base64Decode(requireField(envelope, "c3")));
    if (has_c1) {
        G1Element c1 = decodeG1(requireField(envelope, "c1"));
        return OriginalCiphertext{std::move(c1), std::move(c3)};
    }
    GTElement c2 = decodeGT(requireField(envelope, "c2"));
    return TransformedCiphertext{std::move(c2), std::move(c3)};
}

}  // namespace pre
