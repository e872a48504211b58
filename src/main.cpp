// pre_cli: 代理重加密命令行，每个方案操作对应一个动作参数。
// 只做输入输出：解码参数 -> 调用方案 -> 编码结果 -> 打印。
// 除 --message 外，值写成 @path 时从文件读取（JSON 信封不方便直接放在 shell 参数里）。
// --message 原样传入，消息可以以 @ 开头。

#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "pre/codec.h"
#include "pre/config.h"
#include "pre/errors.h"
#include "pre/pairing_group.h"
#include "pre/residue_group.h"
#include "pre/scheme.h"

namespace {

// 退出码
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitMalformed = 3;
constexpr int kExitPayloadTooLarge = 4;
constexpr int kExitWrongLevel = 5;
constexpr int kExitMissingArgument = 6;

const char* kUsage =
    "usage: pre_cli (--setup | --keygen | --encrypt | --decrypt | --rekeygen | --re-encrypt)\n"
    "               [-P PARAMS] [-s SK] [-p PK] [-m MESSAGE | -c CIPHERTEXT] [-r REKEY] [--owned]\n"
    "\n"
    "  --setup        perform setup to get parameters\n"
    "  --keygen       perform keygen [--params]\n"
    "  --encrypt      perform encryption [--params --pk --message]\n"
    "  --decrypt      perform decryption [--params --pk --sk --ciphertext (--owned)]\n"
    "  --rekeygen     perform rekeygen from sk owner to pk owner [--pk --sk]\n"
    "  --re-encrypt   perform re-encryption [--params --rekey --ciphertext]\n"
    "  -P, --params   input parameters\n"
    "  -s, --sk       input secret key\n"
    "  -p, --pk       input public key\n"
    "  -m, --message  input message\n"
    "  -c, --ciphertext  input ciphertext\n"
    "  -r, --rekey    input re-encryption key\n"
    "  --owned        decrypt a ciphertext encrypted under your own public key\n"
    "  values other than --message written as @path are read from that file\n";

class UsageError : public pre::Error {
  public:
    explicit UsageError(const std::string& what) : pre::Error(what) {}
};

struct Options {
    std::string action;
    std::map<std::string, std::string> values;  // 以长选项名为键
    bool owned = false;
    bool help = false;
};

// @path -> 文件内容，去掉末尾换行
std::string resolveValue(const std::string& raw) {
    if (raw.size() < 2 || raw[0] != '@') {
        return raw;
    }
    const std::string path = raw.substr(1);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw UsageError("cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();
    while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) {
        content.pop_back();
    }
    return content;
}

Options parseArguments(int argc, char* argv[]) {
    static const std::map<std::string, std::string> kActions = {
        {"--setup", "setup"},       {"--keygen", "keygen"},     {"--encrypt", "encrypt"},
        {"--decrypt", "decrypt"},   {"--rekeygen", "rekeygen"}, {"--re-encrypt", "re-encrypt"},
    };
    static const std::map<std::string, std::string> kValueOptions = {
        {"-P", "params"},     {"--params", "params"},         {"-s", "sk"},
        {"--sk", "sk"},       {"-p", "pk"},                   {"--pk", "pk"},
        {"-m", "message"},    {"--message", "message"},       {"-c", "ciphertext"},
        {"--ciphertext", "ciphertext"}, {"-r", "rekey"},      {"--rekey", "rekey"},
    };

    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        if (arg == "--owned") {
            opts.owned = true;
            continue;
        }
        auto action = kActions.find(arg);
        if (action != kActions.end()) {
            if (!opts.action.empty() && opts.action != action->second) {
                throw UsageError("argument " + arg + ": not allowed with --" + opts.action);
            }
            opts.action = action->second;
            continue;
        }
        auto option = kValueOptions.find(arg);
        if (option == kValueOptions.end()) {
            throw UsageError("unrecognized argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw UsageError("argument " + arg + ": expected one argument");
        }
        const std::string raw = argv[++i];
        opts.values[option->second] = option->second == "message" ? raw : resolveValue(raw);
    }
    if (opts.values.count("message") && opts.values.count("ciphertext")) {
        throw UsageError("argument --ciphertext: not allowed with --message");
    }
    return opts;
}

// 缺少任一必需参数时抛出 MissingArgument，消息列出该动作的全部必需参数
void requireValues(const Options& opts, const std::vector<std::string>& names) {
    std::string listed;
    bool missing = false;
    for (const auto& name : names) {
        listed += (listed.empty() ? "--" : " --") + name;
        missing = missing || opts.values.count(name) == 0;
    }
    if (missing) {
        throw pre::MissingArgument(listed + (names.size() > 1 ? " are required" : " is required"));
    }
}

int run(const Options& opts) {
    pre::PairingGroup group(pre::kSS512Params);
    pre::ResidueGroup residue;
    pre::ProxyReEncryption scheme(group, residue);
    pre::Codec codec(group, residue);

    if (opts.action == "setup") {
        std::cout << codec.encodeParams(scheme.setup());
    } else if (opts.action == "keygen") {
        requireValues(opts, {"params"});
        pre::SystemParams params = codec.decodeParams(opts.values.at("params"));
        pre::KeyPair kp = scheme.keygen(params);
        std::cout << codec.encodeElement(kp.pk) << "\n" << codec.encodeElement(kp.sk);
    } else if (opts.action == "encrypt") {
        requireValues(opts, {"params", "pk", "message"});
        pre::SystemParams params = codec.decodeParams(opts.values.at("params"));
        pre::G1Element pk = codec.decodeG1(opts.values.at("pk"));
        const std::string& message = opts.values.at("message");
        pre::OriginalCiphertext ct =
            scheme.encrypt(params, pk, std::vector<uint8_t>(message.begin(), message.end()));
        std::cout << codec.encodeCiphertext(ct);
    } else if (opts.action == "decrypt") {
        requireValues(opts, {"params", "pk", "sk", "ciphertext"});
        pre::SystemParams params = codec.decodeParams(opts.values.at("params"));
        pre::G1Element pk = codec.decodeG1(opts.values.at("pk"));
        pre::ZrElement sk = codec.decodeZr(opts.values.at("sk"));
        pre::Ciphertext ct = codec.decodeCiphertext(opts.values.at("ciphertext"));
        std::vector<uint8_t> message = opts.owned ? scheme.decryptOwned(params, sk, pk, ct)
                                                  : scheme.decrypt(params, sk, ct);
        std::cout.write(reinterpret_cast<const char*>(message.data()),
                        static_cast<std::streamsize>(message.size()));
    } else if (opts.action == "rekeygen") {
        requireValues(opts, {"pk", "sk"});
        pre::G1Element pk_to = codec.decodeG1(opts.values.at("pk"));
        pre::ZrElement sk_from = codec.decodeZr(opts.values.at("sk"));
        std::cout << codec.encodeReKey(scheme.rekeygen(sk_from, pk_to));
    } else if (opts.action == "re-encrypt") {
        requireValues(opts, {"params", "rekey", "ciphertext"});
        pre::SystemParams params = codec.decodeParams(opts.values.at("params"));
        pre::ReKey rk = codec.decodeReKey(opts.values.at("rekey"));
        pre::Ciphertext ct = codec.decodeCiphertext(opts.values.at("ciphertext"));
        std::cout << codec.encodeCiphertext(scheme.reencrypt(params, rk, ct));
    } else {
        throw UsageError("one of --setup --keygen --encrypt --decrypt --rekeygen --re-encrypt is required");
    }
    std::cout.flush();
    return kExitOk;
}

int fail(int code, const std::string& message) {
    std::cerr << "pre_cli: error: " << message << "\n";
    return code;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArguments(argc, argv);
        if (opts.help) {
            std::cout << kUsage;
            return kExitOk;
        }
        return run(opts);
    } catch (const UsageError& e) {
        std::cerr << kUsage;
        return fail(kExitUsage, e.what());
    } catch (const pre::MissingArgument& e) {
        std::cerr << kUsage;
        return fail(kExitMissingArgument, e.what());
    } catch (const pre::MalformedInput& e) {
        return fail(kExitMalformed, std::string("malformed input: ") + e.what());
    } catch (const pre::PayloadTooLarge& e) {
        return fail(kExitPayloadTooLarge, e.what());
    } catch (const pre::WrongLevel& e) {
        return fail(kExitWrongLevel, e.what());
    } catch (const std::exception& e) {
        return fail(kExitFailure, e.what());
    }
}
