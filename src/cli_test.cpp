// pre_cli 端到端测试：通过 popen 调用命令行，中间结果写入文件后以 @path 传递
// 用法: cli_test <pre_cli 路径>

#include <sys/wait.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string g_cli;

struct CmdResult {
    int status;
    std::string out;
};

// 执行命令并获取输出与退出码
CmdResult run_cmd(const std::string& args, bool merge_stderr = false) {
    std::string cmd = "\"" + g_cli + "\" " + args + (merge_stderr ? " 2>&1" : " 2>/dev/null");
    FILE* stream = popen(cmd.c_str(), "r");
    if (!stream) throw std::runtime_error("popen failed");
    std::string data;
    char buffer[256];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        data.append(buffer, n);
    }
    int raw = pclose(stream);
    int status = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
    return {status, data};
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << content;
}

// keygen 输出两行：公钥、私钥
bool keygen(const std::string& name) {
    CmdResult r = run_cmd("--keygen -P @params.json");
    std::istringstream iss(r.out);
    std::string pk, sk;
    if (r.status != 0 || !std::getline(iss, pk) || !std::getline(iss, sk) || pk.empty() || sk.empty()) {
        std::cerr << "keygen output parse fail\n";
        return false;
    }
    write_file(name + ".pk", pk);
    write_file(name + ".sk", sk);
    return true;
}

bool expect_status(const CmdResult& r, int status, const char* label) {
    if (r.status != status) {
        std::cerr << label << ": exit " << r.status << ", expected " << status << "\n" << r.out << "\n";
        return false;
    }
    return true;
}

}  // namespace

// 加密 -> 持有者解密 -> 授权 -> 重加密 -> 被授权者解密
bool test_delegation_flow() {
    CmdResult setup = run_cmd("--setup");
    if (!expect_status(setup, 0, "setup") || setup.out.find("\"g\"") == std::string::npos) return false;
    write_file("params.json", setup.out);
    if (!keygen("alice") || !keygen("bob")) return false;

    CmdResult enc = run_cmd("--encrypt -P @params.json -p @alice.pk -m HelloProxy");
    if (!expect_status(enc, 0, "encrypt")) return false;
    write_file("ct2.json", enc.out);

    CmdResult own = run_cmd("--decrypt --owned -P @params.json -p @alice.pk -s @alice.sk -c @ct2.json");
    if (!expect_status(own, 0, "owned decrypt") || own.out != "HelloProxy") return false;

    CmdResult rk = run_cmd("--rekeygen -s @alice.sk -p @bob.pk");
    if (!expect_status(rk, 0, "rekeygen")) return false;
    write_file("alice_bob.rk", rk.out);

    CmdResult reenc = run_cmd("--re-encrypt -P @params.json -r @alice_bob.rk -c @ct2.json");
    if (!expect_status(reenc, 0, "re-encrypt") || reenc.out.find("\"c2\"") == std::string::npos) return false;
    write_file("ct1.json", reenc.out);

    CmdResult dec = run_cmd("--decrypt -P @params.json -p @bob.pk -s @bob.sk -c @ct1.json");
    return expect_status(dec, 0, "delegate decrypt") && dec.out == "HelloProxy";
}

// 层级错误退出码为 5
bool test_wrong_level() {
    CmdResult dec = run_cmd("--decrypt -P @params.json -p @alice.pk -s @alice.sk -c @ct2.json");
    CmdResult again = run_cmd("--re-encrypt -P @params.json -r @alice_bob.rk -c @ct1.json");
    return expect_status(dec, 5, "decrypt level-2") && expect_status(again, 5, "re-encrypt level-1");
}

// 缺少必需参数(6)与用法错误(2)退出码不同
bool test_missing_argument() {
    CmdResult r = run_cmd("--keygen", true);
    CmdResult unknown = run_cmd("--keygen --bogus x");
    return expect_status(r, 6, "keygen without params") &&
           r.out.find("--params is required") != std::string::npos &&
           expect_status(unknown, 2, "unknown option");
}

// 以 @ 开头的消息原样加密，不当作文件路径
bool test_literal_message() {
    const std::string message = "@alice see the file";
    CmdResult enc = run_cmd("--encrypt -P @params.json -p @alice.pk -m '" + message + "'");
    if (!expect_status(enc, 0, "encrypt literal @ message")) return false;
    write_file("ct_at.json", enc.out);
    CmdResult dec = run_cmd("--decrypt --owned -P @params.json -p @alice.pk -s @alice.sk -c @ct_at.json");
    return expect_status(dec, 0, "decrypt literal @ message") && dec.out == message;
}

bool test_malformed_input() {
    write_file("broken.json", "{\"g\": \"AAAA\"}");
    CmdResult r = run_cmd("--keygen -P @broken.json");
    CmdResult junk = run_cmd("--keygen -P not-json");
    return expect_status(r, 3, "broken params") && expect_status(junk, 3, "junk params");
}

bool test_payload_too_large() {
    std::string big(256, 'A');
    CmdResult r = run_cmd("--encrypt -P @params.json -p @alice.pk -m " + big);
    return expect_status(r, 4, "oversized message");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: cli_test <path to pre_cli>\n";
        return 1;
    }
    g_cli = argv[1];

    try {
        bool flow = test_delegation_flow();
        bool level = flow && test_wrong_level();
        bool missing = test_missing_argument();
        bool malformed = test_malformed_input();
        bool payload = flow && test_payload_too_large();
        bool literal = flow && test_literal_message();

        std::cout << "Delegation flow test: " << (flow ? "PASS" : "FAIL") << "\n";
        std::cout << "Wrong level test: " << (level ? "PASS" : "FAIL") << "\n";
        std::cout << "Missing argument test: " << (missing ? "PASS" : "FAIL") << "\n";
        std::cout << "Malformed input test: " << (malformed ? "PASS" : "FAIL") << "\n";
        std::cout << "Payload limit test: " << (payload ? "PASS" : "FAIL") << "\n";
        std::cout << "Literal message test: " << (literal ? "PASS" : "FAIL") << "\n";

        if (flow && level && missing && malformed && payload && literal)
            return 0;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "测试失败，异常: " << e.what() << std::endl;
        return 1;
    }
}
