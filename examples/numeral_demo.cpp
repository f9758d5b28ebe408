#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "kazu_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -l <lang>      语言: ja (默认) / en\n"
        << "  -n <value>     显示数值的读法和分组写法\n"
        << "  -d <text>      解码读法或混合文本\n"
        << "  -c <value>     校验模式: 标准答案数值 (与 -a 一起使用)\n"
        << "  -a <answer>    校验模式: 用户回答\n"
        << "  -t <value>     模糊匹配阈值 [0, 1] (默认: 0.80)\n"
        << "  --strict       严格模式 (阈值 0.95, 关闭变体)\n"
        << "  --lenient      宽松模式 (阈值 0.70)\n"
        << "  -v             输出校验过程\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -n/-d/-a 参数时进入交互模式\n"
        << "  输入数字显示读法, 输入其他文本进行解码\n"
        << "  输入 'check <value> <answer>' 校验回答\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -n 12345                       # いちまん、にせんさんびゃくよんじゅうご\n"
        << "  " << program << " -l en -n 1234567               # one million two hundred ...\n"
        << "  " << program << " -d \"3億5000万\"                # 350000000\n"
        << "  " << program << " -l en -c 2560 -a \"2,560\"       # numeric match\n"
        << std::endl;
}

// 解析 "ja" / "en", 失败返回 false
bool parseLanguage(const std::string& name, Kazu::Language* language) {
    if (name == "ja" || name == "jp") {
        *language = Kazu::Language::JA;
        return true;
    }
    if (name == "en") {
        *language = Kazu::Language::EN;
        return true;
    }
    return false;
}

// 解析命令行中的数值, 失败返回 std::nullopt
std::optional<int64_t> parseValue(const std::string& text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool showEncoding(const Kazu::NumeralEngine& engine, int64_t value, Kazu::Language language) {
    try {
        std::cout << "读法: " << engine.EncodeSpoken(value, language) << std::endl;
        std::cout << "分组: " << engine.EncodeGrouped(value, language) << std::endl;
        return true;
    } catch (const std::out_of_range& e) {
        std::cerr << "数值超出范围 (0 - " << engine.GetMaxValue(language) << "): "
                  << e.what() << std::endl;
        return false;
    }
}

bool showDecoding(const Kazu::NumeralEngine& engine, const std::string& text, Kazu::Language language) {
    auto value = engine.Decode(text, language);
    if (!value) {
        std::cout << "无法识别: \"" << text << "\"" << std::endl;
        return false;
    }
    std::cout << "数值: " << *value << std::endl;
    return true;
}

bool checkAnswer(const Kazu::NumeralEngine& engine, int64_t expected,
                 const std::string& answer, Kazu::Language language) {
    Kazu::ValidationResult result;
    try {
        result = engine.ValidateNumber(answer, language, expected);
    } catch (const std::out_of_range& e) {
        std::cerr << "标准答案超出范围: " << e.what() << std::endl;
        return false;
    }

    std::cout << "标准答案: " << result.correct_answer << std::endl;
    std::cout << "结果: " << (result.is_correct ? "正确" : "错误")
              << " (" << Kazu::matchMethodName(result.method)
              << ", 置信度 " << result.confidence << ")" << std::endl;
    if (result.user_number) {
        std::cout << "识别数值: " << *result.user_number << std::endl;
    }

    if (!result.is_correct) {
        auto mistake = engine.ExplainMistake(result);
        std::cout << "分析: " << Kazu::mistakeKindName(mistake.kind);
        switch (mistake.kind) {
            case Kazu::MistakeKind::VERY_CLOSE:
                std::cout << " (相差 " << mistake.difference << ")";
                break;
            case Kazu::MistakeKind::FEWER_DIGITS:
            case Kazu::MistakeKind::MORE_DIGITS:
                std::cout << " (" << mistake.user_digits << " 位, 应为 "
                          << mistake.correct_digits << " 位)";
                break;
            case Kazu::MistakeKind::WRONG_PLACE:
                std::cout << " (第 " << mistake.place + 1 << " 位)";
                break;
            default:
                break;
        }
        std::cout << std::endl;
    }
    return result.is_correct;
}

void runInteractive(const Kazu::NumeralEngine& engine, Kazu::Language language) {
    std::cout << "进入交互模式 (" << Kazu::languageName(language) << "), 输入 q 退出" << std::endl;
    std::cout << "----------------------------------------" << std::endl;

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }

        if (line.empty()) {
            continue;
        }

        if (line == "q" || line == "quit" || line == "exit") {
            std::cout << "再见!" << std::endl;
            break;
        }

        // check <value> <answer>
        if (line.compare(0, 6, "check ") == 0) {
            std::string rest = line.substr(6);
            size_t space = rest.find(' ');
            auto expected = parseValue(rest.substr(0, space));
            if (!expected || space == std::string::npos) {
                std::cerr << "用法: check <value> <answer>" << std::endl;
                continue;
            }
            checkAnswer(engine, *expected, rest.substr(space + 1), language);
        } else if (auto value = parseValue(line)) {
            showEncoding(engine, *value, language);
        } else {
            showDecoding(engine, line, language);
        }
        std::cout << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string language_name = "ja";
    std::string encode_arg;
    std::string decode_text;
    std::string expected_arg;
    std::string answer;
    bool has_answer = false;
    Kazu::EngineConfig config;
    std::optional<float> threshold;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            language_name = argv[++i];
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            encode_arg = argv[++i];
        } else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            decode_text = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            expected_arg = argv[++i];
        } else if (strcmp(argv[i], "-a") == 0 && i + 1 < argc) {
            answer = argv[++i];
            has_answer = true;
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            threshold = std::strtof(argv[++i], nullptr);
        } else if (strcmp(argv[i], "--strict") == 0) {
            config = Kazu::EngineConfig::Strict().withVerbose(config.verbose);
        } else if (strcmp(argv[i], "--lenient") == 0) {
            config = Kazu::EngineConfig::Lenient().withVerbose(config.verbose);
        } else if (strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        }
    }

    Kazu::Language language;
    if (!parseLanguage(language_name, &language)) {
        std::cerr << "错误: 未知语言 '" << language_name << "'\n"
            << "可用语言: ja, en" << std::endl;
        return 1;
    }

    if (threshold) {
        config = config.withThreshold(*threshold);
    }

    Kazu::NumeralEngine engine(config);
    if (!engine.IsConfigValid()) {
        std::cerr << "警告: 配置无效, 已使用默认配置" << std::endl;
    }

    bool ok = true;
    bool ran = false;

    if (!encode_arg.empty()) {
        ran = true;
        auto value = parseValue(encode_arg);
        if (!value) {
            std::cerr << "错误: 无效数值 '" << encode_arg << "'" << std::endl;
            return 1;
        }
        ok = showEncoding(engine, *value, language) && ok;
    }

    if (!decode_text.empty()) {
        ran = true;
        ok = showDecoding(engine, decode_text, language) && ok;
    }

    if (has_answer) {
        ran = true;
        auto expected = parseValue(expected_arg);
        if (!expected) {
            std::cerr << "错误: 校验模式需要 -c <value>" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        ok = checkAnswer(engine, *expected, answer, language) && ok;
    }

    if (!ran) {
        runInteractive(engine, language);
    }

    return ok ? 0 : 1;
}
