#include <cstring>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "voice_api.hpp"

// 进度/错误输出
class ConsoleCallback : public Parley::VoiceAgentCallback {
public:
    void OnProgress(const std::string& file, float percent) override {
        int p = static_cast<int>(percent);
        if (p != last_percent_ || file != last_file_) {
            last_percent_ = p;
            last_file_ = file;
            std::cout << "\r加载 " << file << ": " << p << "%" << std::flush;
            if (p >= 100) std::cout << std::endl;
        }
    }

    void OnAudioChunk(const std::vector<float>& samples, int sample_rate) override {
        std::cout << "音频块: " << samples.size() << " 样本 @ " << sample_rate << " Hz" << std::endl;
    }

    void OnComplete(const std::string& payload) override {
        std::cout << "完成: " << payload << std::endl;
    }

    void OnError(const std::string& kind, const std::string& message) override {
        std::cerr << "错误 [" << kind << "]: " << message << std::endl;
    }

private:
    int last_percent_ = -1;
    std::string last_file_;
};

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -p <text>      直接合成指定文本\n"
        << "  -v <voice>     音色 (默认: M3)\n"
        << "  -o <file>      输出文件 (默认: output.wav)\n"
        << "  -s <rate>      时长倍率 (默认: 1.0, >1.0 更慢)\n"
        << "  -n <steps>     去噪步数 (默认: 10)\n"
        << "  -m <dir>       模型目录 (默认: ~/.cache/supertonic)\n"
        << "  --offline      不下载缺失的模型文件\n"
        << "  --list-voices  列出模型目录中的音色\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -p 参数时进入交互模式，输入文本后按 Enter 合成\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " -p \"Hello there.\"\n"
        << "  " << program << " -p \"Hello there.\" -v F1 -s 1.2 -o hello.wav\n"
        << std::endl;
}

std::string numberedOutput(const std::string& output_file, int count) {
    if (count == 0) return output_file;
    size_t dot = output_file.rfind('.');
    if (dot != std::string::npos) {
        return output_file.substr(0, dot) + "_" + std::to_string(count) + output_file.substr(dot);
    }
    return output_file + "_" + std::to_string(count);
}

bool speak(Parley::VoiceAgent& agent, const std::string& text, const std::string& output_file) {
    std::cout << "合成中: \"" << text << "\"" << std::endl;
    if (!agent.SynthesizeToFile(text, output_file)) {
        std::cerr << "合成失败: " << agent.GetLastError() << std::endl;
        return false;
    }
    std::cout << "已保存: " << output_file << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    Parley::VoiceAgentConfig config = Parley::VoiceAgentConfig::Default();
    std::string text;
    std::string output_file = "output.wav";
    bool interactive = true;
    bool list_voices = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--list-voices") == 0) {
            list_voices = true;
        } else if (strcmp(argv[i], "--offline") == 0) {
            config.auto_download = false;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            text = argv[++i];
            interactive = false;
        } else if (strcmp(argv[i], "-v") == 0 && i + 1 < argc) {
            config = config.withVoice(argv[++i]);
        } else if (strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            config = config.withSpeed(std::stof(argv[++i]));
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            config = config.withSteps(std::stoi(argv[++i]));
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            config.model_dir = argv[++i];
        }
    }

    Parley::VoiceAgent agent(config);
    agent.SetCallback(std::make_shared<ConsoleCallback>());

    if (!agent.IsReady()) {
        std::cerr << "初始化失败: " << agent.GetLastError() << std::endl;
        return 1;
    }

    if (list_voices) {
        for (const auto& v : agent.ListVoices()) {
            std::cout << "  " << v << std::endl;
        }
        return 0;
    }

    std::cout << "音色: " << config.voice << ", 步数: " << config.total_steps
              << ", 时长倍率: " << config.speech_rate << std::endl;

    if (!interactive) {
        return speak(agent, text, output_file) ? 0 : 1;
    }

    // 交互模式
    std::cout << "进入交互模式，输入文本后按 Enter 合成 (输入 q 退出)" << std::endl;
    std::cout << "----------------------------------------" << std::endl;

    std::string line;
    int count = 0;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        if (line == "q" || line == "quit" || line == "exit") {
            std::cout << "再见!" << std::endl;
            break;
        }
        speak(agent, line, numberedOutput(output_file, count));
        std::cout << std::endl;
        count++;
    }

    return 0;
}
