#include <pybind11/functional.h>
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "voice_api.hpp"

namespace py = pybind11;

namespace {

std::vector<float> toVector(const py::array_t<float, py::array::c_style | py::array::forcecast>& audio) {
    auto buf = audio.request();
    const float* data = static_cast<const float*>(buf.ptr);
    return std::vector<float>(data, data + buf.size);
}

}  // namespace

// =============================================================================
// PyVoiceCallback - Python 回调包装类
// =============================================================================

/**
 * @brief Python 回调适配器
 *
 * 继承 VoiceAgentCallback, 将 C++ 事件桥接到 Python 函数。
 * 事件可能来自内部工作线程, 调用 Python 前必须获取 GIL。
 */
class PyVoiceCallback : public Parley::VoiceAgentCallback {
public:
    using ProgressFn = std::function<void(const std::string&, float)>;
    using TextFn = std::function<void(const std::string&)>;
    using AudioFn = std::function<void(py::array_t<float>, int)>;
    using ErrorFn = std::function<void(const std::string&, const std::string&)>;
    using StatusFn = std::function<void(Parley::AgentState)>;

    PyVoiceCallback() = default;
    ~PyVoiceCallback() override = default;

    void setOnProgress(ProgressFn cb) { on_progress_ = std::move(cb); }
    void setOnPartial(TextFn cb) { on_partial_ = std::move(cb); }
    void setOnAudio(AudioFn cb) { on_audio_ = std::move(cb); }
    void setOnComplete(TextFn cb) { on_complete_ = std::move(cb); }
    void setOnError(ErrorFn cb) { on_error_ = std::move(cb); }
    void setOnStatus(StatusFn cb) { on_status_ = std::move(cb); }

    void OnProgress(const std::string& file, float percent) override {
        if (on_progress_) {
            py::gil_scoped_acquire acquire;
            on_progress_(file, percent);
        }
    }

    void OnPartial(const std::string& text) override {
        if (on_partial_) {
            py::gil_scoped_acquire acquire;
            on_partial_(text);
        }
    }

    void OnAudioChunk(const std::vector<float>& samples, int sample_rate) override {
        if (on_audio_) {
            py::gil_scoped_acquire acquire;
            py::array_t<float> arr(static_cast<py::ssize_t>(samples.size()), samples.data());
            on_audio_(arr, sample_rate);
        }
    }

    void OnComplete(const std::string& payload) override {
        if (on_complete_) {
            py::gil_scoped_acquire acquire;
            on_complete_(payload);
        }
    }

    void OnError(const std::string& kind, const std::string& message) override {
        if (on_error_) {
            py::gil_scoped_acquire acquire;
            on_error_(kind, message);
        }
    }

    void OnStatus(Parley::AgentState state) override {
        if (on_status_) {
            py::gil_scoped_acquire acquire;
            on_status_(state);
        }
    }

private:
    ProgressFn on_progress_;
    TextFn on_partial_;
    AudioFn on_audio_;
    TextFn on_complete_;
    ErrorFn on_error_;
    StatusFn on_status_;
};

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_parley, m) {
    m.doc() = "Parley - on-device voice assistant engine Python bindings";

    py::enum_<Parley::AgentState>(m, "AgentState", "Conversation turn state")
        .value("IDLE", Parley::AgentState::IDLE)
        .value("TRANSCRIBING", Parley::AgentState::TRANSCRIBING)
        .value("GENERATING", Parley::AgentState::GENERATING)
        .value("SYNTHESIZING", Parley::AgentState::SYNTHESIZING)
        .value("ERROR", Parley::AgentState::ERROR)
        .export_values();

    py::class_<Parley::Message>(m, "Message", "Chat message")
        .def(py::init<>())
        .def(py::init([](const std::string& role, const std::string& content) {
            return Parley::Message{role, content};
        }), py::arg("role"), py::arg("content"))
        .def_readwrite("role", &Parley::Message::role)
        .def_readwrite("content", &Parley::Message::content)
        .def("__repr__", [](const Parley::Message& msg) {
            return "<Message " + msg.role + ": '" + msg.content + "'>";
        });

    // =========================================================================
    // VoiceAgentConfig
    // =========================================================================

    py::class_<Parley::VoiceAgentConfig>(m, "VoiceAgentConfig", "Voice agent configuration")
        .def(py::init<>(), "Create default configuration")
        .def_readwrite("model_dir", &Parley::VoiceAgentConfig::model_dir, "Synthesis model directory")
        .def_readwrite("auto_download", &Parley::VoiceAgentConfig::auto_download,
            "Download missing synthesis assets")
        .def_readwrite("mirror_url", &Parley::VoiceAgentConfig::mirror_url, "Download mirror root")
        .def_readwrite("voice", &Parley::VoiceAgentConfig::voice, "Voice style name")
        .def_readwrite("language", &Parley::VoiceAgentConfig::language, "Synthesis language tag")
        .def_readwrite("speech_rate", &Parley::VoiceAgentConfig::speech_rate,
            "Duration factor (>1.0 slower, <1.0 faster)")
        .def_readwrite("total_steps", &Parley::VoiceAgentConfig::total_steps, "Denoising steps")
        .def_readwrite("seed", &Parley::VoiceAgentConfig::seed, "Noise seed (0 = random)")
        .def_readwrite("transcription_language", &Parley::VoiceAgentConfig::transcription_language)
        .def_readwrite("system_prompt", &Parley::VoiceAgentConfig::system_prompt)
        .def_readwrite("max_new_tokens", &Parley::VoiceAgentConfig::max_new_tokens)
        .def_readwrite("num_threads", &Parley::VoiceAgentConfig::num_threads, "Inference threads")
        .def_readwrite("low_memory", &Parley::VoiceAgentConfig::low_memory, "Disable memory arenas")
        .def_static("Default", &Parley::VoiceAgentConfig::Default)
        .def_static("Offline", &Parley::VoiceAgentConfig::Offline, py::arg("model_dir"),
            "Configuration that never downloads")
        .def("withVoice", &Parley::VoiceAgentConfig::withVoice, py::arg("voice"))
        .def("withSpeed", &Parley::VoiceAgentConfig::withSpeed, py::arg("rate"))
        .def("withSteps", &Parley::VoiceAgentConfig::withSteps, py::arg("steps"))
        .def("__repr__", [](const Parley::VoiceAgentConfig& config) {
            return "<VoiceAgentConfig model_dir='" + config.model_dir + "' voice='" +
                config.voice + "' steps=" + std::to_string(config.total_steps) + ">";
        });

    // =========================================================================
    // VoiceCallback
    // =========================================================================

    py::class_<Parley::VoiceAgentCallback, std::shared_ptr<Parley::VoiceAgentCallback>>(
        m, "_VoiceAgentCallbackBase");

    py::class_<PyVoiceCallback, Parley::VoiceAgentCallback, std::shared_ptr<PyVoiceCallback>>(
        m, "VoiceCallback", "Event callback (set handlers with on_* methods)")
        .def(py::init<>())
        .def("on_progress", &PyVoiceCallback::setOnProgress, py::arg("callback"),
            "callback(file: str, percent: float)")
        .def("on_partial", &PyVoiceCallback::setOnPartial, py::arg("callback"),
            "callback(text: str)")
        .def("on_audio", &PyVoiceCallback::setOnAudio, py::arg("callback"),
            "callback(samples: numpy.ndarray[float32], sample_rate: int)")
        .def("on_complete", &PyVoiceCallback::setOnComplete, py::arg("callback"),
            "callback(payload: str)")
        .def("on_error", &PyVoiceCallback::setOnError, py::arg("callback"),
            "callback(kind: str, message: str)")
        .def("on_status", &PyVoiceCallback::setOnStatus, py::arg("callback"),
            "callback(state: AgentState)");

    // =========================================================================
    // VoiceAgent
    // =========================================================================

    py::class_<Parley::VoiceAgent>(m, "VoiceAgent", "Voice agent (synthesis-only from Python)")
        .def(py::init([](const Parley::VoiceAgentConfig& config) {
            py::gil_scoped_release release;
            return std::make_unique<Parley::VoiceAgent>(config);
        }), py::arg("config") = Parley::VoiceAgentConfig())

        .def("set_callback", [](Parley::VoiceAgent& self, std::shared_ptr<PyVoiceCallback> cb) {
            self.SetCallback(std::move(cb));
        }, py::arg("callback"))

        .def("is_ready", &Parley::VoiceAgent::IsReady)

        // 阻塞调用 - 释放 GIL
        .def("synthesize", [](Parley::VoiceAgent& self, const std::string& text,
                              const std::string& voice) {
            py::gil_scoped_release release;
            return self.Synthesize(text, voice);
        }, py::arg("text"), py::arg("voice") = "",
            "Synthesize text; audio arrives through on_audio (releases GIL)")

        .def("synthesize_to_file", [](Parley::VoiceAgent& self, const std::string& text,
                                      const std::string& file_path, const std::string& voice) {
            py::gil_scoped_release release;
            return self.SynthesizeToFile(text, file_path, voice);
        }, py::arg("text"), py::arg("file_path"), py::arg("voice") = "",
            "Synthesize text and save as WAV (releases GIL)")

        .def("transcribe", [](Parley::VoiceAgent& self,
                              py::array_t<float, py::array::c_style | py::array::forcecast> audio,
                              int sample_rate, const std::string& language) {
            std::vector<float> samples = toVector(audio);
            std::string text;
            bool ok;
            {
                py::gil_scoped_release release;
                ok = self.Transcribe(samples, sample_rate, language, &text);
            }
            return ok ? py::object(py::str(text)) : py::object(py::none());
        }, py::arg("audio"), py::arg("sample_rate"), py::arg("language") = "",
            "Transcribe audio; returns None on failure")

        .def("generate", [](Parley::VoiceAgent& self, const std::vector<Parley::Message>& conversation) {
            std::string reply;
            bool ok;
            {
                py::gil_scoped_release release;
                ok = self.Generate(conversation, &reply);
            }
            return ok ? py::object(py::str(reply)) : py::object(py::none());
        }, py::arg("conversation"), "Generate a reply; returns None on failure")

        .def("process_audio", [](Parley::VoiceAgent& self,
                                 py::array_t<float, py::array::c_style | py::array::forcecast> audio,
                                 int sample_rate) {
            std::vector<float> samples = toVector(audio);
            py::gil_scoped_release release;
            return self.ProcessAudio(samples, sample_rate);
        }, py::arg("audio"), py::arg("sample_rate"),
            "Start a full turn in the background; False if busy")

        .def("preload", &Parley::VoiceAgent::Preload, py::call_guard<py::gil_scoped_release>())
        .def("wait_idle", &Parley::VoiceAgent::WaitIdle, py::call_guard<py::gil_scoped_release>())
        .def("interrupt", &Parley::VoiceAgent::Interrupt)
        .def("reset", &Parley::VoiceAgent::Reset, py::call_guard<py::gil_scoped_release>())

        .def("get_state", &Parley::VoiceAgent::GetState)
        .def("get_history", &Parley::VoiceAgent::GetHistory)
        .def("list_voices", &Parley::VoiceAgent::ListVoices)
        .def("get_last_error", &Parley::VoiceAgent::GetLastError)
        .def("get_config", &Parley::VoiceAgent::GetConfig)

        .def("__repr__", [](const Parley::VoiceAgent& agent) {
            return std::string("<VoiceAgent state=") +
                Parley::AgentStateToString(agent.GetState()) + ">";
        });
}
