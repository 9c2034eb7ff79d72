#ifndef ONNX_SESSION_HPP
#define ONNX_SESSION_HPP

#include <onnxruntime_cxx_api.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/runtime/inference_session.hpp"
#include "internal/voice_config.hpp"

namespace voice {

// =============================================================================
// OnnxSession - ONNX Runtime backed IInferenceSession
// =============================================================================

class OnnxSession : public IInferenceSession {
public:
    OnnxSession(std::shared_ptr<Ort::Env> env,
                std::unique_ptr<Ort::Session> session,
                const std::string& name);
    ~OnnxSession() override;

    ErrorInfo run(const TensorMap& inputs,
                  const std::vector<std::string>& output_names,
                  TensorMap& outputs) override;

    void release() override;
    bool isLoaded() const override;
    std::string getName() const override;

private:
    std::shared_ptr<Ort::Env> env_;         // must outlive session_
    std::unique_ptr<Ort::Session> session_;
    std::string name_;

    mutable std::mutex inference_mutex_;
};

// =============================================================================
// OnnxRuntime - owns the Ort::Env and the session options
// =============================================================================
//
// Constructed once from a RuntimeConfig. createSession() is the only place
// that turns a model file into a runnable session.
//

class OnnxRuntime {
public:
    OnnxRuntime() = default;
    ~OnnxRuntime() = default;

    /// @brief Create the environment (idempotent)
    ErrorInfo initialize(const RuntimeConfig& config);

    bool isInitialized() const { return env_ != nullptr; }

    /// @brief Load a model file
    /// @param model_path Path to the .onnx file
    /// @param out [out] Loaded session
    ErrorInfo createSession(const std::string& model_path,
                            std::unique_ptr<IInferenceSession>& out);

    /// @brief Adapter for places that take a SessionFactory
    SessionFactory sessionFactory();

    const RuntimeConfig& getConfig() const { return config_; }

private:
    Ort::SessionOptions buildSessionOptions() const;

    RuntimeConfig config_;
    std::shared_ptr<Ort::Env> env_;
    std::mutex env_mutex_;
};

}  // namespace voice

#endif  // ONNX_SESSION_HPP
