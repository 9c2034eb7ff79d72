#ifndef INFERENCE_SESSION_HPP
#define INFERENCE_SESSION_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/runtime/tensor.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Inference Session Interface (推理会话抽象接口)
// =============================================================================
//
// A loaded model graph. Inputs and outputs are addressed by the graph's
// tensor names. Implementations:
// - OnnxSession: ONNX Runtime CPU session
// - test fakes: scripted outputs for pipeline tests
//

class IInferenceSession {
public:
    virtual ~IInferenceSession() = default;

    /// @brief Run the graph once
    /// @param inputs Named input tensors
    /// @param output_names Outputs to fetch, in order
    /// @param outputs [out] Named output tensors
    /// @return 错误信息
    virtual ErrorInfo run(const TensorMap& inputs,
                          const std::vector<std::string>& output_names,
                          TensorMap& outputs) = 0;

    /// @brief Release the underlying session and its buffers
    virtual void release() = 0;

    /// @brief Whether the session can still run
    virtual bool isLoaded() const = 0;

    /// @brief Model name (用于日志)
    virtual std::string getName() const = 0;
};

/// @brief Opens a model file as a session. Injected so that every session is
///        created inside a capability setup that the arbiter controls.
using SessionFactory = std::function<ErrorInfo(const std::string& model_path,
                                               std::unique_ptr<IInferenceSession>& out)>;

}  // namespace voice

#endif  // INFERENCE_SESSION_HPP
