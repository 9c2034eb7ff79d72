#include "internal/runtime/onnx_session.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>  // NOLINT(build/c++17)
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace voice {

// =============================================================================
// OnnxSession
// =============================================================================

OnnxSession::OnnxSession(std::shared_ptr<Ort::Env> env,
    std::unique_ptr<Ort::Session> session,
    const std::string& name)
    : env_(std::move(env))
    , session_(std::move(session))
    , name_(name) {
}

OnnxSession::~OnnxSession() {
    release();
}

ErrorInfo OnnxSession::run(const TensorMap& inputs,
    const std::vector<std::string>& output_names,
    TensorMap& outputs) {
    std::lock_guard<std::mutex> lock(inference_mutex_);

    if (!session_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED,
            "Session '" + name_ + "' has been released");
    }

    try {
        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<const char*> input_names;
        std::vector<Ort::Value> input_tensors;
        input_names.reserve(inputs.size());
        input_tensors.reserve(inputs.size());

        for (const auto& [name, tensor] : inputs) {
            input_names.push_back(name.c_str());
            if (tensor.type == TensorType::INT64) {
                input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
                    memory_info,
                    const_cast<int64_t*>(tensor.i64.data()),
                    tensor.i64.size(),
                    tensor.shape.data(),
                    tensor.shape.size()));
            } else {
                input_tensors.push_back(Ort::Value::CreateTensor<float>(
                    memory_info,
                    const_cast<float*>(tensor.f32.data()),
                    tensor.f32.size(),
                    tensor.shape.data(),
                    tensor.shape.size()));
            }
        }

        std::vector<const char*> out_names;
        out_names.reserve(output_names.size());
        for (const auto& n : output_names) {
            out_names.push_back(n.c_str());
        }

        auto output_tensors = session_->Run(
            Ort::RunOptions{nullptr},
            input_names.data(), input_tensors.data(), input_tensors.size(),
            out_names.data(), out_names.size());

        outputs.clear();
        for (size_t i = 0; i < output_tensors.size(); ++i) {
            auto info = output_tensors[i].GetTensorTypeAndShapeInfo();
            auto shape = info.GetShape();
            size_t count = info.GetElementCount();

            if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
                const int64_t* data = output_tensors[i].GetTensorData<int64_t>();
                outputs[output_names[i]] = Tensor::ofInt64(
                    std::vector<int64_t>(data, data + count), shape);
            } else if (info.GetElementType() == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
                const float* data = output_tensors[i].GetTensorData<float>();
                outputs[output_names[i]] = Tensor::ofFloat(
                    std::vector<float>(data, data + count), shape);
            } else {
                return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
                    "Unsupported output element type for '" + output_names[i] + "' in " + name_);
            }
        }
        return ErrorInfo::ok();
    } catch (const std::bad_alloc& e) {
        return ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            name_ + ": allocation failed during inference", e.what());
    } catch (const Ort::Exception& e) {
        ErrorCode code = isAllocationFailure(e.what())
            ? ErrorCode::OUT_OF_MEMORY : ErrorCode::INTERNAL_ERROR;
        return ErrorInfo::error(code, name_ + ": " + e.what());
    }
}

void OnnxSession::release() {
    std::lock_guard<std::mutex> lock(inference_mutex_);
    session_.reset();
}

bool OnnxSession::isLoaded() const {
    std::lock_guard<std::mutex> lock(inference_mutex_);
    return session_ != nullptr;
}

std::string OnnxSession::getName() const {
    return name_;
}

// =============================================================================
// OnnxRuntime
// =============================================================================

ErrorInfo OnnxRuntime::initialize(const RuntimeConfig& config) {
    std::lock_guard<std::mutex> lock(env_mutex_);
    if (env_) {
        return ErrorInfo::ok();
    }

    auto err = config.validate();
    if (!err.isOk()) {
        return err;
    }
    config_ = config;

    try {
        auto level = static_cast<OrtLoggingLevel>(config_.log_severity);

        // Env creation prints provider warnings straight to stderr; hide them
        // unless the caller asked for warnings or more.
        bool quiet = config_.log_severity >= 3;
        int stderr_fd = -1;
        int devnull_fd = -1;
        if (quiet) {
            stderr_fd = dup(STDERR_FILENO);
            devnull_fd = open("/dev/null", O_WRONLY);
            if (stderr_fd >= 0 && devnull_fd >= 0) {
                dup2(devnull_fd, STDERR_FILENO);
            }
        }

        env_ = std::make_shared<Ort::Env>(level, config_.log_id.c_str());

        if (stderr_fd >= 0) {
            dup2(stderr_fd, STDERR_FILENO);
            close(stderr_fd);
        }
        if (devnull_fd >= 0) {
            close(devnull_fd);
        }
    } catch (const Ort::Exception& e) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to create ONNX Runtime environment: ") + e.what());
    }

    std::cout << "[Runtime] ONNX Runtime ready (threads=" << config_.intra_op_threads
        << ", log_severity=" << config_.log_severity << ")" << std::endl;
    return ErrorInfo::ok();
}

Ort::SessionOptions OnnxRuntime::buildSessionOptions() const {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(config_.intra_op_threads > 0 ? config_.intra_op_threads : 2);
    options.SetInterOpNumThreads(config_.inter_op_threads > 0 ? config_.inter_op_threads : 1);
    options.SetLogSeverityLevel(config_.log_severity);

    switch (config_.graph_optimization) {
        case GraphOptimization::DISABLED:
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_DISABLE_ALL);
            break;
        case GraphOptimization::BASIC:
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);
            break;
        case GraphOptimization::EXTENDED:
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
            break;
        case GraphOptimization::ALL:
        default:
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            break;
    }

    options.SetExecutionMode(config_.sequential_execution
        ? ExecutionMode::ORT_SEQUENTIAL : ExecutionMode::ORT_PARALLEL);

    bool mem_pattern = config_.enable_mem_pattern;
    bool cpu_arena = config_.enable_cpu_mem_arena;
    #if defined(__riscv) || defined(__riscv__)
    mem_pattern = false;
    cpu_arena = false;
    #endif

    if (mem_pattern) {
        options.EnableMemPattern();
    } else {
        options.DisableMemPattern();
    }
    if (cpu_arena) {
        options.EnableCpuMemArena();
    } else {
        options.DisableCpuMemArena();
    }
    return options;
}

ErrorInfo OnnxRuntime::createSession(const std::string& model_path,
    std::unique_ptr<IInferenceSession>& out) {
    if (!env_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "ONNX Runtime not initialized");
    }
    if (!fs::exists(model_path)) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Model not found: " + model_path);
    }

    std::string name = fs::path(model_path).stem().string();
    try {
        auto options = buildSessionOptions();
        auto session = std::make_unique<Ort::Session>(*env_, model_path.c_str(), options);
        out = std::make_unique<OnnxSession>(env_, std::move(session), name);
        std::cout << "[Runtime] Loaded " << name << std::endl;
        return ErrorInfo::ok();
    } catch (const std::bad_alloc& e) {
        return ErrorInfo::error(ErrorCode::OUT_OF_MEMORY,
            "Failed to allocate session for " + name, e.what());
    } catch (const Ort::Exception& e) {
        ErrorCode code = isAllocationFailure(e.what())
            ? ErrorCode::OUT_OF_MEMORY : ErrorCode::MODEL_NOT_FOUND;
        return ErrorInfo::error(code,
            "Failed to load " + model_path + ": " + e.what());
    }
}

SessionFactory OnnxRuntime::sessionFactory() {
    return [this](const std::string& model_path, std::unique_ptr<IInferenceSession>& out) {
        return createSession(model_path, out);
    };
}

}  // namespace voice
