#include "internal/capabilities/generation_capability.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace voice {

ErrorInfo GenerationCapability::create(const AgentConfig& config,
                                       const GeneratorFactory& factory,
                                       const ProgressCallback& progress,
                                       std::unique_ptr<GenerationCapability>& out) {
    if (!factory) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED,
            "No text generator provider configured");
    }

    std::cout << "[Generation] Loading " << config.generation_model << std::endl;

    std::unique_ptr<ITextGenerator> generator;
    auto err = factory(config, progress, generator);
    if (!err.isOk()) {
        return err;
    }
    if (!generator) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Generator provider returned no engine for " + config.generation_model);
    }

    out = std::make_unique<GenerationCapability>(std::move(generator), config);
    return ErrorInfo::ok();
}

GenerationCapability::GenerationCapability(std::unique_ptr<ITextGenerator> generator,
                                           const AgentConfig& config)
    : generator_(std::move(generator)),
      system_prompt_(config.system_prompt) {
    params_.max_new_tokens = config.max_new_tokens;
    params_.do_sample = config.do_sample;
    params_.top_k = config.top_k;
    params_.temperature = config.temperature;
}

GenerationCapability::~GenerationCapability() {
    dispose();
}

bool GenerationCapability::isValid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generator_ != nullptr;
}

ErrorInfo GenerationCapability::dispose() {
    // Unblock a generation still running on another thread before taking the lock
    cancel_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    if (generator_) {
        generator_->release();
        generator_.reset();
    }
    return ErrorInfo::ok();
}

ErrorInfo GenerationCapability::generate(const Conversation& conversation,
                                         const TextCallback& on_token,
                                         std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!generator_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Generation capability was disposed");
    }
    if (conversation.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_TEXT, "Conversation is empty");
    }

    Conversation messages = normalizeConversation(conversation, system_prompt_);

    // An interrupt only applies to the generation in flight
    cancel_.store(false);
    std::string result;
    auto err = generator_->generate(messages, params_, on_token, cancel_, result);
    if (!err.isOk()) {
        return err;
    }
    if (cancel_.load()) {
        return ErrorInfo::error(ErrorCode::INTERRUPTED, "Generation interrupted");
    }

    reply = result;
    return ErrorInfo::ok();
}

void GenerationCapability::interrupt() {
    cancel_.store(true);
    std::cout << "[Generation] Interrupt requested" << std::endl;
}

void GenerationCapability::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_.store(false);
    if (generator_) {
        generator_->resetState();
    }
}

Conversation GenerationCapability::normalizeConversation(const Conversation& conversation,
                                                         const std::string& system_prompt) {
    for (const auto& msg : conversation) {
        if (msg.role == "system") {
            return conversation;
        }
    }
    Conversation out;
    out.reserve(conversation.size() + 1);
    out.push_back(ChatMessage::system(system_prompt));
    out.insert(out.end(), conversation.begin(), conversation.end());
    return out;
}

}  // namespace voice
