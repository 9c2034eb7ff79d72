#include "tests/test_common.h"

#include <atomic>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/capabilities/generation_capability.hpp"
#include "internal/capabilities/transcription_capability.hpp"
#include "internal/pipeline/resource_arbiter.hpp"
#include "internal/pipeline/session_orchestrator.hpp"
#include "internal/pipeline/turn_mutex.hpp"
#include "tests/test_fakes.h"

using namespace voice;

namespace {

CapabilitySetup fakeSetup(CapabilityKind kind, std::shared_ptr<fakes::CapabilityLog> log,
                          bool* exclusive = nullptr) {
    return [kind, log, exclusive](std::unique_ptr<ICapability>& out) {
        if (exclusive && log->live != 0) *exclusive = false;
        out = std::make_unique<fakes::FakeCapability>(kind, log);
        return ErrorInfo::ok();
    };
}

}  // namespace

// ── Test: ResourceArbiter ──

static void testArbiter() {
    section("ResourceArbiter");

    auto log = std::make_shared<fakes::CapabilityLog>();
    bool exclusive = true;
    ResourceArbiter arbiter;

    std::vector<std::pair<CapabilityKind, LifecycleEvent>> events;
    arbiter.setLifecycleListener([&events](CapabilityKind kind, LifecycleEvent event) {
        events.emplace_back(kind, event);
    });

    ICapability* cap = nullptr;
    auto err = arbiter.acquire(CapabilityKind::TRANSCRIPTION,
        fakeSetup(CapabilityKind::TRANSCRIPTION, log, &exclusive), cap);
    check(err.isOk() && cap && cap->kind() == CapabilityKind::TRANSCRIPTION, "acquire transcription");

    ICapability* same = nullptr;
    arbiter.acquire(CapabilityKind::TRANSCRIPTION,
        fakeSetup(CapabilityKind::TRANSCRIPTION, log, &exclusive), same);
    check(same == cap, "same kind reuses the resident");
    check(arbiter.getSetupCount() == 1 && arbiter.getDisposeCount() == 0, "no reload for same kind");

    for (CapabilityKind kind : {CapabilityKind::GENERATION, CapabilityKind::SYNTHESIS,
                                CapabilityKind::TRANSCRIPTION, CapabilityKind::GENERATION}) {
        arbiter.acquire(kind, fakeSetup(kind, log, &exclusive), cap);
    }
    check(exclusive, "previous capability disposed before setup runs");
    check(log->max_live == 1, "never more than one resident");
    check(arbiter.getDisposeCount() == 4, "one dispose per switch");

    CapabilityKind kind;
    check(arbiter.residentKind(kind) && kind == CapabilityKind::GENERATION, "resident kind");

    check(events.size() >= 3 && events[0].second == LifecycleEvent::INITIALIZING &&
          events[1].second == LifecycleEvent::READY &&
          events[2].first == CapabilityKind::TRANSCRIPTION &&
          events[2].second == LifecycleEvent::RELEASED, "lifecycle order");

    // Invalid resident of the same kind is replaced
    static_cast<fakes::FakeCapability*>(cap)->invalidate();
    int setups = arbiter.getSetupCount();
    arbiter.acquire(CapabilityKind::GENERATION,
        fakeSetup(CapabilityKind::GENERATION, log, &exclusive), cap);
    check(arbiter.getSetupCount() == setups + 1, "invalid resident reloaded");

    arbiter.release();
    check(!arbiter.hasResident() && log->live == 0, "release empties the arbiter");
}

static void testListenerQueriesArbiter() {
    section("ResourceArbiter listener");

    auto log = std::make_shared<fakes::CapabilityLog>();
    ResourceArbiter arbiter;
    std::vector<bool> resident_seen;
    arbiter.setLifecycleListener([&arbiter, &resident_seen](CapabilityKind, LifecycleEvent) {
        resident_seen.push_back(arbiter.hasResident());
    });

    std::atomic<bool> done{false};
    std::thread worker([&arbiter, &log, &done] {
        ICapability* cap = nullptr;
        arbiter.acquire(CapabilityKind::SYNTHESIS, fakeSetup(CapabilityKind::SYNTHESIS, log), cap);
        arbiter.acquire(CapabilityKind::GENERATION, fakeSetup(CapabilityKind::GENERATION, log), cap);
        arbiter.release();
        done = true;
    });
    bool finished = waitFor([&done] { return done.load(); });
    check(finished, "listener may call back into the arbiter");
    if (!finished) {
        // The worker is stuck holding the arbiter; it cannot be joined
        worker.detach();
        std::_Exit(finish());
    }
    worker.join();
    // synthesis: init, ready; generation: released, init, ready; release: released
    check(resident_seen.size() == 6, "every lifecycle event delivered");
    check(!resident_seen.empty() && !resident_seen.back(),
          "listener sees the arbiter state after release");
}

static void testArbiterFailures() {
    section("ResourceArbiter failures");

    auto log = std::make_shared<fakes::CapabilityLog>();
    ResourceArbiter arbiter;
    ICapability* cap = nullptr;

    auto err = arbiter.acquire(CapabilityKind::SYNTHESIS,
        [](std::unique_ptr<ICapability>&) -> ErrorInfo { throw std::bad_alloc(); }, cap);
    check(err.code == ErrorCode::OUT_OF_MEMORY, "bad_alloc becomes OUT_OF_MEMORY");
    check(err.message == ResourceArbiter::OUT_OF_MEMORY_MESSAGE, "fixed out-of-memory message");
    check(!arbiter.hasResident(), "no resident after failed setup");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS, [](std::unique_ptr<ICapability>&) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            "Failed to allocate memory for buffer of size 268435456");
    }, cap);
    check(err.code == ErrorCode::OUT_OF_MEMORY, "allocation failure message mapped");
    check(err.detail.find("268435456") != std::string::npos, "original message kept as detail");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS, [](std::unique_ptr<ICapability>&) {
        return ErrorInfo::error(ErrorCode::OUT_OF_MEMORY, "Failed to allocate session for vocoder");
    }, cap);
    check(err.code == ErrorCode::OUT_OF_MEMORY &&
          err.message == ResourceArbiter::OUT_OF_MEMORY_MESSAGE,
          "session allocation failure gets the actionable message");
    check(err.detail == "Failed to allocate session for vocoder", "session failure kept as detail");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS, [](std::unique_ptr<ICapability>&) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Model file not found: x.onnx");
    }, cap);
    check(err.code == ErrorCode::MODEL_NOT_FOUND, "other setup errors pass through");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS,
        [](std::unique_ptr<ICapability>&) -> ErrorInfo { throw std::runtime_error("boom"); }, cap);
    check(err.code == ErrorCode::INTERNAL_ERROR && err.message == "boom", "exception reported");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS,
        fakeSetup(CapabilityKind::GENERATION, log), cap);
    check(err.code == ErrorCode::INTERNAL_ERROR && !arbiter.hasResident(), "kind mismatch rejected");
    check(log->live == 0, "mismatched capability disposed");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS, [](std::unique_ptr<ICapability>&) {
        return ErrorInfo::ok();
    }, cap);
    check(err.code == ErrorCode::INTERNAL_ERROR, "empty setup result rejected");

    err = arbiter.acquire(CapabilityKind::SYNTHESIS, nullptr, cap);
    check(err.code == ErrorCode::NOT_INITIALIZED, "missing setup");

    // A failing or throwing dispose still clears residency
    arbiter.acquire(CapabilityKind::TRANSCRIPTION, fakeSetup(CapabilityKind::TRANSCRIPTION, log), cap);
    log->dispose_fails = true;
    err = arbiter.acquire(CapabilityKind::GENERATION, fakeSetup(CapabilityKind::GENERATION, log), cap);
    check(err.isOk() && cap->kind() == CapabilityKind::GENERATION, "switch despite dispose error");
    log->dispose_fails = false;
    log->dispose_throws = true;
    err = arbiter.acquire(CapabilityKind::SYNTHESIS, fakeSetup(CapabilityKind::SYNTHESIS, log), cap);
    check(err.isOk() && cap->kind() == CapabilityKind::SYNTHESIS, "switch despite dispose exception");
    check(log->max_live == 1, "still exclusive");
    log->dispose_throws = false;
}

// ── Test: TurnMutex ──

static void testTurnMutex() {
    section("TurnMutex");

    TurnMutex m;
    check(m.tryLock(), "tryLock when free");
    check(m.isLocked(), "locked");
    check(!m.tryLock(), "tryLock when held");

    std::vector<int> order;
    std::mutex order_mutex;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&m, &order, &order_mutex, i] {
            m.lock();
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }
            m.unlock();
        });
        // Queue the next waiter only after this one holds a ticket
        waitFor([&m, i] { return m.waiting() == static_cast<uint64_t>(i + 1); });
    }
    check(!m.tryLock(), "tryLock fails while others are queued");
    m.unlock();
    for (auto& t : waiters) t.join();
    check(order == std::vector<int>({0, 1, 2}), "waiters served first come, first served");
    check(!m.isLocked() && m.waiting() == 0, "idle after queue drains");

    bool threw = false;
    try {
        m.runExclusive([]() -> int { throw std::runtime_error("stage failed"); });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw && !m.isLocked(), "runExclusive releases on exception");
    check(m.runExclusive([] { return 7; }) == 7, "runExclusive returns the result");
}

// ── Test: TranscriptionCapability ──

static void testTranscription() {
    section("TranscriptionCapability");

    check(TranscriptionCapability::isNoSpeech(""), "empty is no speech");
    check(TranscriptionCapability::isNoSpeech("a"), "one character is no speech");
    check(TranscriptionCapability::isNoSpeech("(inaudible)"), "parenthesized annotation");
    check(TranscriptionCapability::isNoSpeech(" [BLANK_AUDIO] "), "bracketed annotation");
    check(TranscriptionCapability::isNoSpeech("(music) [noise]"), "several annotations");
    check(!TranscriptionCapability::isNoSpeech("ok"), "two characters is speech");
    check(!TranscriptionCapability::isNoSpeech("(laughs) hello"), "speech around annotation");

    auto rlog = std::make_shared<fakes::RecognizerLog>();
    AgentConfig config;
    std::unique_ptr<TranscriptionCapability> cap;
    auto err = TranscriptionCapability::create(config,
        [rlog](const AgentConfig&, const ProgressCallback&, std::unique_ptr<ISpeechRecognizer>& out) {
            out = std::make_unique<fakes::FakeRecognizer>(rlog);
            return ErrorInfo::ok();
        }, nullptr, cap);
    check(err.isOk() && cap->isValid(), "create with recognizer");

    std::vector<std::string> updates;
    std::string text;
    rlog->transcript = "  what time is it \n";
    err = cap->transcribe(std::vector<float>(48000, 0.1f), 48000, "",
        [&updates](const std::string& t) { updates.push_back(t); }, text);
    check(err.isOk() && text == "what time is it", "transcript trimmed");
    check(rlog->last_samples == 16000, "input resampled to 16kHz");
    check(rlog->last_language == "english", "default language");
    check(updates.size() == 1, "interim update forwarded");

    cap->transcribe(std::vector<float>(16000, 0.1f), 16000, "french", nullptr, text);
    check(rlog->last_language == "french" && rlog->last_samples == 16000, "explicit language, no resample");

    rlog->transcript = "(inaudible)";
    err = cap->transcribe(std::vector<float>(16000, 0.1f), 16000, "", nullptr, text);
    check(err.code == ErrorCode::NO_SPEECH, "annotation-only transcript is NO_SPEECH");
    check(err.message == "No meaningful speech detected.", "no-speech message");

    err = cap->transcribe({}, 16000, "", nullptr, text);
    check(err.code == ErrorCode::NO_SPEECH, "empty audio is NO_SPEECH");

    rlog->error = ErrorInfo::error(ErrorCode::TRANSCRIPTION_FAILED, "decoder fault");
    err = cap->transcribe(std::vector<float>(16000, 0.1f), 16000, "", nullptr, text);
    check(err.code == ErrorCode::TRANSCRIPTION_FAILED, "engine error propagates");

    cap->dispose();
    check(!cap->isValid() && rlog->released == 1, "dispose releases recognizer");

    std::unique_ptr<TranscriptionCapability> none;
    check(TranscriptionCapability::create(config, nullptr, nullptr, none).code ==
          ErrorCode::NOT_INITIALIZED, "no provider");
    check(TranscriptionCapability::create(config,
        [](const AgentConfig&, const ProgressCallback&, std::unique_ptr<ISpeechRecognizer>&) {
            return ErrorInfo::ok();
        }, nullptr, none).code == ErrorCode::MODEL_NOT_FOUND, "provider returned nothing");
}

// ── Test: GenerationCapability ──

static void testGeneration() {
    section("GenerationCapability");

    Conversation plain = {ChatMessage::user("hi")};
    auto normalized = GenerationCapability::normalizeConversation(plain, "Be brief.");
    check(normalized.size() == 2 && normalized[0].role == "system" &&
          normalized[0].content == "Be brief.", "system prompt prepended");

    Conversation with_system = {ChatMessage::system("Custom."), ChatMessage::user("hi")};
    check(GenerationCapability::normalizeConversation(with_system, "Be brief.").size() == 2,
          "existing system message kept");

    auto glog = std::make_shared<fakes::GeneratorLog>();
    AgentConfig config = AgentConfig::Default().withSystemPrompt("Be brief.");
    GenerationCapability cap(std::make_unique<fakes::FakeGenerator>(glog), config);

    std::vector<std::string> tokens;
    std::string reply;
    auto err = cap.generate(plain, [&tokens](const std::string& t) { tokens.push_back(t); }, reply);
    check(err.isOk() && reply == "It is noon.", "reply assembled");
    check(tokens == std::vector<std::string>({"It is", " noon."}), "tokens streamed in order");
    check(glog->last_conversation.front().content == "Be brief.", "engine sees system prompt");
    check(glog->last_params.max_new_tokens == 512 && glog->last_params.top_k == 20,
          "sampling parameters from config");

    check(cap.generate({}, nullptr, reply).code == ErrorCode::INVALID_TEXT, "empty conversation");

    // Interrupt from another thread while the engine runs
    glog->wait_for_cancel = true;
    glog->started = false;
    std::thread caller([&cap, &plain, &err, &reply] { err = cap.generate(plain, nullptr, reply); });
    waitFor([&glog] { return glog->started.load(); });
    cap.interrupt();
    caller.join();
    check(err.code == ErrorCode::INTERRUPTED, "interrupt ends generation");
    glog->wait_for_cancel = false;

    err = cap.generate(plain, nullptr, reply);
    check(err.isOk(), "next generation is not pre-cancelled");

    cap.reset();
    check(glog->resets == 1 && !cap.isInterrupted(), "reset clears engine state");

    cap.dispose();
    check(!cap.isValid() && glog->released == 1, "dispose releases generator");
    check(cap.generate(plain, nullptr, reply).code == ErrorCode::NOT_INITIALIZED,
          "generate after dispose");
}

// ── Test: SessionOrchestrator ──

struct Harness {
    std::string model_dir;
    std::shared_ptr<fakes::RecognizerLog> rlog = std::make_shared<fakes::RecognizerLog>();
    std::shared_ptr<fakes::GeneratorLog> glog = std::make_shared<fakes::GeneratorLog>();
    std::shared_ptr<fakes::SessionLog> slog = std::make_shared<fakes::SessionLog>();
    AgentConfig config;
    ResourceArbiter arbiter;
    fakes::RecordingCallback events;
    std::unique_ptr<SessionOrchestrator> orchestrator;

    explicit Harness(bool with_generator = true) {
        model_dir = makeTempDir("orchestrator");
        fakes::writeSynthesisAssets(model_dir);
        config = AgentConfig::Offline(model_dir);
        config.synthesis.total_steps = 2;

        RuntimeProviders providers;
        auto rl = rlog;
        providers.recognizer = [rl](const AgentConfig&, const ProgressCallback&,
                                    std::unique_ptr<ISpeechRecognizer>& out) {
            out = std::make_unique<fakes::FakeRecognizer>(rl);
            return ErrorInfo::ok();
        };
        if (with_generator) {
            auto gl = glog;
            providers.generator = [gl](const AgentConfig&, const ProgressCallback&,
                                       std::unique_ptr<ITextGenerator>& out) {
                out = std::make_unique<fakes::FakeGenerator>(gl);
                return ErrorInfo::ok();
            };
        }
        providers.sessions = fakes::fakeSessionFactory(slog);

        orchestrator = std::make_unique<SessionOrchestrator>(
            arbiter, CapabilitySetups::fromProviders(config, providers, nullptr), config);
        orchestrator->setCallback(&events);
    }
};

static void testFullTurn() {
    section("SessionOrchestrator full turn");

    Harness h;
    auto err = h.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(err.isOk(), "turn completes");

    auto states = h.events.snapshot(h.events.states);
    check(states == std::vector<TurnState>({TurnState::TRANSCRIBING, TurnState::GENERATING,
                                            TurnState::SYNTHESIZING, TurnState::IDLE}),
          "state sequence");
    check(!h.events.snapshot(h.events.chunks).empty(), "audio emitted");

    auto completes = h.events.snapshot(h.events.completes);
    check(completes.size() == 1 && completes[0] == "It is noon.", "completion carries reply");

    auto history = h.orchestrator->getHistory();
    check(history.size() == 2 && history[0].role == "user" &&
          history[0].content == "what time is it" && history[1].content == "It is noon.",
          "history records the turn");
    check(h.glog->last_conversation.size() == 2 &&
          h.glog->last_conversation[0].role == "system", "generation sees system + user");

    CapabilityKind kind;
    check(h.arbiter.residentKind(kind) && kind == CapabilityKind::SYNTHESIS, "synthesis left resident");
    check(h.arbiter.getDisposeCount() == 2, "one release per stage switch");

    // Second turn carries history forward
    h.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(h.glog->last_conversation.size() == 4, "history passed to next generation");
    check(h.orchestrator->getState() == TurnState::IDLE, "idle after turn");
}

static void testNoSpeechTurn() {
    section("SessionOrchestrator no speech");

    Harness h;
    h.rlog->transcript = "[BLANK_AUDIO]";
    auto err = h.orchestrator->runTurn(std::vector<float>(16000, 0.0f), 16000);
    check(err.code == ErrorCode::NO_SPEECH, "turn stops at transcription");
    check(h.orchestrator->getState() == TurnState::IDLE, "no speech returns to idle");
    check(h.glog->calls == 0, "generation never ran");
    check(h.arbiter.getSetupCount() == 1, "only transcription loaded");
    check(h.orchestrator->getHistory().empty(), "history unchanged");

    auto errors = h.events.snapshot(h.events.errors);
    check(errors.size() == 1 && errors[0].code == ErrorCode::NO_SPEECH, "error event raised");
    check(!h.orchestrator->isBusy(), "turn lock released");
}

static void testFailedTurn() {
    section("SessionOrchestrator failure");

    Harness h;
    h.glog->error = ErrorInfo::error(ErrorCode::GENERATION_FAILED, "decode step failed");
    auto err = h.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(err.code == ErrorCode::GENERATION_FAILED, "generation failure reported");
    check(h.orchestrator->getState() == TurnState::ERROR, "error state");
    check(!h.orchestrator->isBusy(), "turn lock released after failure");

    h.glog->error = ErrorInfo::ok();
    err = h.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(err.isOk() && h.orchestrator->getState() == TurnState::IDLE, "next turn recovers");

    Harness missing(false);
    err = missing.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(err.code == ErrorCode::NOT_INITIALIZED, "missing generator provider reported");
    check(missing.orchestrator->getState() == TurnState::ERROR, "missing provider is an error");
}

static void testBusyDrop() {
    section("SessionOrchestrator busy");

    Harness h;
    h.glog->gate_open = false;
    check(h.orchestrator->submitAudio(std::vector<float>(16000, 0.1f), 16000), "first turn accepted");
    waitFor([&h] { return h.glog->started.load(); });
    check(h.orchestrator->isBusy(), "busy during turn");
    check(!h.orchestrator->submitAudio(std::vector<float>(16000, 0.1f), 16000),
          "second submission dropped");

    h.glog->gate_open = true;
    h.orchestrator->waitIdle();
    check(h.glog->calls == 1 && h.rlog->calls == 1, "dropped audio never processed");
    check(h.orchestrator->getState() == TurnState::IDLE && !h.orchestrator->isBusy(), "idle afterwards");
    check(h.orchestrator->submitAudio(std::vector<float>(16000, 0.1f), 16000), "accepted once idle");
    h.orchestrator->waitIdle();
    check(h.orchestrator->getHistory().size() == 4, "both accepted turns recorded");
}

static void testInterrupt() {
    section("SessionOrchestrator interrupt");

    Harness h;
    h.glog->wait_for_cancel = true;
    h.orchestrator->submitAudio(std::vector<float>(16000, 0.1f), 16000);
    waitFor([&h] { return h.glog->started.load(); });
    h.orchestrator->interrupt();
    h.orchestrator->waitIdle();

    auto errors = h.events.snapshot(h.events.errors);
    check(errors.size() == 1 && errors[0].code == ErrorCode::INTERRUPTED, "interrupted turn reported");
    check(h.orchestrator->getState() == TurnState::IDLE, "interrupt returns to idle");
    check(h.orchestrator->getHistory().empty(), "interrupted turn not recorded");
    check(h.slog->opened == 0, "synthesis skipped");

    h.orchestrator->interrupt();
    check(h.orchestrator->getState() == TurnState::IDLE, "interrupt with nothing running is harmless");
}

static void testCommands() {
    section("SessionOrchestrator commands");

    Harness h;
    std::string text;
    auto err = h.orchestrator->transcribe(std::vector<float>(16000, 0.1f), 16000, "", text);
    check(err.isOk() && text == "what time is it", "transcribe command");

    std::string reply;
    err = h.orchestrator->generate({ChatMessage::user("hello")}, reply);
    check(err.isOk() && reply == "It is noon.", "generate command");
    check(h.orchestrator->getHistory().empty(), "single commands leave history alone");

    SpeakResult result;
    std::vector<AudioChunk> sink;
    err = h.orchestrator->synthesize("Hello there.", "", result,
        [&sink](const AudioChunk& c) { sink.push_back(c); });
    check(err.isOk() && result.spoken, "synthesize command");
    check(sink.size() == h.events.snapshot(h.events.chunks).size(), "extra sink sees every chunk");

    SpeakResult quiet;
    err = h.orchestrator->synthesize("<think>hmm</think>", "", quiet);
    check(err.isOk() && !quiet.spoken, "reasoning-only text not spoken");
    auto completes = h.events.snapshot(h.events.completes);
    check(!completes.empty() && completes.back() == SynthesisCapability::NOTHING_TO_SAY,
          "nothing-to-say reported as completion");

    err = h.orchestrator->synthesize("Hello.", "Nobody", quiet);
    check(err.code == ErrorCode::VOICE_NOT_FOUND, "unknown voice");
    check(h.orchestrator->getState() == TurnState::ERROR, "voice error is an error state");

    // Preload visits every capability and leaves none resident
    int setups = h.arbiter.getSetupCount();
    err = h.orchestrator->preload();
    check(err.isOk() && h.arbiter.getSetupCount() == setups + 3, "preload loads each capability");
    check(!h.arbiter.hasResident(), "preload leaves nothing resident");
    completes = h.events.snapshot(h.events.completes);
    check(completes.back() == "All models preloaded", "preload completion");

    // Reset clears history and generation state
    h.orchestrator->runTurn(std::vector<float>(16000, 0.1f), 16000);
    check(h.orchestrator->getHistory().size() == 2, "turn recorded");
    h.orchestrator->reset();
    check(h.orchestrator->getHistory().empty(), "history cleared");
    check(h.glog->resets == 0, "reset skips generation when not resident");

    h.orchestrator->generate({ChatMessage::user("hello")}, reply);
    h.orchestrator->reset();
    check(h.glog->resets == 1, "reset clears resident generation state");
}

int main() {
    testArbiter();
    testListenerQueriesArbiter();
    testArbiterFailures();
    testTurnMutex();
    testTranscription();
    testGeneration();
    testFullTurn();
    testNoSpeechTurn();
    testFailedTurn();
    testBusyDrop();
    testInterrupt();
    testCommands();
    return finish();
}
