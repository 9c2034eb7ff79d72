#include "tests/test_common.h"

#include <cmath>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/capabilities/synthesis_capability.hpp"
#include "internal/synthesis/latent_sampler.hpp"
#include "internal/synthesis/speech_synthesizer.hpp"
#include "internal/synthesis/synthesis_config.hpp"
#include "internal/synthesis/voice_style_store.hpp"
#include "tests/test_fakes.h"

using namespace voice;

// ── Test: ModelConfig ──

static void testModelConfig() {
    section("ModelConfig");

    std::string dir = makeTempDir("model_config");
    fakes::writeModelConfig(dir + "/tts.json");

    ModelConfig cfg;
    check(ModelConfig::load(dir + "/tts.json", cfg).isOk(), "load tts.json");
    check(cfg.sample_rate == 1000 && cfg.base_chunk_size == 10, "ae fields");
    check(cfg.chunk_compress_factor == 2 && cfg.latent_dim == 3, "ttl fields");
    check(cfg.chunkSize() == 20, "chunk size = base * compress");
    check(cfg.latentChannels() == 6, "latent channels = dim * compress");

    check(ModelConfig::load(dir + "/missing.json", cfg).code == ErrorCode::MODEL_NOT_FOUND,
          "missing config is MODEL_NOT_FOUND");

    fakes::writeText(dir + "/partial.json", "{\"ae\": {\"sample_rate\": 44100}}");
    check(ModelConfig::load(dir + "/partial.json", cfg).code == ErrorCode::INVALID_CONFIG,
          "missing keys are INVALID_CONFIG");

    fakes::writeText(dir + "/zero.json",
        "{\"ae\": {\"sample_rate\": 0, \"base_chunk_size\": 512},"
        " \"ttl\": {\"chunk_compress_factor\": 6, \"latent_dim\": 24}}");
    check(ModelConfig::load(dir + "/zero.json", cfg).code == ErrorCode::INVALID_CONFIG,
          "non-positive sample rate rejected");
}

// ── Test: LatentSampler ──

static void testLatentSampler() {
    section("LatentSampler");

    ModelConfig cfg = fakes::testModelConfig();

    LatentSampler a(42);
    LatentSampler b(42);
    auto la = a.sample({0.5f, 0.25f}, cfg);
    auto lb = b.sample({0.5f, 0.25f}, cfg);
    check(la.data == lb.data, "same seed gives same noise");

    check(la.batch == 2 && la.channels == 6, "batch and channel dims");
    check(la.length == 25, "length = ceil(max_wav_len / chunk)");
    check(la.wav_lengths == std::vector<int64_t>({500, 250}), "wav lengths = floor(d * sr)");
    check(la.latent_lengths == std::vector<int64_t>({25, 13}), "latent lengths = ceil(wav / chunk)");
    check(la.data.size() == static_cast<size_t>(2 * 6 * 25), "buffer size");

    bool masked = true;
    for (int64_t c = 0; c < la.channels; ++c) {
        for (int64_t t = 13; t < la.length; ++t) {
            size_t idx = static_cast<size_t>((1 * la.channels + c) * la.length + t);
            if (la.data[idx] != 0.0f) masked = false;
        }
    }
    check(masked, "noise zeroed past the row's latent length");

    Tensor mask = la.maskTensor();
    check(mask.shape == std::vector<int64_t>({2, 1, 25}), "latent_mask shape [B, 1, L]");
    Tensor latent = la.latentTensor();
    check(latent.shape == std::vector<int64_t>({2, 6, 25}) && latent.isConsistent(),
          "noisy_latent shape [B, C, L]");

    LatentSampler stats(7);
    double sum = 0.0;
    double sq = 0.0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        double v = stats.nextGaussian();
        sum += v;
        sq += v * v;
    }
    double mean = sum / n;
    double var = sq / n - mean * mean;
    check(std::fabs(mean) < 0.05 && std::fabs(var - 1.0) < 0.1, "draws are standard normal");

    check(latentLengths({0, 1, 20, 21}, 20) == std::vector<int64_t>({0, 1, 1, 2}),
          "latentLengths ceiling division");
}

// ── Test: VoiceStyleStore ──

static void testVoiceStyles() {
    section("VoiceStyleStore");

    std::string dir = makeTempDir("voices");
    fakes::writeVoiceStyle(dir + "/M3.json");
    fakes::writeVoiceStyle(dir + "/F1.json");

    VoiceStyleStore store(dir);
    std::shared_ptr<const VoiceStyle> style;
    check(store.get("M3", style).isOk(), "load voice M3");
    check(style && style->name == "M3", "style named");
    check(style->style_ttl.shape == std::vector<int64_t>({1, 2, 3}), "style_ttl dims");
    check(style->style_dp.f32 == std::vector<float>({1.0f, -1.0f, 0.5f, -0.5f}),
          "style_dp data flattened in order");
    check(style->batchSize() == 1, "single speaker");

    std::shared_ptr<const VoiceStyle> again;
    check(store.get("M3", again).isOk() && again == style, "second lookup served from cache");
    check(store.cachedCount() == 1, "one cached style");

    std::shared_ptr<const VoiceStyle> none;
    check(store.get("Nobody", none).code == ErrorCode::VOICE_NOT_FOUND, "unknown voice");
    check(store.get("../M3", none).code == ErrorCode::VOICE_NOT_FOUND, "path traversal rejected");

    auto names = store.listVoices();
    check(names == std::vector<std::string>({"F1", "M3"}), "voices listed sorted");

    VoiceStyle tiled = style->repeated(3);
    check(tiled.batchSize() == 3 && tiled.style_ttl.f32.size() == 18, "style tiled along batch");
    check(tiled.style_dp.shape == std::vector<int64_t>({3, 2, 2}), "style_dp tiled dims");

    fakes::writeText(dir + "/Broken.json",
        "{\"style_ttl\": {\"data\": [1, 2], \"dims\": [1, 3], \"type\": \"float32\"},"
        " \"style_dp\": {\"data\": [1], \"dims\": [1, 1], \"type\": \"float32\"}}");
    check(store.get("Broken", none).code == ErrorCode::INVALID_CONFIG, "shape mismatch rejected");

    store.clear();
    check(store.cachedCount() == 0, "clear drops cache");
}

// ── Test: SpeechSynthesizer ──

static void testSynthesizer() {
    section("SpeechSynthesizer");

    auto log = std::make_shared<fakes::SessionLog>();
    auto synth = fakes::makeSynthesizer(log);
    check(synth->isReady(), "synthesizer ready");
    check(log->opened == 4, "four graphs opened");

    VoiceStyle style = fakes::testStyle();
    SynthesisOptions options = SynthesisOptions::Default().withSteps(5).withSeed(11);

    // Single short utterance: one chunk, floor(sr * duration) samples
    std::vector<AudioChunk> chunks;
    SynthesisDiagnostics diag;
    auto err = synth->synthesize("hi", style, options,
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &diag);
    check(err.isOk(), "synthesize 'hi'");
    check(chunks.size() == 1, "one chunk");
    check(chunks[0].samples.size() == 500, "chunk length = floor(sr * duration)");
    check(chunks[0].sample_rate == 1000 && chunks[0].is_final, "chunk metadata");
    check(log->text_ids_shape == std::vector<int64_t>({1, 12}), "tagged text <en>hi.</en> indexed");
    check(log->estimator_calls == 5, "one estimator pass per step");
    check(log->current_steps == std::vector<float>({0, 1, 2, 3, 4}), "current_step counts up");
    check(log->total_step == 5.0f, "total_step passed");
    check(diag.segments == 1 && diag.unsupported_chars.empty(), "diagnostics clean");

    // Same seed, same initial noise
    std::vector<float> first = log->first_noisy;
    chunks.clear();
    synth->synthesize("hi", style, options, [&chunks](const AudioChunk& c) { chunks.push_back(c); });
    check(log->first_noisy == first, "seeded runs are reproducible");

    // Rate factor scales the predicted duration
    chunks.clear();
    SynthesisDiagnostics slow;
    synth->synthesize("hi", style, options.withRate(2.0f),
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &slow);
    check(chunks.size() == 1 && chunks[0].samples.size() == 1000, "rate 2.0 doubles duration");
    check(slow.durations.size() == 1 && slow.durations[0] == 1.0f, "scaled duration reported");

    // Long predicted durations are clipped
    log->durations = {100.0f};
    chunks.clear();
    SynthesisDiagnostics clipped;
    synth->synthesize("hi", style, options,
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &clipped);
    check(clipped.duration_clipped, "over-long duration flagged");
    check(chunks.size() == 1 && chunks[0].samples.size() == 30000, "clipped to max duration");

    // Non-positive durations fall back to a single latent frame
    log->durations = {-1.0f};
    chunks.clear();
    SynthesisDiagnostics tiny;
    err = synth->synthesize("hi", style, options,
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &tiny);
    check(err.isOk() && tiny.duration_clipped, "negative duration recovered");
    check(chunks.size() == 1 && !chunks[0].samples.empty() && chunks[0].samples.size() <= 20,
          "one latent frame of audio");
    log->durations = {0.5f};

    // Segmented text: silence before later segments
    chunks.clear();
    SynthesisOptions seg = options;
    seg.max_chunk_chars = 25;
    SynthesisDiagnostics segd;
    err = synth->synthesize("First sentence here. Second one.", style, seg,
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &segd);
    check(err.isOk() && chunks.size() == 2, "two segments");
    check(chunks[0].samples.size() == 500 && !chunks[0].is_final, "first segment");
    check(chunks[1].samples.size() == 800, "second segment has 0.3s leading silence");
    check(chunks[1].samples[0] == 0.0f && chunks[1].samples[299] == 0.0f &&
          chunks[1].samples[300] != 0.0f, "silence precedes speech");
    check(chunks[1].is_final && chunks[1].segment_index == 1, "last segment marked final");
    check(chunks[1].timestamp_ms == 500, "segment timestamp");
    check(segd.segments == 2, "segments counted");

    // Characters outside the code table are reported, not fatal
    chunks.clear();
    SynthesisDiagnostics odd;
    err = synth->synthesize("caf\xC3\xA9", style, options,
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, &odd);
    check(err.isOk() && chunks.size() == 1, "unsupported characters still synthesized");
    check(odd.unsupported_chars.size() == 1 && odd.unsupported_chars[0] == "\xCC\x81",
          "combining accent reported after NFKD");

    // Unsupported language is tagged anyway
    SynthesisDiagnostics lang;
    err = synth->synthesize("hi", style, options.withLanguage("de"), nullptr, &lang);
    check(err.isOk() && !lang.language_supported, "unknown language flagged");

    // Nothing speakable
    err = synth->synthesize("\xF0\x9F\x99\x82 \xF0\x9F\x99\x82", style, options, nullptr);
    check(err.code == ErrorCode::EMPTY_UTTERANCE, "emoji-only text is EMPTY_UTTERANCE");
    check(err.message == "empty utterance after normalization", "empty utterance message");

    // Multi-speaker style needs the batch entry point
    err = synth->synthesize("hi", style.repeated(2), options, nullptr);
    check(err.code == ErrorCode::INVALID_CONFIG, "batched style rejected for streaming");

    // Batch synthesis with a tiled style
    log->durations = {0.5f, 0.25f};
    std::vector<AudioChunk> batch_out;
    err = synth->batch({"hi", "there"}, style, options, batch_out);
    check(err.isOk() && batch_out.size() == 2, "batch of two");
    check(batch_out[0].samples.size() == 500 && batch_out[1].samples.size() == 250,
          "each row trimmed to its own duration");
    log->durations = {0.5f};

    // Graph failure propagates
    log->fail_run = SynthesisSessions::VOCODER;
    err = synth->synthesize("hi", style, options, nullptr);
    check(err.code == ErrorCode::SYNTHESIS_FAILED, "vocoder failure propagates");
    log->fail_run.clear();

    check(synth->synthesize("hi", style, options.withSteps(0), nullptr).code ==
          ErrorCode::INVALID_CONFIG, "zero steps rejected");

    synth->release();
    check(!synth->isReady(), "released synthesizer not ready");
    check(log->released == 4, "all four sessions released");
    check(synth->synthesize("hi", style, options, nullptr).code == ErrorCode::NOT_INITIALIZED,
          "synthesize after release fails");
}

// ── Test: SynthesisSessions::load ──

static void testSessionLoading() {
    section("SynthesisSessions");

    auto log = std::make_shared<fakes::SessionLog>();
    log->fail_open = SynthesisSessions::VOCODER;

    SynthesisSessions sessions;
    std::vector<std::string> progress;
    auto err = SynthesisSessions::load(fakes::fakeSessionFactory(log), "/models/onnx",
        [&progress](const std::string& file, float) { progress.push_back(file); }, sessions);
    check(err.code == ErrorCode::MODEL_NOT_FOUND, "missing graph reported");
    check(!sessions.complete(), "no partial session set handed out");
    check(log->opened == 3 && log->released == 3, "already-opened graphs released");
    check(progress.size() == 3, "progress per loaded graph");

    check(SynthesisSessions::load(nullptr, "/models/onnx", nullptr, sessions).code ==
          ErrorCode::NOT_INITIALIZED, "missing factory");
}

// ── Test: SynthesisCapability ──

static void testSynthesisCapability() {
    section("SynthesisCapability");

    std::string dir = makeTempDir("synthesis_cap");
    fakes::writeSynthesisAssets(dir);

    AgentConfig config = AgentConfig::Offline(dir);
    config.synthesis.total_steps = 3;

    auto log = std::make_shared<fakes::SessionLog>();
    std::vector<std::string> progress;
    std::unique_ptr<SynthesisCapability> cap;
    auto err = SynthesisCapability::create(config, fakes::fakeSessionFactory(log),
        [&progress](const std::string& file, float) { progress.push_back(file); }, cap);
    check(err.isOk() && cap, "create from model dir");
    check(cap->isValid() && cap->kind() == CapabilityKind::SYNTHESIS, "valid synthesis capability");
    check(progress.size() == 6, "progress for config, indexer and four graphs");
    check(cap->getSampleRate() == 1000, "sample rate from tts.json");

    std::vector<AudioChunk> chunks;
    SpeakResult result;
    err = cap->speak("<think>work it out</think>Hello.", "",
        [&chunks](const AudioChunk& c) { chunks.push_back(c); }, result);
    check(err.isOk() && result.spoken, "reply spoken");
    check(chunks.size() == 1 && result.sample_rate == 1000, "audio delivered");
    check(log->estimator_calls == 3, "default steps from config");

    chunks.clear();
    SpeakResult silent;
    err = cap->speak("<think>nothing to say</think>", "", nullptr, silent);
    check(err.isOk() && !silent.spoken, "reasoning-only reply not spoken");
    check(silent.message == SynthesisCapability::NOTHING_TO_SAY, "nothing-to-say message");

    SpeakResult missing;
    err = cap->speak("Hello.", "Nobody", nullptr, missing);
    check(err.code == ErrorCode::VOICE_NOT_FOUND, "unknown voice");

    check(cap->dispose().isOk(), "dispose");
    check(!cap->isValid(), "disposed capability invalid");
    check(log->released == 4, "sessions released on dispose");
    check(cap->speak("Hello.", "", nullptr, result).code == ErrorCode::NOT_INITIALIZED,
          "speak after dispose fails");

    std::unique_ptr<SynthesisCapability> none;
    err = SynthesisCapability::create(AgentConfig::Offline(dir + "/absent"),
                                      fakes::fakeSessionFactory(log), nullptr, none);
    check(err.code == ErrorCode::MODEL_NOT_FOUND && !none, "missing assets reported");
}

// ── Test: audio helpers ──

static void testAudio() {
    section("AudioProcessor");

    std::vector<float> tone(48000, 0.5f);
    check(audio::resampleAudio(tone, 48000, 16000).size() == 16000, "48k -> 16k length");
    check(audio::resampleAudio(tone, 16000, 16000).size() == 48000, "same rate unchanged");
    check(std::fabs(audio::calculateRMS(tone) - 0.5f) < 1e-6f, "RMS of constant signal");
    check(audio::calculateRMS({}) == 0.0f, "RMS of empty signal");

    auto pcm = audio::floatToInt16({2.0f, -2.0f, 0.0f});
    check(pcm[0] == 32767 && pcm[1] == -32767 && pcm[2] == 0, "int16 conversion clamps");

    std::string dir = makeTempDir("wav");
    std::string path = dir + "/out.wav";
    check(audio::writeWav(path, std::vector<float>(100, 0.1f), 1000).isOk(), "write WAV");

    std::ifstream in(path, std::ios::binary | std::ios::ate);
    check(in.good() && static_cast<long>(in.tellg()) == 44 + 200, "header + 16-bit samples");
    in.seekg(0);
    char riff[4] = {};
    in.read(riff, 4);
    check(std::string(riff, 4) == "RIFF", "RIFF magic");

    check(audio::writeWav(dir + "/no/such/dir/out.wav", {0.0f}, 1000).code ==
          ErrorCode::FILE_WRITE_ERROR, "unwritable path reported");
}

int main() {
    testModelConfig();
    testLatentSampler();
    testVoiceStyles();
    testSynthesizer();
    testSessionLoading();
    testSynthesisCapability();
    testAudio();
    return finish();
}
