#include "app/pronunciation_session.hpp"

#include "core/logging.hpp"

namespace app {

PronunciationSession::PronunciationSession(ITranscriber& transcriber, IRubricStore* rubric_store)
    : transcriber_(transcriber), rubric_store_(rubric_store) {}

score::RubricWeights PronunciationSession::resolve_rubric_for(const SessionRequest& request) {
    if (!rubric_store_ || request.clinician_id.empty() || request.learner_id.empty()) {
        core::log_warn("no clinician/learner for rubric lookup, using default rubric");
        return score::resolve_rubric(std::nullopt);
    }

    std::optional<score::RubricOverride> stored;
    std::string error;
    if (!rubric_store_->fetch_rubric(request.clinician_id, request.learner_id, stored, error)) {
        core::log_warn("rubric lookup failed (" + error + "), using default rubric");
        return score::resolve_rubric(std::nullopt);
    }
    if (!stored || stored->empty()) {
        core::log_warn("no rubric stored for clinician " + request.clinician_id + ", using default rubric");
        return score::resolve_rubric(std::nullopt);
    }
    core::log_info("using custom rubric of clinician " + request.clinician_id);
    return score::resolve_rubric(stored);
}

bool PronunciationSession::run(const SessionRequest& request, AnalysisResult& out, std::string& error) {
    last_rubric_ = resolve_rubric_for(request);
    core::log_info("rubric: " + score::describe_rubric(last_rubric_));

    Transcript transcript;
    std::string tx_error;
    if (!transcriber_.transcribe(transcript, tx_error)) {
        error = "transcription failed: " + tx_error;
        core::log_error(error);
        return false;
    }
    core::log_debug("transcribed text: " + transcript.text);

    out = analyze_pronunciation(request.target_sentence, transcript, last_rubric_);
    return true;
}

} // namespace app
