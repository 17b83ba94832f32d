#pragma once

#include <optional>
#include <string>

#include "app/pronunciation_analyzer.hpp"
#include "score/rubric.hpp"

namespace app {

/**
 * @brief Speech-to-text collaborator
 *
 * Implementations own the audio they transcribe. The session never inspects
 * timestamps; they are passed through as produced.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Produce the transcript for the current recording
     * @param[out] out Transcript on success
     * @param[out] error Reason on failure
     * @return true if a transcript was produced
     */
    virtual bool transcribe(Transcript& out, std::string& error) = 0;
};

/**
 * @brief Document-store collaborator holding per-clinician, per-learner rubrics
 */
class IRubricStore {
public:
    virtual ~IRubricStore() = default;

    /**
     * @brief Look up the rubric a clinician configured for a learner
     * @param[out] out Override if one is stored, std::nullopt if none
     * @param[out] error Reason on failure
     * @return false only if the store could not be queried
     */
    virtual bool fetch_rubric(const std::string& clinician_id,
                              const std::string& learner_id,
                              std::optional<score::RubricOverride>& out,
                              std::string& error) = 0;
};

/// One practice attempt
struct SessionRequest {
    std::string target_sentence;
    std::string clinician_id;   ///< empty = no custom rubric lookup
    std::string learner_id;
};

/// Runs one analysis against the external collaborators.
///
/// Rubric lookup never aborts the attempt: a missing store, missing ids, no
/// stored rubric or a store failure all fall back to the default rubric with a
/// warning. A transcription failure aborts the attempt and is reported through
/// run()'s error string.
class PronunciationSession {
public:
    explicit PronunciationSession(ITranscriber& transcriber, IRubricStore* rubric_store = nullptr);

    bool run(const SessionRequest& request, AnalysisResult& out, std::string& error);

    /// Resolve the rubric for a request (defaults merged with any stored override)
    score::RubricWeights resolve_rubric_for(const SessionRequest& request);

    /// Rubric used by the last call to run()
    const score::RubricWeights& last_rubric() const { return last_rubric_; }

private:
    ITranscriber& transcriber_;
    IRubricStore* rubric_store_;
    score::RubricWeights last_rubric_;
};

} // namespace app
