#include <cassert>
#include <sstream>
#include <string>
#include <vector>
#include "app/practice_sentences.hpp"
#include "app/pronunciation_analyzer.hpp"
#include "app/pronunciation_session.hpp"
#include "io/report.hpp"

using align::WordError;

static app::Transcript make_transcript(const std::vector<std::string>& words) {
    app::Transcript t;
    float s = 0.0f;
    for (const auto& w : words) {
        t.words.push_back({ w, s, s + 0.3f });
        s += 0.4f;
    }
    return t;
}

// Returns a canned transcript or a canned failure
class FakeTranscriber : public app::ITranscriber {
public:
    app::Transcript transcript;
    bool fail = false;
    int calls = 0;

    bool transcribe(app::Transcript& out, std::string& error) override {
        ++calls;
        if (fail) { error = "model not loaded"; return false; }
        out = transcript;
        return true;
    }
};

class FakeRubricStore : public app::IRubricStore {
public:
    std::optional<score::RubricOverride> stored;
    bool fail = false;
    std::string last_clinician;

    bool fetch_rubric(const std::string& clinician_id, const std::string&,
                      std::optional<score::RubricOverride>& out, std::string& error) override {
        last_clinician = clinician_id;
        if (fail) { error = "store unavailable"; return false; }
        out = stored;
        return true;
    }
};

static void test_reference_scenarios() {
    const auto rubric = score::default_rubric();

    auto r = app::analyze_pronunciation("The cat sat", make_transcript({ "the", "cat", "sat" }), rubric);
    assert(r.overall_score == 100);
    assert(r.words.size() == 3);
    assert(r.transcribed_text == "the cat sat");

    r = app::analyze_pronunciation("the cat sat", make_transcript({ "the", "kat", "sat" }), rubric);
    assert(r.words[1].error == WordError::Mispronunciation);
    assert(*r.words[1].transcribed_as == "kat");
    assert(r.overall_score == 83);

    // a word with no close candidate is omitted
    r = app::analyze_pronunciation("the elephant sat", make_transcript({ "the", "sat" }), rubric);
    assert(r.words[1].error == WordError::Omission);
    assert(r.overall_score == 77);

    // greedy matching: "cat" takes the unconsumed "sat" and the target "sat" is omitted
    r = app::analyze_pronunciation("the cat sat", make_transcript({ "the", "sat" }), rubric);
    assert(r.words[1].error == WordError::Mispronunciation);
    assert(r.words[2].error == WordError::Omission);
    assert(r.overall_score == 60);

    r = app::analyze_pronunciation("the cat", make_transcript({ "the", "cat", "now" }), rubric);
    assert(r.words.size() == 3);
    assert(r.words[2].error == WordError::Insertion);
    assert(r.overall_score == 85);

    r = app::analyze_pronunciation("the cat sat", app::Transcript{}, rubric);
    assert(r.overall_score == 30);
    assert(r.transcribed_text.empty());
}

static void test_degenerate_target() {
    auto r = app::analyze_pronunciation("   ", make_transcript({ "hello", "there" }), score::default_rubric());
    assert(r.overall_score == 0);
    assert(r.words.size() == 2);
    for (const auto& w : r.words) assert(w.error == WordError::Insertion);
}

static void test_threshold_from_rubric() {
    score::RubricWeights rubric;
    rubric.mispronunciation_threshold = 0;
    auto r = app::analyze_pronunciation("the cat", make_transcript({ "the", "kat" }), rubric);
    assert(r.words[1].error == WordError::Omission);
    assert(r.words[2].error == WordError::Insertion);
}

static void test_transcript_text_preferred() {
    auto t = make_transcript({ "the", "cat" });
    t.text = "  The cat.  ";
    auto r = app::analyze_pronunciation("the cat", t, score::default_rubric());
    assert(r.transcribed_text == "The cat.");
}

static void test_session_with_stored_rubric() {
    FakeTranscriber tx;
    tx.transcript = make_transcript({ "the", "kat", "sat" });
    FakeRubricStore store;
    score::RubricOverride over;
    over.mispronunciation_weight = 100;
    store.stored = over;

    app::PronunciationSession session(tx, &store);
    app::AnalysisResult result;
    std::string err;
    assert(session.run({ "the cat sat", "dr-1", "pt-7" }, result, err));
    assert(store.last_clinician == "dr-1");
    assert(session.last_rubric().mispronunciation_weight == 100);
    assert(session.last_rubric().omission_weight == 70);
    // (100 + 0 + 100) / 300 -> 67
    assert(result.overall_score == 67);
}

static void test_session_falls_back_to_defaults() {
    FakeTranscriber tx;
    tx.transcript = make_transcript({ "the", "kat", "sat" });
    app::AnalysisResult result;
    std::string err;

    // no store at all
    app::PronunciationSession no_store(tx);
    assert(no_store.run({ "the cat sat", "dr-1", "pt-7" }, result, err));
    assert(result.overall_score == 83);

    // store has nothing for this learner
    FakeRubricStore store;
    app::PronunciationSession empty_store(tx, &store);
    assert(empty_store.run({ "the cat sat", "dr-1", "pt-7" }, result, err));
    assert(empty_store.last_rubric().mispronunciation_weight == 50);

    // a stored rubric with no fields set counts as no rubric
    store.stored = score::RubricOverride{};
    assert(empty_store.run({ "the cat sat", "dr-1", "pt-7" }, result, err));
    assert(store.last_clinician == "dr-1");
    assert(empty_store.last_rubric().mispronunciation_weight == 50);
    assert(empty_store.last_rubric().insertion_weight == 30);
    assert(result.overall_score == 83);

    // store failure
    store.fail = true;
    assert(empty_store.run({ "the cat sat", "dr-1", "pt-7" }, result, err));
    assert(result.overall_score == 83);

    // no ids: store not consulted
    FakeRubricStore untouched;
    app::PronunciationSession no_ids(tx, &untouched);
    assert(no_ids.run({ "the cat sat", "", "" }, result, err));
    assert(untouched.last_clinician.empty());
}

static void test_session_transcription_failure() {
    FakeTranscriber tx;
    tx.fail = true;
    app::PronunciationSession session(tx);
    app::AnalysisResult result;
    result.overall_score = 42;
    std::string err;
    assert(!session.run({ "the cat sat", "", "" }, result, err));
    assert(err.find("model not loaded") != std::string::npos);
    assert(result.overall_score == 42);  // untouched
    assert(tx.calls == 1);
}

static void test_reports() {
    auto r = app::analyze_pronunciation("the cat", make_transcript({ "the", "kat", "\"now\"" }),
                                        score::default_rubric());
    std::ostringstream js;
    io::write_analysis_json(js, r, score::default_rubric());
    const std::string j = js.str();
    assert(j.find("\"overall_score\": " + std::to_string(r.overall_score)) != std::string::npos);
    assert(j.find("\"transcribed_as\": \"kat\"") != std::string::npos);
    assert(j.find("\"error\": \"insertion\"") != std::string::npos);
    assert(j.find("\\\"now\\\"") != std::string::npos);
    assert(j.find("\"mispronounced\": 1") != std::string::npos);

    std::ostringstream txt;
    io::write_analysis_text(txt, r, score::default_rubric());
    assert(txt.str().find("Score: " + std::to_string(r.overall_score) + "/100") != std::string::npos);
    assert(txt.str().find("(heard \"kat\")") != std::string::npos);

    assert(io::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
}

static void test_practice_sentences() {
    assert(app::default_practice_sentences().size() == 5);
    assert(app::exercise_categories().size() == 3);
    assert(app::exercise_sentences("S-sound practice").size() == 5);
    assert(app::exercise_sentences("unknown").empty());

    // a perfect reading of every built-in sentence scores 100
    for (const auto& s : app::default_practice_sentences()) {
        app::Transcript t;
        std::istringstream in(s);
        std::string w;
        float at = 0.0f;
        while (in >> w) { t.words.push_back({ w, at, at + 0.2f }); at += 0.25f; }
        assert(app::analyze_pronunciation(s, t, score::default_rubric()).overall_score == 100);
    }
}

int main() {
    test_reference_scenarios();
    test_degenerate_target();
    test_threshold_from_rubric();
    test_transcript_text_preferred();
    test_session_with_stored_rubric();
    test_session_falls_back_to_defaults();
    test_session_transcription_failure();
    test_reports();
    test_practice_sentences();
    return 0;
}
